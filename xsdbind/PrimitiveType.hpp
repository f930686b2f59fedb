/*##############################################################################

    HPCC SYSTEMS software Copyright (C) 2017 HPCC Systems®.

    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License.
############################################################################## */

#ifndef _XSDBIND_PRIMITIVETYPE_HPP_
#define _XSDBIND_PRIMITIVETYPE_HPP_

#include <string>
#include "Value.hpp"
#include "Exports.hpp"

namespace xsdbind
{

//
// Lexical to native conversions of the built-in atomic types. The integer kind is not an XSD
// primitive but selects the 64-bit conversion used by xs:integer and the types derived from it.
class XSDBIND_DECL_EXPORT PrimitiveType
{
    public:

        enum primitiveKind
        {
            anySimpleKind = 0,
            stringKind,
            booleanKind,
            decimalKind,
            integerKind,
            floatKind,
            doubleKind,
            durationKind,
            dateTimeKind,
            timeKind,
            dateKind,
            gYearMonthKind,
            gYearKind,
            gMonthDayKind,
            gDayKind,
            gMonthKind,
            hexBinaryKind,
            base64BinaryKind,
            anyURIKind,
            QNameKind,
            NOTATIONKind
        };

        enum whiteSpacePolicy
        {
            preserve = 0,
            replace,
            collapse
        };

        static bool decode(primitiveKind kind, const std::string &text, Value &value, std::string &reason);
        static bool encode(primitiveKind kind, const Value &value, std::string &text, std::string &reason);

        //
        // Length as measured by the length facets: characters for strings, octets for binary types
        static size_t getLength(primitiveKind kind, const Value &value);

        static bool isDateTimeKind(primitiveKind kind) { return kind >= dateTimeKind && kind <= gMonthKind; }
        static bool isNumericKind(primitiveKind kind) { return kind >= decimalKind && kind <= doubleKind; }
        static bool hasTimezone(const std::string &text);
        static whiteSpacePolicy getDefaultWhiteSpace(primitiveKind kind);
        static const char *getKindName(primitiveKind kind);
        static std::string normalize(whiteSpacePolicy policy, const std::string &text);
        static const char *getWhiteSpaceName(whiteSpacePolicy policy);
        static bool getWhiteSpaceFromName(const std::string &name, whiteSpacePolicy &policy);
};

}

#endif // _XSDBIND_PRIMITIVETYPE_HPP_
