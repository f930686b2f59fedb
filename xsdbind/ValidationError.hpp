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

#ifndef _XSDBIND_VALIDATIONERROR_HPP_
#define _XSDBIND_VALIDATIONERROR_HPP_

#include <string>
#include <vector>
#include "Exports.hpp"

namespace xsdbind
{

struct XSDBIND_DECL_EXPORT ValidationError
{
    enum errorKind
    {
        validation = 0,     // facet, attribute or content model failure
        decode,             // text not convertible to the native value
        encode              // native value incompatible with the declaring type
    };

    ValidationError() : kind(validation) { }
    ValidationError(enum errorKind _kind, const std::string &_reason, const std::string &_component = "", const std::string &_value = "") :
        kind(_kind), reason(_reason), component(_component), value(_value) { }

    std::string toString() const;
    static std::string getKindString(enum errorKind kind);

    errorKind kind;
    std::string reason;                 // message for user
    std::string path;                   // instance location, e.g. /root/item[2]/@id
    std::string component;              // originating schema component
    std::string value;                  // offending text or value rendering
    std::vector<std::string> expected;  // content model errors: names accepted at the failing position
};

}

#endif // _XSDBIND_VALIDATIONERROR_HPP_
