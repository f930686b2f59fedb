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


#ifndef _XSDBIND_BUILTINTYPES_HPP_
#define _XSDBIND_BUILTINTYPES_HPP_

#include <memory>
#include <string>
#include "SimpleType.hpp"
#include "Exports.hpp"

namespace xsdbind
{

class SchemaRegistry;

//
// The XSD built-in types. Derived built-ins are ordinary restrictions of their primitive with
// the value ranges expressed as facets.
class XSDBIND_DECL_EXPORT BuiltinTypes
{
    public:

        static void addToRegistry(SchemaRegistry &registry);


    protected:

        static std::shared_ptr<SimpleType> addAtomic(SchemaRegistry &registry, const std::string &localName, PrimitiveType::primitiveKind kind, const SchemaType *pBase);
        static std::shared_ptr<SimpleType> addRestriction(SchemaRegistry &registry, const std::string &localName, const std::shared_ptr<SimpleType> &pBase);
        static std::shared_ptr<SimpleType> addList(SchemaRegistry &registry, const std::string &localName, const std::shared_ptr<SimpleType> &pItemType);
        static void addIntegerRange(const std::shared_ptr<SimpleType> &pType, bool hasMin, int64_t minValue, bool hasMax, int64_t maxValue);
        static void addPattern(const std::shared_ptr<SimpleType> &pType, const std::string &pattern);
};

}

#endif // _XSDBIND_BUILTINTYPES_HPP_
