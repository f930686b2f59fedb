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


#ifndef _XSDBIND_ATTRIBUTEDECL_HPP_
#define _XSDBIND_ATTRIBUTEDECL_HPP_

#include <memory>
#include <string>
#include "SchemaComponent.hpp"
#include "Value.hpp"
#include "Exports.hpp"

namespace xsdbind
{

class SimpleType;
class ValidationContext;

class XSDBIND_DECL_EXPORT AttributeDecl : public SchemaComponent
{
    public:

        enum useType
        {
            optional = 0,
            required,
            prohibited
        };

        AttributeDecl(const std::string &name);
        virtual ~AttributeDecl() { }
        virtual std::string getDescription() const;

        const std::string &getRefName() const { return m_refName; }
        void setRefName(const std::string &refName) { m_refName = refName; }
        bool isRef() const { return !m_refName.empty(); }
        void setRef(const AttributeDecl *pRef) { m_pRef = pRef; }
        const AttributeDecl *getTarget() const { return (m_pRef != nullptr) ? m_pRef : this; }

        const SimpleType *getType() const { return getTarget()->m_pType; }
        void setType(const SimpleType *pType) { m_pType = pType; }
        void setLocalType(const std::shared_ptr<SimpleType> &pType);
        const std::string &getTypeName() const { return m_typeName; }
        void setTypeName(const std::string &typeName) { m_typeName = typeName; }

        useType getUse() const { return m_use; }
        void setUse(useType use) { m_use = use; }
        bool isRequired() const { return m_use == required; }
        static useType getUseFromString(const std::string &use);

        //
        // A use reference may override the target's default or fixed value
        void setDefault(const std::string &value);
        void setFixed(const std::string &value);
        bool hasDefault() const { return m_hasDefault || (m_pRef != nullptr && !m_hasFixed && m_pRef->hasDefault()); }
        bool hasFixed() const { return m_hasFixed || (m_pRef != nullptr && !m_hasDefault && m_pRef->hasFixed()); }
        const std::string &getDefault() const { return m_hasDefault ? m_default : getTarget()->m_default; }
        const std::string &getFixed() const { return m_hasFixed ? m_fixed : getTarget()->m_fixed; }

        Value decode(const std::string &text, ValidationContext &ctx) const;
        std::string encode(const Value &value, ValidationContext &ctx) const;


    protected:

        virtual validity doCheck(const std::shared_ptr<const BuildToken> &pToken) const;
        void checkFixed(const Value &value, ValidationContext &ctx) const;


    private:

        std::string m_refName;
        const AttributeDecl *m_pRef;
        const SimpleType *m_pType;
        std::shared_ptr<SimpleType> m_pLocalType;
        std::string m_typeName;
        useType m_use;
        bool m_hasDefault;
        bool m_hasFixed;
        std::string m_default;
        std::string m_fixed;
};

}

#endif // _XSDBIND_ATTRIBUTEDECL_HPP_
