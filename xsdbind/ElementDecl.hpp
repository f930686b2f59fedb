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


#ifndef _XSDBIND_ELEMENTDECL_HPP_
#define _XSDBIND_ELEMENTDECL_HPP_

#include <memory>
#include <string>
#include "Particle.hpp"
#include "Value.hpp"
#include "ValidationError.hpp"
#include "Exports.hpp"

namespace xsdbind
{

class SchemaType;
class XmlElement;
class ValidationContext;
struct ElementData;

class XSDBIND_DECL_EXPORT ElementDecl : public Particle
{
    public:

        ElementDecl(const std::string &name);
        virtual ~ElementDecl() { }
        virtual std::string getDescription() const;

        //
        // A reference keeps its own occurrence range, everything else comes from the global target
        const std::string &getRefName() const { return m_refName; }
        void setRefName(const std::string &refName) { m_refName = refName; }
        bool isRef() const { return !m_refName.empty(); }
        void setRef(const ElementDecl *pRef) { m_pRef = pRef; }
        const ElementDecl *getTarget() const { return (m_pRef != nullptr) ? m_pRef : this; }

        const SchemaType *getType() const { return getTarget()->m_pType; }
        void setType(const SchemaType *pType) { m_pType = pType; }
        void setLocalType(const std::shared_ptr<SchemaType> &pType);
        const std::string &getTypeName() const { return m_typeName; }
        void setTypeName(const std::string &typeName) { m_typeName = typeName; }

        bool isNillable() const { return getTarget()->m_nillable; }
        void setNillable(bool nillable) { m_nillable = nillable; }
        bool isAbstract() const { return getTarget()->m_abstract; }
        void setAbstract(bool isAbstract) { m_abstract = isAbstract; }

        //
        // default and fixed are mutually exclusive, setting both throws ParseException
        void setDefault(const std::string &value);
        void setFixed(const std::string &value);
        bool hasDefault() const { return getTarget()->m_hasDefault; }
        bool hasFixed() const { return getTarget()->m_hasFixed; }
        const std::string &getDefault() const { return getTarget()->m_default; }
        const std::string &getFixed() const { return getTarget()->m_fixed; }

        const std::string &getSubstitutionGroup() const { return m_substitutionGroup; }
        void setSubstitutionGroup(const std::string &headName) { m_substitutionGroup = headName; }

        //
        // Decodes the element through its type and the context's converter. Errors go to the
        // context, a best effort value is always returned.
        Value decode(const XmlElement &elem, ValidationContext &ctx, unsigned level = 0) const;

        //
        // Builds an element from a native value. tag overrides the declared name, used for
        // children matched by a wildcard.
        std::shared_ptr<XmlElement> encode(const Value &value, ValidationContext &ctx, unsigned level = 0, const std::string &tag = "") const;


    protected:

        virtual validity doCheck(const std::shared_ptr<const BuildToken> &pToken) const;
        const SchemaType *getEffectiveType(const ValidationContext &ctx) const;
        bool decodeNil(const XmlElement &elem, ValidationContext &ctx) const;

        //
        // The type named by xsi:type when it can replace pDeclared, else pDeclared after reporting why
        const SchemaType *getInstanceType(const std::string &qname, const std::string &typeName, const SchemaType *pDeclared,
            ValidationContext &ctx, ValidationError::errorKind kind) const;
        const SchemaType *decodeXsiType(const XmlElement &elem, const SchemaType *pDeclared, ValidationContext &ctx, ElementData &data) const;
        const SchemaType *encodeXsiType(const ElementData &data, const SchemaType *pDeclared, ValidationContext &ctx, XmlElement &elem) const;
        void checkFixed(const std::string &text, const Value &value, const SchemaType &type, ValidationContext &ctx) const;


    private:

        std::string m_refName;
        const ElementDecl *m_pRef;
        const SchemaType *m_pType;
        std::shared_ptr<SchemaType> m_pLocalType;
        std::string m_typeName;
        bool m_nillable;
        bool m_abstract;
        bool m_hasDefault;
        bool m_hasFixed;
        std::string m_default;
        std::string m_fixed;
        std::string m_substitutionGroup;
};

}

#endif // _XSDBIND_ELEMENTDECL_HPP_
