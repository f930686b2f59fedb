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

#ifndef _XSDBIND_SCHEMATYPE_HPP_
#define _XSDBIND_SCHEMATYPE_HPP_

#include <string>
#include "SchemaComponent.hpp"
#include "Exports.hpp"

namespace xsdbind
{

class SimpleType;
class ComplexType;

class XSDBIND_DECL_EXPORT SchemaType : public SchemaComponent
{
    public:

        enum derivationMethod
        {
            none = 0,
            restriction,
            extension
        };

        SchemaType(const std::string &name) : SchemaComponent(name), m_pBaseType(nullptr), m_derivation(none) { }
        virtual ~SchemaType() { }

        virtual bool isSimple() const = 0;
        bool isComplex() const { return !isSimple(); }
        virtual bool hasSimpleContent() const = 0;

        //
        // The simple type used for the text of an element of this type, null for complex content
        virtual const SimpleType *getContentSimpleType() const = 0;

        const SchemaType *getBaseType() const { return m_pBaseType; }
        void setBaseType(const SchemaType *pBaseType) { m_pBaseType = pBaseType; }
        const std::string &getBaseName() const { return m_baseName; }
        void setBaseName(const std::string &baseName) { m_baseName = baseName; }
        derivationMethod getDerivation() const { return m_derivation; }
        void setDerivation(derivationMethod derivation) { m_derivation = derivation; }
        bool isDerivedFrom(const SchemaType *pOther) const;
        static const char *getDerivationString(derivationMethod derivation);


    protected:

        // Non-owning, the base is owned by the registry or by the declaration that holds it
        const SchemaType *m_pBaseType;
        std::string m_baseName;
        derivationMethod m_derivation;
};

}

#endif // _XSDBIND_SCHEMATYPE_HPP_
