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


#ifndef _XSDBIND_SCHEMAREGISTRY_HPP_
#define _XSDBIND_SCHEMAREGISTRY_HPP_

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "SchemaComponent.hpp"
#include "SchemaType.hpp"
#include "SimpleType.hpp"
#include "ComplexType.hpp"
#include "ElementDecl.hpp"
#include "AttributeDecl.hpp"
#include "AttributeGroup.hpp"
#include "ModelGroup.hpp"
#include "Exports.hpp"

namespace xsdbind
{

//
// Name keyed arena holding every global component. Cross references between components are
// non-owning pointers into this registry, so cyclic definitions need no ownership cycles.
class XSDBIND_DECL_EXPORT SchemaRegistry
{
    public:

        SchemaRegistry();
        ~SchemaRegistry() { }
        SchemaRegistry(const SchemaRegistry &) = delete;
        SchemaRegistry &operator=(const SchemaRegistry &) = delete;

        const std::string &getTargetNamespace() const { return m_targetNamespace; }
        void setTargetNamespace(const std::string &ns) { m_targetNamespace = ns; }

        //
        // Adding a second component of the same kind and name throws ParseException
        void addType(const std::shared_ptr<SchemaType> &pType);
        void addElement(const std::shared_ptr<ElementDecl> &pElement);
        void addAttribute(const std::shared_ptr<AttributeDecl> &pAttribute);
        void addAttributeGroup(const std::shared_ptr<AttributeGroup> &pGroup);
        void addGroup(const std::shared_ptr<ModelGroup> &pGroup);

        const SchemaType *getType(const std::string &name) const;
        const SimpleType *getSimpleType(const std::string &name) const;
        const ElementDecl *getElement(const std::string &name) const;
        const AttributeDecl *getAttribute(const std::string &name) const;
        const AttributeGroup *getAttributeGroup(const std::string &name) const;
        const ModelGroup *getGroup(const std::string &name) const;

        //
        // Mutable lookups, only used while the schema is built
        std::shared_ptr<SchemaType> findType(const std::string &name) const;
        std::shared_ptr<ElementDecl> findElement(const std::string &name) const;
        std::shared_ptr<AttributeDecl> findAttribute(const std::string &name) const;
        std::shared_ptr<AttributeGroup> findAttributeGroup(const std::string &name) const;
        std::shared_ptr<ModelGroup> findGroup(const std::string &name) const;

        const std::map<std::string, std::shared_ptr<SchemaType>> &getTypes() const { return m_types; }
        const std::map<std::string, std::shared_ptr<ElementDecl>> &getElements() const { return m_elements; }
        size_t getNumBuiltinTypes() const { return m_numBuiltinTypes; }
        void setNumBuiltinTypes(size_t num) { m_numBuiltinTypes = num; }

        //
        // Non abstract global elements that may appear in place of the named head, transitively
        const std::vector<const ElementDecl *> &getSubstitutes(const std::string &headName) const;

        const ComplexType *getAnyType() const;
        const SimpleType *getAnySimpleType() const;

        //
        // Declaration used for elements matched by a lax or skip wildcard with no global declaration
        const ElementDecl *getAnyElement() const { return m_pAnyElement.get(); }

        //
        // Ends a build pass: computes the substitution groups, issues a new build token and
        // checks every component against it.
        void completeBuildPass();
        unsigned getGeneration() const { return m_generation; }
        std::shared_ptr<const BuildToken> getBuildToken() const { return m_pBuildToken; }
        SchemaComponent::validity getValidity() const { return m_validity; }


    private:

        std::string m_targetNamespace;
        std::map<std::string, std::shared_ptr<SchemaType>> m_types;
        std::map<std::string, std::shared_ptr<ElementDecl>> m_elements;
        std::map<std::string, std::shared_ptr<AttributeDecl>> m_attributes;
        std::map<std::string, std::shared_ptr<AttributeGroup>> m_attributeGroups;
        std::map<std::string, std::shared_ptr<ModelGroup>> m_groups;
        std::map<std::string, std::vector<const ElementDecl *>> m_substitutes;
        std::shared_ptr<ElementDecl> m_pAnyElement;
        size_t m_numBuiltinTypes;
        unsigned m_generation;
        std::shared_ptr<const BuildToken> m_pBuildToken;
        SchemaComponent::validity m_validity;
};

}

#endif // _XSDBIND_SCHEMAREGISTRY_HPP_
