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


#ifndef _XSDBIND_XSDSCHEMAPARSER_HPP_
#define _XSDBIND_XSDSCHEMAPARSER_HPP_

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>

#include "SchemaParser.hpp"
#include "Exports.hpp"

namespace pt = boost::property_tree;

namespace xsdbind
{

//
// Builds a registry from a single XSD document. Globals are registered by name first, then
// built (base types on demand), then every by-name reference is resolved to a pointer.
class XSDBIND_DECL_EXPORT XSDSchemaParser : public SchemaParser
{
    public:

        XSDSchemaParser(const std::shared_ptr<SchemaRegistry> &pRegistry) : SchemaParser(pRegistry), m_elementQualified(false), m_attributeQualified(false) { }
        virtual ~XSDSchemaParser() { }


    protected:

        struct GroupRef
        {
            GroupRef(const std::shared_ptr<ModelGroup> &_pGroup, bool _nested) : pGroup(_pGroup), nested(_nested) { }
            std::shared_ptr<ModelGroup> pGroup;
            bool nested;
        };

        virtual void doParse(const pt::ptree &xsdTree) override;
        const pt::ptree &findSchemaRoot(const pt::ptree &xsdTree);
        void registerGlobals(const pt::ptree &schemaTree);
        void buildGlobals();
        void resolveReferences();
        void resolveSubstitutionTypes();
        void checkDerivations();

        std::string getXSDAttributeValue(const pt::ptree &tree, const std::string &attrName, bool throwIfNotPresent=true, const std::string &defaultVal = (std::string(""))) const;
        bool hasXSDAttribute(const pt::ptree &tree, const std::string &attrName) const;
        bool getXSDBoolAttribute(const pt::ptree &tree, const std::string &attrName, bool defaultVal) const;
        std::string getXSDTag(const std::string &key) const;
        std::string resolveQName(const std::string &prefixedName) const;
        std::string getGlobalName(const pt::ptree &tree) const;
        std::string getLocalDeclName(const pt::ptree &tree, bool qualifiedDefault) const;
        bool isLax() const { return m_mode != ValidationContext::strict; }
        void recordError(const std::string &component, const std::string &msg);

        const SchemaType *getTypeByName(const std::string &qname);
        const SimpleType *getSimpleTypeByName(const std::string &qname);
        const AttributeGroup *getAttributeGroupByName(const std::string &qname);
        void buildGlobalType(const std::string &qname);
        void buildGlobalAttributeGroup(const std::string &qname);
        std::shared_ptr<SchemaType> makeFallbackType(const std::string &qname, bool isSimple, const std::string &msg) const;

        std::shared_ptr<SimpleType> parseSimpleType(const pt::ptree &typeTree, const std::string &name);
        std::shared_ptr<SimpleType> parseSimpleRestriction(const pt::ptree &restrictTree, const std::string &name, const SimpleType *pBase);
        void parseFacets(const pt::ptree &restrictTree, SimpleType &type, const SimpleType &base);
        Value decodeFacetValue(const SimpleType &base, SchemaFacet::facetKind kind, const std::string &lexical) const;
        std::shared_ptr<SimpleType> parseList(const pt::ptree &listTree, const std::string &name);
        std::shared_ptr<SimpleType> parseUnion(const pt::ptree &unionTree, const std::string &name);
        const SimpleType *getInlineOrNamedBase(const pt::ptree &tree, const std::string &attrName, SimpleType &owner);

        std::shared_ptr<ComplexType> parseComplexType(const pt::ptree &typeTree, const std::string &name);
        void parseSimpleContent(const pt::ptree &contentTree, ComplexType &type);
        void parseComplexContent(const pt::ptree &contentTree, ComplexType &type, const std::string &mixedAttr);
        std::shared_ptr<ModelGroup> parseContentParticle(const std::string &tag, const pt::ptree &tree);
        const pt::ptree &getDerivationTree(const pt::ptree &contentTree, bool &isExtension) const;

        std::shared_ptr<ElementDecl> parseElement(const pt::ptree &elemTree, bool isGlobal);
        std::shared_ptr<AttributeDecl> parseAttribute(const pt::ptree &attrTree, bool isGlobal);
        void parseAttributeUses(const pt::ptree &tree, AttributeGroup &group);
        std::shared_ptr<ModelGroup> parseModelGroup(const pt::ptree &groupTree, ModelGroup::modelKind model, bool nested);
        std::shared_ptr<ModelGroup> parseGroupRef(const pt::ptree &refTree, bool nested);
        std::shared_ptr<Wildcard> parseWildcard(const pt::ptree &anyTree, bool isAttribute);
        void parseOccurs(const pt::ptree &tree, Particle &particle) const;
        void checkAllGroup(const ModelGroup &group) const;
        void checkGroupCycles();


    protected:

        std::string m_xsdPrefix;
        std::map<std::string, std::string> m_namespaces;       // in scope prefixes of the schema root
        std::string m_targetNamespace;
        bool m_elementQualified;
        bool m_attributeQualified;

        std::map<std::string, const pt::ptree *> m_typeTrees;
        std::map<std::string, bool> m_typeIsSimple;
        std::map<std::string, const pt::ptree *> m_elementTrees;
        std::map<std::string, const pt::ptree *> m_attributeTrees;
        std::map<std::string, const pt::ptree *> m_attributeGroupTrees;
        std::map<std::string, const pt::ptree *> m_groupTrees;
        std::set<std::string> m_inProgress;

        std::vector<std::shared_ptr<ElementDecl>> m_pendingElements;
        std::vector<std::shared_ptr<AttributeDecl>> m_pendingAttributes;
        std::vector<GroupRef> m_pendingGroupRefs;
        std::vector<std::shared_ptr<ComplexType>> m_complexTypes;
};

}

#endif // _XSDBIND_XSDSCHEMAPARSER_HPP_
