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


#include <exception>
#include <stdexcept>
#include "XSDSchemaParser.hpp"
#include "BuiltinTypes.hpp"
#include "Exceptions.hpp"
#include "Converter.hpp"
#include "Utils.hpp"
#include "Log.hpp"

namespace pt = boost::property_tree;

using namespace xsdbind;

static const pt::ptree emptyTree;


static bool getBoolFromString(const std::string &value, const std::string &attrName)
{
    std::string trimmed = trimWhitespace(value);
    if (trimmed == "true" || trimmed == "1")
        return true;
    if (trimmed == "false" || trimmed == "0")
        return false;
    throw(ParseException("Invalid boolean value '" + value + "' for attribute " + attrName));
}


static size_t getFacetSize(const std::string &value, const std::string &facetName)
{
    std::string trimmed = trimWhitespace(value);
    if (trimmed.empty() || trimmed.find_first_not_of("0123456789") != std::string::npos)
    {
        throw(ParseException("Invalid value '" + value + "' for facet " + facetName + ", a non-negative integer is required"));
    }

    size_t size;
    try
    {
        size = std::stoul(trimmed);
    }
    catch (const std::out_of_range &)
    {
        throw(ParseException("Value '" + value + "' for facet " + facetName + " is out of range"));
    }
    return size;
}


static bool reachesGroup(const ModelGroup *pGroup, const ModelGroup *pStart, std::set<const ModelGroup *> &visited)
{
    for (auto &pParticle : pGroup->getParticles())
    {
        if (pParticle->getParticleKind() != Particle::groupParticle)
            continue;

        const ModelGroup *pTarget = static_cast<const ModelGroup *>(pParticle.get())->getTarget();
        if (pTarget == pStart)
            return true;
        if (visited.insert(pTarget).second && reachesGroup(pTarget, pStart, visited))
            return true;
    }
    return false;
}


void XSDSchemaParser::doParse(const pt::ptree &xsdTree)
{
    m_typeTrees.clear();
    m_typeIsSimple.clear();
    m_elementTrees.clear();
    m_attributeTrees.clear();
    m_attributeGroupTrees.clear();
    m_groupTrees.clear();
    m_inProgress.clear();
    m_pendingElements.clear();
    m_pendingAttributes.clear();
    m_pendingGroupRefs.clear();
    m_complexTypes.clear();

    //
    // Add the built-in types, every type in the document derives from them
    BuiltinTypes::addToRegistry(*m_pRegistry);

    const pt::ptree &schemaTree = findSchemaRoot(xsdTree);

    //
    // Register by name, build, then resolve the by-name references
    registerGlobals(schemaTree);
    buildGlobals();
    resolveReferences();
    resolveSubstitutionTypes();
    checkDerivations();

    m_pRegistry->completeBuildPass();
    if (m_status.getNumMessages() != 0)
    {
        getLogger()->warn("Schema built with {} recovered error(s)", m_status.getNumMessages());
    }
}


const pt::ptree &XSDSchemaParser::findSchemaRoot(const pt::ptree &xsdTree)
{
    for (auto it = xsdTree.begin(); it != xsdTree.end(); ++it)
    {
        std::string prefix, localName;
        splitPrefixedName(it->first, prefix, localName);
        if (localName != "schema")
            continue;

        m_namespaces.clear();
        const pt::ptree &attrs = it->second.get_child("<xmlattr>", emptyTree);
        for (auto &attr : attrs)
        {
            if (attr.first == "xmlns")
                m_namespaces[""] = attr.second.data();
            else if (attr.first.compare(0, 6, "xmlns:") == 0)
                m_namespaces[attr.first.substr(6)] = attr.second.data();
        }

        auto nsIt = m_namespaces.find(prefix);
        if (nsIt == m_namespaces.end() || nsIt->second != XSD_NAMESPACE)
        {
            throw(ParseException("The root element '" + it->first + "' is not in the XML Schema namespace"));
        }
        m_xsdPrefix = prefix.empty() ? "" : prefix + ":";

        m_targetNamespace = getXSDAttributeValue(it->second, "<xmlattr>.targetNamespace", false, "");
        m_pRegistry->setTargetNamespace(m_targetNamespace);

        std::string elementForm = getXSDAttributeValue(it->second, "<xmlattr>.elementFormDefault", false, "unqualified");
        std::string attributeForm = getXSDAttributeValue(it->second, "<xmlattr>.attributeFormDefault", false, "unqualified");
        if ((elementForm != "qualified" && elementForm != "unqualified") || (attributeForm != "qualified" && attributeForm != "unqualified"))
        {
            throw(ParseException("Form defaults must be 'qualified' or 'unqualified'"));
        }
        m_elementQualified = (elementForm == "qualified");
        m_attributeQualified = (attributeForm == "qualified");
        return it->second;
    }
    throw(ParseException("The document has no schema root element"));
}


void XSDSchemaParser::registerGlobals(const pt::ptree &schemaTree)
{
    auto registerTree = [this](std::map<std::string, const pt::ptree *> &trees, const std::string &name, const pt::ptree &tree, const std::string &kind)
    {
        if (!trees.insert({name, &tree}).second)
        {
            std::string msg = "Duplicate " + kind + " definition '" + name + "'";
            if (!isLax())
                throw(ParseException(msg));
            recordError(name, msg);
            return false;
        }
        getLogger()->debug("Registered global {} '{}'", kind, name);
        return true;
    };

    for (auto it = schemaTree.begin(); it != schemaTree.end(); ++it)
    {
        if (it->first == "<xmlattr>")
            continue;

        std::string elemType = getXSDTag(it->first);
        if (elemType == "include" || elemType == "import" || elemType == "redefine")
        {
            std::string location = getXSDAttributeValue(it->second, "<xmlattr>.schemaLocation", false, "");
            std::string msg = "Schema composition with '" + elemType + "' is not supported";
            if (!isLax())
            {
                ParseException pe(msg);
                pe.addComponent(location);
                throw(pe);
            }
            recordError(location, msg);
        }
        else if (elemType == "simpleType" || elemType == "complexType")
        {
            std::string name = getGlobalName(it->second);
            if (m_pRegistry->getType(name) != nullptr)
            {
                throw(ParseException("Duplicate type definition '" + name + "'"));
            }
            if (registerTree(m_typeTrees, name, it->second, "type"))
                m_typeIsSimple[name] = (elemType == "simpleType");
        }
        else if (elemType == "element")
        {
            registerTree(m_elementTrees, getGlobalName(it->second), it->second, "element");
        }
        else if (elemType == "attribute")
        {
            registerTree(m_attributeTrees, getGlobalName(it->second), it->second, "attribute");
        }
        else if (elemType == "attributeGroup")
        {
            registerTree(m_attributeGroupTrees, getGlobalName(it->second), it->second, "attributeGroup");
        }
        else if (elemType == "group")
        {
            registerTree(m_groupTrees, getGlobalName(it->second), it->second, "group");
        }
        else if (elemType != "annotation" && elemType != "notation")
        {
            throw(ParseException("Unexpected element '" + it->first + "' in schema"));
        }
    }
}


void XSDSchemaParser::buildGlobals()
{
    for (auto &typeIt : m_typeTrees)
    {
        if (m_pRegistry->getType(typeIt.first) == nullptr)
            buildGlobalType(typeIt.first);
    }

    for (auto &groupIt : m_attributeGroupTrees)
    {
        if (m_pRegistry->getAttributeGroup(groupIt.first) == nullptr)
            buildGlobalAttributeGroup(groupIt.first);
    }

    for (auto &groupIt : m_groupTrees)
    {
        std::shared_ptr<ModelGroup> pGroup;
        try
        {
            for (auto it = groupIt.second->begin(); it != groupIt.second->end(); ++it)
            {
                std::string tag = getXSDTag(it->first);
                if (tag == "sequence" || tag == "choice" || tag == "all")
                {
                    if (pGroup)
                        throw(ParseException("A group may contain only one sequence, choice or all"));
                    pGroup = parseModelGroup(it->second, ModelGroup::getModelFromString(tag), false);
                }
                else if (it->first != "<xmlattr>" && tag != "annotation")
                {
                    throw(ParseException("Unexpected element '" + it->first + "' in group"));
                }
            }
            if (!pGroup)
                throw(ParseException("A group must contain a sequence, choice or all"));
        }
        catch (ParseException &pe)
        {
            pe.addComponent("group '" + groupIt.first + "'");
            if (!isLax())
                throw;
            recordError(groupIt.first, pe.what());
            pGroup = std::make_shared<ModelGroup>("", ModelGroup::sequenceModel);
            pGroup->setBuildError(pe.getReason());
            pGroup->setBuilt(true);
        }
        pGroup->setName(groupIt.first);
        pGroup->setGlobal(true);
        m_pRegistry->addGroup(pGroup);
    }

    for (auto &attrIt : m_attributeTrees)
    {
        std::shared_ptr<AttributeDecl> pAttr;
        try
        {
            pAttr = parseAttribute(*attrIt.second, true);
        }
        catch (ParseException &pe)
        {
            pe.addComponent("attribute '" + attrIt.first + "'");
            if (!isLax())
                throw;
            recordError(attrIt.first, pe.what());
            pAttr = std::make_shared<AttributeDecl>(attrIt.first);
            pAttr->setType(m_pRegistry->getAnySimpleType());
            pAttr->setBuildError(pe.getReason());
            pAttr->setBuilt(true);
        }
        pAttr->setGlobal(true);
        m_pRegistry->addAttribute(pAttr);
    }

    for (auto &elemIt : m_elementTrees)
    {
        std::shared_ptr<ElementDecl> pElem;
        try
        {
            pElem = parseElement(*elemIt.second, true);
        }
        catch (ParseException &pe)
        {
            pe.addComponent("element '" + elemIt.first + "'");
            if (!isLax())
                throw;
            recordError(elemIt.first, pe.what());
            pElem = std::make_shared<ElementDecl>(elemIt.first);
            pElem->setType(m_pRegistry->getAnyType());
            pElem->setBuildError(pe.getReason());
            pElem->setBuilt(true);
        }
        pElem->setGlobal(true);
        m_pRegistry->addElement(pElem);
    }
}


void XSDSchemaParser::resolveReferences()
{
    for (auto &pElem : m_pendingElements)
    {
        try
        {
            if (pElem->isRef())
            {
                const ElementDecl *pTarget = m_pRegistry->getElement(pElem->getRefName());
                if (pTarget == nullptr)
                    throw(ParseException("Unknown element '" + pElem->getRefName() + "'"));
                pElem->setRef(pTarget);
            }
            else if (!pElem->getTypeName().empty())
            {
                pElem->setType(getTypeByName(pElem->getTypeName()));
            }
            else if (pElem->getType() == nullptr && pElem->getSubstitutionGroup().empty())
            {
                pElem->setType(m_pRegistry->getAnyType());
            }
        }
        catch (ParseException &pe)
        {
            pe.addComponent(pElem->getDescription());
            if (!isLax())
                throw;
            recordError(pElem->getName(), pe.what());
            pElem->setRefName("");
            pElem->setType(m_pRegistry->getAnyType());
            pElem->setBuildError(pe.getReason());
        }
    }

    for (auto &pAttr : m_pendingAttributes)
    {
        try
        {
            if (pAttr->isRef())
            {
                const AttributeDecl *pTarget = m_pRegistry->getAttribute(pAttr->getRefName());
                if (pTarget == nullptr)
                    throw(ParseException("Unknown attribute '" + pAttr->getRefName() + "'"));
                pAttr->setRef(pTarget);
            }
            else if (!pAttr->getTypeName().empty())
            {
                pAttr->setType(getSimpleTypeByName(pAttr->getTypeName()));
            }
            else if (pAttr->getType() == nullptr)
            {
                pAttr->setType(m_pRegistry->getAnySimpleType());
            }
        }
        catch (ParseException &pe)
        {
            pe.addComponent(pAttr->getDescription());
            if (!isLax())
                throw;
            recordError(pAttr->getName(), pe.what());
            pAttr->setRefName("");
            pAttr->setType(m_pRegistry->getAnySimpleType());
            pAttr->setBuildError(pe.getReason());
        }
    }

    for (auto &groupRef : m_pendingGroupRefs)
    {
        try
        {
            const ModelGroup *pTarget = m_pRegistry->getGroup(groupRef.pGroup->getRefName());
            if (pTarget == nullptr)
                throw(ParseException("Unknown group '" + groupRef.pGroup->getRefName() + "'"));

            if (m_mode != ValidationContext::skip && pTarget->getModel() == ModelGroup::allModel)
            {
                if (groupRef.nested)
                    throw(ParseException("A reference to an all group may only appear as the whole content model"));
                if (groupRef.pGroup->getMaxOccurs() > 1)
                    throw(ParseException("An all group can't occur more than once"));
            }
            groupRef.pGroup->setRef(pTarget);
        }
        catch (ParseException &pe)
        {
            pe.addComponent(groupRef.pGroup->getDescription());
            if (!isLax())
                throw;
            recordError(groupRef.pGroup->getRefName(), pe.what());
            groupRef.pGroup->setBuildError(pe.getReason());
        }
    }

    checkGroupCycles();
}


void XSDSchemaParser::checkGroupCycles()
{
    for (auto &groupIt : m_groupTrees)
    {
        std::shared_ptr<ModelGroup> pGroup = m_pRegistry->findGroup(groupIt.first);
        std::set<const ModelGroup *> visited;
        if (!pGroup || !reachesGroup(pGroup.get(), pGroup.get(), visited))
            continue;

        std::string msg = "Circular reference to group '" + groupIt.first + "'";
        if (!isLax())
            throw(ParseException(msg));

        //
        // Break the cycle, every reference to the group matches nothing
        recordError(groupIt.first, msg);
        pGroup->setBuildError(msg);
        for (auto &groupRef : m_pendingGroupRefs)
        {
            if (groupRef.pGroup->getRefName() == groupIt.first)
            {
                groupRef.pGroup->setRef(nullptr);
                groupRef.pGroup->setBuildError(msg);
            }
        }
    }
}


void XSDSchemaParser::resolveSubstitutionTypes()
{
    //
    // A substitution group member with no type of its own takes the type of its head
    for (auto &elemIt : m_pRegistry->getElements())
    {
        std::shared_ptr<ElementDecl> pElem = elemIt.second;
        if (pElem->getSubstitutionGroup().empty())
            continue;

        try
        {
            const ElementDecl *pHead = m_pRegistry->getElement(pElem->getSubstitutionGroup());
            if (pHead == nullptr)
                throw(ParseException("Unknown substitution group head '" + pElem->getSubstitutionGroup() + "'"));

            if (pElem->getType() == nullptr)
            {
                unsigned depth = 0;
                while (pHead->getType() == nullptr && !pHead->getSubstitutionGroup().empty())
                {
                    const ElementDecl *pNext = m_pRegistry->getElement(pHead->getSubstitutionGroup());
                    if (pNext == nullptr || pNext == pElem.get() || ++depth > m_pRegistry->getElements().size())
                        throw(ParseException("Circular substitution group for element '" + pElem->getName() + "'"));
                    pHead = pNext;
                }
                pElem->setType(pHead->getType() != nullptr ? pHead->getType() : m_pRegistry->getAnyType());
            }
        }
        catch (ParseException &pe)
        {
            pe.addComponent(pElem->getDescription());
            if (!isLax())
                throw;
            recordError(pElem->getName(), pe.what());
            pElem->setSubstitutionGroup("");
            pElem->setType(m_pRegistry->getAnyType());
            pElem->setBuildError(pe.getReason());
        }
    }
}


void XSDSchemaParser::checkDerivations()
{
    if (m_mode == ValidationContext::skip)
        return;

    for (auto &pType : m_complexTypes)
    {
        try
        {
            pType->checkDerivation();
        }
        catch (ParseException &pe)
        {
            pe.addComponent(pType->getDescription());
            if (!isLax())
                throw;
            recordError(pType->getName(), pe.what());
            pType->setBuildError(pe.getReason());
        }
    }
}


std::string XSDSchemaParser::getXSDAttributeValue(const pt::ptree &tree, const std::string &attrName, bool throwIfNotPresent, const std::string &defaultVal) const
{
    std::string value = defaultVal;
    try
    {
        value = tree.get<std::string>(attrName);
    }
    catch (std::exception &e)
    {
        if (throwIfNotPresent)
            throw(ParseException("Missing attribute " + attrName + "."));
    }
    return value;
}


bool XSDSchemaParser::hasXSDAttribute(const pt::ptree &tree, const std::string &attrName) const
{
    return static_cast<bool>(tree.get_child_optional(attrName));
}


bool XSDSchemaParser::getXSDBoolAttribute(const pt::ptree &tree, const std::string &attrName, bool defaultVal) const
{
    return getBoolFromString(getXSDAttributeValue(tree, attrName, false, defaultVal ? "true" : "false"), attrName);
}


std::string XSDSchemaParser::getXSDTag(const std::string &key) const
{
    if (key.empty() || key[0] == '<')
        return "";
    if (m_xsdPrefix.empty())
        return (key.find(':') == std::string::npos) ? key : "";
    return (key.compare(0, m_xsdPrefix.size(), m_xsdPrefix) == 0) ? key.substr(m_xsdPrefix.size()) : "";
}


std::string XSDSchemaParser::resolveQName(const std::string &prefixedName) const
{
    std::string prefix, localName;
    splitPrefixedName(trimWhitespace(prefixedName), prefix, localName);
    if (prefix == "xml")
        return makeQName(XML_NAMESPACE, localName);

    auto it = m_namespaces.find(prefix);
    if (it == m_namespaces.end())
    {
        if (prefix.empty())
            return localName;
        throw(ParseException("Unknown namespace prefix '" + prefix + "' in '" + prefixedName + "'"));
    }
    return makeQName(it->second, localName);
}


std::string XSDSchemaParser::getGlobalName(const pt::ptree &tree) const
{
    return makeQName(m_targetNamespace, getXSDAttributeValue(tree, "<xmlattr>.name"));
}


std::string XSDSchemaParser::getLocalDeclName(const pt::ptree &tree, bool qualifiedDefault) const
{
    std::string name = getXSDAttributeValue(tree, "<xmlattr>.name");
    std::string form = getXSDAttributeValue(tree, "<xmlattr>.form", false, qualifiedDefault ? "qualified" : "unqualified");
    if (form != "qualified" && form != "unqualified")
    {
        throw(ParseException("Invalid form '" + form + "' for '" + name + "'"));
    }
    return (form == "qualified") ? makeQName(m_targetNamespace, name) : name;
}


void XSDSchemaParser::recordError(const std::string &component, const std::string &msg)
{
    m_status.addMsg(statusMsg::error, component, msg);
    getLogger()->warn("Schema error recovered in {} mode: {}", ValidationContext::getModeString(m_mode), msg);
}


const SchemaType *XSDSchemaParser::getTypeByName(const std::string &qname)
{
    const SchemaType *pType = m_pRegistry->getType(qname);
    if (pType == nullptr)
    {
        if (m_typeTrees.find(qname) == m_typeTrees.end())
        {
            throw(ParseException("Unknown type '" + qname + "'"));
        }
        if (m_inProgress.find("type " + qname) != m_inProgress.end())
        {
            throw(ParseException("Circular definition of type '" + qname + "'"));
        }
        buildGlobalType(qname);
        pType = m_pRegistry->getType(qname);
    }
    return pType;
}


const SimpleType *XSDSchemaParser::getSimpleTypeByName(const std::string &qname)
{
    const SchemaType *pType = getTypeByName(qname);
    if (!pType->isSimple())
    {
        throw(ParseException("Type '" + qname + "' is not a simple type"));
    }
    return static_cast<const SimpleType *>(pType);
}


const AttributeGroup *XSDSchemaParser::getAttributeGroupByName(const std::string &qname)
{
    const AttributeGroup *pGroup = m_pRegistry->getAttributeGroup(qname);
    if (pGroup == nullptr)
    {
        if (m_attributeGroupTrees.find(qname) == m_attributeGroupTrees.end())
        {
            throw(ParseException("Unknown attributeGroup '" + qname + "'"));
        }
        if (m_inProgress.find("attributeGroup " + qname) != m_inProgress.end())
        {
            throw(ParseException("Circular reference to attributeGroup '" + qname + "'"));
        }
        buildGlobalAttributeGroup(qname);
        pGroup = m_pRegistry->getAttributeGroup(qname);
    }
    return pGroup;
}


void XSDSchemaParser::buildGlobalType(const std::string &qname)
{
    const std::string key = "type " + qname;
    bool isSimple = m_typeIsSimple[qname];
    std::shared_ptr<SchemaType> pType;

    m_inProgress.insert(key);
    try
    {
        if (isSimple)
            pType = parseSimpleType(*m_typeTrees[qname], qname);
        else
            pType = parseComplexType(*m_typeTrees[qname], qname);
    }
    catch (ParseException &pe)
    {
        m_inProgress.erase(key);
        pe.addComponent((isSimple ? "simpleType '" : "complexType '") + qname + "'");
        if (!isLax())
            throw;
        recordError(qname, pe.what());
        pType = makeFallbackType(qname, isSimple, pe.getReason());
    }
    m_inProgress.erase(key);

    pType->setGlobal(true);
    m_pRegistry->addType(pType);
    getLogger()->debug("Built {} '{}'", isSimple ? "simpleType" : "complexType", qname);
}


void XSDSchemaParser::buildGlobalAttributeGroup(const std::string &qname)
{
    const std::string key = "attributeGroup " + qname;
    std::shared_ptr<AttributeGroup> pGroup = std::make_shared<AttributeGroup>(qname);

    m_inProgress.insert(key);
    try
    {
        parseAttributeUses(*m_attributeGroupTrees[qname], *pGroup);
    }
    catch (ParseException &pe)
    {
        m_inProgress.erase(key);
        pe.addComponent("attributeGroup '" + qname + "'");
        if (!isLax())
            throw;
        recordError(qname, pe.what());
        pGroup = std::make_shared<AttributeGroup>(qname);
        pGroup->setBuildError(pe.getReason());
    }
    m_inProgress.erase(key);

    pGroup->setGlobal(true);
    pGroup->setBuilt(true);
    m_pRegistry->addAttributeGroup(pGroup);
    getLogger()->debug("Built attributeGroup '{}'", qname);
}


std::shared_ptr<SchemaType> XSDSchemaParser::makeFallbackType(const std::string &qname, bool isSimple, const std::string &msg) const
{
    std::shared_ptr<SchemaType> pType;
    if (isSimple)
    {
        const SimpleType *pAnySimple = m_pRegistry->getAnySimpleType();
        std::shared_ptr<SimpleType> pSimple = std::make_shared<SimpleType>(qname);
        pSimple->setBaseType(pAnySimple);
        pSimple->setBaseName(pAnySimple->getName());
        pSimple->setDerivation(SchemaType::restriction);
        pType = pSimple;
    }
    else
    {
        //
        // Same content and attribute wildcard as anyType
        const ComplexType *pAnyType = m_pRegistry->getAnyType();
        std::shared_ptr<ComplexType> pComplex = std::make_shared<ComplexType>(qname);
        pComplex->setBaseType(pAnyType);
        pComplex->setBaseName(pAnyType->getName());
        pComplex->setDerivation(SchemaType::restriction);
        pComplex->setMixed(true);
        pComplex->setContentGroup(pAnyType->getContentGroupPtr());
        pComplex->getAttributeGroup().setWildcard(pAnyType->getAttributeGroup().getWildcard());
        pComplex->getAttributeGroup().setBuilt(true);
        pType = pComplex;
    }
    pType->setBuildError(msg);
    pType->setBuilt(true);
    return pType;
}


std::shared_ptr<SimpleType> XSDSchemaParser::parseSimpleType(const pt::ptree &typeTree, const std::string &name)
{
    std::shared_ptr<SimpleType> pType;
    for (auto it = typeTree.begin(); it != typeTree.end(); ++it)
    {
        std::string tag = getXSDTag(it->first);
        if (it->first == "<xmlattr>" || tag == "annotation")
            continue;
        if (pType)
            throw(ParseException("A simpleType may contain only one restriction, list or union"));

        if (tag == "restriction")
            pType = parseSimpleRestriction(it->second, name, nullptr);
        else if (tag == "list")
            pType = parseList(it->second, name);
        else if (tag == "union")
            pType = parseUnion(it->second, name);
        else
            throw(ParseException("Unexpected element '" + it->first + "' in simpleType"));
    }

    if (!pType)
    {
        throw(ParseException("A simpleType must contain a restriction, list or union"));
    }
    pType->setBuilt(true);
    return pType;
}


std::shared_ptr<SimpleType> XSDSchemaParser::parseSimpleRestriction(const pt::ptree &restrictTree, const std::string &name, const SimpleType *pBase)
{
    std::shared_ptr<SimpleType> pInlineBase;
    if (pBase == nullptr)
    {
        std::string baseName = getXSDAttributeValue(restrictTree, "<xmlattr>.base", false, "");
        if (!baseName.empty())
        {
            pBase = getSimpleTypeByName(resolveQName(baseName));
        }
        else
        {
            for (auto it = restrictTree.begin(); it != restrictTree.end() && !pInlineBase; ++it)
            {
                if (getXSDTag(it->first) == "simpleType")
                    pInlineBase = parseSimpleType(it->second, "");
            }
            if (!pInlineBase)
                throw(ParseException("A restriction must have a base attribute or an anonymous simpleType"));
            pBase = pInlineBase.get();
        }
    }

    //
    // A restriction keeps the variety, the primitive and the item or member types of its base
    std::shared_ptr<SimpleType> pType = std::make_shared<SimpleType>(name, pBase->getVariety());
    if (pInlineBase)
        pType->addLocalType(pInlineBase);
    pType->setPrimitive(pBase->getPrimitive());
    pType->setItemType(pBase->getItemType());
    pType->setItemTypeName(pBase->getItemTypeName());
    for (auto pMember : pBase->getMemberTypes())
        pType->addMemberType(pMember);
    pType->setBaseType(pBase);
    pType->setBaseName(pBase->getName());
    pType->setDerivation(SchemaType::restriction);

    parseFacets(restrictTree, *pType, *pBase);
    if (m_mode != ValidationContext::skip)
        pType->checkFacets();

    pType->setBuilt(true);
    return pType;
}


void XSDSchemaParser::parseFacets(const pt::ptree &restrictTree, SimpleType &type, const SimpleType &base)
{
    std::shared_ptr<EnumerationFacet> pEnumeration;
    std::shared_ptr<PatternFacet> pPattern;

    for (auto it = restrictTree.begin(); it != restrictTree.end(); ++it)
    {
        std::string tag = getXSDTag(it->first);
        if (it->first == "<xmlattr>" || tag == "annotation" || tag == "simpleType" ||
            tag == "attribute" || tag == "attributeGroup" || tag == "anyAttribute")
        {
            continue;
        }

        SchemaFacet::facetKind kind;
        if (!SchemaFacet::getKindFromName(tag, kind))
        {
            throw(ParseException("Unknown facet '" + it->first + "'"));
        }
        if (!type.isFacetAdmitted(kind, m_xsd11))
        {
            throw(ParseException("Facet '" + tag + "' is not allowed for " + base.getDescription() + " derived types"));
        }

        std::string value = getXSDAttributeValue(it->second, "<xmlattr>.value");
        bool fixed = getXSDBoolAttribute(it->second, "<xmlattr>.fixed", false);
        switch (kind)
        {
            case SchemaFacet::length:
            case SchemaFacet::minLength:
            case SchemaFacet::maxLength:
                type.getFacets().addFacet(std::make_shared<LengthFacet>(kind, getFacetSize(value, tag), fixed));
                break;

            case SchemaFacet::totalDigits:
            case SchemaFacet::fractionDigits:
            {
                size_t digits = getFacetSize(value, tag);
                if (kind == SchemaFacet::totalDigits && digits == 0)
                    throw(ParseException("Facet totalDigits must be a positive integer"));
                type.getFacets().addFacet(std::make_shared<DigitsFacet>(kind, static_cast<unsigned>(digits), fixed));
                break;
            }

            case SchemaFacet::minInclusive:
            case SchemaFacet::minExclusive:
            case SchemaFacet::maxInclusive:
            case SchemaFacet::maxExclusive:
                type.getFacets().addFacet(std::make_shared<BoundFacet>(kind, decodeFacetValue(base, kind, value), fixed));
                break;

            case SchemaFacet::enumeration:
                if (!pEnumeration)
                    pEnumeration = std::make_shared<EnumerationFacet>();
                pEnumeration->addAllowedValue(value, decodeFacetValue(base, kind, value));
                break;

            //
            // Patterns in the same derivation step are alternatives
            case SchemaFacet::pattern:
                if (!pPattern)
                    pPattern = std::make_shared<PatternFacet>();
                pPattern->addPattern(value);
                break;

            case SchemaFacet::whiteSpace:
            {
                PrimitiveType::whiteSpacePolicy policy;
                if (!PrimitiveType::getWhiteSpaceFromName(value, policy))
                    throw(ParseException("Invalid whiteSpace value '" + value + "'"));
                type.getFacets().addFacet(std::make_shared<WhiteSpaceFacet>(policy, fixed));
                break;
            }

            case SchemaFacet::explicitTimezone:
            {
                TimezoneFacet::timezonePolicy policy;
                if (value == "optional")
                    policy = TimezoneFacet::optional;
                else if (value == "required")
                    policy = TimezoneFacet::required;
                else if (value == "prohibited")
                    policy = TimezoneFacet::prohibited;
                else
                    throw(ParseException("Invalid explicitTimezone value '" + value + "'"));
                type.getFacets().addFacet(std::make_shared<TimezoneFacet>(policy, fixed));
                break;
            }

            default:
                break;
        }
    }

    if (pEnumeration)
        type.getFacets().addFacet(pEnumeration);
    if (pPattern)
        type.getFacets().addFacet(pPattern);
}


Value XSDSchemaParser::decodeFacetValue(const SimpleType &base, SchemaFacet::facetKind kind, const std::string &lexical) const
{
    ErrorCollector collector;
    Value value;
    if (kind == SchemaFacet::enumeration)
    {
        DefaultConverter converter;
        ValidationContext ctx(*m_pRegistry, ValidationContext::lax, &collector, converter);
        value = base.decode(lexical, ctx);
    }
    else
    {
        //
        // Bounds are compared with the base facets by checkFacets, only the lexical form is checked here
        std::string reason;
        if (!PrimitiveType::decode(base.getPrimitive(), base.normalize(lexical), value, reason))
            collector.visitError(ValidationError(ValidationError::decode, reason, base.getDescription(), lexical));
    }

    if (!collector.empty())
    {
        throw(ParseException(std::string("Invalid ") + SchemaFacet::getKindName(kind) + " value '" + lexical + "': " + collector.getErrors().front().reason));
    }
    return value;
}


const SimpleType *XSDSchemaParser::getInlineOrNamedBase(const pt::ptree &tree, const std::string &attrName, SimpleType &owner)
{
    std::string typeName = getXSDAttributeValue(tree, attrName, false, "");
    if (!typeName.empty())
        return getSimpleTypeByName(resolveQName(typeName));

    for (auto it = tree.begin(); it != tree.end(); ++it)
    {
        if (getXSDTag(it->first) == "simpleType")
        {
            std::shared_ptr<SimpleType> pInline = parseSimpleType(it->second, "");
            owner.addLocalType(pInline);
            return pInline.get();
        }
    }
    throw(ParseException("Missing attribute " + attrName + " or anonymous simpleType."));
}


std::shared_ptr<SimpleType> XSDSchemaParser::parseList(const pt::ptree &listTree, const std::string &name)
{
    std::shared_ptr<SimpleType> pType = std::make_shared<SimpleType>(name, SimpleType::listVariety);
    const SimpleType *pItemType = getInlineOrNamedBase(listTree, "<xmlattr>.itemType", *pType);
    if (pItemType->getVariety() == SimpleType::listVariety)
    {
        throw(ParseException("The item type of a list can't be a list type"));
    }
    pType->setItemType(pItemType);
    pType->setItemTypeName(pItemType->getName());

    const SimpleType *pAnySimple = m_pRegistry->getAnySimpleType();
    pType->setBaseType(pAnySimple);
    pType->setBaseName(pAnySimple->getName());
    pType->setDerivation(SchemaType::restriction);
    pType->setBuilt(true);
    return pType;
}


std::shared_ptr<SimpleType> XSDSchemaParser::parseUnion(const pt::ptree &unionTree, const std::string &name)
{
    std::shared_ptr<SimpleType> pType = std::make_shared<SimpleType>(name, SimpleType::unionVariety);
    for (auto &memberName : splitWhitespace(getXSDAttributeValue(unionTree, "<xmlattr>.memberTypes", false, "")))
    {
        std::string qname = resolveQName(memberName);
        pType->addMemberType(getSimpleTypeByName(qname));
        pType->addMemberTypeName(qname);
    }

    for (auto it = unionTree.begin(); it != unionTree.end(); ++it)
    {
        if (getXSDTag(it->first) == "simpleType")
        {
            std::shared_ptr<SimpleType> pMember = parseSimpleType(it->second, "");
            pType->addLocalType(pMember);
            pType->addMemberType(pMember.get());
        }
    }

    if (pType->getMemberTypes().empty())
    {
        throw(ParseException("A union must have member types"));
    }

    const SimpleType *pAnySimple = m_pRegistry->getAnySimpleType();
    pType->setBaseType(pAnySimple);
    pType->setBaseName(pAnySimple->getName());
    pType->setDerivation(SchemaType::restriction);
    pType->setBuilt(true);
    return pType;
}


std::shared_ptr<ComplexType> XSDSchemaParser::parseComplexType(const pt::ptree &typeTree, const std::string &name)
{
    std::shared_ptr<ComplexType> pType = std::make_shared<ComplexType>(name);
    std::string mixedAttr = getXSDAttributeValue(typeTree, "<xmlattr>.mixed", false, "");
    pType->setMixed(!mixedAttr.empty() && getBoolFromString(mixedAttr, "mixed"));
    pType->setAbstract(getXSDBoolAttribute(typeTree, "<xmlattr>.abstract", false));

    bool derived = false;
    for (auto it = typeTree.begin(); it != typeTree.end(); ++it)
    {
        std::string tag = getXSDTag(it->first);
        if (it->first == "<xmlattr>" || tag == "annotation" || tag == "attribute" || tag == "attributeGroup" || tag == "anyAttribute")
            continue;

        if (derived || pType->getContentGroupPtr())
        {
            throw(ParseException("Unexpected element '" + it->first + "' after the content model of a complexType"));
        }

        if (tag == "simpleContent")
        {
            parseSimpleContent(it->second, *pType);
            derived = true;
        }
        else if (tag == "complexContent")
        {
            parseComplexContent(it->second, *pType, mixedAttr);
            derived = true;
        }
        else if (tag == "sequence" || tag == "choice" || tag == "all" || tag == "group")
        {
            pType->setContentGroup(parseContentParticle(tag, it->second));
        }
        else
        {
            throw(ParseException("Unexpected element '" + it->first + "' in complexType"));
        }
    }

    //
    // Without simpleContent or complexContent the type is a restriction of anyType
    if (!derived)
    {
        const ComplexType *pAnyType = m_pRegistry->getAnyType();
        pType->setBaseType(pAnyType);
        pType->setBaseName(pAnyType->getName());
        pType->setDerivation(SchemaType::restriction);
        parseAttributeUses(typeTree, pType->getAttributeGroup());
    }

    pType->getAttributeGroup().setBuilt(true);
    pType->setBuilt(true);
    m_complexTypes.push_back(pType);
    return pType;
}


const pt::ptree &XSDSchemaParser::getDerivationTree(const pt::ptree &contentTree, bool &isExtension) const
{
    const pt::ptree *pDerivTree = nullptr;
    for (auto it = contentTree.begin(); it != contentTree.end(); ++it)
    {
        std::string tag = getXSDTag(it->first);
        if (it->first == "<xmlattr>" || tag == "annotation")
            continue;

        if (pDerivTree != nullptr || (tag != "restriction" && tag != "extension"))
            throw(ParseException("Unexpected element '" + it->first + "', expected a single restriction or extension"));
        pDerivTree = &it->second;
        isExtension = (tag == "extension");
    }

    if (pDerivTree == nullptr)
    {
        throw(ParseException("Content must be derived by restriction or extension"));
    }
    return *pDerivTree;
}


void XSDSchemaParser::parseSimpleContent(const pt::ptree &contentTree, ComplexType &type)
{
    bool isExtension = false;
    const pt::ptree &derivTree = getDerivationTree(contentTree, isExtension);
    std::string baseName = resolveQName(getXSDAttributeValue(derivTree, "<xmlattr>.base"));
    const SchemaType *pBase = getTypeByName(baseName);

    type.setBaseType(pBase);
    type.setBaseName(baseName);
    type.setDerivation(isExtension ? SchemaType::extension : SchemaType::restriction);
    parseAttributeUses(derivTree, type.getAttributeGroup());

    if (isExtension)
    {
        for (auto it = derivTree.begin(); it != derivTree.end(); ++it)
        {
            std::string tag = getXSDTag(it->first);
            if (it->first != "<xmlattr>" && tag != "annotation" && tag != "attribute" && tag != "attributeGroup" && tag != "anyAttribute")
                throw(ParseException("Unexpected element '" + it->first + "' in a simpleContent extension"));
        }

        if (pBase->isSimple())
        {
            type.setSimpleContent(static_cast<const SimpleType *>(pBase));
        }
        else if (pBase->hasSimpleContent())
        {
            type.setSimpleContent(pBase->getContentSimpleType());
            type.getAttributeGroup().addAttributes(static_cast<const ComplexType *>(pBase)->getAttributeGroup(), false);
        }
        else
        {
            throw(ParseException("The base type of a simpleContent extension must have simple content"));
        }
        return;
    }

    if (pBase->isSimple() || !pBase->hasSimpleContent())
    {
        throw(ParseException("The base type of a simpleContent restriction must be a complex type with simple content"));
    }

    std::shared_ptr<SimpleType> pInline;
    for (auto it = derivTree.begin(); it != derivTree.end() && !pInline; ++it)
    {
        if (getXSDTag(it->first) == "simpleType")
            pInline = parseSimpleType(it->second, "");
    }

    std::shared_ptr<SimpleType> pContent = parseSimpleRestriction(derivTree, "", pInline ? pInline.get() : pBase->getContentSimpleType());
    if (pInline)
        pContent->addLocalType(pInline);
    type.setLocalSimpleContent(pContent);
    type.getAttributeGroup().addAttributes(static_cast<const ComplexType *>(pBase)->getAttributeGroup(), true);
}


void XSDSchemaParser::parseComplexContent(const pt::ptree &contentTree, ComplexType &type, const std::string &mixedAttr)
{
    bool isExtension = false;
    const pt::ptree &derivTree = getDerivationTree(contentTree, isExtension);
    std::string baseName = resolveQName(getXSDAttributeValue(derivTree, "<xmlattr>.base"));
    const SchemaType *pBase = getTypeByName(baseName);
    if (pBase->isSimple())
    {
        throw(ParseException("The base type of a complexContent derivation must be a complex type"));
    }
    const ComplexType *pComplexBase = static_cast<const ComplexType *>(pBase);

    type.setBaseType(pBase);
    type.setBaseName(baseName);
    type.setDerivation(isExtension ? SchemaType::extension : SchemaType::restriction);

    std::shared_ptr<ModelGroup> pOwnGroup;
    for (auto it = derivTree.begin(); it != derivTree.end(); ++it)
    {
        std::string tag = getXSDTag(it->first);
        if (it->first == "<xmlattr>" || tag == "annotation" || tag == "attribute" || tag == "attributeGroup" || tag == "anyAttribute")
            continue;
        if (pOwnGroup || (tag != "sequence" && tag != "choice" && tag != "all" && tag != "group"))
            throw(ParseException("Unexpected element '" + it->first + "' in complexContent"));
        pOwnGroup = parseContentParticle(tag, it->second);
    }
    parseAttributeUses(derivTree, type.getAttributeGroup());

    //
    // The mixed attribute of complexContent wins over the one of complexType
    std::string contentMixed = getXSDAttributeValue(contentTree, "<xmlattr>.mixed", false, mixedAttr);

    if (!isExtension)
    {
        type.setMixed(!contentMixed.empty() && getBoolFromString(contentMixed, "mixed"));
        type.setContentGroup(pOwnGroup);
        type.getAttributeGroup().addAttributes(pComplexBase->getAttributeGroup(), true);
        return;
    }

    type.setMixed(contentMixed.empty() ? pComplexBase->isMixed() : getBoolFromString(contentMixed, "mixed"));
    if (pComplexBase->hasSimpleContent())
        type.setSimpleContent(pComplexBase->getContentSimpleType());

    //
    // Extension content is the base content followed by the own content. anyType is extended as empty.
    const std::shared_ptr<ModelGroup> &pBaseGroup = pComplexBase->getContentGroupPtr();
    bool baseEmpty = !pBaseGroup || pComplexBase == m_pRegistry->getAnyType() || (!pBaseGroup->isRef() && pBaseGroup->isEmpty());
    if (baseEmpty)
    {
        type.setContentGroup(pOwnGroup);
    }
    else if (!pOwnGroup)
    {
        type.setContentGroup(pBaseGroup);
    }
    else
    {
        if (m_mode != ValidationContext::skip && !pBaseGroup->isRef() && pBaseGroup->getModel() == ModelGroup::allModel)
        {
            throw(ParseException("An extension can't add particles to an all group"));
        }
        std::shared_ptr<ModelGroup> pSequence = std::make_shared<ModelGroup>("", ModelGroup::sequenceModel);
        pSequence->addParticle(pBaseGroup);
        pSequence->addParticle(pOwnGroup);
        pSequence->setBuilt(true);
        type.setContentGroup(pSequence);
    }
    type.getAttributeGroup().addAttributes(pComplexBase->getAttributeGroup(), false);
}


std::shared_ptr<ModelGroup> XSDSchemaParser::parseContentParticle(const std::string &tag, const pt::ptree &tree)
{
    if (tag == "group")
        return parseGroupRef(tree, false);
    return parseModelGroup(tree, ModelGroup::getModelFromString(tag), false);
}


std::shared_ptr<ElementDecl> XSDSchemaParser::parseElement(const pt::ptree &elemTree, bool isGlobal)
{
    std::shared_ptr<ElementDecl> pElem;
    std::string refName = getXSDAttributeValue(elemTree, "<xmlattr>.ref", false, "");
    if (!refName.empty())
    {
        if (isGlobal)
            throw(ParseException("A global element can't be a reference"));

        std::string qname = resolveQName(refName);
        pElem = std::make_shared<ElementDecl>(qname);
        pElem->setRefName(qname);
        parseOccurs(elemTree, *pElem);
        pElem->setBuilt(true);
        m_pendingElements.push_back(pElem);
        return pElem;
    }

    std::string name = isGlobal ? getGlobalName(elemTree) : getLocalDeclName(elemTree, m_elementQualified);
    pElem = std::make_shared<ElementDecl>(name);
    if (!isGlobal)
        parseOccurs(elemTree, *pElem);

    pElem->setNillable(getXSDBoolAttribute(elemTree, "<xmlattr>.nillable", false));
    if (isGlobal)
    {
        pElem->setAbstract(getXSDBoolAttribute(elemTree, "<xmlattr>.abstract", false));
        std::string headName = getXSDAttributeValue(elemTree, "<xmlattr>.substitutionGroup", false, "");
        if (!headName.empty())
            pElem->setSubstitutionGroup(resolveQName(headName));
    }

    if (hasXSDAttribute(elemTree, "<xmlattr>.default"))
        pElem->setDefault(getXSDAttributeValue(elemTree, "<xmlattr>.default"));
    if (hasXSDAttribute(elemTree, "<xmlattr>.fixed"))
        pElem->setFixed(getXSDAttributeValue(elemTree, "<xmlattr>.fixed"));

    std::string typeName = getXSDAttributeValue(elemTree, "<xmlattr>.type", false, "");
    bool hasLocalType = false;
    for (auto it = elemTree.begin(); it != elemTree.end(); ++it)
    {
        std::string tag = getXSDTag(it->first);
        if (tag == "simpleType" || tag == "complexType")
        {
            if (!typeName.empty() || hasLocalType)
                throw(ParseException("Element '" + name + "' can have only one of a type attribute or an anonymous type"));
            if (tag == "simpleType")
                pElem->setLocalType(parseSimpleType(it->second, ""));
            else
                pElem->setLocalType(parseComplexType(it->second, ""));
            hasLocalType = true;
        }
        else if (it->first != "<xmlattr>" && tag != "annotation" && tag != "unique" && tag != "key" && tag != "keyref")
        {
            throw(ParseException("Unexpected element '" + it->first + "' in element '" + name + "'"));
        }
    }

    if (!typeName.empty())
        pElem->setTypeName(resolveQName(typeName));

    pElem->setBuilt(true);
    m_pendingElements.push_back(pElem);
    return pElem;
}


std::shared_ptr<AttributeDecl> XSDSchemaParser::parseAttribute(const pt::ptree &attrTree, bool isGlobal)
{
    std::shared_ptr<AttributeDecl> pAttr;
    std::string refName = getXSDAttributeValue(attrTree, "<xmlattr>.ref", false, "");
    if (!refName.empty())
    {
        if (isGlobal)
            throw(ParseException("A global attribute can't be a reference"));

        std::string qname = resolveQName(refName);
        pAttr = std::make_shared<AttributeDecl>(qname);
        pAttr->setRefName(qname);
    }
    else
    {
        std::string name = isGlobal ? getGlobalName(attrTree) : getLocalDeclName(attrTree, m_attributeQualified);
        if (name == "xmlns")
            throw(ParseException("The attribute name 'xmlns' is reserved"));
        pAttr = std::make_shared<AttributeDecl>(name);

        std::string typeName = getXSDAttributeValue(attrTree, "<xmlattr>.type", false, "");
        for (auto it = attrTree.begin(); it != attrTree.end(); ++it)
        {
            std::string tag = getXSDTag(it->first);
            if (tag == "simpleType")
            {
                if (!typeName.empty() || pAttr->getType() != nullptr)
                    throw(ParseException("Attribute '" + name + "' can have only one of a type attribute or an anonymous simpleType"));
                pAttr->setLocalType(parseSimpleType(it->second, ""));
            }
            else if (it->first != "<xmlattr>" && tag != "annotation")
            {
                throw(ParseException("Unexpected element '" + it->first + "' in attribute '" + name + "'"));
            }
        }
        if (!typeName.empty())
            pAttr->setTypeName(resolveQName(typeName));
    }

    if (!isGlobal)
        pAttr->setUse(AttributeDecl::getUseFromString(getXSDAttributeValue(attrTree, "<xmlattr>.use", false, "optional")));

    if (hasXSDAttribute(attrTree, "<xmlattr>.default"))
    {
        if (pAttr->getUse() != AttributeDecl::optional)
            throw(ParseException("An attribute with a default value must be optional"));
        pAttr->setDefault(getXSDAttributeValue(attrTree, "<xmlattr>.default"));
    }
    if (hasXSDAttribute(attrTree, "<xmlattr>.fixed"))
        pAttr->setFixed(getXSDAttributeValue(attrTree, "<xmlattr>.fixed"));

    pAttr->setBuilt(true);
    m_pendingAttributes.push_back(pAttr);
    return pAttr;
}


void XSDSchemaParser::parseAttributeUses(const pt::ptree &tree, AttributeGroup &group)
{
    for (auto it = tree.begin(); it != tree.end(); ++it)
    {
        std::string tag = getXSDTag(it->first);
        if (tag == "attribute")
        {
            group.addAttribute(parseAttribute(it->second, false));
        }
        else if (tag == "attributeGroup")
        {
            std::string refName = resolveQName(getXSDAttributeValue(it->second, "<xmlattr>.ref"));
            group.addAttributes(*getAttributeGroupByName(refName), false);
            group.addGroupRefName(refName);
        }
        else if (tag == "anyAttribute")
        {
            group.setWildcard(parseWildcard(it->second, true));
        }
    }
}


std::shared_ptr<ModelGroup> XSDSchemaParser::parseModelGroup(const pt::ptree &groupTree, ModelGroup::modelKind model, bool nested)
{
    if (model == ModelGroup::allModel && nested && m_mode != ValidationContext::skip)
    {
        throw(ParseException("An all group may only appear as the whole content model"));
    }

    std::shared_ptr<ModelGroup> pGroup = std::make_shared<ModelGroup>("", model);
    parseOccurs(groupTree, *pGroup);

    for (auto it = groupTree.begin(); it != groupTree.end(); ++it)
    {
        std::string tag = getXSDTag(it->first);
        if (tag == "element")
            pGroup->addParticle(parseElement(it->second, false));
        else if (tag == "group")
            pGroup->addParticle(parseGroupRef(it->second, true));
        else if (tag == "sequence" || tag == "choice" || tag == "all")
            pGroup->addParticle(parseModelGroup(it->second, ModelGroup::getModelFromString(tag), true));
        else if (tag == "any")
            pGroup->addParticle(parseWildcard(it->second, false));
        else if (it->first != "<xmlattr>" && tag != "annotation")
            throw(ParseException("Unexpected element '" + it->first + "' in " + tag));
    }

    if (model == ModelGroup::allModel && m_mode != ValidationContext::skip)
        checkAllGroup(*pGroup);

    pGroup->setBuilt(true);
    return pGroup;
}


void XSDSchemaParser::checkAllGroup(const ModelGroup &group) const
{
    if (group.getMaxOccurs() > 1)
    {
        throw(ParseException("An all group can't occur more than once"));
    }

    for (auto &pParticle : group.getParticles())
    {
        if (pParticle->getParticleKind() != Particle::elementParticle)
            throw(ParseException("An all group may contain only element declarations"));
        if (pParticle->getMaxOccurs() > 1)
            throw(ParseException("Element '" + pParticle->getName() + "' in an all group can't occur more than once"));
    }
}


std::shared_ptr<ModelGroup> XSDSchemaParser::parseGroupRef(const pt::ptree &refTree, bool nested)
{
    std::shared_ptr<ModelGroup> pGroup = std::make_shared<ModelGroup>("", ModelGroup::sequenceModel);
    pGroup->setRefName(resolveQName(getXSDAttributeValue(refTree, "<xmlattr>.ref")));
    parseOccurs(refTree, *pGroup);
    pGroup->setBuilt(true);
    m_pendingGroupRefs.push_back(GroupRef(pGroup, nested));
    return pGroup;
}


std::shared_ptr<Wildcard> XSDSchemaParser::parseWildcard(const pt::ptree &anyTree, bool isAttribute)
{
    std::shared_ptr<Wildcard> pWildcard = std::make_shared<Wildcard>(m_targetNamespace, isAttribute);
    pWildcard->setNamespace(getXSDAttributeValue(anyTree, "<xmlattr>.namespace", false, "##any"));
    pWildcard->setProcessContents(Wildcard::getProcessContentsFromString(getXSDAttributeValue(anyTree, "<xmlattr>.processContents", false, "strict")));
    if (!isAttribute)
        parseOccurs(anyTree, *pWildcard);
    return pWildcard;
}


void XSDSchemaParser::parseOccurs(const pt::ptree &tree, Particle &particle) const
{
    unsigned minOccurs = Particle::getOccursFromString(getXSDAttributeValue(tree, "<xmlattr>.minOccurs", false, "1"), "minOccurs");
    unsigned maxOccurs = Particle::getOccursFromString(getXSDAttributeValue(tree, "<xmlattr>.maxOccurs", false, "1"), "maxOccurs");
    particle.setOccurs(minOccurs, maxOccurs);
}
