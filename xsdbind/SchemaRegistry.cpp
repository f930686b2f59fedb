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


#include "SchemaRegistry.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

using namespace xsdbind;

// Substitution chains longer than this can only be circular
static const unsigned MAX_SUBSTITUTION_DEPTH = 64;


SchemaRegistry::SchemaRegistry() :
    m_numBuiltinTypes(0), m_generation(0), m_validity(SchemaComponent::notKnown)
{
    m_pAnyElement = std::make_shared<ElementDecl>("");
    m_pAnyElement->setBuilt(true);
}


void SchemaRegistry::addType(const std::shared_ptr<SchemaType> &pType)
{
    auto rc = m_types.insert({pType->getName(), pType});
    if (!rc.second)
    {
        throw(ParseException("Duplicate type definition '" + pType->getName() + "'"));
    }

    if (pType->getName() == makeQName(XSD_NAMESPACE, "anyType"))
        m_pAnyElement->setType(pType.get());
}


void SchemaRegistry::addElement(const std::shared_ptr<ElementDecl> &pElement)
{
    auto rc = m_elements.insert({pElement->getName(), pElement});
    if (!rc.second)
    {
        throw(ParseException("Duplicate element definition '" + pElement->getName() + "'"));
    }
}


void SchemaRegistry::addAttribute(const std::shared_ptr<AttributeDecl> &pAttribute)
{
    auto rc = m_attributes.insert({pAttribute->getName(), pAttribute});
    if (!rc.second)
    {
        throw(ParseException("Duplicate attribute definition '" + pAttribute->getName() + "'"));
    }
}


void SchemaRegistry::addAttributeGroup(const std::shared_ptr<AttributeGroup> &pGroup)
{
    auto rc = m_attributeGroups.insert({pGroup->getName(), pGroup});
    if (!rc.second)
    {
        throw(ParseException("Duplicate attributeGroup definition '" + pGroup->getName() + "'"));
    }
}


void SchemaRegistry::addGroup(const std::shared_ptr<ModelGroup> &pGroup)
{
    auto rc = m_groups.insert({pGroup->getName(), pGroup});
    if (!rc.second)
    {
        throw(ParseException("Duplicate group definition '" + pGroup->getName() + "'"));
    }
}


const SchemaType *SchemaRegistry::getType(const std::string &name) const
{
    auto it = m_types.find(name);
    return (it != m_types.end()) ? it->second.get() : nullptr;
}


const SimpleType *SchemaRegistry::getSimpleType(const std::string &name) const
{
    const SchemaType *pType = getType(name);
    return (pType != nullptr && pType->isSimple()) ? static_cast<const SimpleType *>(pType) : nullptr;
}


const ElementDecl *SchemaRegistry::getElement(const std::string &name) const
{
    auto it = m_elements.find(name);
    return (it != m_elements.end()) ? it->second.get() : nullptr;
}


const AttributeDecl *SchemaRegistry::getAttribute(const std::string &name) const
{
    auto it = m_attributes.find(name);
    return (it != m_attributes.end()) ? it->second.get() : nullptr;
}


const AttributeGroup *SchemaRegistry::getAttributeGroup(const std::string &name) const
{
    auto it = m_attributeGroups.find(name);
    return (it != m_attributeGroups.end()) ? it->second.get() : nullptr;
}


const ModelGroup *SchemaRegistry::getGroup(const std::string &name) const
{
    auto it = m_groups.find(name);
    return (it != m_groups.end()) ? it->second.get() : nullptr;
}


std::shared_ptr<SchemaType> SchemaRegistry::findType(const std::string &name) const
{
    auto it = m_types.find(name);
    return (it != m_types.end()) ? it->second : nullptr;
}


std::shared_ptr<ElementDecl> SchemaRegistry::findElement(const std::string &name) const
{
    auto it = m_elements.find(name);
    return (it != m_elements.end()) ? it->second : nullptr;
}


std::shared_ptr<AttributeDecl> SchemaRegistry::findAttribute(const std::string &name) const
{
    auto it = m_attributes.find(name);
    return (it != m_attributes.end()) ? it->second : nullptr;
}


std::shared_ptr<AttributeGroup> SchemaRegistry::findAttributeGroup(const std::string &name) const
{
    auto it = m_attributeGroups.find(name);
    return (it != m_attributeGroups.end()) ? it->second : nullptr;
}


std::shared_ptr<ModelGroup> SchemaRegistry::findGroup(const std::string &name) const
{
    auto it = m_groups.find(name);
    return (it != m_groups.end()) ? it->second : nullptr;
}


const std::vector<const ElementDecl *> &SchemaRegistry::getSubstitutes(const std::string &headName) const
{
    static const std::vector<const ElementDecl *> noSubstitutes;
    auto it = m_substitutes.find(headName);
    return (it != m_substitutes.end()) ? it->second : noSubstitutes;
}


const ComplexType *SchemaRegistry::getAnyType() const
{
    const SchemaType *pType = getType(makeQName(XSD_NAMESPACE, "anyType"));
    return (pType != nullptr && pType->isComplex()) ? static_cast<const ComplexType *>(pType) : nullptr;
}


const SimpleType *SchemaRegistry::getAnySimpleType() const
{
    return getSimpleType(makeQName(XSD_NAMESPACE, "anySimpleType"));
}


void SchemaRegistry::completeBuildPass()
{
    //
    // Substitution groups, each member is listed under every head up its chain
    m_substitutes.clear();
    for (auto &elemIt : m_elements)
    {
        const ElementDecl *pMember = elemIt.second.get();
        std::string headName = pMember->getSubstitutionGroup();
        for (unsigned depth = 0; !headName.empty() && depth < MAX_SUBSTITUTION_DEPTH; ++depth)
        {
            if (!pMember->isAbstract())
                m_substitutes[headName].push_back(pMember);
            const ElementDecl *pHead = getElement(headName);
            if (pHead == nullptr || pHead == pMember)
                break;
            headName = pHead->getSubstitutionGroup();
        }
    }

    ++m_generation;
    m_pBuildToken = std::make_shared<const BuildToken>(m_generation);

    unsigned numInvalid = 0, numNotKnown = 0;
    auto checkComponent = [this, &numInvalid, &numNotKnown](const SchemaComponent &component)
    {
        SchemaComponent::validity v = component.check(m_pBuildToken);
        if (v == SchemaComponent::invalid)
            ++numInvalid;
        else if (v == SchemaComponent::notKnown)
            ++numNotKnown;
    };

    for (auto &it : m_types)            checkComponent(*it.second);
    for (auto &it : m_elements)         checkComponent(*it.second);
    for (auto &it : m_attributes)       checkComponent(*it.second);
    for (auto &it : m_attributeGroups)  checkComponent(*it.second);
    for (auto &it : m_groups)           checkComponent(*it.second);

    if (numInvalid != 0)
        m_validity = SchemaComponent::invalid;
    else if (numNotKnown != 0)
        m_validity = SchemaComponent::notKnown;
    else
        m_validity = SchemaComponent::valid;

    getLogger()->info("Build pass {} complete: {} types ({} builtin), {} elements, {} attributes, {} attribute groups, {} groups, validity {}",
        m_generation, m_types.size(), m_numBuiltinTypes, m_elements.size(), m_attributes.size(), m_attributeGroups.size(),
        m_groups.size(), SchemaComponent::getValidityString(m_validity));
}
