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


#include <algorithm>
#include "AttributeGroup.hpp"
#include "SchemaRegistry.hpp"
#include "ValidationContext.hpp"
#include "XmlElement.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"

using namespace xsdbind;


std::string AttributeGroup::getDescription() const
{
    return m_name.empty() ? std::string("attribute group") : "attributeGroup '" + m_name + "'";
}


void AttributeGroup::addAttribute(const std::shared_ptr<AttributeDecl> &pAttr)
{
    for (auto &pExisting : m_attributes)
    {
        if (pExisting->getName() == pAttr->getName())
        {
            throw(ParseException("Duplicate attribute '" + pAttr->getName() + "'"));
        }
    }
    m_attributes.push_back(pAttr);
}


void AttributeGroup::addAttributes(const AttributeGroup &other, bool keepExisting)
{
    for (auto &pAttr : other.m_attributes)
    {
        bool found = false;
        for (auto &pExisting : m_attributes)
        {
            if (pExisting->getName() == pAttr->getName())
                found = true;
        }

        if (!found)
            m_attributes.push_back(pAttr);
        else if (!keepExisting)
            throw(ParseException("Duplicate attribute '" + pAttr->getName() + "'"));
    }

    if (!m_pWildcard)
        m_pWildcard = other.m_pWildcard;
}


const AttributeDecl *AttributeGroup::findAttribute(const std::string &name, bool matchLocalName) const
{
    for (auto &pAttr : m_attributes)
    {
        if (pAttr->getName() == name)
            return pAttr.get();
    }

    //
    // A name without namespace may still mean a qualified attribute
    if (matchLocalName && getNamespace(name).empty())
    {
        for (auto &pAttr : m_attributes)
        {
            if (getLocalName(pAttr->getName()) == name)
                return pAttr.get();
        }
    }
    return nullptr;
}


SchemaComponent::validity AttributeGroup::doCheck(const std::shared_ptr<const BuildToken> &pToken) const
{
    validity result = valid;
    for (auto &pAttr : m_attributes)
        result = combine(result, pAttr->check(pToken));
    if (m_pWildcard)
        result = combine(result, m_pWildcard->check(pToken));
    return result;
}


const AttributeDecl *AttributeGroup::findWildcardDecl(const std::string &name, ValidationContext &ctx, bool &allowed) const
{
    allowed = false;
    if (!m_pWildcard || !m_pWildcard->isNameAllowed(name))
        return nullptr;

    const AttributeDecl *pGlobal = nullptr;
    if (m_pWildcard->getProcessContents() != Wildcard::skipContents)
        pGlobal = ctx.getRegistry().getAttribute(name);

    allowed = pGlobal != nullptr || m_pWildcard->getProcessContents() != Wildcard::strictContents;
    return pGlobal;
}


void AttributeGroup::checkRequired(const std::vector<std::string> &present, ValidationContext &ctx) const
{
    std::vector<std::string> missing;
    for (auto &pAttr : m_attributes)
    {
        if (pAttr->isRequired() && std::find(present.begin(), present.end(), pAttr->getName()) == present.end())
            missing.push_back("'" + pAttr->getName() + "'");
    }

    if (!missing.empty())
    {
        std::string reason = (missing.size() == 1) ? "missing required attribute " : "missing required attributes ";
        ctx.reportError(ValidationError(ValidationError::validation, reason + joinStrings(missing, ", "), getDescription()));
    }
}


void AttributeGroup::decodeAttributes(const XmlElement &elem, ValidationContext &ctx, std::vector<std::pair<std::string, Value>> &attributes) const
{
    std::vector<std::string> present;
    for (auto &attr : elem.getAttributes())
    {
        const std::string &name = attr.first;
        std::string ns = getNamespace(name);
        if (ns == XSI_NAMESPACE || ns == XMLNS_NAMESPACE)
            continue;

        PathScope scope(ctx, "@" + getLocalName(name));
        const AttributeDecl *pDecl = findAttribute(name);
        if (pDecl == nullptr)
        {
            bool allowed;
            pDecl = findWildcardDecl(name, ctx, allowed);
            if (!allowed)
            {
                ctx.reportError(ValidationError(ValidationError::validation, "attribute '" + name + "' not allowed", getDescription(), attr.second));
                continue;
            }

            if (pDecl == nullptr)
            {
                attributes.emplace_back(name, Value::makeString(attr.second));
                continue;
            }
        }
        else if (pDecl->getUse() == AttributeDecl::prohibited)
        {
            ctx.reportError(ValidationError(ValidationError::validation, "attribute '" + name + "' is prohibited", getDescription(), attr.second));
            continue;
        }

        present.push_back(pDecl->getName());
        attributes.emplace_back(name, pDecl->decode(attr.second, ctx));
    }

    checkRequired(present, ctx);

    if (ctx.useDefaults())
    {
        for (auto &pAttr : m_attributes)
        {
            if (pAttr->getUse() == AttributeDecl::prohibited || std::find(present.begin(), present.end(), pAttr->getName()) != present.end())
                continue;

            if (pAttr->hasFixed())
                attributes.emplace_back(pAttr->getName(), pAttr->decode(pAttr->getFixed(), ctx));
            else if (pAttr->hasDefault())
                attributes.emplace_back(pAttr->getName(), pAttr->decode(pAttr->getDefault(), ctx));
        }
    }
}


void AttributeGroup::encodeAttributes(const std::vector<std::pair<std::string, Value>> &attributes, ValidationContext &ctx, XmlElement &elem) const
{
    std::vector<std::string> present;
    for (auto &attr : attributes)
    {
        const std::string &name = attr.first;
        if (getNamespace(name) == XSI_NAMESPACE)
        {
            elem.setAttribute(name, attr.second.toLexical());
            continue;
        }

        PathScope scope(ctx, "@" + getLocalName(name));
        const AttributeDecl *pDecl = findAttribute(name, true);
        if (pDecl == nullptr)
        {
            bool allowed;
            pDecl = findWildcardDecl(name, ctx, allowed);
            if (!allowed)
            {
                ctx.reportError(ValidationError(ValidationError::validation, "attribute '" + name + "' not allowed", getDescription(), attr.second.toString()));
                continue;
            }

            if (pDecl == nullptr)
            {
                elem.setAttribute(name, attr.second.toLexical());
                continue;
            }
        }
        else if (pDecl->getUse() == AttributeDecl::prohibited)
        {
            ctx.reportError(ValidationError(ValidationError::validation, "attribute '" + name + "' is prohibited", getDescription(), attr.second.toString()));
            continue;
        }

        present.push_back(pDecl->getName());
        elem.setAttribute(pDecl->getName(), pDecl->encode(attr.second, ctx));
    }

    checkRequired(present, ctx);
}
