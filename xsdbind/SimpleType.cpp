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

#include "SimpleType.hpp"
#include "ValidationContext.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"

using namespace xsdbind;


SimpleType::SimpleType(const std::string &name, varietyType variety) :
    SchemaType(name), m_variety(variety), m_primitive(PrimitiveType::anySimpleKind), m_pItemType(nullptr)
{
}


const char *SimpleType::getVarietyString(varietyType variety)
{
    const char *result = "atomic";
    if (variety == listVariety)
        result = "list";
    else if (variety == unionVariety)
        result = "union";
    return result;
}


std::string SimpleType::getDescription() const
{
    if (m_name.empty())
        return std::string("anonymous ") + getVarietyString(m_variety) + " simpleType";
    return "simpleType '" + m_name + "'";
}


const SimpleType *SimpleType::getRestrictionBase() const
{
    if (m_derivation != restriction || m_pBaseType == nullptr || m_pBaseType == this || !m_pBaseType->isSimple())
        return nullptr;
    const SimpleType *pBase = static_cast<const SimpleType *>(m_pBaseType);
    return (pBase->m_variety == m_variety) ? pBase : nullptr;
}


SchemaFacetSet SimpleType::getEffectiveFacets() const
{
    const SimpleType *pBase = getRestrictionBase();
    if (pBase == nullptr)
        return m_facets;
    return m_facets.merge(pBase->getEffectiveFacets());
}


std::shared_ptr<const SchemaFacet> SimpleType::getEffectiveFacet(SchemaFacet::facetKind kind) const
{
    for (const SimpleType *pType = this; pType != nullptr; pType = pType->getRestrictionBase())
    {
        std::shared_ptr<const SchemaFacet> pFacet = pType->m_facets.getFacet(kind);
        if (pFacet)
            return pFacet;
    }
    return nullptr;
}


PrimitiveType::whiteSpacePolicy SimpleType::getWhiteSpace() const
{
    if (m_variety == listVariety)
        return PrimitiveType::collapse;
    if (m_variety == unionVariety)
        return PrimitiveType::preserve;

    auto pWs = std::dynamic_pointer_cast<const WhiteSpaceFacet>(getEffectiveFacet(SchemaFacet::whiteSpace));
    return pWs ? pWs->getPolicy() : PrimitiveType::getDefaultWhiteSpace(m_primitive);
}


bool SimpleType::isFacetAdmitted(SchemaFacet::facetKind kind, bool xsd11) const
{
    bool admitted = false;
    if (m_variety == atomicVariety)
    {
        admitted = SchemaFacet::isAdmitted(kind, m_primitive, xsd11);
    }
    else if (m_variety == listVariety)
    {
        admitted = kind == SchemaFacet::length || kind == SchemaFacet::minLength || kind == SchemaFacet::maxLength ||
            kind == SchemaFacet::pattern || kind == SchemaFacet::enumeration || kind == SchemaFacet::whiteSpace;
    }
    else
    {
        admitted = kind == SchemaFacet::pattern || kind == SchemaFacet::enumeration;
    }
    return admitted;
}


void SimpleType::checkFacets() const
{
    const SimpleType *pBase = getRestrictionBase();
    if (pBase != nullptr)
        m_facets.checkRestriction(pBase->getEffectiveFacets(), pBase->getWhiteSpace());
    else
        m_facets.checkConsistency();
}


SchemaComponent::validity SimpleType::doCheck(const std::shared_ptr<const BuildToken> &pToken) const
{
    validity result = valid;
    if (m_pBaseType != nullptr && m_pBaseType != this)
        result = combine(result, m_pBaseType->check(pToken));
    if (m_pItemType != nullptr)
        result = combine(result, m_pItemType->check(pToken));
    for (auto pMember : m_memberTypes)
        result = combine(result, pMember->check(pToken));
    return result;
}


std::string SimpleType::normalize(const std::string &text) const
{
    return PrimitiveType::normalize(getWhiteSpace(), text);
}


size_t SimpleType::getValueLength(const Value &value) const
{
    if (m_variety == listVariety)
        return value.isList() ? value.size() : 1;
    return PrimitiveType::getLength(m_variety == atomicVariety ? m_primitive : PrimitiveType::stringKind, value);
}


void SimpleType::checkLexicalFacets(const std::string &text, ValidationContext &ctx) const
{
    Value noValue;
    FacetInput input(text, noValue, 0);
    for (const SimpleType *pType = this; pType != nullptr; pType = pType->getRestrictionBase())
    {
        std::shared_ptr<const SchemaFacet> pPattern = pType->m_facets.getFacet(SchemaFacet::pattern);
        std::string reason;
        if (pPattern && !pPattern->isValueValid(input, reason))
        {
            ctx.reportError(ValidationError(ValidationError::validation, reason, pType->getDescription(), text));
        }
    }
}


void SimpleType::checkValueFacets(const std::string &text, const Value &value, ValidationContext &ctx) const
{
    FacetInput input(text, value, getValueLength(value));
    for (const SimpleType *pType = this; pType != nullptr; pType = pType->getRestrictionBase())
    {
        for (auto &pFacet : pType->m_facets.getFacets())
        {
            if (pFacet->getKind() == SchemaFacet::pattern || pFacet->getKind() == SchemaFacet::whiteSpace)
                continue;

            std::string reason;
            if (!pFacet->isValueValid(input, reason))
            {
                ctx.reportError(ValidationError(ValidationError::validation, reason, pType->getDescription(), text));
            }
        }
    }
}


Value SimpleType::decode(const std::string &text, ValidationContext &ctx) const
{
    Value result;
    switch (m_variety)
    {
        case atomicVariety: result = decodeAtomic(text, ctx); break;
        case listVariety:   result = decodeList(text, ctx);   break;
        case unionVariety:  result = decodeUnion(text, ctx);  break;
    }
    return result;
}


Value SimpleType::decodeAtomic(const std::string &text, ValidationContext &ctx) const
{
    std::string normalized = normalize(text);
    std::string reason;
    Value value;

    if (ctx.isSkip())
    {
        if (!PrimitiveType::decode(m_primitive, normalized, value, reason))
            value = Value::makeString(normalized);
        return value;
    }

    if (!PrimitiveType::decode(m_primitive, normalized, value, reason))
    {
        //
        // The normalized text is the best effort value handed back in lax mode
        ctx.reportError(ValidationError(ValidationError::decode, reason, getDescription(), normalized));
        return Value::makeString(normalized);
    }

    checkLexicalFacets(normalized, ctx);
    checkValueFacets(normalized, value, ctx);
    return value;
}


Value SimpleType::decodeList(const std::string &text, ValidationContext &ctx) const
{
    std::string normalized = collapseWhitespace(text);
    Value list = Value::makeList();
    if (m_pItemType == nullptr)
    {
        ctx.reportError(ValidationError(ValidationError::decode, "list type has no item type", getDescription(), normalized));
        list.append(Value::makeString(normalized));
        return list;
    }

    if (!ctx.isSkip())
        checkLexicalFacets(normalized, ctx);

    for (auto &item : splitWhitespace(normalized))
        list.append(m_pItemType->decode(item, ctx));

    if (!ctx.isSkip())
        checkValueFacets(normalized, list, ctx);
    return list;
}


Value SimpleType::decodeUnion(const std::string &text, ValidationContext &ctx) const
{
    if (!ctx.isSkip())
        checkLexicalFacets(text, ctx);

    //
    // Members are tried in declaration order and the first one that decodes cleanly wins
    std::vector<std::string> tried;
    for (auto pMember : m_memberTypes)
    {
        ErrorCollector collector;
        ValidationContext trialCtx(ctx, &collector);
        Value value = pMember->decode(text, trialCtx);
        if (collector.empty())
        {
            if (!ctx.isSkip())
                checkValueFacets(text, value, ctx);
            return value;
        }
        tried.push_back(pMember->getDescription());
    }

    ctx.reportError(ValidationError(ValidationError::decode, "no type suitable for decoding the text, tried " + joinStrings(tried, ", "), getDescription(), text));
    return Value::makeString(text);
}


std::string SimpleType::encode(const Value &value, ValidationContext &ctx) const
{
    std::string result;
    switch (m_variety)
    {
        case atomicVariety: result = encodeAtomic(value, ctx); break;
        case listVariety:   result = encodeList(value, ctx);   break;
        case unionVariety:  result = encodeUnion(value, ctx);  break;
    }
    return result;
}


std::string SimpleType::encodeAtomic(const Value &value, ValidationContext &ctx) const
{
    std::string text, reason;
    if (!PrimitiveType::encode(m_primitive, value, text, reason))
    {
        if (!ctx.isSkip())
            ctx.reportError(ValidationError(ValidationError::encode, reason, getDescription(), value.toString()));
        return value.toLexical();
    }

    std::string normalized = normalize(text);
    if (ctx.isSkip())
        return normalized;

    Value native;
    if (!PrimitiveType::decode(m_primitive, normalized, native, reason))
    {
        ctx.reportError(ValidationError(ValidationError::encode, reason, getDescription(), value.toString()));
        return normalized;
    }

    checkLexicalFacets(normalized, ctx);
    checkValueFacets(normalized, native, ctx);
    return normalized;
}


std::string SimpleType::encodeList(const Value &value, ValidationContext &ctx) const
{
    if (!value.isList() || m_pItemType == nullptr)
    {
        if (!ctx.isSkip())
            ctx.reportError(ValidationError(ValidationError::encode, "a list value is required", getDescription(), value.toString()));
        return value.toLexical();
    }

    std::vector<std::string> items;
    for (size_t i = 0; i < value.size(); ++i)
        items.push_back(m_pItemType->encode(value.at(i), ctx));

    std::string text = joinStrings(items, " ");
    if (!ctx.isSkip())
    {
        checkLexicalFacets(text, ctx);
        checkValueFacets(text, value, ctx);
    }
    return text;
}


std::string SimpleType::encodeUnion(const Value &value, ValidationContext &ctx) const
{
    std::vector<std::string> tried;
    for (auto pMember : m_memberTypes)
    {
        ErrorCollector collector;
        ValidationContext trialCtx(ctx, &collector);
        std::string text = pMember->encode(value, trialCtx);
        if (collector.empty())
        {
            if (!ctx.isSkip())
            {
                checkLexicalFacets(text, ctx);
                checkValueFacets(text, value, ctx);
            }
            return text;
        }
        tried.push_back(pMember->getDescription());
    }

    if (!ctx.isSkip())
        ctx.reportError(ValidationError(ValidationError::encode, "no type suitable for encoding the value, tried " + joinStrings(tried, ", "), getDescription(), value.toString()));
    return value.toLexical();
}
