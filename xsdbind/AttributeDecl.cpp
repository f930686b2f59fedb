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


#include "AttributeDecl.hpp"
#include "SimpleType.hpp"
#include "SchemaRegistry.hpp"
#include "ValidationContext.hpp"
#include "Exceptions.hpp"

using namespace xsdbind;


AttributeDecl::AttributeDecl(const std::string &name) :
    SchemaComponent(name), m_pRef(nullptr), m_pType(nullptr), m_use(optional), m_hasDefault(false), m_hasFixed(false)
{
}


std::string AttributeDecl::getDescription() const
{
    if (isRef())
        return "attribute reference to '" + m_refName + "'";
    return "attribute '" + m_name + "'";
}


void AttributeDecl::setLocalType(const std::shared_ptr<SimpleType> &pType)
{
    m_pLocalType = pType;
    m_pType = pType.get();
}


AttributeDecl::useType AttributeDecl::getUseFromString(const std::string &use)
{
    useType result;
    if (use == "optional")         result = optional;
    else if (use == "required")    result = required;
    else if (use == "prohibited")  result = prohibited;
    else
        throw(ParseException("Invalid attribute use '" + use + "'"));
    return result;
}


void AttributeDecl::setDefault(const std::string &value)
{
    if (m_hasFixed)
        throw(ParseException("'default' and 'fixed' attributes are mutually exclusive"));
    m_hasDefault = true;
    m_default = value;
}


void AttributeDecl::setFixed(const std::string &value)
{
    if (m_hasDefault)
        throw(ParseException("'default' and 'fixed' attributes are mutually exclusive"));
    m_hasFixed = true;
    m_fixed = value;
}


SchemaComponent::validity AttributeDecl::doCheck(const std::shared_ptr<const BuildToken> &pToken) const
{
    validity result = valid;
    if (m_pRef != nullptr)
        result = combine(result, m_pRef->check(pToken));
    if (m_pType != nullptr)
        result = combine(result, m_pType->check(pToken));
    return result;
}


Value AttributeDecl::decode(const std::string &text, ValidationContext &ctx) const
{
    const SimpleType *pType = getType();
    if (pType == nullptr)
        pType = ctx.getRegistry().getAnySimpleType();
    if (pType == nullptr)
        return Value::makeString(text);

    Value value = pType->decode(text, ctx);
    if (hasFixed() && !ctx.isSkip())
        checkFixed(value, ctx);
    return value;
}


std::string AttributeDecl::encode(const Value &value, ValidationContext &ctx) const
{
    const SimpleType *pType = getType();
    if (pType == nullptr)
        pType = ctx.getRegistry().getAnySimpleType();
    if (pType == nullptr)
        return value.toLexical();

    std::string text = pType->encode(value, ctx);
    if (hasFixed() && !ctx.isSkip())
        checkFixed(value, ctx);
    return text;
}


void AttributeDecl::checkFixed(const Value &value, ValidationContext &ctx) const
{
    const SimpleType *pType = getType();
    if (pType == nullptr)
        return;

    ErrorCollector collector;
    ValidationContext trialCtx(ctx, &collector);
    Value fixedValue = pType->decode(getFixed(), trialCtx);
    if (value != fixedValue)
    {
        ctx.reportError(ValidationError(ValidationError::validation, "value must be equal to the fixed value '" + getFixed() + "'", getDescription(), value.toLexical()));
    }
}
