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


#include "ElementDecl.hpp"
#include "SimpleType.hpp"
#include "ComplexType.hpp"
#include "SchemaRegistry.hpp"
#include "ValidationContext.hpp"
#include "XmlElement.hpp"
#include "Converter.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"

using namespace xsdbind;


ElementDecl::ElementDecl(const std::string &name) :
    Particle(name, elementParticle), m_pRef(nullptr), m_pType(nullptr), m_nillable(false), m_abstract(false),
    m_hasDefault(false), m_hasFixed(false)
{
}


std::string ElementDecl::getDescription() const
{
    std::string desc;
    if (isRef())
        desc = "element reference to '" + m_refName + "'";
    else if (m_name.empty())
        desc = "any element";
    else
        desc = "element '" + m_name + "'";
    return desc;
}


void ElementDecl::setLocalType(const std::shared_ptr<SchemaType> &pType)
{
    m_pLocalType = pType;
    m_pType = pType.get();
}


void ElementDecl::setDefault(const std::string &value)
{
    if (m_hasFixed)
        throw(ParseException("'default' and 'fixed' attributes are mutually exclusive"));
    m_hasDefault = true;
    m_default = value;
}


void ElementDecl::setFixed(const std::string &value)
{
    if (m_hasDefault)
        throw(ParseException("'default' and 'fixed' attributes are mutually exclusive"));
    m_hasFixed = true;
    m_fixed = value;
}


SchemaComponent::validity ElementDecl::doCheck(const std::shared_ptr<const BuildToken> &pToken) const
{
    validity result = valid;
    if (m_pRef != nullptr)
        result = combine(result, m_pRef->check(pToken));
    if (m_pType != nullptr)
        result = combine(result, m_pType->check(pToken));
    return result;
}


const SchemaType *ElementDecl::getEffectiveType(const ValidationContext &ctx) const
{
    const SchemaType *pType = getType();
    return (pType != nullptr) ? pType : ctx.getRegistry().getAnyType();
}


Value ElementDecl::decode(const XmlElement &elem, ValidationContext &ctx, unsigned level) const
{
    const SchemaType *pType = getEffectiveType(ctx);
    if (pType == nullptr)
    {
        ctx.reportError(ValidationError(ValidationError::validation, "no type available for the element", getDescription(), elem.getTag()));
        return Value();
    }

    InstanceNamespaceScope nsScope(ctx, elem.getNamespaceMap());
    ElementData data;
    data.tag = elem.getTag();
    pType = decodeXsiType(elem, pType, ctx, data);
    bool isNil = decodeNil(elem, ctx);

    if (pType->isComplex())
    {
        static_cast<const ComplexType *>(pType)->getAttributeGroup().decodeAttributes(elem, ctx, data.attributes);
    }
    else
    {
        for (auto &attr : elem.getAttributes())
        {
            std::string ns = getNamespace(attr.first);
            if (ns != XSI_NAMESPACE && ns != XMLNS_NAMESPACE)
            {
                ctx.reportError(ValidationError(ValidationError::validation, "attribute '" + attr.first + "' not allowed, the element has a simple type",
                    getDescription(), attr.second));
            }
        }
    }

    if (!isNil)
    {
        const SimpleType *pSimple = pType->getContentSimpleType();
        if (pSimple != nullptr)
        {
            if (elem.getNumChildren() != 0)
            {
                ctx.reportError(ValidationError(ValidationError::validation, "a simple content element can't have child elements", getDescription()));
            }

            std::string text = elem.getText();
            if (text.empty() && ctx.useDefaults())
            {
                if (hasFixed())
                    text = getFixed();
                else if (hasDefault())
                    text = getDefault();
            }

            data.text = pSimple->decode(text, ctx);
            if (hasFixed() && !ctx.isSkip())
                checkFixed(text, data.text, *pType, ctx);
        }
        else
        {
            static_cast<const ComplexType *>(pType)->decodeContent(elem, ctx, data, level);
        }
    }

    return ctx.getConverter().elementDecode(data, *this, *pType, level);
}


bool ElementDecl::decodeNil(const XmlElement &elem, ValidationContext &ctx) const
{
    std::string nilText;
    if (!elem.getAttribute(makeQName(XSI_NAMESPACE, "nil"), nilText))
        return false;

    std::string nil = collapseWhitespace(nilText);
    if (nil != "true" && nil != "1")
    {
        if (nil != "false" && nil != "0")
            ctx.reportError(ValidationError(ValidationError::decode, "invalid boolean value for xsi:nil", getDescription(), nilText));
        return false;
    }

    if (!isNillable())
    {
        ctx.reportError(ValidationError(ValidationError::validation, "xsi:nil attribute on an element that is not nillable", getDescription(), nilText));
        return false;
    }

    if (!isAllWhitespace(elem.getText()) || elem.getNumChildren() != 0)
        ctx.reportError(ValidationError(ValidationError::validation, "xsi:nil='true' but the element has content", getDescription()));
    if (hasFixed())
        ctx.reportError(ValidationError(ValidationError::validation, "xsi:nil='true' is not allowed on an element with a fixed value", getDescription()));
    return true;
}


const SchemaType *ElementDecl::getInstanceType(const std::string &qname, const std::string &typeName, const SchemaType *pDeclared,
    ValidationContext &ctx, ValidationError::errorKind kind) const
{
    const SchemaType *pType = ctx.getRegistry().getType(qname);
    if (pType == nullptr)
    {
        ctx.reportError(ValidationError(kind, "unknown xsi:type '" + typeName + "'", getDescription(), typeName));
        return pDeclared;
    }

    bool derived = pType->isDerivedFrom(pDeclared);

    //
    // A member of a union without facets of its own may stand in for the union
    if (!derived && pDeclared->isSimple())
    {
        const SimpleType *pUnion = static_cast<const SimpleType *>(pDeclared);
        if (pUnion->getVariety() == SimpleType::unionVariety && pUnion->getFacets().empty())
        {
            for (auto pMember : pUnion->getMemberTypes())
            {
                if (pType->isDerivedFrom(pMember))
                    derived = true;
            }
        }
    }

    if (!derived)
    {
        ctx.reportError(ValidationError(kind, "xsi:type '" + typeName + "' is not derived from the element type", getDescription(), typeName));
        return pDeclared;
    }

    if (pType->isComplex() && static_cast<const ComplexType *>(pType)->isAbstract())
    {
        ctx.reportError(ValidationError(kind, "xsi:type '" + typeName + "' is abstract", getDescription(), typeName));
        return pDeclared;
    }
    return pType;
}


const SchemaType *ElementDecl::decodeXsiType(const XmlElement &elem, const SchemaType *pDeclared, ValidationContext &ctx, ElementData &data) const
{
    std::string typeText;
    std::string attrName = makeQName(XSI_NAMESPACE, "type");
    if (!elem.getAttribute(attrName, typeText))
        return pDeclared;

    //
    // Kept so the value encodes back with the same type
    data.attributes.emplace_back(attrName, Value::makeString(typeText));

    std::string typeName = collapseWhitespace(typeText);
    std::string qname = typeName;
    if (typeName.empty() || typeName[0] != '{')
    {
        std::string prefix, localName, uri;
        splitPrefixedName(typeName, prefix, localName);
        if (!ctx.resolvePrefix(prefix, uri))
        {
            ctx.reportError(ValidationError(ValidationError::validation, "unknown namespace prefix in xsi:type '" + typeName + "'", getDescription(), typeText));
            return pDeclared;
        }
        qname = makeQName(uri, localName);
    }

    return getInstanceType(qname, typeName, pDeclared, ctx, ValidationError::validation);
}


void ElementDecl::checkFixed(const std::string &text, const Value &value, const SchemaType &type, ValidationContext &ctx) const
{
    const SimpleType *pSimple = type.getContentSimpleType();
    ErrorCollector collector;
    ValidationContext trialCtx(ctx, &collector);
    Value fixedValue = pSimple->decode(getFixed(), trialCtx);

    bool matches = collector.empty() ? (value == fixedValue) : (pSimple->normalize(text) == pSimple->normalize(getFixed()));
    if (!matches)
    {
        ctx.reportError(ValidationError(ValidationError::validation, "value must be equal to the fixed value '" + getFixed() + "'", getDescription(), text));
    }
}


const SchemaType *ElementDecl::encodeXsiType(const ElementData &data, const SchemaType *pDeclared, ValidationContext &ctx, XmlElement &elem) const
{
    std::string attrName = makeQName(XSI_NAMESPACE, "type");
    for (auto &attr : data.attributes)
    {
        if (attr.first != attrName)
            continue;

        std::string typeName = collapseWhitespace(attr.second.toLexical());
        std::string qname = typeName;
        if (typeName.empty() || typeName[0] != '{')
        {
            //
            // Prefixes come from the converter's namespace map when encoding
            std::string prefix, localName;
            splitPrefixedName(typeName, prefix, localName);
            const std::map<std::string, std::string> &namespaces = ctx.getConverter().getOptions().namespaces;
            auto nsIt = namespaces.find(prefix);
            if (nsIt != namespaces.end())
            {
                //
                // Declared on the element so the attribute value resolves the same way when read back
                qname = makeQName(nsIt->second, localName);
                if (!prefix.empty())
                    elem.addNamespace(prefix, nsIt->second);
            }
            else if (!prefix.empty())
            {
                ctx.reportError(ValidationError(ValidationError::encode, "unknown namespace prefix in xsi:type '" + typeName + "'", getDescription(), typeName));
                return pDeclared;
            }
            else
            {
                qname = localName;
            }
        }
        return getInstanceType(qname, typeName, pDeclared, ctx, ValidationError::encode);
    }
    return pDeclared;
}


std::shared_ptr<XmlElement> ElementDecl::encode(const Value &value, ValidationContext &ctx, unsigned level, const std::string &tag) const
{
    std::shared_ptr<XmlElement> pElem = std::make_shared<XmlElement>(tag.empty() ? getTarget()->getName() : tag);
    const SchemaType *pType = getEffectiveType(ctx);
    if (pType == nullptr)
    {
        ctx.reportError(ValidationError(ValidationError::encode, "no type available for the element", getDescription(), value.toString()));
        return pElem;
    }

    const SimpleType *pSimple = pType->getContentSimpleType();

    //
    // A null value for a nillable element that needs content is written as xsi:nil
    if (value.isNull() && isNillable())
    {
        const ModelGroup *pGroup = pType->isComplex() ? static_cast<const ComplexType *>(pType)->getContentGroup() : nullptr;
        if (pSimple != nullptr || (pGroup != nullptr && !pGroup->isEmptiable()))
        {
            pElem->setAttribute(makeQName(XSI_NAMESPACE, "nil"), "true");
            return pElem;
        }
    }

    ElementData data;
    try
    {
        data = ctx.getConverter().elementEncode(value, *this, *pType, level);

        //
        // An xsi:type attribute in the value selects the type the rest of the element is encoded with
        const SchemaType *pInstanceType = encodeXsiType(data, pType, ctx, *pElem);
        if (pInstanceType != pType)
        {
            pType = pInstanceType;
            pSimple = pType->getContentSimpleType();
            data = ctx.getConverter().elementEncode(value, *this, *pType, level);
        }
    }
    catch (ValueException &e)
    {
        ctx.reportError(ValidationError(ValidationError::encode, e.what(), getDescription(), value.toString()));
        return pElem;
    }

    if (pType->isComplex())
    {
        static_cast<const ComplexType *>(pType)->getAttributeGroup().encodeAttributes(data.attributes, ctx, *pElem);
    }
    else
    {
        for (auto &attr : data.attributes)
        {
            if (getNamespace(attr.first) == XSI_NAMESPACE)
                pElem->setAttribute(attr.first, attr.second.toLexical());
            else
                ctx.reportError(ValidationError(ValidationError::encode, "attribute '" + attr.first + "' not allowed, the element has a simple type", getDescription(), value.toString()));
        }
    }

    if (pSimple != nullptr)
    {
        if (!data.content.empty())
        {
            ctx.reportError(ValidationError(ValidationError::encode, "a simple content element can't have child elements", getDescription(), value.toString()));
        }

        if (data.text.isNull())
        {
            if (hasFixed())
            {
                pElem->setText(getFixed());
            }
            else if (!hasDefault() && !ctx.isSkip())
            {
                ErrorCollector collector;
                ValidationContext trialCtx(ctx, &collector);
                pSimple->decode("", trialCtx);
                if (!collector.empty())
                {
                    ctx.reportError(ValidationError(ValidationError::encode, "an empty value is not valid for " + pSimple->getDescription(), getDescription()));
                }
            }
        }
        else
        {
            std::string text = pSimple->encode(data.text, ctx);
            if (hasFixed() && !ctx.isSkip())
                checkFixed(text, data.text, *pType, ctx);
            pElem->setText(text);
        }
    }
    else
    {
        static_cast<const ComplexType *>(pType)->encodeContent(data, ctx, *pElem, level);
    }
    return pElem;
}
