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


#include "XMLSchema.hpp"
#include "XSDSchemaParser.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

using namespace xsdbind;


bool XMLSchema::loadSchema(const std::string &filename, const std::map<std::string, std::string> &params)
{
    std::shared_ptr<SchemaRegistry> pRegistry = std::make_shared<SchemaRegistry>();
    XSDSchemaParser parser(pRegistry);
    bool rc = parser.parse(filename, params);
    return finishLoad(parser, pRegistry, rc);
}


bool XMLSchema::loadSchema(std::istream &in, const std::map<std::string, std::string> &params)
{
    std::shared_ptr<SchemaRegistry> pRegistry = std::make_shared<SchemaRegistry>();
    XSDSchemaParser parser(pRegistry);
    bool rc = parser.parse(in, params);
    return finishLoad(parser, pRegistry, rc);
}


bool XMLSchema::finishLoad(const SchemaParser &parser, const std::shared_ptr<SchemaRegistry> &pRegistry, bool rc)
{
    m_buildStatus = parser.getStatus();
    m_message = parser.getLastMessage();
    if (rc)
    {
        m_pRegistry = pRegistry;
    }
    else
    {
        m_pRegistry = nullptr;
        getLogger()->error("{}", m_message);
    }
    return rc;
}


const SchemaRegistry &XMLSchema::getRegistry() const
{
    if (!m_pRegistry)
    {
        throw(ValueException("No schema is loaded"));
    }
    return *m_pRegistry;
}


SchemaComponent::validity XMLSchema::getValidity() const
{
    return m_pRegistry ? m_pRegistry->getValidity() : SchemaComponent::notKnown;
}


const ElementDecl *XMLSchema::getElement(const std::string &name) const
{
    return getRegistry().getElement(name);
}


const SchemaType *XMLSchema::getType(const std::string &name) const
{
    return getRegistry().getType(name);
}


bool XMLSchema::isValid(const XmlElement &root) const
{
    return getErrors(root).empty();
}


void XMLSchema::validate(const XmlElement &root) const
{
    DefaultConverter converter;
    ValidationContext ctx(getRegistry(), ValidationContext::strict, nullptr, converter);
    doDecode(root, ctx);
}


void XMLSchema::iterErrors(const XmlElement &root, IErrorVisitor &visitor) const
{
    DefaultConverter converter;
    ValidationContext ctx(getRegistry(), ValidationContext::lax, &visitor, converter);
    doDecode(root, ctx);
}


std::vector<ValidationError> XMLSchema::getErrors(const XmlElement &root) const
{
    ErrorCollector collector;
    iterErrors(root, collector);
    return collector.getErrors();
}


Value XMLSchema::decode(const XmlElement &root, ValidationContext::validationMode mode, const ConverterOptions &options, std::vector<ValidationError> *pErrors) const
{
    DefaultConverter converter(options);
    ErrorCollector collector;
    ValidationContext ctx(getRegistry(), mode, &collector, converter, options.useDefaults);
    Value result = doDecode(root, ctx);
    if (pErrors != nullptr)
        pErrors->insert(pErrors->end(), collector.getErrors().begin(), collector.getErrors().end());
    return result;
}


std::shared_ptr<XmlElement> XMLSchema::encode(const Value &value, const std::string &elementName, ValidationContext::validationMode mode,
    const ConverterOptions &options, std::vector<ValidationError> *pErrors, bool unordered) const
{
    DefaultConverter converter(options);
    ErrorCollector collector;
    ValidationContext ctx(getRegistry(), mode, &collector, converter, options.useDefaults);
    ctx.setUnordered(unordered);

    std::string qname = converter.unmapQName(elementName);
    const ElementDecl *pDecl = findRootDecl(qname, ctx, true);
    std::shared_ptr<XmlElement> pRoot;
    {
        PathScope scope(ctx, getLocalName(qname));
        pRoot = pDecl->encode(value, ctx, 0, qname);
    }

    if (pErrors != nullptr)
        pErrors->insert(pErrors->end(), collector.getErrors().begin(), collector.getErrors().end());
    getLogger()->debug("Encoded '{}' in {} mode with {} error(s)", elementName, ValidationContext::getModeString(mode), collector.getNumErrors());
    return pRoot;
}


void XMLSchema::saveDocument(std::ostream &out, const XmlElement &root, const std::map<std::string, std::string> &namespaces, bool pretty) const
{
    m_loader.save(out, root, namespaces, pretty);
}


Value XMLSchema::doDecode(const XmlElement &root, ValidationContext &ctx) const
{
    const ElementDecl *pDecl = findRootDecl(root.getTag(), ctx, false);
    Value result;
    {
        PathScope scope(ctx, getLocalName(root.getTag()));
        result = pDecl->decode(root, ctx);
    }
    getLogger()->debug("Decoded '{}' in {} mode with {} error(s)", root.getTag(), ValidationContext::getModeString(ctx.getMode()), ctx.getNumErrors());
    return result;
}


const ElementDecl *XMLSchema::findRootDecl(const std::string &name, ValidationContext &ctx, bool isEncode) const
{
    const SchemaRegistry &registry = getRegistry();
    const ElementDecl *pDecl = registry.getElement(name);
    if (pDecl == nullptr)
    {
        //
        // Lax and skip carry on with an element of anyType
        ValidationError error(isEncode ? ValidationError::encode : ValidationError::validation, "'" + name + "' is not an element of the schema", "schema", name);
        error.path = "/" + getLocalName(name);
        ctx.reportError(error);
        pDecl = registry.getAnyElement();
    }
    else if (pDecl->isAbstract())
    {
        ValidationError error(ValidationError::validation, "element '" + name + "' is abstract", pDecl->getDescription(), name);
        error.path = "/" + getLocalName(name);
        ctx.reportError(error);
    }
    return pDecl;
}
