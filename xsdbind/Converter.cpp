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


#include <cctype>
#include "Converter.hpp"
#include "ComplexType.hpp"
#include "SimpleType.hpp"
#include "ElementDecl.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"

using namespace xsdbind;


void ConverterOptions::check() const
{
    auto checkKey = [](const std::string &option, const std::string &key)
    {
        for (auto c : key)
        {
            if (isalpha(static_cast<unsigned char>(c)) || c == '_')
                throw(ValueException("Invalid " + option + " '" + key + "', letters and underscores are not allowed"));
        }
    };

    if (useAttrPrefix)
        checkKey("attribute prefix", attrPrefix);
    checkKey("text key", textKey);
    if (useCDataPrefix)
        checkKey("cdata prefix", cdataPrefix);
    if (textKey.empty())
        throw(ValueException("The text key can't be empty"));
}


DefaultConverter::DefaultConverter()
{
}


DefaultConverter::DefaultConverter(const ConverterOptions &options) : m_options(options)
{
    m_options.check();
}


std::string DefaultConverter::mapQName(const std::string &qname) const
{
    std::string ns = getNamespace(qname);
    if (ns.empty())
        return qname;

    for (auto &nsIt : m_options.namespaces)
    {
        if (nsIt.second == ns)
            return nsIt.first.empty() ? getLocalName(qname) : nsIt.first + ":" + getLocalName(qname);
    }
    return qname;
}


std::string DefaultConverter::unmapQName(const std::string &name) const
{
    if (!name.empty() && name[0] == '{')
        return name;

    std::string prefix, localName;
    splitPrefixedName(name, prefix, localName);
    auto nsIt = m_options.namespaces.find(prefix);
    if (nsIt == m_options.namespaces.end())
        return name;
    return makeQName(nsIt->second, localName);
}


void DefaultConverter::finishMap(Value &map) const
{
    if (m_options.order == ConverterOptions::sortedKeys)
        map.sortKeys();
}


bool DefaultConverter::isCDataKey(const std::string &key, unsigned &index) const
{
    if (!m_options.useCDataPrefix || key.size() <= m_options.cdataPrefix.size() || key.compare(0, m_options.cdataPrefix.size(), m_options.cdataPrefix) != 0)
        return false;

    std::string digits = key.substr(m_options.cdataPrefix.size());
    for (auto c : digits)
    {
        if (!isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    index = static_cast<unsigned>(std::stoul(digits));
    return index != 0;
}


Value DefaultConverter::elementDecode(const ElementData &data, const ElementDecl &decl, const SchemaType &type, unsigned level) const
{
    Value result = Value::makeMap();
    if (m_options.useAttrPrefix)
    {
        for (auto &attr : data.attributes)
            result.set(m_options.attrPrefix + mapQName(attr.first), attr.second);
    }

    const ModelGroup *pGroup = type.isComplex() ? static_cast<const ComplexType &>(type).getContentGroup() : nullptr;
    if (pGroup == nullptr || data.content.empty())
    {
        //
        // Plain value unless there are attributes to keep beside it
        if (result.empty())
            return data.text;
        if (!data.text.isNull())
            result.set(m_options.textKey, data.text);
    }
    else
    {
        for (auto &item : data.content)
        {
            if (item.isCData())
            {
                if (m_options.useCDataPrefix)
                    result.set(m_options.cdataPrefix + std::to_string(item.cdataIndex), item.value);
                continue;
            }

            std::string key = mapQName(item.name);
            Value *pExisting = result.find(key);
            if (pExisting == nullptr)
            {
                if (item.pDecl == nullptr || item.single)
                {
                    result.set(key, item.value);
                }
                else
                {
                    Value list = Value::makeList();
                    list.append(item.value);
                    result.set(key, list);
                }
            }
            else if (!pExisting->isList() || pExisting->empty())
            {
                Value list = Value::makeList();
                list.append(*pExisting);
                list.append(item.value);
                result.set(key, list);
            }
            else if (pExisting->at(0).isList() || !item.value.isList())
            {
                pExisting->append(item.value);
            }
            else
            {
                Value list = Value::makeList();
                list.append(*pExisting);
                list.append(item.value);
                result.set(key, list);
            }
        }
    }

    if (result.empty())
        return Value();
    finishMap(result);
    return result;
}


ElementData DefaultConverter::elementEncode(const Value &obj, const ElementDecl &decl, const SchemaType &type, unsigned level) const
{
    ElementData data;
    data.tag = decl.getTarget()->getName();
    const ComplexType *pComplex = type.isComplex() ? static_cast<const ComplexType *>(&type) : nullptr;

    if (!obj.isMap())
    {
        if (type.hasSimpleContent())
            data.text = obj;
        else if (pComplex != nullptr && pComplex->isMixed() && obj.isString())
            data.content.emplace_back(1, obj);
        else if (!obj.isNull())
            throw(ValueException(std::string("A map is required to encode an element with complex content, got a ") + Value::getTypeName(obj.getType())));
        return data;
    }

    const std::string &attrPrefix = m_options.attrPrefix;
    for (size_t i = 0; i < obj.size(); ++i)
    {
        const std::string &key = obj.keyAt(i);
        const Value &value = obj.at(i);
        unsigned cdataIndex = 0;

        if (key == m_options.textKey)
        {
            data.text = value;
        }
        else if (isCDataKey(key, cdataIndex))
        {
            data.content.emplace_back(cdataIndex, value);
        }
        else if (m_options.useAttrPrefix && !attrPrefix.empty() && key.size() > attrPrefix.size() && key.compare(0, attrPrefix.size(), attrPrefix) == 0)
        {
            data.attributes.emplace_back(unmapQName(key.substr(attrPrefix.size())), value);
        }
        else if (m_options.useAttrPrefix && attrPrefix.empty() && pComplex != nullptr && pComplex->getAttributeGroup().findAttribute(unmapQName(key), true) != nullptr)
        {
            data.attributes.emplace_back(unmapQName(key), value);
        }
        else
        {
            std::string name = unmapQName(key);
            if (!value.isList() || value.empty())
            {
                data.content.emplace_back(name, value, nullptr, true);
            }
            else if (value.at(0).isList() || value.at(0).isMap())
            {
                for (size_t j = 0; j < value.size(); ++j)
                    data.content.emplace_back(name, value.at(j), nullptr, false);
            }
            else
            {
                //
                // A list of scalars is one value for a child of list type, else one child per item
                const ElementDecl *pChild = (pComplex != nullptr) ? pComplex->findChildDecl(name, true) : nullptr;
                const SchemaType *pChildType = (pChild != nullptr) ? pChild->getType() : nullptr;
                const SimpleType *pSimple = (pChildType != nullptr) ? pChildType->getContentSimpleType() : nullptr;
                if (pSimple != nullptr && pSimple->getVariety() == SimpleType::listVariety)
                {
                    data.content.emplace_back(name, value, pChild, true);
                }
                else
                {
                    for (size_t j = 0; j < value.size(); ++j)
                        data.content.emplace_back(name, value.at(j), pChild, false);
                }
            }
        }
    }
    return data;
}
