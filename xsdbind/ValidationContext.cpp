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

#include "ValidationContext.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"

using namespace xsdbind;


ValidationContext::ValidationContext(const SchemaRegistry &registry, validationMode mode, IErrorVisitor *pVisitor, const IConverter &converter, bool useDefaults) :
    m_registry(registry), m_mode(mode), m_pVisitor(pVisitor), m_converter(converter), m_useDefaults(useDefaults), m_unordered(false), m_numErrors(0)
{
}


ValidationContext::ValidationContext(const ValidationContext &parent, IErrorVisitor *pVisitor, validationMode mode) :
    m_registry(parent.m_registry), m_mode(mode), m_pVisitor(pVisitor), m_converter(parent.m_converter),
    m_useDefaults(parent.m_useDefaults), m_unordered(parent.m_unordered), m_numErrors(0), m_path(parent.m_path),
    m_namespaces(parent.m_namespaces)
{
}


void ValidationContext::reportError(ValidationError error)
{
    if (m_mode == skip)
        return;

    if (error.path.empty())
        error.path = getPath();
    ++m_numErrors;

    if (m_mode == strict)
    {
        if (error.kind == ValidationError::decode)
            throw(DecodeException(error));
        else if (error.kind == ValidationError::encode)
            throw(EncodeException(error));
        throw(ValidationException(error));
    }

    if (m_pVisitor != nullptr)
        m_pVisitor->visitError(error);
}


std::string ValidationContext::getPath() const
{
    std::string path;
    for (auto &step : m_path)
        path += "/" + step;
    return path.empty() ? "/" : path;
}


bool ValidationContext::resolvePrefix(const std::string &prefix, std::string &uri) const
{
    if (prefix == "xml")
    {
        uri = XML_NAMESPACE;
        return true;
    }

    for (auto it = m_namespaces.rbegin(); it != m_namespaces.rend(); ++it)
    {
        auto nsIt = (*it)->find(prefix);
        if (nsIt != (*it)->end())
        {
            uri = nsIt->second;
            return true;
        }
    }

    //
    // No default namespace in scope means no namespace
    if (prefix.empty())
    {
        uri.clear();
        return true;
    }
    return false;
}


const char *ValidationContext::getModeString(validationMode mode)
{
    const char *result = "strict";
    if (mode == lax)
        result = "lax";
    else if (mode == skip)
        result = "skip";
    return result;
}


ValidationContext::validationMode ValidationContext::getModeFromString(const std::string &mode)
{
    validationMode result;
    if (mode == "strict")     result = strict;
    else if (mode == "lax")   result = lax;
    else if (mode == "skip")  result = skip;
    else
        throw(ValueException("Invalid validation mode '" + mode + "', expected strict, lax or skip"));
    return result;
}
