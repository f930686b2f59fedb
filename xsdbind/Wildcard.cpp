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


#include "Wildcard.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"

using namespace xsdbind;


Wildcard::Wildcard(const std::string &targetNamespace, bool isAttribute) :
    Particle("", wildcardParticle), m_targetNamespace(targetNamespace), m_constraint(anyNamespace),
    m_processContents(strictContents), m_nsAttr("##any"), m_isAttribute(isAttribute)
{
    m_built = true;
}


std::string Wildcard::getDescription() const
{
    std::string desc = m_isAttribute ? "anyAttribute" : "any";
    return desc + " wildcard (namespace='" + m_nsAttr + "', processContents='" + getProcessContentsString(m_processContents) + "')";
}


void Wildcard::setNamespace(const std::string &nsAttr)
{
    std::string value = collapseWhitespace(nsAttr);
    m_namespaces.clear();
    m_nsAttr = value;

    if (value == "##any")
    {
        m_constraint = anyNamespace;
    }
    else if (value == "##other")
    {
        m_constraint = otherNamespace;
    }
    else
    {
        m_constraint = enumeratedNamespaces;
        for (auto &uri : splitWhitespace(value))
        {
            if (uri == "##targetNamespace")
                m_namespaces.insert(m_targetNamespace);
            else if (uri == "##local")
                m_namespaces.insert("");
            else if (uri == "##any" || uri == "##other")
                throw(ParseException("'" + uri + "' is not allowed inside a namespace list"));
            else
                m_namespaces.insert(uri);
        }
    }
}


bool Wildcard::isNamespaceAllowed(const std::string &uri) const
{
    bool allowed = true;
    if (m_constraint == otherNamespace)
        allowed = !uri.empty() && uri != m_targetNamespace;
    else if (m_constraint == enumeratedNamespaces)
        allowed = m_namespaces.find(uri) != m_namespaces.end();
    return allowed;
}


bool Wildcard::isNameAllowed(const std::string &qname) const
{
    return isNamespaceAllowed(getNamespace(qname));
}


Wildcard::processContentsType Wildcard::getProcessContentsFromString(const std::string &value)
{
    processContentsType result;
    if (value == "skip")         result = skipContents;
    else if (value == "lax")     result = laxContents;
    else if (value == "strict")  result = strictContents;
    else
        throw(ParseException("Invalid processContents value '" + value + "'"));
    return result;
}


const char *Wildcard::getProcessContentsString(processContentsType processContents)
{
    const char *result = "strict";
    if (processContents == skipContents)
        result = "skip";
    else if (processContents == laxContents)
        result = "lax";
    return result;
}
