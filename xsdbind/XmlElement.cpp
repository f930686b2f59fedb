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

#include "XmlElement.hpp"
#include "Utils.hpp"

using namespace xsdbind;


bool XmlElement::getAttribute(const std::string &name, std::string &value) const
{
    auto attrIt = m_attributes.find(name);
    if (attrIt == m_attributes.end())
        return false;
    value = attrIt->second;
    return true;
}


std::shared_ptr<XmlElement> XmlElement::addChild(const std::string &tag)
{
    std::shared_ptr<XmlElement> pChild = std::make_shared<XmlElement>(tag);
    m_children.push_back(pChild);
    return pChild;
}


static bool isSameText(const std::string &left, const std::string &right, bool ignoreWhitespace)
{
    if (!ignoreWhitespace)
        return left == right;
    return trimWhitespace(left) == trimWhitespace(right);
}


bool XmlElement::isEquivalent(const XmlElement &other, bool ignoreWhitespace, std::string *pDiff) const
{
    std::string diff;
    if (m_tag != other.m_tag)
    {
        diff = "tag '" + m_tag + "' differs from '" + other.m_tag + "'";
    }
    else if (m_attributes != other.m_attributes)
    {
        diff = "attributes of '" + m_tag + "' differ";
    }
    else if (!isSameText(m_text, other.m_text, ignoreWhitespace))
    {
        diff = "text of '" + m_tag + "' differs ('" + m_text + "' vs '" + other.m_text + "')";
    }
    else if (!isSameText(m_tail, other.m_tail, ignoreWhitespace))
    {
        diff = "tail of '" + m_tag + "' differs";
    }
    else if (m_children.size() != other.m_children.size())
    {
        diff = "'" + m_tag + "' has " + std::to_string(m_children.size()) + " children, other has " + std::to_string(other.m_children.size());
    }
    else
    {
        for (size_t i = 0; i < m_children.size(); ++i)
        {
            if (!m_children[i]->isEquivalent(*other.m_children[i], ignoreWhitespace, pDiff))
                return false;
        }
    }

    if (!diff.empty() && pDiff != nullptr)
        *pDiff = diff;
    return diff.empty();
}
