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

#include <vector>
#include <string>
#include "Utils.hpp"

namespace xsdbind
{

const char *XSD_NAMESPACE = "http://www.w3.org/2001/XMLSchema";
const char *XSI_NAMESPACE = "http://www.w3.org/2001/XMLSchema-instance";
const char *XML_NAMESPACE = "http://www.w3.org/XML/1998/namespace";
const char *XMLNS_NAMESPACE = "http://www.w3.org/2000/xmlns/";


std::vector<std::string> splitWhitespace(const std::string &input)
{
    std::vector<std::string> list;
    std::string item;
    for (char c : input)
    {
        if (isXmlWhitespace(c))
        {
            if (!item.empty())
            {
                list.push_back(item);
                item.clear();
            }
        }
        else
        {
            item += c;
        }
    }
    if (!item.empty())
        list.push_back(item);
    return list;
}


std::string joinStrings(const std::vector<std::string> &items, const std::string &delim)
{
    std::string result;
    for (auto it = items.begin(); it != items.end(); ++it)
    {
        if (it != items.begin())
            result += delim;
        result += *it;
    }
    return result;
}


bool isXmlWhitespace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}


bool isAllWhitespace(const std::string &text)
{
    for (char c : text)
    {
        if (!isXmlWhitespace(c))
            return false;
    }
    return true;
}


std::string replaceWhitespace(const std::string &text)
{
    std::string result(text);
    for (auto &c : result)
    {
        if (isXmlWhitespace(c))
            c = ' ';
    }
    return result;
}


std::string collapseWhitespace(const std::string &text)
{
    return joinStrings(splitWhitespace(text), " ");
}


std::string trimWhitespace(const std::string &text)
{
    size_t start = 0, end = text.length();
    while (start < end && isXmlWhitespace(text[start]))
        ++start;
    while (end > start && isXmlWhitespace(text[end - 1]))
        --end;
    return text.substr(start, end - start);
}


std::string makeQName(const std::string &uri, const std::string &localName)
{
    return uri.empty() ? localName : "{" + uri + "}" + localName;
}


std::string getLocalName(const std::string &qname)
{
    if (!qname.empty() && qname[0] == '{')
    {
        size_t pos = qname.find('}');
        if (pos != std::string::npos)
            return qname.substr(pos + 1);
    }
    return qname;
}


std::string getNamespace(const std::string &qname)
{
    if (!qname.empty() && qname[0] == '{')
    {
        size_t pos = qname.find('}');
        if (pos != std::string::npos)
            return qname.substr(1, pos - 1);
    }
    return "";
}


void splitPrefixedName(const std::string &name, std::string &prefix, std::string &localName)
{
    size_t pos = name.find(':');
    if (pos == std::string::npos)
    {
        prefix.clear();
        localName = name;
    }
    else
    {
        prefix = name.substr(0, pos);
        localName = name.substr(pos + 1);
    }
}

}
