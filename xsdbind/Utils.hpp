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

#ifndef _XSDBIND_UTILS_HPP_
#define _XSDBIND_UTILS_HPP_

#include <string>
#include <vector>
#include "Exports.hpp"

namespace xsdbind
{

extern XSDBIND_DECL_EXPORT const char *XSD_NAMESPACE;
extern XSDBIND_DECL_EXPORT const char *XSI_NAMESPACE;
extern XSDBIND_DECL_EXPORT const char *XML_NAMESPACE;
extern XSDBIND_DECL_EXPORT const char *XMLNS_NAMESPACE;

XSDBIND_DECL_EXPORT std::vector<std::string> splitWhitespace(const std::string &input);
XSDBIND_DECL_EXPORT std::string joinStrings(const std::vector<std::string> &items, const std::string &delim);

//
// Whitespace helpers following the XSD whiteSpace facet: replace turns tab, newline and
// carriage return into spaces, collapse also trims and squeezes runs of spaces.
XSDBIND_DECL_EXPORT bool isXmlWhitespace(char c);
XSDBIND_DECL_EXPORT bool isAllWhitespace(const std::string &text);
XSDBIND_DECL_EXPORT std::string replaceWhitespace(const std::string &text);
XSDBIND_DECL_EXPORT std::string collapseWhitespace(const std::string &text);
XSDBIND_DECL_EXPORT std::string trimWhitespace(const std::string &text);

//
// Qualified names are kept in {uri}local form. A name with no namespace is just local.
XSDBIND_DECL_EXPORT std::string makeQName(const std::string &uri, const std::string &localName);
XSDBIND_DECL_EXPORT std::string getLocalName(const std::string &qname);
XSDBIND_DECL_EXPORT std::string getNamespace(const std::string &qname);

//
// Splits prefix:local. An unprefixed name returns an empty prefix.
XSDBIND_DECL_EXPORT void splitPrefixedName(const std::string &name, std::string &prefix, std::string &localName);

}

#endif // _XSDBIND_UTILS_HPP_
