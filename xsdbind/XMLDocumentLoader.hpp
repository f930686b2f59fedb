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

#ifndef _XSDBIND_XMLDOCUMENTLOADER_HPP_
#define _XSDBIND_XMLDOCUMENTLOADER_HPP_

#include <istream>
#include <ostream>
#include <map>
#include <memory>
#include <string>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include "XmlElement.hpp"
#include "Exports.hpp"

namespace pt = boost::property_tree;

namespace xsdbind
{

class XSDBIND_DECL_EXPORT XMLDocumentLoader
{
    public:

        XMLDocumentLoader() { }
        ~XMLDocumentLoader() { }

        std::shared_ptr<XmlElement> load(std::istream &in) const;
        std::shared_ptr<XmlElement> load(const std::string &filename) const;
        std::shared_ptr<XmlElement> load(const pt::ptree &docTree) const;

        //
        // Writes the element tree. Namespaces maps prefixes to URIs; any URI used by the tree and
        // not in the map gets a generated nsN prefix. All declarations are placed on the root.
        void save(std::ostream &out, const XmlElement &root, const std::map<std::string, std::string> &namespaces, bool pretty = false) const;


    protected:

        typedef std::map<std::string, std::string> NamespaceScope;

        std::shared_ptr<XmlElement> parse(const std::string &name, const pt::ptree &elemTree, const NamespaceScope &parentScope) const;
        std::string resolveName(const std::string &name, const NamespaceScope &scope, bool isAttribute) const;
        void serialize(pt::ptree &elemTree, const XmlElement &elem, std::map<std::string, std::string> &prefixes) const;
        std::string getPrefixedName(const std::string &qname, std::map<std::string, std::string> &prefixes, bool isAttribute) const;
        void collectNamespaces(const XmlElement &elem, std::map<std::string, std::string> &prefixes) const;
};

}

#endif // _XSDBIND_XMLDOCUMENTLOADER_HPP_
