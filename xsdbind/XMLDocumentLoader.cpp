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

#include <fstream>
#include "XMLDocumentLoader.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"
#include "Log.hpp"

using namespace xsdbind;


std::shared_ptr<XmlElement> XMLDocumentLoader::load(const std::string &filename) const
{
    std::ifstream in(filename);
    if (!in.is_open())
    {
        ParseException pe("Unable to open document");
        pe.addFilename(filename);
        throw pe;
    }

    try
    {
        return load(in);
    }
    catch (ParseException &pe)
    {
        pe.addFilename(filename);
        throw;
    }
}


std::shared_ptr<XmlElement> XMLDocumentLoader::load(std::istream &in) const
{
    pt::ptree docTree;
    try
    {
        pt::read_xml(in, docTree, pt::xml_parser::no_concat_text | pt::xml_parser::no_comments);
    }
    catch (const std::exception &e)
    {
        std::string xmlError = e.what();
        throw(ParseException("Unable to read/parse document. Check that it is formatted correctly. Error = " + xmlError));
    }
    return load(docTree);
}


std::shared_ptr<XmlElement> XMLDocumentLoader::load(const pt::ptree &docTree) const
{
    NamespaceScope scope;
    scope["xml"] = XML_NAMESPACE;

    std::shared_ptr<XmlElement> pRoot;
    for (auto docIt = docTree.begin(); docIt != docTree.end(); ++docIt)
    {
        if (docIt->first == "<xmltext>" || docIt->first == "<xmlcomment>")
            continue;

        if (pRoot)
            throw(ParseException("Document has more than one root element"));
        pRoot = parse(docIt->first, docIt->second, scope);
    }

    if (!pRoot)
        throw(ParseException("Document has no root element"));
    getLogger()->debug("Loaded document, root element '{}'", pRoot->getTag());
    return pRoot;
}


std::shared_ptr<XmlElement> XMLDocumentLoader::parse(const std::string &name, const pt::ptree &elemTree, const NamespaceScope &parentScope) const
{
    //
    // Namespace declarations first, they are in scope for the element's own name
    NamespaceScope scope = parentScope;
    std::map<std::string, std::string> declared;
    boost::optional<const pt::ptree &> attrTree = elemTree.get_child_optional("<xmlattr>");
    if (attrTree)
    {
        for (auto attrIt = attrTree->begin(); attrIt != attrTree->end(); ++attrIt)
        {
            const std::string &attrName = attrIt->first;
            if (attrName == "xmlns")
                declared[""] = attrIt->second.data();
            else if (attrName.compare(0, 6, "xmlns:") == 0)
                declared[attrName.substr(6)] = attrIt->second.data();
        }
        for (auto &decl : declared)
            scope[decl.first] = decl.second;
    }

    std::shared_ptr<XmlElement> pElem = std::make_shared<XmlElement>(resolveName(name, scope, false));
    for (auto &decl : declared)
        pElem->addNamespace(decl.first, decl.second);

    if (attrTree)
    {
        for (auto attrIt = attrTree->begin(); attrIt != attrTree->end(); ++attrIt)
        {
            const std::string &attrName = attrIt->first;
            if (attrName == "xmlns" || attrName.compare(0, 6, "xmlns:") == 0)
                continue;
            pElem->setAttribute(resolveName(attrName, scope, true), attrIt->second.data());
        }
    }

    //
    // Text read without no_concat_text ends up as the node data
    if (!elemTree.data().empty())
        pElem->setText(elemTree.data());

    std::shared_ptr<XmlElement> pLastChild;
    for (auto it = elemTree.begin(); it != elemTree.end(); ++it)
    {
        const std::string &childName = it->first;
        if (childName == "<xmlattr>" || childName == "<xmlcomment>")
        {
            continue;
        }
        else if (childName == "<xmltext>")
        {
            if (pLastChild)
                pLastChild->appendTail(it->second.data());
            else
                pElem->appendText(it->second.data());
        }
        else
        {
            pLastChild = parse(childName, it->second, scope);
            pElem->addChild(pLastChild);
        }
    }
    return pElem;
}


std::string XMLDocumentLoader::resolveName(const std::string &name, const NamespaceScope &scope, bool isAttribute) const
{
    std::string prefix, localName;
    splitPrefixedName(name, prefix, localName);

    //
    // Unprefixed attributes are never in a namespace
    if (prefix.empty() && isAttribute)
        return localName;

    auto nsIt = scope.find(prefix);
    if (nsIt == scope.end())
    {
        if (prefix.empty())
            return localName;
        throw(ParseException("Unknown namespace prefix '" + prefix + "' in name '" + name + "'"));
    }
    return makeQName(nsIt->second, localName);
}


void XMLDocumentLoader::save(std::ostream &out, const XmlElement &root, const std::map<std::string, std::string> &namespaces, bool pretty) const
{
    //
    // prefixes is keyed by URI
    std::map<std::string, std::string> prefixes;
    for (auto &ns : namespaces)
    {
        if (prefixes.find(ns.second) == prefixes.end())
            prefixes[ns.second] = ns.first;
    }
    prefixes[XML_NAMESPACE] = "xml";
    collectNamespaces(root, prefixes);

    pt::ptree docTree, rootTree;
    serialize(rootTree, root, prefixes);
    for (auto &prefix : prefixes)
    {
        if (prefix.first == XML_NAMESPACE || prefix.first.empty())
            continue;
        std::string attrName = prefix.second.empty() ? "xmlns" : "xmlns:" + prefix.second;
        rootTree.put(pt::ptree::path_type("<xmlattr>/" + attrName, '/'), prefix.first);
    }
    docTree.push_back(std::make_pair(getPrefixedName(root.getTag(), prefixes, false), rootTree));

    try
    {
        pt::write_xml(out, docTree, pt::xml_writer_make_settings<std::string>(' ', pretty ? 2 : 0));
    }
    catch (const std::exception &e)
    {
        std::string xmlError = e.what();
        throw(ParseException("Unable to write document. Error = " + xmlError));
    }
}


void XMLDocumentLoader::collectNamespaces(const XmlElement &elem, std::map<std::string, std::string> &prefixes) const
{
    std::vector<std::string> uris;
    uris.push_back(getNamespace(elem.getTag()));
    for (auto &attr : elem.getAttributes())
        uris.push_back(getNamespace(attr.first));

    for (auto &uri : uris)
    {
        if (!uri.empty() && prefixes.find(uri) == prefixes.end())
        {
            //
            // Reuse the prefix the document declared if it is still free
            std::string prefix;
            for (auto &decl : elem.getNamespaceMap())
            {
                if (decl.second == uri)
                    prefix = decl.first;
            }
            bool taken = prefix.empty();
            for (auto &used : prefixes)
                taken = taken || used.second == prefix;
            for (unsigned idx = 0; taken; ++idx)
            {
                prefix = "ns" + std::to_string(idx);
                taken = false;
                for (auto &used : prefixes)
                    taken = taken || used.second == prefix;
            }
            prefixes[uri] = prefix;
        }
    }

    for (auto &pChild : elem.getChildren())
        collectNamespaces(*pChild, prefixes);
}


std::string XMLDocumentLoader::getPrefixedName(const std::string &qname, std::map<std::string, std::string> &prefixes, bool isAttribute) const
{
    std::string uri = getNamespace(qname);
    if (uri.empty())
        return getLocalName(qname);

    auto prefixIt = prefixes.find(uri);
    if (prefixIt == prefixes.end() || (isAttribute && prefixIt->second.empty()))
        throw(ParseException("No namespace prefix available for '" + uri + "'"));
    return prefixIt->second.empty() ? getLocalName(qname) : prefixIt->second + ":" + getLocalName(qname);
}


void XMLDocumentLoader::serialize(pt::ptree &elemTree, const XmlElement &elem, std::map<std::string, std::string> &prefixes) const
{
    if (!elem.getAttributes().empty())
    {
        //
        // push_back rather than put, put would treat a dot in the name as a path separator
        pt::ptree &attrTree = elemTree.put_child("<xmlattr>", pt::ptree());
        for (auto &attr : elem.getAttributes())
            attrTree.push_back(std::make_pair(getPrefixedName(attr.first, prefixes, true), pt::ptree(attr.second)));
    }

    if (elem.getChildren().empty())
    {
        elemTree.data() = elem.getText();
        return;
    }

    if (!elem.getText().empty())
        elemTree.push_back(std::make_pair("<xmltext>", pt::ptree(elem.getText())));

    for (auto &pChild : elem.getChildren())
    {
        pt::ptree childTree;
        serialize(childTree, *pChild, prefixes);
        elemTree.push_back(std::make_pair(getPrefixedName(pChild->getTag(), prefixes, false), childTree));
        if (!pChild->getTail().empty())
            elemTree.push_back(std::make_pair("<xmltext>", pt::ptree(pChild->getTail())));
    }
}
