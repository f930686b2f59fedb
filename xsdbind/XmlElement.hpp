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

#ifndef _XSDBIND_XMLELEMENT_HPP_
#define _XSDBIND_XMLELEMENT_HPP_

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "Exports.hpp"

namespace xsdbind
{

//
// Markup node consumed by the validator and produced by the encoder. The tag and attribute
// names are qualified names in {uri}local form. Text is the character data before the first
// child, tail is the character data following this element inside its parent.
class XSDBIND_DECL_EXPORT XmlElement
{
    public:

        XmlElement(const std::string &tag) : m_tag(tag) { }
        ~XmlElement() { }

        const std::string &getTag() const { return m_tag; }
        void setTag(const std::string &tag) { m_tag = tag; }
        const std::string &getText() const { return m_text; }
        void setText(const std::string &text) { m_text = text; }
        void appendText(const std::string &text) { m_text += text; }
        const std::string &getTail() const { return m_tail; }
        void setTail(const std::string &tail) { m_tail = tail; }
        void appendTail(const std::string &tail) { m_tail += tail; }

        const std::map<std::string, std::string> &getAttributes() const { return m_attributes; }
        void setAttribute(const std::string &name, const std::string &value) { m_attributes[name] = value; }
        bool getAttribute(const std::string &name, std::string &value) const;
        bool hasAttribute(const std::string &name) const { return m_attributes.find(name) != m_attributes.end(); }

        const std::vector<std::shared_ptr<XmlElement>> &getChildren() const { return m_children; }
        size_t getNumChildren() const { return m_children.size(); }
        void addChild(const std::shared_ptr<XmlElement> &pChild) { m_children.push_back(pChild); }
        std::shared_ptr<XmlElement> addChild(const std::string &tag);

        //
        // Namespace declarations made on this element, prefix to URI ('' is the default namespace)
        const std::map<std::string, std::string> &getNamespaceMap() const { return m_nsMap; }
        void addNamespace(const std::string &prefix, const std::string &uri) { m_nsMap[prefix] = uri; }

        //
        // Structural comparison. Text that is only whitespace is ignored, other text is compared
        // after trimming when ignoreWhitespace is set.
        bool isEquivalent(const XmlElement &other, bool ignoreWhitespace = true, std::string *pDiff = nullptr) const;


    private:

        std::string m_tag;
        std::string m_text;
        std::string m_tail;
        std::map<std::string, std::string> m_attributes;
        std::map<std::string, std::string> m_nsMap;
        std::vector<std::shared_ptr<XmlElement>> m_children;
};

}

#endif // _XSDBIND_XMLELEMENT_HPP_
