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


#ifndef _XSDBIND_ATTRIBUTEGROUP_HPP_
#define _XSDBIND_ATTRIBUTEGROUP_HPP_

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "SchemaComponent.hpp"
#include "AttributeDecl.hpp"
#include "Wildcard.hpp"
#include "Value.hpp"
#include "Exports.hpp"

namespace xsdbind
{

class XmlElement;
class ValidationContext;

//
// Ordered attribute uses plus an optional attribute wildcard. Named groups referenced from a
// type are flattened into it when the type is built.
class XSDBIND_DECL_EXPORT AttributeGroup : public SchemaComponent
{
    public:

        AttributeGroup(const std::string &name) : SchemaComponent(name) { }
        virtual ~AttributeGroup() { }
        virtual std::string getDescription() const;

        //
        // Throws ParseException on a duplicate attribute name
        void addAttribute(const std::shared_ptr<AttributeDecl> &pAttr);

        //
        // Adds the other group's uses and wildcard. With keepExisting set, a use already present
        // wins over the other's (restriction), otherwise it is a duplicate and throws ParseException.
        void addAttributes(const AttributeGroup &other, bool keepExisting);

        const std::vector<std::shared_ptr<AttributeDecl>> &getAttributes() const { return m_attributes; }
        bool empty() const { return m_attributes.empty() && !m_pWildcard; }

        //
        // Use by qualified name. Encoding sets matchLocalName so value keys given without their
        // namespace still find a qualified attribute.
        const AttributeDecl *findAttribute(const std::string &name, bool matchLocalName = false) const;

        const std::shared_ptr<Wildcard> &getWildcard() const { return m_pWildcard; }
        void setWildcard(const std::shared_ptr<Wildcard> &pWildcard) { m_pWildcard = pWildcard; }

        void addGroupRefName(const std::string &refName) { m_groupRefNames.push_back(refName); }
        const std::vector<std::string> &getGroupRefNames() const { return m_groupRefNames; }

        void decodeAttributes(const XmlElement &elem, ValidationContext &ctx, std::vector<std::pair<std::string, Value>> &attributes) const;
        void encodeAttributes(const std::vector<std::pair<std::string, Value>> &attributes, ValidationContext &ctx, XmlElement &elem) const;


    protected:

        virtual validity doCheck(const std::shared_ptr<const BuildToken> &pToken) const;
        const AttributeDecl *findWildcardDecl(const std::string &name, ValidationContext &ctx, bool &allowed) const;
        void checkRequired(const std::vector<std::string> &present, ValidationContext &ctx) const;


    private:

        std::vector<std::shared_ptr<AttributeDecl>> m_attributes;
        std::shared_ptr<Wildcard> m_pWildcard;
        std::vector<std::string> m_groupRefNames;
};

}

#endif // _XSDBIND_ATTRIBUTEGROUP_HPP_
