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

#ifndef _XSDBIND_SIMPLETYPE_HPP_
#define _XSDBIND_SIMPLETYPE_HPP_

#include <memory>
#include <string>
#include <vector>
#include "SchemaType.hpp"
#include "SchemaFacetSet.hpp"
#include "PrimitiveType.hpp"
#include "Value.hpp"
#include "Exports.hpp"

namespace xsdbind
{

class ValidationContext;

//
// Atomic, list and union types as one closed type. A restriction keeps the variety of its
// base and adds a facet set that may only narrow the base's facets.
class XSDBIND_DECL_EXPORT SimpleType : public SchemaType
{
    public:

        enum varietyType
        {
            atomicVariety = 0,
            listVariety,
            unionVariety
        };

        SimpleType(const std::string &name, varietyType variety = atomicVariety);
        virtual ~SimpleType() { }

        varietyType getVariety() const { return m_variety; }
        static const char *getVarietyString(varietyType variety);
        virtual bool isSimple() const { return true; }
        virtual bool hasSimpleContent() const { return true; }
        virtual const SimpleType *getContentSimpleType() const { return this; }
        virtual std::string getDescription() const;

        PrimitiveType::primitiveKind getPrimitive() const { return m_primitive; }
        void setPrimitive(PrimitiveType::primitiveKind primitive) { m_primitive = primitive; }
        const SimpleType *getItemType() const { return m_pItemType; }
        void setItemType(const SimpleType *pItemType) { m_pItemType = pItemType; }
        const std::string &getItemTypeName() const { return m_itemTypeName; }
        void setItemTypeName(const std::string &name) { m_itemTypeName = name; }
        const std::vector<const SimpleType *> &getMemberTypes() const { return m_memberTypes; }
        void addMemberType(const SimpleType *pMember) { m_memberTypes.push_back(pMember); }
        const std::vector<std::string> &getMemberTypeNames() const { return m_memberTypeNames; }
        void addMemberTypeName(const std::string &name) { m_memberTypeNames.push_back(name); }
        void addLocalType(const std::shared_ptr<SimpleType> &pType) { m_localTypes.push_back(pType); }

        SchemaFacetSet &getFacets() { return m_facets; }
        const SchemaFacetSet &getFacets() const { return m_facets; }
        SchemaFacetSet getEffectiveFacets() const;
        std::shared_ptr<const SchemaFacet> getEffectiveFacet(SchemaFacet::facetKind kind) const;
        PrimitiveType::whiteSpacePolicy getWhiteSpace() const;
        bool isFacetAdmitted(SchemaFacet::facetKind kind, bool xsd11) const;

        //
        // Build time narrowing and consistency checks against the base type, throws ParseException
        void checkFacets() const;

        std::string normalize(const std::string &text) const;
        Value decode(const std::string &text, ValidationContext &ctx) const;
        std::string encode(const Value &value, ValidationContext &ctx) const;


    protected:

        virtual validity doCheck(const std::shared_ptr<const BuildToken> &pToken) const;
        const SimpleType *getRestrictionBase() const;
        size_t getValueLength(const Value &value) const;
        void checkLexicalFacets(const std::string &text, ValidationContext &ctx) const;
        void checkValueFacets(const std::string &text, const Value &value, ValidationContext &ctx) const;
        Value decodeAtomic(const std::string &text, ValidationContext &ctx) const;
        Value decodeList(const std::string &text, ValidationContext &ctx) const;
        Value decodeUnion(const std::string &text, ValidationContext &ctx) const;
        std::string encodeAtomic(const Value &value, ValidationContext &ctx) const;
        std::string encodeList(const Value &value, ValidationContext &ctx) const;
        std::string encodeUnion(const Value &value, ValidationContext &ctx) const;


    private:

        varietyType m_variety;
        PrimitiveType::primitiveKind m_primitive;
        const SimpleType *m_pItemType;
        std::string m_itemTypeName;
        std::vector<const SimpleType *> m_memberTypes;
        std::vector<std::string> m_memberTypeNames;
        std::vector<std::shared_ptr<SimpleType>> m_localTypes;
        SchemaFacetSet m_facets;
};

}

#endif // _XSDBIND_SIMPLETYPE_HPP_
