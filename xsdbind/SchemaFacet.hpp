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

#ifndef _XSDBIND_SCHEMAFACET_HPP_
#define _XSDBIND_SCHEMAFACET_HPP_

#include <memory>
#include <string>
#include <vector>
#include "Value.hpp"
#include "XSDRegex.hpp"
#include "PrimitiveType.hpp"
#include "Exports.hpp"

namespace xsdbind
{

//
// What a facet looks at. Lexical facets (pattern) use the normalized text, the others the
// decoded value and its length in the units of the type.
struct XSDBIND_DECL_EXPORT FacetInput
{
    FacetInput(const std::string &_text, const Value &_value, size_t _length) : text(_text), value(_value), length(_length) { }
    const std::string &text;
    const Value &value;
    size_t length;
};


class XSDBIND_DECL_EXPORT SchemaFacet
{
    public:

        enum facetKind
        {
            length = 0,
            minLength,
            maxLength,
            minInclusive,
            minExclusive,
            maxInclusive,
            maxExclusive,
            totalDigits,
            fractionDigits,
            enumeration,
            pattern,
            whiteSpace,
            explicitTimezone,
            numFacetKinds
        };

        SchemaFacet(facetKind kind, bool fixed = false) : m_kind(kind), m_fixed(fixed) { }
        virtual ~SchemaFacet() { }

        facetKind getKind() const { return m_kind; }
        bool isFixed() const { return m_fixed; }
        bool isValueValid(const FacetInput &input, std::string &reason) const { return doValueTest(input, reason); }
        virtual std::string getLimitString() const = 0;

        static const char *getKindName(facetKind kind);
        static bool getKindFromName(const std::string &name, facetKind &kind);

        //
        // Facets a primitive admits. xsd11 adds explicitTimezone on the date/time primitives.
        static bool isAdmitted(facetKind kind, PrimitiveType::primitiveKind primitive, bool xsd11);


    protected:

        virtual bool doValueTest(const FacetInput &input, std::string &reason) const = 0;


    protected:

        facetKind m_kind;
        bool m_fixed;
};


class XSDBIND_DECL_EXPORT LengthFacet : public SchemaFacet
{
    public:

        LengthFacet(facetKind kind, size_t limit, bool fixed = false) : SchemaFacet(kind, fixed), m_limit(limit) { }
        virtual ~LengthFacet() { }
        size_t getLimit() const { return m_limit; }
        virtual std::string getLimitString() const;


    protected:

        virtual bool doValueTest(const FacetInput &input, std::string &reason) const;


    private:

        size_t m_limit;
};


class XSDBIND_DECL_EXPORT BoundFacet : public SchemaFacet
{
    public:

        BoundFacet(facetKind kind, const Value &limit, bool fixed = false) : SchemaFacet(kind, fixed), m_limit(limit) { }
        virtual ~BoundFacet() { }
        const Value &getLimit() const { return m_limit; }
        bool isMinBound() const { return m_kind == minInclusive || m_kind == minExclusive; }
        bool isInclusive() const { return m_kind == minInclusive || m_kind == maxInclusive; }
        virtual std::string getLimitString() const;


    protected:

        virtual bool doValueTest(const FacetInput &input, std::string &reason) const;


    private:

        Value m_limit;
};


class XSDBIND_DECL_EXPORT DigitsFacet : public SchemaFacet
{
    public:

        DigitsFacet(facetKind kind, unsigned limit, bool fixed = false) : SchemaFacet(kind, fixed), m_limit(limit) { }
        virtual ~DigitsFacet() { }
        unsigned getLimit() const { return m_limit; }
        virtual std::string getLimitString() const;

        //
        // Digit counts of a decimal ignoring leading and trailing zeros
        static void countDigits(const Value &value, unsigned &totalDigits, unsigned &fractionDigits);


    protected:

        virtual bool doValueTest(const FacetInput &input, std::string &reason) const;


    private:

        unsigned m_limit;
};


class XSDBIND_DECL_EXPORT EnumerationFacet : public SchemaFacet
{
    public:

        EnumerationFacet() : SchemaFacet(enumeration) { }
        virtual ~EnumerationFacet() { }
        void addAllowedValue(const std::string &lexical, const Value &value) { m_lexicals.push_back(lexical); m_values.push_back(value); }
        const std::vector<Value> &getAllowedValues() const { return m_values; }
        const std::vector<std::string> &getAllowedLexicals() const { return m_lexicals; }
        virtual std::string getLimitString() const;


    protected:

        virtual bool doValueTest(const FacetInput &input, std::string &reason) const;


    private:

        std::vector<std::string> m_lexicals;
        std::vector<Value> m_values;
};


//
// All pattern facets of one derivation step. The value is accepted if any of them matches.
class XSDBIND_DECL_EXPORT PatternFacet : public SchemaFacet
{
    public:

        PatternFacet() : SchemaFacet(pattern) { }
        virtual ~PatternFacet() { }
        void addPattern(const std::string &pattern) { m_patterns.push_back(std::make_shared<XSDRegex>(pattern)); }
        size_t getNumPatterns() const { return m_patterns.size(); }
        virtual std::string getLimitString() const;


    protected:

        virtual bool doValueTest(const FacetInput &input, std::string &reason) const;


    private:

        std::vector<std::shared_ptr<const XSDRegex>> m_patterns;
};


class XSDBIND_DECL_EXPORT WhiteSpaceFacet : public SchemaFacet
{
    public:

        WhiteSpaceFacet(PrimitiveType::whiteSpacePolicy policy, bool fixed = false) : SchemaFacet(whiteSpace, fixed), m_policy(policy) { }
        virtual ~WhiteSpaceFacet() { }
        PrimitiveType::whiteSpacePolicy getPolicy() const { return m_policy; }
        std::string normalize(const std::string &text) const { return PrimitiveType::normalize(m_policy, text); }
        virtual std::string getLimitString() const { return std::string("whiteSpace ") + PrimitiveType::getWhiteSpaceName(m_policy); }


    protected:

        virtual bool doValueTest(const FacetInput &input, std::string &reason) const { return true; }


    private:

        PrimitiveType::whiteSpacePolicy m_policy;
};


class XSDBIND_DECL_EXPORT TimezoneFacet : public SchemaFacet
{
    public:

        enum timezonePolicy
        {
            optional = 0,
            required,
            prohibited
        };

        TimezoneFacet(timezonePolicy policy, bool fixed = false) : SchemaFacet(explicitTimezone, fixed), m_policy(policy) { }
        virtual ~TimezoneFacet() { }
        timezonePolicy getPolicy() const { return m_policy; }
        virtual std::string getLimitString() const;


    protected:

        virtual bool doValueTest(const FacetInput &input, std::string &reason) const;


    private:

        timezonePolicy m_policy;
};

}

#endif // _XSDBIND_SCHEMAFACET_HPP_
