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

#include "SchemaFacet.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"

using namespace xsdbind;

static const char *facetNames[] = {
    "length", "minLength", "maxLength", "minInclusive", "minExclusive", "maxInclusive", "maxExclusive",
    "totalDigits", "fractionDigits", "enumeration", "pattern", "whiteSpace", "explicitTimezone"
};


const char *SchemaFacet::getKindName(facetKind kind)
{
    return (kind >= 0 && kind < numFacetKinds) ? facetNames[kind] : "unknown";
}


bool SchemaFacet::getKindFromName(const std::string &name, facetKind &kind)
{
    for (int i = 0; i < numFacetKinds; ++i)
    {
        if (name == facetNames[i])
        {
            kind = static_cast<facetKind>(i);
            return true;
        }
    }
    return false;
}


bool SchemaFacet::isAdmitted(facetKind kind, PrimitiveType::primitiveKind primitive, bool xsd11)
{
    bool admitted = false;
    bool isLengthKind = kind == length || kind == minLength || kind == maxLength;
    bool isBoundKind = kind >= minInclusive && kind <= maxExclusive;
    bool isCommonKind = kind == pattern || kind == whiteSpace || kind == enumeration;

    switch (primitive)
    {
        case PrimitiveType::anySimpleKind:
            admitted = kind != explicitTimezone || xsd11;
            break;

        case PrimitiveType::stringKind:
        case PrimitiveType::hexBinaryKind:
        case PrimitiveType::base64BinaryKind:
        case PrimitiveType::anyURIKind:
        case PrimitiveType::QNameKind:
        case PrimitiveType::NOTATIONKind:
            admitted = isLengthKind || isCommonKind;
            break;

        case PrimitiveType::booleanKind:
            admitted = kind == pattern || kind == whiteSpace;
            break;

        case PrimitiveType::decimalKind:
        case PrimitiveType::integerKind:
            admitted = isCommonKind || isBoundKind || kind == totalDigits || kind == fractionDigits;
            break;

        case PrimitiveType::floatKind:
        case PrimitiveType::doubleKind:
        case PrimitiveType::durationKind:
            admitted = isCommonKind || isBoundKind;
            break;

        default:
            admitted = isCommonKind || isBoundKind || (kind == explicitTimezone && xsd11);
            break;
    }
    return admitted;
}


std::string LengthFacet::getLimitString() const
{
    return std::string(getKindName(m_kind)) + " " + std::to_string(m_limit);
}


bool LengthFacet::doValueTest(const FacetInput &input, std::string &reason) const
{
    bool isValid = true;
    if (m_kind == length && input.length != m_limit)
    {
        isValid = false;
        reason = "length has to be " + std::to_string(m_limit);
    }
    else if (m_kind == minLength && input.length < m_limit)
    {
        isValid = false;
        reason = "value length cannot be lesser than " + std::to_string(m_limit);
    }
    else if (m_kind == maxLength && input.length > m_limit)
    {
        isValid = false;
        reason = "value length cannot be greater than " + std::to_string(m_limit);
    }
    return isValid;
}


std::string BoundFacet::getLimitString() const
{
    return std::string(getKindName(m_kind)) + " " + m_limit.toLexical();
}


bool BoundFacet::doValueTest(const FacetInput &input, std::string &reason) const
{
    int cmp;
    try
    {
        cmp = input.value.compare(m_limit);
    }
    catch (const ValueException &e)
    {
        reason = std::string("value is not comparable with ") + getKindName(m_kind) + " " + m_limit.toLexical() + ": " + e.what();
        return false;
    }

    bool isValid = true;
    switch (m_kind)
    {
        case minInclusive:
            isValid = cmp >= 0;
            if (!isValid) reason = "value has to be greater or equal than " + m_limit.toLexical();
            break;
        case minExclusive:
            isValid = cmp > 0;
            if (!isValid) reason = "value has to be greater than " + m_limit.toLexical();
            break;
        case maxInclusive:
            isValid = cmp <= 0;
            if (!isValid) reason = "value has to be lesser or equal than " + m_limit.toLexical();
            break;
        case maxExclusive:
            isValid = cmp < 0;
            if (!isValid) reason = "value has to be lesser than " + m_limit.toLexical();
            break;
        default:
            break;
    }
    return isValid;
}


void DigitsFacet::countDigits(const Value &value, unsigned &total, unsigned &fraction)
{
    std::string text = (value.getType() == Value::intValue) ? std::to_string(value.getInteger()) : Value::canonicalDecimal(value.toLexical());
    if (!text.empty() && text[0] == '-')
        text = text.substr(1);

    std::string intPart = text, fracPart;
    size_t dot = text.find('.');
    if (dot != std::string::npos)
    {
        intPart = text.substr(0, dot);
        fracPart = text.substr(dot + 1);
    }
    std::string digits = intPart + fracPart;
    size_t firstSignificant = digits.find_first_not_of('0');

    fraction = static_cast<unsigned>(fracPart.length());
    total = (firstSignificant == std::string::npos) ? 1 : static_cast<unsigned>(digits.length() - firstSignificant);
}


std::string DigitsFacet::getLimitString() const
{
    return std::string(getKindName(m_kind)) + " " + std::to_string(m_limit);
}


bool DigitsFacet::doValueTest(const FacetInput &input, std::string &reason) const
{
    if (input.value.getType() != Value::intValue && input.value.getType() != Value::decimalValue)
    {
        reason = std::string(getKindName(m_kind)) + " applies to decimal values only";
        return false;
    }

    unsigned total, fraction;
    countDigits(input.value, total, fraction);
    bool isValid = true;
    if (m_kind == totalDigits && total > m_limit)
    {
        isValid = false;
        reason = "the number of digits has to be lesser or equal than " + std::to_string(m_limit);
    }
    else if (m_kind == fractionDigits && fraction > m_limit)
    {
        isValid = false;
        reason = "the number of fractional digits has to be lesser or equal than " + std::to_string(m_limit);
    }
    return isValid;
}


std::string EnumerationFacet::getLimitString() const
{
    std::vector<std::string> quoted;
    for (auto &lexical : m_lexicals)
        quoted.push_back("'" + lexical + "'");
    return "enumeration [" + joinStrings(quoted, ", ") + "]";
}


bool EnumerationFacet::doValueTest(const FacetInput &input, std::string &reason) const
{
    for (auto &allowed : m_values)
    {
        if (allowed == input.value)
            return true;
    }

    std::vector<std::string> quoted;
    for (auto &lexical : m_lexicals)
        quoted.push_back("'" + lexical + "'");
    reason = "value must be one of [" + joinStrings(quoted, ", ") + "]";
    return false;
}


std::string PatternFacet::getLimitString() const
{
    std::vector<std::string> patterns;
    for (auto &pRegex : m_patterns)
        patterns.push_back("'" + pRegex->getPattern() + "'");
    return "pattern [" + joinStrings(patterns, ", ") + "]";
}


bool PatternFacet::doValueTest(const FacetInput &input, std::string &reason) const
{
    for (auto &pRegex : m_patterns)
    {
        if (pRegex->isMatch(input.text))
            return true;
    }
    reason = "value doesn't match any " + getLimitString();
    return false;
}


std::string TimezoneFacet::getLimitString() const
{
    std::string policy = "optional";
    if (m_policy == required)
        policy = "required";
    else if (m_policy == prohibited)
        policy = "prohibited";
    return "explicitTimezone " + policy;
}


bool TimezoneFacet::doValueTest(const FacetInput &input, std::string &reason) const
{
    bool isValid = true;
    bool hasTimezone = PrimitiveType::hasTimezone(input.text);
    if (m_policy == required && !hasTimezone)
    {
        isValid = false;
        reason = "time zone required";
    }
    else if (m_policy == prohibited && hasTimezone)
    {
        isValid = false;
        reason = "time zone prohibited";
    }
    return isValid;
}
