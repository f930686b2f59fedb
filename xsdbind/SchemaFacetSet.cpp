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

#include "SchemaFacetSet.hpp"
#include "Exceptions.hpp"

using namespace xsdbind;


void SchemaFacetSet::addFacet(const std::shared_ptr<const SchemaFacet> &pFacet)
{
    SchemaFacet::facetKind kind = pFacet->getKind();
    if (m_facets[kind] != nullptr)
    {
        throw(ParseException(std::string("Duplicate facet '") + SchemaFacet::getKindName(kind) + "'"));
    }
    m_facets[kind] = pFacet;
}


bool SchemaFacetSet::empty() const
{
    for (auto &pFacet : m_facets)
    {
        if (pFacet)
            return false;
    }
    return true;
}


std::vector<std::shared_ptr<const SchemaFacet>> SchemaFacetSet::getFacets() const
{
    std::vector<std::shared_ptr<const SchemaFacet>> facets;
    for (auto &pFacet : m_facets)
    {
        if (pFacet)
            facets.push_back(pFacet);
    }
    return facets;
}


SchemaFacetSet SchemaFacetSet::merge(const SchemaFacetSet &baseEffective) const
{
    SchemaFacetSet merged = baseEffective;
    for (int i = 0; i < SchemaFacet::numFacetKinds; ++i)
    {
        if (m_facets[i])
        {
            merged.m_facets[i] = m_facets[i];

            //
            // The inclusive and exclusive forms of a bound replace each other
            if (i == SchemaFacet::minInclusive)       merged.m_facets[SchemaFacet::minExclusive] = nullptr;
            else if (i == SchemaFacet::minExclusive)  merged.m_facets[SchemaFacet::minInclusive] = nullptr;
            else if (i == SchemaFacet::maxInclusive)  merged.m_facets[SchemaFacet::maxExclusive] = nullptr;
            else if (i == SchemaFacet::maxExclusive)  merged.m_facets[SchemaFacet::maxInclusive] = nullptr;
        }
    }
    return merged;
}


std::string SchemaFacetSet::getLexical(SchemaFacet::facetKind kind) const
{
    return m_facets[kind] ? m_facets[kind]->getLimitString() : "";
}


void SchemaFacetSet::checkConsistency() const
{
    auto pLength = std::dynamic_pointer_cast<const LengthFacet>(m_facets[SchemaFacet::length]);
    auto pMinLength = std::dynamic_pointer_cast<const LengthFacet>(m_facets[SchemaFacet::minLength]);
    auto pMaxLength = std::dynamic_pointer_cast<const LengthFacet>(m_facets[SchemaFacet::maxLength]);

    if (pMinLength && pMaxLength && pMinLength->getLimit() > pMaxLength->getLimit())
        throw(ParseException("value of minLength is greater than maxLength (" + getLexical(SchemaFacet::minLength) + ", " + getLexical(SchemaFacet::maxLength) + ")"));
    if (pLength && pMinLength && pMinLength->getLimit() > pLength->getLimit())
        throw(ParseException("value of minLength is greater than length (" + getLexical(SchemaFacet::minLength) + ", " + getLexical(SchemaFacet::length) + ")"));
    if (pLength && pMaxLength && pMaxLength->getLimit() < pLength->getLimit())
        throw(ParseException("value of maxLength is lesser than length (" + getLexical(SchemaFacet::maxLength) + ", " + getLexical(SchemaFacet::length) + ")"));

    if (m_facets[SchemaFacet::minInclusive] && m_facets[SchemaFacet::minExclusive])
        throw(ParseException("minInclusive and minExclusive facets are mutually exclusive"));
    if (m_facets[SchemaFacet::maxInclusive] && m_facets[SchemaFacet::maxExclusive])
        throw(ParseException("maxInclusive and maxExclusive facets are mutually exclusive"));

    std::shared_ptr<const BoundFacet> pMin = std::dynamic_pointer_cast<const BoundFacet>(m_facets[SchemaFacet::minInclusive] ? m_facets[SchemaFacet::minInclusive] : m_facets[SchemaFacet::minExclusive]);
    std::shared_ptr<const BoundFacet> pMax = std::dynamic_pointer_cast<const BoundFacet>(m_facets[SchemaFacet::maxInclusive] ? m_facets[SchemaFacet::maxInclusive] : m_facets[SchemaFacet::maxExclusive]);
    if (pMin && pMax)
    {
        int cmp;
        try
        {
            cmp = pMin->getLimit().compare(pMax->getLimit());
        }
        catch (const ValueException &e)
        {
            throw(ParseException(std::string("bound facets are not comparable: ") + e.what()));
        }

        bool bothInclusive = pMin->isInclusive() && pMax->isInclusive();
        if (cmp > 0 || (cmp == 0 && !bothInclusive))
            throw(ParseException("lower bound " + pMin->getLimitString() + " is not lesser than upper bound " + pMax->getLimitString()));
    }

    auto pTotal = std::dynamic_pointer_cast<const DigitsFacet>(m_facets[SchemaFacet::totalDigits]);
    auto pFraction = std::dynamic_pointer_cast<const DigitsFacet>(m_facets[SchemaFacet::fractionDigits]);
    if (pTotal && pFraction && pFraction->getLimit() > pTotal->getLimit())
        throw(ParseException("fractionDigits has to be lesser or equal than totalDigits"));
}


void SchemaFacetSet::checkBoundWithinBase(const BoundFacet &bound, const SchemaFacetSet &baseEffective) const
{
    FacetInput input(bound.getLimit().toLexical(), bound.getLimit(), 0);
    for (int kind = SchemaFacet::minInclusive; kind <= SchemaFacet::maxExclusive; ++kind)
    {
        auto pBaseBound = std::dynamic_pointer_cast<const BoundFacet>(baseEffective.m_facets[kind]);
        if (!pBaseBound)
            continue;

        //
        // Repeating the base's exclusive bound is allowed
        if (pBaseBound->getKind() == bound.getKind() && pBaseBound->getLimit() == bound.getLimit())
            continue;

        //
        // An exclusive bound may sit on the base's inclusive bound of the same side
        if (!bound.isInclusive() && pBaseBound->isInclusive() && pBaseBound->isMinBound() == bound.isMinBound() && pBaseBound->getLimit() == bound.getLimit())
            continue;

        std::string reason;
        if (!pBaseBound->isValueValid(input, reason))
        {
            throw(ParseException(bound.getLimitString() + " is outside the range of the base type: " + reason));
        }
    }
}


void SchemaFacetSet::checkRestriction(const SchemaFacetSet &baseEffective, PrimitiveType::whiteSpacePolicy baseWhiteSpace) const
{
    for (int i = 0; i < SchemaFacet::numFacetKinds; ++i)
    {
        std::shared_ptr<const SchemaFacet> pOwn = m_facets[i];
        std::shared_ptr<const SchemaFacet> pBase = baseEffective.m_facets[i];
        if (!pOwn || !pBase)
            continue;

        if (pBase->isFixed() && pOwn->getLimitString() != pBase->getLimitString())
            throw(ParseException(std::string("fixed facet '") + SchemaFacet::getKindName(pBase->getKind()) + "' of the base type can't be changed"));
    }

    auto pOwnLength = std::dynamic_pointer_cast<const LengthFacet>(m_facets[SchemaFacet::length]);
    auto pBaseLength = std::dynamic_pointer_cast<const LengthFacet>(baseEffective.m_facets[SchemaFacet::length]);
    if (pOwnLength && pBaseLength && pOwnLength->getLimit() != pBaseLength->getLimit())
        throw(ParseException("base type has a different length (" + pBaseLength->getLimitString() + ")"));

    auto pOwnMin = std::dynamic_pointer_cast<const LengthFacet>(m_facets[SchemaFacet::minLength]);
    auto pBaseMin = std::dynamic_pointer_cast<const LengthFacet>(baseEffective.m_facets[SchemaFacet::minLength]);
    if (pOwnMin && pBaseMin && pOwnMin->getLimit() < pBaseMin->getLimit())
        throw(ParseException("base type has a greater minLength (" + pBaseMin->getLimitString() + ")"));

    auto pOwnMax = std::dynamic_pointer_cast<const LengthFacet>(m_facets[SchemaFacet::maxLength]);
    auto pBaseMax = std::dynamic_pointer_cast<const LengthFacet>(baseEffective.m_facets[SchemaFacet::maxLength]);
    if (pOwnMax && pBaseMax && pOwnMax->getLimit() > pBaseMax->getLimit())
        throw(ParseException("base type has a lesser maxLength (" + pBaseMax->getLimitString() + ")"));

    for (int kind = SchemaFacet::minInclusive; kind <= SchemaFacet::maxExclusive; ++kind)
    {
        auto pBound = std::dynamic_pointer_cast<const BoundFacet>(m_facets[kind]);
        if (pBound)
            checkBoundWithinBase(*pBound, baseEffective);
    }

    for (int kind = SchemaFacet::totalDigits; kind <= SchemaFacet::fractionDigits; ++kind)
    {
        auto pOwnDigits = std::dynamic_pointer_cast<const DigitsFacet>(m_facets[kind]);
        auto pBaseDigits = std::dynamic_pointer_cast<const DigitsFacet>(baseEffective.m_facets[kind]);
        if (pOwnDigits && pBaseDigits && pOwnDigits->getLimit() > pBaseDigits->getLimit())
            throw(ParseException(std::string("base type has a lesser ") + pBaseDigits->getLimitString()));
    }

    auto pOwnWs = std::dynamic_pointer_cast<const WhiteSpaceFacet>(m_facets[SchemaFacet::whiteSpace]);
    if (pOwnWs && pOwnWs->getPolicy() < baseWhiteSpace)
        throw(ParseException(std::string("whiteSpace can't be relaxed from '") + PrimitiveType::getWhiteSpaceName(baseWhiteSpace) +
            "' to '" + PrimitiveType::getWhiteSpaceName(pOwnWs->getPolicy()) + "'"));

    merge(baseEffective).checkConsistency();
}
