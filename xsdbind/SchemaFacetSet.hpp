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

#ifndef _XSDBIND_SCHEMAFACETSET_HPP_
#define _XSDBIND_SCHEMAFACETSET_HPP_

#include <memory>
#include <vector>
#include "SchemaFacet.hpp"
#include "Exports.hpp"

namespace xsdbind
{

//
// The facets declared by one derivation step, at most one per kind. Build time checks throw
// ParseException, they never surface as instance validation errors.
class XSDBIND_DECL_EXPORT SchemaFacetSet
{
    public:

        SchemaFacetSet() : m_facets(SchemaFacet::numFacetKinds) { }
        ~SchemaFacetSet() { }

        void addFacet(const std::shared_ptr<const SchemaFacet> &pFacet);
        std::shared_ptr<const SchemaFacet> getFacet(SchemaFacet::facetKind kind) const { return m_facets[kind]; }
        bool hasFacet(SchemaFacet::facetKind kind) const { return m_facets[kind] != nullptr; }
        bool empty() const;
        std::vector<std::shared_ptr<const SchemaFacet>> getFacets() const;

        //
        // Own facets layered over the base type's effective facets
        SchemaFacetSet merge(const SchemaFacetSet &baseEffective) const;

        //
        // Contradictory combinations such as minLength > maxLength
        void checkConsistency() const;

        //
        // Checks that the own facets only narrow the base, then checks the merged set. The base's
        // whitespace policy is passed in since it may come from its primitive rather than a facet
        void checkRestriction(const SchemaFacetSet &baseEffective, PrimitiveType::whiteSpacePolicy baseWhiteSpace) const;


    protected:

        void checkBoundWithinBase(const BoundFacet &bound, const SchemaFacetSet &baseEffective) const;
        std::string getLexical(SchemaFacet::facetKind kind) const;


    private:

        std::vector<std::shared_ptr<const SchemaFacet>> m_facets;
};

}

#endif // _XSDBIND_SCHEMAFACETSET_HPP_
