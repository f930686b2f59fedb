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


#ifndef _XSDBIND_PARTICLE_HPP_
#define _XSDBIND_PARTICLE_HPP_

#include <climits>
#include <string>
#include "SchemaComponent.hpp"
#include "Exports.hpp"

namespace xsdbind
{

//
// One slot of a content model with its occurrence range. Element declarations, wildcards and
// model groups are the three particle kinds.
class XSDBIND_DECL_EXPORT Particle : public SchemaComponent
{
    public:

        enum particleKind
        {
            elementParticle = 0,
            wildcardParticle,
            groupParticle
        };

        static constexpr unsigned UNBOUNDED = UINT_MAX;

        Particle(const std::string &name, particleKind kind) : SchemaComponent(name), m_particleKind(kind), m_minOccurs(1), m_maxOccurs(1) { }
        virtual ~Particle() { }

        particleKind getParticleKind() const { return m_particleKind; }
        unsigned getMinOccurs() const { return m_minOccurs; }
        unsigned getMaxOccurs() const { return m_maxOccurs; }

        //
        // Throws ParseException when max is lower than min
        void setOccurs(unsigned minOccurs, unsigned maxOccurs);

        bool isOptional() const { return m_minOccurs == 0; }
        bool isSingle() const { return m_maxOccurs == 1; }
        bool isUnbounded() const { return m_maxOccurs == UNBOUNDED; }
        bool isOccursAllowed(unsigned occurs) const { return m_maxOccurs == UNBOUNDED || occurs <= m_maxOccurs; }

        //
        // True when the particle can match an empty run of children
        virtual bool isEmptiable() const { return m_minOccurs == 0; }

        static unsigned getOccursFromString(const std::string &value, const std::string &attrName);


    protected:

        particleKind m_particleKind;
        unsigned m_minOccurs;
        unsigned m_maxOccurs;
};

}

#endif // _XSDBIND_PARTICLE_HPP_
