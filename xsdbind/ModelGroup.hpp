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


#ifndef _XSDBIND_MODELGROUP_HPP_
#define _XSDBIND_MODELGROUP_HPP_

#include <memory>
#include <string>
#include <vector>
#include "Particle.hpp"
#include "MemoValue.hpp"
#include "Exports.hpp"

namespace xsdbind
{

class ElementDecl;

//
// sequence, choice or all over an ordered list of particles. A group reference carries its own
// occurrence range and points at the global named group holding the particles.
class XSDBIND_DECL_EXPORT ModelGroup : public Particle
{
    public:

        enum modelKind
        {
            sequenceModel = 0,
            choiceModel,
            allModel
        };

        ModelGroup(const std::string &name, modelKind model = sequenceModel);
        virtual ~ModelGroup() { }
        virtual std::string getDescription() const;

        modelKind getModel() const { return getTarget()->m_model; }
        void setModel(modelKind model) { m_model = model; }
        static const char *getModelString(modelKind model);
        static modelKind getModelFromString(const std::string &model);

        void addParticle(const std::shared_ptr<Particle> &pParticle) { m_particles.push_back(pParticle); }
        const std::vector<std::shared_ptr<Particle>> &getParticles() const { return getTarget()->m_particles; }
        bool isEmpty() const { return getTarget()->m_particles.empty(); }

        const std::string &getRefName() const { return m_refName; }
        void setRefName(const std::string &refName) { m_refName = refName; }
        bool isRef() const { return !m_refName.empty(); }
        void setRef(const ModelGroup *pRef) { m_pRef = pRef; }
        const ModelGroup *getTarget() const { return (m_pRef != nullptr) ? m_pRef : this; }

        virtual bool isEmptiable() const;

        //
        // True when one run of the model can match no children, ignoring the group's own minOccurs
        bool isModelEmptiable() const;

        //
        // Element and wildcard particles reachable without crossing an element, in declaration
        // order. Computed on first use.
        const std::vector<const Particle *> &getLeafParticles() const;

        //
        // Names that can start a match of the given particle. A wildcard is reported as '*'.
        static void getFirstNames(const Particle *pParticle, std::vector<std::string> &names);


    protected:

        virtual validity doCheck(const std::shared_ptr<const BuildToken> &pToken) const;
        void collectLeafParticles(std::vector<const Particle *> &leaves, unsigned depth) const;


    private:

        modelKind m_model;
        std::vector<std::shared_ptr<Particle>> m_particles;
        std::string m_refName;
        const ModelGroup *m_pRef;
        MemoValue<std::vector<const Particle *>> m_leafParticles;
};

}

#endif // _XSDBIND_MODELGROUP_HPP_
