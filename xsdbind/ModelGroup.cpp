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


#include <algorithm>
#include "ModelGroup.hpp"
#include "ElementDecl.hpp"
#include "Exceptions.hpp"

using namespace xsdbind;

// Nesting deeper than this can only come from a circular group reference left by a lax build
static const unsigned MAX_GROUP_DEPTH = 256;


ModelGroup::ModelGroup(const std::string &name, modelKind model) :
    Particle(name, groupParticle), m_model(model), m_pRef(nullptr)
{
}


std::string ModelGroup::getDescription() const
{
    std::string desc = m_name.empty() ? std::string(getModelString(getModel())) : "group '" + m_name + "'";
    if (isRef())
        desc = "group reference to '" + m_refName + "'";
    return desc;
}


const char *ModelGroup::getModelString(modelKind model)
{
    const char *result = "sequence";
    if (model == choiceModel)
        result = "choice";
    else if (model == allModel)
        result = "all";
    return result;
}


ModelGroup::modelKind ModelGroup::getModelFromString(const std::string &model)
{
    modelKind result;
    if (model == "sequence")     result = sequenceModel;
    else if (model == "choice")  result = choiceModel;
    else if (model == "all")     result = allModel;
    else
        throw(ParseException("Invalid model group '" + model + "'"));
    return result;
}


bool ModelGroup::isEmptiable() const
{
    return m_minOccurs == 0 || isModelEmptiable();
}


bool ModelGroup::isModelEmptiable() const
{
    const ModelGroup *pTarget = getTarget();
    if (pTarget->m_particles.empty())
        return true;

    if (pTarget->m_model == choiceModel)
    {
        return std::any_of(pTarget->m_particles.begin(), pTarget->m_particles.end(),
            [](const std::shared_ptr<Particle> &pParticle) { return pParticle->isEmptiable(); });
    }
    return std::all_of(pTarget->m_particles.begin(), pTarget->m_particles.end(),
        [](const std::shared_ptr<Particle> &pParticle) { return pParticle->isEmptiable(); });
}


const std::vector<const Particle *> &ModelGroup::getLeafParticles() const
{
    return m_leafParticles.get([this]()
    {
        std::vector<const Particle *> leaves;
        collectLeafParticles(leaves, 0);
        return leaves;
    });
}


void ModelGroup::collectLeafParticles(std::vector<const Particle *> &leaves, unsigned depth) const
{
    if (depth > MAX_GROUP_DEPTH)
        return;

    for (auto &pParticle : getTarget()->m_particles)
    {
        if (pParticle->getParticleKind() == groupParticle)
            static_cast<const ModelGroup *>(pParticle.get())->collectLeafParticles(leaves, depth + 1);
        else
            leaves.push_back(pParticle.get());
    }
}


void ModelGroup::getFirstNames(const Particle *pParticle, std::vector<std::string> &names)
{
    auto addName = [&names](const std::string &name)
    {
        if (std::find(names.begin(), names.end(), name) == names.end())
            names.push_back(name);
    };

    if (pParticle->getParticleKind() == elementParticle)
    {
        addName(static_cast<const ElementDecl *>(pParticle)->getTarget()->getName());
    }
    else if (pParticle->getParticleKind() == wildcardParticle)
    {
        addName("*");
    }
    else
    {
        const ModelGroup *pTarget = static_cast<const ModelGroup *>(pParticle)->getTarget();
        for (auto &pChild : pTarget->m_particles)
        {
            std::vector<std::string> childNames;
            getFirstNames(pChild.get(), childNames);
            for (auto &name : childNames)
                addName(name);

            //
            // A sequence stops at its first member that must match something
            if (pTarget->m_model == sequenceModel && !pChild->isEmptiable())
                break;
        }
    }
}


SchemaComponent::validity ModelGroup::doCheck(const std::shared_ptr<const BuildToken> &pToken) const
{
    validity result = valid;
    if (m_pRef != nullptr)
        result = combine(result, m_pRef->check(pToken));
    for (auto &pParticle : m_particles)
        result = combine(result, pParticle->check(pToken));
    return result;
}
