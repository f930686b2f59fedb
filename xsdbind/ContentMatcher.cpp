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
#include <numeric>
#include "ContentMatcher.hpp"
#include "ModelGroup.hpp"
#include "ElementDecl.hpp"
#include "Wildcard.hpp"
#include "SchemaRegistry.hpp"
#include "ValidationContext.hpp"

using namespace xsdbind;


std::vector<MatchPair> ContentMatcher::match(const ModelGroup *pGroup, const std::vector<std::string> &tags, ValidationContext &ctx) const
{
    std::vector<MatchPair> pairs;
    if (pGroup == nullptr)
    {
        for (auto &tag : tags)
        {
            ctx.reportError(ValidationError(ValidationError::validation, "unexpected tag '" + tag + "', the element has empty content", "", tag));
        }
        return pairs;
    }

    std::vector<size_t> active(tags.size());
    std::iota(active.begin(), active.end(), 0);
    std::vector<std::vector<std::string>> reported;

    for (;;)
    {
        std::vector<std::string> activeTags;
        for (auto idx : active)
            activeTags.push_back(tags[idx]);

        pairs.clear();
        StepResult result = matchParticle(pGroup, activeTags, 0, pairs);
        if (!result.ok)
        {
            bool atEnd = result.cursor >= activeTags.size();
            if (!atEnd || std::find(reported.begin(), reported.end(), result.expected) == reported.end())
            {
                ValidationError error(ValidationError::validation, formatExpected(result.expected), pGroup->getDescription());
                error.expected = result.expected;
                if (!atEnd)
                {
                    error.reason += ", found '" + activeTags[result.cursor] + "'";
                    error.value = activeTags[result.cursor];
                }
                ctx.reportError(error);
                reported.push_back(result.expected);
            }

            //
            // Drop the child that stopped the match and retry with the rest
            if (!atEnd)
            {
                active.erase(active.begin() + result.cursor);
                continue;
            }
        }
        else
        {
            for (size_t i = result.cursor; i < activeTags.size(); ++i)
            {
                ctx.reportError(ValidationError(ValidationError::validation, "unexpected tag '" + activeTags[i] + "'", pGroup->getDescription(), activeTags[i]));
            }
        }
        break;
    }

    for (auto &pair : pairs)
        pair.childIndex = active[pair.childIndex];
    return pairs;
}


bool ContentMatcher::isMatch(const ModelGroup *pGroup, const std::vector<std::string> &tags) const
{
    if (pGroup == nullptr)
        return tags.empty();

    std::vector<MatchPair> pairs;
    StepResult result = matchParticle(pGroup, tags, 0, pairs);
    return result.ok && result.cursor == tags.size();
}


ContentMatcher::StepResult ContentMatcher::matchParticle(const Particle *pParticle, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const
{
    if (pParticle->getParticleKind() == Particle::groupParticle)
        return matchGroup(static_cast<const ModelGroup *>(pParticle), tags, cursor, pairs);
    return matchLeaf(pParticle, tags, cursor, pairs);
}


ContentMatcher::StepResult ContentMatcher::matchLeaf(const Particle *pParticle, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const
{
    unsigned count = 0;
    size_t cur = cursor;
    while (cur < tags.size() && pParticle->isOccursAllowed(count + 1))
    {
        MatchPair pair;
        bool matched;
        if (pParticle->getParticleKind() == Particle::elementParticle)
            matched = matchElementTag(static_cast<const ElementDecl *>(pParticle), tags[cur], pair);
        else
            matched = matchWildcardTag(static_cast<const Wildcard *>(pParticle), tags[cur], pair);

        if (!matched)
            break;

        pair.pParticle = pParticle;
        pair.childIndex = cur;
        pairs.push_back(pair);
        ++cur;
        ++count;
    }

    StepResult result(count >= pParticle->getMinOccurs(), cur);
    if (!result.ok)
        ModelGroup::getFirstNames(pParticle, result.expected);
    return result;
}


ContentMatcher::StepResult ContentMatcher::matchGroup(const ModelGroup *pGroup, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const
{
    const ModelGroup *pModel = pGroup->getTarget();
    unsigned occurs = 0;
    size_t cur = cursor;

    while (pGroup->isOccursAllowed(occurs + 1))
    {
        size_t mark = pairs.size();
        StepResult cycle(false, cur);
        switch (pModel->getModel())
        {
            case ModelGroup::sequenceModel: cycle = matchSequence(pModel, tags, cur, pairs); break;
            case ModelGroup::choiceModel:   cycle = matchChoice(pModel, tags, cur, pairs);   break;
            case ModelGroup::allModel:      cycle = matchAll(pModel, tags, cur, pairs);      break;
        }

        if (!cycle.ok)
        {
            //
            // A repetition that fails before consuming anything just ends the group, once the
            // minimum is reached. A repetition that fails halfway is an error.
            if (occurs < pGroup->getMinOccurs() || cycle.cursor > cur)
                return cycle;
            pairs.resize(mark);
            break;
        }

        ++occurs;
        if (cycle.cursor == cur)
            break;
        cur = cycle.cursor;
    }
    return StepResult(true, cur);
}


ContentMatcher::StepResult ContentMatcher::matchSequence(const ModelGroup *pModel, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const
{
    size_t cur = cursor;
    std::vector<std::string> skipped;  // names still acceptable at cur from particles that matched nothing

    for (auto &pParticle : pModel->getParticles())
    {
        StepResult result = matchParticle(pParticle.get(), tags, cur, pairs);
        if (!result.ok)
        {
            if (result.cursor == cur)
            {
                addExpected(skipped, result.expected);
                result.expected = skipped;
            }
            return result;
        }

        if (result.cursor == cur)
        {
            std::vector<std::string> names;
            ModelGroup::getFirstNames(pParticle.get(), names);
            addExpected(skipped, names);
        }
        else
        {
            skipped.clear();
        }
        cur = result.cursor;
    }
    return StepResult(true, cur);
}


ContentMatcher::StepResult ContentMatcher::matchChoice(const ModelGroup *pModel, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const
{
    size_t mark = pairs.size();
    const Particle *pPartial = nullptr;
    const Particle *pEmpty = nullptr;

    //
    // Declaration order decides, the first alternative that consumes a child is taken
    for (auto &pParticle : pModel->getParticles())
    {
        StepResult result = matchParticle(pParticle.get(), tags, cursor, pairs);
        if (result.ok && result.cursor > cursor)
            return result;

        pairs.resize(mark);
        if (result.ok)
        {
            if (pEmpty == nullptr)
                pEmpty = pParticle.get();
        }
        else if (result.cursor > cursor && pPartial == nullptr)
        {
            pPartial = pParticle.get();
        }
    }

    if (pPartial != nullptr)
        return matchParticle(pPartial, tags, cursor, pairs);

    if (pEmpty != nullptr || pModel->getParticles().empty())
        return StepResult(true, cursor);

    StepResult result(false, cursor);
    for (auto &pParticle : pModel->getParticles())
    {
        std::vector<std::string> names;
        ModelGroup::getFirstNames(pParticle.get(), names);
        addExpected(result.expected, names);
    }
    return result;
}


ContentMatcher::StepResult ContentMatcher::matchAll(const ModelGroup *pModel, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const
{
    const std::vector<std::shared_ptr<Particle>> &particles = pModel->getParticles();
    std::vector<bool> matched(particles.size(), false);
    size_t cur = cursor;

    bool progressed = true;
    while (progressed && cur < tags.size())
    {
        progressed = false;
        for (size_t i = 0; i < particles.size(); ++i)
        {
            if (matched[i])
                continue;

            size_t mark = pairs.size();
            StepResult result = matchParticle(particles[i].get(), tags, cur, pairs);
            if (result.cursor > cur)
            {
                if (!result.ok)
                    return result;
                matched[i] = true;
                cur = result.cursor;
                progressed = true;
                break;
            }
            pairs.resize(mark);
        }
    }

    StepResult result(true, cur);
    for (size_t i = 0; i < particles.size(); ++i)
    {
        if (!matched[i] && !particles[i]->isEmptiable())
        {
            std::vector<std::string> names;
            ModelGroup::getFirstNames(particles[i].get(), names);
            addExpected(result.expected, names);
            result.ok = false;
        }
    }
    return result;
}


bool ContentMatcher::matchElementTag(const ElementDecl *pElement, const std::string &tag, MatchPair &pair) const
{
    const ElementDecl *pTarget = pElement->getTarget();
    if (tag == pTarget->getName() && !pTarget->isAbstract())
    {
        pair.pDecl = pTarget;
        return true;
    }

    for (auto pMember : m_registry.getSubstitutes(pTarget->getName()))
    {
        if (pMember->getName() == tag)
        {
            pair.pDecl = pMember;
            return true;
        }
    }
    return false;
}


bool ContentMatcher::matchWildcardTag(const Wildcard *pWildcard, const std::string &tag, MatchPair &pair) const
{
    if (!pWildcard->isNameAllowed(tag))
        return false;

    const ElementDecl *pGlobal = m_registry.getElement(tag);
    bool matched = true;
    switch (pWildcard->getProcessContents())
    {
        case Wildcard::strictContents:
            matched = pGlobal != nullptr;
            pair.pDecl = pGlobal;
            break;
        case Wildcard::laxContents:
            pair.pDecl = (pGlobal != nullptr) ? pGlobal : m_registry.getAnyElement();
            break;
        case Wildcard::skipContents:
            pair.pDecl = m_registry.getAnyElement();
            pair.skipContents = true;
            break;
    }
    return matched;
}


std::string ContentMatcher::formatExpected(const std::vector<std::string> &expected)
{
    std::string reason = "tag expected";
    if (expected.size() == 1)
    {
        reason += ": '" + expected[0] + "'";
    }
    else if (!expected.empty())
    {
        reason += ": one of ";
        for (size_t i = 0; i < expected.size(); ++i)
        {
            if (i != 0)
                reason += ", ";
            reason += "'" + expected[i] + "'";
        }
    }
    return reason;
}


void ContentMatcher::addExpected(std::vector<std::string> &expected, const std::vector<std::string> &names)
{
    for (auto &name : names)
    {
        if (std::find(expected.begin(), expected.end(), name) == expected.end())
            expected.push_back(name);
    }
}
