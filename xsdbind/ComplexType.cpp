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
#include <limits>
#include <map>
#include "ComplexType.hpp"
#include "SimpleType.hpp"
#include "ElementDecl.hpp"
#include "Wildcard.hpp"
#include "ContentMatcher.hpp"
#include "SchemaRegistry.hpp"
#include "ValidationContext.hpp"
#include "XmlElement.hpp"
#include "Exceptions.hpp"
#include "Utils.hpp"

using namespace xsdbind;

static const unsigned MAX_COLLAPSE_DEPTH = 256;
static const size_t NO_PENDING = std::numeric_limits<size_t>::max();


ComplexType::ComplexType(const std::string &name) :
    SchemaType(name), m_pSimpleContent(nullptr), m_attributeGroup(""), m_mixed(false), m_abstract(false)
{
}


std::string ComplexType::getDescription() const
{
    return m_name.empty() ? std::string("anonymous complexType") : "complexType '" + m_name + "'";
}


void ComplexType::setLocalSimpleContent(const std::shared_ptr<SimpleType> &pSimpleType)
{
    m_pLocalSimpleContent = pSimpleType;
    m_pSimpleContent = pSimpleType.get();
}


bool ComplexType::isEmptyContent() const
{
    return m_pSimpleContent == nullptr && (!m_pContentGroup || m_pContentGroup->isEmpty());
}


bool ComplexType::isSingleParticle() const
{
    const Particle *pParticle = m_pContentGroup.get();
    while (pParticle != nullptr && pParticle->getMaxOccurs() <= 1)
    {
        if (pParticle->getParticleKind() == Particle::elementParticle)
            return true;
        if (pParticle->getParticleKind() != Particle::groupParticle)
            break;

        const std::vector<std::shared_ptr<Particle>> &particles = static_cast<const ModelGroup *>(pParticle)->getParticles();
        pParticle = (particles.size() == 1) ? particles[0].get() : nullptr;
    }
    return false;
}


const ElementDecl *ComplexType::findChildDecl(const std::string &name, bool matchLocalName) const
{
    if (!m_pContentGroup)
        return nullptr;

    const std::vector<const Particle *> &leaves = m_pContentGroup->getLeafParticles();
    for (auto pLeaf : leaves)
    {
        if (pLeaf->getParticleKind() == Particle::elementParticle)
        {
            const ElementDecl *pTarget = static_cast<const ElementDecl *>(pLeaf)->getTarget();
            if (pTarget->getName() == name)
                return pTarget;
        }
    }

    if (matchLocalName && getNamespace(name).empty())
    {
        for (auto pLeaf : leaves)
        {
            if (pLeaf->getParticleKind() == Particle::elementParticle)
            {
                const ElementDecl *pTarget = static_cast<const ElementDecl *>(pLeaf)->getTarget();
                if (getLocalName(pTarget->getName()) == name)
                    return pTarget;
            }
        }
    }
    return nullptr;
}


const ElementDecl *ComplexType::resolveChildDecl(const std::string &name, ValidationContext &ctx, bool &skipContents, bool matchLocalName) const
{
    skipContents = false;
    const ElementDecl *pDecl = findChildDecl(name, matchLocalName);
    if (pDecl != nullptr || !m_pContentGroup)
        return pDecl;

    const SchemaRegistry &registry = ctx.getRegistry();
    const std::vector<const Particle *> &leaves = m_pContentGroup->getLeafParticles();
    for (auto pLeaf : leaves)
    {
        if (pLeaf->getParticleKind() == Particle::elementParticle)
        {
            for (auto pMember : registry.getSubstitutes(static_cast<const ElementDecl *>(pLeaf)->getTarget()->getName()))
            {
                if (pMember->getName() == name)
                    return pMember;
            }
        }
    }

    for (auto pLeaf : leaves)
    {
        if (pLeaf->getParticleKind() != Particle::wildcardParticle)
            continue;

        const Wildcard *pWildcard = static_cast<const Wildcard *>(pLeaf);
        if (!pWildcard->isNameAllowed(name))
            continue;

        const ElementDecl *pGlobal = registry.getElement(name);
        if (pWildcard->getProcessContents() == Wildcard::skipContents)
        {
            skipContents = true;
            return registry.getAnyElement();
        }
        if (pGlobal != nullptr)
            return pGlobal;
        if (pWildcard->getProcessContents() == Wildcard::laxContents)
            return registry.getAnyElement();
    }
    return nullptr;
}


size_t ComplexType::getLeafIndex(const ElementDecl *pDecl, const std::string &tag, const SchemaRegistry &registry) const
{
    const std::vector<const Particle *> &leaves = m_pContentGroup->getLeafParticles();
    for (size_t i = 0; i < leaves.size(); ++i)
    {
        if (leaves[i]->getParticleKind() == Particle::elementParticle)
        {
            const ElementDecl *pTarget = static_cast<const ElementDecl *>(leaves[i])->getTarget();
            if (pTarget == pDecl)
                return i;

            const std::vector<const ElementDecl *> &members = registry.getSubstitutes(pTarget->getName());
            if (std::find(members.begin(), members.end(), pDecl) != members.end())
                return i;
        }
        else if (static_cast<const Wildcard *>(leaves[i])->isNameAllowed(tag))
        {
            return i;
        }
    }
    return leaves.size();
}


size_t ComplexType::getFirstPending(const Particle *pParticle, const PendingChildren &pending, unsigned depth)
{
    if (pParticle->getParticleKind() != Particle::groupParticle)
    {
        auto it = pending.find(pParticle);
        return (it == pending.end() || it->second.empty()) ? NO_PENDING : it->second.front();
    }

    size_t first = NO_PENDING;
    if (depth < MAX_COLLAPSE_DEPTH)
    {
        for (auto &pMember : static_cast<const ModelGroup *>(pParticle)->getParticles())
            first = std::min(first, getFirstPending(pMember.get(), pending, depth + 1));
    }
    return first;
}


size_t ComplexType::collapseParticle(const Particle *pParticle, PendingChildren &pending, std::vector<size_t> &order, unsigned depth)
{
    size_t taken = 0;
    if (pParticle->getParticleKind() != Particle::groupParticle)
    {
        auto it = pending.find(pParticle);
        if (it == pending.end())
            return 0;
        std::deque<size_t> &queue = it->second;
        while (!queue.empty() && pParticle->isOccursAllowed(static_cast<unsigned>(taken + 1)))
        {
            order.push_back(queue.front());
            queue.pop_front();
            ++taken;
        }
        return taken;
    }

    if (depth >= MAX_COLLAPSE_DEPTH)
        return 0;

    const ModelGroup *pGroup = static_cast<const ModelGroup *>(pParticle);
    const std::vector<std::shared_ptr<Particle>> &members = pGroup->getParticles();
    for (unsigned occurs = 1; pGroup->isOccursAllowed(occurs); ++occurs)
    {
        if (getFirstPending(pGroup, pending, depth) == NO_PENDING)
            break;

        size_t consumed = 0;
        if (pGroup->getModel() == ModelGroup::sequenceModel)
        {
            for (auto &pMember : members)
                consumed += collapseParticle(pMember.get(), pending, order, depth + 1);
        }
        else if (pGroup->getModel() == ModelGroup::choiceModel)
        {
            //
            // The alternative holding the earliest pending child is taken
            const Particle *pChosen = nullptr;
            size_t chosenFirst = NO_PENDING;
            for (auto &pMember : members)
            {
                size_t first = getFirstPending(pMember.get(), pending, depth + 1);
                if (first < chosenFirst)
                {
                    chosenFirst = first;
                    pChosen = pMember.get();
                }
            }
            if (pChosen != nullptr)
                consumed = collapseParticle(pChosen, pending, order, depth + 1);
        }
        else
        {
            //
            // all: members in the order their children were listed
            std::vector<const Particle *> sorted;
            for (auto &pMember : members)
                sorted.push_back(pMember.get());
            std::stable_sort(sorted.begin(), sorted.end(), [&pending, depth](const Particle *a, const Particle *b)
                { return getFirstPending(a, pending, depth + 1) < getFirstPending(b, pending, depth + 1); });
            for (auto pMember : sorted)
                consumed += collapseParticle(pMember, pending, order, depth + 1);
        }

        if (consumed == 0)
            break;
        taken += consumed;
    }
    return taken;
}


void ComplexType::checkDerivation() const
{
    if (m_pBaseType == nullptr || m_derivation == none || m_pBaseType->isSimple())
        return;

    const ComplexType *pBase = static_cast<const ComplexType *>(m_pBaseType);
    if (m_derivation == extension)
    {
        if (pBase->hasSimpleContent() && m_pContentGroup && !m_pContentGroup->isEmpty())
        {
            throw(ParseException("An extension of a type with simple content can't add child elements"));
        }
        if (!pBase->isEmptyContent() && m_pContentGroup && pBase->isMixed() != m_mixed)
        {
            throw(ParseException("An extension must have the same mixed content setting as its base type"));
        }
        return;
    }

    //
    // Restriction. Anything can restrict anyType.
    if (pBase->getBaseType() == nullptr || pBase->getName() == makeQName(XSD_NAMESPACE, "anyType"))
        return;

    if (m_mixed && !pBase->isMixed())
    {
        throw(ParseException("A restriction of an element only type can't have mixed content"));
    }

    if (pBase->isEmptyContent() && !isEmptyContent())
    {
        throw(ParseException("A restriction of a type with empty content can't add content"));
    }

    const ModelGroup *pOwnGroup = getContentGroup();
    const ModelGroup *pBaseGroup = pBase->getContentGroup();
    if (pOwnGroup != nullptr && pBaseGroup != nullptr && !pOwnGroup->isEmpty() && !pBaseGroup->isEmpty())
    {
        if (pOwnGroup->getModel() != pBaseGroup->getModel() && !isSingleParticle())
        {
            throw(ParseException(std::string("The restriction's content model kind '") + ModelGroup::getModelString(pOwnGroup->getModel()) +
                "' differs from the base content model kind '" + ModelGroup::getModelString(pBaseGroup->getModel()) + "'"));
        }
    }
}


SchemaComponent::validity ComplexType::doCheck(const std::shared_ptr<const BuildToken> &pToken) const
{
    validity result = valid;
    if (m_pBaseType != nullptr && m_pBaseType != this)
        result = combine(result, m_pBaseType->check(pToken));
    if (m_pSimpleContent != nullptr)
        result = combine(result, m_pSimpleContent->check(pToken));
    if (m_pContentGroup)
        result = combine(result, m_pContentGroup->check(pToken));
    result = combine(result, m_attributeGroup.check(pToken));
    return result;
}


void ComplexType::decodeContent(const XmlElement &elem, ValidationContext &ctx, ElementData &data, unsigned level) const
{
    const ModelGroup *pGroup = isEmptyContent() ? nullptr : m_pContentGroup.get();
    const std::vector<std::shared_ptr<XmlElement>> &children = elem.getChildren();

    if (children.empty())
    {
        if (m_mixed)
        {
            if (!elem.getText().empty())
                data.text = Value::makeString(elem.getText());
        }
        else if (!isAllWhitespace(elem.getText()))
        {
            ctx.reportError(ValidationError(ValidationError::validation, "character data not allowed, the element has element only content", getDescription(), elem.getText()));
        }

        //
        // Still run the matcher so that missing required children are reported
        if (pGroup != nullptr && !ctx.isSkip())
            ContentMatcher(ctx.getRegistry()).match(pGroup, std::vector<std::string>(), ctx);
        return;
    }

    std::vector<std::string> tags;
    std::map<std::string, unsigned> tagCounts;
    for (auto &pChild : children)
    {
        tags.push_back(pChild->getTag());
        ++tagCounts[pChild->getTag()];
    }

    std::vector<MatchPair> pairs = ContentMatcher(ctx.getRegistry()).match(pGroup, tags, ctx);
    std::vector<const MatchPair *> childPairs(children.size(), nullptr);
    for (auto &pair : pairs)
        childPairs[pair.childIndex] = &pair;

    bool groupSingle = (pGroup == nullptr) || pGroup->isSingle();
    unsigned cdataIndex = 1;
    auto addText = [&](const std::string &text)
    {
        if (!m_mixed)
        {
            if (!isAllWhitespace(text))
                ctx.reportError(ValidationError(ValidationError::validation, "character data between child elements not allowed", getDescription(), trimWhitespace(text)));
        }
        else if (!text.empty())
        {
            data.content.emplace_back(cdataIndex++, Value::makeString(text));
        }
    };

    addText(elem.getText());
    std::map<std::string, unsigned> seen;
    for (size_t i = 0; i < children.size(); ++i)
    {
        const XmlElement &child = *children[i];
        unsigned position = ++seen[child.getTag()];

        //
        // In skip mode children the matcher dropped are still decoded when a declaration fits
        MatchPair skipPair;
        const MatchPair *pPair = childPairs[i];
        if (pPair == nullptr && ctx.isSkip())
        {
            skipPair.pDecl = resolveChildDecl(child.getTag(), ctx, skipPair.skipContents, false);
            if (skipPair.pDecl != nullptr)
                pPair = &skipPair;
        }

        if (pPair != nullptr)
        {
            std::string step = getLocalName(child.getTag());
            if (tagCounts[child.getTag()] > 1)
                step += "[" + std::to_string(position) + "]";
            PathScope scope(ctx, step);

            Value value;
            if (pPair->skipContents)
            {
                ValidationContext skipCtx(ctx, nullptr, ValidationContext::skip);
                value = pPair->pDecl->decode(child, skipCtx, level + 1);
            }
            else
            {
                value = pPair->pDecl->decode(child, ctx, level + 1);
            }

            bool single = (pPair->pParticle == nullptr) || (groupSingle && pPair->pParticle->isSingle());
            data.content.emplace_back(child.getTag(), value, pPair->pDecl, single);
        }
        addText(child.getTail());
    }
}


void ComplexType::encodeContent(const ElementData &data, ValidationContext &ctx, XmlElement &elem, unsigned level) const
{
    if (!data.text.isNull())
    {
        std::string text = data.text.toLexical();
        if (m_mixed)
            elem.setText(text);
        else if (!isAllWhitespace(text))
            ctx.reportError(ValidationError(ValidationError::validation, "character data not allowed, the element has element only content", getDescription(), text));
    }

    struct EncodedChild
    {
        size_t order;
        std::shared_ptr<XmlElement> pElem;
    };
    std::vector<EncodedChild> encoded;

    for (auto &item : data.content)
    {
        if (item.isCData())
        {
            std::string text = item.value.toLexical();
            if (!m_mixed)
            {
                if (!isAllWhitespace(text))
                    ctx.reportError(ValidationError(ValidationError::validation, "character data not allowed, the element has element only content", getDescription(), text));
            }
            else if (encoded.empty())
            {
                elem.appendText(text);
            }
            else
            {
                encoded.back().pElem->appendTail(text);
            }
            continue;
        }

        bool skipContents = false;
        const ElementDecl *pDecl = resolveChildDecl(item.name, ctx, skipContents, true);
        if (pDecl == nullptr)
        {
            ctx.reportError(ValidationError(ValidationError::encode, "'" + item.name + "' does not match any declared element", getDescription(), item.value.toString()));
            continue;
        }

        std::string tag = pDecl->getName().empty() ? item.name : pDecl->getName();
        PathScope scope(ctx, getLocalName(tag));
        std::shared_ptr<XmlElement> pChild;
        if (skipContents)
        {
            ValidationContext skipCtx(ctx, nullptr, ValidationContext::skip);
            pChild = pDecl->encode(item.value, skipCtx, level + 1, tag);
        }
        else
        {
            pChild = pDecl->encode(item.value, ctx, level + 1, tag);
        }
        encoded.push_back({getLeafIndex(pDecl, tag, ctx.getRegistry()), pChild});
    }

    //
    // Children follow the content model: the model is walked and every particle takes the next
    // children pending for it, so repeated groups interleave their members again. Text runs
    // travel with the child they follow.
    const ModelGroup *pGroup = isEmptyContent() ? nullptr : m_pContentGroup.get();
    if (!ctx.isUnordered() && pGroup != nullptr && encoded.size() > 1)
    {
        const std::vector<const Particle *> &leaves = pGroup->getLeafParticles();
        PendingChildren pending;
        for (size_t i = 0; i < encoded.size(); ++i)
        {
            if (encoded[i].order < leaves.size())
                pending[leaves[encoded[i].order]].push_back(i);
        }

        std::vector<size_t> order;
        collapseParticle(pGroup, pending, order, 0);

        std::vector<bool> placed(encoded.size(), false);
        for (auto idx : order)
            placed[idx] = true;
        for (size_t i = 0; i < encoded.size(); ++i)
        {
            if (!placed[i])
                order.push_back(i);
        }

        std::vector<EncodedChild> collapsed;
        for (auto idx : order)
            collapsed.push_back(encoded[idx]);
        encoded.swap(collapsed);
    }

    std::vector<std::string> tags;
    for (auto &child : encoded)
    {
        elem.addChild(child.pElem);
        tags.push_back(child.pElem->getTag());
    }

    if (!ctx.isUnordered() && !ctx.isSkip())
    {
        ContentMatcher(ctx.getRegistry()).match(pGroup, tags, ctx);
    }
}
