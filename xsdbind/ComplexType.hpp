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


#ifndef _XSDBIND_COMPLEXTYPE_HPP_
#define _XSDBIND_COMPLEXTYPE_HPP_

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "SchemaType.hpp"
#include "AttributeGroup.hpp"
#include "ModelGroup.hpp"
#include "Converter.hpp"
#include "Exports.hpp"

namespace xsdbind
{

class SimpleType;
class SchemaRegistry;
class ElementDecl;
class XmlElement;
class ValidationContext;

//
// Element content type: either simple content (a SimpleType for the text) or a model group,
// plus the attribute uses. No group and no simple content means empty content.
class XSDBIND_DECL_EXPORT ComplexType : public SchemaType
{
    public:

        ComplexType(const std::string &name);
        virtual ~ComplexType() { }
        virtual std::string getDescription() const;

        virtual bool isSimple() const { return false; }
        virtual bool hasSimpleContent() const { return m_pSimpleContent != nullptr; }
        virtual const SimpleType *getContentSimpleType() const { return m_pSimpleContent; }
        void setSimpleContent(const SimpleType *pSimpleType) { m_pSimpleContent = pSimpleType; }
        void setLocalSimpleContent(const std::shared_ptr<SimpleType> &pSimpleType);

        const ModelGroup *getContentGroup() const { return m_pContentGroup.get(); }
        const std::shared_ptr<ModelGroup> &getContentGroupPtr() const { return m_pContentGroup; }
        void setContentGroup(const std::shared_ptr<ModelGroup> &pGroup) { m_pContentGroup = pGroup; }
        bool isEmptyContent() const;

        AttributeGroup &getAttributeGroup() { return m_attributeGroup; }
        const AttributeGroup &getAttributeGroup() const { return m_attributeGroup; }

        bool isMixed() const { return m_mixed; }
        void setMixed(bool mixed) { m_mixed = mixed; }
        bool isAbstract() const { return m_abstract; }
        void setAbstract(bool isAbstract) { m_abstract = isAbstract; }

        //
        // Content with a single element particle at most once, optionally wrapped in groups
        // that also occur at most once
        bool isSingleParticle() const;

        //
        // Child declaration by qualified name. Encoding sets matchLocalName so value keys given
        // without their namespace still find a qualified child.
        const ElementDecl *findChildDecl(const std::string &name, bool matchLocalName = false) const;

        //
        // Build time derivation checks against the base type, throws ParseException
        void checkDerivation() const;

        void decodeContent(const XmlElement &elem, ValidationContext &ctx, ElementData &data, unsigned level) const;
        void encodeContent(const ElementData &data, ValidationContext &ctx, XmlElement &elem, unsigned level) const;


    protected:

        virtual validity doCheck(const std::shared_ptr<const BuildToken> &pToken) const;
        size_t getLeafIndex(const ElementDecl *pDecl, const std::string &tag, const SchemaRegistry &registry) const;

        //
        // Encoded children waiting for their leaf particle, as indexes in the order the value listed them
        typedef std::map<const Particle *, std::deque<size_t>> PendingChildren;
        static size_t getFirstPending(const Particle *pParticle, const PendingChildren &pending, unsigned depth);
        static size_t collapseParticle(const Particle *pParticle, PendingChildren &pending, std::vector<size_t> &order, unsigned depth);
        const ElementDecl *resolveChildDecl(const std::string &name, ValidationContext &ctx, bool &skipContents, bool matchLocalName) const;


    private:

        const SimpleType *m_pSimpleContent;
        std::shared_ptr<SimpleType> m_pLocalSimpleContent;
        std::shared_ptr<ModelGroup> m_pContentGroup;
        AttributeGroup m_attributeGroup;
        bool m_mixed;
        bool m_abstract;
};

}

#endif // _XSDBIND_COMPLEXTYPE_HPP_
