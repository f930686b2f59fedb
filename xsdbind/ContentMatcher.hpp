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


#ifndef _XSDBIND_CONTENTMATCHER_HPP_
#define _XSDBIND_CONTENTMATCHER_HPP_

#include <string>
#include <vector>
#include "Particle.hpp"
#include "Exports.hpp"

namespace xsdbind
{

class SchemaRegistry;
class ModelGroup;
class ElementDecl;
class Wildcard;
class ValidationContext;

//
// A child element bound to the particle that accepted it. pDecl is the declaration used to
// process the child: the element particle's target, a substitution group member, or for
// wildcards the global declaration (or the registry's any element).
struct XSDBIND_DECL_EXPORT MatchPair
{
    MatchPair() : pParticle(nullptr), pDecl(nullptr), childIndex(0), skipContents(false) { }
    const Particle *pParticle;
    const ElementDecl *pDecl;
    size_t childIndex;
    bool skipContents;
};


//
// Aligns an ordered list of child tags against a content model. Holds no state between calls,
// every call works on its own cursor and buffers so one matcher serves any number of threads.
class XSDBIND_DECL_EXPORT ContentMatcher
{
    public:

        ContentMatcher(const SchemaRegistry &registry) : m_registry(registry) { }

        //
        // Matches the tags against the group (null for empty content), reports every content
        // error to the context and returns the pairs for the children that were matched, in
        // child order. After a failure at a child, the child is reported and dropped and the
        // match is retried so that the remaining children still get paired.
        std::vector<MatchPair> match(const ModelGroup *pGroup, const std::vector<std::string> &tags, ValidationContext &ctx) const;

        //
        // Matches without reporting, true when the whole list is accepted
        bool isMatch(const ModelGroup *pGroup, const std::vector<std::string> &tags) const;


    protected:

        struct StepResult
        {
            StepResult(bool _ok, size_t _cursor) : ok(_ok), cursor(_cursor) { }
            bool ok;
            size_t cursor;
            std::vector<std::string> expected;
        };

        StepResult matchParticle(const Particle *pParticle, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const;
        StepResult matchLeaf(const Particle *pParticle, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const;
        StepResult matchGroup(const ModelGroup *pGroup, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const;
        StepResult matchSequence(const ModelGroup *pModel, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const;
        StepResult matchChoice(const ModelGroup *pModel, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const;
        StepResult matchAll(const ModelGroup *pModel, const std::vector<std::string> &tags, size_t cursor, std::vector<MatchPair> &pairs) const;

        bool matchElementTag(const ElementDecl *pElement, const std::string &tag, MatchPair &pair) const;
        bool matchWildcardTag(const Wildcard *pWildcard, const std::string &tag, MatchPair &pair) const;
        static std::string formatExpected(const std::vector<std::string> &expected);
        static void addExpected(std::vector<std::string> &expected, const std::vector<std::string> &names);


    private:

        const SchemaRegistry &m_registry;
};

}

#endif // _XSDBIND_CONTENTMATCHER_HPP_
