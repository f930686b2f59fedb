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


#ifndef _XSDBIND_WILDCARD_HPP_
#define _XSDBIND_WILDCARD_HPP_

#include <set>
#include <string>
#include "Particle.hpp"
#include "Exports.hpp"

namespace xsdbind
{

//
// xs:any and xs:anyAttribute. The namespace constraint is kept as parsed, ##targetNamespace
// and ##local are resolved against the schema's target namespace at construction.
class XSDBIND_DECL_EXPORT Wildcard : public Particle
{
    public:

        enum processContentsType
        {
            skipContents = 0,
            laxContents,
            strictContents
        };

        enum namespaceConstraint
        {
            anyNamespace = 0,
            otherNamespace,
            enumeratedNamespaces
        };

        Wildcard(const std::string &targetNamespace, bool isAttribute = false);
        virtual ~Wildcard() { }
        virtual std::string getDescription() const;

        //
        // Parses the namespace attribute ('##any', '##other' or a list of URIs, ##targetNamespace
        // and ##local). Throws ParseException on an invalid list.
        void setNamespace(const std::string &nsAttr);
        namespaceConstraint getConstraint() const { return m_constraint; }
        const std::set<std::string> &getNamespaces() const { return m_namespaces; }
        bool isNamespaceAllowed(const std::string &uri) const;
        bool isNameAllowed(const std::string &qname) const;

        processContentsType getProcessContents() const { return m_processContents; }
        void setProcessContents(processContentsType processContents) { m_processContents = processContents; }
        static processContentsType getProcessContentsFromString(const std::string &value);
        static const char *getProcessContentsString(processContentsType processContents);

        bool isAttributeWildcard() const { return m_isAttribute; }


    private:

        std::string m_targetNamespace;
        namespaceConstraint m_constraint;
        std::set<std::string> m_namespaces;
        processContentsType m_processContents;
        std::string m_nsAttr;
        bool m_isAttribute;
};

}

#endif // _XSDBIND_WILDCARD_HPP_
