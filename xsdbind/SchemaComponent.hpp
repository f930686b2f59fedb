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

#ifndef _XSDBIND_SCHEMACOMPONENT_HPP_
#define _XSDBIND_SCHEMACOMPONENT_HPP_

#include <memory>
#include <string>
#include "Exports.hpp"

namespace xsdbind
{

//
// Issued by the registry once per completed build pass. Checks compare tokens by identity,
// holding the token keeps its address from being reused by a later pass.
struct XSDBIND_DECL_EXPORT BuildToken
{
    BuildToken(unsigned _generation) : generation(_generation) { }
    const unsigned generation;
};


class XSDBIND_DECL_EXPORT SchemaComponent
{
    public:

        enum validity
        {
            notKnown = 0,
            valid,
            invalid
        };

        SchemaComponent(const std::string &name) : m_name(name), m_global(false), m_built(false), m_checkInProgress(false), m_validity(notKnown) { }
        virtual ~SchemaComponent() { }

        const std::string &getName() const { return m_name; }
        void setName(const std::string &name) { m_name = name; }
        bool isGlobal() const { return m_global; }
        void setGlobal(bool global) { m_global = global; }
        bool isBuilt() const { return m_built; }
        void setBuilt(bool built) { m_built = built; }
        const std::string &getBuildError() const { return m_buildError; }
        bool hasBuildError() const { return !m_buildError.empty(); }
        void setBuildError(const std::string &msg) { m_buildError = msg; }

        //
        // Validity of the component and everything it references. Computed once per build
        // pass; a check that re-enters a component still being checked answers notKnown.
        validity check(const std::shared_ptr<const BuildToken> &pToken) const;
        bool isChecked(const std::shared_ptr<const BuildToken> &pToken) const { return m_pCheckedToken == pToken && !m_checkInProgress; }
        validity getValidity() const { return m_validity; }
        static const char *getValidityString(validity v);

        virtual std::string getDescription() const = 0;


    protected:

        virtual validity doCheck(const std::shared_ptr<const BuildToken> &pToken) const { return valid; }
        static validity combine(validity current, validity referenced) { return (referenced == invalid) ? invalid : current; }


    protected:

        std::string m_name;
        bool m_global;
        bool m_built;
        std::string m_buildError;


    private:

        mutable std::shared_ptr<const BuildToken> m_pCheckedToken;
        mutable bool m_checkInProgress;
        mutable validity m_validity;
};

}

#endif // _XSDBIND_SCHEMACOMPONENT_HPP_
