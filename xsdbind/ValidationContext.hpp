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

#ifndef _XSDBIND_VALIDATIONCONTEXT_HPP_
#define _XSDBIND_VALIDATIONCONTEXT_HPP_

#include <map>
#include <string>
#include <vector>
#include "ValidationError.hpp"
#include "ErrorVisitor.hpp"
#include "Exports.hpp"

namespace xsdbind
{

class SchemaRegistry;
class IConverter;

//
// Per call working state of a decode or encode run. Components are immutable and shared,
// everything that changes while walking an instance lives here.
class XSDBIND_DECL_EXPORT ValidationContext
{
    public:

        enum validationMode
        {
            strict = 0,     // raise on the first error
            lax,            // report every error to the visitor and keep going
            skip            // no checks, best effort result
        };

        ValidationContext(const SchemaRegistry &registry, validationMode mode, IErrorVisitor *pVisitor, const IConverter &converter, bool useDefaults = true);

        //
        // A trial context shares the parent's registry, converter and path but collects errors into
        // pVisitor, in lax mode unless told otherwise, so a caller can try an alternative
        // without committing to it.
        ValidationContext(const ValidationContext &parent, IErrorVisitor *pVisitor, validationMode mode = lax);

        validationMode getMode() const { return m_mode; }
        bool isSkip() const { return m_mode == skip; }
        bool isStrict() const { return m_mode == strict; }
        const SchemaRegistry &getRegistry() const { return m_registry; }
        const IConverter &getConverter() const { return m_converter; }
        bool useDefaults() const { return m_useDefaults; }
        bool isUnordered() const { return m_unordered; }
        void setUnordered(bool unordered) { m_unordered = unordered; }

        //
        // Strict mode throws the exception matching the error kind, lax mode hands the error
        // to the visitor, skip mode drops it.
        void reportError(ValidationError error);
        size_t getNumErrors() const { return m_numErrors; }

        void pushPath(const std::string &step) { m_path.push_back(step); }
        void popPath() { m_path.pop_back(); }
        std::string getPath() const;

        //
        // Namespace declarations of the instance elements being walked, innermost last. QName
        // valued attributes such as xsi:type are resolved against them.
        void pushNamespaces(const std::map<std::string, std::string> &nsMap) { m_namespaces.push_back(&nsMap); }
        void popNamespaces() { m_namespaces.pop_back(); }
        bool resolvePrefix(const std::string &prefix, std::string &uri) const;

        static const char *getModeString(validationMode mode);
        static validationMode getModeFromString(const std::string &mode);


    private:

        const SchemaRegistry &m_registry;
        validationMode m_mode;
        IErrorVisitor *m_pVisitor;
        const IConverter &m_converter;
        bool m_useDefaults;
        bool m_unordered;
        size_t m_numErrors;
        std::vector<std::string> m_path;
        std::vector<const std::map<std::string, std::string> *> m_namespaces;
};


class XSDBIND_DECL_EXPORT PathScope
{
    public:

        PathScope(ValidationContext &ctx, const std::string &step) : m_ctx(ctx) { m_ctx.pushPath(step); }
        ~PathScope() { m_ctx.popPath(); }


    private:

        ValidationContext &m_ctx;
};


class XSDBIND_DECL_EXPORT InstanceNamespaceScope
{
    public:

        InstanceNamespaceScope(ValidationContext &ctx, const std::map<std::string, std::string> &nsMap) : m_ctx(ctx) { m_ctx.pushNamespaces(nsMap); }
        ~InstanceNamespaceScope() { m_ctx.popNamespaces(); }


    private:

        ValidationContext &m_ctx;
};

}

#endif // _XSDBIND_VALIDATIONCONTEXT_HPP_
