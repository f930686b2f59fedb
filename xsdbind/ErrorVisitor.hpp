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

#ifndef _XSDBIND_ERRORVISITOR_HPP_
#define _XSDBIND_ERRORVISITOR_HPP_

#include <vector>
#include "ValidationError.hpp"
#include "Exports.hpp"

namespace xsdbind
{

//
// Receives instance errors in the order they are found, while decode or encode is still
// running. Nothing is buffered on the way to the visitor.
class XSDBIND_DECL_EXPORT IErrorVisitor
{
    public:

        virtual ~IErrorVisitor() { }
        virtual void visitError(const ValidationError &error) = 0;
};


class XSDBIND_DECL_EXPORT ErrorCollector : public IErrorVisitor
{
    public:

        ErrorCollector() { }
        virtual ~ErrorCollector() { }
        virtual void visitError(const ValidationError &error) { m_errors.push_back(error); }
        const std::vector<ValidationError> &getErrors() const { return m_errors; }
        size_t getNumErrors() const { return m_errors.size(); }
        bool empty() const { return m_errors.empty(); }
        void clear() { m_errors.clear(); }


    private:

        std::vector<ValidationError> m_errors;
};

}

#endif // _XSDBIND_ERRORVISITOR_HPP_
