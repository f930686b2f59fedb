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

#ifndef _XSDBIND_XSDREGEX_HPP_
#define _XSDBIND_XSDREGEX_HPP_

#include <regex>
#include <string>
#include "Exports.hpp"

namespace xsdbind
{

//
// A pattern facet expression compiled to std::regex. XSD patterns are implicitly anchored,
// so matching is done with regex_match.
class XSDBIND_DECL_EXPORT XSDRegex
{
    public:

        XSDRegex(const std::string &pattern);
        ~XSDRegex() { }

        bool isMatch(const std::string &text) const { return std::regex_match(text, m_regex); }
        const std::string &getPattern() const { return m_pattern; }
        const std::string &getTranslated() const { return m_translated; }

        static std::string translate(const std::string &pattern);


    protected:

        static std::string translateClass(const std::string &pattern, size_t &pos);
        static std::string translateClassEscape(const std::string &pattern, char c);


    private:

        std::string m_pattern;
        std::string m_translated;
        std::regex m_regex;
};

}

#endif // _XSDBIND_XSDREGEX_HPP_
