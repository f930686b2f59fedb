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


#ifndef _XSDBIND_SCHEMAPARSER_HPP_
#define _XSDBIND_SCHEMAPARSER_HPP_

#include <istream>
#include <map>
#include <memory>
#include <string>
#include <boost/property_tree/ptree.hpp>

#include "SchemaRegistry.hpp"
#include "ValidationContext.hpp"
#include "Status.hpp"
#include "Exports.hpp"

namespace pt = boost::property_tree;

namespace xsdbind
{

class XSDBIND_DECL_EXPORT SchemaParser
{
    public:

        SchemaParser(const std::shared_ptr<SchemaRegistry> &pRegistry);
        virtual ~SchemaParser() { }
        bool parse(const std::string &filename, const std::map<std::string, std::string> &params);
        bool parse(std::istream &in, const std::map<std::string, std::string> &params);
        const std::string &getLastMessage() const { return m_message; }
        const Status &getStatus() const { return m_status; }
        ValidationContext::validationMode getMode() const { return m_mode; }
        bool isXSD11() const { return m_xsd11; }


    protected:

        virtual void doParse(const pt::ptree &xsdTree) = 0;
        bool doParseTree(const pt::ptree &xsdTree, const std::map<std::string, std::string> &params);
        void readParameters(const std::map<std::string, std::string> &params);


    protected:

        std::shared_ptr<SchemaRegistry> m_pRegistry;
        ValidationContext::validationMode m_mode;
        bool m_xsd11;
        std::string m_filename;
        Status m_status;                // problems recovered from in lax and skip modes
        std::string m_message;          // a place where a message can be stored and retrieved, such as for a parse error
};

}

#endif // _XSDBIND_SCHEMAPARSER_HPP_
