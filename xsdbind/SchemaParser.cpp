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


#include <boost/property_tree/xml_parser.hpp>
#include "SchemaParser.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"

using namespace xsdbind;


SchemaParser::SchemaParser(const std::shared_ptr<SchemaRegistry> &pRegistry) :
    m_pRegistry(pRegistry), m_mode(ValidationContext::strict), m_xsd11(false)
{
}


bool SchemaParser::parse(const std::string &filename, const std::map<std::string, std::string> &params)
{
    pt::ptree xsdTree;
    m_filename = filename;
    try
    {
        pt::read_xml(filename, xsdTree, pt::xml_parser::trim_whitespace | pt::xml_parser::no_comments);
    }
    catch (const std::exception &e)
    {
        std::string xmlError = e.what();
        m_message = "Unable to read/parse file. Check that file is formatted correctly. Error = " + xmlError;
        return false;
    }
    return doParseTree(xsdTree, params);
}


bool SchemaParser::parse(std::istream &in, const std::map<std::string, std::string> &params)
{
    pt::ptree xsdTree;
    m_filename.clear();
    try
    {
        pt::read_xml(in, xsdTree, pt::xml_parser::trim_whitespace | pt::xml_parser::no_comments);
    }
    catch (const std::exception &e)
    {
        std::string xmlError = e.what();
        m_message = "Unable to read/parse the schema stream. Error = " + xmlError;
        return false;
    }
    return doParseTree(xsdTree, params);
}


bool SchemaParser::doParseTree(const pt::ptree &xsdTree, const std::map<std::string, std::string> &params)
{
    bool rc = true;
    m_message.clear();
    m_status.clear();
    try
    {
        readParameters(params);
        doParse(xsdTree);
    }
    catch (ParseException &pe)
    {
        if (!m_filename.empty())
            pe.addFilename(m_filename);
        m_message = "The following error was detected while parsing the schema: " + static_cast<std::string>(pe.what());
        rc = false;
    }
    catch (const ValueException &ve)
    {
        m_message = "Invalid schema parameter: " + static_cast<std::string>(ve.what());
        rc = false;
    }
    return rc;
}


void SchemaParser::readParameters(const std::map<std::string, std::string> &params)
{
    auto it = params.find("log_level");
    if (it != params.end())
    {
        setLogLevel(it->second);
    }

    m_mode = ValidationContext::strict;
    it = params.find("validation");
    if (it != params.end())
    {
        try
        {
            m_mode = ValidationContext::getModeFromString(it->second);
        }
        catch (const ValueException &e)
        {
            throw(ParseException(e.what()));
        }
    }

    m_xsd11 = false;
    it = params.find("xsd_version");
    if (it != params.end())
    {
        if (it->second == "1.1")
            m_xsd11 = true;
        else if (it->second != "1.0")
            throw(ParseException("Invalid xsd_version '" + it->second + "', expected 1.0 or 1.1"));
    }

    getLogger()->debug("Schema parameters: validation={}, xsd_version={}", ValidationContext::getModeString(m_mode), m_xsd11 ? "1.1" : "1.0");
}
