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


#ifndef _XSDBIND_UNITTESTS_HPP_
#define _XSDBIND_UNITTESTS_HPP_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <cppunit/extensions/HelperMacros.h>

#include "XMLSchema.hpp"
#include "Utils.hpp"

//
// Loads an inline schema, failing the test with the build message when the load fails
extern std::shared_ptr<xsdbind::XMLSchema> loadTestSchema(const char *xsd, const std::map<std::string, std::string> &params = std::map<std::string, std::string>());

//
// Loads an inline schema and returns the load result, the schema keeps the message and status
extern bool tryLoadSchema(xsdbind::XMLSchema &schema, const char *xsd, const std::map<std::string, std::string> &params = std::map<std::string, std::string>());

extern std::shared_ptr<xsdbind::XmlElement> parseInstance(const char *xml);

//
// True when one of the errors has a reason containing the text
extern bool hasErrorContaining(const std::vector<xsdbind::ValidationError> &errors, const std::string &text);

extern std::string describeErrors(const std::vector<xsdbind::ValidationError> &errors);

#endif // _XSDBIND_UNITTESTS_HPP_
