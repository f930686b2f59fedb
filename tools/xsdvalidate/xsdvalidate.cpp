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


#include <iostream>
#include <map>
#include <string>
#include <vector>
#include <string.h>
#include "XMLSchema.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"

using namespace xsdbind;

enum exitCode
{
    exitValid = 0,
    exitInvalid = 1,
    exitFailure = 2
};


struct ValidateOptions
{
    ValidateOptions() : mode(ValidationContext::strict), decode(false) { }
    std::string schemaFile;
    std::string instanceFile;
    ValidationContext::validationMode mode;
    bool decode;
    std::map<std::string, std::string> params;
};


void usage()
{
    std::cout << "usage: xsdvalidate [options] <schema.xsd> <instance.xml> [name=value ...]" << std::endl;
    std::cout << std::endl;
    std::cout << "  --mode strict|lax|skip   strict stops at the first error, lax reports every" << std::endl;
    std::cout << "                           error, skip only builds a best effort value" << std::endl;
    std::cout << "  --decode                 print the decoded value" << std::endl;
    std::cout << "  --log-level <level>      trace, debug, info, warn, error or off" << std::endl;
    std::cout << "  -h, --help               print this message" << std::endl;
    std::cout << std::endl;
    std::cout << "  name=value pairs are passed to the schema loader, e.g. xsd_version=1.1" << std::endl;
}


bool parseArgs(int argc, char **argv, ValidateOptions &options)
{
    std::vector<std::string> files;
    int i = 1;
    while (i < argc)
    {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0)
        {
            usage();
            return false;
        }
        else if (strcmp(argv[i], "--mode") == 0)
        {
            if (++i == argc)
            {
                std::cerr << "Missing value for --mode" << std::endl;
                return false;
            }
            std::string mode = argv[i++];
            if (mode == "strict")
                options.mode = ValidationContext::strict;
            else if (mode == "lax")
                options.mode = ValidationContext::lax;
            else if (mode == "skip")
                options.mode = ValidationContext::skip;
            else
            {
                std::cerr << "Invalid mode '" << mode << "'" << std::endl;
                return false;
            }
            options.params["validation"] = mode;
        }
        else if (strcmp(argv[i], "--decode") == 0)
        {
            i++;
            options.decode = true;
        }
        else if (strcmp(argv[i], "--log-level") == 0)
        {
            if (++i == argc)
            {
                std::cerr << "Missing value for --log-level" << std::endl;
                return false;
            }
            options.params["log_level"] = argv[i++];
        }
        else if (strncmp(argv[i], "--", 2) == 0)
        {
            std::cerr << "Unknown option " << argv[i] << std::endl;
            usage();
            return false;
        }
        else
        {
            std::string arg = argv[i++];
            size_t eqPos = arg.find('=');
            if (eqPos != std::string::npos && files.size() == 2)
                options.params[arg.substr(0, eqPos)] = arg.substr(eqPos + 1);
            else
                files.push_back(arg);
        }
    }

    if (files.size() != 2)
    {
        std::cerr << "A schema and an instance document are required" << std::endl;
        usage();
        return false;
    }

    options.schemaFile = files[0];
    options.instanceFile = files[1];
    return true;
}


int main(int argc, char **argv)
{
    ValidateOptions options;
    if (!parseArgs(argc, argv, options))
        return exitFailure;

    XMLSchema schema;
    if (!schema.loadSchema(options.schemaFile, options.params))
    {
        std::cerr << "Unable to load schema " << options.schemaFile << ": " << schema.getLastSchemaMessage() << std::endl;
        return exitFailure;
    }

    for (auto &msg : schema.getBuildStatus().getMessages())
    {
        if (msg.msgLevel >= statusMsg::warning)
            std::cout << Status::getStatusTypeString(msg.msgLevel) << ": " << msg.msg << std::endl;
    }

    int rc = exitValid;
    try
    {
        std::shared_ptr<XmlElement> pRoot = schema.loadDocument(options.instanceFile);
        getLogger()->info("Validating {} against {}", options.instanceFile, options.schemaFile);

        std::vector<ValidationError> errors;
        Value result = schema.decode(*pRoot, options.mode, ConverterOptions(), &errors);
        for (auto &error : errors)
        {
            std::cout << error.toString() << std::endl;
        }
        if (!errors.empty())
            rc = exitInvalid;

        if (options.decode)
            std::cout << result.toString() << std::endl;
    }
    catch (const ValidationException &e)
    {
        std::cout << e.what() << std::endl;
        rc = exitInvalid;
    }
    catch (const ParseException &e)
    {
        std::cerr << "Unable to load instance " << options.instanceFile << ": " << e.what() << std::endl;
        rc = exitFailure;
    }

    if (rc == exitValid && options.mode != ValidationContext::skip)
        std::cout << options.instanceFile << " is valid" << std::endl;
    return rc;
}
