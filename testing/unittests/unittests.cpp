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


#include <cstdlib>
#include <iostream>
#include <sstream>

#include <cppunit/extensions/TestFactoryRegistry.h>
#include <cppunit/TestResult.h>
#include <cppunit/TestResultCollector.h>
#include <cppunit/TestRunner.h>
#include <cppunit/TestListener.h>
#include <cppunit/TestFailure.h>
#include <cppunit/Exception.h>
#include <cppunit/CompilerOutputter.h>

#include "unittests.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"

using namespace xsdbind;


std::shared_ptr<XMLSchema> loadTestSchema(const char *xsd, const std::map<std::string, std::string> &params)
{
    std::shared_ptr<XMLSchema> pSchema = std::make_shared<XMLSchema>();
    std::istringstream in(xsd);
    bool rc = pSchema->loadSchema(in, params);
    CPPUNIT_ASSERT_MESSAGE(pSchema->getLastSchemaMessage(), rc);
    return pSchema;
}


bool tryLoadSchema(XMLSchema &schema, const char *xsd, const std::map<std::string, std::string> &params)
{
    std::istringstream in(xsd);
    return schema.loadSchema(in, params);
}


std::shared_ptr<XmlElement> parseInstance(const char *xml)
{
    XMLDocumentLoader loader;
    std::istringstream in(xml);
    std::shared_ptr<XmlElement> pRoot;
    try
    {
        pRoot = loader.load(in);
    }
    catch (const ParseException &pe)
    {
        CPPUNIT_FAIL(pe.what());
    }
    CPPUNIT_ASSERT_MESSAGE("invalid instance document", pRoot != nullptr);
    return pRoot;
}


bool hasErrorContaining(const std::vector<ValidationError> &errors, const std::string &text)
{
    for (auto &error : errors)
    {
        if (error.reason.find(text) != std::string::npos)
            return true;
    }
    return false;
}


std::string describeErrors(const std::vector<ValidationError> &errors)
{
    std::string msg = std::to_string(errors.size()) + " error(s)";
    for (auto &error : errors)
        msg += "\n  " + error.toString();
    return msg;
}


class XsdbindTestProgressListener : public CPPUNIT_NS::TestListener
{
public:
    XsdbindTestProgressListener() : m_lastTestFailed( false ) {}
    virtual ~XsdbindTestProgressListener() {}

    void startTest( CPPUNIT_NS::Test *test )
    {
        getLogger()->info("TEST({}): START", test->getName());
        m_lastTestFailed = false;
    }

    void addFailure( const CPPUNIT_NS::TestFailure &failure )
    {
        std::string s = "TEST(" + failure.failedTestName() + "): " + (failure.isError() ? "" : "ASSERT ") +
            "File: " + failure.sourceLine().fileName() + " Ln:" + std::to_string(failure.sourceLine().lineNumber());
        CPPUNIT_NS::Exception *e = failure.thrownException();
        if (e)
            s += " " + e->message().shortDescription() + " " + e->message().details();
        getLogger()->error("{}", s);
        m_lastTestFailed = true;
    }

    void endTest( CPPUNIT_NS::Test *test )
    {
        getLogger()->info("TEST({}): END{}", test->getName(), m_lastTestFailed ? "" : " OK");
    }

private:
    XsdbindTestProgressListener( const XsdbindTestProgressListener &copy ) = delete;
    void operator =( const XsdbindTestProgressListener &copy ) = delete;

private:
    bool m_lastTestFailed;
};


static void usage()
{
    std::cout << "usage: xsdbind_unittests [suite name]" << std::endl;
    std::cout << "  suites: facets, matcher, decode, encode, parser, registry, concurrency" << std::endl;
}


int main( int argc, char **argv )
{
    int ret = 1;
    if (argc > 2 || (argc == 2 && std::string(argv[1]) == "--help"))
    {
        usage();
        return ret;
    }

    //
    // Progress lines are info level, the library stays at warn unless the environment says otherwise
    if (std::getenv("XSDBIND_LOG_LEVEL") == nullptr)
        setLogLevel("info");

    try
    {
        CPPUNIT_NS::TestResult controller;

        CPPUNIT_NS::TestResultCollector result;
        controller.addListener( &result );

        XsdbindTestProgressListener progress;
        controller.addListener( &progress );

        CPPUNIT_NS::TestRunner runner;
        if (argc == 2)
            runner.addTest( CPPUNIT_NS::TestFactoryRegistry::getRegistry(argv[1]).makeTest() );
        else
            runner.addTest( CPPUNIT_NS::TestFactoryRegistry::getRegistry().makeTest() );
        runner.run( controller );

        CPPUNIT_NS::CompilerOutputter outputter( &result, std::cerr );
        outputter.write();

        ret = result.wasSuccessful() ? 0 : 1;
    }
    catch (const std::exception &e)
    {
        getLogger()->critical("Unexpected exception: {}", e.what());
        ret = 2;
    }
    return ret;
}
