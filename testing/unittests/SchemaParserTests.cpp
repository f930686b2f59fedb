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


#include "unittests.hpp"
#include "Exceptions.hpp"
#include "ComplexType.hpp"
#include "ElementDecl.hpp"
#include "AttributeDecl.hpp"

using namespace xsdbind;


class SchemaParserTests : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(SchemaParserTests);
    CPPUNIT_TEST(testMissingFile);
    CPPUNIT_TEST(testNotASchema);
    CPPUNIT_TEST(testParameters);
    CPPUNIT_TEST(testCompositionNotSupported);
    CPPUNIT_TEST(testDuplicateGlobal);
    CPPUNIT_TEST(testUnknownTypeReference);
    CPPUNIT_TEST(testCircularDerivation);
    CPPUNIT_TEST(testCircularGroups);
    CPPUNIT_TEST(testCircularAttributeGroups);
    CPPUNIT_TEST(testOccursRange);
    CPPUNIT_TEST(testDefaultAndFixedTogether);
    CPPUNIT_TEST(testAllGroupRules);
    CPPUNIT_TEST(testComplexContentExtension);
    CPPUNIT_TEST(testComplexContentRestriction);
    CPPUNIT_TEST(testAttributeGroupsAndWildcards);
    CPPUNIT_TEST(testRecursiveType);
    CPPUNIT_TEST(testQualifiedForms);
    CPPUNIT_TEST_SUITE_END();

public:

    static bool loadFails(const char *xsd, const std::string &expectedText)
    {
        XMLSchema schema;
        bool rc = tryLoadSchema(schema, xsd);
        CPPUNIT_ASSERT_MESSAGE("schema loaded but an error was expected", !rc);
        CPPUNIT_ASSERT_MESSAGE(schema.getLastSchemaMessage(), schema.getLastSchemaMessage().find(expectedText) != std::string::npos);
        return !rc;
    }

    static std::map<std::string, std::string> laxParams()
    {
        std::map<std::string, std::string> params;
        params["validation"] = "lax";
        return params;
    }

    void testMissingFile()
    {
        XMLSchema schema;
        CPPUNIT_ASSERT(!schema.loadSchema("/nonexistent/directory/schema.xsd"));
        CPPUNIT_ASSERT(!schema.getLastSchemaMessage().empty());
        CPPUNIT_ASSERT_EQUAL(SchemaComponent::notKnown, schema.getValidity());
    }

    void testNotASchema()
    {
        loadFails("<notes><note>hello</note></notes>", "XML Schema namespace");
        loadFails("<xs:schema xmlns:xs='http://www.w3.org/2001/XMLSchema'><xs:element", "");
    }

    void testParameters()
    {
        constexpr const char *xsd = "<xs:schema xmlns:xs='http://www.w3.org/2001/XMLSchema'><xs:element name='a' type='xs:string'/></xs:schema>";
        XMLSchema schema;
        std::map<std::string, std::string> params;

        params["validation"] = "paranoid";
        CPPUNIT_ASSERT(!tryLoadSchema(schema, xsd, params));

        params.clear();
        params["xsd_version"] = "2.0";
        CPPUNIT_ASSERT(!tryLoadSchema(schema, xsd, params));

        params.clear();
        params["log_level"] = "chatty";
        CPPUNIT_ASSERT(!tryLoadSchema(schema, xsd, params));
        CPPUNIT_ASSERT(schema.getLastSchemaMessage().find("chatty") != std::string::npos);

        params.clear();
        params["validation"] = "skip";
        params["xsd_version"] = "1.1";
        params["log_level"] = "info";
        CPPUNIT_ASSERT(tryLoadSchema(schema, xsd, params));
        CPPUNIT_ASSERT(schema.isLoaded());
    }

    void testCompositionNotSupported()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:include schemaLocation="common.xsd"/>
                <xs:element name="a" type="xs:string"/>
            </xs:schema>
        )!!!";
        loadFails(xsd, "not supported");

        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd, laxParams());
        CPPUNIT_ASSERT(pSchema->getBuildStatus().isError());
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), pSchema->getBuildStatus().getMessages(statusMsg::error).size());
        CPPUNIT_ASSERT(pSchema->getElement("a") != nullptr);
        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance("<a>text</a>")));
    }

    void testDuplicateGlobal()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="a" type="xs:string"/>
                <xs:element name="a" type="xs:int"/>
            </xs:schema>
        )!!!";
        loadFails(xsd, "Duplicate");

        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd, laxParams());
        CPPUNIT_ASSERT(pSchema->getBuildStatus().isError());
        CPPUNIT_ASSERT(pSchema->getElement("a") != nullptr);
    }

    void testUnknownTypeReference()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:complexType name="holder">
                    <xs:sequence>
                        <xs:element name="thing" type="missingType"/>
                    </xs:sequence>
                </xs:complexType>
                <xs:element name="box" type="holder"/>
                <xs:element name="label" type="xs:string"/>
            </xs:schema>
        )!!!";
        loadFails(xsd, "Unknown type 'missingType'");

        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd, laxParams());
        CPPUNIT_ASSERT_EQUAL(SchemaComponent::invalid, pSchema->getValidity());
        CPPUNIT_ASSERT_EQUAL(SchemaComponent::invalid, pSchema->getElement("box")->getValidity());
        CPPUNIT_ASSERT_EQUAL(SchemaComponent::valid, pSchema->getElement("label")->getValidity());

        //
        // The broken element falls back to anyType and accepts any content
        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance("<box><thing><whatever>1</whatever></thing></box>")));
    }

    void testCircularDerivation()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:complexType name="a">
                    <xs:complexContent>
                        <xs:extension base="b"/>
                    </xs:complexContent>
                </xs:complexType>
                <xs:complexType name="b">
                    <xs:complexContent>
                        <xs:extension base="a"/>
                    </xs:complexContent>
                </xs:complexType>
            </xs:schema>
        )!!!";
        loadFails(xsd, "Circular definition of type");

        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd, laxParams());
        CPPUNIT_ASSERT_EQUAL(SchemaComponent::invalid, pSchema->getValidity());
    }

    void testCircularGroups()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:group name="g1">
                    <xs:sequence>
                        <xs:element name="x" type="xs:string"/>
                        <xs:group ref="g2"/>
                    </xs:sequence>
                </xs:group>
                <xs:group name="g2">
                    <xs:sequence>
                        <xs:group ref="g1" minOccurs="0"/>
                    </xs:sequence>
                </xs:group>
            </xs:schema>
        )!!!";
        loadFails(xsd, "Circular reference to group");
    }

    void testCircularAttributeGroups()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:attributeGroup name="ag1">
                    <xs:attribute name="x" type="xs:string"/>
                    <xs:attributeGroup ref="ag2"/>
                </xs:attributeGroup>
                <xs:attributeGroup name="ag2">
                    <xs:attributeGroup ref="ag1"/>
                </xs:attributeGroup>
            </xs:schema>
        )!!!";
        loadFails(xsd, "Circular reference to attributeGroup");
    }

    void testOccursRange()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="list">
                    <xs:complexType>
                        <xs:sequence>
                            <xs:element name="item" type="xs:string" minOccurs="3" maxOccurs="2"/>
                        </xs:sequence>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        loadFails(xsd, "maxOccurs");

        constexpr const char *badValue = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="list">
                    <xs:complexType>
                        <xs:sequence>
                            <xs:element name="item" type="xs:string" maxOccurs="lots"/>
                        </xs:sequence>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        loadFails(badValue, "lots");
    }

    void testDefaultAndFixedTogether()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="a" type="xs:string" default="x" fixed="y"/>
            </xs:schema>
        )!!!";
        loadFails(xsd, "default");

        constexpr const char *requiredDefault = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="a">
                    <xs:complexType>
                        <xs:attribute name="b" type="xs:string" use="required" default="x"/>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        loadFails(requiredDefault, "must be optional");
    }

    void testAllGroupRules()
    {
        constexpr const char *repeatedMember = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="a">
                    <xs:complexType>
                        <xs:all>
                            <xs:element name="b" type="xs:string" maxOccurs="2"/>
                        </xs:all>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        loadFails(repeatedMember, "can't occur more than once");

        constexpr const char *nested = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="a">
                    <xs:complexType>
                        <xs:sequence>
                            <xs:all>
                                <xs:element name="b" type="xs:string"/>
                            </xs:all>
                        </xs:sequence>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        loadFails(nested, "whole content model");

        constexpr const char *wildcardMember = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="a">
                    <xs:complexType>
                        <xs:all>
                            <xs:any/>
                        </xs:all>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        loadFails(wildcardMember, "only element declarations");

        //
        // Skip mode builds the schema without the all group checks
        std::map<std::string, std::string> params;
        params["validation"] = "skip";
        XMLSchema schema;
        CPPUNIT_ASSERT(tryLoadSchema(schema, repeatedMember, params));
    }

    void testComplexContentExtension()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:complexType name="address">
                    <xs:sequence>
                        <xs:element name="street" type="xs:string"/>
                        <xs:element name="city" type="xs:string"/>
                    </xs:sequence>
                    <xs:attribute name="kind" type="xs:string"/>
                </xs:complexType>
                <xs:complexType name="ukAddress">
                    <xs:complexContent>
                        <xs:extension base="address">
                            <xs:sequence>
                                <xs:element name="postcode" type="xs:string"/>
                            </xs:sequence>
                            <xs:attribute name="county" type="xs:string"/>
                        </xs:extension>
                    </xs:complexContent>
                </xs:complexType>
                <xs:element name="home" type="ukAddress"/>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        const SchemaType *pUk = pSchema->getType("ukAddress");
        CPPUNIT_ASSERT(pUk != nullptr);
        CPPUNIT_ASSERT_EQUAL(SchemaType::extension, pUk->getDerivation());
        CPPUNIT_ASSERT(pUk->isDerivedFrom(pSchema->getType("address")));

        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance(
            "<home kind='house' county='Kent'><street>1 High St</street><city>Ashford</city><postcode>TN1</postcode></home>")));
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance("<home><postcode>TN1</postcode><street>1 High St</street><city>Ashford</city></home>")));
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance("<home><street>1 High St</street><city>Ashford</city></home>")));
    }

    void testComplexContentRestriction()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:complexType name="range">
                    <xs:sequence>
                        <xs:element name="low" type="xs:int" minOccurs="0"/>
                        <xs:element name="high" type="xs:int" minOccurs="0"/>
                    </xs:sequence>
                </xs:complexType>
                <xs:complexType name="upperBound">
                    <xs:complexContent>
                        <xs:restriction base="range">
                            <xs:sequence>
                                <xs:element name="high" type="xs:int"/>
                            </xs:sequence>
                        </xs:restriction>
                    </xs:complexContent>
                </xs:complexType>
                <xs:element name="limit" type="upperBound"/>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);
        CPPUNIT_ASSERT_EQUAL(SchemaType::restriction, pSchema->getType("upperBound")->getDerivation());
        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance("<limit><high>10</high></limit>")));
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance("<limit><low>1</low><high>10</high></limit>")));

        constexpr const char *simpleBase = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:complexType name="bad">
                    <xs:complexContent>
                        <xs:extension base="xs:string"/>
                    </xs:complexContent>
                </xs:complexType>
            </xs:schema>
        )!!!";
        loadFails(simpleBase, "must be a complex type");
    }

    void testAttributeGroupsAndWildcards()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema" xmlns:m="urn:meta" targetNamespace="urn:meta">
                <xs:attribute name="lang" type="xs:language"/>
                <xs:attributeGroup name="common">
                    <xs:attribute name="id" type="xs:ID" use="required"/>
                    <xs:attribute ref="m:lang"/>
                </xs:attributeGroup>
                <xs:element name="doc">
                    <xs:complexType>
                        <xs:attributeGroup ref="m:common"/>
                        <xs:attribute name="secret" type="xs:string" use="prohibited"/>
                        <xs:anyAttribute namespace="##other" processContents="skip"/>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance(
            "<m:doc xmlns:m='urn:meta' xmlns:x='urn:x' id='d1' m:lang='en-GB' x:anything='1'/>")));
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance("<m:doc xmlns:m='urn:meta' id='d1' m:lang='not a language'/>")));
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance("<m:doc xmlns:m='urn:meta' m:lang='en'/>")));

        std::vector<ValidationError> errors = pSchema->getErrors(*parseInstance("<m:doc xmlns:m='urn:meta' id='d1' secret='x'/>"));
        CPPUNIT_ASSERT(hasErrorContaining(errors, "prohibited"));

        //
        // ##other does not admit unqualified names
        errors = pSchema->getErrors(*parseInstance("<m:doc xmlns:m='urn:meta' id='d1' extra='x'/>"));
        CPPUNIT_ASSERT(hasErrorContaining(errors, "not allowed"));
    }

    void testRecursiveType()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:annotation>
                    <xs:documentation>A tree of named nodes</xs:documentation>
                </xs:annotation>
                <xs:complexType name="node">
                    <xs:sequence>
                        <xs:element name="node" type="node" minOccurs="0" maxOccurs="unbounded"/>
                    </xs:sequence>
                    <xs:attribute name="name" type="xs:NCName" use="required"/>
                </xs:complexType>
                <xs:element name="tree" type="node"/>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);
        CPPUNIT_ASSERT_EQUAL(SchemaComponent::valid, pSchema->getValidity());

        std::shared_ptr<XmlElement> pDoc = parseInstance(
            "<tree name='root'><node name='a'><node name='a1'/><node name='a2'/></node><node name='b'/></tree>");
        CPPUNIT_ASSERT(pSchema->isValid(*pDoc));
        Value result = pSchema->decode(*pDoc);
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), result.find("node")->size());
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), result.find("node")->at(0).find("node")->size());

        std::vector<ValidationError> errors = pSchema->getErrors(*parseInstance("<tree name='root'><node name='a'><node name='a:1'/></node></tree>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT_EQUAL(std::string("/tree/node/node/@name"), errors[0].path);
    }

    void testQualifiedForms()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema" xmlns="urn:forms" targetNamespace="urn:forms"
                elementFormDefault="unqualified" attributeFormDefault="qualified">
                <xs:element name="root">
                    <xs:complexType>
                        <xs:sequence>
                            <xs:element name="local" type="xs:string"/>
                            <xs:element name="qualifiedLocal" type="xs:string" form="qualified"/>
                            <xs:element ref="shared"/>
                        </xs:sequence>
                        <xs:attribute name="flag" type="xs:boolean"/>
                    </xs:complexType>
                </xs:element>
                <xs:element name="shared" type="xs:int"/>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        CPPUNIT_ASSERT(pSchema->getElement("{urn:forms}root") != nullptr);
        CPPUNIT_ASSERT(pSchema->getElement("root") == nullptr);

        std::vector<ValidationError> errors = pSchema->getErrors(*parseInstance(
            "<f:root xmlns:f='urn:forms' f:flag='true'><local>a</local><f:qualifiedLocal>b</f:qualifiedLocal><f:shared>3</f:shared></f:root>"));
        CPPUNIT_ASSERT_MESSAGE(describeErrors(errors), errors.empty());

        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance(
            "<f:root xmlns:f='urn:forms'><f:local>a</f:local><f:qualifiedLocal>b</f:qualifiedLocal><f:shared>3</f:shared></f:root>")));
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance(
            "<f:root xmlns:f='urn:forms' flag='true'><local>a</local><f:qualifiedLocal>b</f:qualifiedLocal><f:shared>3</f:shared></f:root>")));
    }
};

CPPUNIT_TEST_SUITE_REGISTRATION(SchemaParserTests);
CPPUNIT_TEST_SUITE_NAMED_REGISTRATION(SchemaParserTests, "parser");
