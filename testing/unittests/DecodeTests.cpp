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

using namespace xsdbind;


static const char *personSchema = R"!!!(<?xml version="1.0" encoding="UTF-8"?>
<xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
    <xs:simpleType name="age">
        <xs:restriction base="xs:int">
            <xs:minInclusive value="0"/>
            <xs:maxInclusive value="150"/>
        </xs:restriction>
    </xs:simpleType>
    <xs:complexType name="amount">
        <xs:simpleContent>
            <xs:extension base="xs:decimal">
                <xs:attribute name="currency" type="xs:string" default="EUR"/>
            </xs:extension>
        </xs:simpleContent>
    </xs:complexType>
    <xs:element name="person">
        <xs:complexType>
            <xs:sequence>
                <xs:element name="name" type="xs:string"/>
                <xs:element name="age" type="age"/>
                <xs:element name="salary" type="amount" minOccurs="0"/>
                <xs:element name="nickname" type="xs:string" minOccurs="0" maxOccurs="unbounded"/>
                <xs:element name="country" type="xs:string" minOccurs="0" default="NZ"/>
                <xs:element name="species" type="xs:string" minOccurs="0" fixed="human"/>
                <xs:element name="spouse" type="xs:string" minOccurs="0" nillable="true"/>
            </xs:sequence>
            <xs:attribute name="id" type="xs:int" use="required"/>
            <xs:attribute name="active" type="xs:boolean" default="true"/>
        </xs:complexType>
    </xs:element>
    <xs:element name="para">
        <xs:complexType mixed="true">
            <xs:sequence>
                <xs:element name="b" type="xs:string" minOccurs="0" maxOccurs="unbounded"/>
            </xs:sequence>
        </xs:complexType>
    </xs:element>
</xs:schema>
)!!!";


class CountingVisitor : public IErrorVisitor
{
public:
    CountingVisitor() : m_count(0) { }
    virtual void visitError(const ValidationError &error) { ++m_count; m_paths.push_back(error.path); }
    unsigned m_count;
    std::vector<std::string> m_paths;
};


class DecodeTests : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(DecodeTests);
    CPPUNIT_TEST(testLaxModeReportsEveryError);
    CPPUNIT_TEST(testStrictModeThrowsFirstError);
    CPPUNIT_TEST(testSkipModeIsBestEffort);
    CPPUNIT_TEST(testDecodedShape);
    CPPUNIT_TEST(testDefaultsAndFixedValues);
    CPPUNIT_TEST(testNil);
    CPPUNIT_TEST(testErrorPaths);
    CPPUNIT_TEST(testUndeclaredAttributes);
    CPPUNIT_TEST(testUnknownRootElement);
    CPPUNIT_TEST(testMixedContent);
    CPPUNIT_TEST(testConverterOptions);
    CPPUNIT_TEST(testNamespaceMap);
    CPPUNIT_TEST(testXsiTypeSubstitution);
    CPPUNIT_TEST(testUnqualifiedNamesAreErrors);
    CPPUNIT_TEST_SUITE_END();

public:

    void setUp()
    {
        m_pSchema = loadTestSchema(personSchema);
    }

    void tearDown()
    {
        m_pSchema.reset();
    }

    void testLaxModeReportsEveryError()
    {
        std::shared_ptr<XmlElement> pDoc = parseInstance("<person><name>Ann</name><age>200</age></person>");

        CountingVisitor visitor;
        m_pSchema->iterErrors(*pDoc, visitor);
        CPPUNIT_ASSERT_EQUAL(2U, visitor.m_count);

        std::vector<ValidationError> errors;
        Value result = m_pSchema->decode(*pDoc, ValidationContext::lax, ConverterOptions(), &errors);
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(2), errors.size());
        CPPUNIT_ASSERT(hasErrorContaining(errors, "missing required attribute 'id'"));
        CPPUNIT_ASSERT(result.isMap());
        CPPUNIT_ASSERT(result.find("@id") == nullptr);
        CPPUNIT_ASSERT_EQUAL(std::string("Ann"), result.find("name")->getString());
        CPPUNIT_ASSERT_EQUAL(static_cast<int64_t>(200), result.find("age")->getInteger());

        //
        // Text that does not decode at all falls back to the string
        errors.clear();
        result = m_pSchema->decode(*parseInstance("<person id='1'><name>Ann</name><age>old</age></person>"), ValidationContext::lax, ConverterOptions(), &errors);
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT_EQUAL(ValidationError::decode, errors[0].kind);
        CPPUNIT_ASSERT_EQUAL(std::string("old"), result.find("age")->getString());
    }

    void testStrictModeThrowsFirstError()
    {
        CPPUNIT_ASSERT_THROW(m_pSchema->validate(*parseInstance("<person><name>Ann</name><age>20</age></person>")), ValidationException);
        CPPUNIT_ASSERT_THROW(m_pSchema->decode(*parseInstance("<person id='x'><name>Ann</name><age>20</age></person>")), DecodeException);
        CPPUNIT_ASSERT_NO_THROW(m_pSchema->validate(*parseInstance("<person id='1'><name>Ann</name><age>20</age></person>")));

        try
        {
            m_pSchema->validate(*parseInstance("<person id='1'><name>Ann</name><age>151</age></person>"));
            CPPUNIT_FAIL("expected a validation exception");
        }
        catch (const ValidationException &e)
        {
            CPPUNIT_ASSERT_EQUAL(std::string("/person/age"), e.getError().path);
            CPPUNIT_ASSERT_EQUAL(std::string("151"), e.getError().value);
            CPPUNIT_ASSERT(std::string(e.what()).find("/person/age") != std::string::npos);
        }
    }

    void testSkipModeIsBestEffort()
    {
        std::vector<ValidationError> errors;
        Value result = m_pSchema->decode(*parseInstance("<person><age>old</age><name>Ann</name><extra>1</extra></person>"),
            ValidationContext::skip, ConverterOptions(), &errors);
        CPPUNIT_ASSERT(errors.empty());
        CPPUNIT_ASSERT(result.isMap());
        CPPUNIT_ASSERT_EQUAL(std::string("old"), result.find("age")->getString());
        CPPUNIT_ASSERT_EQUAL(std::string("Ann"), result.find("name")->getString());
    }

    void testDecodedShape()
    {
        Value result = m_pSchema->decode(*parseInstance(
            "<person id='7' active='0'><name>Ann</name><age>30</age><salary currency='USD'>1000.50</salary>"
            "<nickname>A</nickname><nickname>Annie</nickname></person>"));

        CPPUNIT_ASSERT_EQUAL(static_cast<int64_t>(7), result.find("@id")->getInteger());
        CPPUNIT_ASSERT(!result.find("@active")->getBool());

        const Value *pSalary = result.find("salary");
        CPPUNIT_ASSERT(pSalary != nullptr && pSalary->isMap());
        CPPUNIT_ASSERT_EQUAL(std::string("USD"), pSalary->find("@currency")->getString());
        CPPUNIT_ASSERT_EQUAL(std::string("1000.5"), pSalary->find("$")->getDecimal());

        const Value *pNicknames = result.find("nickname");
        CPPUNIT_ASSERT(pNicknames != nullptr && pNicknames->isList());
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), pNicknames->size());
        CPPUNIT_ASSERT_EQUAL(std::string("Annie"), pNicknames->at(1).getString());

        //
        // A child that may repeat is a list even when it appears once
        result = m_pSchema->decode(*parseInstance("<person id='7'><name>Ann</name><age>30</age><nickname>A</nickname></person>"));
        CPPUNIT_ASSERT(result.find("nickname")->isList());
        CPPUNIT_ASSERT(!result.find("name")->isList());
    }

    void testDefaultsAndFixedValues()
    {
        Value result = m_pSchema->decode(*parseInstance(
            "<person id='1'><name>Ann</name><age>30</age><salary>5</salary><country/><species/></person>"));
        CPPUNIT_ASSERT(result.find("@active")->getBool());
        CPPUNIT_ASSERT_EQUAL(std::string("NZ"), result.find("country")->getString());
        CPPUNIT_ASSERT_EQUAL(std::string("human"), result.find("species")->getString());
        CPPUNIT_ASSERT_EQUAL(std::string("EUR"), result.find("salary")->find("@currency")->getString());

        ConverterOptions options;
        options.useDefaults = false;
        result = m_pSchema->decode(*parseInstance("<person id='1'><name>Ann</name><age>30</age><country/></person>"),
            ValidationContext::strict, options);
        CPPUNIT_ASSERT(result.find("@active") == nullptr);
        CPPUNIT_ASSERT_EQUAL(std::string(""), result.find("country")->getString());

        std::vector<ValidationError> errors = m_pSchema->getErrors(*parseInstance(
            "<person id='1'><name>Ann</name><age>30</age><species>robot</species></person>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT(hasErrorContaining(errors, "fixed value 'human'"));
    }

    void testNil()
    {
        Value result = m_pSchema->decode(*parseInstance(
            "<person id='1' xmlns:xsi='http://www.w3.org/2001/XMLSchema-instance'><name>Ann</name><age>30</age><spouse xsi:nil='true'/></person>"));
        const Value *pSpouse = result.find("spouse");
        CPPUNIT_ASSERT(pSpouse != nullptr);
        CPPUNIT_ASSERT(pSpouse->isNull());

        std::vector<ValidationError> errors = m_pSchema->getErrors(*parseInstance(
            "<person id='1' xmlns:xsi='http://www.w3.org/2001/XMLSchema-instance'><name xsi:nil='true'/><age>30</age></person>"));
        CPPUNIT_ASSERT(hasErrorContaining(errors, "not nillable"));

        errors = m_pSchema->getErrors(*parseInstance(
            "<person id='1' xmlns:xsi='http://www.w3.org/2001/XMLSchema-instance'><name>Ann</name><age>30</age><spouse xsi:nil='true'>Bob</spouse></person>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT(hasErrorContaining(errors, "has content"));
    }

    void testErrorPaths()
    {
        std::vector<ValidationError> errors = m_pSchema->getErrors(*parseInstance(
            "<person id='1' active='maybe'><name>Ann</name><age>30</age><nickname>A</nickname><nickname><i/></nickname></person>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(2), errors.size());
        CPPUNIT_ASSERT_EQUAL(std::string("/person/@active"), errors[0].path);
        CPPUNIT_ASSERT_EQUAL(std::string("/person/nickname[2]"), errors[1].path);
        CPPUNIT_ASSERT(!errors[0].component.empty());
    }

    void testUndeclaredAttributes()
    {
        std::vector<ValidationError> errors = m_pSchema->getErrors(*parseInstance(
            "<person id='1' colour='red' xmlns:xsi='http://www.w3.org/2001/XMLSchema-instance' xsi:noNamespaceSchemaLocation='person.xsd'>"
            "<name>Ann</name><age>30</age></person>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT_EQUAL(std::string("attribute 'colour' not allowed"), errors[0].reason);
        CPPUNIT_ASSERT_EQUAL(std::string("/person/@colour"), errors[0].path);
    }

    void testUnknownRootElement()
    {
        std::vector<ValidationError> errors = m_pSchema->getErrors(*parseInstance("<animal><legs>4</legs></animal>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT_EQUAL(std::string("'animal' is not an element of the schema"), errors[0].reason);
        CPPUNIT_ASSERT_EQUAL(std::string("/animal"), errors[0].path);
        CPPUNIT_ASSERT_THROW(m_pSchema->validate(*parseInstance("<animal/>")), ValidationException);

        //
        // Lax carries on with anyType, so the content still comes back
        Value result = m_pSchema->decode(*parseInstance("<animal><legs>4</legs></animal>"), ValidationContext::lax);
        CPPUNIT_ASSERT(result.isMap());
        CPPUNIT_ASSERT(result.find("legs") != nullptr);
    }

    void testMixedContent()
    {
        std::shared_ptr<XmlElement> pDoc = parseInstance("<para>Hello <b>big</b> world</para>");
        CPPUNIT_ASSERT(m_pSchema->isValid(*pDoc));

        ConverterOptions options;
        options.useCDataPrefix = true;
        options.cdataPrefix = "#";
        Value result = m_pSchema->decode(*pDoc, ValidationContext::strict, options);
        CPPUNIT_ASSERT_EQUAL(std::string("Hello "), result.find("#1")->getString());
        CPPUNIT_ASSERT_EQUAL(std::string(" world"), result.find("#2")->getString());
        CPPUNIT_ASSERT_EQUAL(std::string("big"), result.find("b")->at(0).getString());

        //
        // Without a prefix the text is dropped
        result = m_pSchema->decode(*pDoc);
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), result.size());

        CPPUNIT_ASSERT_EQUAL(std::string("just text"), m_pSchema->decode(*parseInstance("<para>just text</para>")).getString());
        CPPUNIT_ASSERT(!m_pSchema->isValid(*parseInstance("<person id='1'>stray<name>Ann</name><age>30</age></person>")));
    }

    void testConverterOptions()
    {
        std::shared_ptr<XmlElement> pDoc = parseInstance("<person id='1'><name>Ann</name><age>30</age></person>");

        ConverterOptions options;
        options.useAttrPrefix = false;
        Value result = m_pSchema->decode(*pDoc, ValidationContext::strict, options);
        CPPUNIT_ASSERT(result.find("@id") == nullptr);
        CPPUNIT_ASSERT(result.find("@active") == nullptr);

        options = ConverterOptions();
        options.order = ConverterOptions::sortedKeys;
        result = m_pSchema->decode(*pDoc, ValidationContext::strict, options);
        CPPUNIT_ASSERT_EQUAL(std::string("@active"), result.keyAt(0));
        CPPUNIT_ASSERT_EQUAL(std::string("age"), result.keyAt(2));

        options = ConverterOptions();
        options.attrPrefix = "attr_";
        CPPUNIT_ASSERT_THROW(m_pSchema->decode(*pDoc, ValidationContext::strict, options), ValueException);
        options = ConverterOptions();
        options.textKey = "";
        CPPUNIT_ASSERT_THROW(m_pSchema->decode(*pDoc, ValidationContext::strict, options), ValueException);
    }

    void testNamespaceMap()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema" xmlns:c="urn:catalog" targetNamespace="urn:catalog" elementFormDefault="qualified">
                <xs:element name="catalog">
                    <xs:complexType>
                        <xs:sequence>
                            <xs:element name="item" type="xs:string" maxOccurs="unbounded"/>
                        </xs:sequence>
                        <xs:attribute name="version" type="xs:int"/>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);
        std::shared_ptr<XmlElement> pDoc = parseInstance("<catalog xmlns='urn:catalog' version='2'><item>a</item></catalog>");
        CPPUNIT_ASSERT_EQUAL(std::string("{urn:catalog}catalog"), pDoc->getTag());

        Value result = pSchema->decode(*pDoc);
        CPPUNIT_ASSERT(result.find("{urn:catalog}item") != nullptr);
        CPPUNIT_ASSERT(result.find("@version") != nullptr);

        ConverterOptions options;
        options.namespaces["cat"] = "urn:catalog";
        result = pSchema->decode(*pDoc, ValidationContext::strict, options);
        CPPUNIT_ASSERT(result.find("cat:item") != nullptr);

        options.namespaces.clear();
        options.namespaces[""] = "urn:catalog";
        result = pSchema->decode(*pDoc, ValidationContext::strict, options);
        CPPUNIT_ASSERT(result.find("item") != nullptr);
    }

    void testXsiTypeSubstitution()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema" xmlns:z="urn:zoo" targetNamespace="urn:zoo" elementFormDefault="qualified">
                <xs:complexType name="animal">
                    <xs:sequence>
                        <xs:element name="name" type="xs:string"/>
                    </xs:sequence>
                </xs:complexType>
                <xs:complexType name="dog">
                    <xs:complexContent>
                        <xs:extension base="z:animal">
                            <xs:sequence>
                                <xs:element name="bark" type="xs:string"/>
                            </xs:sequence>
                        </xs:extension>
                    </xs:complexContent>
                </xs:complexType>
                <xs:complexType name="plant">
                    <xs:sequence>
                        <xs:element name="leaf" type="xs:string"/>
                    </xs:sequence>
                </xs:complexType>
                <xs:element name="pet" type="z:animal"/>
                <xs:element name="count" type="xs:decimal"/>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        std::shared_ptr<XmlElement> pDog = parseInstance(
            "<pet xmlns='urn:zoo' xmlns:z='urn:zoo' xmlns:xsi='http://www.w3.org/2001/XMLSchema-instance' xsi:type='z:dog'>"
            "<name>Rex</name><bark>loud</bark></pet>");
        std::vector<ValidationError> errors = pSchema->getErrors(*pDog);
        CPPUNIT_ASSERT_MESSAGE(describeErrors(errors), errors.empty());
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance("<pet xmlns='urn:zoo'><name>Rex</name><bark>loud</bark></pet>")));

        Value result = pSchema->decode(*pDog);
        CPPUNIT_ASSERT_EQUAL(std::string("loud"), result.find("{urn:zoo}bark")->getString());
        CPPUNIT_ASSERT(result.find("@{http://www.w3.org/2001/XMLSchema-instance}type") != nullptr);

        //
        // The attribute kept in the value selects the type again on encode
        ConverterOptions options;
        options.namespaces["z"] = "urn:zoo";
        std::shared_ptr<XmlElement> pEncoded = pSchema->encode(pSchema->decode(*pDog, ValidationContext::strict, options), "{urn:zoo}pet",
            ValidationContext::strict, options);
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), pEncoded->getChildren().size());
        CPPUNIT_ASSERT(pEncoded->hasAttribute(makeQName(XSI_NAMESPACE, "type")));
        CPPUNIT_ASSERT(pSchema->isValid(*pEncoded));

        const char *xsiDecl = " xmlns='urn:zoo' xmlns:z='urn:zoo' xmlns:xsi='http://www.w3.org/2001/XMLSchema-instance'";
        errors = pSchema->getErrors(*parseInstance((std::string("<pet") + xsiDecl + " xsi:type='z:plant'><leaf>green</leaf></pet>").c_str()));
        CPPUNIT_ASSERT(hasErrorContaining(errors, "is not derived from the element type"));

        errors = pSchema->getErrors(*parseInstance((std::string("<pet") + xsiDecl + " xsi:type='z:cat'><name>Tom</name></pet>").c_str()));
        CPPUNIT_ASSERT(hasErrorContaining(errors, "unknown xsi:type 'z:cat'"));

        errors = pSchema->getErrors(*parseInstance((std::string("<pet") + xsiDecl + " xsi:type='q:dog'><name>Rex</name></pet>").c_str()));
        CPPUNIT_ASSERT(hasErrorContaining(errors, "unknown namespace prefix"));

        //
        // A simple type narrowed by xsi:type
        std::string countStart = "<count xmlns='urn:zoo' xmlns:xs='http://www.w3.org/2001/XMLSchema' "
            "xmlns:xsi='http://www.w3.org/2001/XMLSchema-instance' xsi:type='xs:integer'>";
        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance("<count xmlns='urn:zoo'>1.5</count>")));
        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance((countStart + "12</count>").c_str())));
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance((countStart + "1.5</count>").c_str())));
    }

    void testUnqualifiedNamesAreErrors()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema" targetNamespace="urn:forms"
                elementFormDefault="qualified" attributeFormDefault="qualified">
                <xs:element name="root">
                    <xs:complexType>
                        <xs:sequence>
                            <xs:element name="item" type="xs:string" minOccurs="0"/>
                        </xs:sequence>
                        <xs:attribute name="flag" type="xs:boolean"/>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance("<f:root xmlns:f='urn:forms' f:flag='true'><f:item>a</f:item></f:root>")));

        std::vector<ValidationError> errors = pSchema->getErrors(*parseInstance("<f:root xmlns:f='urn:forms' flag='true'/>"));
        CPPUNIT_ASSERT(hasErrorContaining(errors, "attribute 'flag' not allowed"));

        errors = pSchema->getErrors(*parseInstance("<f:root xmlns:f='urn:forms'><item>a</item></f:root>"));
        CPPUNIT_ASSERT_MESSAGE(describeErrors(errors), !errors.empty());

        //
        // Value keys without the namespace still encode to the qualified names
        Value value = Value::makeMap();
        value.set("@flag", Value::makeBool(true));
        value.set("item", Value::makeString("a"));
        errors.clear();
        std::shared_ptr<XmlElement> pEncoded = pSchema->encode(value, "{urn:forms}root", ValidationContext::lax, ConverterOptions(), &errors);
        CPPUNIT_ASSERT_MESSAGE(describeErrors(errors), errors.empty());
        CPPUNIT_ASSERT(pEncoded->hasAttribute("{urn:forms}flag"));
        CPPUNIT_ASSERT_EQUAL(std::string("{urn:forms}item"), pEncoded->getChildren()[0]->getTag());
        CPPUNIT_ASSERT(pSchema->isValid(*pEncoded));
    }

private:
    std::shared_ptr<XMLSchema> m_pSchema;
};

CPPUNIT_TEST_SUITE_REGISTRATION(DecodeTests);
CPPUNIT_TEST_SUITE_NAMED_REGISTRATION(DecodeTests, "decode");
