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


#include <sstream>

#include "unittests.hpp"
#include "Exceptions.hpp"

using namespace xsdbind;


static const char *orderSchema = R"!!!(<?xml version="1.0" encoding="UTF-8"?>
<xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema" xmlns:o="urn:orders" targetNamespace="urn:orders" elementFormDefault="qualified">
    <xs:simpleType name="quantities">
        <xs:list itemType="xs:positiveInteger"/>
    </xs:simpleType>
    <xs:complexType name="line">
        <xs:sequence>
            <xs:element name="sku" type="xs:token"/>
            <xs:element name="price" type="xs:decimal"/>
            <xs:element name="splits" type="o:quantities" minOccurs="0"/>
        </xs:sequence>
        <xs:attribute name="gift" type="xs:boolean" default="false"/>
    </xs:complexType>
    <xs:element name="order">
        <xs:complexType>
            <xs:sequence>
                <xs:element name="customer" type="xs:string"/>
                <xs:element name="line" type="o:line" maxOccurs="unbounded"/>
                <xs:element name="note" type="xs:string" minOccurs="0" nillable="true"/>
            </xs:sequence>
            <xs:attribute name="id" type="xs:int" use="required"/>
            <xs:attribute name="placed" type="xs:date"/>
        </xs:complexType>
    </xs:element>
</xs:schema>
)!!!";


static const char *orderInstance = R"!!!(<?xml version="1.0" encoding="UTF-8"?>
<o:order xmlns:o="urn:orders" xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance" id="42" placed="2024-03-01">
    <o:customer>Ann</o:customer>
    <o:line gift="true">
        <o:sku>A-1</o:sku>
        <o:price>9.5</o:price>
        <o:splits>1 2 3</o:splits>
    </o:line>
    <o:line gift="false">
        <o:sku>B-2</o:sku>
        <o:price>100</o:price>
    </o:line>
    <o:note xsi:nil="true"/>
</o:order>
)!!!";


class EncodeTests : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(EncodeTests);
    CPPUNIT_TEST(testStrictRoundTrip);
    CPPUNIT_TEST(testChildrenFollowModelOrder);
    CPPUNIT_TEST(testUnorderedKeepsValueOrder);
    CPPUNIT_TEST(testStrictEncodeErrors);
    CPPUNIT_TEST(testLaxEncodeCollectsErrors);
    CPPUNIT_TEST(testSaveAndReload);
    CPPUNIT_TEST(testEncodeUnknownElement);
    CPPUNIT_TEST(testRepeatedGroupsInterleave);
    CPPUNIT_TEST_SUITE_END();

public:

    void setUp()
    {
        m_pSchema = loadTestSchema(orderSchema);
        m_options.namespaces["o"] = "urn:orders";
    }

    void tearDown()
    {
        m_pSchema.reset();
    }

    Value makeOrder()
    {
        Value line = Value::makeMap();
        line.set("o:price", Value::makeDecimal("12.25"));
        line.set("o:sku", Value::makeString("C-3"));

        Value lines = Value::makeList();
        lines.append(line);

        Value order = Value::makeMap();
        order.set("o:line", lines);
        order.set("@id", Value::makeInteger(7));
        order.set("o:customer", Value::makeString("Bob"));
        return order;
    }

    void testStrictRoundTrip()
    {
        std::shared_ptr<XmlElement> pDoc = parseInstance(orderInstance);
        CPPUNIT_ASSERT(m_pSchema->isValid(*pDoc));

        Value value = m_pSchema->decode(*pDoc, ValidationContext::strict, m_options);
        std::shared_ptr<XmlElement> pEncoded = m_pSchema->encode(value, "o:order", ValidationContext::strict, m_options);
        CPPUNIT_ASSERT(pEncoded != nullptr);

        std::string diff;
        CPPUNIT_ASSERT_MESSAGE(diff, pEncoded->isEquivalent(*pDoc, true, &diff));

        //
        // Same again with the default and a qualified name given in full
        ConverterOptions plain;
        value = m_pSchema->decode(*pDoc, ValidationContext::strict, plain);
        pEncoded = m_pSchema->encode(value, "{urn:orders}order", ValidationContext::strict, plain);
        CPPUNIT_ASSERT_MESSAGE(diff, pEncoded->isEquivalent(*pDoc, true, &diff));
    }

    void testChildrenFollowModelOrder()
    {
        std::shared_ptr<XmlElement> pEncoded = m_pSchema->encode(makeOrder(), "o:order", ValidationContext::strict, m_options);
        CPPUNIT_ASSERT_EQUAL(std::string("{urn:orders}order"), pEncoded->getTag());
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), pEncoded->getNumChildren());
        CPPUNIT_ASSERT_EQUAL(std::string("{urn:orders}customer"), pEncoded->getChildren()[0]->getTag());

        const XmlElement &line = *pEncoded->getChildren()[1];
        CPPUNIT_ASSERT_EQUAL(std::string("{urn:orders}sku"), line.getChildren()[0]->getTag());
        CPPUNIT_ASSERT_EQUAL(std::string("12.25"), line.getChildren()[1]->getText());

        std::string id;
        CPPUNIT_ASSERT(pEncoded->getAttribute("id", id));
        CPPUNIT_ASSERT_EQUAL(std::string("7"), id);
        CPPUNIT_ASSERT(m_pSchema->isValid(*pEncoded));
    }

    void testUnorderedKeepsValueOrder()
    {
        std::shared_ptr<XmlElement> pEncoded = m_pSchema->encode(makeOrder(), "o:order", ValidationContext::strict, m_options, nullptr, true);
        CPPUNIT_ASSERT_EQUAL(std::string("{urn:orders}line"), pEncoded->getChildren()[0]->getTag());
        CPPUNIT_ASSERT(!m_pSchema->isValid(*pEncoded));
    }

    void testStrictEncodeErrors()
    {
        Value order = makeOrder();
        order.set("@id", Value::makeString("seven"));
        CPPUNIT_ASSERT_THROW(m_pSchema->encode(order, "o:order", ValidationContext::strict, m_options), EncodeException);

        order = makeOrder();
        order.erase("o:customer");
        CPPUNIT_ASSERT_THROW(m_pSchema->encode(order, "o:order", ValidationContext::strict, m_options), ValidationException);

        order = makeOrder();
        order.set("o:customer", Value::makeList());
        order.find("o:customer")->append(Value::makeString("x"));
        order.find("o:customer")->append(Value::makeString("y"));
        CPPUNIT_ASSERT_THROW(m_pSchema->encode(order, "o:order", ValidationContext::strict, m_options), ValidationException);

        CPPUNIT_ASSERT_THROW(m_pSchema->encode(Value::makeString("text"), "o:order", ValidationContext::strict, m_options), EncodeException);
    }

    void testLaxEncodeCollectsErrors()
    {
        Value order = makeOrder();
        order.set("@id", Value::makeString("seven"));
        order.set("o:hobby", Value::makeString("chess"));
        order.find("o:line")->at(0).set("o:price", Value::makeString("cheap"));

        std::vector<ValidationError> errors;
        std::shared_ptr<XmlElement> pEncoded = m_pSchema->encode(order, "o:order", ValidationContext::lax, m_options, &errors);
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(3), errors.size());
        CPPUNIT_ASSERT_EQUAL(ValidationError::encode, errors[0].kind);
        CPPUNIT_ASSERT_EQUAL(std::string("/order/@id"), errors[0].path);
        CPPUNIT_ASSERT(hasErrorContaining(errors, "does not match any declared element"));
        CPPUNIT_ASSERT(pEncoded != nullptr);
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), pEncoded->getNumChildren());

        errors.clear();
        m_pSchema->encode(order, "o:order", ValidationContext::skip, m_options, &errors);
        CPPUNIT_ASSERT(errors.empty());
    }

    void testSaveAndReload()
    {
        std::shared_ptr<XmlElement> pEncoded = m_pSchema->encode(makeOrder(), "o:order", ValidationContext::strict, m_options);

        std::ostringstream out;
        m_pSchema->saveDocument(out, *pEncoded, m_options.namespaces);
        std::string xml = out.str();
        CPPUNIT_ASSERT(xml.find("<o:order") != std::string::npos);
        CPPUNIT_ASSERT(xml.find("xmlns:o=\"urn:orders\"") != std::string::npos);

        std::istringstream in(xml);
        std::shared_ptr<XmlElement> pReloaded = m_pSchema->loadDocument(in);
        std::string diff;
        CPPUNIT_ASSERT_MESSAGE(diff, pReloaded->isEquivalent(*pEncoded, true, &diff));

        //
        // Unmapped namespaces get a generated prefix
        std::ostringstream generated;
        m_pSchema->saveDocument(generated, *pEncoded);
        CPPUNIT_ASSERT(generated.str().find("xmlns:ns") != std::string::npos);
    }

    void testEncodeUnknownElement()
    {
        CPPUNIT_ASSERT_THROW(m_pSchema->encode(makeOrder(), "o:invoice", ValidationContext::strict, m_options), EncodeException);

        std::vector<ValidationError> errors;
        m_pSchema->encode(Value::makeString("x"), "o:invoice", ValidationContext::lax, m_options, &errors);
        CPPUNIT_ASSERT(hasErrorContaining(errors, "is not an element of the schema"));
    }

    void testRepeatedGroupsInterleave()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="pairs">
                    <xs:complexType>
                        <xs:sequence maxOccurs="unbounded">
                            <xs:element name="key" type="xs:string"/>
                            <xs:element name="val" type="xs:int"/>
                        </xs:sequence>
                    </xs:complexType>
                </xs:element>
                <xs:element name="shapes">
                    <xs:complexType>
                        <xs:choice maxOccurs="unbounded">
                            <xs:element name="circle" type="xs:decimal"/>
                            <xs:element name="square" type="xs:decimal"/>
                        </xs:choice>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        std::shared_ptr<XmlElement> pPairs = parseInstance("<pairs><key>a</key><val>1</val><key>b</key><val>2</val><key>c</key><val>3</val></pairs>");
        Value pairs = pSchema->decode(*pPairs);
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(3), pairs.find("key")->size());

        std::shared_ptr<XmlElement> pEncoded = pSchema->encode(pairs, "pairs");
        std::string diff;
        CPPUNIT_ASSERT_MESSAGE(diff, pEncoded->isEquivalent(*pPairs, true, &diff));
        CPPUNIT_ASSERT_EQUAL(std::string("key"), pEncoded->getChildren()[2]->getTag());
        CPPUNIT_ASSERT_EQUAL(std::string("b"), pEncoded->getChildren()[2]->getText());

        //
        // The decoded map groups each alternative, any valid ordering is accepted
        std::shared_ptr<XmlElement> pShapes = parseInstance("<shapes><square>2</square><circle>1.5</circle><square>4</square></shapes>");
        Value shapes = pSchema->decode(*pShapes);
        std::vector<ValidationError> errors;
        pEncoded = pSchema->encode(shapes, "shapes", ValidationContext::lax, ConverterOptions(), &errors);
        CPPUNIT_ASSERT_MESSAGE(describeErrors(errors), errors.empty());
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(3), pEncoded->getChildren().size());
        CPPUNIT_ASSERT_EQUAL(std::string("square"), pEncoded->getChildren()[0]->getTag());
        CPPUNIT_ASSERT(pSchema->isValid(*pEncoded));
    }

private:
    std::shared_ptr<XMLSchema> m_pSchema;
    ConverterOptions m_options;
};

CPPUNIT_TEST_SUITE_REGISTRATION(EncodeTests);
CPPUNIT_TEST_SUITE_NAMED_REGISTRATION(EncodeTests, "encode");
