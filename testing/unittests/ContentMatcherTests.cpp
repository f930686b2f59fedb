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
#include "ContentMatcher.hpp"
#include "ComplexType.hpp"
#include "ElementDecl.hpp"
#include "ModelGroup.hpp"

using namespace xsdbind;


class ContentMatcherTests : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(ContentMatcherTests);
    CPPUNIT_TEST(testSequenceExactOccurs);
    CPPUNIT_TEST(testAllGroupAnyOrder);
    CPPUNIT_TEST(testChoiceTakesFirstAlternative);
    CPPUNIT_TEST(testChoiceExpectedNames);
    CPPUNIT_TEST(testRepeatedGroupRef);
    CPPUNIT_TEST(testEmptyContent);
    CPPUNIT_TEST(testWildcardNamespaces);
    CPPUNIT_TEST(testSubstitutionGroup);
    CPPUNIT_TEST(testMatchRecoversAfterBadChild);
    CPPUNIT_TEST_SUITE_END();

public:

    static const ModelGroup *getRootGroup(const XMLSchema &schema, const std::string &rootName)
    {
        const ElementDecl *pRoot = schema.getElement(rootName);
        CPPUNIT_ASSERT(pRoot != nullptr);
        CPPUNIT_ASSERT(pRoot->getType() != nullptr && pRoot->getType()->isComplex());
        return static_cast<const ComplexType *>(pRoot->getType())->getContentGroup();
    }

    void testSequenceExactOccurs()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="root">
                    <xs:complexType>
                        <xs:sequence>
                            <xs:element name="A" type="xs:string" minOccurs="2" maxOccurs="2"/>
                        </xs:sequence>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        std::vector<ValidationError> errors = pSchema->getErrors(*parseInstance("<root><A>1</A><A>2</A></root>"));
        CPPUNIT_ASSERT_MESSAGE(describeErrors(errors), errors.empty());

        errors = pSchema->getErrors(*parseInstance("<root><A>1</A></root>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT_EQUAL(std::string("tag expected: 'A'"), errors[0].reason);
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), errors[0].expected.size());
        CPPUNIT_ASSERT_EQUAL(std::string("A"), errors[0].expected[0]);

        errors = pSchema->getErrors(*parseInstance("<root><A>1</A><A>2</A><A>3</A></root>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT_EQUAL(std::string("unexpected tag 'A'"), errors[0].reason);

        ContentMatcher matcher(pSchema->getRegistry());
        const ModelGroup *pGroup = getRootGroup(*pSchema, "root");
        CPPUNIT_ASSERT(matcher.isMatch(pGroup, { "A", "A" }));
        CPPUNIT_ASSERT(!matcher.isMatch(pGroup, { "A" }));
        CPPUNIT_ASSERT(!matcher.isMatch(pGroup, { "A", "A", "A" }));
    }

    void testAllGroupAnyOrder()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="root">
                    <xs:complexType>
                        <xs:all>
                            <xs:element name="A" type="xs:string"/>
                            <xs:element name="B" type="xs:string" minOccurs="0"/>
                            <xs:element name="C" type="xs:string" minOccurs="0"/>
                        </xs:all>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        Value result = pSchema->decode(*parseInstance("<root><C>c</C><A>a</A></root>"));
        CPPUNIT_ASSERT(result.isMap());
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), result.size());
        CPPUNIT_ASSERT(result.find("A") != nullptr);
        CPPUNIT_ASSERT(result.find("C") != nullptr);
        CPPUNIT_ASSERT(result.find("B") == nullptr);
        CPPUNIT_ASSERT_EQUAL(std::string("a"), result.find("A")->getString());

        std::vector<ValidationError> errors = pSchema->getErrors(*parseInstance("<root><B>b</B><C>c</C></root>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT_EQUAL(std::string("tag expected: 'A'"), errors[0].reason);

        errors = pSchema->getErrors(*parseInstance("<root><A>a</A><A>a</A></root>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
    }

    void testChoiceTakesFirstAlternative()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="root">
                    <xs:complexType>
                        <xs:choice>
                            <xs:sequence>
                                <xs:element name="A" type="xs:string"/>
                                <xs:element name="B" type="xs:string" minOccurs="0"/>
                            </xs:sequence>
                            <xs:sequence>
                                <xs:element name="A" type="xs:string"/>
                                <xs:element name="C" type="xs:string" minOccurs="0"/>
                            </xs:sequence>
                        </xs:choice>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        const ModelGroup *pChoice = getRootGroup(*pSchema, "root");
        CPPUNIT_ASSERT(pChoice != nullptr);
        CPPUNIT_ASSERT_EQUAL(ModelGroup::choiceModel, pChoice->getModel());
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), pChoice->getParticles().size());
        auto pFirst = std::dynamic_pointer_cast<ModelGroup>(pChoice->getParticles()[0]);
        CPPUNIT_ASSERT(pFirst != nullptr);

        ContentMatcher matcher(pSchema->getRegistry());
        DefaultConverter converter;
        ErrorCollector collector;
        ValidationContext ctx(pSchema->getRegistry(), ValidationContext::lax, &collector, converter);
        std::vector<MatchPair> pairs = matcher.match(pChoice, { "A" }, ctx);
        CPPUNIT_ASSERT(collector.empty());
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), pairs.size());
        CPPUNIT_ASSERT(pairs[0].pParticle == pFirst->getParticles()[0].get());

        //
        // The first alternative already consumed A, so C is left over
        pairs = matcher.match(pChoice, { "A", "C" }, ctx);
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(collector.getErrors()), static_cast<size_t>(1), collector.getNumErrors());
        CPPUNIT_ASSERT_EQUAL(std::string("unexpected tag 'C'"), collector.getErrors()[0].reason);
        CPPUNIT_ASSERT(pairs[0].pParticle == pFirst->getParticles()[0].get());
    }

    void testChoiceExpectedNames()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="shape">
                    <xs:complexType>
                        <xs:choice>
                            <xs:element name="circle" type="xs:string"/>
                            <xs:element name="square" type="xs:string"/>
                        </xs:choice>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        std::vector<ValidationError> errors = pSchema->getErrors(*parseInstance("<shape><triangle/></shape>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT_EQUAL(std::string("tag expected: one of 'circle', 'square', found 'triangle'"), errors[0].reason);
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), errors[0].expected.size());
        CPPUNIT_ASSERT_EQUAL(std::string("triangle"), errors[0].value);
    }

    void testRepeatedGroupRef()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:group name="pair">
                    <xs:sequence>
                        <xs:element name="key" type="xs:string"/>
                        <xs:element name="value" type="xs:int" minOccurs="0"/>
                    </xs:sequence>
                </xs:group>
                <xs:element name="dictionary">
                    <xs:complexType>
                        <xs:sequence>
                            <xs:group ref="pair" minOccurs="1" maxOccurs="3"/>
                        </xs:sequence>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance("<dictionary><key>a</key><value>1</value><key>b</key><key>c</key><value>3</value></dictionary>")));
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance("<dictionary/>")));
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance("<dictionary><value>1</value></dictionary>")));
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance("<dictionary><key>a</key><key>b</key><key>c</key><key>d</key></dictionary>")));

        Value result = pSchema->decode(*parseInstance("<dictionary><key>a</key><value>1</value><key>b</key></dictionary>"));
        const Value *pKeys = result.find("key");
        CPPUNIT_ASSERT(pKeys != nullptr && pKeys->isList());
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), pKeys->size());
    }

    void testEmptyContent()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="marker">
                    <xs:complexType>
                        <xs:attribute name="id" type="xs:int"/>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance("<marker id='3'/>")));
        std::vector<ValidationError> errors = pSchema->getErrors(*parseInstance("<marker><child/></marker>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT(hasErrorContaining(errors, "empty content"));
    }

    void testWildcardNamespaces()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema" targetNamespace="urn:orders" xmlns="urn:orders" elementFormDefault="qualified">
                <xs:element name="order">
                    <xs:complexType>
                        <xs:sequence>
                            <xs:element name="id" type="xs:int"/>
                            <xs:any namespace="##other" processContents="skip" minOccurs="0" maxOccurs="unbounded"/>
                        </xs:sequence>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance(
            "<o:order xmlns:o='urn:orders' xmlns:x='urn:extra'><o:id>1</o:id><x:note>anything <x:b>here</x:b></x:note></o:order>")));

        std::vector<ValidationError> errors = pSchema->getErrors(*parseInstance(
            "<o:order xmlns:o='urn:orders'><o:id>1</o:id><o:note/></o:order>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());

        //
        // ##other excludes unqualified names too
        errors = pSchema->getErrors(*parseInstance("<o:order xmlns:o='urn:orders'><o:id>1</o:id><note/></o:order>"));
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
    }

    void testSubstitutionGroup()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="shape" type="xs:string" abstract="true"/>
                <xs:element name="circle" type="xs:string" substitutionGroup="shape"/>
                <xs:element name="square" type="xs:string" substitutionGroup="shape"/>
                <xs:element name="roundedSquare" type="xs:string" substitutionGroup="square"/>
                <xs:element name="drawing">
                    <xs:complexType>
                        <xs:sequence>
                            <xs:element ref="shape" maxOccurs="unbounded"/>
                        </xs:sequence>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        CPPUNIT_ASSERT(pSchema->isValid(*parseInstance("<drawing><circle>c</circle><square>s</square><roundedSquare>r</roundedSquare></drawing>")));
        CPPUNIT_ASSERT(!pSchema->isValid(*parseInstance("<drawing><shape>s</shape></drawing>")));
        CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(3), pSchema->getRegistry().getSubstitutes("shape").size());

        std::vector<ValidationError> errors = pSchema->getErrors(*parseInstance("<shape>s</shape>"));
        CPPUNIT_ASSERT(hasErrorContaining(errors, "abstract"));
    }

    void testMatchRecoversAfterBadChild()
    {
        constexpr const char *xsd = R"!!!(
            <xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
                <xs:element name="person">
                    <xs:complexType>
                        <xs:sequence>
                            <xs:element name="first" type="xs:string"/>
                            <xs:element name="middle" type="xs:string" minOccurs="0"/>
                            <xs:element name="last" type="xs:string"/>
                            <xs:element name="age" type="xs:int"/>
                        </xs:sequence>
                    </xs:complexType>
                </xs:element>
            </xs:schema>
        )!!!";
        std::shared_ptr<XMLSchema> pSchema = loadTestSchema(xsd);

        std::vector<ValidationError> errors;
        Value result = pSchema->decode(*parseInstance("<person><first>Ada</first><nickname>A</nickname><last>Lovelace</last><age>36</age></person>"),
            ValidationContext::lax, ConverterOptions(), &errors);
        CPPUNIT_ASSERT_EQUAL_MESSAGE(describeErrors(errors), static_cast<size_t>(1), errors.size());
        CPPUNIT_ASSERT_EQUAL(std::string("nickname"), errors[0].value);
        CPPUNIT_ASSERT(errors[0].reason.find("'middle'") != std::string::npos);
        CPPUNIT_ASSERT(errors[0].reason.find("'last'") != std::string::npos);

        CPPUNIT_ASSERT(result.find("nickname") == nullptr);
        CPPUNIT_ASSERT_EQUAL(std::string("Lovelace"), result.find("last")->getString());
        CPPUNIT_ASSERT_EQUAL(static_cast<int64_t>(36), result.find("age")->getInteger());
    }
};

CPPUNIT_TEST_SUITE_REGISTRATION(ContentMatcherTests);
CPPUNIT_TEST_SUITE_NAMED_REGISTRATION(ContentMatcherTests, "matcher");
