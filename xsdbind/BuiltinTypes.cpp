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


#include <cstdint>
#include "BuiltinTypes.hpp"
#include "SchemaRegistry.hpp"
#include "SchemaFacet.hpp"
#include "Utils.hpp"

using namespace xsdbind;


void BuiltinTypes::addToRegistry(SchemaRegistry &registry)
{
    //
    // anyType: mixed content, any element and any attribute, both processed laxly
    std::shared_ptr<ComplexType> pAnyType = std::make_shared<ComplexType>(makeQName(XSD_NAMESPACE, "anyType"));
    std::shared_ptr<ModelGroup> pAnyContent = std::make_shared<ModelGroup>("", ModelGroup::sequenceModel);
    std::shared_ptr<Wildcard> pAnyElement = std::make_shared<Wildcard>("");
    pAnyElement->setProcessContents(Wildcard::laxContents);
    pAnyElement->setOccurs(0, Particle::UNBOUNDED);
    pAnyContent->addParticle(pAnyElement);
    pAnyContent->setBuilt(true);
    std::shared_ptr<Wildcard> pAnyAttribute = std::make_shared<Wildcard>("", true);
    pAnyAttribute->setProcessContents(Wildcard::laxContents);
    pAnyType->setContentGroup(pAnyContent);
    pAnyType->getAttributeGroup().setWildcard(pAnyAttribute);
    pAnyType->getAttributeGroup().setBuilt(true);
    pAnyType->setMixed(true);
    pAnyType->setGlobal(true);
    pAnyType->setBuilt(true);
    registry.addType(pAnyType);

    std::shared_ptr<SimpleType> pAnySimple = addAtomic(registry, "anySimpleType", PrimitiveType::anySimpleKind, pAnyType.get());
    std::shared_ptr<SimpleType> pAnyAtomic = addAtomic(registry, "anyAtomicType", PrimitiveType::anySimpleKind, pAnySimple.get());

    //
    // Primitives
    std::shared_ptr<SimpleType> pString = addAtomic(registry, "string", PrimitiveType::stringKind, pAnyAtomic.get());
    addAtomic(registry, "boolean", PrimitiveType::booleanKind, pAnyAtomic.get());
    std::shared_ptr<SimpleType> pDecimal = addAtomic(registry, "decimal", PrimitiveType::decimalKind, pAnyAtomic.get());
    addAtomic(registry, "float", PrimitiveType::floatKind, pAnyAtomic.get());
    addAtomic(registry, "double", PrimitiveType::doubleKind, pAnyAtomic.get());
    addAtomic(registry, "duration", PrimitiveType::durationKind, pAnyAtomic.get());
    addAtomic(registry, "dateTime", PrimitiveType::dateTimeKind, pAnyAtomic.get());
    addAtomic(registry, "time", PrimitiveType::timeKind, pAnyAtomic.get());
    addAtomic(registry, "date", PrimitiveType::dateKind, pAnyAtomic.get());
    addAtomic(registry, "gYearMonth", PrimitiveType::gYearMonthKind, pAnyAtomic.get());
    addAtomic(registry, "gYear", PrimitiveType::gYearKind, pAnyAtomic.get());
    addAtomic(registry, "gMonthDay", PrimitiveType::gMonthDayKind, pAnyAtomic.get());
    addAtomic(registry, "gDay", PrimitiveType::gDayKind, pAnyAtomic.get());
    addAtomic(registry, "gMonth", PrimitiveType::gMonthKind, pAnyAtomic.get());
    addAtomic(registry, "hexBinary", PrimitiveType::hexBinaryKind, pAnyAtomic.get());
    addAtomic(registry, "base64Binary", PrimitiveType::base64BinaryKind, pAnyAtomic.get());
    addAtomic(registry, "anyURI", PrimitiveType::anyURIKind, pAnyAtomic.get());
    addAtomic(registry, "QName", PrimitiveType::QNameKind, pAnyAtomic.get());
    addAtomic(registry, "NOTATION", PrimitiveType::NOTATIONKind, pAnyAtomic.get());

    //
    // String family
    std::shared_ptr<SimpleType> pNormalized = addRestriction(registry, "normalizedString", pString);
    pNormalized->getFacets().addFacet(std::make_shared<WhiteSpaceFacet>(PrimitiveType::replace));
    std::shared_ptr<SimpleType> pToken = addRestriction(registry, "token", pNormalized);
    pToken->getFacets().addFacet(std::make_shared<WhiteSpaceFacet>(PrimitiveType::collapse));
    std::shared_ptr<SimpleType> pLanguage = addRestriction(registry, "language", pToken);
    addPattern(pLanguage, "[a-zA-Z]{1,8}(-[a-zA-Z0-9]{1,8})*");
    std::shared_ptr<SimpleType> pNmtoken = addRestriction(registry, "NMTOKEN", pToken);
    addPattern(pNmtoken, "\\c+");
    std::shared_ptr<SimpleType> pName = addRestriction(registry, "Name", pToken);
    addPattern(pName, "\\i\\c*");
    std::shared_ptr<SimpleType> pNCName = addRestriction(registry, "NCName", pName);
    addPattern(pNCName, "[\\i-[:]][\\c-[:]]*");
    addRestriction(registry, "ID", pNCName);
    std::shared_ptr<SimpleType> pIdref = addRestriction(registry, "IDREF", pNCName);
    std::shared_ptr<SimpleType> pEntity = addRestriction(registry, "ENTITY", pNCName);
    addList(registry, "NMTOKENS", pNmtoken);
    addList(registry, "IDREFS", pIdref);
    addList(registry, "ENTITIES", pEntity);

    //
    // Integer family
    std::shared_ptr<SimpleType> pInteger = addRestriction(registry, "integer", pDecimal);
    pInteger->setPrimitive(PrimitiveType::integerKind);
    pInteger->getFacets().addFacet(std::make_shared<DigitsFacet>(SchemaFacet::fractionDigits, 0, true));
    addPattern(pInteger, "[\\-+]?[0-9]+");

    std::shared_ptr<SimpleType> pNonPositive = addRestriction(registry, "nonPositiveInteger", pInteger);
    addIntegerRange(pNonPositive, false, 0, true, 0);
    std::shared_ptr<SimpleType> pNegative = addRestriction(registry, "negativeInteger", pNonPositive);
    addIntegerRange(pNegative, false, 0, true, -1);

    std::shared_ptr<SimpleType> pLong = addRestriction(registry, "long", pInteger);
    addIntegerRange(pLong, true, INT64_MIN, true, INT64_MAX);
    std::shared_ptr<SimpleType> pInt = addRestriction(registry, "int", pLong);
    addIntegerRange(pInt, true, INT32_MIN, true, INT32_MAX);
    std::shared_ptr<SimpleType> pShort = addRestriction(registry, "short", pInt);
    addIntegerRange(pShort, true, INT16_MIN, true, INT16_MAX);
    std::shared_ptr<SimpleType> pByte = addRestriction(registry, "byte", pShort);
    addIntegerRange(pByte, true, INT8_MIN, true, INT8_MAX);

    std::shared_ptr<SimpleType> pNonNegative = addRestriction(registry, "nonNegativeInteger", pInteger);
    addIntegerRange(pNonNegative, true, 0, false, 0);
    std::shared_ptr<SimpleType> pPositive = addRestriction(registry, "positiveInteger", pNonNegative);
    addIntegerRange(pPositive, true, 1, false, 0);

    //
    // Native integers are 64-bit signed, so unsignedLong stops at the int64 maximum
    std::shared_ptr<SimpleType> pUnsignedLong = addRestriction(registry, "unsignedLong", pNonNegative);
    addIntegerRange(pUnsignedLong, false, 0, true, INT64_MAX);
    std::shared_ptr<SimpleType> pUnsignedInt = addRestriction(registry, "unsignedInt", pUnsignedLong);
    addIntegerRange(pUnsignedInt, false, 0, true, UINT32_MAX);
    std::shared_ptr<SimpleType> pUnsignedShort = addRestriction(registry, "unsignedShort", pUnsignedInt);
    addIntegerRange(pUnsignedShort, false, 0, true, UINT16_MAX);
    std::shared_ptr<SimpleType> pUnsignedByte = addRestriction(registry, "unsignedByte", pUnsignedShort);
    addIntegerRange(pUnsignedByte, false, 0, true, UINT8_MAX);

    registry.setNumBuiltinTypes(registry.getTypes().size());
}


std::shared_ptr<SimpleType> BuiltinTypes::addAtomic(SchemaRegistry &registry, const std::string &localName, PrimitiveType::primitiveKind kind, const SchemaType *pBase)
{
    std::shared_ptr<SimpleType> pType = std::make_shared<SimpleType>(makeQName(XSD_NAMESPACE, localName));
    pType->setPrimitive(kind);
    if (pBase != nullptr)
    {
        pType->setBaseType(pBase);
        pType->setBaseName(pBase->getName());
        pType->setDerivation(SchemaType::restriction);
    }
    pType->setGlobal(true);
    pType->setBuilt(true);
    registry.addType(pType);
    return pType;
}


std::shared_ptr<SimpleType> BuiltinTypes::addRestriction(SchemaRegistry &registry, const std::string &localName, const std::shared_ptr<SimpleType> &pBase)
{
    return addAtomic(registry, localName, pBase->getPrimitive(), pBase.get());
}


std::shared_ptr<SimpleType> BuiltinTypes::addList(SchemaRegistry &registry, const std::string &localName, const std::shared_ptr<SimpleType> &pItemType)
{
    std::shared_ptr<SimpleType> pType = std::make_shared<SimpleType>(makeQName(XSD_NAMESPACE, localName), SimpleType::listVariety);
    pType->setItemType(pItemType.get());
    pType->setItemTypeName(pItemType->getName());
    pType->getFacets().addFacet(std::make_shared<LengthFacet>(SchemaFacet::minLength, 1));
    pType->setGlobal(true);
    pType->setBuilt(true);
    registry.addType(pType);
    return pType;
}


void BuiltinTypes::addIntegerRange(const std::shared_ptr<SimpleType> &pType, bool hasMin, int64_t minValue, bool hasMax, int64_t maxValue)
{
    if (hasMin)
        pType->getFacets().addFacet(std::make_shared<BoundFacet>(SchemaFacet::minInclusive, Value::makeInteger(minValue)));
    if (hasMax)
        pType->getFacets().addFacet(std::make_shared<BoundFacet>(SchemaFacet::maxInclusive, Value::makeInteger(maxValue)));
}


void BuiltinTypes::addPattern(const std::shared_ptr<SimpleType> &pType, const std::string &pattern)
{
    std::shared_ptr<PatternFacet> pPattern = std::make_shared<PatternFacet>();
    pPattern->addPattern(pattern);
    pType->getFacets().addFacet(pPattern);
}
