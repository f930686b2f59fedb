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

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>
#include "PrimitiveType.hpp"
#include "Utils.hpp"

using namespace xsdbind;

#define TZ_EXPR "(Z|[+-]((0[0-9]|1[0-3]):[0-5][0-9]|14:00))?"
#define YEAR_EXPR "-?([1-9][0-9]{3,}|0[0-9]{3})"
#define MONTH_EXPR "(0[1-9]|1[0-2])"
#define DAY_EXPR "(0[1-9]|[12][0-9]|3[01])"
#define TIME_EXPR "(([01][0-9]|2[0-3]):[0-5][0-9]:[0-5][0-9](\\.[0-9]+)?|24:00:00(\\.0+)?)"


static const std::regex &getLexicalRegex(PrimitiveType::primitiveKind kind)
{
    static const std::regex anyExpr(".*");
    static const std::regex decimalExpr("[+-]?([0-9]+(\\.[0-9]*)?|\\.[0-9]+)");
    static const std::regex integerExpr("[+-]?[0-9]+");
    static const std::regex floatExpr("[+-]?([0-9]+(\\.[0-9]*)?|\\.[0-9]+)([eE][+-]?[0-9]+)?|[+-]?INF|NaN");
    static const std::regex durationExpr("-?P(?=[0-9]|T[0-9])([0-9]+Y)?([0-9]+M)?([0-9]+D)?(T(?=[0-9])([0-9]+H)?([0-9]+M)?([0-9]+(\\.[0-9]+)?S)?)?");
    static const std::regex dateTimeExpr(YEAR_EXPR "-" MONTH_EXPR "-" DAY_EXPR "T" TIME_EXPR TZ_EXPR);
    static const std::regex timeExpr(TIME_EXPR TZ_EXPR);
    static const std::regex dateExpr(YEAR_EXPR "-" MONTH_EXPR "-" DAY_EXPR TZ_EXPR);
    static const std::regex gYearMonthExpr(YEAR_EXPR "-" MONTH_EXPR TZ_EXPR);
    static const std::regex gYearExpr(YEAR_EXPR TZ_EXPR);
    static const std::regex gMonthDayExpr("--" MONTH_EXPR "-" DAY_EXPR TZ_EXPR);
    static const std::regex gDayExpr("---" DAY_EXPR TZ_EXPR);
    static const std::regex gMonthExpr("--" MONTH_EXPR TZ_EXPR);
    static const std::regex hexBinaryExpr("([0-9a-fA-F]{2})*");
    static const std::regex base64Expr("((([A-Za-z0-9+/] ?){4})*(([A-Za-z0-9+/] ?){3}[A-Za-z0-9+/]|([A-Za-z0-9+/] ?){2}[AEIMQUYcgkosw048] ?=|[A-Za-z0-9+/] ?[AQgw] ?= ?=))?");
    static const std::regex qnameExpr("([A-Za-z_][-.A-Za-z0-9_]*:)?[A-Za-z_][-.A-Za-z0-9_]*");

    switch (kind)
    {
        case PrimitiveType::decimalKind:      return decimalExpr;
        case PrimitiveType::integerKind:      return integerExpr;
        case PrimitiveType::floatKind:
        case PrimitiveType::doubleKind:       return floatExpr;
        case PrimitiveType::durationKind:     return durationExpr;
        case PrimitiveType::dateTimeKind:     return dateTimeExpr;
        case PrimitiveType::timeKind:         return timeExpr;
        case PrimitiveType::dateKind:         return dateExpr;
        case PrimitiveType::gYearMonthKind:   return gYearMonthExpr;
        case PrimitiveType::gYearKind:        return gYearExpr;
        case PrimitiveType::gMonthDayKind:    return gMonthDayExpr;
        case PrimitiveType::gDayKind:         return gDayExpr;
        case PrimitiveType::gMonthKind:       return gMonthExpr;
        case PrimitiveType::hexBinaryKind:    return hexBinaryExpr;
        case PrimitiveType::base64BinaryKind: return base64Expr;
        case PrimitiveType::QNameKind:
        case PrimitiveType::NOTATIONKind:     return qnameExpr;
        default:                              return anyExpr;
    }
}


bool PrimitiveType::decode(primitiveKind kind, const std::string &text, Value &value, std::string &reason)
{
    if (kind == anySimpleKind || kind == stringKind || kind == anyURIKind)
    {
        value = Value::makeString(text);
        return true;
    }

    if (kind == booleanKind)
    {
        if (text == "true" || text == "1")
            value = Value::makeBool(true);
        else if (text == "false" || text == "0")
            value = Value::makeBool(false);
        else
        {
            reason = "invalid value '" + text + "' for type boolean";
            return false;
        }
        return true;
    }

    if (!std::regex_match(text, getLexicalRegex(kind)))
    {
        reason = "invalid value '" + text + "' for type " + getKindName(kind);
        return false;
    }

    switch (kind)
    {
        case decimalKind:
            value = Value::makeDecimal(text);
            break;

        case integerKind:
        {
            errno = 0;
            long long intValue = std::strtoll(text.c_str(), nullptr, 10);
            if (errno == ERANGE)
            {
                reason = "value '" + text + "' is out of the 64-bit integer range";
                return false;
            }
            value = Value::makeInteger(static_cast<int64_t>(intValue));
            break;
        }

        case floatKind:
        case doubleKind:
        {
            double dblValue;
            if (text == "INF" || text == "+INF")
                dblValue = std::numeric_limits<double>::infinity();
            else if (text == "-INF")
                dblValue = -std::numeric_limits<double>::infinity();
            else if (text == "NaN")
                dblValue = std::numeric_limits<double>::quiet_NaN();
            else
                dblValue = std::strtod(text.c_str(), nullptr);

            if (kind == floatKind)
                dblValue = static_cast<double>(static_cast<float>(dblValue));
            value = Value::makeDouble(dblValue);
            break;
        }

        default:
            value = Value::makeString(text);
            break;
    }
    return true;
}


bool PrimitiveType::encode(primitiveKind kind, const Value &value, std::string &text, std::string &reason)
{
    bool typeOk = false;
    switch (kind)
    {
        case anySimpleKind:
            typeOk = !value.isMap();
            break;
        case booleanKind:
            typeOk = value.getType() == Value::boolValue;
            break;
        case decimalKind:
            typeOk = value.isNumeric();
            break;
        case integerKind:
            typeOk = value.getType() == Value::intValue ||
                (value.getType() == Value::decimalValue && value.getDecimal().find('.') == std::string::npos);
            break;
        case floatKind:
        case doubleKind:
            typeOk = value.isNumeric();
            break;
        default:
            typeOk = value.isString();
            break;
    }

    if (!typeOk)
    {
        reason = std::string(Value::getTypeName(value.getType())) + " value " + value.toString() + " is not compatible with type " + getKindName(kind);
        return false;
    }

    if (kind == floatKind || kind == doubleKind)
        text = Value::makeDouble(value.getDouble()).toLexical();
    else
        text = value.toLexical();

    //
    // The rendered text must read back as the same kind
    Value check;
    return decode(kind, text, check, reason);
}


size_t PrimitiveType::getLength(primitiveKind kind, const Value &value)
{
    std::string text = value.toLexical();
    size_t length = 0;
    if (kind == hexBinaryKind)
    {
        length = text.length() / 2;
    }
    else if (kind == base64BinaryKind)
    {
        size_t chars = 0, padding = 0;
        for (char c : text)
        {
            if (c == '=')
                ++padding;
            else if (!isXmlWhitespace(c))
                ++chars;
        }
        length = ((chars + padding) / 4) * 3 - padding;
    }
    else
    {
        //
        // UTF-8 code points, continuation bytes are not counted
        for (unsigned char c : text)
        {
            if ((c & 0xC0) != 0x80)
                ++length;
        }
    }
    return length;
}


bool PrimitiveType::hasTimezone(const std::string &text)
{
    static const std::regex tzExpr(".*(Z|[+-][0-9]{2}:[0-9]{2})");
    return std::regex_match(text, tzExpr);
}


PrimitiveType::whiteSpacePolicy PrimitiveType::getDefaultWhiteSpace(primitiveKind kind)
{
    return (kind == stringKind || kind == anySimpleKind) ? preserve : collapse;
}


const char *PrimitiveType::getKindName(primitiveKind kind)
{
    const char *name = "unknown";
    switch (kind)
    {
        case anySimpleKind:    name = "anySimpleType"; break;
        case stringKind:       name = "string";        break;
        case booleanKind:      name = "boolean";       break;
        case decimalKind:      name = "decimal";       break;
        case integerKind:      name = "integer";       break;
        case floatKind:        name = "float";         break;
        case doubleKind:       name = "double";        break;
        case durationKind:     name = "duration";      break;
        case dateTimeKind:     name = "dateTime";      break;
        case timeKind:         name = "time";          break;
        case dateKind:         name = "date";          break;
        case gYearMonthKind:   name = "gYearMonth";    break;
        case gYearKind:        name = "gYear";         break;
        case gMonthDayKind:    name = "gMonthDay";     break;
        case gDayKind:         name = "gDay";          break;
        case gMonthKind:       name = "gMonth";        break;
        case hexBinaryKind:    name = "hexBinary";     break;
        case base64BinaryKind: name = "base64Binary";  break;
        case anyURIKind:       name = "anyURI";        break;
        case QNameKind:        name = "QName";         break;
        case NOTATIONKind:     name = "NOTATION";      break;
    }
    return name;
}


std::string PrimitiveType::normalize(whiteSpacePolicy policy, const std::string &text)
{
    std::string result = text;
    if (policy == replace)
        result = replaceWhitespace(text);
    else if (policy == collapse)
        result = collapseWhitespace(text);
    return result;
}


const char *PrimitiveType::getWhiteSpaceName(whiteSpacePolicy policy)
{
    const char *name = "preserve";
    if (policy == replace)
        name = "replace";
    else if (policy == collapse)
        name = "collapse";
    return name;
}


bool PrimitiveType::getWhiteSpaceFromName(const std::string &name, whiteSpacePolicy &policy)
{
    bool found = true;
    if (name == "preserve")       policy = preserve;
    else if (name == "replace")   policy = replace;
    else if (name == "collapse")  policy = collapse;
    else
        found = false;
    return found;
}
