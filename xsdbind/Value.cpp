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

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <algorithm>
#include <numeric>
#include "Value.hpp"
#include "Exceptions.hpp"

using namespace xsdbind;


Value Value::makeBool(bool value)
{
    Value v;
    v.m_type = boolValue;
    v.m_bool = value;
    return v;
}


Value Value::makeInteger(int64_t value)
{
    Value v;
    v.m_type = intValue;
    v.m_int = value;
    return v;
}


Value Value::makeDecimal(const std::string &lexical)
{
    Value v;
    v.m_type = decimalValue;
    v.m_string = canonicalDecimal(lexical);
    return v;
}


Value Value::makeDouble(double value)
{
    Value v;
    v.m_type = doubleValue;
    v.m_double = value;
    return v;
}


Value Value::makeString(const std::string &value)
{
    Value v;
    v.m_type = stringValue;
    v.m_string = value;
    return v;
}


Value Value::makeList()
{
    Value v;
    v.m_type = listValue;
    return v;
}


Value Value::makeMap()
{
    Value v;
    v.m_type = mapValue;
    return v;
}


const char *Value::getTypeName(valueType type)
{
    const char *name = "unknown";
    switch (type)
    {
        case nullValue:    name = "null";    break;
        case boolValue:    name = "boolean"; break;
        case intValue:     name = "integer"; break;
        case decimalValue: name = "decimal"; break;
        case doubleValue:  name = "double";  break;
        case stringValue:  name = "string";  break;
        case listValue:    name = "list";    break;
        case mapValue:     name = "map";     break;
    }
    return name;
}


void Value::checkType(valueType type) const
{
    if (m_type != type)
    {
        throw(ValueException(std::string("Value is a ") + getTypeName(m_type) + ", not a " + getTypeName(type)));
    }
}


bool Value::getBool() const
{
    checkType(boolValue);
    return m_bool;
}


int64_t Value::getInteger() const
{
    checkType(intValue);
    return m_int;
}


const std::string &Value::getDecimal() const
{
    checkType(decimalValue);
    return m_string;
}


double Value::getDouble() const
{
    if (m_type == intValue)
        return static_cast<double>(m_int);
    if (m_type == decimalValue)
        return std::strtod(m_string.c_str(), nullptr);
    checkType(doubleValue);
    return m_double;
}


const std::string &Value::getString() const
{
    checkType(stringValue);
    return m_string;
}


const Value &Value::at(size_t idx) const
{
    if (m_type != listValue && m_type != mapValue)
        throw(ValueException(std::string("Value is a ") + getTypeName(m_type) + ", not a container"));
    return m_items.at(idx);
}


Value &Value::at(size_t idx)
{
    if (m_type != listValue && m_type != mapValue)
        throw(ValueException(std::string("Value is a ") + getTypeName(m_type) + ", not a container"));
    return m_items.at(idx);
}


const std::string &Value::keyAt(size_t idx) const
{
    checkType(mapValue);
    return m_keys.at(idx);
}


void Value::append(const Value &value)
{
    checkType(listValue);
    m_items.push_back(value);
}


void Value::set(const std::string &key, const Value &value)
{
    checkType(mapValue);
    auto keyIt = std::find(m_keys.begin(), m_keys.end(), key);
    if (keyIt != m_keys.end())
    {
        m_items[keyIt - m_keys.begin()] = value;
    }
    else
    {
        m_keys.push_back(key);
        m_items.push_back(value);
    }
}


const Value *Value::find(const std::string &key) const
{
    checkType(mapValue);
    auto keyIt = std::find(m_keys.begin(), m_keys.end(), key);
    return (keyIt != m_keys.end()) ? &m_items[keyIt - m_keys.begin()] : nullptr;
}


Value *Value::find(const std::string &key)
{
    checkType(mapValue);
    auto keyIt = std::find(m_keys.begin(), m_keys.end(), key);
    return (keyIt != m_keys.end()) ? &m_items[keyIt - m_keys.begin()] : nullptr;
}


bool Value::erase(const std::string &key)
{
    checkType(mapValue);
    auto keyIt = std::find(m_keys.begin(), m_keys.end(), key);
    if (keyIt == m_keys.end())
        return false;
    m_items.erase(m_items.begin() + (keyIt - m_keys.begin()));
    m_keys.erase(keyIt);
    return true;
}


void Value::sortKeys()
{
    checkType(mapValue);
    std::vector<size_t> order(m_keys.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) { return m_keys[a] < m_keys[b]; });

    std::vector<std::string> keys;
    std::vector<Value> items;
    for (auto idx : order)
    {
        keys.push_back(m_keys[idx]);
        items.push_back(m_items[idx]);
    }
    m_keys.swap(keys);
    m_items.swap(items);
}


std::string Value::canonicalDecimal(const std::string &lexical)
{
    std::string text = lexical;
    bool negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+'))
    {
        negative = text[0] == '-';
        text = text.substr(1);
    }

    std::string intPart = text, fracPart;
    size_t dot = text.find('.');
    if (dot != std::string::npos)
    {
        intPart = text.substr(0, dot);
        fracPart = text.substr(dot + 1);
    }

    size_t firstDigit = intPart.find_first_not_of('0');
    intPart = (firstDigit == std::string::npos) ? "0" : intPart.substr(firstDigit);
    size_t lastDigit = fracPart.find_last_not_of('0');
    fracPart = (lastDigit == std::string::npos) ? "" : fracPart.substr(0, lastDigit + 1);

    std::string result = intPart;
    if (!fracPart.empty())
        result += "." + fracPart;
    if (negative && result != "0")
        result = "-" + result;
    return result;
}


int Value::compareDecimals(const std::string &left, const std::string &right)
{
    std::string a = canonicalDecimal(left), b = canonicalDecimal(right);
    bool negA = a[0] == '-', negB = b[0] == '-';
    if (negA != negB)
        return negA ? -1 : 1;
    if (negA)
    {
        a = a.substr(1);
        b = b.substr(1);
    }

    size_t dotA = a.find('.'), dotB = b.find('.');
    std::string intA = a.substr(0, dotA), intB = b.substr(0, dotB);
    std::string fracA = (dotA == std::string::npos) ? "" : a.substr(dotA + 1);
    std::string fracB = (dotB == std::string::npos) ? "" : b.substr(dotB + 1);

    int result = 0;
    if (intA.length() != intB.length())
        result = intA.length() < intB.length() ? -1 : 1;
    else if (intA != intB)
        result = intA < intB ? -1 : 1;
    else
    {
        size_t len = std::max(fracA.length(), fracB.length());
        fracA.resize(len, '0');
        fracB.resize(len, '0');
        if (fracA != fracB)
            result = fracA < fracB ? -1 : 1;
    }
    return negA ? -result : result;
}


int Value::compare(const Value &other) const
{
    if (isNumeric() && other.isNumeric())
    {
        if (m_type == intValue && other.m_type == intValue)
            return (m_int < other.m_int) ? -1 : ((m_int > other.m_int) ? 1 : 0);

        if (m_type == doubleValue || other.m_type == doubleValue)
        {
            double a = getDouble(), b = other.getDouble();
            if (std::isnan(a) || std::isnan(b))
                throw(ValueException("NaN is not comparable"));
            return (a < b) ? -1 : ((a > b) ? 1 : 0);
        }

        std::string a = (m_type == intValue) ? std::to_string(m_int) : m_string;
        std::string b = (other.m_type == intValue) ? std::to_string(other.m_int) : other.m_string;
        return compareDecimals(a, b);
    }

    if (m_type != other.m_type)
    {
        throw(ValueException(std::string("Values of type ") + getTypeName(m_type) + " and " + getTypeName(other.m_type) + " are not comparable"));
    }

    int result = 0;
    switch (m_type)
    {
        case nullValue:
            break;
        case boolValue:
            result = (m_bool == other.m_bool) ? 0 : (m_bool ? 1 : -1);
            break;
        case stringValue:
            result = m_string.compare(other.m_string);
            result = (result < 0) ? -1 : ((result > 0) ? 1 : 0);
            break;
        case listValue:
            for (size_t i = 0; result == 0 && i < m_items.size() && i < other.m_items.size(); ++i)
                result = m_items[i].compare(other.m_items[i]);
            if (result == 0 && m_items.size() != other.m_items.size())
                result = m_items.size() < other.m_items.size() ? -1 : 1;
            break;
        default:
            throw(ValueException(std::string("Values of type ") + getTypeName(m_type) + " are not ordered"));
    }
    return result;
}


bool Value::operator==(const Value &other) const
{
    if (isNumeric() && other.isNumeric())
    {
        if (m_type == doubleValue && other.m_type == doubleValue && std::isnan(m_double) && std::isnan(other.m_double))
            return true;
        try
        {
            return compare(other) == 0;
        }
        catch (const ValueException &)
        {
            return false;
        }
    }

    if (m_type != other.m_type)
        return false;

    bool equal = true;
    switch (m_type)
    {
        case nullValue:    break;
        case boolValue:    equal = m_bool == other.m_bool;      break;
        case stringValue:  equal = m_string == other.m_string;  break;
        case listValue:    equal = m_items == other.m_items;    break;
        case mapValue:     equal = (m_keys == other.m_keys) && (m_items == other.m_items); break;
        default:           break;
    }
    return equal;
}


static std::string formatDouble(double value)
{
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value < 0 ? "-INF" : "INF";

    //
    // Shortest precision that reads back to the same double
    char buf[64];
    for (int precision = 15; precision <= 17; ++precision)
    {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value)
            break;
    }
    return buf;
}


std::string Value::toLexical() const
{
    std::string result;
    switch (m_type)
    {
        case nullValue:    break;
        case boolValue:    result = m_bool ? "true" : "false";  break;
        case intValue:     result = std::to_string(m_int);      break;
        case decimalValue: result = m_string;                   break;
        case doubleValue:  result = formatDouble(m_double);     break;
        case stringValue:  result = m_string;                   break;
        case listValue:
            for (size_t i = 0; i < m_items.size(); ++i)
            {
                if (i)
                    result += " ";
                result += m_items[i].toLexical();
            }
            break;
        case mapValue:     result = toString();                 break;
    }
    return result;
}


static void renderString(const std::string &value, std::string &out)
{
    out += '"';
    for (char c : value)
    {
        switch (c)
        {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\t': out += "\\t";  break;
            case '\r': out += "\\r";  break;
            default:   out += c;      break;
        }
    }
    out += '"';
}


void Value::renderTo(std::string &out) const
{
    switch (m_type)
    {
        case nullValue:
            out += "null";
            break;
        case stringValue:
            renderString(m_string, out);
            break;
        case listValue:
            out += "[";
            for (size_t i = 0; i < m_items.size(); ++i)
            {
                if (i)
                    out += ", ";
                m_items[i].renderTo(out);
            }
            out += "]";
            break;
        case mapValue:
            out += "{";
            for (size_t i = 0; i < m_items.size(); ++i)
            {
                if (i)
                    out += ", ";
                renderString(m_keys[i], out);
                out += ": ";
                m_items[i].renderTo(out);
            }
            out += "}";
            break;
        default:
            out += toLexical();
            break;
    }
}


std::string Value::toString() const
{
    std::string result;
    renderTo(result);
    return result;
}
