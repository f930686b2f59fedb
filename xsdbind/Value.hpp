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

#ifndef _XSDBIND_VALUE_HPP_
#define _XSDBIND_VALUE_HPP_

#include <cstdint>
#include <string>
#include <vector>
#include "Exports.hpp"

namespace xsdbind
{

//
// Native value produced by decode and consumed by encode. Decimals are kept as their
// canonical lexical form so that no precision is lost. A map keeps its keys unique and in
// insertion order.
class XSDBIND_DECL_EXPORT Value
{
    public:

        enum valueType
        {
            nullValue = 0,
            boolValue,
            intValue,
            decimalValue,
            doubleValue,
            stringValue,
            listValue,
            mapValue
        };

        Value() : m_type(nullValue), m_bool(false), m_int(0), m_double(0.0) { }
        Value(const Value &) = default;
        Value(Value &&) = default;
        Value &operator=(const Value &) = default;
        Value &operator=(Value &&) = default;
        ~Value() { }

        static Value makeBool(bool value);
        static Value makeInteger(int64_t value);
        static Value makeDecimal(const std::string &lexical);
        static Value makeDouble(double value);
        static Value makeString(const std::string &value);
        static Value makeList();
        static Value makeMap();

        valueType getType() const { return m_type; }
        static const char *getTypeName(valueType type);
        bool isNull() const { return m_type == nullValue; }
        bool isNumeric() const { return m_type == intValue || m_type == decimalValue || m_type == doubleValue; }
        bool isList() const { return m_type == listValue; }
        bool isMap() const { return m_type == mapValue; }
        bool isString() const { return m_type == stringValue; }

        bool getBool() const;
        int64_t getInteger() const;
        const std::string &getDecimal() const;
        double getDouble() const;
        const std::string &getString() const;

        //
        // List and map access. Both keep their items in m_items, a map adds the parallel keys.
        size_t size() const { return m_items.size(); }
        bool empty() const { return m_items.empty(); }
        const Value &at(size_t idx) const;
        Value &at(size_t idx);
        const std::string &keyAt(size_t idx) const;
        void append(const Value &value);
        void set(const std::string &key, const Value &value);
        const Value *find(const std::string &key) const;
        Value *find(const std::string &key);
        bool erase(const std::string &key);
        void sortKeys();

        int compare(const Value &other) const;
        bool operator==(const Value &other) const;
        bool operator!=(const Value &other) const { return !(*this == other); }

        //
        // Lexical rendering of scalars, JSON like rendering of lists and maps
        std::string toString() const;
        std::string toLexical() const;

        static std::string canonicalDecimal(const std::string &lexical);
        static int compareDecimals(const std::string &left, const std::string &right);


    private:

        void checkType(valueType type) const;
        void renderTo(std::string &out) const;


    private:

        valueType m_type;
        bool m_bool;
        int64_t m_int;
        double m_double;
        std::string m_string;
        std::vector<std::string> m_keys;
        std::vector<Value> m_items;
};

}

#endif // _XSDBIND_VALUE_HPP_
