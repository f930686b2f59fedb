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

#include "XSDRegex.hpp"
#include "Exceptions.hpp"

using namespace xsdbind;

static const char *NAME_START_CHARS = "_:A-Za-z";
static const char *NAME_CHARS = "\\-._:A-Za-z0-9";
static const char *SPACE_CHARS = " \\t\\n\\r";


XSDRegex::XSDRegex(const std::string &pattern) : m_pattern(pattern)
{
    m_translated = translate(pattern);
    try
    {
        m_regex = std::regex(m_translated, std::regex::ECMAScript);
    }
    catch (const std::regex_error &e)
    {
        throw(ParseException("Invalid pattern '" + pattern + "': " + e.what()));
    }
}


std::string XSDRegex::translate(const std::string &pattern)
{
    std::string result;
    size_t pos = 0;
    while (pos < pattern.length())
    {
        char c = pattern[pos];
        if (c == '\\')
        {
            if (pos + 1 >= pattern.length())
                throw(ParseException("Invalid pattern '" + pattern + "': trailing backslash"));
            char esc = pattern[pos + 1];
            switch (esc)
            {
                case 'i': result += std::string("[") + NAME_START_CHARS + "]";  break;
                case 'I': result += std::string("[^") + NAME_START_CHARS + "]"; break;
                case 'c': result += std::string("[") + NAME_CHARS + "]";        break;
                case 'C': result += std::string("[^") + NAME_CHARS + "]";       break;
                case 's': result += std::string("[") + SPACE_CHARS + "]";       break;
                case 'S': result += std::string("[^") + SPACE_CHARS + "]";      break;
                case 'p':
                case 'P':
                    throw(ParseException("Invalid pattern '" + pattern + "': character category escapes are not supported"));
                default:
                    result += '\\';
                    result += esc;
                    break;
            }
            pos += 2;
        }
        else if (c == '[')
        {
            result += translateClass(pattern, pos);
        }
        else if (c == '^' || c == '$')
        {
            //
            // Anchors do not exist in XSD patterns, both are ordinary characters
            result += '\\';
            result += c;
            ++pos;
        }
        else
        {
            result += c;
            ++pos;
        }
    }
    return result;
}


std::string XSDRegex::translateClassEscape(const std::string &pattern, char c)
{
    std::string result;
    switch (c)
    {
        case 'i': result = NAME_START_CHARS; break;
        case 'c': result = NAME_CHARS;       break;
        case 's': result = SPACE_CHARS;      break;
        case 'd': result = "0-9";            break;
        case 'I':
        case 'C':
        case 'S':
        case 'p':
        case 'P':
            throw(ParseException("Invalid pattern '" + pattern + "': escape \\" + std::string(1, c) + " is not supported inside a character class"));
        default:
            result = std::string("\\") + c;
            break;
    }
    return result;
}


//
// pos is at the opening bracket on entry and past the closing one on return. A class
// subtraction [A-[B]] becomes a negative lookahead in front of the outer class.
std::string XSDRegex::translateClass(const std::string &pattern, size_t &pos)
{
    ++pos;
    std::string items, subtraction;
    bool negated = false;
    if (pos < pattern.length() && pattern[pos] == '^')
    {
        negated = true;
        ++pos;
    }

    bool closed = false;
    while (pos < pattern.length() && !closed)
    {
        char c = pattern[pos];
        if (c == ']')
        {
            closed = true;
            ++pos;
        }
        else if (c == '-' && pos + 1 < pattern.length() && pattern[pos + 1] == '[')
        {
            ++pos;
            subtraction = translateClass(pattern, pos);
            if (pos >= pattern.length() || pattern[pos] != ']')
                throw(ParseException("Invalid pattern '" + pattern + "': class subtraction must end the character class"));
        }
        else if (c == '\\')
        {
            if (pos + 1 >= pattern.length())
                throw(ParseException("Invalid pattern '" + pattern + "': trailing backslash"));
            items += translateClassEscape(pattern, pattern[pos + 1]);
            pos += 2;
        }
        else if (c == '[' || (c == '^' && !items.empty()))
        {
            items += '\\';
            items += c;
            ++pos;
        }
        else
        {
            items += c;
            ++pos;
        }
    }

    if (!closed)
        throw(ParseException("Invalid pattern '" + pattern + "': unterminated character class"));
    if (items.empty())
        throw(ParseException("Invalid pattern '" + pattern + "': empty character class"));

    std::string result = std::string("[") + (negated ? "^" : "") + items + "]";
    if (!subtraction.empty())
        result = "(?:(?!" + subtraction + ")" + result + ")";
    return result;
}
