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
#include <cerrno>
#include "Particle.hpp"
#include "Exceptions.hpp"

using namespace xsdbind;


void Particle::setOccurs(unsigned minOccurs, unsigned maxOccurs)
{
    if (maxOccurs < minOccurs)
    {
        throw(ParseException("maxOccurs (" + std::to_string(maxOccurs) + ") must be greater or equal than minOccurs (" + std::to_string(minOccurs) + ")"));
    }
    m_minOccurs = minOccurs;
    m_maxOccurs = maxOccurs;
}


unsigned Particle::getOccursFromString(const std::string &value, const std::string &attrName)
{
    if (value == "unbounded")
    {
        if (attrName == "maxOccurs")
            return UNBOUNDED;
        throw(ParseException("'unbounded' is only allowed for maxOccurs"));
    }

    bool ok = !value.empty();
    for (auto c : value)
    {
        if (c < '0' || c > '9')
            ok = false;
    }

    unsigned long occurs = 0;
    if (ok)
    {
        errno = 0;
        occurs = strtoul(value.c_str(), nullptr, 10);
        ok = errno == 0 && occurs < UNBOUNDED;
    }

    if (!ok)
    {
        throw(ParseException("Invalid value '" + value + "' for " + attrName + ", a non negative integer is required"));
    }
    return static_cast<unsigned>(occurs);
}
