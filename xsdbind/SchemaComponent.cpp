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

#include "SchemaComponent.hpp"

using namespace xsdbind;


SchemaComponent::validity SchemaComponent::check(const std::shared_ptr<const BuildToken> &pToken) const
{
    if (m_pCheckedToken == pToken)
    {
        return m_checkInProgress ? notKnown : m_validity;
    }

    m_pCheckedToken = pToken;
    m_checkInProgress = true;

    validity result;
    if (hasBuildError())
        result = invalid;
    else if (!m_built)
        result = notKnown;
    else
        result = doCheck(pToken);

    m_validity = result;
    m_checkInProgress = false;
    return result;
}


const char *SchemaComponent::getValidityString(validity v)
{
    const char *result = "notKnown";
    if (v == valid)
        result = "valid";
    else if (v == invalid)
        result = "invalid";
    return result;
}
