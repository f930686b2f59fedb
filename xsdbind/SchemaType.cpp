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

#include "SchemaType.hpp"

using namespace xsdbind;


bool SchemaType::isDerivedFrom(const SchemaType *pOther) const
{
    //
    // Bounded walk, a circular derivation is rejected at build time but lax builds may leave one behind
    const SchemaType *pType = this;
    for (unsigned depth = 0; pType != nullptr && depth < 1000; ++depth)
    {
        if (pType == pOther)
            return true;
        if (pType->m_pBaseType == pType)
            break;
        pType = pType->m_pBaseType;
    }
    return false;
}


const char *SchemaType::getDerivationString(derivationMethod derivation)
{
    const char *result = "none";
    if (derivation == restriction)
        result = "restriction";
    else if (derivation == extension)
        result = "extension";
    return result;
}
