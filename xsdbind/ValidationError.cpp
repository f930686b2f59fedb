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

#include "ValidationError.hpp"


std::string xsdbind::ValidationError::toString() const
{
    std::string result = getKindString(kind) + ": " + reason;
    if (!component.empty())
        result += "\n  Schema component: " + component;
    if (!path.empty())
        result += "\n  Instance path: " + path;
    if (!value.empty())
        result += "\n  Value: '" + value + "'";
    return result;
}


std::string xsdbind::ValidationError::getKindString(enum errorKind kind)
{
    std::string result = "Unknown";
    switch (kind)
    {
        case validation: result = "Validation error"; break;
        case decode:     result = "Decode error";     break;
        case encode:     result = "Encode error";     break;
    }
    return result;
}
