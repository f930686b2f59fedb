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

#ifndef _XSDBIND_LOG_HPP_
#define _XSDBIND_LOG_HPP_

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "Exports.hpp"

namespace xsdbind
{

extern XSDBIND_DECL_EXPORT const char *LOGGER_NAME;

//
// The library logger. Created on first use with a stderr sink, level taken from the
// XSDBIND_LOG_LEVEL environment variable (warn when not set).
XSDBIND_DECL_EXPORT std::shared_ptr<spdlog::logger> getLogger();

//
// Accepts trace, debug, info, warn, error, critical and off. Throws ValueException otherwise.
XSDBIND_DECL_EXPORT void setLogLevel(const std::string &level);

}

#endif // _XSDBIND_LOG_HPP_
