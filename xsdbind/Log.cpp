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
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "Log.hpp"
#include "Exceptions.hpp"

namespace xsdbind
{

const char *LOGGER_NAME = "xsdbind";

static std::mutex loggerMutex;


static spdlog::level::level_enum levelFromString(const std::string &level)
{
    spdlog::level::level_enum lvl = spdlog::level::from_str(level);

    //
    // from_str answers off for any name it does not know, so only trust it when asked for off
    if (lvl == spdlog::level::off && level != "off")
    {
        throw(ValueException("Invalid log level '" + level + "'"));
    }
    return lvl;
}


std::shared_ptr<spdlog::logger> getLogger()
{
    std::shared_ptr<spdlog::logger> pLogger = spdlog::get(LOGGER_NAME);
    if (!pLogger)
    {
        std::lock_guard<std::mutex> lock(loggerMutex);
        pLogger = spdlog::get(LOGGER_NAME);
        if (!pLogger)
        {
            pLogger = spdlog::stderr_color_mt(LOGGER_NAME);
            pLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            spdlog::level::level_enum lvl = spdlog::level::warn;
            const char *envLevel = std::getenv("XSDBIND_LOG_LEVEL");
            if (envLevel != nullptr)
            {
                try
                {
                    lvl = levelFromString(envLevel);
                }
                catch (const ValueException &e)
                {
                    pLogger->warn("{}, using warn", e.what());
                }
            }
            pLogger->set_level(lvl);
        }
    }
    return pLogger;
}


void setLogLevel(const std::string &level)
{
    getLogger()->set_level(levelFromString(level));
}

}
