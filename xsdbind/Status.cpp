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

#include "Status.hpp"

using namespace xsdbind;


void Status::addMsg(enum statusMsg::msgLevel level, const std::string &component, const std::string &msg)
{
    statusMsg statusMsg(level, component, msg);
    m_messages.insert({level, statusMsg });
    if (level > m_highestMsgLevel)
        m_highestMsgLevel = level;
}


std::vector<statusMsg> Status::getMessages() const
{
    std::vector<statusMsg> msgs;
    for (auto it = m_messages.begin(); it != m_messages.end(); ++it)
    {
        msgs.push_back(it->second);
    }
    return msgs;
}


std::vector<statusMsg> Status::getMessages(enum statusMsg::msgLevel level) const
{
    std::vector<statusMsg> msgs;
    auto msgRange = m_messages.equal_range(level);
    for (auto msgIt = msgRange.first; msgIt != msgRange.second; ++msgIt)
    {
        msgs.push_back(msgIt->second);
    }
    return msgs;
}


std::string Status::getStatusTypeString(enum statusMsg::msgLevel status)
{
    std::string result = "Not found";
    switch (status)
    {
        case statusMsg::info:    result = "Info";     break;
        case statusMsg::warning: result = "Warning";  break;
        case statusMsg::error:   result = "Error";    break;
        case statusMsg::fatal:   result = "Fatal";    break;
    }
    return result;
}


void Status::add(const std::vector<statusMsg> &msgs)
{
    for (auto msgIt = msgs.begin(); msgIt != msgs.end(); ++msgIt)
    {
        m_messages.insert({ (*msgIt).msgLevel, *msgIt });
        if ((*msgIt).msgLevel > m_highestMsgLevel)
            m_highestMsgLevel = (*msgIt).msgLevel;
    }
}
