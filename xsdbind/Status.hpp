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

#ifndef _XSDBIND_STATUS_HPP_
#define _XSDBIND_STATUS_HPP_

#include <map>
#include <vector>
#include <string>
#include "Exports.hpp"

namespace xsdbind
{

//
// Schema build messages. In lax build mode every recovered ParseException lands here
// instead of aborting the load.
struct XSDBIND_DECL_EXPORT statusMsg {

    enum msgLevel
    {
        info = 0,     // informational messages mainly
        warning,
        error,
        fatal
    };

    statusMsg(enum msgLevel _msgLevel, const std::string &_component, const std::string &_msg) :
        msgLevel(_msgLevel), component(_component), msg(_msg) { }
    msgLevel msgLevel;                // Message level
    std::string component;            // if not '', the schema component to which this status applies
    std::string msg;                  // message for user
};


class XSDBIND_DECL_EXPORT Status
{
    public:

        Status() : m_highestMsgLevel(statusMsg::info) { }
        ~Status() {}
        void addMsg(enum statusMsg::msgLevel status, const std::string &msg) { addMsg(status, "", msg); }
        void addMsg(enum statusMsg::msgLevel status, const std::string &component, const std::string &msg);
        enum statusMsg::msgLevel getHighestMsgLevel() const { return m_highestMsgLevel; }
        bool isOk() const { return m_highestMsgLevel <= statusMsg::warning; }
        bool isError() const { return m_highestMsgLevel >= statusMsg::error; }
        static std::string getStatusTypeString(enum statusMsg::msgLevel status);
        std::vector<statusMsg> getMessages() const;
        std::vector<statusMsg> getMessages(enum statusMsg::msgLevel level) const;
        size_t getNumMessages() const { return m_messages.size(); }
        void add(const std::vector<statusMsg> &msgs);
        void clear() { m_messages.clear(); m_highestMsgLevel = statusMsg::info; }


    private:

        enum statusMsg::msgLevel m_highestMsgLevel;
        std::multimap<enum statusMsg::msgLevel, statusMsg> m_messages;
};

}

#endif // _XSDBIND_STATUS_HPP_
