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

#ifndef _XSDBIND_MEMOVALUE_HPP_
#define _XSDBIND_MEMOVALUE_HPP_

#include <atomic>
#include <mutex>

namespace xsdbind
{

//
// Lazily computed value of a pure function of an immutable component. The first callers race
// for the lock and one of them populates; once populated, readers only load the flag.
template <class T>
class MemoValue
{
    public:

        MemoValue() : m_populated(false) { }
        MemoValue(const MemoValue &) = delete;
        MemoValue &operator=(const MemoValue &) = delete;

        template <class Populate>
        const T &get(Populate populate) const
        {
            if (!m_populated.load(std::memory_order_acquire))
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!m_populated.load(std::memory_order_relaxed))
                {
                    m_value = populate();
                    m_populated.store(true, std::memory_order_release);
                }
            }
            return m_value;
        }


    private:

        mutable std::atomic<bool> m_populated;
        mutable std::mutex m_mutex;
        mutable T m_value;
};

}

#endif // _XSDBIND_MEMOVALUE_HPP_
