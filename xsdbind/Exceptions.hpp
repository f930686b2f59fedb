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

#ifndef _XSDBIND_EXCEPTIONS_HPP_
#define _XSDBIND_EXCEPTIONS_HPP_

#include <exception>
#include <string>
#include "ValidationError.hpp"
#include "Exports.hpp"

namespace xsdbind
{

//
// Schema build error. The filename and component are optional context added as the exception
// unwinds through the parser.
class XSDBIND_DECL_EXPORT ParseException : public std::exception
{
    public:

        ParseException(const std::string &reason) : m_reason(reason) { }
        ParseException(const char *reason) : m_reason(reason) { }
        void addFilename(const std::string &filename) { m_filename = filename; buildMessage(); }
        void addComponent(const std::string &component) { if (m_component.empty()) { m_component = component; buildMessage(); } }
        const std::string &getReason() const { return m_reason; }
        const std::string &getComponent() const { return m_component; }
        const std::string &getFilename() const { return m_filename; }

        virtual const char *what() const throw()
        {
            return m_message.empty() ? m_reason.c_str() : m_message.c_str();
        }


    private:

        void buildMessage()
        {
            m_message = m_reason;
            if (!m_component.empty())
                m_message += " (component: " + m_component + ")";
            if (!m_filename.empty())
                m_message += " (file: " + m_filename + ")";
        }


    private:

        std::string m_reason;
        std::string m_component;
        std::string m_filename;
        std::string m_message;
};


class XSDBIND_DECL_EXPORT ValueException : public std::exception
{
    public:

        ValueException(const std::string &reason) : m_reason(reason) { }
        ValueException(const char *reason) : m_reason(reason) { }

        virtual const char *what() const throw()
        {
            return m_reason.c_str();
        }


    private:

        std::string m_reason;
};


//
// Instance time error raised in strict mode. Carries the full error record.
class XSDBIND_DECL_EXPORT ValidationException : public std::exception
{
    public:

        ValidationException(const ValidationError &error) : m_error(error), m_message(error.toString()) { }
        const ValidationError &getError() const { return m_error; }

        virtual const char *what() const throw()
        {
            return m_message.c_str();
        }


    private:

        ValidationError m_error;
        std::string m_message;
};


class XSDBIND_DECL_EXPORT DecodeException : public ValidationException
{
    public:

        DecodeException(const ValidationError &error) : ValidationException(error) { }
};


class XSDBIND_DECL_EXPORT EncodeException : public ValidationException
{
    public:

        EncodeException(const ValidationError &error) : ValidationException(error) { }
};

}

#endif // _XSDBIND_EXCEPTIONS_HPP_
