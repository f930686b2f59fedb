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

#ifndef _XSDBIND_EXPORTS_HPP_
#define _XSDBIND_EXPORTS_HPP_

#if defined(_WIN32) || defined(__CYGWIN__)
    #ifdef XSDBIND_EXPORTS
        #define XSDBIND_DECL_EXPORT __declspec(dllexport)
    #else
        #define XSDBIND_DECL_EXPORT __declspec(dllimport)
    #endif
#else
    #define XSDBIND_DECL_EXPORT __attribute__ ((visibility ("default")))
#endif

#endif // _XSDBIND_EXPORTS_HPP_
