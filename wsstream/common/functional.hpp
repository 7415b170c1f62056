/*
 * Copyright (c) 2013, Peter Thorson. All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *     * Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *     * Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *     * Neither the name of the WebSocket++ Project nor the
 *       names of its contributors may be used to endorse or promote products
 *       derived from this software without specific prior written permission.
 * 
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" 
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE 
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE 
 * ARE DISCLAIMED. IN NO EVENT SHALL PETER THORSON BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 * 
 */

#ifndef WSSTREAM_COMMON_FUNCTIONAL_HPP
#define WSSTREAM_COMMON_FUNCTIONAL_HPP

#include <wsstream/common/cpp11.hpp>

// Handlers are stored as lib::function. C++11 builds use <functional>
// unless _WSSTREAM_NO_CPP11_FUNCTIONAL_ is defined, older builds fall back
// to Boost.Function and Boost.Bind.
#if defined _WSSTREAM_CPP11_STL_ && !defined _WSSTREAM_NO_CPP11_FUNCTIONAL_
    #ifndef _WSSTREAM_CPP11_FUNCTIONAL_
        #define _WSSTREAM_CPP11_FUNCTIONAL_
    #endif
#endif

#ifdef _WSSTREAM_CPP11_FUNCTIONAL_
    #include <functional>
#else
    #include <boost/bind.hpp>
    #include <boost/function.hpp>
#endif

namespace wsstream {
namespace lib {

#ifdef _WSSTREAM_CPP11_FUNCTIONAL_
    using std::function;
    using std::bind;
    namespace placeholders = std::placeholders;
#else
    using boost::function;
    using boost::bind;
    namespace placeholders {
        // frame handlers take (header, payload)
        using ::_1;
        using ::_2;
    }
#endif

} // namespace lib
} // namespace wsstream

#endif // WSSTREAM_COMMON_FUNCTIONAL_HPP
