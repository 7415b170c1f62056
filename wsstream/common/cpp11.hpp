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

#ifndef WSSTREAM_COMMON_CPP11_HPP
#define WSSTREAM_COMMON_CPP11_HPP

/**
 * This header sets up some constants based on the state of C++11 support
 */

// Hide clang feature detection from other compilers
#ifndef __has_feature         // Optional of course.
  #define __has_feature(x) 0  // Compatibility with non-clang compilers.
#endif
#ifndef __has_extension
  #define __has_extension __has_feature // Compatibility with pre-3.0 compilers.
#endif

// The code below attempts to use information provided by the build system or
// user supplied defines to selectively enable C++11 language and library
// features. In most cases features that are targeted individually may also be
// selectively disabled via an associated _WSSTREAM_NOXXX_ define.

#if defined(_WSSTREAM_CPP11_STL_) || __cplusplus >= 201103L || defined(_WSSTREAM_CPP11_STRICT_)
    // This check tests for blanket c++11 coverage. It can be activated in one
    // of three ways. Either the compiler itself reports that it is a full
    // C++11 compiler via __cplusplus or the user explicitly indicates that
    // they want to use C++11 versions of the STL via one of the two defines.
    #ifndef _WSSTREAM_CPP11_STL_
        #define _WSSTREAM_CPP11_STL_
    #endif

    #ifndef _WSSTREAM_NOEXCEPT_TOKEN_
        #define _WSSTREAM_NOEXCEPT_TOKEN_ noexcept
    #endif
    #ifndef _WSSTREAM_CONSTEXPR_TOKEN_
        #define _WSSTREAM_CONSTEXPR_TOKEN_ constexpr
    #endif
    #ifndef _WSSTREAM_NULLPTR_TOKEN_
        #define _WSSTREAM_NULLPTR_TOKEN_ nullptr
    #endif
#else
    // Test for noexcept
    #ifndef _WSSTREAM_NOEXCEPT_TOKEN_
        #if __has_feature(cxx_noexcept)
            // clang feature detect says we have noexcept
            #define _WSSTREAM_NOEXCEPT_TOKEN_ noexcept
        #else
            // assume we don't have noexcept
            #define _WSSTREAM_NOEXCEPT_TOKEN_
        #endif
    #endif

    // Test for constexpr
    #ifndef _WSSTREAM_CONSTEXPR_TOKEN_
        #if __has_feature(cxx_constexpr)
            #define _WSSTREAM_CONSTEXPR_TOKEN_ constexpr
        #else
            #define _WSSTREAM_CONSTEXPR_TOKEN_
        #endif
    #endif

    // Test for nullptr
    #ifndef _WSSTREAM_NULLPTR_TOKEN_
        #if __has_feature(cxx_nullptr)
            #define _WSSTREAM_NULLPTR_TOKEN_ nullptr
        #else
            #define _WSSTREAM_NULLPTR_TOKEN_ 0
        #endif
    #endif
#endif

#endif // WSSTREAM_COMMON_CPP11_HPP
