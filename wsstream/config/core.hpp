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

#ifndef WSSTREAM_CONFIG_CORE_HPP
#define WSSTREAM_CONFIG_CORE_HPP

// Concurrency
#include <wsstream/concurrency/basic.hpp>

// Transport
#include <wsstream/transport/iostream/source.hpp>

// Loggers
#include <wsstream/logger/basic.hpp>
#include <wsstream/logger/levels.hpp>

#include <wsstream/common/stdint.hpp>

namespace wsstream {
namespace config {

/// Reader config that pulls bytes from a std::istream
struct core {
    typedef core type;

    // Concurrency policy
    typedef wsstream::concurrency::basic concurrency_type;

    // Byte source
    typedef wsstream::transport::iostream::source source_type;

    // Loggers
    typedef wsstream::log::basic<concurrency_type,
        wsstream::log::elevel> elog_type;
    typedef wsstream::log::basic<concurrency_type,
        wsstream::log::alevel> alog_type;

    /// Default static error logging channels
    /**
     * Which error logging channels to enable at compile time. Channels not
     * enabled here can't be enabled at runtime.
     */
    static const wsstream::log::level elog_level =
        wsstream::log::elevel::rerror | wsstream::log::elevel::fatal;

    /// Default static access logging channels
    static const wsstream::log::level alog_level =
        wsstream::log::alevel::none;

    /// Validate every frame header against RFC6455
    static const bool check_header = true;

    /// Validate text messages as UTF-8
    static const bool check_utf8 = false;

    /// Largest payload a single frame may declare, zero for no limit
    static const uint64_t max_frame_size = 0;
};

} // namespace config
} // namespace wsstream

#endif // WSSTREAM_CONFIG_CORE_HPP
