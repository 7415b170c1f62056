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

#ifndef WSSTREAM_LOGGER_BASIC_HPP
#define WSSTREAM_LOGGER_BASIC_HPP

#include <wsstream/logger/levels.hpp>

#include <wsstream/common/cpp11.hpp>
#include <wsstream/common/stdint.hpp>
#include <wsstream/common/system_error.hpp>

#include <ctime>
#include <iostream>
#include <string>

namespace wsstream {
namespace log {

/// Channel logger that writes one line per event to an ostream
/**
 * Lines look like `[2024-01-01 12:00:00] [frame_header] msg`.
 *
 * The static channel set is fixed at construction. Callers test it with
 * static_test() before building an expensive message. The dynamic set can
 * be changed at runtime but never exceeds the static one.
 *
 * @tparam concurrency Policy supplying mutex_type and scoped_lock_type
 * @tparam names elevel or alevel, provides channel_name()
 */
template <typename concurrency, typename names>
class basic {
public:
    basic(std::ostream * out = &std::cout)
      : m_static_channels(0xffffffff)
      , m_dynamic_channels(0)
      , m_out(out) {}

    basic(level c, std::ostream * out = &std::cout)
      : m_static_channels(c)
      , m_dynamic_channels(0)
      , m_out(out) {}

    void set_ostream(std::ostream * out = &std::cout) {
        scoped_lock_type lock(m_lock);
        m_out = out;
    }

    /// Enable channels, limited to the static set. none disables everything.
    void set_channels(level channels) {
        scoped_lock_type lock(m_lock);
        if (channels == names::none) {
            m_dynamic_channels = 0;
        } else {
            m_dynamic_channels |= (channels & m_static_channels);
        }
    }

    void clear_channels(level channels) {
        scoped_lock_type lock(m_lock);
        m_dynamic_channels &= ~channels;
    }

    void write(level channel, std::string const & msg) {
        this->emit(channel,msg.c_str());
    }

    void write(level channel, char const * msg) {
        this->emit(channel,msg);
    }

    /// Write `what error: <category:value> (<message>)` to the channel
    void write(level channel, std::string const & what,
        lib::error_code const & ec)
    {
        if (!this->static_test(channel)) {
            return;
        }
        std::string msg = what + " error: " + ec.category().name() + ":"
            + std::to_string(ec.value()) + " (" + ec.message() + ")";
        this->emit(channel,msg.c_str());
    }

    bool static_test(level channel) const {
        return ((channel & m_static_channels) != 0);
    }

    bool dynamic_test(level channel) {
        return ((channel & m_dynamic_channels) != 0);
    }

protected:
    typedef typename concurrency::scoped_lock_type scoped_lock_type;
    typedef typename concurrency::mutex_type mutex_type;
    mutex_type m_lock;

private:
    void emit(level channel, char const * msg) {
        scoped_lock_type lock(m_lock);
        if (!this->dynamic_test(channel) || !m_out) { return; }
        *m_out << "[" << timestamp << "] "
               << "[" << names::channel_name(channel) << "] "
               << msg << "\n";
        m_out->flush();
    }

    // Local time without a zone suffix
    static std::ostream & timestamp(std::ostream & os) {
        std::time_t t = std::time(NULL);
        std::tm lt;
#ifdef _WIN32
        localtime_s(&lt, &t);
#else
        localtime_r(&t, &lt);
#endif
        char buffer[20];
        size_t result = std::strftime(buffer,sizeof(buffer),"%Y-%m-%d %H:%M:%S",&lt);
        return os << (result == 0 ? "Unknown" : buffer);
    }

    level const m_static_channels;
    level m_dynamic_channels;
    std::ostream * m_out;
};

} // log
} // wsstream

#endif // WSSTREAM_LOGGER_BASIC_HPP
