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

#ifndef WSSTREAM_LOGGER_LEVELS_HPP
#define WSSTREAM_LOGGER_LEVELS_HPP

#include <wsstream/common/stdint.hpp>

namespace wsstream {
namespace log {

/// Type of a channel package
typedef uint32_t level;

/// Error channels. A reader logs protocol and transport failures here.
struct elevel {
    static level const none = 0x0;
    /// Byte level tracing of the decoder
    static level const devel = 0x1;
    /// Internal state that is odd but harmless
    static level const library = 0x2;
    /// Failures that originate below the reader (pass_through transport
    /// errors) and are reported to the caller unchanged
    static level const info = 0x4;
    /// Suspicious input that was still accepted
    static level const warn = 0x8;
    /// A frame or message was rejected. The reader can continue after the
    /// caller discards or abandons the message.
    static level const rerror = 0x10;
    /// The byte source is unusable
    static level const fatal = 0x20;
    static level const all = 0xffffffff;

    /// Get the textual name of a channel given a channel id
    static char const * channel_name(level channel) {
        switch(channel) {
            case devel:
                return "devel";
            case library:
                return "library";
            case info:
                return "info";
            case warn:
                return "warning";
            case rerror:
                return "error";
            case fatal:
                return "fatal";
            default:
                return "unknown";
        }
    }
};

/// Package of log levels for logging access events
struct alevel {
    static level const none = 0x0;
    /// One line for each decoded frame header
    static level const frame_header = 0x1;
    /// One line per payload read, with the byte count
    static level const frame_payload = 0x2;
    /// Control frames that arrived in the middle of a fragmented message
    static level const control = 0x4;
    /// Fragment boundaries of multi-frame messages
    static level const fragment = 0x8;
    /// Start and end of each logical message
    static level const message_header = 0x10;
    /// Messages skipped with discard()
    static level const discard = 0x20;
    /// Development messages (warning: very chatty)
    static level const devel = 0x40;
    /// Special channel for application specific logs. Not used by the library.
    static level const app = 0x80;
    static level const all = 0xffffffff;

    /// Get the textual name of a channel given a channel id
    static char const * channel_name(level channel) {
        switch(channel) {
            case frame_header:
                return "frame_header";
            case frame_payload:
                return "frame_payload";
            case control:
                return "control";
            case fragment:
                return "fragment";
            case message_header:
                return "message_header";
            case discard:
                return "discard";
            case devel:
                return "devel";
            case app:
                return "application";
            default:
                return "unknown";
        }
    }
};

} // log
} // wsstream

#endif // WSSTREAM_LOGGER_LEVELS_HPP
