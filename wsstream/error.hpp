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

#ifndef WSSTREAM_ERROR_HPP
#define WSSTREAM_ERROR_HPP

#include <exception>
#include <string>

#include <wsstream/common/cpp11.hpp>
#include <wsstream/common/system_error.hpp>

namespace wsstream {

namespace error {
enum value {
    /// Catch-all library error
    general = 1,

    /// read() was called with no open frame and no fragmented message in
    /// progress. Call next_frame() first.
    no_frame_advance,

    /// A frame header declared a payload longer than the configured maximum
    frame_too_large,

    /// The 7 bit length field of a frame header held an impossible value
    header_length_unexpected,

    /// The most significant bit of a 64 bit frame length was set
    header_length_msb,

    /// The byte source ended in the middle of a frame or of a fragmented
    /// message
    unexpected_eof,

    /// The whole current message was read. Not a failure.
    eof,

    /// A text message did not contain valid UTF-8
    invalid_utf8
}; // enum value


class category : public lib::error_category {
public:
    category() {}

    char const * name() const _WSSTREAM_NOEXCEPT_TOKEN_ {
        return "wsstream";
    }

    std::string message(int value) const {
        switch(value) {
            case error::general:
                return "Generic error";
            case error::no_frame_advance:
                return "No frame advance: read called before next_frame";
            case error::frame_too_large:
                return "Frame length exceeds the configured maximum";
            case error::header_length_unexpected:
                return "Unexpected payload length bits in frame header";
            case error::header_length_msb:
                return "Most significant bit of 64 bit payload length is set";
            case error::unexpected_eof:
                return "Unexpected end of stream";
            case error::eof:
                return "End of message";
            case error::invalid_utf8:
                return "Invalid UTF-8 in text message";
            default:
                return "Unknown";
        }
    }
};

inline lib::error_category const & get_category() {
    static category instance;
    return instance;
}

inline lib::error_code make_error_code(error::value e) {
    return lib::error_code(static_cast<int>(e), get_category());
}

} // namespace error
} // namespace wsstream

_WSSTREAM_ERROR_CODE_ENUM_NS_START_
template<> struct is_error_code_enum<wsstream::error::value>
{
    static bool const value = true;
};
_WSSTREAM_ERROR_CODE_ENUM_NS_END_

namespace wsstream {

/// Exception type for callers that prefer throwing over error codes
/**
 * The reader itself never throws. Tools built on top of it may wrap a failed
 * error code in this type to unwind through code that does not check codes.
 */
class exception : public std::exception {
public:
    exception(std::string const & msg, lib::error_code ec = make_error_code(error::general))
      : m_msg(msg.empty() ? ec.message() : msg), m_code(ec)
    {}

    explicit exception(lib::error_code ec)
      : m_msg(ec.message()), m_code(ec)
    {}

    ~exception() throw() {}

    virtual char const * what() const throw() {
        return m_msg.c_str();
    }

    lib::error_code code() const throw() {
        return m_code;
    }

    const std::string m_msg;
    lib::error_code m_code;
};

} // namespace wsstream

#endif // WSSTREAM_ERROR_HPP
