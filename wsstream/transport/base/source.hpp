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

#ifndef WSSTREAM_TRANSPORT_BASE_SOURCE_HPP
#define WSSTREAM_TRANSPORT_BASE_SOURCE_HPP

#include <wsstream/common/cpp11.hpp>
#include <wsstream/common/stdint.hpp>
#include <wsstream/common/system_error.hpp>

#include <string>

namespace wsstream {
namespace transport {

/**
 * A byte source needs to provide:
 * - size_t read_some(uint8_t * buf, size_t len, lib::error_code & ec)
 *     block until at least one byte is available, then copy at most len bytes
 *     into buf and return how many were copied. ec is cleared on success.
 *
 *     At the clean end of the stream the source returns zero bytes and sets
 *     ec to transport::error::eof. Any other failure is reported through ec;
 *     sources that wrap a foreign error system translate its codes into this
 *     category (pass_through) and log the original.
 *
 *     The reader never calls read_some with len == 0 and never issues two
 *     calls concurrently.
 */

namespace error {
enum value {
    /// Catch-all error for transport policy errors that don't fit in other
    /// categories
    general = 1,

    /// underlying transport pass through
    pass_through,

    /// A stream operation failed with the badbit set
    bad_stream,

    /// End of file
    eof
};

class category : public lib::error_category {
    public:
    category() {}

    char const * name() const _WSSTREAM_NOEXCEPT_TOKEN_ {
        return "wsstream.transport";
    }

    std::string message(int value) const {
        switch(value) {
            case general:
                return "Generic transport policy error";
            case pass_through:
                return "Underlying Transport Error";
            case bad_stream:
                return "A stream operation returned ios::bad";
            case eof:
                return "End of File";
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
} // namespace transport
} // namespace wsstream
_WSSTREAM_ERROR_CODE_ENUM_NS_START_
template<> struct is_error_code_enum<wsstream::transport::error::value>
{
    static bool const value = true;
};
_WSSTREAM_ERROR_CODE_ENUM_NS_END_

namespace wsstream {
namespace transport {

/// Read exactly len bytes from a source
/**
 * Keeps calling read_some until len bytes arrived or the source failed.
 *
 * @param s The source to read from
 * @param buf Destination, at least len bytes long
 * @param len Number of bytes wanted
 * @param ec Set to the source's error if fewer than len bytes were read
 * @return The number of bytes actually read
 */
template <typename source_type>
size_t read_full(source_type & s, uint8_t * buf, size_t len,
    lib::error_code & ec)
{
    size_t total = 0;
    ec = lib::error_code();
    while (total < len) {
        size_t n = s.read_some(buf+total,len-total,ec);
        total += n;
        if (ec) {
            break;
        }
    }
    // a source may report an error along with the final bytes
    if (total == len) {
        ec = lib::error_code();
    }
    return total;
}

} // namespace transport
} // namespace wsstream

#endif // WSSTREAM_TRANSPORT_BASE_SOURCE_HPP
