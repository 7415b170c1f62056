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

#ifndef WSSTREAM_EXTENSION_PERMESSAGE_DEFLATE_RECEIVER_HPP
#define WSSTREAM_EXTENSION_PERMESSAGE_DEFLATE_RECEIVER_HPP

#include <wsstream/common/cpp11.hpp>
#include <wsstream/common/system_error.hpp>

#include <wsstream/extensions/extension.hpp>
#include <wsstream/frame.hpp>

#include <string>

namespace wsstream {
namespace extensions {

/// Receive side bit handling of the permessage-deflate extension
/**
 * RFC7692 uses RSV1 on the first frame of a message to flag a compressed
 * payload. The receiver records that flag for the message and clears the
 * bit. RSV1 is illegal on continuation frames and on control frames.
 *
 * Decompression is not done here; callers that want the plain payload run
 * the bytes through an inflater when is_compressed() is true.
 */
namespace permessage_deflate {

/// Permessage deflate error values
namespace error {
enum value {
    /// Catch all
    general = 1,

    /// RSV1 was set on a continuation frame
    unexpected_compression_bit,

    /// RSV1 was set on a control frame
    control_compressed
};

/// Permessage-deflate error category
class category : public lib::error_category {
public:
    category() {}

    char const * name() const _WSSTREAM_NOEXCEPT_TOKEN_ {
        return "wsstream.extension.permessage-deflate";
    }

    std::string message(int value) const {
        switch(value) {
            case general:
                return "Generic permessage-deflate error";
            case unexpected_compression_bit:
                return "Compression bit set on a continuation frame";
            case control_compressed:
                return "Compression bit set on a control frame";
            default:
                return "Unknown permessage-deflate error";
        }
    }
};

/// Get a reference to a static copy of the permessage-deflate error category
inline lib::error_category const & get_category() {
    static category instance;
    return instance;
}

/// Create an error code in the permessage-deflate category
inline lib::error_code make_error_code(error::value e) {
    return lib::error_code(static_cast<int>(e), get_category());
}

} // namespace error
} // namespace permessage_deflate
} // namespace extensions
} // namespace wsstream

_WSSTREAM_ERROR_CODE_ENUM_NS_START_
template<> struct is_error_code_enum
    <wsstream::extensions::permessage_deflate::error::value>
{
    static bool const value = true;
};
_WSSTREAM_ERROR_CODE_ENUM_NS_END_

namespace wsstream {
namespace extensions {
namespace permessage_deflate {

/// Claims RSV1 for permessage-deflate
class receiver : public extension {
public:
    receiver() : m_compressed(false) {}

    lib::error_code unset_bits(frame::header & h) {
        bool rsv1 = frame::get_rsv1(h);

        if (frame::is_control(h)) {
            if (rsv1) {
                return make_error_code(error::control_compressed);
            }
            return lib::error_code();
        }

        if (h.op == frame::opcode::continuation) {
            if (rsv1) {
                return make_error_code(error::unexpected_compression_bit);
            }
            return lib::error_code();
        }

        m_compressed = rsv1;
        h.rsv &= static_cast<uint8_t>(~frame::RSV1);
        return lib::error_code();
    }

    /// Whether the message being read was sent compressed
    bool is_compressed() const {
        return m_compressed;
    }
private:
    bool m_compressed;
};

} // namespace permessage_deflate
} // namespace extensions
} // namespace wsstream

#endif // WSSTREAM_EXTENSION_PERMESSAGE_DEFLATE_RECEIVER_HPP
