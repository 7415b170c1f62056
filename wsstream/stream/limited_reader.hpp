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

#ifndef WSSTREAM_STREAM_LIMITED_READER_HPP
#define WSSTREAM_STREAM_LIMITED_READER_HPP

#include <wsstream/common/stdint.hpp>
#include <wsstream/common/system_error.hpp>

#include <wsstream/error.hpp>
#include <wsstream/transport/base/source.hpp>

namespace wsstream {
/// Small stateful stages that a frame payload is read through
namespace stream {

/// Reads at most a fixed number of bytes from a source
/**
 * Bound to the payload of exactly one frame. It is the innermost stage of
 * the payload chain and also what discard() drains when bytes are skipped
 * without unmasking or validation.
 *
 * Once the bound is reached read_some reports error::eof. A source that ends
 * before the bound is reached reports error::unexpected_eof.
 */
template <typename source_type>
class limited_reader {
public:
    limited_reader() : m_source(NULL), m_remaining(0) {}

    /// Bind to the next n bytes of a source
    void reset(source_type & s, uint64_t n) {
        m_source = &s;
        m_remaining = n;
    }

    /// Unbind from the source
    void clear() {
        m_source = NULL;
        m_remaining = 0;
    }

    /// Bytes of the bound not yet read
    uint64_t remaining() const {
        return m_remaining;
    }

    size_t read_some(uint8_t * buf, size_t len, lib::error_code & ec) {
        if (m_remaining == 0 || m_source == NULL) {
            ec = make_error_code(error::eof);
            return 0;
        }
        if (len == 0) {
            ec = lib::error_code();
            return 0;
        }
        if (len > m_remaining) {
            len = static_cast<size_t>(m_remaining);
        }

        size_t n = m_source->read_some(buf,len,ec);
        m_remaining -= n;

        if (ec == transport::error::eof) {
            ec = make_error_code(error::unexpected_eof);
        }
        return n;
    }

    /// Read and throw away every remaining byte of the bound
    /**
     * @return A status code, zero if the bound was reached
     */
    lib::error_code discard() {
        uint8_t scratch[512];
        lib::error_code ec;

        while (m_remaining > 0) {
            read_some(scratch,sizeof(scratch),ec);
            if (ec) {
                return ec;
            }
        }
        return lib::error_code();
    }
private:
    source_type *   m_source;
    uint64_t        m_remaining;
};

} // namespace stream
} // namespace wsstream

#endif // WSSTREAM_STREAM_LIMITED_READER_HPP
