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

#ifndef WSSTREAM_TRANSPORT_BUFFER_SOURCE_HPP
#define WSSTREAM_TRANSPORT_BUFFER_SOURCE_HPP

#include <wsstream/transport/base/source.hpp>

#include <wsstream/common/stdint.hpp>
#include <wsstream/common/system_error.hpp>

#include <algorithm>
#include <cstring>
#include <string>

namespace wsstream {
namespace transport {
namespace buffer {

/// Byte source that reads from a caller owned block of memory
/**
 * The memory must outlive the source. An optional per call cap forces the
 * source to hand out short reads, which is how network sources behave when
 * a frame straddles several segments.
 */
class source {
public:
    source() : m_buf(NULL), m_len(0), m_cursor(0), m_max_read(0) {}

    source(uint8_t const * buf, size_t len)
      : m_buf(buf), m_len(len), m_cursor(0), m_max_read(0) {}

    explicit source(std::string const & data)
      : m_buf(reinterpret_cast<uint8_t const *>(data.data()))
      , m_len(data.size())
      , m_cursor(0)
      , m_max_read(0) {}

    /// Set the most bytes a single read_some call may return
    /**
     * @param max The cap, zero for no cap
     */
    void set_max_read(size_t max) {
        m_max_read = max;
    }

    /// Number of bytes handed out so far
    size_t position() const {
        return m_cursor;
    }

    /// Number of bytes not yet handed out
    size_t available() const {
        return m_len - m_cursor;
    }

    size_t read_some(uint8_t * buf, size_t len, lib::error_code & ec) {
        if (m_cursor == m_len) {
            ec = make_error_code(error::eof);
            return 0;
        }

        size_t n = std::min(len,m_len-m_cursor);
        if (m_max_read != 0 && n > m_max_read) {
            n = m_max_read;
        }

        std::memcpy(buf,m_buf+m_cursor,n);
        m_cursor += n;

        ec = lib::error_code();
        return n;
    }
private:
    uint8_t const * m_buf;
    size_t          m_len;
    size_t          m_cursor;
    size_t          m_max_read;
};

} // namespace buffer
} // namespace transport
} // namespace wsstream

#endif // WSSTREAM_TRANSPORT_BUFFER_SOURCE_HPP
