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

#ifndef WSSTREAM_STREAM_PAYLOAD_HPP
#define WSSTREAM_STREAM_PAYLOAD_HPP

#include <wsstream/common/stdint.hpp>
#include <wsstream/common/system_error.hpp>

#include <wsstream/frame.hpp>
#include <wsstream/stream/cipher.hpp>
#include <wsstream/stream/limited_reader.hpp>
#include <wsstream/utf8_validator.hpp>

namespace wsstream {
namespace stream {

/// The payload of one frame as seen by the caller
/**
 * Composes the stages raw -> cipher -> utf8. The cipher and the utf8 stage
 * are optional and switched per frame. The utf8 validator is not owned: it
 * belongs to the message and outlives the frames that feed it.
 *
 * Provides the same read_some contract as a byte source, with error::eof at
 * the end of the frame.
 */
template <typename source_type>
class payload {
public:
    typedef limited_reader<source_type> raw_type;

    payload() : m_utf8(NULL) {}

    /// Bind to the payload of a new frame
    /**
     * The cipher stage is switched off. The utf8 stage is left as it was so
     * that it carries over the frames of one message.
     */
    void reset(source_type & s, uint64_t length) {
        m_raw.reset(s,length);
        m_cipher.clear();
    }

    /// Unbind and switch off every optional stage
    void clear() {
        m_raw.clear();
        m_cipher.clear();
        m_utf8 = NULL;
    }

    /// Unmask with the given key
    void set_mask(frame::masking_key_type const & key) {
        m_cipher.reset(key);
    }

    /// Feed every byte read to a validator, NULL to stop
    void set_utf8(utf8_validator::validator * v) {
        m_utf8 = v;
    }

    utf8_validator::validator * get_utf8() const {
        return m_utf8;
    }

    /// Access the raw stage, which bypasses unmasking and validation
    raw_type & raw() {
        return m_raw;
    }

    /// Payload bytes of the frame not yet read
    uint64_t remaining() const {
        return m_raw.remaining();
    }

    size_t read_some(uint8_t * buf, size_t len, lib::error_code & ec) {
        size_t n = m_raw.read_some(buf,len,ec);
        if (n > 0) {
            m_cipher.apply(buf,n);
            if (m_utf8) {
                // an invalid sequence latches in the validator and is
                // reported once the message ends
                m_utf8->decode(buf,buf+n);
            }
        }
        return n;
    }
private:
    raw_type                    m_raw;
    cipher                      m_cipher;
    utf8_validator::validator * m_utf8;
};

} // namespace stream
} // namespace wsstream

#endif // WSSTREAM_STREAM_PAYLOAD_HPP
