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

#ifndef WSSTREAM_STREAM_CIPHER_HPP
#define WSSTREAM_STREAM_CIPHER_HPP

#include <wsstream/common/stdint.hpp>

#include <wsstream/frame.hpp>

namespace wsstream {
namespace stream {

/// Unmasking stage
/**
 * Keeps the keystream position between calls so a frame may be unmasked in
 * pieces of any size.
 */
class cipher {
public:
    cipher() : m_enabled(false), m_prepared_key(0) {}

    /// Start a new keystream for the given key
    void reset(frame::masking_key_type const & key) {
        m_prepared_key = frame::prepare_masking_key(key);
        m_enabled = true;
    }

    /// Turn the stage off
    void clear() {
        m_enabled = false;
        m_prepared_key = 0;
    }

    bool enabled() const {
        return m_enabled;
    }

    /// Unmask len bytes in place and advance the keystream
    void apply(uint8_t * buf, size_t len) {
        if (!m_enabled || len == 0) {
            return;
        }
        m_prepared_key = frame::word_mask_circ(buf,len,m_prepared_key);
    }
private:
    bool    m_enabled;
    size_t  m_prepared_key;
};

} // namespace stream
} // namespace wsstream

#endif // WSSTREAM_STREAM_CIPHER_HPP
