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

#ifndef WSSTREAM_TRANSPORT_IOSTREAM_SOURCE_HPP
#define WSSTREAM_TRANSPORT_IOSTREAM_SOURCE_HPP

#include <wsstream/transport/base/source.hpp>

#include <wsstream/common/stdint.hpp>
#include <wsstream/common/system_error.hpp>

#include <istream>

namespace wsstream {
namespace transport {
namespace iostream {

/// Byte source that pulls from a std::istream
/**
 * Reads block inside std::istream::read until either the requested number of
 * bytes arrived or the stream hit end of file. A short read caused by end of
 * file is returned without error; the following call reports
 * transport::error::eof.
 *
 * You can use tellg() on the input stream to determine how many bytes the
 * reader has consumed.
 */
class source {
public:
    explicit source(std::istream & in) : m_input(&in) {}

    /// Replace the registered input stream
    void register_istream(std::istream & in) {
        m_input = &in;
    }

    size_t read_some(uint8_t * buf, size_t len, lib::error_code & ec) {
        if (m_input->bad()) {
            ec = make_error_code(error::bad_stream);
            return 0;
        }

        m_input->read(reinterpret_cast<char *>(buf),static_cast<std::streamsize>(len));
        size_t n = static_cast<size_t>(m_input->gcount());

        if (m_input->bad()) {
            ec = make_error_code(error::bad_stream);
        } else if (n == 0) {
            ec = make_error_code(error::eof);
        } else {
            ec = lib::error_code();
        }
        return n;
    }
private:
    std::istream * m_input;
};

} // namespace iostream
} // namespace transport
} // namespace wsstream

#endif // WSSTREAM_TRANSPORT_IOSTREAM_SOURCE_HPP
