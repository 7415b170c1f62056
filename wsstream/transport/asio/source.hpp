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

#ifndef WSSTREAM_TRANSPORT_ASIO_SOURCE_HPP
#define WSSTREAM_TRANSPORT_ASIO_SOURCE_HPP

#include <wsstream/transport/base/source.hpp>

#include <wsstream/common/stdint.hpp>
#include <wsstream/common/system_error.hpp>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

namespace wsstream {
namespace transport {
/// Byte sources backed by boost::asio
namespace asio {

/// Byte source that performs blocking read_some calls on an asio stream
/**
 * stream_type is any Boost.Asio SyncReadStream, for example
 * boost::asio::ip::tcp::socket or boost::asio::local::stream_protocol::socket.
 * The source does not own the stream. Timeouts and cancellation are whatever
 * the stream itself provides.
 *
 * boost::asio::error::eof is translated to transport::error::eof. Every other
 * asio error is reported as transport::error::pass_through; the original code
 * stays available from get_transport_ec().
 */
template <typename stream_type>
class source {
public:
    typedef source<stream_type> type;

    explicit source(stream_type & stream) : m_stream(stream) {}

    stream_type & get_stream() {
        return m_stream;
    }

    /// Get the most recent underlying asio error
    /**
     * @return The boost::system::error_code that caused the most recent
     * pass_through error, or an empty code.
     */
    boost::system::error_code get_transport_ec() const {
        return m_tec;
    }

    size_t read_some(uint8_t * buf, size_t len, lib::error_code & ec) {
        boost::system::error_code bec;
        size_t n = m_stream.read_some(boost::asio::buffer(buf,len),bec);

        if (!bec) {
            ec = lib::error_code();
            return n;
        }

        // translate boost error codes into lib::error_codes
        if (bec == boost::asio::error::eof) {
            ec = make_error_code(transport::error::eof);
        } else {
            m_tec = bec;
            ec = make_error_code(transport::error::pass_through);
        }
        return n;
    }
private:
    stream_type & m_stream;
    boost::system::error_code m_tec;
};

} // namespace asio
} // namespace transport
} // namespace wsstream

#endif // WSSTREAM_TRANSPORT_ASIO_SOURCE_HPP
