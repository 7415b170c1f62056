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

#ifndef WSSTREAM_READER_HPP
#define WSSTREAM_READER_HPP

#include <wsstream/common/functional.hpp>
#include <wsstream/common/memory.hpp>
#include <wsstream/common/stdint.hpp>
#include <wsstream/common/system_error.hpp>

#include <wsstream/error.hpp>
#include <wsstream/frame.hpp>
#include <wsstream/role.hpp>
#include <wsstream/utf8_validator.hpp>

#include <wsstream/extensions/extension.hpp>
#include <wsstream/logger/levels.hpp>
#include <wsstream/processors/hybi13.hpp>
#include <wsstream/stream/payload.hpp>
#include <wsstream/transport/base/source.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace wsstream {

/// Reads WebSocket messages from a byte source
/**
 * The reader turns the frames arriving on one connection into a sequence of
 * messages that are read as plain byte streams. Fragmented messages are
 * joined, payloads are unmasked and headers are validated on the way.
 *
 * Usage: call next_frame() to open a message, then call read() until it
 * returns error::eof. A message that is not wanted can be skipped with
 * discard(). Control frames that arrive in the middle of a fragmented
 * message never show up through read(); they are handed to the intermediate
 * handler and skipped.
 *
 * All calls block on the source. A reader must not be used from more than
 * one thread at a time.
 *
 * The config type supplies:
 * - source_type: the byte source (see transport/base/source.hpp)
 * - alog_type, elog_type: access and error loggers
 * - alog_level, elog_level: channels enabled at construction
 * - check_header, check_utf8, max_frame_size: default option values
 */
template <typename config>
class reader {
public:
    /// Type of this reader
    typedef reader<config> type;
    /// Type of a shared pointer to this reader
    typedef lib::shared_ptr<type> ptr;

    /// Type of the byte source
    typedef typename config::source_type source_type;
    /// Type of the access logger
    typedef typename config::alog_type alog_type;
    /// Type of the error logger
    typedef typename config::elog_type elog_type;

    /// Type of the stream a frame's payload is read through
    typedef stream::payload<source_type> payload_type;

    /// Callback invoked for continuation or intermediate control frames
    /**
     * Runs synchronously from within next_frame(). A non-empty return value
     * aborts that call with the same error.
     */
    typedef lib::function<lib::error_code(frame::header const &,
        payload_type &)> frame_handler;

    typedef std::vector<extensions::extension_ptr> extension_list;

    reader(source_type & source, role::value r)
      : m_source(source)
      , m_role(r)
      , m_check_header(config::check_header)
      , m_check_utf8(config::check_utf8)
      , m_max_frame_size(config::max_frame_size)
      , m_open(false)
      , m_fragmented(false)
      , m_opcode(frame::opcode::continuation)
      , m_alog(config::alog_level, &std::clog)
      , m_elog(config::elog_level, &std::cerr)
    {
        m_alog.set_channels(config::alog_level);
        m_elog.set_channels(config::elog_level);

        m_alog.write(log::alevel::devel,"reader constructor");
    }

    /// Create a reader for the client end of a connection
    static ptr client_side(source_type & source) {
        return ptr(new type(source,role::client));
    }

    /// Create a reader for the server end of a connection
    static ptr server_side(source_type & source) {
        return ptr(new type(source,role::server));
    }

    ///////////////////
    // Configuration //
    ///////////////////

    /// Enable or disable RFC6455 header validation
    void set_header_check(bool enabled) {
        m_check_header = enabled;
    }

    bool get_header_check() const {
        return m_check_header;
    }

    /// Enable or disable UTF-8 validation of text messages
    /**
     * Takes effect at the start of the next message.
     */
    void set_check_utf8(bool enabled) {
        m_check_utf8 = enabled;
    }

    bool get_check_utf8() const {
        return m_check_utf8;
    }

    /// Set the largest payload a single frame may declare
    /**
     * @param size The limit in bytes, zero for no limit
     */
    void set_max_frame_size(uint64_t size) {
        m_max_frame_size = size;
    }

    uint64_t get_max_frame_size() const {
        return m_max_frame_size;
    }

    /// Append an extension to the end of the hook chain
    /**
     * Registering an extension allows reserved bits through header
     * validation. Each extension is expected to clear the bits it owns.
     */
    void add_extension(extensions::extension_ptr ext) {
        m_alog.write(log::alevel::devel,"add_extension");
        m_extensions.push_back(ext);
    }

    extension_list const & get_extensions() const {
        return m_extensions;
    }

    /// Set the handler called for each continuation frame
    /**
     * The handler receives the payload stream of the frame. Bytes it reads
     * are not returned again by read().
     */
    void set_continuation_handler(frame_handler h) {
        m_alog.write(log::alevel::devel,"set_continuation_handler");
        m_continuation_handler = h;
    }

    /// Set the handler called for control frames inside a fragmented message
    /**
     * Whatever part of the payload the handler leaves unread is skipped
     * afterwards.
     */
    void set_intermediate_handler(frame_handler h) {
        m_alog.write(log::alevel::devel,"set_intermediate_handler");
        m_intermediate_handler = h;
    }

    ///////////////////
    // Introspection //
    ///////////////////

    role::value get_role() const {
        return m_role;
    }

    source_type & get_source() {
        return m_source;
    }

    /// Whether a fragmented message is waiting for more frames
    bool is_fragmented() const {
        return m_fragmented;
    }

    /// Whether a frame is open for read()
    bool is_open() const {
        return m_open;
    }

    /// Opcode of the message being read
    /**
     * Meaningless while no message is open.
     */
    frame::opcode::value get_message_opcode() const {
        return m_opcode;
    }

    /// Get reference to access logger
    alog_type & get_alog() {
        return m_alog;
    }

    /// Get reference to error logger
    elog_type & get_elog() {
        return m_elog;
    }

    ////////////////
    // Operations //
    ////////////////

    /// Read the next frame header and prepare its payload for reading
    /**
     * The caller must have finished with the payload of the previous frame,
     * either by reading it to the end or by calling discard().
     *
     * Control frames arriving inside a fragmented message are consumed here
     * completely. In that case the frame opened for read() does not change.
     *
     * @param h Receives the decoded header, after extensions rewrote it
     * @return A status code, zero on success
     */
    lib::error_code next_frame(frame::header & h) {
        lib::error_code ec = frame::read_header(m_source,m_scratch,h);
        if (ec) {
            if (ec == transport::error::eof && m_fragmented) {
                ec = make_error_code(error::unexpected_eof);
            }
            if (ec == transport::error::pass_through) {
                log_err(log::elevel::info,"read_header",ec);
            } else if (ec != transport::error::eof) {
                log_err(log::elevel::rerror,"read_header",ec);
            }
            return ec;
        }

        if (m_alog.static_test(log::alevel::frame_header)) {
            m_alog.write(log::alevel::frame_header,
                "Header: "+frame::print_header(h));
        }

        if (m_check_header) {
            ec = processor::check_header(h,m_role,m_fragmented,
                !m_extensions.empty());
            if (ec) {
                log_err(log::elevel::rerror,"check_header",ec);
                return ec;
            }
        }

        if (m_max_frame_size > 0 && h.length > m_max_frame_size) {
            ec = make_error_code(error::frame_too_large);
            log_err(log::elevel::rerror,"next_frame",ec);
            return ec;
        }

        // Bind the payload before the hooks run so that discard() after a
        // rejected frame skips exactly that frame.
        bool intermediate = m_fragmented && frame::is_control(h);
        payload_type & target = intermediate ? m_control : m_payload;
        target.reset(m_source,h.length);
        if (h.masked) {
            target.set_mask(h.mask);
        }

        for (typename extension_list::iterator it = m_extensions.begin();
             it != m_extensions.end(); ++it)
        {
            ec = (*it)->unset_bits(h);
            if (ec) {
                log_err(log::elevel::rerror,"extension",ec);
                return ec;
            }
        }

        if (intermediate) {
            return process_intermediate(h);
        }

        if (!m_fragmented) {
            m_opcode = h.op;
            m_utf8.reset();

            if (m_check_utf8 && m_opcode == frame::opcode::text) {
                m_payload.set_utf8(&m_utf8);
            } else {
                m_payload.set_utf8(NULL);
            }

            if (m_alog.static_test(log::alevel::message_header)) {
                std::stringstream s;
                s << "Message start: " << frame::opcode::name(m_opcode)
                  << (h.fin ? "" : " (fragmented)");
                m_alog.write(log::alevel::message_header,s.str());
            }
        } else if (m_alog.static_test(log::alevel::fragment)) {
            std::stringstream s;
            s << "Continuation frame of " << h.length << " bytes"
              << (h.fin ? ", final" : "");
            m_alog.write(log::alevel::fragment,s.str());
        }
        m_open = true;

        if (h.op == frame::opcode::continuation && m_continuation_handler) {
            ec = m_continuation_handler(h,m_payload);
            if (ec) {
                log_err(log::elevel::rerror,"continuation handler",ec);
            }
        }

        m_fragmented = !h.fin;

        return ec;
    }

    /// Read payload bytes of the current message
    /**
     * Frame boundaries of a fragmented message are crossed transparently:
     * when a frame ends in the middle of a message the call returns what it
     * read without error and the next call moves on to the next frame. Such
     * a call may return zero bytes without error if the next frame was a
     * control frame.
     *
     * error::eof is set if and only if the whole message was read. After it
     * the reader is ready for next_frame() again.
     *
     * If UTF-8 checking is on and the text message turned out to be invalid,
     * the call that would have reported error::eof reports
     * error::invalid_utf8 instead. Its return value is then the length of
     * the valid prefix of the whole message rather than a count for this
     * call.
     *
     * @param buf Destination buffer
     * @param len Size of buf
     * @param ec Set to the status of the operation
     * @return The number of bytes read
     */
    size_t read(uint8_t * buf, size_t len, lib::error_code & ec) {
        if (!m_open) {
            if (!m_fragmented) {
                ec = make_error_code(error::no_frame_advance);
                return 0;
            }

            frame::header h;
            ec = next_frame(h);
            if (ec) {
                return 0;
            }
            if (!m_open) {
                // an intermediate control frame was consumed
                return 0;
            }
        }

        size_t n = m_payload.read_some(buf,len,ec);
        if (m_alog.static_test(log::alevel::frame_payload)) {
            std::stringstream s;
            s << "Read " << n << " bytes, " << m_payload.remaining()
              << " left in frame";
            m_alog.write(log::alevel::frame_payload,s.str());
        }
        if (ec && ec != error::eof) {
            log_err(log::elevel::rerror,"read",ec);
            return n;
        }
        if (!ec && m_payload.remaining() != 0) {
            return n;
        }

        // end of frame
        if (m_payload.remaining() != 0) {
            ec = make_error_code(error::unexpected_eof);
            log_err(log::elevel::rerror,"read",ec);
            return n;
        }

        if (m_fragmented) {
            reset_fragment();
            ec = lib::error_code();
            return n;
        }

        if (m_payload.get_utf8() != NULL && !m_utf8.complete()) {
            ec = make_error_code(error::invalid_utf8);
            log_err(log::elevel::rerror,"read",ec);
            return static_cast<size_t>(m_utf8.accepted());
        }

        m_alog.write(log::alevel::message_header,"Message end");
        reset();
        ec = make_error_code(error::eof);
        return n;
    }

    /// Skip the rest of the current message
    /**
     * Drains the current frame and, while the message is fragmented, every
     * following frame up to and including the final one. The payload is not
     * unmasked or validated. Read state is reset afterwards even on error.
     *
     * @return A status code, zero on success
     */
    lib::error_code discard() {
        lib::error_code ec;

        if (m_alog.static_test(log::alevel::discard)) {
            std::stringstream s;
            s << "Discard " << m_payload.remaining() << " bytes"
              << (m_fragmented ? " and following fragments" : "");
            m_alog.write(log::alevel::discard,s.str());
        }

        // a control frame rejected by an extension or by the intermediate
        // handler is still bound here
        ec = m_control.raw().discard();
        m_control.clear();

        while (!ec) {
            ec = m_payload.raw().discard();
            if (ec || !m_fragmented) {
                break;
            }

            frame::header h;
            ec = next_frame(h);
            if (ec) {
                break;
            }
        }

        if (ec) {
            log_err(log::elevel::rerror,"discard",ec);
        }

        reset();
        return ec;
    }
private:
    lib::error_code process_intermediate(frame::header const & h) {
        if (m_alog.static_test(log::alevel::control)) {
            std::stringstream s;
            s << "Intermediate " << frame::opcode::name(h.op) << " frame of "
              << h.length << " bytes";
            m_alog.write(log::alevel::control,s.str());
        }

        lib::error_code ec;
        if (m_intermediate_handler) {
            ec = m_intermediate_handler(h,m_control);
        }
        if (!ec) {
            ec = m_control.raw().discard();
        }
        if (ec) {
            // left bound, discard() skips what the handler did not read
            log_err(log::elevel::rerror,"intermediate frame",ec);
            return ec;
        }

        m_control.clear();
        return ec;
    }

    /// Forget the finished frame but keep the message going
    void reset_fragment() {
        m_open = false;
        m_payload.raw().clear();
    }

    /// Forget the message
    void reset() {
        m_open = false;
        m_fragmented = false;
        m_opcode = frame::opcode::continuation;
        m_payload.clear();
        m_utf8.reset();
    }

    void log_err(log::level l, char const * msg, lib::error_code const & ec) {
        m_elog.write(l,msg,ec);
    }

    source_type &               m_source;
    role::value const           m_role;

    bool                        m_check_header;
    bool                        m_check_utf8;
    uint64_t                    m_max_frame_size;
    extension_list              m_extensions;

    frame_handler               m_continuation_handler;
    frame_handler               m_intermediate_handler;

    // header decoding working memory, reused across frames
    uint8_t                     m_scratch[frame::MAX_EXTENDED_HEADER_LENGTH];

    payload_type                m_payload;
    payload_type                m_control;
    utf8_validator::validator   m_utf8;

    bool                        m_open;
    bool                        m_fragmented;
    frame::opcode::value        m_opcode;

    alog_type                   m_alog;
    elog_type                   m_elog;
};

/// Open the next message of a byte source with a fresh reader
/**
 * Performs exactly one next_frame() call. On success out holds a reader
 * positioned at the payload of the message.
 *
 * The reader has no intermediate handler, so a control frame arriving in
 * the middle of a fragmented message is skipped silently. Callers that care
 * about such frames should construct a reader themselves.
 *
 * @param source The byte source to read from
 * @param r The role of the reading endpoint
 * @param h Receives the header of the first frame
 * @param out Receives the reader on success
 * @return A status code, zero on success
 */
template <typename config>
lib::error_code next_reader(typename config::source_type & source,
    role::value r, frame::header & h, typename reader<config>::ptr & out)
{
    typename reader<config>::ptr rd(new reader<config>(source,r));

    lib::error_code ec = rd->next_frame(h);
    if (ec) {
        return ec;
    }

    out = rd;
    return lib::error_code();
}

} // namespace wsstream

#endif // WSSTREAM_READER_HPP
