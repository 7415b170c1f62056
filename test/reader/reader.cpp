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

//#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE reader
#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>
#include <vector>

#include <wsstream/config/core.hpp>
#include <wsstream/extensions/extension.hpp>
#include <wsstream/reader.hpp>
#include <wsstream/transport/buffer/source.hpp>

#include "../frame_builder.hpp"

using namespace wsstream;
using test::build_frame;

struct stub_config : public config::core {
    typedef transport::buffer::source source_type;

    static const log::level elog_level = log::elevel::none;
    static const log::level alog_level = log::alevel::none;
};

struct verbose_config : public config::core {
    typedef transport::buffer::source source_type;

    static const log::level elog_level = log::elevel::all;
    static const log::level alog_level = log::alevel::all;
};

typedef reader<stub_config> reader_type;

namespace {

uint8_t const key_a[4] = {0x37, 0xFA, 0x21, 0x3D};
uint8_t const key_b[4] = {0x00, 0xFF, 0x80, 0x01};

/// Read the open message to its end in chunks of the given size
template <typename reader_t>
lib::error_code read_message(reader_t & r, std::string & out,
    size_t chunk = 64)
{
    std::vector<uint8_t> buf(chunk);
    lib::error_code ec;

    for (;;) {
        size_t n = r.read(&buf[0],buf.size(),ec);
        if (ec == error::invalid_utf8) {
            return ec;
        }
        out.append(reinterpret_cast<char *>(&buf[0]),n);
        if (ec) {
            return ec;
        }
    }
}

std::string pattern(size_t len) {
    std::string s(len,'\0');
    for (size_t i = 0; i < len; i++) {
        s[i] = static_cast<char>((i*31+7) & 0xFF);
    }
    return s;
}

/// Handler target that drains and records every frame it is given
struct frame_recorder {
    frame_recorder() : calls(0) {}

    lib::error_code on_frame(frame::header const & h,
        reader_type::payload_type & p)
    {
        calls++;
        ops.push_back(h.op);

        uint8_t buf[16];
        lib::error_code ec;
        for (;;) {
            size_t n = p.read_some(buf,sizeof(buf),ec);
            payload.append(reinterpret_cast<char *>(buf),n);
            if (ec) {
                break;
            }
        }
        if (ec == error::eof) {
            return result;
        }
        return ec;
    }

    int calls;
    std::vector<frame::opcode::value> ops;
    std::string payload;
    lib::error_code result;
};

/// Extension that counts calls and clears or rejects
class counting_extension : public extensions::extension {
public:
    explicit counting_extension(lib::error_code ec = lib::error_code())
      : calls(0), m_ec(ec) {}

    lib::error_code unset_bits(frame::header & h) {
        calls++;
        if (m_ec) {
            return m_ec;
        }
        h.rsv = 0;
        return lib::error_code();
    }

    int calls;
private:
    lib::error_code m_ec;
};

} // namespace

BOOST_AUTO_TEST_CASE( single_frame_messages ) {
    size_t lengths[] = {0, 1, 2, 125, 126, 127, 1000, 65535, 65536, 70001};

    for (size_t i = 0; i < sizeof(lengths)/sizeof(lengths[0]); i++) {
        std::string payload = pattern(lengths[i]);
        std::string wire = build_frame(true,frame::opcode::binary,payload);
        transport::buffer::source s(wire);
        reader_type r(s,role::client);

        frame::header h;
        BOOST_REQUIRE( !r.next_frame(h) );
        BOOST_CHECK_EQUAL( h.length, lengths[i] );
        BOOST_CHECK_EQUAL( r.get_message_opcode(), frame::opcode::binary );

        std::string out;
        BOOST_CHECK_EQUAL( read_message(r,out,4096), error::eof );
        BOOST_CHECK( out == payload );
        BOOST_CHECK_EQUAL( s.available(), 0 );
        BOOST_CHECK( !r.is_open() );
    }
}

BOOST_AUTO_TEST_CASE( length_forms_read_identically ) {
    std::string payload = pattern(100);
    test::length_form::value forms[3] = {test::length_form::basic,
        test::length_form::extended, test::length_form::jumbo};

    for (int i = 0; i < 3; i++) {
        std::string wire = build_frame(true,frame::opcode::binary,payload,
            false,NULL,0,forms[i]);
        transport::buffer::source s(wire);
        reader_type r(s,role::client);

        frame::header h;
        BOOST_REQUIRE( !r.next_frame(h) );
        BOOST_CHECK_EQUAL( h.length, 100 );

        std::string out;
        BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
        BOOST_CHECK( out == payload );
    }
}

BOOST_AUTO_TEST_CASE( length_msb_is_rejected ) {
    std::string wire = test::build_jumbo_header(0x82,0x8000000000000001ULL);
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    frame::header h;
    BOOST_CHECK_EQUAL( r.next_frame(h), error::header_length_msb );
}

BOOST_AUTO_TEST_CASE( messages_follow_each_other ) {
    std::string wire = build_frame(true,frame::opcode::text,"first")
        + build_frame(true,frame::opcode::binary,"second")
        + build_frame(true,frame::opcode::ping,"third");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    char const * expected[3] = {"first", "second", "third"};
    frame::opcode::value ops[3] = {frame::opcode::text,
        frame::opcode::binary, frame::opcode::ping};

    for (int i = 0; i < 3; i++) {
        frame::header h;
        BOOST_REQUIRE( !r.next_frame(h) );
        BOOST_CHECK_EQUAL( r.get_message_opcode(), ops[i] );

        std::string out;
        BOOST_CHECK_EQUAL( read_message(r,out,3), error::eof );
        BOOST_CHECK_EQUAL( out, expected[i] );
    }

    frame::header h;
    BOOST_CHECK_EQUAL( r.next_frame(h), transport::error::eof );
}

BOOST_AUTO_TEST_CASE( fragmented_message_with_intermediate_ping ) {
    std::string wire = build_frame(false,frame::opcode::text,"Hel")
        + build_frame(false,frame::opcode::continuation,"lo, ")
        + build_frame(true,frame::opcode::ping,"are you there")
        + build_frame(false,frame::opcode::continuation,"")
        + build_frame(true,frame::opcode::continuation,"World");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    frame_recorder intermediate;
    r.set_intermediate_handler(lib::bind(&frame_recorder::on_frame,
        &intermediate,lib::placeholders::_1,lib::placeholders::_2));

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );
    BOOST_CHECK( !h.fin );
    BOOST_CHECK( r.is_fragmented() );

    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out,2), error::eof );
    BOOST_CHECK_EQUAL( out, "Hello, World" );
    BOOST_CHECK( !r.is_fragmented() );
    BOOST_CHECK_EQUAL( s.available(), 0 );

    BOOST_CHECK_EQUAL( intermediate.calls, 1 );
    BOOST_CHECK_EQUAL( intermediate.ops[0], frame::opcode::ping );
    BOOST_CHECK_EQUAL( intermediate.payload, "are you there" );
}

BOOST_AUTO_TEST_CASE( intermediate_frame_without_handler_is_skipped ) {
    std::string wire = build_frame(false,frame::opcode::binary,"ab")
        + build_frame(true,frame::opcode::pong,"ignored")
        + build_frame(true,frame::opcode::continuation,"cd")
        + build_frame(true,frame::opcode::text,"next");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );

    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK_EQUAL( out, "abcd" );

    BOOST_REQUIRE( !r.next_frame(h) );
    BOOST_CHECK_EQUAL( h.op, frame::opcode::text );
    out.clear();
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK_EQUAL( out, "next" );
}

BOOST_AUTO_TEST_CASE( intermediate_frame_returns_zero_bytes ) {
    std::string wire = build_frame(false,frame::opcode::binary,"ab")
        + build_frame(true,frame::opcode::ping,"")
        + build_frame(true,frame::opcode::continuation,"cd");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );

    uint8_t buf[16];
    lib::error_code ec;

    BOOST_CHECK_EQUAL( r.read(buf,sizeof(buf),ec), 2 );
    BOOST_CHECK( !ec );
    BOOST_CHECK_EQUAL( r.read(buf,sizeof(buf),ec), 0 );
    BOOST_CHECK( !ec );
    BOOST_CHECK( r.is_fragmented() );
    BOOST_CHECK_EQUAL( r.read(buf,sizeof(buf),ec), 2 );
    BOOST_CHECK_EQUAL( ec, error::eof );
}

BOOST_AUTO_TEST_CASE( end_of_stream_inside_fragmented_message ) {
    std::string wire = build_frame(false,frame::opcode::text,"abc");

    {
        transport::buffer::source s(wire);
        reader_type r(s,role::client);

        frame::header h;
        BOOST_REQUIRE( !r.next_frame(h) );

        std::string out;
        BOOST_CHECK_EQUAL( read_message(r,out), error::unexpected_eof );
        BOOST_CHECK_EQUAL( out, "abc" );
    }

    {
        transport::buffer::source s(wire);
        reader_type r(s,role::client);

        frame::header h;
        BOOST_REQUIRE( !r.next_frame(h) );

        uint8_t buf[3];
        lib::error_code ec;
        BOOST_CHECK_EQUAL( r.read(buf,3,ec), 3 );
        BOOST_CHECK( !ec );
        BOOST_CHECK_EQUAL( r.next_frame(h), error::unexpected_eof );
    }
}

BOOST_AUTO_TEST_CASE( end_of_stream_inside_frame ) {
    std::string wire = build_frame(true,frame::opcode::binary,"0123456789");
    wire.resize(wire.size()-6);
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );

    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out), error::unexpected_eof );
    BOOST_CHECK_EQUAL( out, "0123" );
}

BOOST_AUTO_TEST_CASE( read_without_next_frame ) {
    std::string wire = build_frame(true,frame::opcode::text,"hello");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    uint8_t buf[16];
    lib::error_code ec;

    BOOST_CHECK_EQUAL( r.read(buf,sizeof(buf),ec), 0 );
    BOOST_CHECK_EQUAL( ec, error::no_frame_advance );
    BOOST_CHECK_EQUAL( s.position(), 0 );

    // recoverable by calling next_frame
    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );
    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK_EQUAL( out, "hello" );

    // and again once the message is finished
    BOOST_CHECK_EQUAL( r.read(buf,sizeof(buf),ec), 0 );
    BOOST_CHECK_EQUAL( ec, error::no_frame_advance );
}

BOOST_AUTO_TEST_CASE( masked_frames_are_unmasked ) {
    uint8_t const * keys[2] = {key_a, key_b};

    for (int k = 0; k < 2; k++) {
        for (size_t len = 0; len <= 40; len++) {
            std::string payload = pattern(len);
            std::string wire = build_frame(true,frame::opcode::binary,
                payload,true,keys[k]);
            transport::buffer::source s(wire);
            reader_type::ptr r = reader_type::server_side(s);

            frame::header h;
            BOOST_REQUIRE( !r->next_frame(h) );
            BOOST_CHECK( h.masked );

            std::string out;
            BOOST_CHECK_EQUAL( read_message(*r,out,3), error::eof );
            BOOST_CHECK( out == payload );
        }
    }
}

BOOST_AUTO_TEST_CASE( masked_fragments_restart_keystream ) {
    std::string wire = build_frame(false,frame::opcode::binary,"abcde",true,
            key_a)
        + build_frame(true,frame::opcode::ping,"xyz",true,key_b)
        + build_frame(true,frame::opcode::continuation,"fghij",true,key_b);
    transport::buffer::source s(wire);
    reader_type::ptr r = reader_type::server_side(s);
    BOOST_CHECK_EQUAL( r->get_role(), role::server );

    frame_recorder intermediate;
    r->set_intermediate_handler(lib::bind(&frame_recorder::on_frame,
        &intermediate,lib::placeholders::_1,lib::placeholders::_2));

    frame::header h;
    BOOST_REQUIRE( !r->next_frame(h) );

    std::string out;
    BOOST_CHECK_EQUAL( read_message(*r,out,3), error::eof );
    BOOST_CHECK_EQUAL( out, "abcdefghij" );
    BOOST_CHECK_EQUAL( intermediate.payload, "xyz" );
}

BOOST_AUTO_TEST_CASE( short_source_reads ) {
    std::string payload = pattern(300);
    std::string wire = build_frame(false,frame::opcode::binary,
            payload.substr(0,130),true,key_a)
        + build_frame(true,frame::opcode::ping,"p",true,key_b)
        + build_frame(true,frame::opcode::continuation,payload.substr(130),
            true,key_b);

    for (size_t max_read = 0; max_read < 4; max_read++) {
        transport::buffer::source s(wire);
        s.set_max_read(max_read);
        reader_type r(s,role::server);

        frame::header h;
        BOOST_REQUIRE( !r.next_frame(h) );

        std::string out;
        BOOST_CHECK_EQUAL( read_message(r,out,max_read == 0 ? 64 : 1),
            error::eof );
        BOOST_CHECK( out == payload );
    }
}

BOOST_AUTO_TEST_CASE( max_frame_size ) {
    std::string wire = build_frame(true,frame::opcode::binary,"123456");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);
    r.set_max_frame_size(5);
    BOOST_CHECK_EQUAL( r.get_max_frame_size(), 5 );

    frame::header h;
    BOOST_CHECK_EQUAL( r.next_frame(h), error::frame_too_large );
    BOOST_CHECK( !r.is_fragmented() );
    BOOST_CHECK( !r.is_open() );

    transport::buffer::source s2(wire);
    reader_type r2(s2,role::client);
    r2.set_max_frame_size(6);
    BOOST_CHECK( !r2.next_frame(h) );
}

BOOST_AUTO_TEST_CASE( max_frame_size_keeps_fragmentation_state ) {
    std::string wire = build_frame(false,frame::opcode::binary,"ab")
        + build_frame(true,frame::opcode::continuation,"0123456789");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);
    r.set_max_frame_size(5);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );

    uint8_t buf[16];
    lib::error_code ec;
    BOOST_CHECK_EQUAL( r.read(buf,sizeof(buf),ec), 2 );
    BOOST_CHECK( !ec );

    BOOST_CHECK_EQUAL( r.read(buf,sizeof(buf),ec), 0 );
    BOOST_CHECK_EQUAL( ec, error::frame_too_large );
    BOOST_CHECK( r.is_fragmented() );
    BOOST_CHECK_EQUAL( r.get_message_opcode(), frame::opcode::binary );
}

BOOST_AUTO_TEST_CASE( utf8_valid_text_across_fragments ) {
    // U+20AC split over three frames
    std::string wire = build_frame(false,frame::opcode::text,"price \xE2")
        + build_frame(false,frame::opcode::continuation,"\x82")
        + build_frame(true,frame::opcode::continuation,"\xAC" "5");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);
    r.set_check_utf8(true);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );

    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out,1), error::eof );
    BOOST_CHECK_EQUAL( out, "price \xE2\x82\xAC" "5" );
}

BOOST_AUTO_TEST_CASE( utf8_invalid_text ) {
    std::string wire = build_frame(false,frame::opcode::text,"ab\xC3")
        + build_frame(true,frame::opcode::continuation,"\xA9" "cd\xFF" "efgh")
        + build_frame(true,frame::opcode::text,"fine");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);
    r.set_check_utf8(true);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );

    uint8_t buf[64];
    lib::error_code ec;
    BOOST_CHECK_EQUAL( r.read(buf,sizeof(buf),ec), 3 );
    BOOST_CHECK( !ec );

    // the count is the valid prefix of the whole message
    BOOST_CHECK_EQUAL( r.read(buf,sizeof(buf),ec), 6 );
    BOOST_CHECK_EQUAL( ec, error::invalid_utf8 );

    BOOST_CHECK( !r.discard() );

    BOOST_REQUIRE( !r.next_frame(h) );
    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK_EQUAL( out, "fine" );
}

BOOST_AUTO_TEST_CASE( utf8_truncated_text ) {
    std::string wire = build_frame(true,frame::opcode::text,"ab\xE2\x82");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);
    r.set_check_utf8(true);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );

    uint8_t buf[64];
    lib::error_code ec;
    BOOST_CHECK_EQUAL( r.read(buf,sizeof(buf),ec), 2 );
    BOOST_CHECK_EQUAL( ec, error::invalid_utf8 );
}

BOOST_AUTO_TEST_CASE( utf8_check_ignores_binary_and_disabled ) {
    std::string bad = "\xFF\xFE";
    std::string wire = build_frame(true,frame::opcode::binary,bad)
        + build_frame(true,frame::opcode::text,bad);

    transport::buffer::source s(wire);
    reader_type r(s,role::client);
    r.set_check_utf8(true);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );
    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK( out == bad );

    r.set_check_utf8(false);
    BOOST_REQUIRE( !r.next_frame(h) );
    out.clear();
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK( out == bad );
}

BOOST_AUTO_TEST_CASE( discard_fragmented_message ) {
    std::string first = build_frame(false,frame::opcode::text,"aaa")
        + build_frame(true,frame::opcode::ping,"p")
        + build_frame(false,frame::opcode::continuation,"bbb")
        + build_frame(true,frame::opcode::continuation,"ccc");
    std::string wire = first + build_frame(true,frame::opcode::binary,"next");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );

    uint8_t buf[1];
    lib::error_code ec;
    BOOST_CHECK_EQUAL( r.read(buf,1,ec), 1 );

    BOOST_CHECK( !r.discard() );
    BOOST_CHECK_EQUAL( s.position(), first.size() );
    BOOST_CHECK( !r.is_fragmented() );
    BOOST_CHECK( !r.is_open() );

    BOOST_REQUIRE( !r.next_frame(h) );
    BOOST_CHECK_EQUAL( h.op, frame::opcode::binary );
    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK_EQUAL( out, "next" );
}

BOOST_AUTO_TEST_CASE( discard_without_message ) {
    std::string wire = build_frame(true,frame::opcode::text,"hi");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    BOOST_CHECK( !r.discard() );
    BOOST_CHECK_EQUAL( s.position(), 0 );
}

BOOST_AUTO_TEST_CASE( discard_truncated_frame ) {
    std::string wire = build_frame(false,frame::opcode::binary,"0123456789");
    wire.resize(wire.size()-3);
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );
    BOOST_CHECK( r.is_fragmented() );

    BOOST_CHECK_EQUAL( r.discard(), error::unexpected_eof );
    BOOST_CHECK( !r.is_fragmented() );
    BOOST_CHECK( !r.is_open() );
}

BOOST_AUTO_TEST_CASE( discard_truncated_fragmented_message ) {
    std::string wire = build_frame(false,frame::opcode::binary,"0123");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );
    BOOST_CHECK_EQUAL( r.discard(), error::unexpected_eof );
    BOOST_CHECK( !r.is_fragmented() );
}

BOOST_AUTO_TEST_CASE( continuation_handler ) {
    std::string wire = build_frame(false,frame::opcode::binary,"a")
        + build_frame(false,frame::opcode::continuation,"b")
        + build_frame(true,frame::opcode::continuation,"c");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);

    frame_recorder continuation;
    r.set_continuation_handler(lib::bind(&frame_recorder::on_frame,
        &continuation,lib::placeholders::_1,lib::placeholders::_2));

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );
    BOOST_CHECK_EQUAL( continuation.calls, 0 );

    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK_EQUAL( continuation.calls, 2 );
    BOOST_CHECK_EQUAL( continuation.ops[0], frame::opcode::continuation );

    // the handler drained both continuation frames
    BOOST_CHECK_EQUAL( continuation.payload, "bc" );
    BOOST_CHECK_EQUAL( out, "a" );
}

BOOST_AUTO_TEST_CASE( handler_errors_abort_next_frame ) {
    lib::error_code reject = make_error_code(error::general);

    {
        std::string wire = build_frame(false,frame::opcode::binary,"a")
            + build_frame(true,frame::opcode::continuation,"b");
        transport::buffer::source s(wire);
        reader_type r(s,role::client);

        frame_recorder continuation;
        continuation.result = reject;
        r.set_continuation_handler(lib::bind(&frame_recorder::on_frame,
            &continuation,lib::placeholders::_1,lib::placeholders::_2));

        frame::header h;
        BOOST_REQUIRE( !r.next_frame(h) );

        std::string out;
        BOOST_CHECK_EQUAL( read_message(r,out), reject );
    }

    {
        std::string wire = build_frame(false,frame::opcode::binary,"a")
            + build_frame(true,frame::opcode::ping,"b")
            + build_frame(true,frame::opcode::continuation,"c");
        transport::buffer::source s(wire);
        reader_type r(s,role::client);

        frame_recorder intermediate;
        intermediate.result = reject;
        r.set_intermediate_handler(lib::bind(&frame_recorder::on_frame,
            &intermediate,lib::placeholders::_1,lib::placeholders::_2));

        frame::header h;
        BOOST_REQUIRE( !r.next_frame(h) );

        std::string out;
        BOOST_CHECK_EQUAL( read_message(r,out), reject );
        BOOST_CHECK( r.is_fragmented() );
    }
}

BOOST_AUTO_TEST_CASE( header_check ) {
    std::string wire = build_frame(true,frame::opcode::binary,"abc",true,
        key_a);

    transport::buffer::source s(wire);
    reader_type r(s,role::client);
    BOOST_CHECK( r.get_header_check() );

    frame::header h;
    BOOST_CHECK_EQUAL( r.next_frame(h), processor::error::masking_forbidden );

    transport::buffer::source s2(wire);
    reader_type r2(s2,role::client);
    r2.set_header_check(false);

    BOOST_REQUIRE( !r2.next_frame(h) );
    std::string out;
    BOOST_CHECK_EQUAL( read_message(r2,out), error::eof );
    BOOST_CHECK_EQUAL( out, "abc" );
}

BOOST_AUTO_TEST_CASE( protocol_violations ) {
    frame::header h;

    {
        std::string wire = build_frame(true,frame::opcode::continuation,"x");
        transport::buffer::source s(wire);
        reader_type r(s,role::client);
        BOOST_CHECK_EQUAL( r.next_frame(h),
            processor::error::invalid_continuation );
    }
    {
        std::string wire = build_frame(false,frame::opcode::text,"x")
            + build_frame(true,frame::opcode::text,"y");
        transport::buffer::source s(wire);
        reader_type r(s,role::client);
        BOOST_REQUIRE( !r.next_frame(h) );

        std::string out;
        BOOST_CHECK_EQUAL( read_message(r,out),
            processor::error::invalid_continuation );
        BOOST_CHECK( r.is_fragmented() );
    }
    {
        std::string wire = build_frame(true,frame::opcode::binary,"x");
        transport::buffer::source s(wire);
        reader_type r(s,role::server);
        BOOST_CHECK_EQUAL( r.next_frame(h),
            processor::error::masking_required );
    }
    {
        std::string wire = build_frame(true,frame::opcode::binary,"x",false,
            NULL,frame::RSV2);
        transport::buffer::source s(wire);
        reader_type r(s,role::client);
        BOOST_CHECK_EQUAL( r.next_frame(h), processor::error::invalid_rsv_bit );
    }
}

BOOST_AUTO_TEST_CASE( extensions_run_in_order ) {
    std::string wire = build_frame(true,frame::opcode::binary,"x",false,NULL,
        frame::RSV1 | frame::RSV3);

    {
        transport::buffer::source s(wire);
        reader_type r(s,role::client);
        lib::shared_ptr<counting_extension> clear(new counting_extension());
        r.add_extension(clear);
        BOOST_CHECK_EQUAL( r.get_extensions().size(), 1 );

        frame::header h;
        BOOST_REQUIRE( !r.next_frame(h) );
        BOOST_CHECK_EQUAL( h.rsv, 0 );
        BOOST_CHECK_EQUAL( clear->calls, 1 );
    }

    {
        transport::buffer::source s(wire);
        reader_type r(s,role::client);
        lib::error_code reject = make_error_code(error::general);
        lib::shared_ptr<counting_extension> first(
            new counting_extension(reject));
        lib::shared_ptr<counting_extension> second(new counting_extension());
        r.add_extension(first);
        r.add_extension(second);

        frame::header h;
        BOOST_CHECK_EQUAL( r.next_frame(h), reject );
        BOOST_CHECK_EQUAL( first->calls, 1 );
        BOOST_CHECK_EQUAL( second->calls, 0 );
        BOOST_CHECK( !r.is_open() );

        BOOST_CHECK( !r.discard() );
        BOOST_CHECK_EQUAL( s.position(), wire.size() );
    }
}

namespace {

lib::error_code reject_reserved_bits(frame::header & h) {
    if (h.rsv != 0) {
        return make_error_code(error::general);
    }
    return lib::error_code();
}

lib::error_code refuse_frame(frame::header const &,
    reader_type::payload_type &)
{
    return make_error_code(error::general);
}

} // namespace

BOOST_AUTO_TEST_CASE( extension_rejected_frame_is_discarded ) {
    // the rejected payload looks like two frame headers of its own
    std::string bogus("\x82\x03XYZ\x82\x01Q",8);
    std::string first = build_frame(true,frame::opcode::binary,bogus,false,
        NULL,frame::RSV1);
    std::string wire = first + build_frame(true,frame::opcode::text,"hello");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);
    r.add_extension(extensions::extension_ptr(
        new extensions::function_extension(&reject_reserved_bits)));

    frame::header h;
    BOOST_CHECK_EQUAL( r.next_frame(h), error::general );
    BOOST_CHECK_EQUAL( s.position(), 2 );

    BOOST_CHECK( !r.discard() );
    BOOST_CHECK_EQUAL( s.position(), first.size() );

    BOOST_REQUIRE( !r.next_frame(h) );
    BOOST_CHECK_EQUAL( h.op, frame::opcode::text );
    BOOST_CHECK_EQUAL( h.length, 5 );

    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK_EQUAL( out, "hello" );
}

BOOST_AUTO_TEST_CASE( extension_rejected_intermediate_frame_is_discarded ) {
    std::string wire = build_frame(false,frame::opcode::binary,"ab")
        + build_frame(true,frame::opcode::ping,"\x81\x01Z",false,NULL,
            frame::RSV1)
        + build_frame(true,frame::opcode::continuation,"cd")
        + build_frame(true,frame::opcode::text,"next");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);
    r.add_extension(extensions::extension_ptr(
        new extensions::function_extension(&reject_reserved_bits)));

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );

    uint8_t buf[16];
    lib::error_code ec;
    BOOST_CHECK_EQUAL( r.read(buf,sizeof(buf),ec), 2 );
    BOOST_CHECK( !ec );
    r.read(buf,sizeof(buf),ec);
    BOOST_CHECK_EQUAL( ec, error::general );

    // skips the rest of the ping and the final fragment
    BOOST_CHECK( !r.discard() );
    BOOST_CHECK( !r.is_fragmented() );

    BOOST_REQUIRE( !r.next_frame(h) );
    BOOST_CHECK_EQUAL( h.op, frame::opcode::text );

    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK_EQUAL( out, "next" );
    BOOST_CHECK_EQUAL( s.position(), wire.size() );
}

BOOST_AUTO_TEST_CASE( intermediate_handler_error_then_discard ) {
    std::string wire = build_frame(false,frame::opcode::binary,"a")
        + build_frame(true,frame::opcode::ping,"\x82\x01Q")
        + build_frame(true,frame::opcode::continuation,"b")
        + build_frame(true,frame::opcode::binary,"after");
    transport::buffer::source s(wire);
    reader_type r(s,role::client);
    r.set_intermediate_handler(&refuse_frame);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );

    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out), error::general );
    BOOST_CHECK_EQUAL( out, "a" );

    BOOST_CHECK( !r.discard() );

    BOOST_REQUIRE( !r.next_frame(h) );
    BOOST_CHECK_EQUAL( h.op, frame::opcode::binary );
    out.clear();
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK_EQUAL( out, "after" );
}

namespace {

lib::error_code clear_rsv3(frame::header & h) {
    h.rsv &= static_cast<uint8_t>(~frame::RSV3);
    return lib::error_code();
}

} // namespace

BOOST_AUTO_TEST_CASE( function_extension ) {
    std::string wire = build_frame(true,frame::opcode::binary,"x",false,NULL,
        frame::RSV3);
    transport::buffer::source s(wire);
    reader_type r(s,role::client);
    r.add_extension(extensions::extension_ptr(
        new extensions::function_extension(&clear_rsv3)));

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );
    BOOST_CHECK_EQUAL( h.rsv, 0 );
}

BOOST_AUTO_TEST_CASE( next_reader_one_shot ) {
    std::string wire = build_frame(false,frame::opcode::text,"one ")
        + build_frame(true,frame::opcode::continuation,"shot");
    transport::buffer::source s(wire);

    frame::header h;
    reader_type::ptr r;
    BOOST_REQUIRE( !next_reader<stub_config>(s,role::client,h,r) );
    BOOST_REQUIRE( r );
    BOOST_CHECK_EQUAL( h.op, frame::opcode::text );
    BOOST_CHECK( !h.fin );

    std::string out;
    BOOST_CHECK_EQUAL( read_message(*r,out), error::eof );
    BOOST_CHECK_EQUAL( out, "one shot" );
}

BOOST_AUTO_TEST_CASE( next_reader_failure ) {
    transport::buffer::source s;

    frame::header h;
    reader_type::ptr r;
    BOOST_CHECK_EQUAL( next_reader<stub_config>(s,role::server,h,r),
        transport::error::eof );
    BOOST_CHECK( !r );
}

BOOST_AUTO_TEST_CASE( defaults_come_from_config ) {
    transport::buffer::source s;
    reader_type::ptr r = reader_type::client_side(s);

    BOOST_CHECK_EQUAL( r->get_role(), role::client );
    BOOST_CHECK( r->get_header_check() );
    BOOST_CHECK( !r->get_check_utf8() );
    BOOST_CHECK_EQUAL( r->get_max_frame_size(), 0 );
    BOOST_CHECK( !r->is_fragmented() );
    BOOST_CHECK( !r->is_open() );
}

BOOST_AUTO_TEST_CASE( access_log_records_frames ) {
    std::string wire = build_frame(false,frame::opcode::text,"a")
        + build_frame(true,frame::opcode::ping,"")
        + build_frame(true,frame::opcode::continuation,"b")
        + build_frame(true,frame::opcode::ping,"x",false,NULL,frame::RSV1);
    transport::buffer::source s(wire);

    std::stringstream alog;
    std::stringstream elog;
    reader<verbose_config> r(s,role::client);
    r.get_alog().set_ostream(&alog);
    r.get_elog().set_ostream(&elog);

    frame::header h;
    BOOST_REQUIRE( !r.next_frame(h) );
    std::string out;
    BOOST_CHECK_EQUAL( read_message(r,out), error::eof );
    BOOST_CHECK_EQUAL( r.next_frame(h), processor::error::invalid_rsv_bit );

    BOOST_CHECK( alog.str().find("[frame_header] Header: fin: 0") !=
        std::string::npos );
    BOOST_CHECK( alog.str().find("[control]") != std::string::npos );
    BOOST_CHECK( alog.str().find("[message_header] Message end") !=
        std::string::npos );
    BOOST_CHECK( elog.str().find("[error] check_header error") !=
        std::string::npos );
}
