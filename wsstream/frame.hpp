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

#ifndef WSSTREAM_FRAME_HPP
#define WSSTREAM_FRAME_HPP

#include <algorithm>
#include <cstring>
#include <sstream>
#include <string>

#include <wsstream/common/stdint.hpp>
#include <wsstream/common/system_error.hpp>

#include <wsstream/error.hpp>
#include <wsstream/transport/base/source.hpp>

namespace wsstream {
/// Data structures and utility functions for reading WebSocket frames
namespace frame {

/// Minimum length of a WebSocket frame header.
static unsigned int const BASIC_HEADER_LENGTH = 2;
/// Maximum length of a WebSocket header
static unsigned int const MAX_HEADER_LENGTH = 14;
/// Maximum length of the variable portion of the WebSocket header
static unsigned int const MAX_EXTENDED_HEADER_LENGTH = 12;

/// Constants and utility functions related to WebSocket opcodes
/**
 * WebSocket Opcodes are 4 bits. See RFC6455 section 5.2.
 */
namespace opcode {
    enum value {
        continuation = 0x0,
        text = 0x1,
        binary = 0x2,
        rsv3 = 0x3,
        rsv4 = 0x4,
        rsv5 = 0x5,
        rsv6 = 0x6,
        rsv7 = 0x7,
        close = 0x8,
        ping = 0x9,
        pong = 0xA,
        control_rsvb = 0xB,
        control_rsvc = 0xC,
        control_rsvd = 0xD,
        control_rsve = 0xE,
        control_rsvf = 0xF
    };

    /// Check if an opcode is reserved
    /**
     * @param v The opcode to test.
     * @return Whether or not the opcode is reserved.
     */
    inline bool reserved(value v) {
        return (v >= rsv3 && v <= rsv7) ||
               (v >= control_rsvb && v <= control_rsvf);
    }

    /// Check if an opcode is invalid
    /**
     * Invalid opcodes are negative or require greater than 4 bits to store.
     *
     * @param v The opcode to test.
     * @return Whether or not the opcode is invalid.
     */
    inline bool invalid(value v) {
        return (v > 0xF || v < 0);
    }

    /// Check if an opcode is for a control frame
    /**
     * @param v The opcode to test.
     * @return Whether or not the opcode is a control opcode.
     */
    inline bool is_control(value v) {
        return v >= 0x8;
    }

    /// Get the textual name of an opcode
    inline char const * name(value v) {
        switch (v) {
            case continuation:
                return "continuation";
            case text:
                return "text";
            case binary:
                return "binary";
            case close:
                return "close";
            case ping:
                return "ping";
            case pong:
                return "pong";
            default:
                return "reserved";
        }
    }
} // namespace opcode

/// Constants related to frame and payload limits
namespace limits {
    /// Maximum size of a basic WebSocket payload
    static uint8_t const payload_size_basic = 125;

    /// Maximum size of an extended WebSocket payload (basic payload = 126)
    static uint16_t const payload_size_extended = 0xFFFF; // 2^16, 65535

    /// Maximum size of a jumbo WebSocket payload (basic payload = 127)
    static uint64_t const payload_size_jumbo = 0x7FFFFFFFFFFFFFFFLL;//2^63
} // namespace limits

// masks for fields in the basic header
static uint8_t const BHB0_OPCODE = 0x0F;
static uint8_t const BHB0_RSV = 0x70;
static uint8_t const BHB0_FIN = 0x80;

static uint8_t const BHB1_PAYLOAD = 0x7F;
static uint8_t const BHB1_MASK = 0x80;

static uint8_t const payload_size_code_16bit = 0x7E; // 126
static uint8_t const payload_size_code_64bit = 0x7F; // 127

// bits of the rsv field once shifted down out of byte 0
static uint8_t const RSV1 = 0x4;
static uint8_t const RSV2 = 0x2;
static uint8_t const RSV3 = 0x1;

/// Four byte masking key as it appears on the wire
union masking_key_type {
    int32_t i;
    uint8_t c[4];
};

/// Decoded WebSocket frame header
/**
 * Produced by read_header and consumed by the reader within the same
 * next_frame call. Extensions may clear bits of rsv.
 */
struct header {
    header()
      : fin(false)
      , rsv(0)
      , op(opcode::continuation)
      , masked(false)
      , length(0)
    {
        mask.i = 0;
    }

    bool                fin;
    uint8_t             rsv;
    opcode::value       op;
    bool                masked;
    masking_key_type    mask;
    uint64_t            length;
};

/// Check whether the frame's opcode is a control opcode
inline bool is_control(header const & h) {
    return opcode::is_control(h.op);
}

inline bool get_rsv1(header const & h) {
    return ((h.rsv & RSV1) == RSV1);
}

inline bool get_rsv2(header const & h) {
    return ((h.rsv & RSV2) == RSV2);
}

inline bool get_rsv3(header const & h) {
    return ((h.rsv & RSV3) == RSV3);
}

/// Generate a one line description of a header, for logs
inline std::string print_header(header const & h) {
    std::stringstream f;

    f << "fin: " << h.fin
      << " rsv: " << ((h.rsv & RSV1) ? 1 : 0)
                  << ((h.rsv & RSV2) ? 1 : 0)
                  << ((h.rsv & RSV3) ? 1 : 0)
      << " opcode: " << opcode::name(h.op) << " (" << int(h.op) << ")"
      << " masked: " << h.masked
      << " payload length: " << h.length;

    return f.str();
}

/// Decode a big endian integer of N bytes
inline uint64_t decode_be(uint8_t const * p, size_t n) {
    uint64_t v = 0;
    for (size_t i = 0; i < n; i++) {
        v = (v << 8) | p[i];
    }
    return v;
}

/// Read one frame header from a byte source
/**
 * Reads exactly the bytes that belong to the header, in at most two hops:
 * the two basic header bytes first and then all of the length and masking
 * key bytes the basic header announced. Length bytes always precede masking
 * key bytes. Lengths that are not minimally encoded are accepted.
 *
 * If the source ends before the first byte the source's error is returned
 * unchanged (transport::error::eof for a clean end). If it ends after the
 * header has started, error::unexpected_eof is returned. This includes a
 * source that ends exactly after the two basic bytes of a header that
 * announces extended length or masking key bytes. Readers built on a plain
 * "read exactly n bytes" primitive report a clean end in that position;
 * here a header cut off at any byte counts as truncated.
 *
 * @param s The source to read from
 * @param scratch Working memory of at least MAX_EXTENDED_HEADER_LENGTH bytes.
 * Its contents are overwritten.
 * @param h The header to fill in
 * @return A status code, zero on success
 */
template <typename source_type>
lib::error_code read_header(source_type & s, uint8_t * scratch, header & h) {
    lib::error_code ec;

    size_t n = transport::read_full(s,scratch,BASIC_HEADER_LENGTH,ec);
    if (ec) {
        if (ec == transport::error::eof && n > 0) {
            return make_error_code(error::unexpected_eof);
        }
        return ec;
    }

    h.fin = (scratch[0] & BHB0_FIN) == BHB0_FIN;
    h.rsv = static_cast<uint8_t>((scratch[0] & BHB0_RSV) >> 4);
    h.op = opcode::value(scratch[0] & BHB0_OPCODE);
    h.masked = (scratch[1] & BHB1_MASK) == BHB1_MASK;
    h.length = 0;
    h.mask.i = 0;

    uint8_t basic_size = scratch[1] & BHB1_PAYLOAD;
    size_t extra = 0;

    if (h.masked) {
        extra += 4;
    }

    if (basic_size <= limits::payload_size_basic) {
        h.length = basic_size;
    } else if (basic_size == payload_size_code_16bit) {
        extra += 2;
    } else if (basic_size == payload_size_code_64bit) {
        extra += 8;
    } else {
        return make_error_code(error::header_length_unexpected);
    }

    if (extra == 0) {
        return lib::error_code();
    }

    // The basic header bytes are no longer needed, the extended bytes reuse
    // the front of the scratch buffer.
    transport::read_full(s,scratch,extra,ec);
    if (ec) {
        if (ec == transport::error::eof) {
            return make_error_code(error::unexpected_eof);
        }
        return ec;
    }

    uint8_t const * p = scratch;
    if (basic_size == payload_size_code_16bit) {
        h.length = decode_be(p,2);
        p += 2;
    } else if (basic_size == payload_size_code_64bit) {
        if (p[0] & 0x80) {
            return make_error_code(error::header_length_msb);
        }
        h.length = decode_be(p,8);
        p += 8;
    }

    if (h.masked) {
        std::copy(p,p+4,h.mask.c);
    }

    return lib::error_code();
}

// ----------------------------------------------------------------------------
// Masking
// ----------------------------------------------------------------------------

/// Test whether the host stores the least significant byte first
inline bool is_little_endian() {
    uint16_t const probe = 1;
    uint8_t first;
    std::memcpy(&first,&probe,1);
    return first == 1;
}

/// Extract a masking key into a value the size of a machine word.
/**
 * Machine word size must be 4 or 8. The bytes of the result, in memory order,
 * repeat the key bytes in wire order.
 *
 * @param key Masking key to extract from
 * @return prepared key as a machine word
 */
inline size_t prepare_masking_key(masking_key_type const & key) {
    size_t prepared_key = 0;
    for (size_t i = 0; i < sizeof(size_t); i += 4) {
        std::memcpy(reinterpret_cast<uint8_t *>(&prepared_key)+i,key.c,4);
    }
    return prepared_key;
}

/// circularly shifts the supplied prepared masking key by offset bytes
/**
 * Prepared_key must be the output of prepare_masking_key with the associated
 * restrictions on the machine word size. offset must be greater than or equal
 * to zero and less than sizeof(size_t).
 */
inline size_t circshift_prepared_key(size_t prepared_key, size_t offset) {
    if (offset == 0) {
        return prepared_key;
    }
    if (is_little_endian()) {
        size_t temp = prepared_key << (sizeof(size_t)-offset)*8;
        return (prepared_key >> offset*8) | temp;
    } else {
        size_t temp = prepared_key >> (sizeof(size_t)-offset)*8;
        return (prepared_key << offset*8) | temp;
    }
}

/// Byte by byte mask/unmask
/**
 * Iterator based byte by byte masking and unmasking for WebSocket payloads.
 * Performs masking in place using the supplied key offset by the supplied
 * offset number of bytes.
 *
 * This function is simple and can be done in place on input with arbitrary
 * lengths and does not vary based on machine word size. It is slow.
 *
 * @param b Beginning iterator to start masking
 * @param e Ending iterator to end masking
 * @param o Beginning iterator to store masked results
 * @param key 32 bit key to mask with.
 * @param key_offset offset value to start masking at.
 */
template <typename input_iter, typename output_iter>
void byte_mask(input_iter first, input_iter last, output_iter result,
    masking_key_type const & key, size_t key_offset = 0)
{
    size_t key_index = key_offset%4;
    while (first != last) {
        *result = static_cast<uint8_t>(*first ^ key.c[key_index++]);
        key_index %= 4;
        ++result;
        ++first;
    }
}

/// Circular word aligned mask/unmask
/**
 * Performs a circular mask/unmask in word sized chunks using pre-prepared keys
 * that store state between calls. Best for providing streaming masking or
 * unmasking of small chunks at a time of a larger message. Buffers need not be
 * word aligned and length need not be a multiple of the word size.
 *
 * The returned value is the prepared key rotated so that the next call
 * continues the keystream where this call left it.
 *
 * @param input Input buffer
 * @param output Output buffer, may be the same as input
 * @param length Length of data buffer
 * @param prepared_key Prepared key to use.
 * @return the prepared_key shifted to account for the input length
 */
inline size_t word_mask_circ(uint8_t const * input, uint8_t * output,
    size_t length, size_t prepared_key)
{
    size_t n = length / sizeof(size_t); // whole words
    size_t l = length - (n * sizeof(size_t)); // remaining bytes

    // mask word by word; memcpy keeps unaligned buffers well defined
    for (size_t i = 0; i < n; i++) {
        size_t word;
        std::memcpy(&word,input+i*sizeof(size_t),sizeof(size_t));
        word ^= prepared_key;
        std::memcpy(output+i*sizeof(size_t),&word,sizeof(size_t));
    }

    // mask partial word at the end
    size_t start = length - l;
    uint8_t byte_key[sizeof(size_t)];
    std::memcpy(byte_key,&prepared_key,sizeof(size_t));
    for (size_t i = 0; i < l; ++i) {
        output[start+i] = input[start+i] ^ byte_key[i];
    }

    return circshift_prepared_key(prepared_key,l);
}

/// Circular word aligned mask/unmask (in place)
inline size_t word_mask_circ(uint8_t * data, size_t length,
    size_t prepared_key)
{
    return word_mask_circ(data,data,length,prepared_key);
}

} // namespace frame
} // namespace wsstream

#endif // WSSTREAM_FRAME_HPP
