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

#ifndef WSSTREAM_PROCESSOR_HYBI13_HPP
#define WSSTREAM_PROCESSOR_HYBI13_HPP

#include <wsstream/processors/base.hpp>

#include <wsstream/common/system_error.hpp>
#include <wsstream/frame.hpp>
#include <wsstream/role.hpp>

namespace wsstream {
namespace processor {

/// Validate an incoming frame header against RFC6455
/**
 * Checks the rules that can be decided from a single header plus the
 * connection's fragmentation state. Rules are applied in a fixed order and
 * the first violation is returned.
 *
 * @param h The header to validate
 * @param r The role of the reading endpoint
 * @param fragmented Whether a fragmented message is in progress
 * @param extended Whether extensions that may claim reserved bits are active
 * @return A status code, zero on success
 */
inline lib::error_code check_header(frame::header const & h, role::value r,
    bool fragmented, bool extended)
{
    bool control = frame::is_control(h);

    if (frame::opcode::reserved(h.op)) {
        return make_error_code(error::invalid_opcode);
    }

    if (frame::opcode::invalid(h.op)) {
        return make_error_code(error::invalid_opcode);
    }

    if (control) {
        if (h.length > frame::limits::payload_size_basic) {
            return make_error_code(error::control_too_big);
        }
        if (!h.fin) {
            return make_error_code(error::fragmented_control);
        }
    }

    // reserved bits are only legal if an extension is around to claim them
    if (h.rsv != 0 && !extended) {
        return make_error_code(error::invalid_rsv_bit);
    }

    if (r == role::server && !h.masked) {
        return make_error_code(error::masking_required);
    }

    if (r == role::client && h.masked) {
        return make_error_code(error::masking_forbidden);
    }

    if (fragmented && !control && h.op != frame::opcode::continuation) {
        // a new data message started before the last one finished
        return make_error_code(error::invalid_continuation);
    }

    if (!fragmented && h.op == frame::opcode::continuation) {
        return make_error_code(error::invalid_continuation);
    }

    return lib::error_code();
}

} // namespace processor
} // namespace wsstream

#endif // WSSTREAM_PROCESSOR_HYBI13_HPP
