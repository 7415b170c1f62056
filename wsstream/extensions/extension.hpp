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

#ifndef WSSTREAM_EXTENSION_HPP
#define WSSTREAM_EXTENSION_HPP

#include <wsstream/common/functional.hpp>
#include <wsstream/common/memory.hpp>
#include <wsstream/common/system_error.hpp>

#include <wsstream/frame.hpp>

namespace wsstream {

/**
 * Some generic information about extensions
 *
 * Each extension registered with a reader sees every frame header, in
 * registration order, after the header passed validation and before the
 * payload is exposed. An extension owns some of the reserved bits: it clears
 * the bits it understands so later stages never see them, and may reject the
 * frame by returning an error. The first error stops the chain.
 *
 * Registering any extension tells the validator that reserved bits may be in
 * use.
 */
namespace extensions {

/// Header rewrite hook
class extension {
public:
    virtual ~extension() {}

    /// Clear owned reserved bits or reject the frame
    /**
     * @param h The header of the frame being read. May be modified.
     * @return A status code, zero to let the frame through
     */
    virtual lib::error_code unset_bits(frame::header & h) = 0;
};

typedef lib::shared_ptr<extension> extension_ptr;

/// Adapts a plain function to the extension interface
class function_extension : public extension {
public:
    typedef lib::function<lib::error_code(frame::header &)> handler;

    explicit function_extension(handler h) : m_handler(h) {}

    lib::error_code unset_bits(frame::header & h) {
        if (!m_handler) {
            return lib::error_code();
        }
        return m_handler(h);
    }
private:
    handler m_handler;
};

} // namespace extensions
} // namespace wsstream

#endif // WSSTREAM_EXTENSION_HPP
