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

#include <wsstream/config/asio.hpp>
#include <wsstream/config/core.hpp>
#include <wsstream/config/debug.hpp>

#include <wsstream/extensions/permessage_deflate/receiver.hpp>
#include <wsstream/reader.hpp>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>
#include <string>

namespace po = boost::program_options;

// Print the header of a control frame that arrived between fragments and
// leave its payload to be skipped.
template <typename reader_type>
wsstream::lib::error_code on_intermediate(wsstream::frame::header const & h,
    typename reader_type::payload_type &)
{
    std::cout << "  [" << wsstream::frame::opcode::name(h.op) << " "
              << h.length << " bytes between fragments]" << std::endl;
    return wsstream::lib::error_code();
}

std::string printable(std::string const & payload, bool hex) {
    static char const digits[] = "0123456789abcdef";

    std::string out;
    for (size_t i = 0; i < payload.size(); i++) {
        unsigned char c = static_cast<unsigned char>(payload[i]);
        if (hex) {
            out += digits[c >> 4];
            out += digits[c & 0x0F];
            out += ' ';
        } else {
            out += (c >= 0x20 && c < 0x7F) ? static_cast<char>(c) : '.';
        }
    }
    return out;
}

template <typename config>
int dump(typename config::source_type & source, po::variables_map & vm) {
    typedef wsstream::reader<config> reader_type;
    typedef wsstream::extensions::permessage_deflate::receiver receiver_type;

    wsstream::role::value r = vm.count("server") ? wsstream::role::server
                                                 : wsstream::role::client;
    reader_type reader(source,r);

    reader.set_max_frame_size(vm["max-frame-size"].as<uint64_t>());
    if (vm.count("utf8")) {
        reader.set_check_utf8(true);
    }
    if (vm.count("no-header-check")) {
        reader.set_header_check(false);
    }

    wsstream::lib::shared_ptr<receiver_type> deflate;
    if (vm.count("deflate")) {
        deflate.reset(new receiver_type());
        reader.add_extension(deflate);
    }

    reader.set_intermediate_handler(&on_intermediate<reader_type>);

    bool show_payload = vm.count("payload") > 0;
    bool hex = vm.count("hex") > 0;
    size_t messages = 0;

    for (;;) {
        wsstream::frame::header h;
        wsstream::lib::error_code ec = reader.next_frame(h);
        if (ec == wsstream::transport::error::eof) {
            break;
        } else if (ec) {
            throw wsstream::exception("next_frame failed",ec);
        }

        std::string payload;
        uint8_t buf[4096];
        for (;;) {
            size_t n = reader.read(buf,sizeof(buf),ec);
            if (ec == wsstream::error::invalid_utf8) {
                std::cout << "message " << messages << ": invalid UTF-8 after "
                          << n << " bytes" << std::endl;
                ec = reader.discard();
                if (ec) {
                    throw wsstream::exception("discard failed",ec);
                }
                break;
            }
            payload.append(reinterpret_cast<char *>(buf),n);
            if (ec == wsstream::error::eof) {
                break;
            } else if (ec) {
                throw wsstream::exception("read failed",ec);
            }
        }

        if (ec == wsstream::error::eof) {
            std::cout << "message " << messages << ": "
                      << wsstream::frame::opcode::name(h.op) << " "
                      << payload.size() << " bytes"
                      << (deflate && deflate->is_compressed() ? " compressed" : "");
            if (show_payload) {
                std::cout << " " << printable(payload,hex);
            }
            std::cout << std::endl;
        }
        messages++;
    }

    std::cout << messages << " messages" << std::endl;
    return 0;
}

template <typename config>
int dump_stream(std::istream & in, po::variables_map & vm) {
    typename config::source_type source(in);
    return dump<config>(source,vm);
}

int dump_tcp(po::variables_map & vm) {
    boost::asio::io_service ios;
    boost::asio::ip::tcp::resolver resolver(ios);
    boost::asio::ip::tcp::resolver::query query(vm["host"].as<std::string>(),
        vm["port"].as<std::string>());

    boost::asio::ip::tcp::socket socket(ios);
    boost::asio::connect(socket,resolver.resolve(query));

    wsstream::config::asio::source_type source(socket);
    try {
        return dump<wsstream::config::asio>(source,vm);
    } catch (wsstream::exception const & e) {
        if (e.code() == wsstream::transport::error::pass_through) {
            std::cerr << "socket error: "
                      << source.get_transport_ec().message() << std::endl;
        }
        throw;
    }
}

int main(int argc, char * argv[]) {
    try {
        po::options_description options("Allowed options");
        options.add_options()
            ("help", "produce this help message")
            ("input,f", po::value<std::string>(), "File of raw frames to read, stdin if omitted")
            ("host", po::value<std::string>(), "Read raw frames from a TCP connection to this host")
            ("port", po::value<std::string>()->default_value("9002"), "Port to connect to with --host")
            ("server,s", "Read as the server end, client frames must be masked")
            ("utf8,u", "Validate text messages as UTF-8")
            ("deflate", "Accept the permessage-deflate compression bit")
            ("max-frame-size", po::value<uint64_t>()->default_value(0), "Reject frames larger than this, 0 for no limit")
            ("no-header-check", "Skip RFC6455 header validation")
            ("payload,p", "Print message payloads")
            ("hex", "Print payloads as hex")
            ("verbose,v", "Log every frame to stderr")
        ;

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, options), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << options << std::endl;
            return 1;
        }

        if (vm.count("host")) {
            return dump_tcp(vm);
        }

        std::ifstream file;
        std::istream * in = &std::cin;
        if (vm.count("input")) {
            file.open(vm["input"].as<std::string>().c_str(),
                std::ios::in | std::ios::binary);
            if (!file) {
                std::cerr << "could not open " << vm["input"].as<std::string>()
                          << std::endl;
                return 1;
            }
            in = &file;
        }

        if (vm.count("verbose")) {
            return dump_stream<wsstream::config::debug>(*in,vm);
        } else {
            return dump_stream<wsstream::config::core>(*in,vm);
        }
    } catch (wsstream::exception const & e) {
        std::cerr << e.what() << ": " << e.code().message() << std::endl;
        return 2;
    } catch (std::exception & e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
}
