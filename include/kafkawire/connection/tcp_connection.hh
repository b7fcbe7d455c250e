/*
 * This file is open source software, licensed to you under the terms
 * of the Apache License, Version 2.0 (the "License").  See the NOTICE file
 * distributed with this work for additional information regarding copyright
 * ownership.  You may not use this file except in compliance with the License.
 *
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

/*
 * Copyright (C) 2019 ScyllaDB Ltd.
 */

#pragma once

#include <memory>
#include <stdexcept>

#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>
#include <seastar/net/api.hh>
#include <seastar/net/inet_address.hh>

#include <kafkawire/connection/transport.hh>

using namespace seastar;

namespace kafkawire {

struct tcp_connection_exception final : public std::runtime_error {
    explicit tcp_connection_exception(const seastar::sstring& message) : runtime_error(message) {}
};

class tcp_connection final : public wire_transport {

    connected_socket _fd;
    // 0 disables the timeout.
    uint32_t _timeout_ms;
    input_stream<char> _read_buf;
    output_stream<char> _write_buf;

public:
    static future<std::unique_ptr<tcp_connection>> connect(const seastar::sstring& host, uint16_t port,
            uint32_t timeout_ms);

    tcp_connection(connected_socket&& fd, uint32_t timeout_ms) noexcept
            : _fd(std::move(fd))
            , _timeout_ms(timeout_ms)
            , _read_buf(_fd.input())
            , _write_buf(_fd.output()) {};

    tcp_connection(tcp_connection&& other) = delete;
    tcp_connection(tcp_connection& other) = delete;

    future<> write(temporary_buffer<char> buff) override;
    future<temporary_buffer<char>> read(size_t bytes_to_read) override;
    void shutdown() override;
    future<> close() override;

};

}
