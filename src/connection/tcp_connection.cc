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

#include <seastar/core/reactor.hh>
#include <seastar/core/when_all.hh>
#include <seastar/core/with_timeout.hh>

#include <kafkawire/connection/tcp_connection.hh>
#include <kafkawire/utils/logger.hh>

using namespace seastar;

namespace kafkawire {

static auto timeout_end(uint32_t timeout_ms) {
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
}

template<typename... T>
static future<T...> maybe_with_timeout(uint32_t timeout_ms, future<T...> f) {
    if (timeout_ms == 0) {
        return f;
    }
    return seastar::with_timeout(timeout_end(timeout_ms), std::move(f));
}

future<std::unique_ptr<tcp_connection>> tcp_connection::connect(const seastar::sstring& host, uint16_t port,
        uint32_t timeout_ms) {
    net::inet_address target_host = net::inet_address{host};
    sa_family_t family = target_host.is_ipv4() ? sa_family_t(AF_INET) : sa_family_t(AF_INET6);
    socket_address socket = socket_address(::sockaddr_in{family, INADDR_ANY, {0}});
    auto f = target_host.is_ipv4()
            ? engine().net().connect(ipv4_addr{target_host, port}, socket, seastar::transport::TCP)
            : engine().net().connect(ipv6_addr{target_host, port}, socket, seastar::transport::TCP);
    return maybe_with_timeout(timeout_ms, std::move(f)).then([host, port, timeout_ms] (connected_socket fd) {
        kwlog.debug("Connected to {}:{}", host, port);
        return std::make_unique<tcp_connection>(std::move(fd), timeout_ms);
    });
}

future<temporary_buffer<char>> tcp_connection::read(size_t bytes_to_read) {
    auto f = _read_buf.read_exactly(bytes_to_read)
        .then([this, bytes_to_read](temporary_buffer<char> data) {
            if (!data.empty() && data.size() != bytes_to_read) {
                shutdown();
                throw tcp_connection_exception("Connection ended prematurely");
            }
            return data;
        });
    return maybe_with_timeout(_timeout_ms, std::move(f));
}

future<> tcp_connection::write(temporary_buffer<char> buff) {
    auto f = _write_buf.write(std::move(buff)).then([this] {
        return _write_buf.flush();
    });
    return maybe_with_timeout(_timeout_ms, std::move(f));
}

void tcp_connection::shutdown() {
    _fd.shutdown_input();
    _fd.shutdown_output();
}

future<> tcp_connection::close() {
    return when_all_succeed(_read_buf.close(), _write_buf.close())
    .discard_result().handle_exception([](std::exception_ptr ep) {
        kwlog.debug("Error while closing connection: {}", ep);
    });
}

}
