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

#include <seastar/core/loop.hh>
#include <seastar/core/when_all.hh>
#include <seastar/net/inet_address.hh>

#include <kafkawire/connection/kafka_server.hh>
#include <kafkawire/connection/tcp_connection.hh>
#include <kafkawire/utils/logger.hh>

using namespace seastar;

namespace kafkawire {

kafka_server::kafka_server(server_properties properties, handler_factory factory)
    : _properties(std::move(properties))
    , _handler_factory(std::move(factory))
    , _accept_loop(make_ready_future<>()) {}

future<> kafka_server::start() {
    listen_options options;
    options.reuse_address = true;
    _listener = seastar::listen(socket_address(net::inet_address(_properties.host), _properties.port), options);
    kwlog.info("Listening on {}:{}", _properties.host, _properties.port);
    _accept_loop = accept_loop();
    return make_ready_future<>();
}

future<> kafka_server::accept_loop() {
    return keep_doing([this] {
        return _listener->accept().then([this] (accept_result accepted) {
            if (_gate.is_closed()) {
                return;
            }
            kwlog.debug("Accepted connection from {}", accepted.remote_address);
            auto transport = std::make_unique<tcp_connection>(std::move(accepted.connection), _properties.io_timeout);
            auto connection = make_lw_shared<server_connection>(std::move(transport), _handler_factory(),
                    _properties.max_frame_size);
            auto it = _connections.insert(_connections.end(), connection);
            (void) with_gate(_gate, [this, connection, it] {
                return connection->process().finally([this, it] {
                    _connections.erase(it);
                });
            });
        });
    }).handle_exception([this] (std::exception_ptr ex) {
        if (_gate.is_closed()) {
            kwlog.debug("Stopped accepting connections");
        } else {
            kwlog.error("Accepting connections failed: {}", ex);
        }
    });
}

future<> kafka_server::stop() {
    auto f = _gate.close();
    if (_listener) {
        _listener->abort_accept();
    }
    for (auto& connection : _connections) {
        connection->shutdown();
    }
    return when_all_succeed(std::move(f), std::move(_accept_loop)).discard_result();
}

}
