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

#include <list>
#include <memory>
#include <optional>

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/net/api.hh>
#include <seastar/util/noncopyable_function.hh>

#include <kafkawire/connection/request_handler.hh>
#include <kafkawire/connection/server_connection.hh>
#include <kafkawire/connection/server_properties.hh>

using namespace seastar;

namespace kafkawire {

// Accepts client connections and serves each with its own handler.
class kafka_server final {
public:
    using handler_factory = noncopyable_function<std::unique_ptr<request_handler>()>;

private:
    server_properties _properties;
    handler_factory _handler_factory;
    std::optional<server_socket> _listener;
    std::list<lw_shared_ptr<server_connection>> _connections;
    gate _gate;
    future<> _accept_loop;

    future<> accept_loop();

public:
    kafka_server(server_properties properties, handler_factory factory);

    kafka_server(kafka_server&& other) = delete;
    kafka_server(kafka_server& other) = delete;

    future<> start();

    // Stops accepting, shuts down the open connections and waits for them.
    future<> stop();
};

}
