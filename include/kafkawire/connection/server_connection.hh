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
#include <string>

#include <seastar/core/future.hh>
#include <seastar/core/temporary_buffer.hh>

#include <kafkawire/connection/request_handler.hh>
#include <kafkawire/connection/transport.hh>

using namespace seastar;

namespace kafkawire {

// The frame is not a request this server understands. Only that request
// is dropped.
struct invalid_request_exception : public std::runtime_error {
public:
    explicit invalid_request_exception(const std::string& message) : runtime_error(message) {}
};

// Server end of a client connection. Reads requests one by one, passes
// them to the handler and writes back whatever it answers.
class server_connection final {

    std::unique_ptr<wire_transport> _transport;
    std::unique_ptr<request_handler> _handler;
    int32_t _max_frame_size;

    future<> dispatch(temporary_buffer<char> frame);

public:
    server_connection(std::unique_ptr<wire_transport> transport, std::unique_ptr<request_handler> handler,
            int32_t max_frame_size) noexcept
        : _transport(std::move(transport))
        , _handler(std::move(handler))
        , _max_frame_size(max_frame_size) {}

    server_connection(server_connection&& other) = delete;
    server_connection(server_connection& other) = delete;

    // Serves requests until the client disconnects or the stream becomes
    // unreadable, then closes the handler and the transport. Never fails.
    future<> process();

    // Makes process() finish after the request in progress.
    void shutdown();
};

}
