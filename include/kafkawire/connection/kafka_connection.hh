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

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>

#include <kafkawire/codec/request_correlator.hh>
#include <kafkawire/codec/response_decoder.hh>
#include <kafkawire/codec/stream_response_decoder.hh>
#include <kafkawire/connection/connection_properties.hh>
#include <kafkawire/connection/response_splitter.hh>
#include <kafkawire/connection/transport.hh>
#include <kafkawire/protocol/request.hh>
#include <kafkawire/protocol/response.hh>

using namespace seastar;

namespace kafkawire {

// The connection failed earlier and can no longer be used.
struct connection_broken_exception : public std::runtime_error {
public:
    explicit connection_broken_exception(const std::string& message) : runtime_error(message) {}
};

// The broker answered an API this client cannot decode.
struct unsupported_response_exception : public std::runtime_error {
public:
    explicit unsupported_response_exception(const std::string& message) : runtime_error(message) {}
};

// Client end of a broker connection. Requests are pipelined, every call
// completes with the response to its own request.
class kafka_connection final {

    class pending_response {
    public:
        promise<response> _promise;
        bool _delivered = false;

        void set_value(response resp) {
            _delivered = true;
            _promise.set_value(std::move(resp));
        }

        void set_exception(std::exception_ptr ex) {
            _delivered = true;
            _promise.set_exception(std::move(ex));
        }
    };

    std::unique_ptr<wire_transport> _transport;
    connection_properties _properties;
    request_correlator _correlator;
    response_decoder _decoder;
    stream_response_decoder _stream_decoder;
    response_splitter _splitter;
    int32_t _correlation_id;
    semaphore _send_semaphore;
    semaphore _receive_semaphore;
    gate _pending;
    std::exception_ptr _broken;
    bool _closing;

    void mark_broken(std::exception_ptr ex);

    void deliver(decode_result result, int32_t correlation_id, pending_response& pending);

    future<> receive_response(int32_t correlation_id, lw_shared_ptr<pending_response> pending);

    future<> receive_buffered(int32_t correlation_id, lw_shared_ptr<pending_response> pending);

    future<> receive_streamed(int32_t correlation_id, lw_shared_ptr<pending_response> pending);

public:
    static future<std::unique_ptr<kafka_connection>> connect(const seastar::sstring& host, uint16_t port,
            connection_properties properties);

    kafka_connection(std::unique_ptr<wire_transport> transport, connection_properties properties);

    kafka_connection(kafka_connection&& other) = delete;
    kafka_connection(kafka_connection& other) = delete;

    // Id used after correlation_id, wraps around to INT32_MIN after INT32_MAX.
    static int32_t following_correlation_id(int32_t correlation_id) noexcept {
        return static_cast<int32_t>(static_cast<uint32_t>(correlation_id) + 1);
    }

    int32_t next_correlation_id() noexcept {
        auto id = _correlation_id;
        _correlation_id = following_correlation_id(id);
        return id;
    }

    [[nodiscard]] bool is_broken() const noexcept {
        return bool(_broken);
    }

    // Sends the request as is, including its correlation id and client id.
    future<response> send(request req);

    // Wraps the body into a request with the next correlation id and the
    // configured client id.
    template<typename RequestType>
    future<response> send(RequestType body) {
        request req;
        req._correlation_id = next_correlation_id();
        req._client_id = _properties.client_id;
        req._body = std::move(body);
        return send(std::move(req));
    }

    future<> close();
};

}
