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

#include <fmt/format.h>

#include <seastar/core/loop.hh>

#include <kafkawire/codec/request_codec.hh>
#include <kafkawire/codec/response_encoder.hh>
#include <kafkawire/connection/server_connection.hh>
#include <kafkawire/protocol/headers.hh>
#include <kafkawire/utils/logger.hh>

using namespace seastar;

namespace kafkawire {

namespace {

seastar::sstring describe_frame(const temporary_buffer<char>& frame) {
    kafka::input_stream is(frame.get(), frame.size());
    request_header header;
    header.deserialize(is, 0);
    return header.describe();
}

}

future<> server_connection::dispatch(temporary_buffer<char> frame) {
    std::optional<request> req;
    try {
        req = decode_request(frame);
        if (!req) {
            throw invalid_request_exception(fmt::format("Unsupported request, {}", describe_frame(frame)));
        }
    } catch (...) {
        return make_exception_future<>(std::current_exception());
    }

    auto key = req->key();
    auto correlation_id = req->_correlation_id;
    kwlog.trace("Handling {} request, correlation id {}", api_key_name(key), correlation_id);
    return _handler->handle(std::move(*req)).then([this, key, correlation_id] (response resp) {
        if (resp.is<nil_response>()) {
            kwlog.trace("No response to {} request, correlation id {}", api_key_name(key), correlation_id);
            return make_ready_future<>();
        }
        return write_frame(*_transport, encode_response(resp));
    });
}

future<> server_connection::process() {
    kwlog.debug("Serving connection");
    return repeat([this] {
        return read_frame(*_transport, _max_frame_size).then([this] (std::optional<temporary_buffer<char>> frame) {
            if (!frame) {
                kwlog.debug("Client closed the connection");
                return make_ready_future<stop_iteration>(stop_iteration::yes);
            }
            return dispatch(std::move(*frame)).then_wrapped([] (future<> f) {
                try {
                    f.get();
                } catch (const invalid_request_exception& e) {
                    kwlog.warn("Dropping request: {}", e.what());
                }
                return stop_iteration::no;
            });
        });
    }).handle_exception([] (std::exception_ptr ex) {
        kwlog.error("Closing connection: {}", ex);
    }).finally([this] {
        return _handler->close().finally([this] {
            return _transport->close();
        });
    });
}

void server_connection::shutdown() {
    _transport->shutdown();
}

}
