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

#define SEASTAR_TESTING_MAIN
#include <seastar/testing/thread_test_case.hh>

#include <kafkawire/codec/request_codec.hh>
#include <kafkawire/codec/response_encoder.hh>
#include <kafkawire/connection/server_connection.hh>

#include "memory_transport.hh"

using namespace seastar;
namespace kw = kafkawire;

namespace {

struct handler_state {
    std::vector<kw::api_key> handled;
    bool closed = false;
};

// Answers metadata with an empty response and everything else with
// nothing at all.
class recording_handler final : public kw::request_handler {
    lw_shared_ptr<handler_state> _state;

public:
    explicit recording_handler(lw_shared_ptr<handler_state> state) : _state(std::move(state)) {}

    future<kw::response> handle(kw::request req) override {
        _state->handled.push_back(req.key());
        if (req.key() == kw::api_key::METADATA) {
            return make_ready_future<kw::response>(kw::response{req._correlation_id, kw::metadata_response()});
        }
        return make_ready_future<kw::response>(kw::response{req._correlation_id, kw::nil_response{}});
    }

    future<> close() override {
        _state->closed = true;
        return make_ready_future<>();
    }
};

template<typename RequestType>
std::string request_frame(int32_t correlation_id, RequestType body) {
    kw::request req;
    req._correlation_id = correlation_id;
    req._client_id = seastar::sstring("client");
    req._body = std::move(body);
    return framed(kw::encode_request(req));
}

kw::produce_request unacknowledged_produce() {
    kw::produce_request produce;
    produce._acks = 0;
    produce._timeout_ms = 100;
    return produce;
}

std::string metadata_answer(int32_t correlation_id) {
    return framed(kw::encode_response(kw::response{correlation_id, kw::metadata_response()}));
}

}

SEASTAR_THREAD_TEST_CASE(server_connection_answers_in_order_test) {
    auto state = make_lw_shared<handler_state>();
    auto transport = std::make_unique<memory_transport>(
            request_frame(7, kw::metadata_request())
            + request_frame(8, unacknowledged_produce())
            + request_frame(9, kw::metadata_request()));
    auto raw = transport.get();
    kw::server_connection connection(std::move(transport), std::make_unique<recording_handler>(state), 1024);

    connection.process().get();

    BOOST_REQUIRE(state->handled == std::vector<kw::api_key>({
            kw::api_key::METADATA, kw::api_key::PRODUCE, kw::api_key::METADATA}));
    // The produce without acks gets no frame of its own.
    BOOST_REQUIRE_EQUAL(raw->written(), metadata_answer(7) + metadata_answer(9));
    BOOST_REQUIRE(state->closed);
    BOOST_REQUIRE(raw->closed());
}

SEASTAR_THREAD_TEST_CASE(server_connection_skips_unsupported_requests_test) {
    // api key 99, version 0, correlation id 1, client id "c", no body
    kw::kafka::output_stream unknown;
    const std::string header("\x00\x63" "\x00\x00" "\x00\x00\x00\x01" "\x00\x01" "c", 11);
    unknown.write(header.data(), header.size());

    auto state = make_lw_shared<handler_state>();
    auto transport = std::make_unique<memory_transport>(
            framed(unknown)
            + request_frame(2, kw::metadata_request()));
    auto raw = transport.get();
    kw::server_connection connection(std::move(transport), std::make_unique<recording_handler>(state), 1024);

    connection.process().get();

    BOOST_REQUIRE(state->handled == std::vector<kw::api_key>({kw::api_key::METADATA}));
    BOOST_REQUIRE_EQUAL(raw->written(), metadata_answer(2));
}

SEASTAR_THREAD_TEST_CASE(server_connection_closes_on_malformed_request_test) {
    // Metadata request whose topic array claims more topics than it holds.
    kw::kafka::output_stream malformed;
    const std::string bytes("\x00\x03" "\x00\x00" "\x00\x00\x00\x01" "\xff\xff" "\x00\x00\x00\x05" "\x00\x01" "t", 17);
    malformed.write(bytes.data(), bytes.size());

    auto state = make_lw_shared<handler_state>();
    auto transport = std::make_unique<memory_transport>(
            framed(malformed)
            + request_frame(2, kw::metadata_request()));
    auto raw = transport.get();
    kw::server_connection connection(std::move(transport), std::make_unique<recording_handler>(state), 1024);

    connection.process().get();

    BOOST_REQUIRE(state->handled.empty());
    BOOST_REQUIRE(raw->written().empty());
    BOOST_REQUIRE(state->closed);
    BOOST_REQUIRE(raw->closed());
}

SEASTAR_THREAD_TEST_CASE(server_connection_closes_on_oversized_frame_test) {
    auto state = make_lw_shared<handler_state>();
    auto transport = std::make_unique<memory_transport>(request_frame(1, kw::metadata_request()));
    auto raw = transport.get();
    kw::server_connection connection(std::move(transport), std::make_unique<recording_handler>(state), 4);

    connection.process().get();

    BOOST_REQUIRE(state->handled.empty());
    BOOST_REQUIRE(state->closed);
    BOOST_REQUIRE(raw->closed());
}
