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

#include <kafkawire/codec/response_decoder.hh>
#include <kafkawire/codec/response_encoder.hh>

#include "memory_transport.hh"

using namespace seastar;
namespace kw = kafkawire;

template<size_t N>
static std::string bytes(const char (&data)[N]) {
    return std::string(data, N - 1);
}

static temporary_buffer<char> to_buffer(const std::string& data) {
    return temporary_buffer<char>(data.data(), data.size());
}

static std::string int32(int32_t value) {
    kw::kafka::output_stream os;
    kw::kafka_int32_t(value).serialize(os, 0);
    return to_string(os);
}

static std::string str(const seastar::sstring& value) {
    kw::kafka::output_stream os;
    kw::kafka_string_t(value).serialize(os, 0);
    return to_string(os);
}

// One broker (id 1), one topic "t" with a single partition.
static std::string metadata_frame(int32_t correlation_id, int32_t leader, int32_t replica) {
    return int32(correlation_id)
        + int32(1) + int32(1) + str("b1") + int32(9092)
        + int32(1) + bytes("\x00\x00") + str("t")
        + int32(1) + bytes("\x00\x00") + int32(0) + int32(leader)
        + int32(1) + int32(replica)
        + int32(1) + int32(1);
}

static const std::string PRODUCE_FRAME = bytes(
        "\x00\x00\x00\x2a"
        "\x00\x00\x00\x01"
        "\x00\x06" "orders"
        "\x00\x00\x00\x01"
        "\x00\x00\x00\x00"
        "\x00\x00"
        "\x00\x00\x00\x00\x00\x00\x04\x00");

SEASTAR_THREAD_TEST_CASE(response_decoder_produce_test) {
    kw::request_correlator correlator;
    correlator.register_request(42, kw::api_key::PRODUCE);
    kw::response_decoder decoder(correlator);

    auto result = decoder.decode(to_buffer(PRODUCE_FRAME));
    auto emitted = std::get_if<kw::emit_response>(&result);
    BOOST_REQUIRE(emitted);
    BOOST_REQUIRE_EQUAL(emitted->_response._correlation_id, 42);

    const auto& produce = emitted->_response.as<kw::produce_response>();
    BOOST_REQUIRE_EQUAL(produce._responses->size(), 1);
    BOOST_REQUIRE_EQUAL(*produce._responses[0]._name, "orders");
    const auto& partition = produce._responses[0]._partitions[0];
    BOOST_REQUIRE_EQUAL(*partition._partition_index, 0);
    BOOST_REQUIRE(partition._error_code == kw::error::kafka_error_code::NONE);
    BOOST_REQUIRE_EQUAL(*partition._base_offset, 1024);
    BOOST_REQUIRE(!correlator.contains(42));

    // Encoding the decoded value gives back the original bytes.
    BOOST_REQUIRE_EQUAL(to_string(kw::encode_response(emitted->_response)), PRODUCE_FRAME);
}

SEASTAR_THREAD_TEST_CASE(response_decoder_metadata_leader_test) {
    kw::request_correlator correlator;
    kw::response_decoder decoder(correlator);

    correlator.register_request(1, kw::api_key::METADATA);
    auto result = decoder.decode(to_buffer(metadata_frame(1, -1, 1)));
    BOOST_REQUIRE(std::holds_alternative<kw::emit_response>(result));
    auto& leaderless = std::get<kw::emit_response>(result)._response.as<kw::metadata_response>();
    const auto& partition = leaderless._topics[0]._partitions[0];
    BOOST_REQUIRE(!partition._leader);
    BOOST_REQUIRE_EQUAL(partition._replicas.size(), 1);
    BOOST_REQUIRE_EQUAL(*partition._replicas[0]._host, "b1");
    BOOST_REQUIRE_EQUAL(*partition._isr[0]._port, 9092);

    correlator.register_request(2, kw::api_key::METADATA);
    result = decoder.decode(to_buffer(metadata_frame(2, 1, 1)));
    BOOST_REQUIRE(std::holds_alternative<kw::emit_response>(result));
    auto& led = std::get<kw::emit_response>(result)._response.as<kw::metadata_response>();
    BOOST_REQUIRE(led._topics[0]._partitions[0]._leader);
    BOOST_REQUIRE_EQUAL(*led._topics[0]._partitions[0]._leader->_node_id, 1);
    BOOST_REQUIRE_EQUAL(*led._topics[0]._name, "t");
}

SEASTAR_THREAD_TEST_CASE(response_decoder_metadata_unknown_replica_test) {
    kw::request_correlator correlator;
    kw::response_decoder decoder(correlator);

    correlator.register_request(3, kw::api_key::METADATA);
    auto result = decoder.decode(to_buffer(metadata_frame(3, 1, 2)));
    auto failure = std::get_if<kw::decode_failure>(&result);
    BOOST_REQUIRE(failure);
    BOOST_REQUIRE_THROW(std::rethrow_exception(failure->_error), kw::parsing_exception);
}

SEASTAR_THREAD_TEST_CASE(response_decoder_unknown_correlation_id_test) {
    kw::request_correlator correlator;
    kw::response_decoder decoder(correlator);

    auto result = decoder.decode(to_buffer(PRODUCE_FRAME));
    auto skipped = std::get_if<kw::not_handled>(&result);
    BOOST_REQUIRE(skipped);
    BOOST_REQUIRE(skipped->_reason == kw::not_handled_reason::unknown_correlation_id);
    BOOST_REQUIRE_EQUAL(std::string(skipped->_frame.get(), skipped->_frame.size()), PRODUCE_FRAME);
}

SEASTAR_THREAD_TEST_CASE(response_decoder_no_body_decoder_test) {
    kw::request_correlator correlator;
    kw::response_decoder decoder(correlator);

    correlator.register_request(9, kw::api_key::STOP_REPLICA);
    auto frame = int32(9) + bytes("\x00\x00");
    auto result = decoder.decode(to_buffer(frame));
    auto skipped = std::get_if<kw::not_handled>(&result);
    BOOST_REQUIRE(skipped);
    BOOST_REQUIRE(skipped->_reason == kw::not_handled_reason::no_response_body);
    BOOST_REQUIRE_EQUAL(std::string(skipped->_frame.get(), skipped->_frame.size()), frame);
    BOOST_REQUIRE(!correlator.contains(9));
}

SEASTAR_THREAD_TEST_CASE(response_decoder_truncated_frame_test) {
    kw::request_correlator correlator;
    kw::response_decoder decoder(correlator);

    // The topic name claims 7 bytes, only 6 follow.
    correlator.register_request(42, kw::api_key::PRODUCE);
    auto result = decoder.decode(to_buffer(bytes("\x00\x00\x00\x2a" "\x00\x00\x00\x01" "\x00\x07" "orders")));
    auto failure = std::get_if<kw::decode_failure>(&result);
    BOOST_REQUIRE(failure);
    BOOST_REQUIRE_THROW(std::rethrow_exception(failure->_error), kw::parsing_exception);

    correlator.register_request(43, kw::api_key::PRODUCE);
    result = decoder.decode(to_buffer(int32(43) + int32(0) + bytes("\x01")));
    BOOST_REQUIRE(std::holds_alternative<kw::decode_failure>(result));

    result = decoder.decode(to_buffer(bytes("\x00\x00")));
    BOOST_REQUIRE(std::holds_alternative<kw::decode_failure>(result));
}
