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

// Encodes, decodes through the batch decoder and checks that encoding the
// result gives the same bytes.
static kw::response round_trip(kw::api_key key, const kw::response& original) {
    auto encoded = to_string(kw::encode_response(original));

    kw::request_correlator correlator;
    correlator.register_request(original._correlation_id, key);
    kw::response_decoder decoder(correlator);
    auto result = decoder.decode(temporary_buffer<char>(encoded.data(), encoded.size()));
    BOOST_REQUIRE(std::holds_alternative<kw::emit_response>(result));
    auto decoded = std::move(std::get<kw::emit_response>(result)._response);

    BOOST_REQUIRE_EQUAL(decoded._correlation_id, original._correlation_id);
    BOOST_REQUIRE_EQUAL(to_string(kw::encode_response(decoded)), encoded);
    return decoded;
}

SEASTAR_THREAD_TEST_CASE(response_encoder_fetch_test) {
    kw::fetch_response_partition partition;
    partition._partition_index = 3;
    partition._error_code = kw::error::kafka_error_code::OFFSET_OUT_OF_RANGE;
    partition._high_watermark = 77;
    kw::message_set_entry entry;
    entry._offset = 76;
    entry._message = seastar::sstring("payload");
    partition._messages._entries.push_back(entry);
    kw::fetch_response_topic topic;
    topic._name = seastar::sstring("events");
    topic._partitions = std::vector<kw::fetch_response_partition>{partition};
    kw::fetch_response body;
    body._topics = std::vector<kw::fetch_response_topic>{topic};

    auto decoded = round_trip(kw::api_key::FETCH, kw::response{11, body});
    const auto& fetched = decoded.as<kw::fetch_response>()._topics[0]._partitions[0];
    BOOST_REQUIRE(fetched._error_code == kw::error::kafka_error_code::OFFSET_OUT_OF_RANGE);
    BOOST_REQUIRE_EQUAL(*fetched._high_watermark, 77);
    BOOST_REQUIRE_EQUAL(*fetched._messages._entries[0]._message, "payload");
}

SEASTAR_THREAD_TEST_CASE(response_encoder_offset_test) {
    kw::offset_response_partition partition;
    partition._partition_index = 0;
    partition._offsets = std::vector<kw::kafka_int64_t>{kw::kafka_int64_t(100), kw::kafka_int64_t(0)};
    kw::offset_response_topic topic;
    topic._name = seastar::sstring("events");
    topic._partitions = std::vector<kw::offset_response_partition>{partition};
    kw::offset_response body;
    body._topics = std::vector<kw::offset_response_topic>{topic};

    auto decoded = round_trip(kw::api_key::OFFSET, kw::response{12, body});
    const auto& offsets = decoded.as<kw::offset_response>()._topics[0]._partitions[0]._offsets;
    BOOST_REQUIRE_EQUAL(offsets->size(), 2);
    BOOST_REQUIRE_EQUAL(*offsets[0], 100);
}

SEASTAR_THREAD_TEST_CASE(response_encoder_metadata_test) {
    kw::metadata_response_broker first;
    first._node_id = 1;
    first._host = seastar::sstring("kafka-1");
    first._port = 9092;
    kw::metadata_response_broker second;
    second._node_id = 2;
    second._host = seastar::sstring("kafka-2");
    second._port = 9093;

    kw::metadata_response_partition led;
    led._partition_index = 0;
    led._leader = second;
    led._replicas = {second, first};
    led._isr = {second};
    kw::metadata_response_partition leaderless;
    leaderless._partition_index = 1;
    leaderless._error_code = kw::error::kafka_error_code::LEADER_NOT_AVAILABLE;
    leaderless._replicas = {first};

    kw::metadata_response_topic topic;
    topic._name = seastar::sstring("events");
    topic._partitions = {led, leaderless};
    kw::metadata_response body;
    body._brokers = std::vector<kw::metadata_response_broker>{first, second};
    body._topics = {topic};

    auto decoded = round_trip(kw::api_key::METADATA, kw::response{13, body});
    const auto& partitions = decoded.as<kw::metadata_response>()._topics[0]._partitions;
    BOOST_REQUIRE_EQUAL(*partitions[0]._leader->_host, "kafka-2");
    BOOST_REQUIRE_EQUAL(*partitions[0]._replicas[1]._port, 9092);
    BOOST_REQUIRE(partitions[1]._isr.empty());
    BOOST_REQUIRE(!partitions[1]._leader);
}

SEASTAR_THREAD_TEST_CASE(response_encoder_offset_commit_test) {
    kw::offset_commit_response_partition partition;
    partition._partition_index = 4;
    partition._error_code = kw::error::kafka_error_code::OFFSET_METADATA_TOO_LARGE;
    kw::offset_commit_response_topic topic;
    topic._name = seastar::sstring("events");
    topic._partitions = std::vector<kw::offset_commit_response_partition>{partition};
    kw::offset_commit_response body;
    body._topics = std::vector<kw::offset_commit_response_topic>{topic};

    auto decoded = round_trip(kw::api_key::OFFSET_COMMIT, kw::response{14, body});
    BOOST_REQUIRE(decoded.as<kw::offset_commit_response>()._topics[0]._partitions[0]._error_code
            == kw::error::kafka_error_code::OFFSET_METADATA_TOO_LARGE);
}

SEASTAR_THREAD_TEST_CASE(response_encoder_offset_fetch_test) {
    kw::offset_fetch_response_partition with_metadata;
    with_metadata._partition_index = 0;
    with_metadata._committed_offset = 42;
    with_metadata._metadata = seastar::sstring("checkpoint");
    kw::offset_fetch_response_partition without_metadata;
    without_metadata._partition_index = 1;
    without_metadata._committed_offset = -1;
    kw::offset_fetch_response_topic topic;
    topic._name = seastar::sstring("events");
    topic._partitions = std::vector<kw::offset_fetch_response_partition>{with_metadata, without_metadata};
    kw::offset_fetch_response body;
    body._topics = std::vector<kw::offset_fetch_response_topic>{topic};

    auto decoded = round_trip(kw::api_key::OFFSET_FETCH, kw::response{15, body});
    const auto& partitions = decoded.as<kw::offset_fetch_response>()._topics[0]._partitions;
    BOOST_REQUIRE_EQUAL(*partitions[0]._metadata, "checkpoint");
    BOOST_REQUIRE(partitions[1]._metadata.is_null());
    BOOST_REQUIRE_EQUAL(*partitions[1]._committed_offset, -1);
}

SEASTAR_THREAD_TEST_CASE(response_encoder_consumer_metadata_test) {
    kw::consumer_metadata_response body;
    body._coordinator_id = 2;
    body._coordinator_host = seastar::sstring("kafka-2");
    body._coordinator_port = 9093;

    auto decoded = round_trip(kw::api_key::CONSUMER_METADATA, kw::response{16, body});
    BOOST_REQUIRE_EQUAL(*decoded.as<kw::consumer_metadata_response>()._coordinator_host, "kafka-2");
}

SEASTAR_THREAD_TEST_CASE(response_encoder_empty_arrays_test) {
    auto decoded = round_trip(kw::api_key::PRODUCE, kw::response{17, kw::produce_response{}});
    BOOST_REQUIRE(decoded.as<kw::produce_response>()._responses->empty());
}

SEASTAR_THREAD_TEST_CASE(response_encoder_unencodable_test) {
    BOOST_REQUIRE_THROW(kw::encode_response(kw::response{1, kw::nil_response{}}),
            kw::unsupported_encoding_exception);
    BOOST_REQUIRE_THROW(kw::encode_response(kw::response{2, kw::stream_fetch_response{}}),
            kw::unsupported_encoding_exception);
}
