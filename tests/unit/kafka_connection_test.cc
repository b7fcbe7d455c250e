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

#include <limits>

#include <seastar/core/when_all.hh>

#include <kafkawire/codec/request_codec.hh>
#include <kafkawire/codec/response_encoder.hh>
#include <kafkawire/connection/kafka_connection.hh>
#include <kafkawire/connection/response_splitter.hh>

#include "memory_transport.hh"

using namespace seastar;
namespace kw = kafkawire;

static std::string response_frame(int32_t correlation_id, kw::response_body body) {
    return framed(kw::encode_response(kw::response{correlation_id, std::move(body)}));
}

static kw::metadata_response metadata_with_broker(int32_t node_id) {
    kw::metadata_response_broker broker;
    broker._node_id = node_id;
    broker._host = seastar::sstring("localhost");
    broker._port = 9092;
    kw::metadata_response metadata;
    metadata._brokers = std::vector<kw::metadata_response_broker>{broker};
    return metadata;
}

static kw::produce_request produce_request(int16_t acks) {
    kw::message_set_entry entry;
    entry._message = seastar::sstring("value");
    kw::produce_request_partition_produce_data partition;
    partition._partition_index = 0;
    partition._messages._entries.push_back(entry);
    kw::produce_request_topic_produce_data topic;
    topic._name = seastar::sstring("orders");
    topic._partitions = std::vector<kw::produce_request_partition_produce_data>{partition};
    kw::produce_request produce;
    produce._acks = acks;
    produce._timeout_ms = 1000;
    produce._topics = std::vector<kw::produce_request_topic_produce_data>{topic};
    return produce;
}

static kw::produce_response produce_response(int64_t offset) {
    kw::produce_response_partition_response partition;
    partition._partition_index = 0;
    partition._base_offset = offset;
    kw::produce_response_topic_response topic;
    topic._name = seastar::sstring("orders");
    topic._partitions = std::vector<kw::produce_response_partition_response>{partition};
    kw::produce_response produce;
    produce._responses = std::vector<kw::produce_response_topic_response>{topic};
    return produce;
}

static kw::fetch_request fetch_request() {
    kw::fetch_request_partition partition;
    partition._partition_index = 0;
    partition._max_bytes = 4096;
    kw::fetch_request_topic topic;
    topic._name = seastar::sstring("events");
    topic._partitions = std::vector<kw::fetch_request_partition>{partition};
    kw::fetch_request fetch;
    fetch._topics = std::vector<kw::fetch_request_topic>{topic};
    return fetch;
}

// Partition 0 carries two messages, partition 1 none.
static kw::fetch_response fetch_response() {
    kw::fetch_response_partition first;
    first._partition_index = 0;
    first._high_watermark = 10;
    for (auto offset : {8, 9}) {
        kw::message_set_entry entry;
        entry._offset = offset;
        entry._message = seastar::sstring(offset == 8 ? "m0" : "m1");
        first._messages._entries.push_back(entry);
    }
    kw::fetch_response_partition second;
    second._partition_index = 1;
    second._error_code = kw::error::kafka_error_code::NOT_LEADER_FOR_PARTITION;
    kw::fetch_response_topic topic;
    topic._name = seastar::sstring("events");
    topic._partitions = std::vector<kw::fetch_response_partition>{first, second};
    kw::fetch_response fetch;
    fetch._topics = std::vector<kw::fetch_response_topic>{topic};
    return fetch;
}

static std::pair<std::unique_ptr<kw::kafka_connection>, memory_transport*> make_connection(std::string input,
        kw::streaming_fetch streaming = kw::streaming_fetch::no) {
    auto transport = std::make_unique<memory_transport>(std::move(input));
    auto raw = transport.get();
    kw::connection_properties properties;
    properties.client_id = "tester";
    properties.streaming = streaming;
    return {std::make_unique<kw::kafka_connection>(std::move(transport), std::move(properties)), raw};
}

SEASTAR_THREAD_TEST_CASE(kafka_connection_pipelining_test) {
    auto [conn, transport] = make_connection(
            response_frame(0, metadata_with_broker(3))
            + response_frame(1, produce_response(1024))
            + response_frame(2, kw::consumer_metadata_response()));

    auto metadata = conn->send(kw::metadata_request());
    auto produce = conn->send(produce_request(1));
    auto coordinator = conn->send(kw::consumer_metadata_request());

    auto metadata_response = metadata.get();
    BOOST_REQUIRE_EQUAL(metadata_response._correlation_id, 0);
    BOOST_REQUIRE_EQUAL(*metadata_response.as<kw::metadata_response>()._brokers[0]._node_id, 3);
    auto produce_result = produce.get();
    BOOST_REQUIRE_EQUAL(produce_result._correlation_id, 1);
    BOOST_REQUIRE_EQUAL(*produce_result.as<kw::produce_response>()._responses[0]._partitions[0]._base_offset, 1024);
    auto coordinator_response = coordinator.get();
    BOOST_REQUIRE(coordinator_response.is<kw::consumer_metadata_response>());

    // Requests went out in call order, with the configured client id.
    kw::request first;
    first._correlation_id = 0;
    first._client_id = seastar::sstring("tester");
    first._body = kw::metadata_request();
    BOOST_REQUIRE_EQUAL(transport->written().substr(0, framed(kw::encode_request(first)).size()),
            framed(kw::encode_request(first)));

    conn->close().get();
    BOOST_REQUIRE(transport->closed());
}

SEASTAR_THREAD_TEST_CASE(kafka_connection_produce_without_acks_test) {
    auto [conn, transport] = make_connection(response_frame(1, metadata_with_broker(1)));

    auto produced = conn->send(produce_request(0)).get();
    BOOST_REQUIRE(produced.is<kw::nil_response>());
    BOOST_REQUIRE_EQUAL(produced._correlation_id, 0);
    // Nothing was read for the produce.
    BOOST_REQUIRE_EQUAL(transport->unread(), response_frame(1, metadata_with_broker(1)).size());

    auto metadata = conn->send(kw::metadata_request()).get();
    BOOST_REQUIRE_EQUAL(metadata._correlation_id, 1);
    BOOST_REQUIRE(metadata.is<kw::metadata_response>());

    conn->close().get();
}

SEASTAR_THREAD_TEST_CASE(kafka_connection_buffered_fetch_test) {
    auto [conn, transport] = make_connection(response_frame(0, fetch_response()));

    auto fetched = conn->send(fetch_request()).get();
    const auto& partitions = fetched.as<kw::fetch_response>()._topics[0]._partitions;
    BOOST_REQUIRE_EQUAL(partitions->size(), 2);
    BOOST_REQUIRE_EQUAL(*partitions[0]._messages._entries[1]._message, "m1");

    conn->close().get();
}

SEASTAR_THREAD_TEST_CASE(kafka_connection_streaming_fetch_test) {
    auto [conn, transport] = make_connection(
            response_frame(0, fetch_response()) + response_frame(1, metadata_with_broker(2)),
            kw::streaming_fetch::yes);

    auto fetched = conn->send(fetch_request()).get();
    BOOST_REQUIRE_EQUAL(fetched._correlation_id, 0);
    auto& stream = fetched.as<kw::stream_fetch_response>();

    std::vector<kw::partition_status> partitions;
    std::vector<kw::fetched_message> messages;
    when_all_succeed(
        stream._partitions.consume([&partitions] (kw::partition_status item) { partitions.push_back(std::move(item)); }),
        stream._messages.consume([&messages] (kw::fetched_message item) { messages.push_back(std::move(item)); })
    ).discard_result().get();
    stream._complete.get_future().get();

    BOOST_REQUIRE_EQUAL(partitions.size(), 2);
    BOOST_REQUIRE_EQUAL(partitions[0]._topic, "events");
    BOOST_REQUIRE_EQUAL(partitions[0]._high_watermark, 10);
    BOOST_REQUIRE(partitions[1]._error_code == kw::error::kafka_error_code::NOT_LEADER_FOR_PARTITION);
    BOOST_REQUIRE_EQUAL(messages.size(), 2);
    BOOST_REQUIRE_EQUAL(messages[0]._offset, 8);
    BOOST_REQUIRE_EQUAL(messages[1]._payload, "m1");

    auto metadata = conn->send(kw::metadata_request()).get();
    BOOST_REQUIRE_EQUAL(*metadata.as<kw::metadata_response>()._brokers[0]._node_id, 2);

    conn->close().get();
}

SEASTAR_THREAD_TEST_CASE(kafka_connection_abandoned_stream_test) {
    auto [conn, transport] = make_connection(
            response_frame(0, fetch_response()) + response_frame(1, metadata_with_broker(2)),
            kw::streaming_fetch::yes);

    {
        auto fetched = conn->send(fetch_request()).get();
        BOOST_REQUIRE(fetched.is<kw::stream_fetch_response>());
    }

    // The rest of the fetch body is skipped and the next response lines up.
    auto metadata = conn->send(kw::metadata_request()).get();
    BOOST_REQUIRE_EQUAL(metadata._correlation_id, 1);
    BOOST_REQUIRE_EQUAL(*metadata.as<kw::metadata_response>()._brokers[0]._node_id, 2);
    BOOST_REQUIRE(!conn->is_broken());
    BOOST_REQUIRE_EQUAL(transport->unread(), 0);

    conn->close().get();
}

SEASTAR_THREAD_TEST_CASE(kafka_connection_close_with_undrained_stream_test) {
    auto [conn, transport] = make_connection(response_frame(0, fetch_response()), kw::streaming_fetch::yes);

    auto fetched = conn->send(fetch_request()).get();
    auto& stream = fetched.as<kw::stream_fetch_response>();
    auto complete = stream._complete.get_future();

    // Nothing is drained, the reader is stuck on the full slots until close() fails the stream.
    conn->close().get();
    BOOST_REQUIRE_THROW(complete.get(), kw::connection_broken_exception);
    BOOST_REQUIRE(conn->is_broken());
    BOOST_REQUIRE(transport->closed());
}

SEASTAR_THREAD_TEST_CASE(kafka_connection_correlation_id_wraps_test) {
    BOOST_REQUIRE_EQUAL(kw::kafka_connection::following_correlation_id(0), 1);
    BOOST_REQUIRE_EQUAL(kw::kafka_connection::following_correlation_id(std::numeric_limits<int32_t>::max()),
            std::numeric_limits<int32_t>::min());
    BOOST_REQUIRE_EQUAL(kw::kafka_connection::following_correlation_id(-1), 0);
}

SEASTAR_THREAD_TEST_CASE(kafka_connection_waits_for_responses_by_default_test) {
    // A long polling Fetch must not be cut off by a default timeout.
    BOOST_REQUIRE_EQUAL(kw::connection_properties().request_timeout, 0);
}

SEASTAR_THREAD_TEST_CASE(kafka_connection_unknown_correlation_id_test) {
    auto [conn, transport] = make_connection(response_frame(99, metadata_with_broker(1)));

    BOOST_REQUIRE_THROW(conn->send(kw::metadata_request()).get(), kw::unknown_correlation_id_exception);
    BOOST_REQUIRE(conn->is_broken());
    BOOST_REQUIRE_THROW(conn->send(kw::metadata_request()).get(), kw::connection_broken_exception);

    conn->close().get();
}

SEASTAR_THREAD_TEST_CASE(kafka_connection_closed_by_peer_test) {
    auto [conn, transport] = make_connection("");

    BOOST_REQUIRE_THROW(conn->send(kw::metadata_request()).get(), kw::connection_closed_exception);
    BOOST_REQUIRE_THROW(conn->send(kw::metadata_request()).get(), kw::connection_broken_exception);

    conn->close().get();
}

SEASTAR_THREAD_TEST_CASE(kafka_connection_oversized_frame_test) {
    auto [conn, transport] = make_connection(std::string("\x7f\xff\xff\xff", 4));

    BOOST_REQUIRE_THROW(conn->send(kw::metadata_request()).get(), kw::parsing_exception);
    BOOST_REQUIRE(conn->is_broken());

    conn->close().get();
}

SEASTAR_THREAD_TEST_CASE(response_splitter_partial_message_test) {
    // Fetch body for correlation id 4: one topic "t", partition 0, a full
    // message "ok" at offset 1 and a cut off one at offset 2.
    const std::string body =
        std::string("\x00\x00\x00\x04", 4)
        + std::string("\x00\x00\x00\x01" "\x00\x01" "t" "\x00\x00\x00\x01", 11)
        + std::string("\x00\x00\x00\x00" "\x00\x00" "\x00\x00\x00\x00\x00\x00\x00\x03", 14)
        + std::string("\x00\x00\x00\x1c", 4)
        + std::string("\x00\x00\x00\x00\x00\x00\x00\x01" "\x00\x00\x00\x02" "ok", 14)
        + std::string("\x00\x00\x00\x00\x00\x00\x00\x02" "\x00\x00\x00\x10" "ab", 14);
    kw::kafka::output_stream payload;
    payload.write(body.data(), body.size());
    memory_transport transport(framed(payload));

    kw::request_correlator correlator;
    correlator.register_request(4, kw::api_key::FETCH);
    kw::response_splitter splitter(transport, correlator, 1024);

    std::vector<size_t> kinds;
    std::vector<kw::fetched_message> messages;
    splitter.read_response([&kinds, &messages] (kw::stream_event event) {
        kinds.push_back(event.index());
        if (auto message = std::get_if<kw::fetched_message>(&event)) {
            messages.push_back(std::move(*message));
        }
        return make_ready_future<>();
    }).get();

    // begin, partition, message, end
    BOOST_REQUIRE(kinds == std::vector<size_t>({1, 2, 3, 4}));
    BOOST_REQUIRE_EQUAL(messages[0]._payload, "ok");
    BOOST_REQUIRE_EQUAL(messages[0]._offset, 1);
    BOOST_REQUIRE_EQUAL(transport.unread(), 0);
    BOOST_REQUIRE(!correlator.contains(4));
}
