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

#include <algorithm>
#include <map>
#include <vector>

#include <fmt/format.h>

#include <seastar/core/app-template.hh>
#include <seastar/core/sleep.hh>
#include <seastar/core/thread.hh>
#include <seastar/core/when_all.hh>

#include <kafkawire/connection/kafka_connection.hh>
#include <kafkawire/connection/kafka_server.hh>

using namespace seastar;

namespace bpo = boost::program_options;
namespace kw = kafkawire;

// Keeps produced message sets in memory and serves them back to Fetch.
// Enough of a broker to point the client mode at.
class memory_log_handler final : public kw::request_handler {
    using partition_key = std::pair<seastar::sstring, int32_t>;

    seastar::sstring _host;
    uint16_t _port;
    std::map<partition_key, std::vector<kw::message_set_entry>>& _log;

    kw::response handle_metadata(const kw::metadata_request& request, int32_t correlation_id) {
        kw::metadata_response_broker self;
        self._node_id = 0;
        self._host = _host;
        self._port = _port;

        kw::metadata_response body;
        body._brokers = std::vector<kw::metadata_response_broker>{self};
        for (const auto& [key, entries] : _log) {
            if (!request._topics->empty() && std::none_of(request._topics->begin(), request._topics->end(),
                    [&key] (const kw::kafka_string_t& topic) { return *topic == key.first; })) {
                continue;
            }
            kw::metadata_response_partition partition;
            partition._partition_index = key.second;
            partition._leader = self;
            partition._replicas = {self};
            partition._isr = {self};
            if (body._topics.empty() || *body._topics.back()._name != key.first) {
                kw::metadata_response_topic topic;
                topic._name = key.first;
                body._topics.push_back(std::move(topic));
            }
            body._topics.back()._partitions.push_back(std::move(partition));
        }
        return kw::response{correlation_id, std::move(body)};
    }

    kw::response handle_produce(const kw::produce_request& request, int32_t correlation_id) {
        kw::produce_response body;
        for (const auto& topic : *request._topics) {
            kw::produce_response_topic_response topic_response;
            topic_response._name = *topic._name;
            for (const auto& partition : *topic._partitions) {
                auto& entries = _log[{*topic._name, *partition._partition_index}];
                kw::produce_response_partition_response partition_response;
                partition_response._partition_index = *partition._partition_index;
                partition_response._base_offset = static_cast<int64_t>(entries.size());
                for (const auto& entry : partition._messages._entries) {
                    kw::message_set_entry stored;
                    stored._offset = static_cast<int64_t>(entries.size());
                    stored._message = *entry._message;
                    entries.push_back(std::move(stored));
                }
                topic_response._partitions->push_back(std::move(partition_response));
            }
            body._responses->push_back(std::move(topic_response));
        }
        if (!request.expects_response()) {
            return kw::response{correlation_id, kw::nil_response{}};
        }
        return kw::response{correlation_id, std::move(body)};
    }

    kw::response handle_fetch(const kw::fetch_request& request, int32_t correlation_id) {
        kw::fetch_response body;
        for (const auto& topic : *request._topics) {
            kw::fetch_response_topic topic_response;
            topic_response._name = *topic._name;
            for (const auto& partition : *topic._partitions) {
                kw::fetch_response_partition partition_response;
                partition_response._partition_index = *partition._partition_index;
                auto it = _log.find({*topic._name, *partition._partition_index});
                if (it == _log.end()) {
                    partition_response._error_code = kw::error::kafka_error_code::UNKNOWN_TOPIC_OR_PARTITION;
                } else {
                    partition_response._high_watermark = static_cast<int64_t>(it->second.size());
                    int32_t budget = *partition._max_bytes;
                    for (auto offset = std::max<int64_t>(*partition._fetch_offset, 0);
                            offset < static_cast<int64_t>(it->second.size()); offset++) {
                        const auto& entry = it->second[offset];
                        budget -= entry.wire_size();
                        if (budget < 0) {
                            break;
                        }
                        partition_response._messages._entries.push_back(entry);
                    }
                }
                topic_response._partitions->push_back(std::move(partition_response));
            }
            body._topics->push_back(std::move(topic_response));
        }
        return kw::response{correlation_id, std::move(body)};
    }

public:
    memory_log_handler(seastar::sstring host, uint16_t port,
            std::map<partition_key, std::vector<kw::message_set_entry>>& log)
        : _host(std::move(host)), _port(port), _log(log) {}

    future<kw::response> handle(kw::request req) override {
        auto correlation_id = req._correlation_id;
        if (auto metadata = std::get_if<kw::metadata_request>(&req._body)) {
            return make_ready_future<kw::response>(handle_metadata(*metadata, correlation_id));
        }
        if (auto produce = std::get_if<kw::produce_request>(&req._body)) {
            return make_ready_future<kw::response>(handle_produce(*produce, correlation_id));
        }
        if (auto fetch = std::get_if<kw::fetch_request>(&req._body)) {
            return make_ready_future<kw::response>(handle_fetch(*fetch, correlation_id));
        }
        return make_exception_future<kw::response>(kw::invalid_request_exception(
                fmt::format("{} is not served by the demo broker", kw::api_key_name(req.key()))));
    }
};

void print_metadata(const kw::metadata_response& metadata) {
    for (const auto& broker : *metadata._brokers) {
        fmt::print("broker {} at {}:{}\n", *broker._node_id, *broker._host, *broker._port);
    }
    for (const auto& topic : metadata._topics) {
        fmt::print("topic {} (error {})\n", *topic._name, topic._error_code.code());
        for (const auto& partition : topic._partitions) {
            fmt::print("  partition {} leader {} replicas {} isr {}\n", *partition._partition_index,
                    partition._leader ? *partition._leader->_node_id : -1,
                    partition._replicas.size(), partition._isr.size());
        }
    }
}

void run_client(const seastar::sstring& host, uint16_t port, const seastar::sstring& topic, int32_t partition,
        const std::vector<std::string>& messages) {
    kw::connection_properties properties;
    properties.client_id = "kafkawire-demo";
    properties.streaming = kw::streaming_fetch::yes;
    auto connection = kw::kafka_connection::connect(host, port, std::move(properties)).get();

    if (!messages.empty()) {
        kw::produce_request_partition_produce_data partition_data;
        partition_data._partition_index = partition;
        for (const auto& message : messages) {
            kw::message_set_entry entry;
            entry._message = seastar::sstring(message.data(), message.size());
            partition_data._messages._entries.push_back(std::move(entry));
        }
        kw::produce_request_topic_produce_data topic_data;
        topic_data._name = topic;
        topic_data._partitions = std::vector<kw::produce_request_partition_produce_data>{std::move(partition_data)};
        kw::produce_request produce;
        produce._acks = 1;
        produce._timeout_ms = 1000;
        produce._topics = std::vector<kw::produce_request_topic_produce_data>{std::move(topic_data)};
        auto produced = connection->send(std::move(produce)).get();
        for (const auto& topic_response : *produced.as<kw::produce_response>()._responses) {
            for (const auto& partition_response : *topic_response._partitions) {
                fmt::print("produced to {}-{} at offset {}: {}\n", *topic_response._name,
                        *partition_response._partition_index, *partition_response._base_offset,
                        partition_response._error_code.message());
            }
        }
    }

    kw::metadata_request metadata;
    metadata._topics = std::vector<kw::kafka_string_t>{kw::kafka_string_t(topic)};
    auto metadata_response = connection->send(std::move(metadata)).get();
    print_metadata(metadata_response.as<kw::metadata_response>());

    kw::fetch_request_partition fetch_partition;
    fetch_partition._partition_index = partition;
    fetch_partition._fetch_offset = 0;
    fetch_partition._max_bytes = 1024 * 1024;
    kw::fetch_request_topic fetch_topic;
    fetch_topic._name = topic;
    fetch_topic._partitions = std::vector<kw::fetch_request_partition>{fetch_partition};
    kw::fetch_request fetch;
    fetch._max_wait_ms = 100;
    fetch._min_bytes = 1;
    fetch._topics = std::vector<kw::fetch_request_topic>{std::move(fetch_topic)};

    auto fetched = connection->send(std::move(fetch)).get();
    auto& stream = fetched.as<kw::stream_fetch_response>();
    when_all_succeed(
        stream._partitions.consume([] (kw::partition_status status) {
            fmt::print("partition {}-{} high watermark {}: {}\n", status._topic, status._partition_index,
                    status._high_watermark, status._error_code.message());
        }),
        stream._messages.consume([] (kw::fetched_message message) {
            fmt::print("{}-{}@{}: {}\n", message._topic, message._partition_index, message._offset,
                    message._payload);
        })
    ).discard_result().get();
    stream._complete.get_future().get();

    connection->close().get();
}

int main(int ac, char** av) {
    app_template app;
    app.add_options()
        ("mode", bpo::value<std::string>()->default_value("client"), "client or server")
        ("host", bpo::value<std::string>()->default_value("127.0.0.1"), "Address of the Kafka broker, or to listen on")
        ("port", bpo::value<uint16_t>()->default_value(9092), "Port to connect through, or to listen on")
        ("topic", bpo::value<std::string>()->default_value("demo"), "Topic to produce to and fetch from")
        ("partition", bpo::value<int32_t>()->default_value(0), "Partition to produce to and fetch from")
        ("message", bpo::value<std::vector<std::string>>()->default_value({}, ""), "Messages to produce first");

    return app.run(ac, av, [&app] {
        return seastar::async([&app] {
            auto&& config = app.configuration();
            auto mode = config["mode"].as<std::string>();
            seastar::sstring host(config["host"].as<std::string>());
            auto port = config["port"].as<uint16_t>();

            if (mode == "server") {
                std::map<std::pair<seastar::sstring, int32_t>, std::vector<kw::message_set_entry>> log;
                kw::server_properties properties;
                properties.host = host;
                properties.port = port;
                kw::kafka_server server(properties, [host, port, &log] {
                    return std::make_unique<memory_log_handler>(host, port, log);
                });
                server.start().get();
                fmt::print("Serving an in-memory log on {}:{}, stop with ctrl-c\n", host, port);
                seastar::sleep_abortable(std::chrono::hours(24 * 365)).handle_exception_type([] (const seastar::sleep_aborted&) {}).get();
                server.stop().get();
                return;
            }

            seastar::sstring topic(config["topic"].as<std::string>());
            run_client(host, port, topic, config["partition"].as<int32_t>(),
                    config["message"].as<std::vector<std::string>>());
        });
    });
}
