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

#include <kafkawire/protocol/metadata_response.hh>

using namespace seastar;

namespace kafkawire {

namespace {

constexpr int32_t NO_LEADER = -1;

int32_t read_count(kafka::input_stream& is, int16_t api_version) {
    kafka_int32_t count;
    count.deserialize(is, api_version);
    if (*count < 0 || *count > is.remaining()) {
        throw parsing_exception(fmt::format("Invalid element count {}", *count));
    }
    return *count;
}

std::vector<metadata_response_broker> read_broker_ids(kafka::input_stream& is, int16_t api_version,
        const broker_table& brokers, const char* role) {
    auto count = read_count(is, api_version);
    std::vector<metadata_response_broker> result;
    result.reserve(count);
    for (int32_t i = 0; i < count; i++) {
        kafka_int32_t node_id;
        node_id.deserialize(is, api_version);
        auto it = brokers.find(*node_id);
        if (it == brokers.end()) {
            throw parsing_exception(fmt::format("Unknown {} broker id {}", role, *node_id));
        }
        result.push_back(it->second);
    }
    return result;
}

void write_broker_ids(kafka::output_stream& os, int16_t api_version,
        const std::vector<metadata_response_broker>& brokers) {
    kafka_int32_t count(brokers.size());
    count.serialize(os, api_version);
    for (const auto& broker : brokers) {
        broker._node_id.serialize(os, api_version);
    }
}

}

void metadata_response_broker::serialize(kafka::output_stream& os, int16_t api_version) const {
    _node_id.serialize(os, api_version);
    _host.serialize(os, api_version);
    _port.serialize(os, api_version);
}

void metadata_response_broker::deserialize(kafka::input_stream& is, int16_t api_version) {
    _node_id.deserialize(is, api_version);
    _host.deserialize(is, api_version);
    _port.deserialize(is, api_version);
}

void metadata_response_partition::serialize(kafka::output_stream& os, int16_t api_version) const {
    _error_code.serialize(os, api_version);
    _partition_index.serialize(os, api_version);
    kafka_int32_t leader_id(_leader ? *_leader->_node_id : NO_LEADER);
    leader_id.serialize(os, api_version);
    write_broker_ids(os, api_version, _replicas);
    write_broker_ids(os, api_version, _isr);
}

void metadata_response_partition::deserialize(kafka::input_stream& is, int16_t api_version,
        const broker_table& brokers) {
    _error_code.deserialize(is, api_version);
    _partition_index.deserialize(is, api_version);
    kafka_int32_t leader_id;
    leader_id.deserialize(is, api_version);
    // A leader which is not among the listed brokers is reported as absent,
    // the broker list may lag behind a leadership change.
    auto leader = brokers.find(*leader_id);
    if (*leader_id == NO_LEADER || leader == brokers.end()) {
        _leader = std::nullopt;
    } else {
        _leader = leader->second;
    }
    _replicas = read_broker_ids(is, api_version, brokers, "replica");
    _isr = read_broker_ids(is, api_version, brokers, "isr");
}

void metadata_response_topic::serialize(kafka::output_stream& os, int16_t api_version) const {
    _error_code.serialize(os, api_version);
    _name.serialize(os, api_version);
    kafka_int32_t count(_partitions.size());
    count.serialize(os, api_version);
    for (const auto& partition : _partitions) {
        partition.serialize(os, api_version);
    }
}

void metadata_response_topic::deserialize(kafka::input_stream& is, int16_t api_version,
        const broker_table& brokers) {
    _error_code.deserialize(is, api_version);
    _name.deserialize(is, api_version);
    std::vector<metadata_response_partition> partitions(read_count(is, api_version));
    for (auto& partition : partitions) {
        partition.deserialize(is, api_version, brokers);
    }
    _partitions.swap(partitions);
}

void metadata_response::serialize(kafka::output_stream& os, int16_t api_version) const {
    _brokers.serialize(os, api_version);
    kafka_int32_t count(_topics.size());
    count.serialize(os, api_version);
    for (const auto& topic : _topics) {
        topic.serialize(os, api_version);
    }
}

void metadata_response::deserialize(kafka::input_stream& is, int16_t api_version) {
    _brokers.deserialize(is, api_version);
    broker_table brokers;
    for (const auto& broker : *_brokers) {
        brokers.emplace(*broker._node_id, broker);
    }
    std::vector<metadata_response_topic> topics(read_count(is, api_version));
    for (auto& topic : topics) {
        topic.deserialize(is, api_version, brokers);
    }
    _topics.swap(topics);
}

}
