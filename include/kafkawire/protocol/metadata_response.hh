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

#include <optional>
#include <unordered_map>
#include <vector>

#include <kafkawire/protocol/kafka_primitives.hh>

using namespace seastar;

namespace kafkawire {

class metadata_response_broker {
public:
    kafka_int32_t _node_id;
    kafka_string_t _host;
    kafka_int32_t _port;

    void serialize(kafka::output_stream& os, int16_t api_version) const;

    void deserialize(kafka::input_stream& is, int16_t api_version);
};

// Broker list of the response being decoded, keyed by node id. Partition
// records only carry ids and are resolved against it.
using broker_table = std::unordered_map<int32_t, metadata_response_broker>;

class metadata_response_partition {
public:
    kafka_error_code_t _error_code;
    kafka_int32_t _partition_index;
    // Empty while a leader election is in progress.
    std::optional<metadata_response_broker> _leader;
    std::vector<metadata_response_broker> _replicas;
    std::vector<metadata_response_broker> _isr;

    void serialize(kafka::output_stream& os, int16_t api_version) const;

    void deserialize(kafka::input_stream& is, int16_t api_version, const broker_table& brokers);
};

class metadata_response_topic {
public:
    kafka_error_code_t _error_code;
    kafka_string_t _name;
    std::vector<metadata_response_partition> _partitions;

    void serialize(kafka::output_stream& os, int16_t api_version) const;

    void deserialize(kafka::input_stream& is, int16_t api_version, const broker_table& brokers);
};

class metadata_response {
public:
    kafka_array_t<metadata_response_broker> _brokers;
    std::vector<metadata_response_topic> _topics;

    void serialize(kafka::output_stream& os, int16_t api_version) const;

    void deserialize(kafka::input_stream& is, int16_t api_version);
};

}
