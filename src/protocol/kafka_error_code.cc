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

#include <unordered_map>

#include <fmt/format.h>

#include <kafkawire/protocol/kafka_error_code.hh>
#include <kafkawire/protocol/kafka_primitives.hh>

using namespace seastar;

namespace kafkawire {

namespace error {

static std::unordered_map<int16_t, const kafka_error_code*>& errors() {
    static std::unordered_map<int16_t, const kafka_error_code*> registry;
    return registry;
}

kafka_error_code::kafka_error_code(
    int16_t error_code,
    seastar::sstring error_name,
    seastar::sstring error_message,
    is_retriable is_retriable)
    : _error_code(error_code),
    _error_name(std::move(error_name)),
    _error_message(std::move(error_message)),
    _is_retriable(is_retriable) {
    errors().emplace(error_code, this);
}

const kafka_error_code* kafka_error_code::find_error(int16_t value) noexcept {
    auto it = errors().find(value);
    return it != errors().end() ? it->second : nullptr;
}

const kafka_error_code kafka_error_code::UNKNOWN(
    -1,
    "UNKNOWN",
    "An unexpected server error.",
    is_retriable::no
);
const kafka_error_code kafka_error_code::NONE(
    0,
    "NONE",
    "",
    is_retriable::no
);
const kafka_error_code kafka_error_code::OFFSET_OUT_OF_RANGE(
    1,
    "OFFSET_OUT_OF_RANGE",
    "The requested offset is outside the range of offsets maintained by the server for the given topic/partition.",
    is_retriable::no
);
const kafka_error_code kafka_error_code::INVALID_MESSAGE(
    2,
    "INVALID_MESSAGE",
    "The message contents do not match the message CRC or the message is otherwise corrupt.",
    is_retriable::yes
);
const kafka_error_code kafka_error_code::UNKNOWN_TOPIC_OR_PARTITION(
    3,
    "UNKNOWN_TOPIC_OR_PARTITION",
    "The topic or partition does not exist on this broker.",
    is_retriable::yes
);
const kafka_error_code kafka_error_code::INVALID_MESSAGE_SIZE(
    4,
    "INVALID_MESSAGE_SIZE",
    "The message has a negative size.",
    is_retriable::no
);
const kafka_error_code kafka_error_code::LEADER_NOT_AVAILABLE(
    5,
    "LEADER_NOT_AVAILABLE",
    "The partition is in the middle of a leadership election and has no leader.",
    is_retriable::yes
);
const kafka_error_code kafka_error_code::NOT_LEADER_FOR_PARTITION(
    6,
    "NOT_LEADER_FOR_PARTITION",
    "The request was sent to a replica which is not the leader for the partition.",
    is_retriable::yes
);
const kafka_error_code kafka_error_code::REQUEST_TIMED_OUT(
    7,
    "REQUEST_TIMED_OUT",
    "The request exceeded the user-specified time limit.",
    is_retriable::yes
);
const kafka_error_code kafka_error_code::BROKER_NOT_AVAILABLE(
    8,
    "BROKER_NOT_AVAILABLE",
    "The broker is not alive.",
    is_retriable::no
);
const kafka_error_code kafka_error_code::REPLICA_NOT_AVAILABLE(
    9,
    "REPLICA_NOT_AVAILABLE",
    "A replica was expected on a broker but is not there.",
    is_retriable::no
);
const kafka_error_code kafka_error_code::MESSAGE_SIZE_TOO_LARGE(
    10,
    "MESSAGE_SIZE_TOO_LARGE",
    "The message is larger than the maximum size the server accepts.",
    is_retriable::no
);
const kafka_error_code kafka_error_code::STALE_CONTROLLER_EPOCH(
    11,
    "STALE_CONTROLLER_EPOCH",
    "The controller epoch is stale.",
    is_retriable::no
);
const kafka_error_code kafka_error_code::OFFSET_METADATA_TOO_LARGE(
    12,
    "OFFSET_METADATA_TOO_LARGE",
    "The metadata string attached to the committed offset is too large.",
    is_retriable::no
);
const kafka_error_code kafka_error_code::OFFSETS_LOAD_IN_PROGRESS(
    14,
    "OFFSETS_LOAD_IN_PROGRESS",
    "The broker is still loading offsets after a leader change for the offsets topic partition.",
    is_retriable::yes
);
const kafka_error_code kafka_error_code::CONSUMER_COORDINATOR_NOT_AVAILABLE(
    15,
    "CONSUMER_COORDINATOR_NOT_AVAILABLE",
    "The offsets topic has not yet been created or the coordinator is not active.",
    is_retriable::yes
);
const kafka_error_code kafka_error_code::NOT_COORDINATOR_FOR_CONSUMER(
    16,
    "NOT_COORDINATOR_FOR_CONSUMER",
    "The broker is not the coordinator for the consumer group.",
    is_retriable::yes
);

}

seastar::sstring kafka_error_code_t::message() const {
    auto error = known();
    if (error) {
        return error->_error_message;
    }
    auto message = fmt::format("Unknown error code {}", _value);
    return seastar::sstring(message.data(), message.size());
}

}
