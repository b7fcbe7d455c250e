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
#include <seastar/core/sstring.hh>
#include <seastar/util/bool_class.hh>

using namespace seastar;

namespace kafkawire {

namespace error {

struct is_retriable_tag {};
using is_retriable = bool_class<is_retriable_tag>;

// Error codes defined by the 0.8.2 protocol. Values are never thrown,
// they are carried in the result records of every response.
class kafka_error_code {

public:

    int16_t _error_code;
    seastar::sstring _error_name;
    seastar::sstring _error_message;
    is_retriable _is_retriable;

    kafka_error_code(
        int16_t error_code,
        seastar::sstring error_name,
        seastar::sstring error_message,
        is_retriable is_retriable);

    kafka_error_code(const kafka_error_code&) = delete;
    kafka_error_code& operator=(const kafka_error_code&) = delete;

    // nullptr for codes this protocol version does not define.
    static const kafka_error_code* find_error(int16_t value) noexcept;

    static const kafka_error_code UNKNOWN;
    static const kafka_error_code NONE;
    static const kafka_error_code OFFSET_OUT_OF_RANGE;
    static const kafka_error_code INVALID_MESSAGE;
    static const kafka_error_code UNKNOWN_TOPIC_OR_PARTITION;
    static const kafka_error_code INVALID_MESSAGE_SIZE;
    static const kafka_error_code LEADER_NOT_AVAILABLE;
    static const kafka_error_code NOT_LEADER_FOR_PARTITION;
    static const kafka_error_code REQUEST_TIMED_OUT;
    static const kafka_error_code BROKER_NOT_AVAILABLE;
    static const kafka_error_code REPLICA_NOT_AVAILABLE;
    static const kafka_error_code MESSAGE_SIZE_TOO_LARGE;
    static const kafka_error_code STALE_CONTROLLER_EPOCH;
    static const kafka_error_code OFFSET_METADATA_TOO_LARGE;
    static const kafka_error_code OFFSETS_LOAD_IN_PROGRESS;
    static const kafka_error_code CONSUMER_COORDINATOR_NOT_AVAILABLE;
    static const kafka_error_code NOT_COORDINATOR_FOR_CONSUMER;
};

}

}
