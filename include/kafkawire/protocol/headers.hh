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

#include <seastar/core/sstring.hh>

#include <kafkawire/protocol/api_key.hh>
#include <kafkawire/protocol/kafka_primitives.hh>

using namespace seastar;

namespace kafkawire {

// Every request starts with this header, the 0.8 layout has no tagged
// fields and the client id may be null.
class request_header {
public:
    // Keys outside the enum are kept as read, decoders reject them later.
    api_key _api_key = api_key::PRODUCE;
    kafka_int16_t _api_version;
    kafka_int32_t _correlation_id;
    kafka_nullable_string_t _client_id;

    // Key name and number, version and correlation id, for logs and errors.
    [[nodiscard]] seastar::sstring describe() const;

    void serialize(kafka::output_stream& os, int16_t api_version) const;

    void deserialize(kafka::input_stream& is, int16_t api_version);
};

class response_header {
public:
    kafka_int32_t _correlation_id;

    void serialize(kafka::output_stream& os, int16_t api_version) const;

    void deserialize(kafka::input_stream& is, int16_t api_version);
};

}
