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

#include <kafkawire/protocol/headers.hh>

using namespace seastar;

namespace kafkawire {

seastar::sstring request_header::describe() const {
    auto description = fmt::format("{} request (api key {}) version {}, correlation id {}",
            api_key_name(_api_key), static_cast<int16_t>(_api_key), *_api_version, *_correlation_id);
    return seastar::sstring(description.data(), description.size());
}

void request_header::serialize(kafka::output_stream& os, int16_t api_version) const {
    kafka_int16_t key(static_cast<int16_t>(_api_key));
    key.serialize(os, api_version);
    _api_version.serialize(os, api_version);
    _correlation_id.serialize(os, api_version);
    _client_id.serialize(os, api_version);
}

void request_header::deserialize(kafka::input_stream& is, int16_t api_version) {
    kafka_int16_t key;
    key.deserialize(is, api_version);
    _api_key = static_cast<api_key>(*key);
    _api_version.deserialize(is, api_version);
    _correlation_id.deserialize(is, api_version);
    _client_id.deserialize(is, api_version);
}

// Responses of API version 0 carry only the correlation id.
void response_header::serialize(kafka::output_stream& os, int16_t api_version) const {
    _correlation_id.serialize(os, api_version);
}

void response_header::deserialize(kafka::input_stream& is, int16_t api_version) {
    _correlation_id.deserialize(is, api_version);
}

}
