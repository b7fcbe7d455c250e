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

#include <kafkawire/protocol/api_key.hh>
#include <kafkawire/protocol/kafka_primitives.hh>
#include <kafkawire/protocol/metadata_response.hh>

using namespace seastar;

namespace kafkawire {

class metadata_request {
public:
    using response_type = metadata_response;
    static constexpr api_key API_KEY = api_key::METADATA;
    static constexpr int16_t API_VERSION = 0;

    // Empty asks for every topic in the cluster.
    kafka_array_t<kafka_string_t> _topics;

    void serialize(kafka::output_stream& os, int16_t api_version) const;

    void deserialize(kafka::input_stream& is, int16_t api_version);
};

}
