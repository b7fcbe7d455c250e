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

#include <variant>

#include <kafkawire/protocol/api_key.hh>
#include <kafkawire/protocol/kafka_primitives.hh>
#include <kafkawire/protocol/produce_request.hh>
#include <kafkawire/protocol/fetch_request.hh>
#include <kafkawire/protocol/offset_request.hh>
#include <kafkawire/protocol/metadata_request.hh>
#include <kafkawire/protocol/offset_commit_request.hh>
#include <kafkawire/protocol/offset_fetch_request.hh>
#include <kafkawire/protocol/consumer_metadata_request.hh>

using namespace seastar;

namespace kafkawire {

using request_body = std::variant<
    produce_request,
    fetch_request,
    offset_request,
    metadata_request,
    offset_commit_request,
    offset_fetch_request,
    consumer_metadata_request>;

class request {
public:
    int32_t _correlation_id = 0;
    kafka_nullable_string_t _client_id;
    request_body _body;

    [[nodiscard]] api_key key() const noexcept {
        return std::visit([] (const auto& body) { return std::decay_t<decltype(body)>::API_KEY; }, _body);
    }

    [[nodiscard]] int16_t api_version() const noexcept {
        return std::visit([] (const auto& body) { return std::decay_t<decltype(body)>::API_VERSION; }, _body);
    }

    // A Produce with acks 0 is the only request the broker never answers.
    [[nodiscard]] bool expects_response() const noexcept {
        auto produce = std::get_if<produce_request>(&_body);
        return !produce || produce->expects_response();
    }
};

}
