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

#include <kafkawire/protocol/produce_response.hh>
#include <kafkawire/protocol/fetch_response.hh>
#include <kafkawire/protocol/offset_response.hh>
#include <kafkawire/protocol/metadata_response.hh>
#include <kafkawire/protocol/offset_commit_response.hh>
#include <kafkawire/protocol/offset_fetch_response.hh>
#include <kafkawire/protocol/consumer_metadata_response.hh>
#include <kafkawire/protocol/stream_fetch_response.hh>

using namespace seastar;

namespace kafkawire {

// Placeholder for requests which get no answer. The server side writes
// nothing for it, the client side produces it for acks 0 Produce.
class nil_response {};

using response_body = std::variant<
    nil_response,
    produce_response,
    fetch_response,
    offset_response,
    metadata_response,
    offset_commit_response,
    offset_fetch_response,
    consumer_metadata_response,
    stream_fetch_response>;

class response {
public:
    int32_t _correlation_id = 0;
    response_body _body;

    template<typename ResponseType>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<ResponseType>(_body);
    }

    template<typename ResponseType>
    [[nodiscard]] ResponseType& as() {
        return std::get<ResponseType>(_body);
    }

    template<typename ResponseType>
    [[nodiscard]] const ResponseType& as() const {
        return std::get<ResponseType>(_body);
    }
};

}
