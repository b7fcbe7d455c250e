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

#include <seastar/core/temporary_buffer.hh>

#include <kafkawire/codec/decode_result.hh>
#include <kafkawire/codec/request_correlator.hh>
#include <kafkawire/protocol/api_key.hh>
#include <kafkawire/protocol/response.hh>
#include <kafkawire/protocol/streams.hh>

using namespace seastar;

namespace kafkawire {

// Decodes the body of a response to a request sent with the given key,
// the stream has to hold exactly that body. Returns an empty optional
// for APIs without a response decoder, throws parsing_exception when the
// bytes do not match the layout.
std::optional<response_body> decode_response_body(api_key key, kafka::input_stream& is);

// Decoder for fully buffered response frames, the size prefix already
// stripped. Consumes the correlator entry of every frame it recognizes.
class response_decoder {
private:
    request_correlator& _correlator;

public:
    explicit response_decoder(request_correlator& correlator) noexcept
        : _correlator(correlator) {}

    decode_result decode(temporary_buffer<char> frame);
};

}
