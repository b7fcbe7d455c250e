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

#include <kafkawire/codec/response_decoder.hh>
#include <kafkawire/protocol/headers.hh>
#include <kafkawire/utils/logger.hh>

using namespace seastar;

namespace kafkawire {

namespace {

constexpr int16_t RESPONSE_VERSION = 0;

template<typename ResponseType>
response_body decode_as(kafka::input_stream& is) {
    ResponseType body;
    body.deserialize(is, RESPONSE_VERSION);
    return body;
}

std::optional<response_body> decode_known_body(api_key key, kafka::input_stream& is) {
    switch (key) {
    case api_key::PRODUCE: return decode_as<produce_response>(is);
    case api_key::FETCH: return decode_as<fetch_response>(is);
    case api_key::OFFSET: return decode_as<offset_response>(is);
    case api_key::METADATA: return decode_as<metadata_response>(is);
    case api_key::OFFSET_COMMIT: return decode_as<offset_commit_response>(is);
    case api_key::OFFSET_FETCH: return decode_as<offset_fetch_response>(is);
    case api_key::CONSUMER_METADATA: return decode_as<consumer_metadata_response>(is);
    case api_key::LEADER_AND_ISR:
    case api_key::STOP_REPLICA:
    case api_key::UPDATE_METADATA:
    case api_key::CONTROLLED_SHUTDOWN:
        break;
    }
    return std::nullopt;
}

}

std::optional<response_body> decode_response_body(api_key key, kafka::input_stream& is) {
    auto body = decode_known_body(key, is);
    if (body && !is.eof()) {
        throw parsing_exception(fmt::format("{} response has {} trailing bytes",
                api_key_name(key), is.remaining()));
    }
    return body;
}

decode_result response_decoder::decode(temporary_buffer<char> frame) {
    try {
        kafka::input_stream is(frame.get(), frame.size());
        response_header header;
        header.deserialize(is, RESPONSE_VERSION);
        auto correlation_id = *header._correlation_id;

        auto key = _correlator.try_resolve(correlation_id);
        if (!key) {
            kwlog.trace("No request registered for correlation id {}", correlation_id);
            return not_handled{std::move(frame), not_handled_reason::unknown_correlation_id};
        }

        auto body = decode_response_body(*key, is);
        if (!body) {
            kwlog.trace("No decoder for {} response, correlation id {}", api_key_name(*key), correlation_id);
            return not_handled{std::move(frame), not_handled_reason::no_response_body};
        }
        kwlog.trace("Decoded {} response, correlation id {}", api_key_name(*key), correlation_id);
        return emit_response{response{correlation_id, std::move(*body)}};
    } catch (const parsing_exception&) {
        return decode_failure{std::current_exception()};
    }
}

}
