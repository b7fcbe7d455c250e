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

#include <kafkawire/codec/request_codec.hh>
#include <kafkawire/protocol/headers.hh>
#include <kafkawire/utils/logger.hh>

using namespace seastar;

namespace kafkawire {

namespace {

constexpr int16_t HEADER_VERSION = 0;

template<typename RequestType>
request_body decode_as(kafka::input_stream& is, int16_t api_version) {
    RequestType body;
    body.deserialize(is, api_version);
    return body;
}

std::optional<request_body> decode_body(api_key key, kafka::input_stream& is, int16_t api_version) {
    switch (key) {
    case api_key::PRODUCE: return decode_as<produce_request>(is, api_version);
    case api_key::FETCH: return decode_as<fetch_request>(is, api_version);
    case api_key::OFFSET: return decode_as<offset_request>(is, api_version);
    case api_key::METADATA: return decode_as<metadata_request>(is, api_version);
    case api_key::OFFSET_COMMIT: return decode_as<offset_commit_request>(is, api_version);
    case api_key::OFFSET_FETCH: return decode_as<offset_fetch_request>(is, api_version);
    case api_key::CONSUMER_METADATA: return decode_as<consumer_metadata_request>(is, api_version);
    default:
        return std::nullopt;
    }
}

}

kafka::output_stream encode_request(const request& req) {
    kafka::output_stream os;
    request_header header;
    header._api_key = req.key();
    header._api_version = req.api_version();
    header._correlation_id = req._correlation_id;
    header._client_id = req._client_id;
    header.serialize(os, HEADER_VERSION);
    std::visit([&os, &req] (const auto& body) { body.serialize(os, req.api_version()); }, req._body);
    return os;
}

std::optional<request> decode_request(const temporary_buffer<char>& frame) {
    kafka::input_stream is(frame.get(), frame.size());
    request_header header;
    header.deserialize(is, HEADER_VERSION);

    if (*header._api_version != 0) {
        kwlog.trace("Unsupported version in {}", header.describe());
        return std::nullopt;
    }
    auto body = decode_body(header._api_key, is, *header._api_version);
    if (!body) {
        kwlog.trace("No decoder for {}", header.describe());
        return std::nullopt;
    }
    if (!is.eof()) {
        throw parsing_exception(fmt::format("{} has {} trailing bytes", header.describe(), is.remaining()));
    }
    request req;
    req._correlation_id = *header._correlation_id;
    req._client_id = header._client_id;
    req._body = std::move(*body);
    return req;
}

}
