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

#include <kafkawire/codec/response_encoder.hh>
#include <kafkawire/protocol/headers.hh>
#include <kafkawire/utils/logger.hh>

using namespace seastar;

namespace kafkawire {

namespace {

constexpr int16_t RESPONSE_VERSION = 0;

class body_encoder {
private:
    kafka::output_stream& _os;

public:
    explicit body_encoder(kafka::output_stream& os) noexcept : _os(os) {}

    void operator()(const nil_response&) const {
        throw unsupported_encoding_exception("A nil response has no wire representation");
    }

    void operator()(const stream_fetch_response&) const {
        throw unsupported_encoding_exception("A streamed fetch response cannot be encoded");
    }

    template<typename ResponseType>
    void operator()(const ResponseType& body) const {
        body.serialize(_os, RESPONSE_VERSION);
    }
};

}

kafka::output_stream encode_response(const response& resp) {
    kafka::output_stream os;
    response_header header;
    header._correlation_id = resp._correlation_id;
    header.serialize(os, RESPONSE_VERSION);
    std::visit(body_encoder(os), resp._body);
    kwlog.trace("Encoded response of {} bytes, correlation id {}", os.size(), resp._correlation_id);
    return os;
}

}
