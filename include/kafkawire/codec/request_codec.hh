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

#include <kafkawire/protocol/request.hh>
#include <kafkawire/protocol/streams.hh>

using namespace seastar;

namespace kafkawire {

// Header and body, without the size prefix.
kafka::output_stream encode_request(const request& req);

// Returns an empty optional for API keys or versions without a request
// decoder, the frame can be skipped in that case. Throws
// parsing_exception if a supported request is malformed.
std::optional<request> decode_request(const temporary_buffer<char>& frame);

}
