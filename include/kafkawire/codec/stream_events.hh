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

#include <seastar/core/temporary_buffer.hh>

#include <kafkawire/protocol/api_key.hh>
#include <kafkawire/protocol/stream_fetch_response.hh>

using namespace seastar;

namespace kafkawire {

// A complete response body of a non streamed API, positioned right after
// the correlation id.
class buffer_response_frame {
public:
    api_key _api_key;
    int32_t _correlation_id;
    temporary_buffer<char> _frame;
};

class fetch_response_begin {
public:
    int32_t _correlation_id;
};

class fetch_response_end {
public:
    int32_t _correlation_id;
};

// What the framing layer hands to stream_response_decoder, in wire order.
// A Fetch response shows up as begin, then partition_status and
// fetched_message in the order they appear in the frame, then end.
using stream_event = std::variant<
    buffer_response_frame,
    fetch_response_begin,
    partition_status,
    fetched_message,
    fetch_response_end>;

}
