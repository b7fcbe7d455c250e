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

#include <seastar/core/sstring.hh>
#include <seastar/util/bool_class.hh>

namespace kafkawire {

struct streaming_fetch_tag {};
using streaming_fetch = seastar::bool_class<streaming_fetch_tag>;

class connection_properties final {

public:

    // Sent in the header of every request.
    seastar::sstring client_id {};
    // number of ms after which a connect, read or write is considered to have timed out, 0 waits forever.
    // Waiting for a response is a read, so a non-zero value has to exceed the max_wait_ms of every Fetch
    // sent over the connection.
    uint32_t request_timeout = 0;
    // Deliver Fetch responses as stream_fetch_response, while their body is still being read,
    // instead of fetch_response once the whole frame arrived.
    streaming_fetch streaming = streaming_fetch::no;
    // Responses declaring a larger size are treated as a corrupted stream.
    int32_t max_frame_size = 100 * 1024 * 1024;

};

}
