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

#include <seastar/core/future.hh>
#include <seastar/util/noncopyable_function.hh>

#include <kafkawire/codec/request_correlator.hh>
#include <kafkawire/codec/stream_events.hh>
#include <kafkawire/connection/transport.hh>

using namespace seastar;

namespace kafkawire {

// Cuts one response off the transport into stream_events. Fetch bodies
// are read one message at a time and the consumer's future has to
// resolve before the next read, so a slow consumer holds back the
// socket instead of the whole body piling up in memory.
class response_splitter {
public:
    using event_consumer = noncopyable_function<future<>(stream_event)>;

private:
    wire_transport& _transport;
    request_correlator& _correlator;
    int32_t _max_frame_size;

public:
    response_splitter(wire_transport& transport, request_correlator& correlator, int32_t max_frame_size) noexcept
        : _transport(transport)
        , _correlator(correlator)
        , _max_frame_size(max_frame_size) {}

    // Reads exactly one frame. Resolves the correlation id, an unknown id
    // fails the future with unknown_correlation_id_exception.
    future<> read_response(event_consumer consumer);
};

}
