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
#include <stdexcept>
#include <string>

#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>

#include <kafkawire/codec/decode_result.hh>
#include <kafkawire/codec/stream_events.hh>

using namespace seastar;

namespace kafkawire {

// An event arrived which is impossible in the decoder's current state.
struct stream_desync_exception : public std::runtime_error {
public:
    explicit stream_desync_exception(const std::string& message) : runtime_error(message) {}
};

// Turns stream_events into responses. At most one Fetch response is open
// at a time. The future returned for an item event resolves only once
// the consumer made room for it.
class stream_response_decoder {
private:
    struct open_stream {
        int32_t _correlation_id;
        lw_shared_ptr<stream_channel<partition_status>> _partitions;
        lw_shared_ptr<stream_channel<fetched_message>> _messages;
        promise<> _complete;
    };

    std::optional<open_stream> _stream;

    decode_result decode_frame(buffer_response_frame frame);
    decode_result begin_stream(const fetch_response_begin& begin);
    future<decode_result> end_stream(const fetch_response_end& end);

public:
    future<decode_result> decode(stream_event event);

    [[nodiscard]] bool streaming() const noexcept {
        return bool(_stream);
    }

    // Fails the open stream, if any, and returns to idle.
    void abort(std::exception_ptr ex);
};

}
