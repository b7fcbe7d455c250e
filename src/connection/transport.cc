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

#include <kafkawire/codec/framing.hh>
#include <kafkawire/connection/transport.hh>
#include <kafkawire/utils/logger.hh>

using namespace seastar;

namespace kafkawire {

future<std::optional<temporary_buffer<char>>> read_frame(wire_transport& transport, int32_t max_frame_size) {
    using frame_type = std::optional<temporary_buffer<char>>;
    return transport.read(FRAME_SIZE_BYTES).then([&transport, max_frame_size] (temporary_buffer<char> prefix) {
        if (prefix.empty()) {
            return make_ready_future<frame_type>();
        }
        auto size = parse_frame_size(prefix, max_frame_size);
        if (size == 0) {
            return make_ready_future<frame_type>(temporary_buffer<char>());
        }
        return transport.read(size).then([size] (temporary_buffer<char> frame) {
            if (frame.empty()) {
                throw connection_closed_exception(fmt::format(
                        "Connection closed before a frame of {} bytes arrived", size));
            }
            kwlog.trace("Read frame of {} bytes", size);
            return frame_type(std::move(frame));
        });
    });
}

future<> write_frame(wire_transport& transport, const kafka::output_stream& payload) {
    kwlog.trace("Writing frame of {} bytes", payload.size());
    return transport.write(make_frame(payload));
}

}
