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

#include <algorithm>

#include <fmt/format.h>

#include <kafkawire/codec/framing.hh>
#include <kafkawire/protocol/kafka_primitives.hh>

using namespace seastar;

namespace kafkawire {

temporary_buffer<char> make_frame(const kafka::output_stream& payload) {
    kafka::output_stream size_stream;
    kafka_int32_t size(payload.size());
    size.serialize(size_stream, 0);

    temporary_buffer<char> frame(FRAME_SIZE_BYTES + payload.size());
    std::copy_n(size_stream.begin(), FRAME_SIZE_BYTES, frame.get_write());
    std::copy_n(payload.begin(), payload.size(), frame.get_write() + FRAME_SIZE_BYTES);
    return frame;
}

int32_t parse_frame_size(const temporary_buffer<char>& prefix, int32_t max_frame_size) {
    kafka::input_stream is(prefix.get(), prefix.size());
    kafka_int32_t size;
    size.deserialize(is, 0);
    if (*size < 0) {
        throw parsing_exception(fmt::format("Negative frame size {}", *size));
    }
    if (*size > max_frame_size) {
        throw parsing_exception(fmt::format("Frame of {} bytes exceeds the limit of {} bytes",
                *size, max_frame_size));
    }
    return *size;
}

}
