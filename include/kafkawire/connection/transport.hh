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
#include <seastar/core/temporary_buffer.hh>

#include <kafkawire/protocol/streams.hh>

using namespace seastar;

namespace kafkawire {

// The peer went away while a frame was expected or half read.
struct connection_closed_exception : public std::runtime_error {
public:
    explicit connection_closed_exception(const std::string& message) : runtime_error(message) {}
};

// Byte pipe under a Kafka connection. Implemented over TCP by
// tcp_connection, tests plug in memory backed ones.
class wire_transport {
public:
    virtual ~wire_transport() = default;

    // Exactly bytes_to_read bytes. An empty buffer means the peer closed
    // the connection before sending any of them, a close in the middle
    // fails the future.
    virtual future<temporary_buffer<char>> read(size_t bytes_to_read) = 0;

    virtual future<> write(temporary_buffer<char> buff) = 0;

    // Unblocks pending reads, they see the end of the stream.
    virtual void shutdown() = 0;

    virtual future<> close() = 0;
};

// Reads one size-prefixed frame and strips the prefix. Empty if the peer
// closed the connection cleanly between frames.
future<std::optional<temporary_buffer<char>>> read_frame(wire_transport& transport, int32_t max_frame_size);

future<> write_frame(wire_transport& transport, const kafka::output_stream& payload);

}
