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

#include <string>

#include <seastar/core/future.hh>
#include <seastar/core/temporary_buffer.hh>

#include <kafkawire/connection/transport.hh>
#include <kafkawire/codec/framing.hh>
#include <kafkawire/protocol/streams.hh>

using namespace seastar;

// Transport over a scripted byte string. Reads past the end behave like
// the peer closing the connection, writes are collected.
class memory_transport final : public kafkawire::wire_transport {
    std::string _input;
    size_t _read_position = 0;
    std::string _written;
    bool _shut_down = false;
    bool _closed = false;

public:
    explicit memory_transport(std::string input = {}) : _input(std::move(input)) {}

    future<temporary_buffer<char>> read(size_t bytes_to_read) override {
        auto available = _shut_down ? 0 : _input.size() - _read_position;
        if (available == 0) {
            return make_ready_future<temporary_buffer<char>>();
        }
        if (available < bytes_to_read) {
            _read_position = _input.size();
            return make_exception_future<temporary_buffer<char>>(
                    kafkawire::connection_closed_exception("Input ended in the middle of a read"));
        }
        temporary_buffer<char> data(_input.data() + _read_position, bytes_to_read);
        _read_position += bytes_to_read;
        return make_ready_future<temporary_buffer<char>>(std::move(data));
    }

    future<> write(temporary_buffer<char> buff) override {
        _written.append(buff.get(), buff.size());
        return make_ready_future<>();
    }

    void shutdown() override {
        _shut_down = true;
    }

    future<> close() override {
        _closed = true;
        return make_ready_future<>();
    }

    const std::string& written() const noexcept {
        return _written;
    }

    size_t unread() const noexcept {
        return _input.size() - _read_position;
    }

    bool closed() const noexcept {
        return _closed;
    }
};

inline std::string to_string(const kafkawire::kafka::output_stream& os) {
    return std::string(os.begin(), os.size());
}

// Size prefix followed by the payload.
inline std::string framed(const kafkawire::kafka::output_stream& payload) {
    auto frame = kafkawire::make_frame(payload);
    return std::string(frame.get(), frame.size());
}
