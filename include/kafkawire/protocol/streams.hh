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

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace kafkawire {

// Raised whenever a frame does not match the declared wire layout:
// too few bytes for a declared length, negative lengths and such.
struct parsing_exception : public std::runtime_error {
public:
    explicit parsing_exception(const std::string& message) : runtime_error(message) {}
};

namespace kafka {

// Read cursor over a frame which is owned by someone else.
// Every read is checked against the end of the frame.
class input_stream {
private:
    const char* _data;
    int32_t _length;
    int32_t _current_position = 0;

public:
    input_stream(const char* data, int32_t length) noexcept
        : _data(data)
        , _length(length)
    {}

    inline void read(char* destination, int32_t length) {
        if (length < 0 || length > remaining()) {
            throw parsing_exception("Attempted to read more than the remaining length of the input stream.");
        }
        std::copy(_data + _current_position, _data + _current_position + length, destination);
        _current_position += length;
    }

    inline void skip(int32_t length) {
        if (length < 0 || length > remaining()) {
            throw parsing_exception("Attempted to skip past the end of the input stream.");
        }
        _current_position += length;
    }

    inline int32_t get_position() const noexcept {
        return _current_position;
    }

    inline void set_position(int32_t new_position) {
        if (new_position > _length || new_position < 0) {
            throw parsing_exception("Attempted to set input stream's position outside its data.");
        }
        _current_position = new_position;
    }

    inline int32_t remaining() const noexcept {
        return _length - _current_position;
    }

    inline bool eof() const noexcept {
        return _current_position == _length;
    }

    int32_t size() const noexcept {
        return _length;
    }

    inline const char* begin() const noexcept {
        return _data;
    }
};

// Growable write buffer. Frames are assembled here and then handed to
// the transport in one piece.
class output_stream {
private:
    std::vector<char> _data;

public:
    output_stream() = default;

    inline void write(const char* source, int32_t length) {
        _data.insert(_data.end(), source, source + length);
    }

    inline const char* begin() const noexcept {
        return _data.data();
    }

    int32_t size() const noexcept {
        return static_cast<int32_t>(_data.size());
    }
};

} // namespace kafka

} // namespace kafkawire
