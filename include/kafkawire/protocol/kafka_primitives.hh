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

#include <cstdint>
#include <array>
#include <cstring>
#include <vector>
#include <stdexcept>

#include <seastar/core/sstring.hh>
#include <seastar/net/byteorder.hh>

#include <kafkawire/protocol/streams.hh>
#include <kafkawire/protocol/kafka_error_code.hh>

using namespace seastar;

namespace kafkawire {

template<typename NumberType>
class kafka_number_t {
private:
    NumberType _value;
    static constexpr auto NUMBER_SIZE = sizeof(NumberType);

public:
    kafka_number_t() noexcept : kafka_number_t(0) {}

    explicit kafka_number_t(NumberType value) noexcept : _value(value) {}

    [[nodiscard]] const NumberType& operator*() const noexcept { return _value; }

    [[nodiscard]] NumberType& operator*() noexcept { return _value; }

    kafka_number_t& operator=(NumberType value) noexcept {
        _value = value;
        return *this;
    }

    void serialize(kafka::output_stream& os, int16_t api_version) const {
        std::array<char, NUMBER_SIZE> buffer{};
        auto value = net::hton(_value);
        auto value_pointer = reinterpret_cast<const char*>(&value);
        std::copy(value_pointer, value_pointer + NUMBER_SIZE, buffer.begin());

        os.write(buffer.data(), NUMBER_SIZE);
    }

    void deserialize(kafka::input_stream& is, int16_t api_version) {
        if (is.remaining() < static_cast<int32_t>(NUMBER_SIZE)) {
            throw parsing_exception("Stream ended prematurely when reading number");
        }
        std::array<char, NUMBER_SIZE> buffer{};
        is.read(buffer.data(), NUMBER_SIZE);
        NumberType value;
        std::memcpy(&value, buffer.data(), NUMBER_SIZE);
        _value = net::ntoh(value);
    }
};

using kafka_int16_t = kafka_number_t<int16_t>;
using kafka_int32_t = kafka_number_t<int32_t>;
using kafka_int64_t = kafka_number_t<int64_t>;

// Error codes travel inline in every result record. Codes which are not
// in the known table are kept verbatim rather than rejected.
class kafka_error_code_t {
private:
    int16_t _value;

public:
    kafka_error_code_t() noexcept : _value(0) {}
    kafka_error_code_t(const error::kafka_error_code& error) noexcept : _value(error._error_code) {}
    explicit kafka_error_code_t(int16_t value) noexcept : _value(value) {}

    [[nodiscard]] int16_t code() const noexcept { return _value; }

    [[nodiscard]] const error::kafka_error_code* known() const noexcept {
        return error::kafka_error_code::find_error(_value);
    }

    [[nodiscard]] bool is_retriable() const noexcept {
        auto error = known();
        return error && bool(error->_is_retriable);
    }

    [[nodiscard]] seastar::sstring message() const;

    kafka_error_code_t& operator=(const error::kafka_error_code& error) noexcept {
        _value = error._error_code;
        return *this;
    }

    void serialize(kafka::output_stream& os, int16_t api_version) const {
        kafka_number_t<int16_t>(_value).serialize(os, api_version);
    }

    void deserialize(kafka::input_stream& is, int16_t api_version) {
        kafka_number_t<int16_t> value;
        value.deserialize(is, api_version);
        _value = *value;
    }

    bool operator==(const error::kafka_error_code& other) const noexcept {
        return other._error_code == this->_value;
    }

    bool operator!=(const error::kafka_error_code& other) const noexcept {
        return ! (*this == other);
    }

    bool operator==(const kafka_error_code_t& other) const noexcept {
        return other._value == this->_value;
    }
};

template<typename SizeType>
class kafka_buffer_t {
private:
    seastar::sstring _value;
public:
    kafka_buffer_t() noexcept = default;

    explicit kafka_buffer_t(seastar::sstring value) : _value(std::move(value)) {}

    [[nodiscard]] const seastar::sstring& operator*() const noexcept { return _value; }

    [[nodiscard]] seastar::sstring& operator*() noexcept { return _value; }

    [[nodiscard]] const seastar::sstring* operator->() const noexcept { return &_value; }

    [[nodiscard]] seastar::sstring* operator->() noexcept { return &_value; }

    kafka_buffer_t& operator=(const seastar::sstring& value) {
        _value = value;
        return *this;
    }

    kafka_buffer_t& operator=(seastar::sstring&& value) noexcept {
        _value = std::move(value);
        return *this;
    }

    void serialize(kafka::output_stream& os, int16_t api_version) const {
        SizeType length(_value.size());
        length.serialize(os, api_version);

        os.write(_value.data(), _value.size());
    }

    void deserialize(kafka::input_stream& is, int16_t api_version) {
        SizeType length;
        length.deserialize(is, api_version);
        if (*length < 0) {
            throw parsing_exception("Length of buffer is negative");
        }
        if (*length > is.remaining()) {
            throw parsing_exception("Stream ended prematurely when reading buffer");
        }

        seastar::sstring value(seastar::sstring::initialized_later(), *length);
        is.read(value.data(), *length);
        _value.swap(value);
    }
};

template<typename SizeType>
class kafka_nullable_buffer_t {
private:
    seastar::sstring _value;
    bool _is_null;
public:
    kafka_nullable_buffer_t() noexcept : _is_null(true) {}

    explicit kafka_nullable_buffer_t(seastar::sstring value) : _value(std::move(value)), _is_null(false) {}

    [[nodiscard]] bool is_null() const noexcept { return _is_null; }

    void set_null() noexcept {
        _value.reset();
        _is_null = true;
    }

    [[nodiscard]] const seastar::sstring& operator*() const {
        if (_is_null) {
            throw std::domain_error("Object is null.");
        }
        return _value;
    }

    [[nodiscard]] seastar::sstring& operator*() {
        if (_is_null) {
            throw std::domain_error("Object is null.");
        }
        return _value;
    }

    [[nodiscard]] const seastar::sstring* operator->() const {
        if (_is_null) {
            throw std::domain_error("Object is null.");
        }
        return &_value;
    }

    kafka_nullable_buffer_t& operator=(const seastar::sstring& value) {
        _value = value;
        _is_null = false;
        return *this;
    }

    kafka_nullable_buffer_t& operator=(seastar::sstring&& value) noexcept {
        _value = std::move(value);
        _is_null = false;
        return *this;
    }

    void serialize(kafka::output_stream& os, int16_t api_version) const {
        if (_is_null) {
            SizeType null_indicator(-1);
            null_indicator.serialize(os, api_version);
        } else {
            SizeType length(_value.size());
            length.serialize(os, api_version);
            os.write(_value.data(), _value.size());
        }
    }

    void deserialize(kafka::input_stream& is, int16_t api_version) {
        SizeType length;
        length.deserialize(is, api_version);
        if (*length >= 0) {
            if (*length > is.remaining()) {
                throw parsing_exception("Stream ended prematurely when reading nullable buffer");
            }
            seastar::sstring value(seastar::sstring::initialized_later(), *length);
            is.read(value.data(), *length);
            _value.swap(value);
            _is_null = false;
        } else if (*length == -1) {
            set_null();
        } else {
            throw parsing_exception("Length of buffer is invalid");
        }
    }
};

using kafka_string_t = kafka_buffer_t<kafka_int16_t>;
using kafka_nullable_string_t = kafka_nullable_buffer_t<kafka_int16_t>;

using kafka_bytes_t = kafka_buffer_t<kafka_int32_t>;

// Protocol 0.8 arrays are never null, a zero count is an empty array.
template<typename ElementType, typename ElementCountType = kafka_int32_t>
class kafka_array_t {
private:
    std::vector<ElementType> _elems;
public:
    kafka_array_t() noexcept = default;

    explicit kafka_array_t(std::vector<ElementType> elems) noexcept
            : _elems(std::move(elems)) {}

    [[nodiscard]] ElementType& operator[](size_t i) { return _elems[i]; }

    [[nodiscard]] const ElementType& operator[](size_t i) const { return _elems[i]; }

    [[nodiscard]] const std::vector<ElementType>& operator*() const noexcept { return _elems; }

    [[nodiscard]] std::vector<ElementType>& operator*() noexcept { return _elems; }

    [[nodiscard]] const std::vector<ElementType>* operator->() const noexcept { return &_elems; }

    [[nodiscard]] std::vector<ElementType>* operator->() noexcept { return &_elems; }

    kafka_array_t& operator=(const std::vector<ElementType>& elems) {
        _elems = elems;
        return *this;
    }

    kafka_array_t& operator=(std::vector<ElementType>&& elems) noexcept {
        _elems = std::move(elems);
        return *this;
    }

    void serialize(kafka::output_stream& os, int16_t api_version) const {
        ElementCountType length(_elems.size());
        length.serialize(os, api_version);
        for (const auto& elem : _elems) {
            elem.serialize(os, api_version);
        }
    }

    void deserialize(kafka::input_stream& is, int16_t api_version) {
        ElementCountType length;
        length.deserialize(is, api_version);
        if (*length < 0) {
            throw parsing_exception("Length of array is invalid");
        }
        // Every element takes at least one byte, a larger count can only
        // come from a corrupted frame.
        if (*length > is.remaining()) {
            throw parsing_exception("Stream ended prematurely when reading array");
        }
        std::vector<ElementType> elems(*length);
        for (auto& elem : elems) {
            elem.deserialize(is, api_version);
        }
        _elems.swap(elems);
    }
};

}
