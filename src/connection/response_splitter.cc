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

#include <seastar/core/thread.hh>

#include <kafkawire/codec/framing.hh>
#include <kafkawire/connection/response_splitter.hh>
#include <kafkawire/protocol/message_set.hh>
#include <kafkawire/utils/logger.hh>

using namespace seastar;

namespace kafkawire {

namespace {

// Blocking reads within the declared frame size. Only usable from a
// seastar thread.
class frame_reader {
private:
    wire_transport& _transport;
    int32_t _remaining;

    temporary_buffer<char> read_exactly(int32_t length) {
        if (length > _remaining) {
            throw parsing_exception(fmt::format("Field of {} bytes exceeds the {} bytes left in the frame",
                    length, _remaining));
        }
        if (length == 0) {
            return temporary_buffer<char>();
        }
        auto data = _transport.read(length).get();
        if (data.empty()) {
            throw connection_closed_exception("Connection closed in the middle of a frame");
        }
        _remaining -= length;
        return data;
    }

    template<typename NumberType>
    NumberType read_number() {
        auto data = read_exactly(sizeof(NumberType));
        kafka::input_stream is(data.get(), data.size());
        kafka_number_t<NumberType> value;
        value.deserialize(is, 0);
        return *value;
    }

public:
    frame_reader(wire_transport& transport, int32_t size) noexcept
        : _transport(transport)
        , _remaining(size) {}

    int16_t read_int16() { return read_number<int16_t>(); }

    int32_t read_int32() { return read_number<int32_t>(); }

    int64_t read_int64() { return read_number<int64_t>(); }

    int32_t read_length(const char* what) {
        auto length = read_int32();
        if (length < 0 || length > _remaining) {
            throw parsing_exception(fmt::format("Invalid {} length {}", what, length));
        }
        return length;
    }

    seastar::sstring read_string() {
        auto length = read_int16();
        if (length < 0) {
            throw parsing_exception(fmt::format("Invalid string length {}", length));
        }
        return read_bytes(length);
    }

    seastar::sstring read_bytes(int32_t length) {
        auto data = read_exactly(length);
        return seastar::sstring(data.get(), data.size());
    }

    temporary_buffer<char> read_rest() {
        return read_exactly(_remaining);
    }

    void skip(int32_t length) {
        // Partial entries are small, reading them is simpler than a skip primitive.
        read_exactly(length);
    }

    [[nodiscard]] int32_t remaining() const noexcept {
        return _remaining;
    }
};

void read_fetch_body(frame_reader& reader, int32_t correlation_id, response_splitter::event_consumer& consumer) {
    consumer(fetch_response_begin{correlation_id}).get();

    auto topic_count = reader.read_length("topic array");
    for (int32_t t = 0; t < topic_count; t++) {
        auto topic = reader.read_string();
        auto partition_count = reader.read_length("partition array");
        for (int32_t p = 0; p < partition_count; p++) {
            partition_status status;
            status._topic = topic;
            status._partition_index = reader.read_int32();
            status._error_code = kafka_error_code_t(reader.read_int16());
            status._high_watermark = reader.read_int64();
            auto partition_index = status._partition_index;
            auto set_remaining = reader.read_length("message set");
            consumer(std::move(status)).get();

            while (set_remaining >= message_set::ENTRY_OVERHEAD) {
                auto offset = reader.read_int64();
                auto message_size = reader.read_int32();
                set_remaining -= message_set::ENTRY_OVERHEAD;
                if (message_size < 0) {
                    throw parsing_exception(fmt::format("Message at offset {} has negative size {}",
                            offset, message_size));
                }
                if (message_size > set_remaining) {
                    break;
                }
                auto payload = reader.read_bytes(message_size);
                set_remaining -= message_size;
                fetched_message message;
                message._topic = topic;
                message._partition_index = partition_index;
                message._offset = offset;
                message._payload = std::move(payload);
                consumer(std::move(message)).get();
            }
            if (set_remaining > 0) {
                kwlog.trace("Dropping {} bytes of a partial message in {}-{}", set_remaining, topic, partition_index);
                reader.skip(set_remaining);
            }
        }
    }
    if (reader.remaining() != 0) {
        throw parsing_exception(fmt::format("Fetch response has {} trailing bytes", reader.remaining()));
    }

    consumer(fetch_response_end{correlation_id}).get();
}

}

future<> response_splitter::read_response(event_consumer consumer) {
    return seastar::async([this, consumer = std::move(consumer)] () mutable {
        auto prefix = _transport.read(FRAME_SIZE_BYTES).get();
        if (prefix.empty()) {
            throw connection_closed_exception("Connection closed while waiting for a response");
        }
        frame_reader reader(_transport, parse_frame_size(prefix, _max_frame_size));
        auto correlation_id = reader.read_int32();
        auto key = _correlator.resolve(correlation_id);
        kwlog.trace("Reading {} response, correlation id {}", api_key_name(key), correlation_id);

        if (key == api_key::FETCH) {
            read_fetch_body(reader, correlation_id, consumer);
        } else {
            consumer(buffer_response_frame{key, correlation_id, reader.read_rest()}).get();
        }
    });
}

}
