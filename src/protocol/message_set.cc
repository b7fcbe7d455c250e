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

#include <kafkawire/protocol/message_set.hh>

using namespace seastar;

namespace kafkawire {

void message_set_entry::serialize(kafka::output_stream& os, int16_t api_version) const {
    _offset.serialize(os, api_version);
    _message.serialize(os, api_version);
}

void message_set_entry::deserialize(kafka::input_stream& is, int16_t api_version) {
    _offset.deserialize(is, api_version);
    _message.deserialize(is, api_version);
}

void message_set::serialize(kafka::output_stream& os, int16_t api_version) const {
    int32_t total_size = 0;
    for (const auto& entry : _entries) {
        total_size += entry.wire_size();
    }
    kafka_int32_t size(total_size);
    size.serialize(os, api_version);
    for (const auto& entry : _entries) {
        entry.serialize(os, api_version);
    }
}

void message_set::deserialize(kafka::input_stream& is, int16_t api_version) {
    kafka_int32_t size;
    size.deserialize(is, api_version);
    if (*size < 0) {
        throw parsing_exception(fmt::format("Message set has negative size {}", *size));
    }
    if (*size > is.remaining()) {
        throw parsing_exception(fmt::format("Message set of {} bytes exceeds the remaining {} bytes",
                *size, is.remaining()));
    }

    kafka::input_stream set_stream(is.begin() + is.get_position(), *size);
    std::vector<message_set_entry> entries;
    while (set_stream.remaining() >= ENTRY_OVERHEAD) {
        auto entry_start = set_stream.get_position();
        kafka_int64_t offset;
        kafka_int32_t message_size;
        offset.deserialize(set_stream, api_version);
        message_size.deserialize(set_stream, api_version);
        if (*message_size < 0) {
            throw parsing_exception(fmt::format("Message at offset {} has negative size {}",
                    *offset, *message_size));
        }
        if (*message_size > set_stream.remaining()) {
            break;
        }
        set_stream.set_position(entry_start);
        message_set_entry entry;
        entry.deserialize(set_stream, api_version);
        entries.push_back(std::move(entry));
    }
    is.skip(*size);
    _entries.swap(entries);
}

}
