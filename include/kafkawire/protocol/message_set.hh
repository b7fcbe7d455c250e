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

#include <vector>

#include <kafkawire/protocol/kafka_primitives.hh>

using namespace seastar;

namespace kafkawire {

// One (offset, message) pair. The message bytes are carried opaquely,
// compression and CRC checks belong to the layer above.
class message_set_entry {
public:
    kafka_int64_t _offset;
    kafka_bytes_t _message;

    // Bytes this entry occupies on the wire.
    [[nodiscard]] int32_t wire_size() const noexcept {
        return 8 + 4 + static_cast<int32_t>(_message->size());
    }

    void serialize(kafka::output_stream& os, int16_t api_version) const;

    void deserialize(kafka::input_stream& is, int16_t api_version);
};

// Size-prefixed sequence of entries. Brokers are allowed to cut the last
// entry short when it does not fit max_bytes, such a partial entry is
// dropped on read.
class message_set {
public:
    std::vector<message_set_entry> _entries;

    static constexpr int32_t ENTRY_OVERHEAD = 8 + 4;

    void serialize(kafka::output_stream& os, int16_t api_version) const;

    void deserialize(kafka::input_stream& is, int16_t api_version);
};

}
