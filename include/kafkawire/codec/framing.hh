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

#include <seastar/core/temporary_buffer.hh>

#include <kafkawire/protocol/streams.hh>

using namespace seastar;

namespace kafkawire {

static constexpr int32_t FRAME_SIZE_BYTES = 4;

// Prepends the big-endian size to an encoded message.
temporary_buffer<char> make_frame(const kafka::output_stream& payload);

// Validates and returns the size carried by a frame prefix.
int32_t parse_frame_size(const temporary_buffer<char>& prefix, int32_t max_frame_size);

}
