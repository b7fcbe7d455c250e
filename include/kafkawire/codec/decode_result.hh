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

#include <exception>
#include <variant>

#include <seastar/core/temporary_buffer.hh>

#include <kafkawire/protocol/response.hh>

using namespace seastar;

namespace kafkawire {

enum class not_handled_reason {
    // Nothing registered under the frame's correlation id.
    unknown_correlation_id,
    // The API is known but has no response body decoder.
    no_response_body,
};

class emit_response {
public:
    response _response;
};

// The input advanced a stream and produced no response of its own.
class consumed {};

// Passed through untouched, the caller decides what to do with it.
class not_handled {
public:
    temporary_buffer<char> _frame;
    not_handled_reason _reason;
};

class decode_failure {
public:
    std::exception_ptr _error;
};

using decode_result = std::variant<emit_response, consumed, not_handled, decode_failure>;

}
