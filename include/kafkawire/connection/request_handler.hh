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

#include <seastar/core/future.hh>

#include <kafkawire/protocol/request.hh>
#include <kafkawire/protocol/response.hh>

using namespace seastar;

namespace kafkawire {

// Application side of a server connection, one instance per connection.
// Requests are handed over one at a time. Returning nil_response sends
// nothing back, which is what a Produce with acks 0 expects.
class request_handler {
public:
    virtual ~request_handler() = default;

    virtual future<response> handle(request req) = 0;

    // Called once after the connection closed.
    virtual future<> close() {
        return make_ready_future<>();
    }
};

}
