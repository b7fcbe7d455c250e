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

#include <seastar/core/sstring.hh>

namespace kafkawire {

class server_properties final {

public:

    seastar::sstring host = "0.0.0.0";
    uint16_t port = 9092;
    // Requests declaring a larger size close the connection.
    int32_t max_frame_size = 100 * 1024 * 1024;
    // number of ms after which a read or write is considered to have timed out, 0 waits forever.
    // Waiting for the next request counts as a read.
    uint32_t io_timeout = 0;

};

}
