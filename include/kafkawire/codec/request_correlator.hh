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

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <kafkawire/protocol/api_key.hh>

namespace kafkawire {

struct unknown_correlation_id_exception : public std::runtime_error {
private:
    int32_t _correlation_id;
public:
    explicit unknown_correlation_id_exception(int32_t correlation_id);

    [[nodiscard]] int32_t correlation_id() const noexcept { return _correlation_id; }
};

struct duplicate_correlation_id_exception : public std::logic_error {
public:
    explicit duplicate_correlation_id_exception(int32_t correlation_id);
};

// Remembers which API every in-flight request used, responses only carry
// the correlation id. Registration happens on the sending path and
// resolution on the reading path, hence the lock.
class request_correlator {
private:
    mutable std::mutex _mutex;
    std::unordered_map<int32_t, api_key> _pending;

public:
    void register_request(int32_t correlation_id, api_key key);

    // Removes the entry. Throws unknown_correlation_id_exception if there
    // is none.
    api_key resolve(int32_t correlation_id);

    std::optional<api_key> try_resolve(int32_t correlation_id);

    [[nodiscard]] bool contains(int32_t correlation_id) const;

    [[nodiscard]] size_t size() const;

    void clear();
};

}
