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

#include <kafkawire/codec/request_correlator.hh>

namespace kafkawire {

unknown_correlation_id_exception::unknown_correlation_id_exception(int32_t correlation_id)
    : runtime_error(fmt::format("No request is waiting for correlation id {}", correlation_id))
    , _correlation_id(correlation_id) {}

duplicate_correlation_id_exception::duplicate_correlation_id_exception(int32_t correlation_id)
    : logic_error(fmt::format("Correlation id {} is already in flight", correlation_id)) {}

void request_correlator::register_request(int32_t correlation_id, api_key key) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto inserted = _pending.emplace(correlation_id, key).second;
    if (!inserted) {
        throw duplicate_correlation_id_exception(correlation_id);
    }
}

api_key request_correlator::resolve(int32_t correlation_id) {
    auto key = try_resolve(correlation_id);
    if (!key) {
        throw unknown_correlation_id_exception(correlation_id);
    }
    return *key;
}

std::optional<api_key> request_correlator::try_resolve(int32_t correlation_id) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _pending.find(correlation_id);
    if (it == _pending.end()) {
        return std::nullopt;
    }
    auto key = it->second;
    _pending.erase(it);
    return key;
}

bool request_correlator::contains(int32_t correlation_id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pending.count(correlation_id) > 0;
}

size_t request_correlator::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pending.size();
}

void request_correlator::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _pending.clear();
}

}
