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

#include <kafkawire/protocol/fetch_request.hh>

using namespace seastar;

namespace kafkawire {

void fetch_request_partition::serialize(kafka::output_stream& os, int16_t api_version) const {
    _partition_index.serialize(os, api_version);
    _fetch_offset.serialize(os, api_version);
    _max_bytes.serialize(os, api_version);
}

void fetch_request_partition::deserialize(kafka::input_stream& is, int16_t api_version) {
    _partition_index.deserialize(is, api_version);
    _fetch_offset.deserialize(is, api_version);
    _max_bytes.deserialize(is, api_version);
}

void fetch_request_topic::serialize(kafka::output_stream& os, int16_t api_version) const {
    _name.serialize(os, api_version);
    _partitions.serialize(os, api_version);
}

void fetch_request_topic::deserialize(kafka::input_stream& is, int16_t api_version) {
    _name.deserialize(is, api_version);
    _partitions.deserialize(is, api_version);
}

void fetch_request::serialize(kafka::output_stream& os, int16_t api_version) const {
    _replica_id.serialize(os, api_version);
    _max_wait_ms.serialize(os, api_version);
    _min_bytes.serialize(os, api_version);
    _topics.serialize(os, api_version);
}

void fetch_request::deserialize(kafka::input_stream& is, int16_t api_version) {
    _replica_id.deserialize(is, api_version);
    _max_wait_ms.deserialize(is, api_version);
    _min_bytes.deserialize(is, api_version);
    _topics.deserialize(is, api_version);
}

}
