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

#include <kafkawire/protocol/api_key.hh>

namespace kafkawire {

const char* api_key_name(api_key key) noexcept {
    switch (key) {
    case api_key::PRODUCE: return "Produce";
    case api_key::FETCH: return "Fetch";
    case api_key::OFFSET: return "Offset";
    case api_key::METADATA: return "Metadata";
    case api_key::LEADER_AND_ISR: return "LeaderAndIsr";
    case api_key::STOP_REPLICA: return "StopReplica";
    case api_key::UPDATE_METADATA: return "UpdateMetadata";
    case api_key::CONTROLLED_SHUTDOWN: return "ControlledShutdown";
    case api_key::OFFSET_COMMIT: return "OffsetCommit";
    case api_key::OFFSET_FETCH: return "OffsetFetch";
    case api_key::CONSUMER_METADATA: return "ConsumerMetadata";
    }
    return "Unknown";
}

}
