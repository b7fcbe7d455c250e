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

#define SEASTAR_TESTING_MAIN
#include <seastar/testing/thread_test_case.hh>

#include <kafkawire/codec/request_correlator.hh>

using namespace seastar;
namespace kw = kafkawire;

SEASTAR_THREAD_TEST_CASE(request_correlator_resolve_test) {
    kw::request_correlator correlator;
    correlator.register_request(7, kw::api_key::FETCH);
    correlator.register_request(8, kw::api_key::METADATA);
    BOOST_REQUIRE_EQUAL(correlator.size(), 2);

    BOOST_REQUIRE(correlator.resolve(8) == kw::api_key::METADATA);
    BOOST_REQUIRE(!correlator.contains(8));
    BOOST_REQUIRE(correlator.contains(7));
    BOOST_REQUIRE(correlator.resolve(7) == kw::api_key::FETCH);
    BOOST_REQUIRE_EQUAL(correlator.size(), 0);
}

SEASTAR_THREAD_TEST_CASE(request_correlator_unknown_id_test) {
    kw::request_correlator correlator;
    BOOST_REQUIRE_THROW(correlator.resolve(1), kw::unknown_correlation_id_exception);
    BOOST_REQUIRE(!correlator.try_resolve(1));

    correlator.register_request(1, kw::api_key::PRODUCE);
    correlator.resolve(1);
    // An id is consumed by its first response.
    BOOST_REQUIRE_THROW(correlator.resolve(1), kw::unknown_correlation_id_exception);
}

SEASTAR_THREAD_TEST_CASE(request_correlator_duplicate_id_test) {
    kw::request_correlator correlator;
    correlator.register_request(3, kw::api_key::OFFSET);
    BOOST_REQUIRE_THROW(correlator.register_request(3, kw::api_key::METADATA),
            kw::duplicate_correlation_id_exception);
    BOOST_REQUIRE(correlator.resolve(3) == kw::api_key::OFFSET);

    // Reusable once resolved.
    correlator.register_request(3, kw::api_key::METADATA);
    BOOST_REQUIRE(correlator.resolve(3) == kw::api_key::METADATA);
}

SEASTAR_THREAD_TEST_CASE(request_correlator_clear_test) {
    kw::request_correlator correlator;
    correlator.register_request(1, kw::api_key::OFFSET_COMMIT);
    correlator.register_request(2, kw::api_key::OFFSET_FETCH);
    correlator.clear();
    BOOST_REQUIRE_EQUAL(correlator.size(), 0);
    BOOST_REQUIRE(!correlator.try_resolve(2));
}
