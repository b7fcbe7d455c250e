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

#include <optional>
#include <stdexcept>

#include <seastar/core/future.hh>
#include <seastar/core/loop.hh>
#include <seastar/core/queue.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>

#include <kafkawire/protocol/kafka_primitives.hh>

using namespace seastar;

namespace kafkawire {

// Reported by a partition record of a streamed Fetch response, before
// the messages of that partition.
class partition_status {
public:
    seastar::sstring _topic;
    int32_t _partition_index = 0;
    kafka_error_code_t _error_code;
    int64_t _high_watermark = 0;
};

class fetched_message {
public:
    seastar::sstring _topic;
    int32_t _partition_index = 0;
    int64_t _offset = 0;
    seastar::sstring _payload;
};

struct stream_abandoned_exception : public std::runtime_error {
public:
    stream_abandoned_exception() : runtime_error("Stream consumer went away") {}
};

// Single slot hand-off between the connection's read fiber and the
// consumer. A full slot suspends the producer, which is what throttles
// reading from the socket. Once the consumer drops its end, items are
// discarded so the rest of the frame can still be read off the wire.
template<typename T>
class stream_channel {
private:
    seastar::queue<std::optional<T>> _queue;
    bool _abandoned = false;
    bool _closed = false;
    bool _failed = false;
    // The consumer took the end marker.
    bool _finished = false;

public:
    stream_channel() : _queue(1) {}

    future<> push(T item) {
        if (_abandoned || _closed) {
            return make_ready_future<>();
        }
        return _queue.push_eventually(std::optional<T>(std::move(item)))
            .handle_exception_type([] (const stream_abandoned_exception&) {});
    }

    // Pushes the end marker. Resolves once the consumer took it or left.
    future<> close() {
        if (_abandoned || _closed) {
            return make_ready_future<>();
        }
        _closed = true;
        return _queue.push_eventually(std::optional<T>())
            .handle_exception_type([] (const stream_abandoned_exception&) {});
    }

    future<std::optional<T>> pop() {
        if (_finished) {
            return make_ready_future<std::optional<T>>();
        }
        return _queue.pop_eventually().then([this] (std::optional<T> item) {
            if (!item) {
                _finished = true;
            }
            return item;
        });
    }

    void abandon() {
        if (!_abandoned && !_finished) {
            _abandoned = true;
            _queue.abort(std::make_exception_ptr(stream_abandoned_exception()));
        }
    }

    // Fails the consumer side, used when the connection dies mid-stream.
    // A pending push or close fails with ex as well.
    void fail(std::exception_ptr ex) {
        if (!_abandoned && !_finished && !_failed) {
            _closed = true;
            _failed = true;
            _queue.abort(std::move(ex));
        }
    }
};

// Consumer end of a stream_channel. Destroying it before the end marker
// was read abandons the channel.
template<typename T>
class fetch_stream {
private:
    lw_shared_ptr<stream_channel<T>> _channel;

public:
    fetch_stream() = default;

    explicit fetch_stream(lw_shared_ptr<stream_channel<T>> channel) noexcept
        : _channel(std::move(channel)) {}

    fetch_stream(fetch_stream&&) noexcept = default;
    fetch_stream& operator=(fetch_stream&& other) noexcept {
        if (this != &other) {
            release();
            _channel = std::move(other._channel);
        }
        return *this;
    }

    fetch_stream(const fetch_stream&) = delete;
    fetch_stream& operator=(const fetch_stream&) = delete;

    ~fetch_stream() {
        release();
    }

    // Next item, or an empty optional once the stream ended.
    future<std::optional<T>> next() {
        if (!_channel) {
            return make_ready_future<std::optional<T>>();
        }
        return _channel->pop().finally([channel = _channel] {});
    }

    // Feeds every remaining item to func.
    template<typename Func>
    future<> consume(Func func) {
        if (!_channel) {
            return make_ready_future<>();
        }
        return repeat([channel = _channel, func = std::move(func)] () mutable {
            return channel->pop().then([&func] (std::optional<T> item) {
                if (!item) {
                    return stop_iteration::yes;
                }
                func(std::move(*item));
                return stop_iteration::no;
            });
        });
    }

    void release() noexcept {
        if (_channel) {
            _channel->abandon();
            _channel = nullptr;
        }
    }
};

// Fetch response delivered while it is still being read. Partition
// records and messages arrive on separate streams which have to be
// drained concurrently, a consumer reading only one of them stalls the
// connection once the other one's slot is taken.
class stream_fetch_response {
public:
    fetch_stream<partition_status> _partitions;
    fetch_stream<fetched_message> _messages;
    // Resolves after the last item of the response was handed over.
    shared_future<> _complete;
};

}
