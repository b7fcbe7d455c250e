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

#include <kafkawire/codec/framing.hh>
#include <kafkawire/codec/request_codec.hh>
#include <kafkawire/connection/kafka_connection.hh>
#include <kafkawire/connection/tcp_connection.hh>
#include <kafkawire/utils/logger.hh>

using namespace seastar;

namespace kafkawire {

future<std::unique_ptr<kafka_connection>> kafka_connection::connect(const seastar::sstring& host, uint16_t port,
        connection_properties properties) {
    auto timeout_ms = properties.request_timeout;
    return tcp_connection::connect(host, port, timeout_ms)
    .then([properties = std::move(properties)] (std::unique_ptr<tcp_connection> connection) mutable {
        return std::make_unique<kafka_connection>(std::move(connection), std::move(properties));
    });
}

kafka_connection::kafka_connection(std::unique_ptr<wire_transport> transport, connection_properties properties)
    : _transport(std::move(transport))
    , _properties(std::move(properties))
    , _decoder(_correlator)
    , _splitter(*_transport, _correlator, _properties.max_frame_size)
    , _correlation_id(0)
    , _send_semaphore(1)
    , _receive_semaphore(1)
    , _closing(false) {}

void kafka_connection::mark_broken(std::exception_ptr ex) {
    if (_broken) {
        return;
    }
    if (_closing) {
        kwlog.debug("Connection closed with {} requests in flight: {}", _correlator.size(), ex);
    } else {
        kwlog.error("Connection failed, {} requests in flight: {}", _correlator.size(), ex);
    }
    _broken = std::make_exception_ptr(connection_broken_exception(_closing
            ? "Connection is closed"
            : "Connection failed on an earlier request"));
    _correlator.clear();
    _stream_decoder.abort(ex);
    _transport->shutdown();
}

void kafka_connection::deliver(decode_result result, int32_t correlation_id, pending_response& pending) {
    if (auto emitted = std::get_if<emit_response>(&result)) {
        if (emitted->_response._correlation_id != correlation_id) {
            throw parsing_exception(fmt::format("Received correlation id {} while waiting for {}",
                    emitted->_response._correlation_id, correlation_id));
        }
        pending.set_value(std::move(emitted->_response));
    } else if (auto skipped = std::get_if<not_handled>(&result)) {
        if (skipped->_reason == not_handled_reason::unknown_correlation_id) {
            kafka::input_stream is(skipped->_frame.get(), skipped->_frame.size());
            kafka_int32_t received;
            received.deserialize(is, 0);
            throw unknown_correlation_id_exception(*received);
        }
        kwlog.warn("No decoder for the response to correlation id {}", correlation_id);
        pending.set_exception(std::make_exception_ptr(unsupported_response_exception(
                fmt::format("No decoder for the response to correlation id {}", correlation_id))));
    } else if (auto failure = std::get_if<decode_failure>(&result)) {
        std::rethrow_exception(failure->_error);
    }
}

future<> kafka_connection::receive_buffered(int32_t correlation_id, lw_shared_ptr<pending_response> pending) {
    return read_frame(*_transport, _properties.max_frame_size)
        .then([this, correlation_id, pending] (std::optional<temporary_buffer<char>> frame) {
            if (!frame) {
                throw connection_closed_exception("Broker closed the connection");
            }
            deliver(_decoder.decode(std::move(*frame)), correlation_id, *pending);
        });
}

future<> kafka_connection::receive_streamed(int32_t correlation_id, lw_shared_ptr<pending_response> pending) {
    return _splitter.read_response([this, correlation_id, pending] (stream_event event) {
        return _stream_decoder.decode(std::move(event)).then([this, correlation_id, pending] (decode_result result) {
            deliver(std::move(result), correlation_id, *pending);
        });
    });
}

future<> kafka_connection::receive_response(int32_t correlation_id, lw_shared_ptr<pending_response> pending) {
    if (_broken) {
        pending->set_exception(_broken);
        return make_ready_future<>();
    }
    auto f = _properties.streaming
            ? receive_streamed(correlation_id, pending)
            : receive_buffered(correlation_id, pending);
    return f.handle_exception([this, pending] (std::exception_ptr ex) {
        mark_broken(ex);
        if (!pending->_delivered) {
            pending->set_exception(std::move(ex));
        }
    });
}

future<response> kafka_connection::send(request req) {
    if (_broken) {
        return make_exception_future<response>(_broken);
    }
    if (_pending.is_closed()) {
        return make_exception_future<response>(connection_broken_exception("Connection is closed"));
    }

    auto correlation_id = req._correlation_id;
    auto key = req.key();
    auto frame = make_frame(encode_request(req));
    kwlog.trace("Sending {} request, correlation id {}", api_key_name(key), correlation_id);

    if (req.expects_response()) {
        try {
            _correlator.register_request(correlation_id, key);
        } catch (const duplicate_correlation_id_exception&) {
            return make_exception_future<response>(std::current_exception());
        }
    }

    // Send and receive are queued jointly on two FIFO semaphores. The
    // broker answers in request order, so the n-th receive reads the
    // response to the n-th send, while sends need not wait for earlier
    // responses.
    auto request_future = with_gate(_pending, [this, frame = std::move(frame)] () mutable {
        return with_semaphore(_send_semaphore, 1, [this, frame = std::move(frame)] () mutable {
            if (_broken) {
                return make_exception_future<>(_broken);
            }
            return _transport->write(std::move(frame));
        });
    });

    if (!req.expects_response()) {
        return request_future.then([correlation_id] {
            return response{correlation_id, nil_response{}};
        }).handle_exception([this] (std::exception_ptr ex) {
            mark_broken(ex);
            return make_exception_future<response>(std::move(ex));
        });
    }

    auto pending = make_lw_shared<pending_response>();
    auto response_future = pending->_promise.get_future();
    // Completion is reported through the promise, the gate keeps close()
    // waiting for the read.
    (void) with_gate(_pending, [this, correlation_id, pending] {
        return with_semaphore(_receive_semaphore, 1, [this, correlation_id, pending] {
            return receive_response(correlation_id, pending);
        });
    });

    return request_future.handle_exception([this] (std::exception_ptr ex) {
        // The read waiting for this response fails once the transport is shut down.
        mark_broken(ex);
    }).then([response_future = std::move(response_future)] () mutable {
        return std::move(response_future);
    });
}

future<> kafka_connection::close() {
    kwlog.debug("Closing connection, {} requests in flight", _correlator.size());
    _closing = true;
    // Also fails an open fetch stream, its reader may be waiting for the consumer
    // rather than for the socket.
    mark_broken(std::make_exception_ptr(connection_broken_exception("Connection is closed")));
    return _pending.close().then([this] {
        return _transport->close();
    });
}

}
