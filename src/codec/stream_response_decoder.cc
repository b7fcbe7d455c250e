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

#include <seastar/core/when_all.hh>

#include <kafkawire/codec/response_decoder.hh>
#include <kafkawire/codec/stream_response_decoder.hh>
#include <kafkawire/utils/logger.hh>

using namespace seastar;

namespace kafkawire {

namespace {

future<decode_result> desync(const std::string& message) {
    return make_ready_future<decode_result>(
            decode_failure{std::make_exception_ptr(stream_desync_exception(message))});
}

}

decode_result stream_response_decoder::decode_frame(buffer_response_frame frame) {
    try {
        kafka::input_stream is(frame._frame.get(), frame._frame.size());
        auto body = decode_response_body(frame._api_key, is);
        if (!body) {
            return not_handled{std::move(frame._frame), not_handled_reason::no_response_body};
        }
        kwlog.trace("Decoded {} response, correlation id {}", api_key_name(frame._api_key), frame._correlation_id);
        return emit_response{response{frame._correlation_id, std::move(*body)}};
    } catch (const parsing_exception&) {
        return decode_failure{std::current_exception()};
    }
}

decode_result stream_response_decoder::begin_stream(const fetch_response_begin& begin) {
    _stream.emplace(open_stream{
        begin._correlation_id,
        make_lw_shared<stream_channel<partition_status>>(),
        make_lw_shared<stream_channel<fetched_message>>(),
        promise<>()
    });
    kwlog.trace("Streaming fetch response, correlation id {}", begin._correlation_id);

    stream_fetch_response body;
    body._partitions = fetch_stream<partition_status>(_stream->_partitions);
    body._messages = fetch_stream<fetched_message>(_stream->_messages);
    body._complete = shared_future<>(_stream->_complete.get_future());
    return emit_response{response{begin._correlation_id, std::move(body)}};
}

// The stream stays open until the consumer took both end markers, an
// abort() in the meantime fails it instead.
future<decode_result> stream_response_decoder::end_stream(const fetch_response_end& end) {
    auto partitions = _stream->_partitions;
    auto messages = _stream->_messages;
    return when_all_succeed(partitions->close(), messages->close()).discard_result()
        .then([this, correlation_id = end._correlation_id] {
            if (_stream) {
                _stream->_complete.set_value();
                _stream.reset();
                kwlog.trace("Fetch response stream ended, correlation id {}", correlation_id);
            }
            return decode_result(consumed{});
        });
}

future<decode_result> stream_response_decoder::decode(stream_event event) {
    if (auto frame = std::get_if<buffer_response_frame>(&event)) {
        if (_stream) {
            return desync(fmt::format("Frame for correlation id {} inside the fetch stream of {}",
                    frame->_correlation_id, _stream->_correlation_id));
        }
        return make_ready_future<decode_result>(decode_frame(std::move(*frame)));
    }
    if (auto begin = std::get_if<fetch_response_begin>(&event)) {
        if (_stream) {
            return desync(fmt::format("Fetch stream {} started while {} is still open",
                    begin->_correlation_id, _stream->_correlation_id));
        }
        return make_ready_future<decode_result>(begin_stream(*begin));
    }
    if (auto status = std::get_if<partition_status>(&event)) {
        if (!_stream) {
            return desync("Partition record outside of a fetch stream");
        }
        return _stream->_partitions->push(std::move(*status)).then([] {
            return decode_result(consumed{});
        });
    }
    if (auto message = std::get_if<fetched_message>(&event)) {
        if (!_stream) {
            return desync("Message outside of a fetch stream");
        }
        return _stream->_messages->push(std::move(*message)).then([] {
            return decode_result(consumed{});
        });
    }
    auto& end = std::get<fetch_response_end>(event);
    if (!_stream) {
        return desync(fmt::format("End of fetch stream {} while none is open", end._correlation_id));
    }
    if (_stream->_correlation_id != end._correlation_id) {
        return desync(fmt::format("End of fetch stream {} while {} is open",
                end._correlation_id, _stream->_correlation_id));
    }
    return end_stream(end);
}

void stream_response_decoder::abort(std::exception_ptr ex) {
    if (!_stream) {
        return;
    }
    kwlog.debug("Aborting fetch stream, correlation id {}", _stream->_correlation_id);
    _stream->_partitions->fail(ex);
    _stream->_messages->fail(ex);
    _stream->_complete.set_exception(ex);
    _stream.reset();
}

}
