// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include "orc/chunked_output_buffer.h"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>

#include "common/logging.h"
#include "filesystem/write_stream.h"
#include "util/coding.h"

namespace orcbuf {

static constexpr size_t CHUNK_HEADER_SIZE = 3;

EagerChunkedOutputBuffer::EagerChunkedOutputBuffer(size_t min_chunk_size, size_t max_chunk_size,
                                                   bool reset_output_buffer)
        : _min_chunk_size(min_chunk_size),
          _max_chunk_size(std::max(min_chunk_size, max_chunk_size)),
          _reset_output_buffer(reset_output_buffer) {
    DCHECK_GT(min_chunk_size, 0);
    _chunks.emplace_back(_min_chunk_size);
    _retained_chunk_bytes = _min_chunk_size;
}

Status EagerChunkedOutputBuffer::write_to(WriteStream* stream) const {
    for (const auto& chunk : _chunks) {
        if (chunk.used > 0) {
            RETURN_IF_ERROR(stream->write(chunk.data.get(), chunk.used));
        }
    }
    return Status::OK();
}

void EagerChunkedOutputBuffer::reset() {
    _size = 0;
    _current = 0;
    if (_reset_output_buffer) {
        for (auto& chunk : _chunks) {
            chunk.used = 0;
        }
        return;
    }
    _chunks.clear();
    _chunks.emplace_back(_min_chunk_size);
    _retained_chunk_bytes = _min_chunk_size;
}

size_t EagerChunkedOutputBuffer::get_retained_size() const {
    return sizeof(*this) + _retained_chunk_bytes;
}

size_t EagerChunkedOutputBuffer::_next_chunk_size() {
    if (_chunks.empty()) {
        return _min_chunk_size;
    }
    return std::min(_chunks.back().capacity * 2, _max_chunk_size);
}

void EagerChunkedOutputBuffer::_next_chunk(size_t min_length) {
    size_t next = _current + 1;
    if (next < _chunks.size() && _chunks[next].capacity >= min_length) {
        _current = next;
        DCHECK_EQ(_chunks[_current].used, 0);
        return;
    }
    size_t chunk_size = std::max(_next_chunk_size(), min_length);
    _chunks.emplace(_chunks.begin() + next, chunk_size);
    _retained_chunk_bytes += chunk_size;
    _current = next;
    VLOG_DEBUG << "allocate output chunk, size=" << chunk_size << ", chunks=" << _chunks.size();
}

void EagerChunkedOutputBuffer::ensure_available(size_t min_length, size_t /*length*/) {
    if (_chunks[_current].remaining() < min_length) {
        _next_chunk(min_length);
    }
}

void EagerChunkedOutputBuffer::write_header(uint32_t value) {
    if (_chunks[_current].remaining() < CHUNK_HEADER_SIZE) {
        _next_chunk(CHUNK_HEADER_SIZE);
    }
    auto& chunk = _chunks[_current];
    encode_fixed24_le(reinterpret_cast<uint8_t*>(chunk.data.get() + chunk.used), value);
    chunk.used += CHUNK_HEADER_SIZE;
    _size += CHUNK_HEADER_SIZE;
}

void EagerChunkedOutputBuffer::write_bytes(const char* data, size_t length) {
    while (length > 0) {
        if (_chunks[_current].remaining() == 0) {
            _next_chunk(1);
        }
        auto& chunk = _chunks[_current];
        size_t n = std::min(chunk.remaining(), length);
        memcpy(chunk.data.get() + chunk.used, data, n);
        chunk.used += n;
        _size += n;
        data += n;
        length -= n;
    }
}

std::string EagerChunkedOutputBuffer::debug_string() const {
    return fmt::format("EagerChunkedOutputBuffer{{size={}, chunks={}, retainedSize={}}}", _size,
                       _chunks.size(), get_retained_size());
}

Status LazyChunkedOutputBuffer::write_to(WriteStream* stream) const {
    for (const auto& chunk : _chunks) {
        if (chunk.used > 0) {
            RETURN_IF_ERROR(stream->write(chunk.data.get(), chunk.used));
        }
    }
    return Status::OK();
}

void LazyChunkedOutputBuffer::reset() {
    _chunks.clear();
    _size = 0;
    _retained_chunk_bytes = 0;
}

size_t LazyChunkedOutputBuffer::get_retained_size() const {
    return sizeof(*this) + _retained_chunk_bytes;
}

void LazyChunkedOutputBuffer::ensure_available(size_t min_length, size_t length) {
    if (_chunks.empty() || _chunks.back().remaining() < min_length) {
        size_t chunk_size = std::max(length, min_length);
        _chunks.emplace_back(chunk_size);
        _retained_chunk_bytes += chunk_size;
    }
}

void LazyChunkedOutputBuffer::write_header(uint32_t value) {
    ensure_available(CHUNK_HEADER_SIZE, CHUNK_HEADER_SIZE);
    auto& chunk = _chunks.back();
    encode_fixed24_le(reinterpret_cast<uint8_t*>(chunk.data.get() + chunk.used), value);
    chunk.used += CHUNK_HEADER_SIZE;
    _size += CHUNK_HEADER_SIZE;
}

void LazyChunkedOutputBuffer::write_bytes(const char* data, size_t length) {
    while (length > 0) {
        if (_chunks.empty() || _chunks.back().remaining() == 0) {
            _chunks.emplace_back(length);
            _retained_chunk_bytes += length;
        }
        auto& chunk = _chunks.back();
        size_t n = std::min(chunk.remaining(), length);
        memcpy(chunk.data.get() + chunk.used, data, n);
        chunk.used += n;
        _size += n;
        data += n;
        length -= n;
    }
}

std::string LazyChunkedOutputBuffer::debug_string() const {
    return fmt::format("LazyChunkedOutputBuffer{{size={}, chunks={}, retainedSize={}}}", _size,
                       _chunks.size(), get_retained_size());
}

} // namespace orcbuf
