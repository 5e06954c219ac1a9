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

#include "orc/orc_output_buffer.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <utility>

#include "common/compiler_util.h"
#include "common/exception.h"
#include "common/logging.h"
#include "filesystem/read_stream.h"
#include "filesystem/write_stream.h"
#include "orc/input_stream_checkpoint.h"
#include "util/coding.h"

namespace orcbuf {

static constexpr uint32_t CANONICAL_FLOAT_NAN_BITS = 0x7fc00000;
static constexpr uint64_t CANONICAL_DOUBLE_NAN_BITS = 0x7ff8000000000000ULL;

Status OrcOutputBuffer::create(const ColumnWriterOptions& options,
                               std::unique_ptr<DataEncryptor> encryptor,
                               std::unique_ptr<OrcOutputBuffer>* buffer) {
    std::unique_ptr<BlockCompressor> compressor;
    RETURN_IF_ERROR(BlockCompressor::create(options.compression_kind, options.compression_level,
                                            &compressor));
    return create(options, std::move(compressor), std::move(encryptor), buffer);
}

Status OrcOutputBuffer::create(const ColumnWriterOptions& options,
                               std::unique_ptr<BlockCompressor> compressor,
                               std::unique_ptr<DataEncryptor> encryptor,
                               std::unique_ptr<OrcOutputBuffer>* buffer) {
    RETURN_IF_ERROR(options.validate());
    size_t max_buffer_size = options.compression_max_buffer_size;
    if (compressor != nullptr) {
        max_buffer_size -= PAGE_HEADER_SIZE;
    }
    if (compressor != nullptr || encryptor != nullptr) {
        // a frame header holds at most 23 bits of length
        max_buffer_size = std::min(max_buffer_size, ChunkFramer::MAX_CHUNK_PAYLOAD_SIZE);
    }
    *buffer = OrcOutputBuffer::create_unique(options, max_buffer_size, std::move(compressor),
                                             std::move(encryptor));
    VLOG_DEBUG << "create orc output buffer, " << options.debug_string()
               << ", maxBufferSize=" << max_buffer_size;
    return Status::OK();
}

OrcOutputBuffer::OrcOutputBuffer(const ColumnWriterOptions& options, size_t max_buffer_size,
                                 std::unique_ptr<BlockCompressor> compressor,
                                 std::unique_ptr<DataEncryptor> encryptor)
        : _max_buffer_size(max_buffer_size),
          _framer(options, max_buffer_size, std::move(compressor), std::move(encryptor)) {
    if (!options.lazy_output_buffer) {
        _init_buffer(0);
    }
}

Status OrcOutputBuffer::write_byte(int8_t value) {
    RETURN_IF_ERROR(_ensure_writable_bytes(sizeof(int8_t)));
    encode_fixed8(_write_pointer(), static_cast<uint8_t>(value));
    _buffer_position += sizeof(int8_t);
    return Status::OK();
}

Status OrcOutputBuffer::write_short(int16_t value) {
    RETURN_IF_ERROR(_ensure_writable_bytes(sizeof(int16_t)));
    encode_fixed16_le(_write_pointer(), static_cast<uint16_t>(value));
    _buffer_position += sizeof(int16_t);
    return Status::OK();
}

Status OrcOutputBuffer::write_int(int32_t value) {
    RETURN_IF_ERROR(_ensure_writable_bytes(sizeof(int32_t)));
    encode_fixed32_le(_write_pointer(), static_cast<uint32_t>(value));
    _buffer_position += sizeof(int32_t);
    return Status::OK();
}

Status OrcOutputBuffer::write_long(int64_t value) {
    RETURN_IF_ERROR(_ensure_writable_bytes(sizeof(int64_t)));
    encode_fixed64_le(_write_pointer(), static_cast<uint64_t>(value));
    _buffer_position += sizeof(int64_t);
    return Status::OK();
}

Status OrcOutputBuffer::write_float(float value) {
    uint32_t bits = CANONICAL_FLOAT_NAN_BITS;
    if (!std::isnan(value)) {
        memcpy(&bits, &value, sizeof(bits));
    }
    return write_int(static_cast<int32_t>(bits));
}

Status OrcOutputBuffer::write_double(double value) {
    uint64_t bits = CANONICAL_DOUBLE_NAN_BITS;
    if (!std::isnan(value)) {
        memcpy(&bits, &value, sizeof(bits));
    }
    return write_long(static_cast<int64_t>(bits));
}

Status OrcOutputBuffer::write_bytes(const char* data, size_t length) {
    if (length == 0) {
        return Status::OK();
    }

    // finish filling the buffer
    if (_buffer_position != 0) {
        size_t chunk_size = std::min(length, _max_buffer_size - _buffer_position);
        RETURN_IF_ERROR(_ensure_writable_bytes(chunk_size));
        memcpy(_buffer.get() + _buffer_position, data, chunk_size);
        _buffer_position += chunk_size;
        data += chunk_size;
        length -= chunk_size;
    }

    // write max buffer size chunks directly to the framer
    if (length >= _max_buffer_size) {
        RETURN_IF_ERROR(_flush_buffer_to_output_stream());
        while (length >= _max_buffer_size) {
            RETURN_IF_ERROR(_framer.write_chunk(data, _max_buffer_size));
            _buffer_offset += _max_buffer_size;
            data += _max_buffer_size;
            length -= _max_buffer_size;
        }
    }

    // stage the tail smaller than max buffer size
    if (length > 0) {
        RETURN_IF_ERROR(_ensure_writable_bytes(length));
        memcpy(_buffer.get() + _buffer_position, data, length);
        _buffer_position += length;
    }
    return Status::OK();
}

Status OrcOutputBuffer::write_bytes(ReadStream* stream, size_t length) {
    while (length > 0) {
        size_t batch_size = 0;
        RETURN_IF_ERROR(_ensure_batch_size(length, &batch_size));
        size_t filled = 0;
        while (filled < batch_size) {
            size_t read_n = 0;
            RETURN_IF_ERROR(stream->read(_buffer.get() + _buffer_position + filled,
                                         batch_size - filled, &read_n));
            if (read_n == 0) {
                return Status::EndOfFile("stream ended with {} bytes left to copy",
                                         length - filled);
            }
            filled += read_n;
        }
        _buffer_position += batch_size;
        length -= batch_size;
    }
    return Status::OK();
}

Status OrcOutputBuffer::write_zeros(size_t length) {
    while (length > 0) {
        size_t batch_size = 0;
        RETURN_IF_ERROR(_ensure_batch_size(length, &batch_size));
        memset(_buffer.get() + _buffer_position, 0, batch_size);
        _buffer_position += batch_size;
        length -= batch_size;
    }
    return Status::OK();
}

void OrcOutputBuffer::reset() {
    _framer.reset();
    _buffer_offset = 0;
    _buffer_position = 0;
}

size_t OrcOutputBuffer::get_output_data_size() const {
    if (UNLIKELY(_buffer_position != 0)) {
        throw Exception(ErrorCode::ILLEGAL_STATE,
                        "Buffer must be flushed before get_output_data_size can be called, "
                        "{} bytes pending",
                        _buffer_position);
    }
    return _framer.sink_size();
}

Status OrcOutputBuffer::write_data_to(WriteStream* stream, size_t* written) const {
    if (UNLIKELY(_buffer_position != 0)) {
        throw Exception(ErrorCode::ILLEGAL_STATE,
                        "Buffer must be closed before write_data_to can be called, {} bytes "
                        "pending",
                        _buffer_position);
    }
    RETURN_IF_ERROR(_framer.write_to(stream));
    *written = _framer.sink_size();
    return Status::OK();
}

int64_t OrcOutputBuffer::get_checkpoint() const {
    if (!_framer.is_framed()) {
        return static_cast<int64_t>(size());
    }
    return create_input_stream_checkpoint(static_cast<int32_t>(_framer.sink_size()),
                                          static_cast<int32_t>(_buffer_position));
}

size_t OrcOutputBuffer::get_retained_size() const {
    return sizeof(*this) + _framer.sink_retained_size() + _capacity;
}

std::string OrcOutputBuffer::debug_string() const {
    const ChunkedOutputBuffer* sink = _framer.sink();
    return fmt::format("OrcOutputBuffer{{outputStream={}, bufferSize={}}}",
                       sink == nullptr ? "null" : sink->debug_string(), _capacity);
}

Status OrcOutputBuffer::_ensure_writable_bytes(size_t min_writable_bytes) {
    if (UNLIKELY(min_writable_bytes > _max_buffer_size)) {
        throw Exception(ErrorCode::BUFFER_OVERFLOW,
                        "Min writable bytes {} must not exceed max buffer size {}",
                        min_writable_bytes, _max_buffer_size);
    }

    if (_buffer == nullptr) {
        _init_buffer(min_writable_bytes);
    }
    size_t needed_buffer_size = _buffer_position + min_writable_bytes;
    if (needed_buffer_size <= _capacity) {
        return Status::OK();
    }

    if (_capacity >= _max_buffer_size) {
        return _flush_buffer_to_output_stream();
    }

    // grow the buffer up to max buffer size
    size_t new_buffer_size =
            std::min(std::max(_capacity * 2, needed_buffer_size), _max_buffer_size);
    std::unique_ptr<char[]> new_buffer(new char[new_buffer_size]);
    if (new_buffer_size >= needed_buffer_size) {
        memcpy(new_buffer.get(), _buffer.get(), _buffer_position);
    } else {
        // the staged bytes and the new ones do not fit together, frame the staged ones
        RETURN_IF_ERROR(_flush_buffer_to_output_stream());
    }
    _buffer = std::move(new_buffer);
    _capacity = new_buffer_size;
    return Status::OK();
}

Status OrcOutputBuffer::_ensure_batch_size(size_t length, size_t* batch_size) {
    if (_buffer == nullptr) {
        _init_buffer(length);
    }
    RETURN_IF_ERROR(
            _ensure_writable_bytes(std::min(length, _max_buffer_size - _buffer_position)));
    if (_available_in_buffer() == 0) {
        RETURN_IF_ERROR(_flush_buffer_to_output_stream());
    }
    *batch_size = std::min(length, _available_in_buffer());
    return Status::OK();
}

void OrcOutputBuffer::_init_buffer(size_t length) {
    _capacity = _calculate_buffer_size(length);
    _buffer.reset(new char[_capacity]);
}

size_t OrcOutputBuffer::_calculate_buffer_size(size_t length) const {
    size_t size = std::min(INITIAL_BUFFER_SIZE, _max_buffer_size);
    while (size < length && size < _max_buffer_size) {
        size = std::min(size * 2, _max_buffer_size);
    }
    return size;
}

Status OrcOutputBuffer::_flush_buffer_to_output_stream() {
    if (_buffer_position > 0) {
        RETURN_IF_ERROR(_framer.write_chunk(_buffer.get(), _buffer_position));
        _buffer_offset += _buffer_position;
        _buffer_position = 0;
    }
    return Status::OK();
}

} // namespace orcbuf
