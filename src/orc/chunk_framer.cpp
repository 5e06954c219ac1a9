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

#include "orc/chunk_framer.h"

#include <fmt/format.h>

#include <utility>
#include <vector>

#include "common/compiler_util.h"
#include "common/exception.h"
#include "common/logging.h"
#include "util/defer_op.h"
#include "util/slice.h"

namespace orcbuf {

ChunkFramer::ChunkFramer(const ColumnWriterOptions& options, size_t max_buffer_size,
                         std::unique_ptr<BlockCompressor> compressor,
                         std::unique_ptr<DataEncryptor> encryptor)
        : _max_buffer_size(max_buffer_size),
          _min_compressible_size(min_compressible_size(
                  compressor == nullptr ? CompressionKind::NONE : compressor->kind())),
          _min_output_buffer_chunk_size(options.min_output_buffer_chunk_size),
          _max_output_buffer_chunk_size(options.max_output_buffer_chunk_size),
          _lazy_output_buffer(options.lazy_output_buffer),
          _reset_output_buffer(options.reset_output_buffer),
          _compression_buffer_pool(options.compression_buffer_pool),
          _compressor(std::move(compressor)),
          _encryptor(std::move(encryptor)) {}

void ChunkFramer::_init_sink() {
    if (UNLIKELY(_sink != nullptr)) {
        throw Exception(ErrorCode::ILLEGAL_STATE, "chunk sink is already initialized");
    }
    if (_lazy_output_buffer) {
        _sink = std::make_unique<LazyChunkedOutputBuffer>();
    } else {
        _sink = std::make_unique<EagerChunkedOutputBuffer>(_min_output_buffer_chunk_size,
                                                           _max_output_buffer_chunk_size,
                                                           _reset_output_buffer);
    }
    VLOG_DEBUG << "init chunk sink: " << _sink->debug_string();
}

Status ChunkFramer::write_chunk(const char* data, size_t length) {
    if (_sink == nullptr) {
        _init_sink();
    }

    if (!is_framed()) {
        _sink->ensure_available(1, length);
        _sink->write_bytes(data, length);
        return Status::OK();
    }

    if (UNLIKELY(length > _max_buffer_size)) {
        throw Exception(ErrorCode::CHUNK_SIZE_EXCEEDED,
                        "chunk length {} exceeds max compression buffer size {}", length,
                        _max_buffer_size);
    }

    const char* payload = data;
    size_t payload_length = length;
    bool compressed = false;

    std::vector<char> compression_buffer;
    bool checked_out = false;
    Defer check_in {[&]() {
        if (checked_out) {
            _compression_buffer_pool->check_in(std::move(compression_buffer));
        }
    }};

    if (_compressor != nullptr && length >= _min_compressible_size) {
        compression_buffer =
                _compression_buffer_pool->check_out(_compressor->max_compressed_length(length));
        checked_out = true;
        size_t compressed_length = 0;
        RETURN_IF_ERROR(_compressor->compress(Slice(data, length), compression_buffer.data(),
                                              compression_buffer.size(), &compressed_length));
        if (compressed_length < length) {
            compressed = true;
            payload = compression_buffer.data();
            payload_length = compressed_length;
        }
    }

    std::string encrypted;
    if (_encryptor != nullptr) {
        RETURN_IF_ERROR(_encryptor->encrypt(Slice(payload, payload_length), &encrypted));
        if (UNLIKELY(encrypted.size() > MAX_ENCRYPTED_CHUNK_SIZE)) {
            LOG(WARNING) << "encrypted chunk too large, size=" << encrypted.size()
                         << ", limit=" << MAX_ENCRYPTED_CHUNK_SIZE;
            return Status::Error<ErrorCode::ENCRYPTED_DATA_SIZE_EXCEEDED>(
                    "Encrypted data size {} exceeds limit of 2^23", encrypted.size());
        }
        payload = encrypted.data();
        payload_length = encrypted.size();
    }

    if (UNLIKELY(payload_length > MAX_CHUNK_PAYLOAD_SIZE)) {
        return Status::Error<ErrorCode::CHUNK_SIZE_EXCEEDED>(
                "chunk payload size {} does not fit in a chunk header", payload_length);
    }

    uint32_t header = compressed ? static_cast<uint32_t>(payload_length << 1)
                                 : static_cast<uint32_t>((payload_length << 1) + 1);
    _sink->ensure_available(CHUNK_HEADER_SIZE, CHUNK_HEADER_SIZE + payload_length);
    _sink->write_header(header);
    _sink->write_bytes(payload, payload_length);
    VLOG_ROW << "write chunk, length=" << length << ", payload=" << payload_length
             << ", compressed=" << compressed;
    return Status::OK();
}

void ChunkFramer::reset() {
    if (_sink != nullptr) {
        _sink->reset();
    }
}

Status ChunkFramer::write_to(WriteStream* stream) const {
    if (_sink == nullptr) {
        return Status::OK();
    }
    return _sink->write_to(stream);
}

std::string ChunkFramer::debug_string() const {
    return fmt::format("ChunkFramer{{maxBufferSize={}, compressor={}, encryptor={}, sink={}}}",
                       _max_buffer_size,
                       _compressor == nullptr ? "none" : _compressor->debug_info(),
                       _encryptor == nullptr ? "none" : _encryptor->debug_info(),
                       _sink == nullptr ? "null" : _sink->debug_string());
}

} // namespace orcbuf
