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

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "common/macros.h"
#include "common/status.h"
#include "orc/block_compressor.h"
#include "orc/chunked_output_buffer.h"
#include "orc/column_writer_options.h"
#include "orc/compression_buffer_pool.h"
#include "orc/data_encryptor.h"

namespace orcbuf {

class WriteStream;

// Turns the chunks flushed by OrcOutputBuffer into frames:
//
//   [3 byte header][payload]
//
// header = (payload length << 1) | 1 when the payload is stored raw, or
// (payload length << 1) when it is compressed. The payload is encrypted after
// compression if an encryptor is present. Without compressor and encryptor the chunks
// are appended as is, without a header.
class ChunkFramer {
public:
    static constexpr size_t CHUNK_HEADER_SIZE = 3;
    // Largest payload the 23 bit length field of a header can carry.
    static constexpr size_t MAX_CHUNK_PAYLOAD_SIZE = (1 << 23) - 1;
    static constexpr size_t MAX_ENCRYPTED_CHUNK_SIZE = 1 << 23;

    // `compressor` and `encryptor` may be null.
    ChunkFramer(const ColumnWriterOptions& options, size_t max_buffer_size,
                std::unique_ptr<BlockCompressor> compressor,
                std::unique_ptr<DataEncryptor> encryptor);
    ~ChunkFramer() = default;

    // Frame one chunk and append it to the sink. Throws Exception(CHUNK_SIZE_EXCEEDED)
    // when a chunk to be framed is larger than the max buffer size.
    Status write_chunk(const char* data, size_t length);

    // Whether chunks get a header, ie. a compressor or an encryptor is configured.
    bool is_framed() const { return _compressor != nullptr || _encryptor != nullptr; }

    bool has_compressor() const { return _compressor != nullptr; }
    bool has_encryptor() const { return _encryptor != nullptr; }

    // Bytes in the sink, 0 before the first chunk.
    size_t sink_size() const { return _sink == nullptr ? 0 : _sink->size(); }

    size_t sink_retained_size() const {
        return _sink == nullptr ? 0 : _sink->get_retained_size();
    }

    // nullptr until the first chunk is written.
    const ChunkedOutputBuffer* sink() const { return _sink.get(); }

    void reset();

    // Copy the sink content to `stream`.
    Status write_to(WriteStream* stream) const;

    std::string debug_string() const;

private:
    void _init_sink();

    const size_t _max_buffer_size;
    const size_t _min_compressible_size;
    const size_t _min_output_buffer_chunk_size;
    const size_t _max_output_buffer_chunk_size;
    const bool _lazy_output_buffer;
    const bool _reset_output_buffer;

    std::shared_ptr<CompressionBufferPool> _compression_buffer_pool;
    std::unique_ptr<BlockCompressor> _compressor;
    std::unique_ptr<DataEncryptor> _encryptor;

    std::unique_ptr<ChunkedOutputBuffer> _sink;

    DISALLOW_COPY_AND_ASSIGN(ChunkFramer);
};

} // namespace orcbuf
