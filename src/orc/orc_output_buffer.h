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

#include "common/factory_creator.h"
#include "common/macros.h"
#include "common/status.h"
#include "orc/block_compressor.h"
#include "orc/chunk_framer.h"
#include "orc/column_writer_options.h"
#include "orc/data_encryptor.h"
#include "util/slice.h"

namespace orcbuf {

class ReadStream;
class WriteStream;

// Output buffer of one ORC/DWRF column stream.
//
// Bytes are staged in a buffer that grows from 256 bytes up to the max buffer size.
// Each time the buffer is full, its content is handed to the ChunkFramer as one
// chunk, which compresses and/or encrypts it and appends it to a chunked sink. Large
// writes bypass the staging buffer: whole max size slices are framed straight from the
// caller's memory.
//
// Not thread safe.
class OrcOutputBuffer {
    ENABLE_FACTORY_CREATOR(OrcOutputBuffer);

public:
    static constexpr size_t INITIAL_BUFFER_SIZE = 256;
    static constexpr size_t PAGE_HEADER_SIZE = 3;

    // Create a buffer with the compressor described by `options`. `encryptor` may be null.
    static Status create(const ColumnWriterOptions& options,
                         std::unique_ptr<DataEncryptor> encryptor,
                         std::unique_ptr<OrcOutputBuffer>* buffer);

    // Same as above but with a caller provided compressor, null for no compression.
    // The compressor kind decides the max buffer size and the min compressible size.
    static Status create(const ColumnWriterOptions& options,
                         std::unique_ptr<BlockCompressor> compressor,
                         std::unique_ptr<DataEncryptor> encryptor,
                         std::unique_ptr<OrcOutputBuffer>* buffer);

    ~OrcOutputBuffer() = default;

    // Fixed width little endian values. Float and double are written as their IEEE 754
    // bits, with every NaN mapped to the canonical quiet NaN.
    Status write_byte(int8_t value);
    Status write_short(int16_t value);
    Status write_int(int32_t value);
    Status write_long(int64_t value);
    Status write_float(float value);
    Status write_double(double value);

    Status write_bytes(const char* data, size_t length);
    Status write_bytes(const Slice& data) { return write_bytes(data.data, data.size); }

    // Copy `length` bytes from `stream`. Returns END_OF_FILE if the stream ends first.
    Status write_bytes(ReadStream* stream, size_t length);

    Status write_zeros(size_t length);

    // Frame whatever is staged. Does not flush the sink.
    Status flush() { return _flush_buffer_to_output_stream(); }
    Status close() { return _flush_buffer_to_output_stream(); }

    // Forget all written bytes so the buffer can be reused for the next block.
    void reset();

    // Bytes written so far, staged bytes included.
    size_t size() const { return _buffer_offset + _buffer_position; }

    // Bytes in the sink. The buffer must be flushed first, otherwise
    // Exception(ILLEGAL_STATE) is thrown.
    size_t get_output_data_size() const;

    size_t estimate_output_data_size() const { return _framer.sink_size() + _buffer_position; }

    // Copy the sink to `stream`. The buffer must be flushed first, otherwise
    // Exception(ILLEGAL_STATE) is thrown. `*written` is 0 if nothing was framed yet.
    Status write_data_to(WriteStream* stream, size_t* written) const;

    // Plain offset when chunks are neither compressed nor encrypted, otherwise
    // (sink size << 32) | staged bytes. See input_stream_checkpoint.h.
    int64_t get_checkpoint() const;

    size_t get_retained_size() const;

    size_t max_buffer_size() const { return _max_buffer_size; }

    size_t buffer_capacity() const { return _capacity; }

    std::string debug_string() const;

private:
    OrcOutputBuffer(const ColumnWriterOptions& options, size_t max_buffer_size,
                    std::unique_ptr<BlockCompressor> compressor,
                    std::unique_ptr<DataEncryptor> encryptor);

    // Make room for `min_writable_bytes` more bytes, growing or flushing the buffer.
    Status _ensure_writable_bytes(size_t min_writable_bytes);

    // Bytes that can be written in one step of a write of `length` bytes.
    Status _ensure_batch_size(size_t length, size_t* batch_size);

    void _init_buffer(size_t length);
    size_t _calculate_buffer_size(size_t length) const;

    size_t _available_in_buffer() const { return _capacity - _buffer_position; }
    uint8_t* _write_pointer() {
        return reinterpret_cast<uint8_t*>(_buffer.get() + _buffer_position);
    }

    Status _flush_buffer_to_output_stream();

    const size_t _max_buffer_size;
    ChunkFramer _framer;

    std::unique_ptr<char[]> _buffer;
    size_t _capacity = 0;
    // offset of the buffer within the stream
    size_t _buffer_offset = 0;
    // write position within the buffer
    size_t _buffer_position = 0;

    DISALLOW_COPY_AND_ASSIGN(OrcOutputBuffer);
};

} // namespace orcbuf
