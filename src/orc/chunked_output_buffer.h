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
#include <vector>

#include "common/macros.h"
#include "common/status.h"

namespace orcbuf {

class WriteStream;

// Append only store of the framed chunks of one column stream.
class ChunkedOutputBuffer {
public:
    virtual ~ChunkedOutputBuffer() = default;

    // Write all bytes appended so far to `stream`, in order.
    virtual Status write_to(WriteStream* stream) const = 0;

    virtual void reset() = 0;

    // Bytes appended so far.
    virtual size_t size() const = 0;

    virtual size_t get_retained_size() const = 0;

    // Must be called before each write_header/write_bytes sequence. Makes sure at
    // least `min_length` contiguous bytes are writable; `length` is the total number of
    // bytes the caller is about to append.
    virtual void ensure_available(size_t min_length, size_t length) = 0;

    // Append the 3 byte little endian chunk header.
    virtual void write_header(uint32_t value) = 0;

    virtual void write_bytes(const char* data, size_t length) = 0;

    virtual std::string debug_string() const = 0;

protected:
    struct Chunk {
        std::unique_ptr<char[]> data;
        size_t capacity = 0;
        size_t used = 0;

        explicit Chunk(size_t size) : data(new char[size]), capacity(size) {}
        size_t remaining() const { return capacity - used; }
    };
};

// Allocates its first chunk up front. Later chunks double in size from
// `min_chunk_size` up to `max_chunk_size`. With `reset_output_buffer`, reset() keeps
// the chunks and reuses them for the next block.
class EagerChunkedOutputBuffer final : public ChunkedOutputBuffer {
public:
    EagerChunkedOutputBuffer(size_t min_chunk_size, size_t max_chunk_size,
                             bool reset_output_buffer);
    ~EagerChunkedOutputBuffer() override = default;

    Status write_to(WriteStream* stream) const override;

    void reset() override;

    size_t size() const override { return _size; }

    size_t get_retained_size() const override;

    void ensure_available(size_t min_length, size_t length) override;

    void write_header(uint32_t value) override;

    void write_bytes(const char* data, size_t length) override;

    std::string debug_string() const override;

    size_t num_chunks() const { return _chunks.size(); }

private:
    // Move to the next chunk with room for `min_length` bytes, reusing a chunk kept by
    // reset() when possible.
    void _next_chunk(size_t min_length);
    size_t _next_chunk_size();

    const size_t _min_chunk_size;
    const size_t _max_chunk_size;
    const bool _reset_output_buffer;

    std::vector<Chunk> _chunks;
    size_t _current = 0;
    size_t _size = 0;
    size_t _retained_chunk_bytes = 0;

    DISALLOW_COPY_AND_ASSIGN(EagerChunkedOutputBuffer);
};

// Allocates nothing until the first reservation, then allocates chunks of exactly
// the reserved size. Suited to streams that are often empty.
class LazyChunkedOutputBuffer final : public ChunkedOutputBuffer {
public:
    LazyChunkedOutputBuffer() = default;
    ~LazyChunkedOutputBuffer() override = default;

    Status write_to(WriteStream* stream) const override;

    void reset() override;

    size_t size() const override { return _size; }

    size_t get_retained_size() const override;

    void ensure_available(size_t min_length, size_t length) override;

    void write_header(uint32_t value) override;

    void write_bytes(const char* data, size_t length) override;

    std::string debug_string() const override;

    size_t num_chunks() const { return _chunks.size(); }

private:
    std::vector<Chunk> _chunks;
    size_t _size = 0;
    size_t _retained_chunk_bytes = 0;

    DISALLOW_COPY_AND_ASSIGN(LazyChunkedOutputBuffer);
};

} // namespace orcbuf
