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

#include <zlib.h>
#include <zstd.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "common/status.h"
#include "orc/compression_kind.h"
#include "util/slice.h"

namespace orcbuf {

// Compresses one chunk at a time; chunks are independent of each other.
class BlockCompressor {
public:
    // Use the codec default level.
    static constexpr int32_t DEFAULT_LEVEL = -1;

    virtual ~BlockCompressor() = default;

    // input(in):             bytes to compress
    // output(out):           buf where to save compressed data
    // output_capacity(in):   size of output, must be at least max_compressed_length(input.size)
    // compressed_len(out):   compressed data size in output
    //
    // output buf should be allocated and released outside
    virtual Status compress(const Slice& input, char* output, size_t output_capacity,
                            size_t* compressed_len) = 0;

    // Worst case output size for `input_len` bytes of input.
    virtual size_t max_compressed_length(size_t input_len) const = 0;

    virtual std::string debug_info() const = 0;

    CompressionKind kind() const { return _kind; }

    // Sets `*compressor` to nullptr for CompressionKind::NONE.
    static Status create(CompressionKind kind, int32_t level,
                         std::unique_ptr<BlockCompressor>* compressor);

protected:
    virtual Status init() = 0;

    BlockCompressor(CompressionKind kind) : _kind(kind) {}

    CompressionKind _kind;
};

// Raw deflate stream, no zlib header or trailer.
class ZlibBlockCompressor : public BlockCompressor {
public:
    ~ZlibBlockCompressor() override;

    Status compress(const Slice& input, char* output, size_t output_capacity,
                    size_t* compressed_len) override;

    size_t max_compressed_length(size_t input_len) const override;

    std::string debug_info() const override;

private:
    friend class BlockCompressor;
    ZlibBlockCompressor(int32_t level);
    Status init() override;

    int32_t _level;
    bool _initialized = false;
    z_stream _z_strm;

    // Negative window bits select raw deflate.
    const static int WINDOW_BITS = -15;
    const static int MEM_LEVEL = 8;
};

class SnappyBlockCompressor : public BlockCompressor {
public:
    ~SnappyBlockCompressor() override = default;

    Status compress(const Slice& input, char* output, size_t output_capacity,
                    size_t* compressed_len) override;

    size_t max_compressed_length(size_t input_len) const override;

    std::string debug_info() const override;

private:
    friend class BlockCompressor;
    SnappyBlockCompressor() : BlockCompressor(CompressionKind::SNAPPY) {}
    Status init() override { return Status::OK(); }
};

class Lz4BlockCompressor : public BlockCompressor {
public:
    ~Lz4BlockCompressor() override = default;

    Status compress(const Slice& input, char* output, size_t output_capacity,
                    size_t* compressed_len) override;

    size_t max_compressed_length(size_t input_len) const override;

    std::string debug_info() const override;

private:
    friend class BlockCompressor;
    Lz4BlockCompressor() : BlockCompressor(CompressionKind::LZ4) {}
    Status init() override { return Status::OK(); }
};

class ZstdBlockCompressor : public BlockCompressor {
public:
    ~ZstdBlockCompressor() override;

    Status compress(const Slice& input, char* output, size_t output_capacity,
                    size_t* compressed_len) override;

    size_t max_compressed_length(size_t input_len) const override;

    std::string debug_info() const override;

private:
    friend class BlockCompressor;
    ZstdBlockCompressor(int32_t level);
    Status init() override;

    int32_t _level;
    ZSTD_CCtx* _cctx = nullptr;
};

} // namespace orcbuf
