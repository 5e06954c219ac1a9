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

#include "orc/block_compressor.h"

#include <fmt/format.h>
#include <lz4.h>
#include <snappy.h>

#include <algorithm>
#include <cstring>
#include <limits>

#include "common/logging.h"

namespace orcbuf {

static constexpr int32_t DEFAULT_ZLIB_LEVEL = 4;
static constexpr int32_t DEFAULT_ZSTD_LEVEL = 3;

Status BlockCompressor::create(CompressionKind kind, int32_t level,
                               std::unique_ptr<BlockCompressor>* compressor) {
    switch (kind) {
    case CompressionKind::NONE:
        compressor->reset(nullptr);
        return Status::OK();
    case CompressionKind::ZLIB:
        compressor->reset(new ZlibBlockCompressor(level == DEFAULT_LEVEL ? DEFAULT_ZLIB_LEVEL
                                                                         : level));
        break;
    case CompressionKind::SNAPPY:
        compressor->reset(new SnappyBlockCompressor());
        break;
    case CompressionKind::LZ4:
        compressor->reset(new Lz4BlockCompressor());
        break;
    case CompressionKind::ZSTD:
        compressor->reset(new ZstdBlockCompressor(level == DEFAULT_LEVEL ? DEFAULT_ZSTD_LEVEL
                                                                         : level));
        break;
    default:
        return Status::Error<ErrorCode::UNSUPPORTED_COMPRESSION_KIND>(
                "unsupported compression kind: {}", static_cast<int32_t>(kind));
    }

    Status st = (*compressor)->init();
    if (!st.ok()) {
        compressor->reset(nullptr);
    }
    return st;
}

ZlibBlockCompressor::ZlibBlockCompressor(int32_t level)
        : BlockCompressor(CompressionKind::ZLIB), _level(level) {
    memset(&_z_strm, 0, sizeof(_z_strm));
}

ZlibBlockCompressor::~ZlibBlockCompressor() {
    if (_initialized) {
        (void)deflateEnd(&_z_strm);
    }
}

Status ZlibBlockCompressor::init() {
    if (_level < Z_NO_COMPRESSION || _level > Z_BEST_COMPRESSION) {
        return Status::InvalidArgument("invalid zlib compression level: {}", _level);
    }
    int ret = deflateInit2(&_z_strm, _level, Z_DEFLATED, WINDOW_BITS, MEM_LEVEL,
                           Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return Status::Error<ErrorCode::COMPRESS_ERROR>("Failed to init deflate. status code: {}",
                                                        ret);
    }
    _initialized = true;
    return Status::OK();
}

Status ZlibBlockCompressor::compress(const Slice& input, char* output, size_t output_capacity,
                                     size_t* compressed_len) {
    int ret = deflateReset(&_z_strm);
    if (ret != Z_OK) {
        return Status::Error<ErrorCode::COMPRESS_ERROR>("Failed to reset deflate. status code: {}",
                                                        ret);
    }
    _z_strm.next_in = reinterpret_cast<Bytef*>(input.data);
    _z_strm.avail_in = static_cast<uInt>(input.size);
    _z_strm.next_out = reinterpret_cast<Bytef*>(output);
    _z_strm.avail_out = static_cast<uInt>(output_capacity);

    ret = deflate(&_z_strm, Z_FINISH);
    if (ret == Z_OK || ret == Z_BUF_ERROR) {
        // output is full: the caller keeps the input uncompressed
        *compressed_len = input.size;
        return Status::OK();
    }
    if (ret != Z_STREAM_END) {
        return Status::Error<ErrorCode::COMPRESS_ERROR>(
                "Failed to deflate {} bytes into {} bytes. status code: {}", input.size,
                output_capacity, ret);
    }
    *compressed_len = output_capacity - _z_strm.avail_out;
    return Status::OK();
}

size_t ZlibBlockCompressor::max_compressed_length(size_t input_len) const {
    return deflateBound(const_cast<z_stream*>(&_z_strm), static_cast<uLong>(input_len));
}

std::string ZlibBlockCompressor::debug_info() const {
    return fmt::format("ZlibBlockCompressor. level: {}, window bits: {}", _level, WINDOW_BITS);
}

Status SnappyBlockCompressor::compress(const Slice& input, char* output, size_t output_capacity,
                                       size_t* compressed_len) {
    if (output_capacity < snappy::MaxCompressedLength(input.size)) {
        return Status::Error<ErrorCode::BUFFER_OVERFLOW>(
                "snappy output buffer too small: {} < {}", output_capacity,
                snappy::MaxCompressedLength(input.size));
    }
    snappy::RawCompress(input.data, input.size, output, compressed_len);
    return Status::OK();
}

size_t SnappyBlockCompressor::max_compressed_length(size_t input_len) const {
    return snappy::MaxCompressedLength(input_len);
}

std::string SnappyBlockCompressor::debug_info() const {
    return "SnappyBlockCompressor";
}

Status Lz4BlockCompressor::compress(const Slice& input, char* output, size_t output_capacity,
                                    size_t* compressed_len) {
    if (input.size > LZ4_MAX_INPUT_SIZE) {
        return Status::InvalidArgument("LZ4 input size {} exceeds the limit {}", input.size,
                                       LZ4_MAX_INPUT_SIZE);
    }
    int capacity = static_cast<int>(
            std::min(output_capacity, static_cast<size_t>(std::numeric_limits<int>::max())));
    int ret = LZ4_compress_default(input.data, output, static_cast<int>(input.size), capacity);
    if (ret <= 0) {
        return Status::Error<ErrorCode::COMPRESS_ERROR>(
                "Failed to compress {} bytes with lz4 into {} bytes", input.size, output_capacity);
    }
    *compressed_len = ret;
    return Status::OK();
}

size_t Lz4BlockCompressor::max_compressed_length(size_t input_len) const {
    return LZ4_compressBound(static_cast<int>(input_len));
}

std::string Lz4BlockCompressor::debug_info() const {
    return fmt::format("Lz4BlockCompressor. version: {}", LZ4_versionString());
}

ZstdBlockCompressor::ZstdBlockCompressor(int32_t level)
        : BlockCompressor(CompressionKind::ZSTD), _level(level) {}

ZstdBlockCompressor::~ZstdBlockCompressor() {
    if (_cctx != nullptr) {
        (void)ZSTD_freeCCtx(_cctx);
    }
}

Status ZstdBlockCompressor::init() {
    if (_level < ZSTD_minCLevel() || _level > ZSTD_maxCLevel()) {
        return Status::InvalidArgument("invalid zstd compression level: {}", _level);
    }
    _cctx = ZSTD_createCCtx();
    if (_cctx == nullptr) {
        return Status::MemoryAllocFailed("Failed to create zstd compress context");
    }
    return Status::OK();
}

Status ZstdBlockCompressor::compress(const Slice& input, char* output, size_t output_capacity,
                                     size_t* compressed_len) {
    size_t ret = ZSTD_compressCCtx(_cctx, output, output_capacity, input.data, input.size, _level);
    if (ZSTD_isError(ret)) {
        return Status::Error<ErrorCode::COMPRESS_ERROR>("Failed to compress with zstd: {}",
                                                        ZSTD_getErrorName(ret));
    }
    *compressed_len = ret;
    return Status::OK();
}

size_t ZstdBlockCompressor::max_compressed_length(size_t input_len) const {
    return ZSTD_compressBound(input_len);
}

std::string ZstdBlockCompressor::debug_info() const {
    return fmt::format("ZstdBlockCompressor. level: {}", _level);
}

} // namespace orcbuf
