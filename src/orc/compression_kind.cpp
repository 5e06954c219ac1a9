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

#include "orc/compression_kind.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace orcbuf {

static constexpr int32_t DEFAULT_MIN_COMPRESSIBLE_SIZE = 256;

int32_t min_compressible_size(CompressionKind kind) {
    switch (kind) {
    case CompressionKind::NONE:
        return std::numeric_limits<int32_t>::max();
    case CompressionKind::ZLIB:
    case CompressionKind::SNAPPY:
    case CompressionKind::LZ4:
    case CompressionKind::ZSTD:
        return DEFAULT_MIN_COMPRESSIBLE_SIZE;
    }
    return std::numeric_limits<int32_t>::max();
}

const char* compression_kind_to_string(CompressionKind kind) {
    switch (kind) {
    case CompressionKind::NONE:
        return "NONE";
    case CompressionKind::ZLIB:
        return "ZLIB";
    case CompressionKind::SNAPPY:
        return "SNAPPY";
    case CompressionKind::LZ4:
        return "LZ4";
    case CompressionKind::ZSTD:
        return "ZSTD";
    }
    return "UNKNOWN";
}

Status parse_compression_kind(const std::string& name, CompressionKind* kind) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (upper == "NONE") {
        *kind = CompressionKind::NONE;
    } else if (upper == "ZLIB") {
        *kind = CompressionKind::ZLIB;
    } else if (upper == "SNAPPY") {
        *kind = CompressionKind::SNAPPY;
    } else if (upper == "LZ4") {
        *kind = CompressionKind::LZ4;
    } else if (upper == "ZSTD") {
        *kind = CompressionKind::ZSTD;
    } else {
        return Status::Error<ErrorCode::UNSUPPORTED_COMPRESSION_KIND>(
                "unsupported compression kind: {}", name);
    }
    return Status::OK();
}

} // namespace orcbuf
