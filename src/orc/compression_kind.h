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

#include <cstdint>
#include <string>

#include "common/status.h"

namespace orcbuf {

// Values follow the CompressionKind enum of the ORC postscript. LZO is not supported.
enum class CompressionKind : int32_t {
    NONE = 0,
    ZLIB = 1,
    SNAPPY = 2,
    LZ4 = 4,
    ZSTD = 5,
};

// Chunks shorter than this are never handed to the codec.
int32_t min_compressible_size(CompressionKind kind);

const char* compression_kind_to_string(CompressionKind kind);

// Case insensitive, e.g. "zstd" or "ZSTD".
Status parse_compression_kind(const std::string& name, CompressionKind* kind);

} // namespace orcbuf
