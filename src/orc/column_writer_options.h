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
#include <memory>
#include <string>

#include "common/status.h"
#include "orc/compression_buffer_pool.h"
#include "orc/compression_kind.h"

namespace orcbuf {

struct ColumnWriterOptions {
    CompressionKind compression_kind = CompressionKind::NONE;
    // BlockCompressor::DEFAULT_LEVEL selects the codec default
    int32_t compression_level = -1;
    // max size of one chunk including the 3 byte header
    int32_t compression_max_buffer_size = 256 * 1024;
    int32_t min_output_buffer_chunk_size = 8 * 1024;
    int32_t max_output_buffer_chunk_size = 1024 * 1024;
    bool lazy_output_buffer = false;
    bool reset_output_buffer = false;
    std::shared_ptr<CompressionBufferPool> compression_buffer_pool =
            std::make_shared<LastUsedCompressionBufferPool>();

    // Fill options from the orc_* config fields.
    static Status from_config(ColumnWriterOptions* options);

    Status validate() const;

    std::string debug_string() const;
};

} // namespace orcbuf
