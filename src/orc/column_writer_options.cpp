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

#include "orc/column_writer_options.h"

#include <fmt/format.h>

#include <mutex>

#include "common/config.h"

namespace orcbuf {

Status ColumnWriterOptions::from_config(ColumnWriterOptions* options) {
    std::string kind;
    {
        std::lock_guard<std::mutex> lock(*config::get_mutable_string_config_lock());
        kind = config::orc_compression_kind;
    }
    RETURN_IF_ERROR(parse_compression_kind(kind, &options->compression_kind));
    options->compression_level = config::orc_compression_level;
    options->compression_max_buffer_size = config::orc_compression_max_buffer_size;
    options->min_output_buffer_chunk_size = config::orc_min_output_buffer_chunk_size;
    options->max_output_buffer_chunk_size = config::orc_max_output_buffer_chunk_size;
    options->lazy_output_buffer = config::orc_lazy_output_buffer;
    options->reset_output_buffer = config::orc_reset_output_buffer;
    return options->validate();
}

Status ColumnWriterOptions::validate() const {
    // PAGE_HEADER_SIZE of the chunk framer
    if (compression_max_buffer_size <= 3) {
        return Status::InvalidArgument(
                "maximum buffer size should be greater than page header size, got {}",
                compression_max_buffer_size);
    }
    if (min_output_buffer_chunk_size <= 0 ||
        max_output_buffer_chunk_size < min_output_buffer_chunk_size) {
        return Status::InvalidArgument("invalid output buffer chunk size range [{}, {}]",
                                       min_output_buffer_chunk_size,
                                       max_output_buffer_chunk_size);
    }
    if (compression_buffer_pool == nullptr) {
        return Status::InvalidArgument("compression buffer pool is null");
    }
    return Status::OK();
}

std::string ColumnWriterOptions::debug_string() const {
    return fmt::format(
            "ColumnWriterOptions{{compressionKind={}, compressionLevel={}, "
            "compressionMaxBufferSize={}, minOutputBufferChunkSize={}, "
            "maxOutputBufferChunkSize={}, lazyOutputBuffer={}, resetOutputBuffer={}}}",
            compression_kind_to_string(compression_kind), compression_level,
            compression_max_buffer_size, min_output_buffer_chunk_size,
            max_output_buffer_chunk_size, lazy_output_buffer, reset_output_buffer);
}

} // namespace orcbuf
