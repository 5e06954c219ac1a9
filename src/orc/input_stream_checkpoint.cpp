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

#include "orc/input_stream_checkpoint.h"

#include <fmt/format.h>

namespace orcbuf {

int64_t create_input_stream_checkpoint(int32_t compressed_block_offset,
                                       int32_t decompressed_offset) {
    return (static_cast<int64_t>(compressed_block_offset) << 32) |
           static_cast<int64_t>(static_cast<uint32_t>(decompressed_offset));
}

int32_t decode_compressed_block_offset(int64_t checkpoint) {
    return static_cast<int32_t>(checkpoint >> 32);
}

int32_t decode_decompressed_offset(int64_t checkpoint) {
    return static_cast<int32_t>(checkpoint & 0xffffffffL);
}

std::vector<int64_t> create_input_stream_position_list(bool compressed, int64_t checkpoint) {
    if (compressed) {
        return {decode_compressed_block_offset(checkpoint), decode_decompressed_offset(checkpoint)};
    }
    return {checkpoint};
}

std::string input_stream_checkpoint_to_string(int64_t checkpoint) {
    return fmt::format("{}:{}", decode_compressed_block_offset(checkpoint),
                       decode_decompressed_offset(checkpoint));
}

} // namespace orcbuf
