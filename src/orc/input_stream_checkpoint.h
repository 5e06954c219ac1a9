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
#include <vector>

namespace orcbuf {

// A checkpoint of a compressed stream packs two offsets into 64 bits:
//   high 32 bits: offset of the chunk header inside the compressed stream
//   low 32 bits:  offset of the position inside the decompressed chunk
// Uncompressed streams use the plain byte offset instead.
int64_t create_input_stream_checkpoint(int32_t compressed_block_offset,
                                       int32_t decompressed_offset);

int32_t decode_compressed_block_offset(int64_t checkpoint);

int32_t decode_decompressed_offset(int64_t checkpoint);

// Positions recorded in the row index: [block offset, offset in block] for compressed
// streams, [byte offset] otherwise.
std::vector<int64_t> create_input_stream_position_list(bool compressed, int64_t checkpoint);

std::string input_stream_checkpoint_to_string(int64_t checkpoint);

} // namespace orcbuf
