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

#include "orc/compression_buffer_pool.h"

#include <utility>

namespace orcbuf {

std::vector<char> LastUsedCompressionBufferPool::check_out(size_t min_size) {
    if (_last_used.size() >= min_size) {
        return std::exchange(_last_used, std::vector<char>());
    }
    if (_last_used.capacity() >= min_size) {
        _last_used.resize(min_size);
        return std::exchange(_last_used, std::vector<char>());
    }
    return std::vector<char>(min_size);
}

void LastUsedCompressionBufferPool::check_in(std::vector<char>&& buffer) {
    _last_used = std::move(buffer);
}

} // namespace orcbuf
