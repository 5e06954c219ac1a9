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

#include "filesystem/memory_stream.h"

#include <algorithm>
#include <cstring>

namespace orcbuf {

Status MemoryWriteStream::write(const char* from, size_t n) {
    if (_closed) {
        return Status::IOError("write to a closed memory stream");
    }
    _data.append(from, n);
    return Status::OK();
}

Status MemoryWriteStream::close() {
    _closed = true;
    return Status::OK();
}

Status MemoryReadStream::read(char* to, size_t req_n, size_t* read_n) {
    if (_closed) {
        return Status::IOError("read from a closed memory stream");
    }
    size_t n = std::min(req_n, _data.size - _offset);
    if (n > 0) {
        memcpy(to, _data.data + _offset, n);
    }
    _offset += n;
    *read_n = n;
    return Status::OK();
}

Status MemoryReadStream::seek(size_t position) {
    if (position > _data.size) {
        return Status::IOError("Position {} exceeds stream size {}", position, _data.size);
    }
    _offset = position;
    return Status::OK();
}

Status MemoryReadStream::tell(size_t* position) const {
    *position = _offset;
    return Status::OK();
}

Status MemoryReadStream::close() {
    _closed = true;
    return Status::OK();
}

} // namespace orcbuf
