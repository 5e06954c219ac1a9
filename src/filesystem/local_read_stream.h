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

#include <cstddef>
#include <memory>

#include "common/macros.h"
#include "filesystem/read_stream.h"

namespace orcbuf {

class LocalReadStream final : public ReadStream {
public:
    LocalReadStream(int fd, size_t file_size, size_t buffer_size);
    ~LocalReadStream() override;

    Status read(char* to, size_t req_n, size_t* read_n) override;

    Status seek(size_t position) override;

    Status tell(size_t* position) const override;

    Status close() override;

    bool closed() const override { return _fd == -1; }

    size_t file_size() const { return _file_size; }

private:
    Status fill();

    bool eof() const { return _offset >= _file_size; }

    int _fd; // owned
    size_t _file_size;
    // file offset
    size_t _offset = 0;

    std::unique_ptr<char[]> _buffer;
    size_t _buffer_size;
    // file range held by _buffer
    size_t _buffer_begin = 0;
    size_t _buffer_end = 0;

    DISALLOW_COPY_AND_ASSIGN(LocalReadStream);
};

} // namespace orcbuf
