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

#include <memory>

#include "common/macros.h"
#include "filesystem/write_stream.h"

namespace orcbuf {

class LocalWriteStream : public WriteStream {
public:
    LocalWriteStream(int fd, size_t buffer_size);
    ~LocalWriteStream() override;

    Status write(const char* from, size_t put_n) override;

    Status sync() override;

    Status close() override;

    // Flush buffer data to file. Mainly, call write for fd.
    Status flush();

    size_t bytes_written() const { return _bytes_written; }

private:
    size_t buffer_remain() const { return _buffer_size - _buffer_used; }

private:
    int _fd; // owned
    bool _dirty = false;

    std::unique_ptr<char[]> _buffer;
    size_t _buffer_size;
    size_t _buffer_used = 0;
    size_t _bytes_written = 0;

    DISALLOW_COPY_AND_ASSIGN(LocalWriteStream);
};

} // namespace orcbuf
