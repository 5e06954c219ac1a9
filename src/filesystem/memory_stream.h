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

#include <string>

#include "filesystem/read_stream.h"
#include "filesystem/write_stream.h"
#include "util/slice.h"

namespace orcbuf {

// Collects everything written into a string, e.g. to assemble a stripe in memory.
class MemoryWriteStream final : public WriteStream {
public:
    MemoryWriteStream() = default;
    ~MemoryWriteStream() override = default;

    Status write(const char* from, size_t n) override;

    Status sync() override { return Status::OK(); }

    Status close() override;

    const std::string& data() const { return _data; }
    size_t size() const { return _data.size(); }
    void clear() { _data.clear(); }

private:
    std::string _data;
    bool _closed = false;
};

// Reads from bytes owned by the caller.
class MemoryReadStream final : public ReadStream {
public:
    explicit MemoryReadStream(Slice data) : _data(data) {}
    ~MemoryReadStream() override = default;

    Status read(char* to, size_t req_n, size_t* read_n) override;

    Status seek(size_t position) override;

    Status tell(size_t* position) const override;

    Status close() override;

    bool closed() const override { return _closed; }

private:
    Slice _data;
    size_t _offset = 0;
    bool _closed = false;
};

} // namespace orcbuf
