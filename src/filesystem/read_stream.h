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

#include "common/status.h"

namespace orcbuf {

class ReadStream {
public:
    ReadStream() = default;
    virtual ~ReadStream() = default;

    // Read up to `req_n` bytes into `to`. `*read_n` is 0 only at the end of the stream.
    virtual Status read(char* to, size_t req_n, size_t* read_n) = 0;

    virtual Status seek(size_t position) = 0;

    virtual Status tell(size_t* position) const = 0;

    virtual Status close() = 0;

    virtual bool closed() const = 0;
};

} // namespace orcbuf
