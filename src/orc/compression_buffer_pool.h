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
#include <vector>

namespace orcbuf {

// Scratch buffers for the compressors. A buffer that is checked out must be checked
// back in once the compressed bytes have been copied out of it.
// Pools are not thread safe; share one only between writers of the same thread.
class CompressionBufferPool {
public:
    virtual ~CompressionBufferPool() = default;

    // Returns a buffer whose size() is at least `min_size`.
    virtual std::vector<char> check_out(size_t min_size) = 0;

    virtual void check_in(std::vector<char>&& buffer) = 0;

    // Bytes held by the pool while no buffer is checked out.
    virtual size_t get_retained_bytes() const = 0;
};

// Keeps the most recently checked in buffer.
class LastUsedCompressionBufferPool final : public CompressionBufferPool {
public:
    std::vector<char> check_out(size_t min_size) override;

    void check_in(std::vector<char>&& buffer) override;

    size_t get_retained_bytes() const override { return _last_used.capacity(); }

private:
    std::vector<char> _last_used;
};

// Allocates on every check out and frees on check in.
class NoopCompressionBufferPool final : public CompressionBufferPool {
public:
    std::vector<char> check_out(size_t min_size) override { return std::vector<char>(min_size); }

    void check_in(std::vector<char>&& buffer) override {
        std::vector<char> released = std::move(buffer);
    }

    size_t get_retained_bytes() const override { return 0; }
};

} // namespace orcbuf
