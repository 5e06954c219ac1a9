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
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace orcbuf {

// A Slice is a (data, size) view over bytes owned by someone else.
struct Slice {
    char* data = nullptr;
    size_t size = 0;

    Slice() = default;
    Slice(const char* d, size_t n) : data(const_cast<char*>(d)), size(n) {}
    Slice(const uint8_t* d, size_t n)
            : data(reinterpret_cast<char*>(const_cast<uint8_t*>(d))), size(n) {}
    Slice(const std::string& s) : data(const_cast<char*>(s.data())), size(s.size()) {}
    Slice(std::string_view s) : data(const_cast<char*>(s.data())), size(s.size()) {}

    const char* get_data() const { return data; }
    size_t get_size() const { return size; }
    bool empty() const { return size == 0; }

    char operator[](size_t n) const { return data[n]; }

    std::string to_string() const { return std::string(data, size); }

    bool operator==(const Slice& other) const {
        return size == other.size && (size == 0 || memcmp(data, other.data, size) == 0);
    }
};

} // namespace orcbuf
