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
#include <cstring>

namespace orcbuf {

// Fixed width little endian encoders. The target platforms are little endian,
// so the encoders are plain memcpy.
inline void encode_fixed8(uint8_t* buf, uint8_t val) {
    *buf = val;
}

inline void encode_fixed16_le(uint8_t* buf, uint16_t val) {
    memcpy(buf, &val, sizeof(val));
}

inline void encode_fixed32_le(uint8_t* buf, uint32_t val) {
    memcpy(buf, &val, sizeof(val));
}

inline void encode_fixed64_le(uint8_t* buf, uint64_t val) {
    memcpy(buf, &val, sizeof(val));
}

inline uint8_t decode_fixed8(const uint8_t* buf) {
    return *buf;
}

inline uint16_t decode_fixed16_le(const uint8_t* buf) {
    uint16_t res;
    memcpy(&res, buf, sizeof(res));
    return res;
}

inline uint32_t decode_fixed32_le(const uint8_t* buf) {
    uint32_t res;
    memcpy(&res, buf, sizeof(res));
    return res;
}

inline uint64_t decode_fixed64_le(const uint8_t* buf) {
    uint64_t res;
    memcpy(&res, buf, sizeof(res));
    return res;
}

// ORC chunk header: 3 bytes, little endian, independent of host byte order.
inline void encode_fixed24_le(uint8_t* buf, uint32_t val) {
    buf[0] = static_cast<uint8_t>(val & 0xff);
    buf[1] = static_cast<uint8_t>((val >> 8) & 0xff);
    buf[2] = static_cast<uint8_t>((val >> 16) & 0xff);
}

inline uint32_t decode_fixed24_le(const uint8_t* buf) {
    return static_cast<uint32_t>(buf[0]) | (static_cast<uint32_t>(buf[1]) << 8) |
           (static_cast<uint32_t>(buf[2]) << 16);
}

} // namespace orcbuf
