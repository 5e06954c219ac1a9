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

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace orcbuf {

TEST(CompressionBufferPoolTest, LastUsedHandsBackReturnedBuffer) {
    LastUsedCompressionBufferPool pool;
    EXPECT_EQ(0, pool.get_retained_bytes());

    std::vector<char> buffer = pool.check_out(100);
    EXPECT_EQ(100, buffer.size());
    const char* address = buffer.data();
    pool.check_in(std::move(buffer));
    EXPECT_GE(pool.get_retained_bytes(), 100);

    std::vector<char> smaller = pool.check_out(50);
    EXPECT_EQ(50, smaller.size());
    EXPECT_EQ(address, smaller.data());
    EXPECT_EQ(0, pool.get_retained_bytes());
    pool.check_in(std::move(smaller));

    // grown back to its capacity without reallocation
    std::vector<char> again = pool.check_out(100);
    EXPECT_EQ(100, again.size());
    EXPECT_EQ(address, again.data());
    pool.check_in(std::move(again));

    std::vector<char> larger = pool.check_out(1000);
    EXPECT_EQ(1000, larger.size());
    EXPECT_GE(pool.get_retained_bytes(), 100);
    pool.check_in(std::move(larger));
    EXPECT_GE(pool.get_retained_bytes(), 1000);
}

TEST(CompressionBufferPoolTest, NoopAllocatesEveryTime) {
    NoopCompressionBufferPool pool;
    std::vector<char> buffer = pool.check_out(64);
    EXPECT_EQ(64, buffer.size());
    pool.check_in(std::move(buffer));
    EXPECT_EQ(0, pool.get_retained_bytes());
}

} // namespace orcbuf
