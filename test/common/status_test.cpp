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

#include "common/status.h"

#include <gtest/gtest.h>

#include <string>

namespace orcbuf {

static Status fail_when(bool fail) {
    if (fail) {
        return Status::IOError("disk {} is gone", "/data1");
    }
    return Status::OK();
}

static Status propagate(bool fail, int* steps) {
    RETURN_IF_ERROR(fail_when(false));
    ++*steps;
    RETURN_IF_ERROR(fail_when(fail));
    ++*steps;
    return Status::OK();
}

TEST(StatusTest, OK) {
    Status st = Status::OK();
    EXPECT_TRUE(st.ok());
    EXPECT_TRUE(st);
    EXPECT_EQ(ErrorCode::OK, st.code());
    EXPECT_EQ("[OK]", st.to_string());
    // prepend and append do not touch an OK status
    st.prepend("a").append("b");
    EXPECT_EQ("", st.msg());
}

TEST(StatusTest, Error) {
    Status st = Status::Error<ErrorCode::CHUNK_SIZE_EXCEEDED>("chunk {} > {}", 300, 256);
    EXPECT_FALSE(st.ok());
    EXPECT_TRUE(st.is<ErrorCode::CHUNK_SIZE_EXCEEDED>());
    EXPECT_EQ(-262, st.code());
    EXPECT_EQ("chunk 300 > 256", st.msg());
    EXPECT_EQ("[CHUNK_SIZE_EXCEEDED]chunk 300 > 256", st.to_string());

    // no arguments: braces are kept as is
    st = Status::InvalidArgument("bad {}");
    EXPECT_EQ("[INVALID_ARGUMENT]bad {}", st.to_string());

    st = Status::Error(-999, "unknown");
    EXPECT_EQ("[E-999]unknown", st.to_string());
}

TEST(StatusTest, CopyAndCompare) {
    Status st = Status::EndOfFile("eof");
    Status copy = st;
    EXPECT_EQ(st, copy);
    EXPECT_EQ("eof", copy.msg());
    EXPECT_NE(st, Status::OK());
    EXPECT_EQ(Status::EndOfFile("other"), st);

    Status moved = std::move(copy);
    EXPECT_TRUE(moved.is<ErrorCode::END_OF_FILE>());
}

TEST(StatusTest, PrependAppend) {
    Status st = Status::IOError("write failed");
    st.prepend("flush: ").append(", retry later");
    EXPECT_EQ("flush: write failed, retry later", st.msg());
}

TEST(StatusTest, ReturnIfError) {
    int steps = 0;
    EXPECT_TRUE(propagate(false, &steps).ok());
    EXPECT_EQ(2, steps);

    steps = 0;
    Status st = propagate(true, &steps);
    EXPECT_TRUE(st.is<ErrorCode::IO_ERROR>());
    EXPECT_EQ("disk /data1 is gone", st.msg());
    EXPECT_EQ(1, steps);

    WARN_IF_ERROR(fail_when(true), "ignored in test");
}

TEST(StatusTest, ErrorCodeName) {
    EXPECT_STREQ("ENCRYPTED_DATA_SIZE_EXCEEDED",
                 ErrorCode::error_code_name(ErrorCode::ENCRYPTED_DATA_SIZE_EXCEEDED));
    EXPECT_STREQ("ILLEGAL_STATE", ErrorCode::error_code_name(16));
    EXPECT_EQ(nullptr, ErrorCode::error_code_name(12345));
}

} // namespace orcbuf
