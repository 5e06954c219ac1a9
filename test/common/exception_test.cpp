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

#include "common/exception.h"

#include <gtest/gtest.h>

#include <string>

namespace orcbuf {

static Status throw_and_convert(int code) {
    RETURN_IF_CATCH_EXCEPTION(throw Exception(code, "pending {} bytes", 44));
    return Status::OK();
}

static Status status_or_exception(bool do_throw) {
    RETURN_IF_ERROR_OR_CATCH_EXCEPTION([&]() -> Status {
        if (do_throw) {
            throw Exception(ErrorCode::BUFFER_OVERFLOW, "too wide");
        }
        return Status::NotSupported("not supported");
    }());
    return Status::OK();
}

TEST(ExceptionTest, Format) {
    Exception e(ErrorCode::ILLEGAL_STATE, "Buffer must be flushed, {} bytes pending", 10);
    EXPECT_EQ(ErrorCode::ILLEGAL_STATE, e.code());
    EXPECT_EQ("[E16] Buffer must be flushed, 10 bytes pending", e.to_string());
    EXPECT_STREQ(e.to_string().c_str(), e.what());

    Status st = e.to_status();
    EXPECT_TRUE(st.is<ErrorCode::ILLEGAL_STATE>());
    EXPECT_EQ("[E16] Buffer must be flushed, 10 bytes pending", st.msg());
}

TEST(ExceptionTest, FromStatusAndNested) {
    Exception from_status(Status::IOError("disk full"));
    EXPECT_EQ(ErrorCode::IO_ERROR, from_status.code());
    EXPECT_EQ("[E11] disk full", from_status.to_string());

    Exception nested(from_status, ErrorCode::INTERNAL_ERROR, "flush failed");
    EXPECT_EQ("[E6] flush failed\nCaused by:[E11] disk full", nested.to_string());
}

TEST(ExceptionTest, CatchAtApiBoundary) {
    Status st = throw_and_convert(ErrorCode::CHUNK_SIZE_EXCEEDED);
    EXPECT_TRUE(st.is<ErrorCode::CHUNK_SIZE_EXCEEDED>());
    EXPECT_EQ("[E-262] pending 44 bytes", st.msg());

    st = status_or_exception(true);
    EXPECT_TRUE(st.is<ErrorCode::BUFFER_OVERFLOW>());
    st = status_or_exception(false);
    EXPECT_TRUE(st.is<ErrorCode::NOT_IMPLEMENTED_ERROR>());
}

TEST(ExceptionTest, ThrowIfError) {
    EXPECT_NO_THROW(THROW_IF_ERROR(Status::OK()));
    try {
        THROW_IF_ERROR(Status::Corruption("bad header"));
        FAIL() << "THROW_IF_ERROR should throw";
    } catch (const Exception& e) {
        EXPECT_EQ(ErrorCode::CORRUPTION, e.code());
    }
}

} // namespace orcbuf
