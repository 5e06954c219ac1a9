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

#include "filesystem/local_file_system.h"

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "filesystem/memory_stream.h"
#include "filesystem/read_stream.h"
#include "filesystem/write_stream.h"
#include "orc/column_writer_options.h"
#include "orc/orc_output_buffer.h"
#include "testutil/orc_test_util.h"

namespace orcbuf {

class LocalFileSystemTest : public testing::Test {
public:
    void SetUp() override {
        _root = (std::filesystem::temp_directory_path() /
                 ("orcbuf_local_fs_test_" + std::to_string(::getpid())))
                        .string();
        std::filesystem::remove_all(_root);
        _fs = std::make_unique<LocalFileSystem>(_root);
        ASSERT_TRUE(_fs->create_directory("").ok());
    }

    void TearDown() override { std::filesystem::remove_all(_root); }

    std::string read_all(const std::string& path) {
        std::unique_ptr<ReadStream> in;
        Status st = _fs->read_file(path, &in);
        EXPECT_TRUE(st.ok()) << st;
        if (!st.ok()) {
            return "";
        }
        std::string res;
        char buf[1000];
        size_t read_n = 0;
        do {
            st = in->read(buf, sizeof(buf), &read_n);
            EXPECT_TRUE(st.ok()) << st;
            res.append(buf, read_n);
        } while (st.ok() && read_n > 0);
        EXPECT_TRUE(in->close().ok());
        return res;
    }

protected:
    std::string _root;
    std::unique_ptr<LocalFileSystem> _fs;
};

TEST_F(LocalFileSystemTest, WriteReadDelete) {
    Status st = _fs->create_directory("");
    EXPECT_TRUE(st.is<ErrorCode::ALREADY_EXIST>()) << st;
    ASSERT_TRUE(_fs->create_directory("a/b").ok());

    std::unique_ptr<WriteStream> out;
    ASSERT_TRUE(_fs->write_file("a/b/data", &out).ok());
    std::string payload = repeated_text(5000);
    ASSERT_TRUE(out->write(payload.data(), 1000).ok());
    ASSERT_TRUE(out->write(payload.data() + 1000, 4000).ok());
    ASSERT_TRUE(out->sync().ok());
    ASSERT_TRUE(out->close().ok());

    bool exists = false;
    ASSERT_TRUE(_fs->exists("a/b/data", &exists).ok());
    EXPECT_TRUE(exists);
    size_t size = 0;
    ASSERT_TRUE(_fs->file_size("a/b/data", &size).ok());
    EXPECT_EQ(5000, size);
    EXPECT_EQ(payload, read_all("a/b/data"));

    EXPECT_FALSE(_fs->delete_file("a/b").ok());
    ASSERT_TRUE(_fs->delete_file("a/b/data").ok());
    ASSERT_TRUE(_fs->exists("a/b/data", &exists).ok());
    EXPECT_FALSE(exists);
    // deleting a missing file is fine
    EXPECT_TRUE(_fs->delete_file("a/b/data").ok());

    std::unique_ptr<ReadStream> in;
    EXPECT_FALSE(_fs->read_file("a/b/data", &in).ok());
}

TEST_F(LocalFileSystemTest, ReadSeek) {
    std::unique_ptr<WriteStream> out;
    ASSERT_TRUE(_fs->write_file("seek", &out).ok());
    ASSERT_TRUE(out->write("0123456789", 10).ok());
    ASSERT_TRUE(out->close().ok());

    std::unique_ptr<ReadStream> in;
    ASSERT_TRUE(_fs->read_file("seek", &in).ok());
    char buf[4];
    size_t read_n = 0;
    ASSERT_TRUE(in->seek(6).ok());
    ASSERT_TRUE(in->read(buf, sizeof(buf), &read_n).ok());
    EXPECT_EQ("6789", std::string(buf, read_n));
    size_t pos = 0;
    ASSERT_TRUE(in->tell(&pos).ok());
    EXPECT_EQ(10, pos);
    ASSERT_TRUE(in->close().ok());
}

// The same stream written to a file and to memory gives the same bytes.
TEST_F(LocalFileSystemTest, OrcOutputBufferToFile) {
    ColumnWriterOptions options;
    options.compression_kind = CompressionKind::ZLIB;
    options.compression_max_buffer_size = 1024;
    std::unique_ptr<OrcOutputBuffer> buffer;
    ASSERT_TRUE(OrcOutputBuffer::create(options, nullptr, &buffer).ok());

    std::string text = repeated_text(10000);
    std::string noise = random_bytes(3000, 7);
    ASSERT_TRUE(buffer->write_bytes(Slice(text)).ok());
    ASSERT_TRUE(buffer->write_bytes(Slice(noise)).ok());
    ASSERT_TRUE(buffer->close().ok());

    MemoryWriteStream memory;
    size_t memory_written = 0;
    ASSERT_TRUE(buffer->write_data_to(&memory, &memory_written).ok());

    std::unique_ptr<WriteStream> out;
    ASSERT_TRUE(_fs->write_file("column.orc", &out).ok());
    size_t file_written = 0;
    ASSERT_TRUE(buffer->write_data_to(out.get(), &file_written).ok());
    ASSERT_TRUE(out->close().ok());

    EXPECT_EQ(memory_written, file_written);
    EXPECT_EQ(buffer->get_output_data_size(), file_written);
    std::string file_data = read_all("column.orc");
    EXPECT_EQ(memory.data(), file_data);

    std::vector<TestFrame> frames;
    ASSERT_TRUE(parse_frames(file_data, &frames));
    std::string decoded;
    for (const auto& frame : frames) {
        if (frame.compressed) {
            std::string inflated;
            ASSERT_TRUE(inflate_raw(frame.payload, 1024, &inflated));
            decoded += inflated;
        } else {
            decoded += frame.payload;
        }
    }
    EXPECT_EQ(text + noise, decoded);
}

} // namespace orcbuf
