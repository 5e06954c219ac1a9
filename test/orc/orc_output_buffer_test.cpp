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

#include "orc/orc_output_buffer.h"

#include <gtest/gtest.h>
#include <openssl/evp.h>

#include <cmath>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "common/exception.h"
#include "filesystem/memory_stream.h"
#include "orc/chunked_output_buffer.h"
#include "orc/input_stream_checkpoint.h"
#include "testutil/orc_test_util.h"

namespace orcbuf {

class OrcOutputBufferTest : public testing::Test {
public:
    static ColumnWriterOptions make_options(CompressionKind kind, int32_t max_buffer_size) {
        ColumnWriterOptions options;
        options.compression_kind = kind;
        options.compression_max_buffer_size = max_buffer_size;
        return options;
    }

    static std::unique_ptr<OrcOutputBuffer> create_buffer(const ColumnWriterOptions& options) {
        std::unique_ptr<OrcOutputBuffer> buffer;
        Status st = OrcOutputBuffer::create(options, nullptr, &buffer);
        EXPECT_TRUE(st.ok()) << st;
        return buffer;
    }

    static std::string output_of(const OrcOutputBuffer& buffer) {
        MemoryWriteStream out;
        size_t written = 0;
        Status st = buffer.write_data_to(&out, &written);
        EXPECT_TRUE(st.ok()) << st;
        EXPECT_EQ(written, out.size());
        return out.data();
    }
};

TEST_F(OrcOutputBufferTest, SmallWriteStaysStaged) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 256));
    std::string data = "0123456789";
    ASSERT_TRUE(buffer->write_bytes(data.data(), data.size()).ok());

    EXPECT_EQ(10, buffer->size());
    EXPECT_EQ(10, buffer->estimate_output_data_size());
    EXPECT_EQ(10, buffer->get_checkpoint());
    EXPECT_THROW(buffer->get_output_data_size(), Exception);

    ASSERT_TRUE(buffer->flush().ok());
    EXPECT_EQ(10, buffer->get_output_data_size());
    EXPECT_EQ(data, output_of(*buffer));
}

TEST_F(OrcOutputBufferTest, OversizedWriteForwardsFullChunks) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 256));
    std::string data = random_bytes(300, 1);
    ASSERT_TRUE(buffer->write_bytes(data.data(), data.size()).ok());

    // one 256 byte chunk went straight to the sink, 44 bytes are staged
    EXPECT_EQ(300, buffer->size());
    EXPECT_EQ(300, buffer->estimate_output_data_size());
    EXPECT_EQ(256, buffer->buffer_capacity());
    EXPECT_THROW(buffer->get_output_data_size(), Exception);

    ASSERT_TRUE(buffer->close().ok());
    EXPECT_EQ(300, buffer->get_output_data_size());
    EXPECT_EQ(data, output_of(*buffer));
}

TEST_F(OrcOutputBufferTest, FillThenForwardKeepsOrder) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 256));
    std::string head = random_bytes(100, 2);
    std::string body = random_bytes(600, 3);
    ASSERT_TRUE(buffer->write_bytes(head.data(), head.size()).ok());
    ASSERT_TRUE(buffer->write_bytes(Slice(body)).ok());
    EXPECT_EQ(700, buffer->size());

    ASSERT_TRUE(buffer->flush().ok());
    EXPECT_EQ(head + body, output_of(*buffer));
}

TEST_F(OrcOutputBufferTest, HalvingCompressorSetsCompressedFlag) {
    auto options = make_options(CompressionKind::ZLIB, 256 * 1024);
    auto compressor = std::make_unique<HalvingBlockCompressor>();
    auto* compressor_ptr = compressor.get();
    std::unique_ptr<OrcOutputBuffer> buffer;
    ASSERT_TRUE(OrcOutputBuffer::create(options, std::move(compressor), nullptr, &buffer).ok());

    std::string data(1000, 'a');
    ASSERT_TRUE(buffer->write_bytes(data.data(), data.size()).ok());
    ASSERT_TRUE(buffer->flush().ok());
    EXPECT_EQ(1, compressor_ptr->compress_calls);

    std::string output = output_of(*buffer);
    ASSERT_EQ(503, output.size());
    // 500 << 1, compressed
    EXPECT_EQ(static_cast<char>(0xe8), output[0]);
    EXPECT_EQ(static_cast<char>(0x03), output[1]);
    EXPECT_EQ(static_cast<char>(0x00), output[2]);

    std::vector<TestFrame> frames;
    ASSERT_TRUE(parse_frames(output, &frames));
    ASSERT_EQ(1, frames.size());
    EXPECT_TRUE(frames[0].compressed);
    EXPECT_EQ(std::string(500, 'a'), frames[0].payload);
}

TEST_F(OrcOutputBufferTest, OversizedEncryptionFailsAndReleasesBuffer) {
    auto options = make_options(CompressionKind::ZLIB, 256 * 1024);
    auto pool = std::make_shared<CountingCompressionBufferPool>();
    options.compression_buffer_pool = pool;
    std::unique_ptr<OrcOutputBuffer> buffer;
    ASSERT_TRUE(OrcOutputBuffer::create(options, std::make_unique<HalvingBlockCompressor>(),
                                        std::make_unique<ExpandingDataEncryptor>((1 << 23) + 1),
                                        &buffer)
                        .ok());

    std::string data(1000, 'b');
    ASSERT_TRUE(buffer->write_bytes(data.data(), data.size()).ok());
    Status st = buffer->flush();
    EXPECT_TRUE(st.is<ErrorCode::ENCRYPTED_DATA_SIZE_EXCEEDED>()) << st;
    EXPECT_NE(std::string::npos, st.to_string().find("8388609"));
    EXPECT_EQ(1, pool->check_outs);
    EXPECT_EQ(1, pool->check_ins);
}

TEST_F(OrcOutputBufferTest, ResetDiscardsEarlierBlock) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 256));
    std::string first = random_bytes(100, 4);
    ASSERT_TRUE(buffer->write_bytes(first.data(), first.size()).ok());
    ASSERT_TRUE(buffer->flush().ok());
    ASSERT_TRUE(buffer->write_bytes(first.data(), 50).ok());

    buffer->reset();
    EXPECT_EQ(0, buffer->size());
    EXPECT_EQ(0, buffer->estimate_output_data_size());

    std::string fresh = "fresh block of twenty";
    fresh.resize(20);
    ASSERT_TRUE(buffer->write_bytes(fresh.data(), fresh.size()).ok());
    ASSERT_TRUE(buffer->flush().ok());
    EXPECT_EQ(20, buffer->size());
    EXPECT_EQ(20, buffer->get_output_data_size());
    EXPECT_EQ(fresh, output_of(*buffer));
}

TEST_F(OrcOutputBufferTest, ResetIsIdempotent) {
    auto buffer = create_buffer(make_options(CompressionKind::ZLIB, 1024));
    std::string data = repeated_text(3000);
    ASSERT_TRUE(buffer->write_bytes(data.data(), data.size()).ok());
    ASSERT_TRUE(buffer->flush().ok());

    buffer->reset();
    size_t retained = buffer->get_retained_size();
    buffer->reset();
    EXPECT_EQ(0, buffer->size());
    EXPECT_EQ(0, buffer->estimate_output_data_size());
    EXPECT_EQ(0, buffer->get_output_data_size());
    EXPECT_EQ(0, buffer->get_checkpoint());
    EXPECT_EQ(retained, buffer->get_retained_size());
    EXPECT_EQ("", output_of(*buffer));
}

TEST_F(OrcOutputBufferTest, ResetOutputBufferKeepsChunks) {
    auto options = make_options(CompressionKind::NONE, 4096);
    options.reset_output_buffer = true;
    auto buffer = create_buffer(options);
    std::string data = random_bytes(20000, 5);
    ASSERT_TRUE(buffer->write_bytes(data.data(), data.size()).ok());
    ASSERT_TRUE(buffer->flush().ok());
    size_t retained = buffer->get_retained_size();

    buffer->reset();
    EXPECT_EQ(retained, buffer->get_retained_size());

    ASSERT_TRUE(buffer->write_bytes(data.data(), data.size()).ok());
    ASSERT_TRUE(buffer->flush().ok());
    EXPECT_EQ(retained, buffer->get_retained_size());
    EXPECT_EQ(data, output_of(*buffer));
}

TEST_F(OrcOutputBufferTest, ResetReleasesChunksByDefault) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 4096));
    std::string data = random_bytes(20000, 6);
    ASSERT_TRUE(buffer->write_bytes(data.data(), data.size()).ok());
    ASSERT_TRUE(buffer->flush().ok());
    size_t retained = buffer->get_retained_size();

    buffer->reset();
    EXPECT_LT(buffer->get_retained_size(), retained);
    EXPECT_EQ(sizeof(OrcOutputBuffer) + buffer->buffer_capacity() +
                      sizeof(EagerChunkedOutputBuffer) + 8192,
              buffer->get_retained_size());
}

TEST_F(OrcOutputBufferTest, LazyBufferAllocatesOnFirstWrite) {
    auto options = make_options(CompressionKind::NONE, 4096);
    options.lazy_output_buffer = true;
    auto buffer = create_buffer(options);
    EXPECT_EQ(0, buffer->buffer_capacity());
    EXPECT_EQ(sizeof(OrcOutputBuffer), buffer->get_retained_size());
    EXPECT_EQ("OrcOutputBuffer{outputStream=null, bufferSize=0}", buffer->debug_string());

    ASSERT_TRUE(buffer->write_byte(7).ok());
    EXPECT_EQ(256, buffer->buffer_capacity());
    ASSERT_TRUE(buffer->flush().ok());
    EXPECT_EQ(std::string(1, 7), output_of(*buffer));
    EXPECT_NE(std::string::npos, buffer->debug_string().find("LazyChunkedOutputBuffer{size=1"));
}

TEST_F(OrcOutputBufferTest, CapacityGrowsUpToMaxBufferSize) {
    auto options = make_options(CompressionKind::NONE, 4096);
    options.lazy_output_buffer = true;
    auto buffer = create_buffer(options);
    std::string data = random_bytes(9700, 7);

    size_t last_capacity = 0;
    for (size_t offset = 0; offset < data.size(); offset += 97) {
        ASSERT_TRUE(buffer->write_bytes(data.data() + offset, 97).ok());
        EXPECT_GE(buffer->buffer_capacity(), last_capacity);
        EXPECT_LE(buffer->buffer_capacity(), buffer->max_buffer_size());
        last_capacity = buffer->buffer_capacity();
    }
    EXPECT_EQ(4096, last_capacity);
    EXPECT_EQ(data.size(), buffer->size());
    ASSERT_TRUE(buffer->flush().ok());
    EXPECT_EQ(data, output_of(*buffer));
}

TEST_F(OrcOutputBufferTest, MaxBufferSizeExcludesHeaderWhenCompressed) {
    EXPECT_EQ(1000, create_buffer(make_options(CompressionKind::NONE, 1000))->max_buffer_size());
    EXPECT_EQ(997, create_buffer(make_options(CompressionKind::ZSTD, 1000))->max_buffer_size());

    // framed chunks are capped by the 23 bit header length, plain ones are not
    EXPECT_EQ((1 << 23) - 1,
              create_buffer(make_options(CompressionKind::ZLIB, 1 << 24))->max_buffer_size());
    EXPECT_EQ(1 << 24,
              create_buffer(make_options(CompressionKind::NONE, 1 << 24))->max_buffer_size());
}

TEST_F(OrcOutputBufferTest, WriteWiderThanMaxBufferSizeThrows) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 4));
    EXPECT_EQ(4, buffer->buffer_capacity());
    ASSERT_TRUE(buffer->write_int(1).ok());
    try {
        static_cast<void>(buffer->write_long(2));
        FAIL() << "write_long should throw";
    } catch (const Exception& e) {
        EXPECT_EQ(ErrorCode::BUFFER_OVERFLOW, e.code());
    }

    auto compressed = create_buffer(make_options(CompressionKind::ZLIB, 4));
    EXPECT_EQ(1, compressed->max_buffer_size());
    ASSERT_TRUE(compressed->write_byte(1).ok());
    EXPECT_THROW(static_cast<void>(compressed->write_short(2)), Exception);
}

TEST_F(OrcOutputBufferTest, PrimitivesAreLittleEndian) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 256));
    ASSERT_TRUE(buffer->write_byte(-1).ok());
    ASSERT_TRUE(buffer->write_short(0x0102).ok());
    ASSERT_TRUE(buffer->write_int(0x01020304).ok());
    ASSERT_TRUE(buffer->write_long(0x0102030405060708L).ok());
    EXPECT_EQ(15, buffer->size());
    ASSERT_TRUE(buffer->flush().ok());

    const std::string expected = {'\xff', '\x02', '\x01', '\x04', '\x03', '\x02', '\x01', '\x08',
                                  '\x07', '\x06', '\x05', '\x04', '\x03', '\x02', '\x01'};
    EXPECT_EQ(expected, output_of(*buffer));
}

TEST_F(OrcOutputBufferTest, FloatingPointNaNIsCanonical) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 256));
    float signaling_float;
    uint32_t float_bits = 0xffc00001;
    memcpy(&signaling_float, &float_bits, sizeof(float_bits));
    double payload_double;
    uint64_t double_bits = 0xfff0000000000001ULL;
    memcpy(&payload_double, &double_bits, sizeof(double_bits));
    ASSERT_TRUE(std::isnan(signaling_float));
    ASSERT_TRUE(std::isnan(payload_double));

    ASSERT_TRUE(buffer->write_float(1.5F).ok());
    ASSERT_TRUE(buffer->write_float(signaling_float).ok());
    ASSERT_TRUE(buffer->write_double(-2.0).ok());
    ASSERT_TRUE(buffer->write_double(payload_double).ok());
    ASSERT_TRUE(buffer->flush().ok());

    std::string output = output_of(*buffer);
    ASSERT_EQ(24, output.size());
    const auto* bytes = reinterpret_cast<const uint8_t*>(output.data());
    EXPECT_EQ(0x3fc00000, decode_fixed32_le(bytes));
    EXPECT_EQ(0x7fc00000, decode_fixed32_le(bytes + 4));
    EXPECT_EQ(0xc000000000000000ULL, decode_fixed64_le(bytes + 8));
    EXPECT_EQ(0x7ff8000000000000ULL, decode_fixed64_le(bytes + 16));
}

TEST_F(OrcOutputBufferTest, WriteZerosAcrossChunks) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 256));
    ASSERT_TRUE(buffer->write_byte(1).ok());
    ASSERT_TRUE(buffer->write_zeros(1000).ok());
    ASSERT_TRUE(buffer->write_byte(2).ok());
    ASSERT_TRUE(buffer->write_zeros(0).ok());
    EXPECT_EQ(1002, buffer->size());
    ASSERT_TRUE(buffer->flush().ok());

    std::string expected(1002, '\0');
    expected[0] = 1;
    expected[1001] = 2;
    EXPECT_EQ(expected, output_of(*buffer));
}

TEST_F(OrcOutputBufferTest, CopyFromReadStream) {
    auto options = make_options(CompressionKind::NONE, 256);
    options.lazy_output_buffer = true;
    auto buffer = create_buffer(options);
    std::string data = random_bytes(700, 8);
    MemoryReadStream stream {Slice(data)};
    ASSERT_TRUE(buffer->write_bytes(&stream, data.size()).ok());
    EXPECT_EQ(700, buffer->size());
    ASSERT_TRUE(buffer->flush().ok());
    EXPECT_EQ(data, output_of(*buffer));
}

TEST_F(OrcOutputBufferTest, ShortReadStreamIsEndOfFile) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 256));
    std::string data = "0123456789";
    MemoryReadStream stream {Slice(data)};
    Status st = buffer->write_bytes(&stream, 20);
    EXPECT_TRUE(st.is<ErrorCode::END_OF_FILE>()) << st;
}

TEST_F(OrcOutputBufferTest, CheckpointOfFramedStream) {
    auto buffer = create_buffer(make_options(CompressionKind::ZLIB, 256 * 1024));
    ASSERT_TRUE(buffer->write_bytes("0123456789", 10).ok());
    int64_t checkpoint = buffer->get_checkpoint();
    EXPECT_EQ(0, decode_compressed_block_offset(checkpoint));
    EXPECT_EQ(10, decode_decompressed_offset(checkpoint));

    // 10 bytes are below the min compressible size: one raw frame of 13 bytes
    ASSERT_TRUE(buffer->flush().ok());
    EXPECT_EQ(13, buffer->get_output_data_size());
    ASSERT_TRUE(buffer->write_bytes("abcde", 5).ok());
    checkpoint = buffer->get_checkpoint();
    EXPECT_EQ(13, decode_compressed_block_offset(checkpoint));
    EXPECT_EQ(5, decode_decompressed_offset(checkpoint));
    EXPECT_EQ("13:5", input_stream_checkpoint_to_string(checkpoint));
    EXPECT_EQ(15, buffer->size());
}

TEST_F(OrcOutputBufferTest, ZlibFramesInflateBack) {
    auto buffer = create_buffer(make_options(CompressionKind::ZLIB, 1003));
    ASSERT_EQ(1000, buffer->max_buffer_size());
    std::string data = repeated_text(10000) + random_bytes(3000, 9) + repeated_text(777);

    const size_t steps[] = {1, 17, 333, 2048, 5};
    size_t offset = 0;
    for (size_t i = 0; offset < data.size(); ++i) {
        size_t n = std::min(steps[i % 5], data.size() - offset);
        ASSERT_TRUE(buffer->write_bytes(data.data() + offset, n).ok());
        offset += n;
    }
    ASSERT_TRUE(buffer->close().ok());

    std::vector<TestFrame> frames;
    ASSERT_TRUE(parse_frames(output_of(*buffer), &frames));
    std::string decoded;
    int compressed_frames = 0;
    for (const auto& frame : frames) {
        ASSERT_LE(frame.payload.size(), 1000);
        if (frame.compressed) {
            std::string chunk;
            ASSERT_TRUE(inflate_raw(frame.payload, 1000, &chunk));
            EXPECT_LT(frame.payload.size(), chunk.size());
            decoded += chunk;
            ++compressed_frames;
        } else {
            decoded += frame.payload;
        }
    }
    EXPECT_GT(compressed_frames, 0);
    EXPECT_EQ(data, decoded);
}

TEST_F(OrcOutputBufferTest, EncryptedFramesDecrypt) {
    std::string key = "0123456789abcdef";
    std::unique_ptr<DataEncryptor> encryptor;
    ASSERT_TRUE(AesCtrDataEncryptor::create(key, &encryptor).ok());
    std::unique_ptr<OrcOutputBuffer> buffer;
    ASSERT_TRUE(OrcOutputBuffer::create(make_options(CompressionKind::NONE, 256),
                                        std::move(encryptor), &buffer)
                        .ok());

    std::string data = random_bytes(100, 10);
    ASSERT_TRUE(buffer->write_bytes(data.data(), data.size()).ok());
    int64_t checkpoint = buffer->get_checkpoint();
    EXPECT_EQ(0, decode_compressed_block_offset(checkpoint));
    EXPECT_EQ(100, decode_decompressed_offset(checkpoint));
    ASSERT_TRUE(buffer->flush().ok());

    std::vector<TestFrame> frames;
    ASSERT_TRUE(parse_frames(output_of(*buffer), &frames));
    ASSERT_EQ(1, frames.size());
    EXPECT_FALSE(frames[0].compressed);
    ASSERT_EQ(116, frames[0].payload.size());

    const auto* payload = reinterpret_cast<const unsigned char*>(frames[0].payload.data());
    std::string plain(100, '\0');
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    ASSERT_NE(nullptr, ctx);
    int len = 0;
    EXPECT_EQ(1, EVP_DecryptInit_ex(ctx, EVP_aes_128_ctr(), nullptr,
                                    reinterpret_cast<const unsigned char*>(key.data()), payload));
    EXPECT_EQ(1, EVP_DecryptUpdate(ctx, reinterpret_cast<unsigned char*>(plain.data()), &len,
                                   payload + 16, 100));
    EVP_CIPHER_CTX_free(ctx);
    EXPECT_EQ(100, len);
    EXPECT_EQ(data, plain);
}

TEST_F(OrcOutputBufferTest, WriteDataToRequiresFlush) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 256));
    EXPECT_EQ("", output_of(*buffer));

    ASSERT_TRUE(buffer->write_byte(1).ok());
    MemoryWriteStream out;
    size_t written = 0;
    EXPECT_THROW(static_cast<void>(buffer->write_data_to(&out, &written)), Exception);
}

TEST_F(OrcOutputBufferTest, RetainedSizeCountsStagingAndSink) {
    auto buffer = create_buffer(make_options(CompressionKind::NONE, 256));
    EXPECT_EQ(sizeof(OrcOutputBuffer) + 256, buffer->get_retained_size());

    ASSERT_TRUE(buffer->write_bytes("0123456789", 10).ok());
    ASSERT_TRUE(buffer->flush().ok());
    EXPECT_EQ(sizeof(OrcOutputBuffer) + 256 + sizeof(EagerChunkedOutputBuffer) + 8192,
              buffer->get_retained_size());
    EXPECT_EQ(
            "OrcOutputBuffer{outputStream=EagerChunkedOutputBuffer{size=10, chunks=1, "
            "retainedSize=" +
                    std::to_string(sizeof(EagerChunkedOutputBuffer) + 8192) +
                    "}, bufferSize=256}",
            buffer->debug_string());
}

TEST_F(OrcOutputBufferTest, CreateRejectsInvalidOptions) {
    std::unique_ptr<OrcOutputBuffer> buffer;
    Status st = OrcOutputBuffer::create(make_options(CompressionKind::NONE, 3), nullptr, &buffer);
    EXPECT_TRUE(st.is<ErrorCode::INVALID_ARGUMENT>()) << st;

    auto options = make_options(CompressionKind::ZLIB, 1024);
    options.compression_level = 42;
    st = OrcOutputBuffer::create(options, nullptr, &buffer);
    EXPECT_TRUE(st.is<ErrorCode::INVALID_ARGUMENT>()) << st;
    EXPECT_TRUE(buffer == nullptr);
}

} // namespace orcbuf
