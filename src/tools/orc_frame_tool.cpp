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

#include <gflags/gflags.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "common/config.h"
#include "common/exception.h"
#include "common/logging.h"
#include "common/status.h"
#include "filesystem/local_file_system.h"
#include "filesystem/read_stream.h"
#include "filesystem/write_stream.h"
#include "orc/column_writer_options.h"
#include "orc/data_encryptor.h"
#include "orc/input_stream_checkpoint.h"
#include "orc/orc_output_buffer.h"

DEFINE_string(conf, "", "orcbuf config file, optional");
DEFINE_string(input, "", "file whose content is written as one column stream");
DEFINE_string(output, "", "file receiving the framed stream");
DEFINE_string(compression_kind, "", "NONE/ZLIB/SNAPPY/LZ4/ZSTD, overrides the config");
DEFINE_int32(compression_level, -1, "codec level, -1 for the codec default");
DEFINE_int32(max_buffer_size, 0, "max chunk size including the header, 0 keeps the config");
DEFINE_bool(lazy_output_buffer, false, "defer allocation of the output chunks");
DEFINE_string(aes_key_hex, "", "AES key in hex (32, 48 or 64 digits) to encrypt every chunk");

namespace orcbuf {

static std::string get_usage(const std::string& progname) {
    std::stringstream ss;
    ss << progname << " writes a file through an ORC column output buffer.\n";
    ss << "Usage:\n";
    ss << "./orc_frame_tool --input=path/to/file --output=path/to/framed "
          "--compression_kind=ZLIB --compression_level=6\n";
    ss << "./orc_frame_tool --input=path/to/file --output=path/to/framed "
          "--compression_kind=ZSTD --aes_key_hex=00112233445566778899aabbccddeeff\n";
    ss << "./orc_frame_tool --conf=conf/orcbuf.conf --input=path/to/file "
          "--output=path/to/framed\n";
    return ss.str();
}

static Status decode_hex(const std::string& hex, std::string* bytes) {
    if (hex.size() % 2 != 0) {
        return Status::InvalidArgument("odd number of hex digits: {}", hex.size());
    }
    auto digit = [](char c) -> int {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    };
    bytes->clear();
    bytes->reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = digit(hex[i]);
        int low = digit(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Status::InvalidArgument("invalid hex digit at {}", i);
        }
        bytes->push_back(static_cast<char>((high << 4) | low));
    }
    return Status::OK();
}

static Status apply_flags() {
    if (!FLAGS_compression_kind.empty()) {
        RETURN_IF_ERROR(config::set_config("orc_compression_kind", FLAGS_compression_kind));
    }
    RETURN_IF_ERROR(
            config::set_config("orc_compression_level", std::to_string(FLAGS_compression_level)));
    if (FLAGS_max_buffer_size > 0) {
        RETURN_IF_ERROR(config::set_config("orc_compression_max_buffer_size",
                                           std::to_string(FLAGS_max_buffer_size)));
    }
    if (FLAGS_lazy_output_buffer) {
        RETURN_IF_ERROR(config::set_config("orc_lazy_output_buffer", "true"));
    }
    return Status::OK();
}

static Status frame_file(const std::string& input, const std::string& output) {
    ColumnWriterOptions options;
    RETURN_IF_ERROR(ColumnWriterOptions::from_config(&options));

    std::unique_ptr<DataEncryptor> encryptor;
    if (!FLAGS_aes_key_hex.empty()) {
        std::string key;
        RETURN_IF_ERROR(decode_hex(FLAGS_aes_key_hex, &key));
        RETURN_IF_ERROR(AesCtrDataEncryptor::create(std::move(key), &encryptor));
    }

    std::unique_ptr<OrcOutputBuffer> buffer;
    RETURN_IF_ERROR(OrcOutputBuffer::create(options, std::move(encryptor), &buffer));

    // paths on the command line are used as given
    LocalFileSystem fs("");
    size_t input_size = 0;
    RETURN_IF_ERROR(fs.file_size(input, &input_size));
    std::unique_ptr<ReadStream> reader;
    RETURN_IF_ERROR(fs.read_file(input, &reader));
    RETURN_IF_ERROR(buffer->write_bytes(reader.get(), input_size));
    RETURN_IF_ERROR(reader->close());
    RETURN_IF_ERROR(buffer->close());

    int64_t checkpoint = buffer->get_checkpoint();
    std::unique_ptr<WriteStream> writer;
    RETURN_IF_ERROR(fs.write_file(output, &writer));
    size_t written = 0;
    RETURN_IF_ERROR(buffer->write_data_to(writer.get(), &written));
    RETURN_IF_ERROR(writer->close());

    LOG_INFO("framed {} into {}", input, output)
            .tag("options", options.debug_string())
            .tag("input_size", input_size)
            .tag("output_size", written)
            .tag("retained_size", buffer->get_retained_size());
    std::cout << "input size: " << input_size << std::endl;
    std::cout << "output size: " << written << std::endl;
    std::cout << "checkpoint: " << input_stream_checkpoint_to_string(checkpoint) << std::endl;
    return Status::OK();
}

} // namespace orcbuf

int main(int argc, char** argv) {
    std::string usage = orcbuf::get_usage(argv[0]);
    gflags::SetUsageMessage(usage);
    google::ParseCommandLineFlags(&argc, &argv, true);

    if (FLAGS_input.empty() || FLAGS_output.empty()) {
        std::cerr << "--input and --output are required" << std::endl;
        std::cerr << usage;
        return -1;
    }
    const char* conf_file = FLAGS_conf.empty() ? nullptr : FLAGS_conf.c_str();
    if (!orcbuf::config::init(conf_file, true)) {
        std::cerr << "failed to load config file " << FLAGS_conf << std::endl;
        return -1;
    }
    orcbuf::init_glog("orc_frame_tool");

    orcbuf::Status st = orcbuf::apply_flags();
    if (st.ok()) {
        try {
            st = orcbuf::frame_file(FLAGS_input, FLAGS_output);
        } catch (const orcbuf::Exception& e) {
            st = e.to_status();
        }
    }
    if (!st.ok()) {
        std::cerr << "failed to frame " << FLAGS_input << ": " << st << std::endl;
        orcbuf::shutdown_logging();
        return -1;
    }
    orcbuf::shutdown_logging();
    return 0;
}
