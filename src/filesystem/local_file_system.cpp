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

#include <fcntl.h>
#include <fmt/format.h>
#include <unistd.h>

#include <cstring>
#include <filesystem>
#include <system_error>

#include "common/config.h"
#include "common/macros.h"
#include "filesystem/local_read_stream.h"
#include "filesystem/local_write_stream.h"

namespace fs = std::filesystem;

namespace orcbuf {

static constexpr size_t READ_BUFFER_SIZE = 64 * 1024;

LocalFileSystem::LocalFileSystem(std::string path) : _path(std::move(path)) {}

LocalFileSystem::~LocalFileSystem() = default;

Status LocalFileSystem::exists(const std::string& path, bool* res) const {
    auto fs_path = fs::path(_path) / path;
    std::error_code ec;
    *res = fs::exists(fs_path, ec);
    if (ec) {
        return Status::IOError("Cannot check {}: {}", fs_path.string(), ec.message());
    }
    return Status::OK();
}

Status LocalFileSystem::file_size(const std::string& path, size_t* size) const {
    auto fs_path = fs::path(_path) / path;
    std::error_code ec;
    auto res = fs::file_size(fs_path, ec);
    if (ec) {
        return Status::IOError("Cannot get size of {}: {}", fs_path.string(), ec.message());
    }
    *size = res;
    return Status::OK();
}

Status LocalFileSystem::delete_file(const std::string& path) {
    auto fs_path = fs::path(_path) / path;
    if (!fs::exists(fs_path)) {
        return Status::OK();
    }
    if (!fs::is_regular_file(fs_path)) {
        return Status::IOError("{} is not a file", fs_path.string());
    }
    std::error_code ec;
    fs::remove(fs_path, ec);
    if (ec) {
        return Status::IOError("Cannot delete {}: {}", fs_path.string(), ec.message());
    }
    return Status::OK();
}

Status LocalFileSystem::create_directory(const std::string& path) {
    auto fs_path = fs::path(_path) / path;
    if (fs::exists(fs_path)) {
        return Status::AlreadyExist("{} exists", fs_path.string());
    }
    std::error_code ec;
    fs::create_directories(fs_path, ec);
    if (ec) {
        return Status::IOError("Cannot create {}: {}", fs_path.string(), ec.message());
    }
    return Status::OK();
}

Status LocalFileSystem::read_file(const std::string& path,
                                  std::unique_ptr<ReadStream>* stream) const {
    auto fs_path = fs::path(_path) / path;
    size_t size = 0;
    RETURN_IF_ERROR(file_size(path, &size));
    int fd = 0;
    RETRY_ON_EINTR(fd, ::open(fs_path.c_str(), O_RDONLY));
    if (fd < 0) {
        return Status::IOError("Cannot open {}: {}", fs_path.string(), std::strerror(errno));
    }
    *stream = std::make_unique<LocalReadStream>(fd, size, READ_BUFFER_SIZE);
    return Status::OK();
}

Status LocalFileSystem::write_file(const std::string& path, std::unique_ptr<WriteStream>* stream) {
    auto fs_path = fs::path(_path) / path;
    int fd = 0;
    RETRY_ON_EINTR(fd, ::open(fs_path.c_str(), O_TRUNC | O_WRONLY | O_CREAT | O_CLOEXEC, 0666));
    if (fd < 0) {
        return Status::IOError("Cannot open {}: {}", fs_path.string(), std::strerror(errno));
    }
    *stream = std::make_unique<LocalWriteStream>(fd, config::local_write_stream_buffer_size);
    return Status::OK();
}

} // namespace orcbuf
