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

#include "filesystem/local_read_stream.h"

#include <unistd.h>

#include <algorithm>
#include <cstring>

#include "common/logging.h"

namespace orcbuf {

LocalReadStream::LocalReadStream(int fd, size_t file_size, size_t buffer_size)
        : _fd(fd),
          _file_size(file_size),
          _buffer(new char[buffer_size]),
          _buffer_size(buffer_size) {}

LocalReadStream::~LocalReadStream() {
    if (_fd != -1) {
        WARN_IF_ERROR(close(), "failed to close local read stream");
    }
}

Status LocalReadStream::read(char* to, size_t req_n, size_t* read_n) {
    *read_n = 0;
    while (req_n > 0 && !eof()) {
        // Beyond buffer range
        if (_offset >= _buffer_end || _offset < _buffer_begin) {
            // Request length is larger than the capacity of buffer,
            // do not copy data into buffer.
            if (req_n > _buffer_size) {
                ssize_t res = 0;
                RETRY_ON_EINTR(res, ::pread(_fd, to, req_n, _offset));
                if (-1 == res) {
                    return Status::IOError("Cannot read from file: {}", std::strerror(errno));
                }
                if (res == 0) {
                    break;
                }
                _offset += res;
                *read_n += res;
                to += res;
                req_n -= res;
                continue;
            }
            RETURN_IF_ERROR(fill());
            if (_buffer_end == _buffer_begin) {
                break;
            }
        }

        size_t copied = std::min(_buffer_end - _offset, req_n);
        memcpy(to, _buffer.get() + _offset - _buffer_begin, copied);
        _offset += copied;
        *read_n += copied;
        to += copied;
        req_n -= copied;
    }
    return Status::OK();
}

Status LocalReadStream::seek(size_t position) {
    if (position > _file_size) {
        return Status::IOError("Position {} exceeds file size {}", position, _file_size);
    }
    _offset = position;
    return Status::OK();
}

Status LocalReadStream::tell(size_t* position) const {
    *position = _offset;
    return Status::OK();
}

Status LocalReadStream::close() {
    if (_fd != -1) {
        int fd = _fd;
        _fd = -1;
        if (0 != ::close(fd)) {
            return Status::IOError("Cannot close file: {}", std::strerror(errno));
        }
    }
    return Status::OK();
}

Status LocalReadStream::fill() {
    ssize_t res = 0;
    RETRY_ON_EINTR(res, ::pread(_fd, _buffer.get(), _buffer_size, _offset));
    if (-1 == res) {
        return Status::IOError("Cannot read from file: {}", std::strerror(errno));
    }
    _buffer_begin = _offset;
    _buffer_end = _offset + res;
    return Status::OK();
}

} // namespace orcbuf
