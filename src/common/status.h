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

#include <fmt/format.h>
#include <glog/logging.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "common/compiler_util.h" // IWYU pragma: keep

namespace orcbuf {

namespace ErrorCode {

// Codes shared with the rest of the writer stack.
// E(error_name, error_code)
#define APPLY_FOR_GENERAL_ERROR_CODES(E) \
    E(OK, 0);                            \
    E(CANCELLED, 1);                     \
    E(NOT_IMPLEMENTED_ERROR, 3);         \
    E(RUNTIME_ERROR, 4);                 \
    E(MEM_ALLOC_FAILED, 5);              \
    E(INTERNAL_ERROR, 6);                \
    E(INVALID_ARGUMENT, 10);             \
    E(IO_ERROR, 11);                     \
    E(NOT_FOUND, 12);                    \
    E(ALREADY_EXIST, 13);                \
    E(END_OF_FILE, 14);                  \
    E(CORRUPTION, 15);                   \
    E(ILLEGAL_STATE, 16);

// Codes raised by the column stream writers only.
#define APPLY_FOR_ORC_ERROR_CODES(E)            \
    E(CONFIG_ERROR, -205);                      \
    E(BUFFER_OVERFLOW, -204);                   \
    E(COMPRESS_ERROR, -251);                    \
    E(DECOMPRESS_ERROR, -252);                  \
    E(ENCRYPTION_ERROR, -260);                  \
    E(ENCRYPTED_DATA_SIZE_EXCEEDED, -261);      \
    E(CHUNK_SIZE_EXCEEDED, -262);               \
    E(UNSUPPORTED_COMPRESSION_KIND, -263);

#define M(NAME, ERRORCODE) constexpr int NAME = ERRORCODE;
APPLY_FOR_GENERAL_ERROR_CODES(M)
APPLY_FOR_ORC_ERROR_CODES(M)
#undef M

// Returns the symbolic name of `code`, or nullptr if the code is unknown.
const char* error_code_name(int code);

} // namespace ErrorCode

class [[nodiscard]] Status {
public:
    Status() : _code(ErrorCode::OK), _err_msg(nullptr) {}

    // used to convert Exception to Status
    Status(int code, std::string msg) : _code(code) {
        _err_msg = std::make_unique<ErrMsg>();
        _err_msg->_msg = std::move(msg);
    }

    // copy c'tor makes copy of error detail so Status can be returned by value
    Status(const Status& rhs) { *this = rhs; }

    // move c'tor
    Status(Status&& rhs) noexcept = default;

    // same as copy c'tor
    Status& operator=(const Status& rhs) {
        _code = rhs._code;
        if (rhs._err_msg) {
            _err_msg = std::make_unique<ErrMsg>(*rhs._err_msg);
        } else {
            _err_msg.reset();
        }
        return *this;
    }

    // move assign
    Status& operator=(Status&& rhs) noexcept {
        _code = rhs._code;
        _err_msg = std::move(rhs._err_msg);
        return *this;
    }

    template <int code, typename... Args>
    Status static Error(std::string_view msg, Args&&... args) {
        Status status;
        status._code = code;
        status._err_msg = std::make_unique<ErrMsg>();
        if constexpr (sizeof...(args) == 0) {
            status._err_msg->_msg = msg;
        } else {
            status._err_msg->_msg = fmt::format(fmt::runtime(msg), std::forward<Args>(args)...);
        }
        return status;
    }

    template <typename... Args>
    Status static Error(int code, std::string_view msg, Args&&... args) {
        Status status;
        status._code = code;
        status._err_msg = std::make_unique<ErrMsg>();
        if constexpr (sizeof...(args) == 0) {
            status._err_msg->_msg = msg;
        } else {
            status._err_msg->_msg = fmt::format(fmt::runtime(msg), std::forward<Args>(args)...);
        }
        return status;
    }

    static Status OK() { return Status(); }

#define ERROR_CTOR(name, code)                                          \
    template <typename... Args>                                         \
    static Status name(std::string_view msg, Args&&... args) {          \
        return Error<ErrorCode::code>(msg, std::forward<Args>(args)...); \
    }

    ERROR_CTOR(MemoryAllocFailed, MEM_ALLOC_FAILED)
    ERROR_CTOR(InvalidArgument, INVALID_ARGUMENT)
    ERROR_CTOR(Corruption, CORRUPTION)
    ERROR_CTOR(IOError, IO_ERROR)
    ERROR_CTOR(NotFound, NOT_FOUND)
    ERROR_CTOR(AlreadyExist, ALREADY_EXIST)
    ERROR_CTOR(NotSupported, NOT_IMPLEMENTED_ERROR)
    ERROR_CTOR(EndOfFile, END_OF_FILE)
    ERROR_CTOR(InternalError, INTERNAL_ERROR)
    ERROR_CTOR(RuntimeError, RUNTIME_ERROR)
    ERROR_CTOR(Cancelled, CANCELLED)
    ERROR_CTOR(IllegalState, ILLEGAL_STATE)
#undef ERROR_CTOR

    template <int code>
    bool is() const {
        return code == _code;
    }

    void set_code(int code) { _code = code; }

    bool ok() const { return _code == ErrorCode::OK; }

    std::string to_string() const;

    int code() const { return _code; }

    /// Clone this status and add the specified prefix to the message.
    ///
    /// If this status is OK, then an OK status will be returned.
    ///
    /// @param [in] msg
    ///   The message to prepend.
    /// @return A ref to Status object
    Status& prepend(std::string_view msg);

    /// Add the specified suffix to the message.
    ///
    /// If this status is OK, then an OK status will be returned.
    ///
    /// @param [in] msg
    ///   The message to append.
    /// @return A ref to Status object
    Status& append(std::string_view msg);

    // if(!status) or if (status) will use this operator
    operator bool() const { return this->ok(); }

    // Used like if ASSERT_EQ(res, Status::OK())
    // ignore error messages during comparison
    bool operator==(const Status& st) const { return _code == st._code; }

    // Used like if ASSERT_NE(res, Status::OK())
    bool operator!=(const Status& st) const { return _code != st._code; }

    friend std::ostream& operator<<(std::ostream& ostr, const Status& status);

    std::string_view msg() const { return _err_msg ? _err_msg->_msg : std::string_view(""); }

private:
    int _code;
    struct ErrMsg {
        std::string _msg;
    };
    std::unique_ptr<ErrMsg> _err_msg;

    std::string code_as_string() const {
        const char* name = ErrorCode::error_code_name(_code);
        return name != nullptr ? std::string(name) : fmt::format("E{}", (int16_t)_code);
    }
};

inline std::ostream& operator<<(std::ostream& ostr, const Status& status) {
    ostr << '[' << status.code_as_string() << ']';
    ostr << status.msg();
    return ostr;
}

inline std::string Status::to_string() const {
    std::stringstream ss;
    ss << *this;
    return ss.str();
}

// some generally useful macros
#define RETURN_IF_ERROR(stmt)           \
    do {                                \
        Status _status_ = (stmt);       \
        if (UNLIKELY(!_status_.ok())) { \
            return _status_;            \
        }                               \
    } while (false)

#define THROW_IF_ERROR(stmt)                    \
    do {                                        \
        Status _status_ = (stmt);               \
        if (UNLIKELY(!_status_.ok())) {         \
            throw orcbuf::Exception(_status_);  \
        }                                       \
    } while (false)

#define EXIT_IF_ERROR(stmt)             \
    do {                                \
        Status _status_ = (stmt);       \
        if (UNLIKELY(!_status_.ok())) { \
            LOG(ERROR) << _status_;     \
            exit(1);                    \
        }                               \
    } while (false)

/// @brief Emit a warning if @c to_call returns a bad status.
#define WARN_IF_ERROR(to_call, warning_prefix)              \
    do {                                                    \
        Status _s = (to_call);                              \
        if (UNLIKELY(!_s.ok())) {                           \
            LOG(WARNING) << (warning_prefix) << ": " << _s; \
        }                                                   \
    } while (false);

#define RETURN_NOT_OK_STATUS_WITH_WARN(stmt, warning_prefix)       \
    do {                                                           \
        Status _s = (stmt);                                        \
        if (UNLIKELY(!_s.ok())) {                                  \
            LOG(WARNING) << (warning_prefix) << ", error: " << _s; \
            return _s;                                             \
        }                                                          \
    } while (false);

} // namespace orcbuf

// specify formatter for Status
template <>
struct fmt::formatter<orcbuf::Status> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(orcbuf::Status const& status, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", status.to_string());
    }
};
