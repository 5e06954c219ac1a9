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

#include "orc/data_encryptor.h"

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <limits>

#include "common/logging.h"
#include "util/defer_op.h"

namespace orcbuf {

static std::string openssl_last_error() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

Status AesCtrDataEncryptor::create(std::string key, std::unique_ptr<DataEncryptor>* encryptor) {
    const EVP_CIPHER* cipher = nullptr;
    switch (key.size()) {
    case 16:
        cipher = EVP_aes_128_ctr();
        break;
    case 24:
        cipher = EVP_aes_192_ctr();
        break;
    case 32:
        cipher = EVP_aes_256_ctr();
        break;
    default:
        return Status::InvalidArgument("invalid AES key length {}, must be 16, 24 or 32",
                                       key.size());
    }
    if (cipher == nullptr) {
        return Status::Error<ErrorCode::ENCRYPTION_ERROR>("failed to get cipher");
    }
    encryptor->reset(new AesCtrDataEncryptor(std::move(key), cipher));
    return Status::OK();
}

AesCtrDataEncryptor::AesCtrDataEncryptor(std::string key, const EVP_CIPHER* cipher)
        : _key(std::move(key)), _cipher(cipher) {}

AesCtrDataEncryptor::~AesCtrDataEncryptor() {
    OPENSSL_cleanse(_key.data(), _key.size());
}

Status AesCtrDataEncryptor::encrypt(const Slice& input, std::string* output) {
    if (input.size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Status::InvalidArgument("encrypt input too large: {}", input.size);
    }
    auto* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return Status::Error<ErrorCode::ENCRYPTION_ERROR>("failed to create cipher context");
    }
    Defer defer {[ctx]() { EVP_CIPHER_CTX_free(ctx); }};

    output->resize(IV_LENGTH + input.size);
    auto* out = reinterpret_cast<unsigned char*>(output->data());
    if (RAND_bytes(out, IV_LENGTH) != 1) {
        return Status::Error<ErrorCode::ENCRYPTION_ERROR>("failed to generate iv: {}",
                                                          openssl_last_error());
    }

    if (EVP_EncryptInit_ex(ctx, _cipher, nullptr,
                           reinterpret_cast<const unsigned char*>(_key.data()), out) != 1) {
        return Status::Error<ErrorCode::ENCRYPTION_ERROR>("encryption init failed: {}",
                                                          openssl_last_error());
    }
    EVP_CIPHER_CTX_set_padding(ctx, 0);

    int out_len = 0;
    if (EVP_EncryptUpdate(ctx, out + IV_LENGTH, &out_len,
                          reinterpret_cast<const unsigned char*>(input.data),
                          static_cast<int>(input.size)) != 1) {
        return Status::Error<ErrorCode::ENCRYPTION_ERROR>("encrypt error: {}",
                                                          openssl_last_error());
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx, out + IV_LENGTH + out_len, &final_len) != 1) {
        return Status::Error<ErrorCode::ENCRYPTION_ERROR>("encrypt final error: {}",
                                                          openssl_last_error());
    }
    DCHECK_EQ(static_cast<size_t>(out_len + final_len), input.size);
    return Status::OK();
}

std::string AesCtrDataEncryptor::debug_info() const {
    return fmt::format("AesCtrDataEncryptor. key bits: {}", _key.size() * 8);
}

} // namespace orcbuf
