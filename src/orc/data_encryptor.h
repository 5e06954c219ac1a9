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

#include <openssl/ossl_typ.h>

#include <cstddef>
#include <memory>
#include <string>

#include "common/status.h"
#include "util/slice.h"

namespace orcbuf {

// Encrypts one chunk payload. The output may be longer than the input.
class DataEncryptor {
public:
    virtual ~DataEncryptor() = default;

    // `output` is replaced by the encrypted bytes.
    virtual Status encrypt(const Slice& input, std::string* output) = 0;

    virtual std::string debug_info() const = 0;
};

// AES in CTR mode, AES-128/192/256 by key length. Each chunk gets a fresh random IV
// which is stored in front of the ciphertext, so the output is 16 bytes longer than
// the input.
class AesCtrDataEncryptor final : public DataEncryptor {
public:
    static constexpr size_t IV_LENGTH = 16;

    // Fails with INVALID_ARGUMENT if the key is not 16, 24 or 32 bytes long.
    static Status create(std::string key, std::unique_ptr<DataEncryptor>* encryptor);

    ~AesCtrDataEncryptor() override;

    Status encrypt(const Slice& input, std::string* output) override;

    std::string debug_info() const override;

private:
    AesCtrDataEncryptor(std::string key, const EVP_CIPHER* cipher);

    std::string _key;
    const EVP_CIPHER* _cipher;
};

} // namespace orcbuf
