#pragma once

#include <cstddef>
#include <string>

#include <openssl/evp.h>

#include "Amount.h"

// OpenSSL EVP 위의 얇은 SHA-256 래퍼. finish() 후에는 다시 처음부터 쓸 수 있다.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    Sha256& update(const void* data, std::size_t size);
    Sha256& update(const Bytes32& bytes);
    Sha256& update(const std::string& text);
    Bytes32 finish();


private:
    EVP_MD_CTX* ctx_{nullptr};

    void reset();
};
