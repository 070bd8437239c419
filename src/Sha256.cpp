#include "Sha256.h"

#include <stdexcept>

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    reset();
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

Sha256& Sha256::update(const void* data, std::size_t size) {
    if (size == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

Sha256& Sha256::update(const Bytes32& bytes) {
    return update(bytes.data(), bytes.size());
}

Sha256& Sha256::update(const std::string& text) {
    return update(text.data(), text.size());
}

Bytes32 Sha256::finish() {
    Bytes32 out{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &length) != 1 || length != out.size()) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    reset();
    return out;
}
