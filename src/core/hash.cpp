#include "hash.hpp"
#include <core/constants.hpp>
#include <openssl/evp.h>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>
#include <vector>

static std::string to_hex(const unsigned char* digest, unsigned int len) {
    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        result += hex[(digest[i] >> 4) & 0xF];
        result += hex[digest[i] & 0xF];
    }
    return result;
}

struct Sha256Stream::Impl {
    EVP_MD_CTX* ctx = nullptr;
};

Sha256Stream::Sha256Stream() : impl_(new Impl) {
    impl_->ctx = EVP_MD_CTX_new();
    if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(impl_->ctx);
        delete impl_;
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

Sha256Stream::~Sha256Stream() {
    EVP_MD_CTX_free(impl_->ctx);
    delete impl_;
}

void Sha256Stream::update(const char* data, size_t len) {
    if (len == 0) return;
    EVP_DigestUpdate(impl_->ctx, data, len);
}

std::string Sha256Stream::finish() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_DigestFinal_ex(impl_->ctx, digest, &len);
    return to_hex(digest, len);
}

std::string sha256_hex(const std::string& data) {
    Sha256Stream h;
    h.update(data.data(), data.size());
    return h.finish();
}

Result<std::string> sha256_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err(Error::make(
            ErrorKind::Permanent, "Cannot open file for hashing", path.string()));
    }

    Sha256Stream h;
    std::vector<char> buf(HASH_READ_BUF_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n > 0) h.update(buf.data(), static_cast<size_t>(n));
    }
    if (in.bad()) {
        return Result<std::string>::Err(Error::make(
            ErrorKind::Permanent, "Read error while hashing", path.string()));
    }
    return Result<std::string>::Ok(h.finish());
}
