#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

// SHA-256 of a file's contents as lowercase hex. Streams the file in
// HASH_READ_BUF_SIZE blocks; an empty file hashes like the empty string.
Result<std::string> sha256_file(const std::filesystem::path& path);

// SHA-256 of an in-memory buffer as lowercase hex.
std::string sha256_hex(const std::string& data);

// Incremental hasher for data that arrives in blocks.
class Sha256Stream {
public:
    Sha256Stream();
    ~Sha256Stream();

    Sha256Stream(const Sha256Stream&) = delete;
    Sha256Stream& operator=(const Sha256Stream&) = delete;

    void update(const char* data, size_t len);
    std::string finish();

private:
    struct Impl;
    Impl* impl_;
};
