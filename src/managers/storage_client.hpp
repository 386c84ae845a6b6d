#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <transport/api_transport.hpp>

enum class RemoteEntryType { File, Directory, Other };

struct RemoteEntry {
    std::string path;        // relative to the listed root for listings
    RemoteEntryType type = RemoteEntryType::File;
    std::string type_name;   // as sent by the server ("FILE", "DIRECTORY", "SYMLINK", ...)
    int64_t size = 0;
    std::string sha256;
};

// Strip "storage://" and surrounding slashes: "storage://alice/data/" -> "alice/data"
std::string normalize_storage_path(const std::string& uri);

// Thin request layer over the storage service. No retries here; callers
// decide per operation.
class StorageClient {
public:
    explicit StorageClient(ApiTransport& api) : api_(api) {}

    Result<std::vector<RemoteEntry>> list_recursive(const std::string& root, CancelToken cancel = {});
    Result<RemoteEntry> stat(const std::string& path, CancelToken cancel = {});
    Result<void> put(const std::string& path, const std::string& content, CancelToken cancel = {});
    Result<std::unique_ptr<ByteStream>> open(const std::string& path, CancelToken cancel = {});

private:
    ApiTransport& api_;
};
