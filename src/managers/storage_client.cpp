#include "storage_client.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

using json = nlohmann::json;

std::string normalize_storage_path(const std::string& uri) {
    std::string p = uri;
    const std::string scheme = STORAGE_URI_SCHEME;
    if (p.compare(0, scheme.size(), scheme) == 0) {
        p = p.substr(scheme.size());
    } else if (p.compare(0, 8, "storage:") == 0) {
        p = p.substr(8);
    }
    size_t start = p.find_first_not_of('/');
    if (start == std::string::npos) return "";
    size_t end = p.find_last_not_of('/');
    return p.substr(start, end - start + 1);
}

static std::string storage_path(const std::string& path) {
    return "/" + url_encode_path(normalize_storage_path(path));
}

static RemoteEntry entry_from_json(const json& j) {
    RemoteEntry e;
    e.path = j.value("path", std::string());
    e.type_name = j.value("type", std::string("FILE"));
    if (e.type_name == "FILE") e.type = RemoteEntryType::File;
    else if (e.type_name == "DIRECTORY") e.type = RemoteEntryType::Directory;
    else e.type = RemoteEntryType::Other;
    e.size = j.value("size", static_cast<int64_t>(0));
    e.sha256 = j.value("sha256", std::string());
    return e;
}

Result<std::vector<RemoteEntry>> StorageClient::list_recursive(const std::string& root,
                                                               CancelToken cancel) {
    using R = Result<std::vector<RemoteEntry>>;
    auto r = api_.request("GET", storage_path(root) + "?op=LISTSTATUS&recursive=true", "", cancel);
    if (r.is_err()) {
        r.error.subject = root;
        return R::Err(r.error);
    }

    try {
        json j = json::parse(r.value.body);
        if (!j.contains("files") || !j["files"].is_array()) {
            return R::Err(Error::make(ErrorKind::Permanent, "malformed listing: missing 'files'", root));
        }
        std::vector<RemoteEntry> entries;
        for (const auto& f : j["files"]) {
            entries.push_back(entry_from_json(f));
        }
        return R::Ok(entries);
    } catch (const json::exception& e) {
        return R::Err(Error::make(ErrorKind::Permanent,
            fmt::format("malformed listing: {}", e.what()), root));
    }
}

Result<RemoteEntry> StorageClient::stat(const std::string& path, CancelToken cancel) {
    auto r = api_.request("GET", storage_path(path) + "?op=GETFILESTATUS", "", cancel);
    if (r.is_err()) {
        r.error.subject = path;
        return Result<RemoteEntry>::Err(r.error);
    }
    try {
        return Result<RemoteEntry>::Ok(entry_from_json(json::parse(r.value.body)));
    } catch (const json::exception& e) {
        return Result<RemoteEntry>::Err(Error::make(ErrorKind::Permanent,
            fmt::format("malformed file status: {}", e.what()), path));
    }
}

Result<void> StorageClient::put(const std::string& path, const std::string& content,
                                CancelToken cancel) {
    auto r = api_.request("PUT", storage_path(path), content, cancel);
    if (r.is_err()) {
        r.error.subject = path;
        return Result<void>::Err(r.error);
    }
    return Result<void>::Ok();
}

Result<std::unique_ptr<ByteStream>> StorageClient::open(const std::string& path, CancelToken cancel) {
    auto r = api_.open_stream(storage_path(path) + "?op=OPEN", cancel);
    if (r.is_err()) r.error.subject = path;
    return r;
}
