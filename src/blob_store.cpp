#include "ff/blob_store.h"
#include "ff/errors.h"
#include <algorithm>
#include <fstream>
#include <iterator>

namespace ff {

namespace {

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Keys may not escape the store root.
void checkKey(const std::string& key) {
    if (key.empty() || key.front() == '/' || key.find("..") != std::string::npos) {
        throw StorageError("store", "invalid key: '" + key + "'");
    }
}

} // anonymous namespace

// --- DirectoryBlobStore ---

DirectoryBlobStore::DirectoryBlobStore(std::filesystem::path root) : root_(std::move(root)) {}

void DirectoryBlobStore::put(const std::string& key, const std::string& data) {
    checkKey(key);
    std::filesystem::path target = root_ / key;

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StorageError("store", "cannot create directory for " + key + ": " + ec.message());
    }

    // Write beside the target and rename so readers never see a partial blob.
    std::filesystem::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw StorageError("store", "cannot open " + tmp.string() + " for writing");
        }
        file << data;
        if (!file) {
            throw StorageError("store", "write failed for " + key);
        }
    }
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        throw StorageError("store", "cannot rename into " + key + ": " + ec.message());
    }
}

bool DirectoryBlobStore::get(const std::string& key, std::string& out) const {
    checkKey(key);
    std::ifstream file(root_ / key, std::ios::binary);
    if (!file.is_open()) return false;
    out.assign((std::istreambuf_iterator<char>(file)),
               std::istreambuf_iterator<char>());
    return true;
}

bool DirectoryBlobStore::contains(const std::string& key) const {
    checkKey(key);
    std::error_code ec;
    return std::filesystem::is_regular_file(root_ / key, ec);
}

std::vector<std::string> DirectoryBlobStore::list(const std::string& prefix) const {
    std::vector<std::string> keys;
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) return keys;

    for (auto it = std::filesystem::recursive_directory_iterator(root_, ec);
         it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;
        std::string key = std::filesystem::relative(it->path(), root_, ec).generic_string();
        if (ec) continue;
        if (key.size() > 4 && key.compare(key.size() - 4, 4, ".tmp") == 0) continue;
        if (startsWith(key, prefix)) keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

// --- MemoryBlobStore ---

void MemoryBlobStore::put(const std::string& key, const std::string& data) {
    checkKey(key);
    blobs_[key] = data;
}

bool MemoryBlobStore::get(const std::string& key, std::string& out) const {
    auto it = blobs_.find(key);
    if (it == blobs_.end()) return false;
    out = it->second;
    return true;
}

bool MemoryBlobStore::contains(const std::string& key) const {
    return blobs_.count(key) > 0;
}

std::vector<std::string> MemoryBlobStore::list(const std::string& prefix) const {
    std::vector<std::string> keys;
    for (auto it = blobs_.lower_bound(prefix); it != blobs_.end(); ++it) {
        if (!startsWith(it->first, prefix)) break;
        keys.push_back(it->first);
    }
    return keys;
}

} // namespace ff
