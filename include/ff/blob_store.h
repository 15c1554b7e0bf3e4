#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace ff {

// Key/value store for artifacts. Keys are '/'-separated relative paths.
// No transactions: concurrent writers to one key are last-writer-wins.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    // Throws StorageError when the write fails.
    virtual void put(const std::string& key, const std::string& data) = 0;
    // Returns false when the key does not exist.
    virtual bool get(const std::string& key, std::string& out) const = 0;
    virtual bool contains(const std::string& key) const = 0;
    // Keys starting with prefix, sorted ascending.
    virtual std::vector<std::string> list(const std::string& prefix) const = 0;
};

class DirectoryBlobStore : public BlobStore {
    std::filesystem::path root_;
public:
    explicit DirectoryBlobStore(std::filesystem::path root);

    void put(const std::string& key, const std::string& data) override;
    bool get(const std::string& key, std::string& out) const override;
    bool contains(const std::string& key) const override;
    std::vector<std::string> list(const std::string& prefix) const override;

    const std::filesystem::path& root() const { return root_; }
};

class MemoryBlobStore : public BlobStore {
    std::map<std::string, std::string> blobs_;
public:
    void put(const std::string& key, const std::string& data) override;
    bool get(const std::string& key, std::string& out) const override;
    bool contains(const std::string& key) const override;
    std::vector<std::string> list(const std::string& prefix) const override;

    size_t size() const { return blobs_.size(); }
};

} // namespace ff
