#include <gtest/gtest.h>
#include "ff/blob_store.h"
#include "ff/errors.h"
#include <chrono>
#include <filesystem>

using namespace ff;

namespace {

std::filesystem::path scratchDir(const std::string& tag) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           ("ff_store_" + tag + "_" + std::to_string(stamp));
}

} // anonymous namespace

TEST(MemoryBlobStore, PutGetContains) {
    MemoryBlobStore store;
    std::string out;
    EXPECT_FALSE(store.get("a.json", out));
    EXPECT_FALSE(store.contains("a.json"));

    store.put("a.json", "{}");
    EXPECT_TRUE(store.contains("a.json"));
    ASSERT_TRUE(store.get("a.json", out));
    EXPECT_EQ(out, "{}");

    store.put("a.json", "[1]");
    ASSERT_TRUE(store.get("a.json", out));
    EXPECT_EQ(out, "[1]");
    EXPECT_EQ(store.size(), 1u);
}

TEST(MemoryBlobStore, ListByPrefixSorted) {
    MemoryBlobStore store;
    store.put("models/b.json", "2");
    store.put("metadata/a.json", "x");
    store.put("models/a.json", "1");

    std::vector<std::string> keys = store.list("models/");
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "models/a.json");
    EXPECT_EQ(keys[1], "models/b.json");
    EXPECT_EQ(store.list("").size(), 3u);
    EXPECT_TRUE(store.list("predictions/").empty());
}

TEST(DirectoryBlobStore, WritesNestedKeys) {
    std::filesystem::path root = scratchDir("nested");
    {
        DirectoryBlobStore store(root);
        store.put("models/fantasy_predictor_1.json", "model");
        store.put("latest_model.json", "ref");

        std::string out;
        ASSERT_TRUE(store.get("models/fantasy_predictor_1.json", out));
        EXPECT_EQ(out, "model");
        EXPECT_TRUE(store.contains("latest_model.json"));
        EXPECT_FALSE(store.contains("models/missing.json"));
        EXPECT_FALSE(store.get("models/missing.json", out));

        std::vector<std::string> keys = store.list("models/");
        ASSERT_EQ(keys.size(), 1u);
        EXPECT_EQ(keys[0], "models/fantasy_predictor_1.json");
    }
    std::filesystem::remove_all(root);
}

TEST(DirectoryBlobStore, MissingRootListsNothing) {
    DirectoryBlobStore store(scratchDir("missing"));
    EXPECT_TRUE(store.list("").empty());
}

TEST(DirectoryBlobStore, RejectsEscapingKeys) {
    std::filesystem::path root = scratchDir("escape");
    DirectoryBlobStore store(root);
    EXPECT_THROW(store.put("../outside.json", "x"), StorageError);
    EXPECT_THROW(store.put("/etc/passwd", "x"), StorageError);
    EXPECT_THROW(store.put("", "x"), StorageError);
    std::filesystem::remove_all(root);
}
