#include "bulkfetch/storage/StorageSink.hpp"

#include "TestSupport.hpp"

#include "bulkfetch/util/JsonUtil.hpp"

#include <gtest/gtest.h>

using namespace bulkfetch;

TEST(LocalDirectorySinkTest, MovesFilesAndWritesInfo) {
    bulkfetch::testing::TempDir dir;
    const auto scratch = dir.path() / "downloads" / "abc";
    bulkfetch::testing::writeFile(scratch / "abc.mp4", "video");
    bulkfetch::testing::writeFile(scratch / "abc.m4a", "audio");

    model::Artifact artifact;
    artifact.files = {scratch / "abc.mp4", scratch / "abc.m4a"};
    artifact.bytes = 10;
    artifact.elapsed = std::chrono::milliseconds{250};
    boost::json::object metadata;
    metadata["title"] = "Sample";

    storage::LocalDirectorySink sink(dir.path() / "output");
    auto result = sink.store("abc", artifact, metadata);
    ASSERT_TRUE(result.success) << result.error;

    const auto target = dir.path() / "output" / "abc";
    EXPECT_EQ(bulkfetch::testing::readFile(target / "abc.mp4"), "video");
    EXPECT_TRUE(std::filesystem::exists(target / "abc.m4a"));
    EXPECT_FALSE(std::filesystem::exists(scratch / "abc.mp4"));

    auto info = util::readJsonFile(target / "abc.info.json");
    ASSERT_TRUE(info.has_value());
    const auto& obj = info->as_object();
    EXPECT_EQ(util::getString(obj, "id"), std::optional<std::string>{"abc"});
    EXPECT_EQ(util::getString(obj, "title"), std::optional<std::string>{"Sample"});
    EXPECT_EQ(util::getInt(obj, "bytes"), std::optional<std::int64_t>{10});
    EXPECT_EQ(util::getInt(obj, "elapsedMs"), std::optional<std::int64_t>{250});
    EXPECT_EQ(obj.at("files").as_array().size(), 2u);
}

TEST(LocalDirectorySinkTest, MissingArtifactIsReportedNotThrown) {
    bulkfetch::testing::TempDir dir;
    model::Artifact artifact;
    artifact.files = {dir.path() / "nowhere.mp4"};

    storage::LocalDirectorySink sink(dir.path() / "output");
    model::StoreResult result;
    EXPECT_NO_THROW(result = sink.store("gone", artifact, {}));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
}

TEST(LocalDirectorySinkTest, RejectsIdsThatEscapeTheOutputRoot) {
    bulkfetch::testing::TempDir dir;
    const auto scratch = dir.path() / "downloads" / "x";
    bulkfetch::testing::writeFile(scratch / "x.mp4", "video");
    model::Artifact artifact;
    artifact.files = {scratch / "x.mp4"};

    storage::LocalDirectorySink sink(dir.path() / "output");
    for (const std::string id : {"..", ".", "", "../escape", "/abs"}) {
        auto result = sink.store(id, artifact, {});
        EXPECT_FALSE(result.success) << id;
    }
    EXPECT_TRUE(std::filesystem::exists(scratch / "x.mp4"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "escape"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "..info.json"));
}

TEST(LocalDirectorySinkTest, StoredItemsRequireInfoFile) {
    bulkfetch::testing::TempDir dir;
    const auto root = dir.path() / "output";
    bulkfetch::testing::writeFile(root / "done" / "done.mp4", "v");
    bulkfetch::testing::writeFile(root / "done" / "done.info.json", "{}");
    bulkfetch::testing::writeFile(root / "partial" / "partial.mp4", "v");
    bulkfetch::testing::writeFile(root / "stray.txt", "x");

    storage::LocalDirectorySink sink(root);
    EXPECT_EQ(sink.storedItems(), std::unordered_set<std::string>{"done"});

    storage::LocalDirectorySink empty(dir.path() / "missing");
    EXPECT_TRUE(empty.storedItems().empty());
}
