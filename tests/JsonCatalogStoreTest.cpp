#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "JsonCatalogStore.h"
#include "TestUtils.h"

using namespace chipstream;

namespace {
Song makeSong(const std::string& id, const std::string& title) {
  Song song;
  song.id = id;
  song.title = title;
  song.artist = "Artist";
  song.extension = ".mod";
  song.storedFilename = id + ".mod";
  song.sizeBytes = 42;
  song.uploadedAt = "2024-01-01T00:00:00.000000Z";
  return song;
}
}  // namespace

class JsonCatalogStoreTest : public ::testing::Test {
 protected:
  test::TempDir dir;
};

TEST_F(JsonCatalogStoreTest, MissingDocumentIsEmpty) {
  JsonCatalogStore store(dir.path("songs.json"));
  EXPECT_TRUE(store.list().empty());
  EXPECT_FALSE(store.find("nope").has_value());
}

TEST_F(JsonCatalogStoreTest, AppendPersistsPrettyJson) {
  auto path = dir.path("nested/db/songs.json");
  JsonCatalogStore store(path);
  store.append(makeSong("a", "Chip Tune"));
  store.append(makeSong("b", "K\xC3\xA4rpf"));

  auto songs = store.list();
  ASSERT_EQ(songs.size(), 2u);
  EXPECT_EQ(songs[0], makeSong("a", "Chip Tune"));
  EXPECT_EQ(songs[1].title, "K\xC3\xA4rpf");

  auto text = test::readFile(path);
  EXPECT_NE(text.find("\n  {"), std::string::npos);
  EXPECT_NE(text.find("K\xC3\xA4rpf"), std::string::npos);
  EXPECT_NE(text.find("\"storedFilename\": \"a.mod\""), std::string::npos);

  // A second store over the same file sees the same catalog
  JsonCatalogStore reopened(path);
  EXPECT_EQ(reopened.list().size(), 2u);
}

TEST_F(JsonCatalogStoreTest, RemoveById) {
  JsonCatalogStore store(dir.path("songs.json"));
  store.append(makeSong("a", "One"));
  store.append(makeSong("b", "Two"));

  EXPECT_TRUE(store.removeById("a"));
  EXPECT_FALSE(store.removeById("a"));
  EXPECT_FALSE(store.removeById("missing"));

  auto songs = store.list();
  ASSERT_EQ(songs.size(), 1u);
  EXPECT_EQ(songs[0].id, "b");
  EXPECT_EQ(store.find("b")->title, "Two");
}

TEST_F(JsonCatalogStoreTest, CorruptedDocumentListsAsEmpty) {
  auto path = dir.path("songs.json");
  test::writeFile(path, "[{\"id\": \"a\", ");
  JsonCatalogStore store(path);
  EXPECT_TRUE(store.list().empty());

  test::writeFile(path, "{\"id\": \"not an array\"}");
  EXPECT_TRUE(store.list().empty());
}

TEST_F(JsonCatalogStoreTest, ToleratesPartialEntries) {
  auto path = dir.path("songs.json");
  test::writeFile(path, R"([
    {"id": "keep", "title": "  ", "extra": 1},
    {"title": "no id"},
    {"id": 7},
    "not an object"
  ])");

  JsonCatalogStore store(path);
  auto songs = store.list();
  ASSERT_EQ(songs.size(), 1u);
  EXPECT_EQ(songs[0].id, "keep");
  EXPECT_EQ(songs[0].title, "Unknown Title");
  EXPECT_EQ(songs[0].artist, "Unknown Artist");
  EXPECT_EQ(songs[0].comment, "");
  EXPECT_EQ(songs[0].sizeBytes, 0u);
}

TEST_F(JsonCatalogStoreTest, ConcurrentAppendsAreNotLost) {
  JsonCatalogStore store(dir.path("songs.json"));
  const int threadCount = 8;
  const int perThread = 10;

  std::vector<std::thread> threads;
  for (int t = 0; t < threadCount; t++) {
    threads.emplace_back([&store, t]() {
      for (int i = 0; i < perThread; i++) {
        auto id = std::to_string(t) + "-" + std::to_string(i);
        store.append(makeSong(id, "Song " + id));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(store.list().size(), (size_t)(threadCount * perThread));
}

TEST_F(JsonCatalogStoreTest, UnwritableLocationThrows) {
  // A regular file where the parent directory should be
  test::writeFile(dir.path("blocker"), "x");
  JsonCatalogStore store(dir.path("blocker/songs.json"));
  EXPECT_THROW(store.append(makeSong("a", "One")), CatalogError);
}

TEST(SongJsonTest, SerializesAllFields) {
  nlohmann::json j = makeSong("id1", "Title");
  EXPECT_EQ(j["id"], "id1");
  EXPECT_EQ(j["title"], "Title");
  EXPECT_EQ(j["artist"], "Artist");
  EXPECT_EQ(j["comment"], "");
  EXPECT_EQ(j["storedFilename"], "id1.mod");
  EXPECT_EQ(j["extension"], ".mod");
  EXPECT_EQ(j["sizeBytes"], 42);
  EXPECT_EQ(j["uploadedAt"], "2024-01-01T00:00:00.000000Z");
}

TEST(SongJsonTest, AllowList) {
  EXPECT_TRUE(isAllowedExtension(".fc"));
  EXPECT_TRUE(isAllowedExtension(".vgz"));
  EXPECT_FALSE(isAllowedExtension(".exe"));
  EXPECT_FALSE(isAllowedExtension("mp3"));
  EXPECT_EQ(allowedExtensions().size(), 14u);
}
