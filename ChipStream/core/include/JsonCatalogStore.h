#pragma once

#include <mutex>   // for mutex
#include <string>  // for string
#include <vector>  // for vector

#include "CatalogStore.h"  // for CatalogStore
#include "Song.h"          // for Song

namespace chipstream {

// Catalog kept as one pretty-printed JSON array on disk.
class JsonCatalogStore : public CatalogStore {
 public:
  explicit JsonCatalogStore(const std::string& path);

  std::vector<Song> list() override;
  void append(const Song& song) override;
  bool removeById(const std::string& id) override;

  const std::string& path() const { return catalogPath; }

 private:
  // Missing or corrupted documents read as an empty catalog.
  std::vector<Song> load();
  void save(const std::vector<Song>& songs);

  std::string catalogPath;
  std::mutex catalogMutex;
};

}  // namespace chipstream
