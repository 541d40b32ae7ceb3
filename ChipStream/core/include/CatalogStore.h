#pragma once

#include <optional>   // for optional
#include <stdexcept>  // for runtime_error
#include <string>     // for string
#include <vector>     // for vector

#include "Song.h"  // for Song

namespace chipstream {

class CatalogError : public std::runtime_error {
 public:
  explicit CatalogError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * Durable list of songs. Implementations re-read the backing store on every
 * call and serialize read-modify-write cycles so concurrent appends and
 * removals never lose an update.
 */
class CatalogStore {
 public:
  virtual ~CatalogStore() {}

  virtual std::vector<Song> list() = 0;

  // Throws CatalogError when the updated catalog cannot be persisted.
  virtual void append(const Song& song) = 0;

  // True when a song was removed. Throws CatalogError like append().
  virtual bool removeById(const std::string& id) = 0;

  std::optional<Song> find(const std::string& id) {
    for (auto& song : list()) {
      if (song.id == id) {
        return song;
      }
    }
    return std::nullopt;
  }
};

}  // namespace chipstream
