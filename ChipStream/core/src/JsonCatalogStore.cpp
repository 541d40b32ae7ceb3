#include "JsonCatalogStore.h"

#include <algorithm>     // for remove_if
#include <filesystem>    // for path, rename, create_directories
#include <fstream>       // for ifstream, ofstream
#include <iterator>      // for istreambuf_iterator
#include <system_error>  // for error_code

#include <nlohmann/json.hpp>  // for json

#include "ChipLogger.h"  // for CHIP_LOG

using namespace chipstream;
namespace fs = std::filesystem;

JsonCatalogStore::JsonCatalogStore(const std::string& path)
    : catalogPath(path) {}

std::vector<Song> JsonCatalogStore::list() {
  std::scoped_lock lock(catalogMutex);
  return load();
}

void JsonCatalogStore::append(const Song& song) {
  std::scoped_lock lock(catalogMutex);
  auto songs = load();
  songs.push_back(song);
  save(songs);
}

bool JsonCatalogStore::removeById(const std::string& id) {
  std::scoped_lock lock(catalogMutex);
  auto songs = load();
  auto size = songs.size();
  songs.erase(std::remove_if(songs.begin(), songs.end(),
                             [&id](const Song& song) { return song.id == id; }),
              songs.end());
  if (songs.size() == size) {
    return false;
  }
  save(songs);
  return true;
}

std::vector<Song> JsonCatalogStore::load() {
  std::vector<Song> songs;
  std::ifstream file(catalogPath, std::ios::binary);
  if (!file.is_open()) {
    return songs;
  }

  std::string body((std::istreambuf_iterator<char>(file)),
                   std::istreambuf_iterator<char>());
  nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_array()) {
    CHIP_LOG(error, "Catalog", "Catalog %s is corrupted, serving it as empty",
             catalogPath.c_str());
    return songs;
  }

  for (auto& entry : j) {
    if (!entry.is_object() || !entry.contains("id") ||
        !entry["id"].is_string()) {
      CHIP_LOG(debug, "Catalog", "Skipping catalog entry without id");
      continue;
    }
    try {
      songs.push_back(entry.get<Song>());
    } catch (nlohmann::json::exception& e) {
      CHIP_LOG(debug, "Catalog", "Skipping malformed catalog entry: %s",
               e.what());
    }
  }
  return songs;
}

void JsonCatalogStore::save(const std::vector<Song>& songs) {
  fs::path target(catalogPath);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw CatalogError("Cannot create catalog directory: " + ec.message());
    }
  }

  nlohmann::json j = songs;
  std::string body =
      j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

  fs::path temp = target;
  temp += ".tmp";
  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      throw CatalogError("Cannot open " + temp.string() + " for writing");
    }
    file << body;
    file.flush();
    if (!file) {
      file.close();
      fs::remove(temp, ec);
      throw CatalogError("Failed writing " + temp.string());
    }
  }

  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code cleanup;
    fs::remove(temp, cleanup);
    throw CatalogError("Cannot replace " + catalogPath + ": " + ec.message());
  }
}
