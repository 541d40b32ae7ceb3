#pragma once

#include <memory>       // for shared_ptr, unique_ptr
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

#include "CatalogStore.h"  // for CatalogStore
#include "HTTPResponse.h"  // for HTTPResponse
#include "ServerConfig.h"  // for ServerConfig
#include "Song.h"          // for Song

namespace chipstream {

/**
 * Request handling for the song endpoints, independent of the HTTP server.
 * Every method returns a complete response; file transfers are left to the
 * response's streamBody so nothing is buffered here.
 */
class SongService {
 public:
  SongService(std::shared_ptr<CatalogStore> catalog, ServerConfig config);

  // Songs whose title or artist contains `query`, ignoring case.
  std::unique_ptr<HTTPResponse> listSongs(const std::string& query);
  std::unique_ptr<HTTPResponse> randomSong(const std::string& exclude);
  std::unique_ptr<HTTPResponse> upload(const std::string& contentType,
                                       std::string_view body);
  std::unique_ptr<HTTPResponse> removeSong(const std::string& id);
  std::unique_ptr<HTTPResponse> stream(
      const std::string& id, const std::optional<std::string>& rangeHeader);
  std::unique_ptr<HTTPResponse> indexPage();

  std::string storedPath(const Song& song) const;

  static std::unique_ptr<HTTPResponse> makeError(const std::string& message,
                                                 int status);

 private:
  std::shared_ptr<CatalogStore> catalog;
  ServerConfig config;
};

}  // namespace chipstream
