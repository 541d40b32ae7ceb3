#include "WebApi.h"

#include <stdint.h>  // for uint64_t
#include <string>    // for string

#include "ChipLogger.h"  // for CHIP_LOG
#include "civetweb.h"    // for mg_connection

using namespace chipstream;

void chipstream::registerSongApi(HTTPServer& server, SongService& service,
                                 const ServerConfig& config) {
  auto handleIndex = [&service](struct mg_connection* conn) {
    return service.indexPage();
  };
  server.registerGet("/", handleIndex);
  server.registerGet("/index.html", handleIndex);

  // GET /api/songs?q=<substr>
  server.registerGet("/api/songs", [&service](struct mg_connection* conn) {
    return service.listSongs(HTTPServer::getQueryParam(conn, "q"));
  });

  // GET /api/random?exclude=<id>
  server.registerGet("/api/random", [&service](struct mg_connection* conn) {
    return service.randomSong(HTTPServer::getQueryParam(conn, "exclude"));
  });

  // GET|HEAD /stream/:id
  server.registerGet("/stream/:id", [&service](struct mg_connection* conn) {
    auto params = HTTPServer::extractParams(conn);
    return service.stream(params["id"], HTTPServer::getHeader(conn, "Range"));
  });

  uint64_t maxUploadBytes = config.maxUploadBytes;
  server.registerPost("/api/upload", [&service, maxUploadBytes](
                                         struct mg_connection* conn) {
    auto body = HTTPServer::readBody(conn, maxUploadBytes);
    if (!body.has_value()) {
      CHIP_LOG(error, "WebApi", "Rejected upload above %llu bytes",
               (unsigned long long)maxUploadBytes);
      return SongService::makeError("Upload too large", 413);
    }
    auto contentType = HTTPServer::getHeader(conn, "Content-Type");
    return service.upload(contentType.value_or(""), *body);
  });

  server.registerDelete("/api/songs/:id", [&service](struct mg_connection* conn) {
    auto params = HTTPServer::extractParams(conn);
    return service.removeSong(params["id"]);
  });

  server.registerNotFound([](struct mg_connection* conn) {
    return SongService::makeError("Not found", 404);
  });
}
