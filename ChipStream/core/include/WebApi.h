#pragma once

#include "HTTPServer.h"    // for HTTPServer
#include "ServerConfig.h"  // for ServerConfig
#include "SongService.h"   // for SongService

namespace chipstream {

// Binds the song endpoints and the index page to `server`. `service` must
// outlive the server.
void registerSongApi(HTTPServer& server, SongService& service,
                     const ServerConfig& config);

}  // namespace chipstream
