#pragma once

#include <stddef.h>    // for size_t
#include <stdint.h>    // for uint8_t
#include <stdlib.h>    // for free
#include <functional>  // for function
#include <map>         // for map
#include <memory>      // for unique_ptr
#include <string>      // for string

namespace chipstream {

// Sends one chunk to the peer, false once the connection is gone.
typedef std::function<bool(const uint8_t* data, size_t size)> ChunkWriter;

struct HTTPResponse {
  int status = 200;
  std::map<std::string, std::string> headers;

  // Fixed body, owned by the response
  uint8_t* body = nullptr;
  size_t bodySize = 0;

  // Streaming body, invoked after the headers went out. Used instead of
  // `body` for file transfers; skipped for HEAD requests.
  std::function<void(const ChunkWriter&)> streamBody;

  HTTPResponse() = default;
  HTTPResponse(const HTTPResponse&) = delete;
  HTTPResponse& operator=(const HTTPResponse&) = delete;

  ~HTTPResponse() {
    if (body != nullptr) {
      free(body);
      body = nullptr;
    }
  }

  void setBody(const std::string& data);
};

std::unique_ptr<HTTPResponse> makeJsonResponse(const std::string& json,
                                               int status = 200);
std::unique_ptr<HTTPResponse> makeEmptyResponse(int status = 204);

}  // namespace chipstream
