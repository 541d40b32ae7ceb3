#include "HTTPResponse.h"

#include <string.h>  // for memcpy
#include <new>       // for bad_alloc

using namespace chipstream;

void HTTPResponse::setBody(const std::string& data) {
  if (body != nullptr) {
    free(body);
    body = nullptr;
  }
  bodySize = 0;
  if (data.empty()) {
    return;
  }

  body = (uint8_t*)malloc(data.size());
  if (body == nullptr) {
    throw std::bad_alloc();
  }
  bodySize = data.size();
  memcpy(body, data.data(), data.size());
}

std::unique_ptr<HTTPResponse> chipstream::makeJsonResponse(
    const std::string& json, int status) {
  auto response = std::make_unique<HTTPResponse>();

  response->setBody(json);
  response->headers["Content-Type"] = "application/json; charset=utf-8";
  response->status = status;
  return response;
}

std::unique_ptr<HTTPResponse> chipstream::makeEmptyResponse(int status) {
  auto response = std::make_unique<HTTPResponse>();
  response->status = status;
  return response;
}
