#include "HTTPServer.h"

#include <string.h>   // for strlen
#include <exception>  // for exception
#include <mutex>      // for lock_guard
#include <regex>      // for sregex_token_iterator, regex
#include <atomic>     // for atomic

#include <fmt/core.h>  // for format

#include "ChipLogger.h"  // for CHIP_LOG
#include "civetweb.h"    // for mg_get_request_info, mg_write, mg_read...

using namespace chipstream;

std::mutex HTTPServer::initMutex;
static std::atomic<int> s_civet_users{0};

namespace {
// "/api/songs/" and "/api/songs" route the same way
std::string normalizePath(const char* uri) {
  std::string path = uri != nullptr ? uri : "/";
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path.empty() ? "/" : path;
}

// Static part of a route, the prefix civetweb dispatches on
std::string civetPrefix(const std::string& route) {
  size_t wildcard = route.find_first_of(":*");
  std::string prefix =
      wildcard == std::string::npos ? route : route.substr(0, wildcard);
  while (prefix.size() > 1 && prefix.back() == '/') {
    prefix.pop_back();
  }
  return prefix.empty() ? "/" : prefix;
}
}  // namespace

std::vector<std::string> HTTPServer::Router::split(
    const std::string str, const std::string regex_str) {
  std::regex regexz(regex_str);
  return {std::sregex_token_iterator(str.begin(), str.end(), regexz, -1),
          std::sregex_token_iterator()};
}

void HTTPServer::Router::insert(const std::string& route,
                                HTTPHandler& value) {
  auto parts = split(route, "/");
  auto currentNode = &root;

  for (size_t index = 0; index < parts.size(); index++) {
    auto part = parts[index];
    if (part[0] == ':') {
      currentNode->isParam = true;
      currentNode->paramName = part.substr(1);
      part = "";
    } else if (part[0] == '*') {
      currentNode->isCatchAll = true;
      currentNode->value = value;
      return;
    }

    if (!currentNode->children.count(part)) {
      currentNode->children[part] = std::make_unique<RouterNode>();
    }
    currentNode = currentNode->children[part].get();
  }
  currentNode->value = value;
}

HTTPServer::Router::HandlerAndParams HTTPServer::Router::find(
    const std::string& route) {
  auto parts = split(route, "/");
  const RouterNode* currentNode = &root;
  Params params;

  for (size_t index = 0; index < parts.size(); index++) {
    const auto& part = parts[index];

    auto child = currentNode->children.find(part);
    if (child != currentNode->children.end()) {
      currentNode = child->second.get();
    } else if (currentNode->isParam) {
      params[currentNode->paramName] = part;
      auto next = currentNode->children.find("");
      if (next == currentNode->children.end()) {
        return {nullptr, Params()};
      }
      currentNode = next->second.get();
    } else if (currentNode->isCatchAll) {
      params["**"] = '*';
      return {currentNode->value, params};
    } else {
      return {nullptr, Params()};
    }
  }

  if (currentNode->value != nullptr) {
    return {currentNode->value, params};
  }

  return {nullptr, Params()};
}

HTTPServer::HTTPServer(
    int serverPort,
    const std::vector<std::pair<std::string, std::string>>& options) {
  std::lock_guard<std::mutex> lock(initMutex);
  if (s_civet_users++ == 0)
    mg_init_library(0);
  this->serverPort = serverPort;

  civetWebOptions.push_back("listening_ports");
  civetWebOptions.push_back(std::to_string(this->serverPort));
  for (auto& kv : options) {
    civetWebOptions.push_back(kv.first);
    civetWebOptions.push_back(kv.second);
  }
}

bool HTTPServer::start() {
  if (server) {
    return true;
  }
  try {
    server = std::make_unique<CivetServer>(civetWebOptions);
  } catch (const std::exception& e) {
    CHIP_LOG(error, "HTTPServer", "Could not start server on port %d: %s",
             serverPort, e.what());
    return false;
  }
  for (auto& prefix : civetPrefixes) {
    server->addHandler(prefix, this);
  }
  CHIP_LOG(info, "HTTPServer", "Server listening on port %d", serverPort);
  return true;
}

HTTPServer::~HTTPServer() {
  if (server) {
    server->close();
    server.reset();
  }
  std::lock_guard<std::mutex> lock(initMutex);
  if (--s_civet_users == 0)
    mg_exit_library();
}

void HTTPServer::addRoute(Router& router, const std::string& url,
                          HTTPHandler& handler) {
  router.insert(url, handler);
  civetPrefixes.insert(civetPrefix(url));
  if (server) {
    server->addHandler(civetPrefix(url), this);
  }
}

void HTTPServer::registerGet(const std::string& url, HTTPHandler handler) {
  addRoute(getRequestsRouter, url, handler);
}

void HTTPServer::registerPost(const std::string& url, HTTPHandler handler) {
  addRoute(postRequestsRouter, url, handler);
}

void HTTPServer::registerDelete(const std::string& url, HTTPHandler handler) {
  addRoute(deleteRequestsRouter, url, handler);
}

void HTTPServer::registerNotFound(HTTPHandler handler) {
  this->notFoundHandler = handler;
  // Catch-all so unknown paths reach us instead of civetweb's file server
  civetPrefixes.insert("**");
  if (server) {
    server->addHandler("**", this);
  }
}

bool HTTPServer::handleGet(CivetServer* server, struct mg_connection* conn) {
  return dispatch(getRequestsRouter, conn, true);
}

bool HTTPServer::handleHead(CivetServer* server, struct mg_connection* conn) {
  return dispatch(getRequestsRouter, conn, false);
}

bool HTTPServer::handlePost(CivetServer* server, struct mg_connection* conn) {
  return dispatch(postRequestsRouter, conn, true);
}

bool HTTPServer::handleDelete(CivetServer* server,
                              struct mg_connection* conn) {
  return dispatch(deleteRequestsRouter, conn, true);
}

bool HTTPServer::handleOptions(CivetServer* server,
                               struct mg_connection* conn) {
  auto reply = makeEmptyResponse(204);
  sendResponse(conn, *reply, false);
  return true;
}

bool HTTPServer::dispatch(Router& router, struct mg_connection* conn,
                          bool sendBody) {
  const mg_request_info* requestInfo = mg_get_request_info(conn);
  auto path = normalizePath(requestInfo->local_uri);
  auto handler = router.find(path);
  std::unique_ptr<HTTPResponse> reply;

  try {
    if (handler.first == nullptr) {
      if (this->notFoundHandler == nullptr) {
        return false;
      }
      reply = this->notFoundHandler(conn);
    } else {
      mg_set_user_connection_data(conn, &handler.second);
      reply = handler.first(conn);
      mg_set_user_connection_data(conn, nullptr);
    }
  } catch (std::exception& e) {
    mg_set_user_connection_data(conn, nullptr);
    CHIP_LOG(error, "HTTPServer", "Exception occured in handler: %s",
             e.what());
    reply = makeJsonResponse("{\"error\":\"Internal error\"}", 500);
  }

  if (!reply) {
    reply = makeEmptyResponse(204);
  }

  CHIP_LOG(info, "HTTPServer", "%s %s -> %d", requestInfo->request_method,
           path.c_str(), reply->status);

  try {
    sendResponse(conn, *reply, sendBody);
  } catch (std::exception& e) {
    CHIP_LOG(error, "HTTPServer", "Failed to send response for %s: %s",
             path.c_str(), e.what());
  }
  return true;
}

void HTTPServer::sendResponse(struct mg_connection* conn,
                              HTTPResponse& response, bool sendBody) {
  addCorsHeaders(response);
  response.headers["Connection"] = "close";
  if (!response.streamBody) {
    response.headers["Content-Length"] = std::to_string(response.bodySize);
  }

  std::string head = fmt::format("HTTP/1.1 {} {}\r\n", response.status,
                                 mg_get_response_code_text(conn, response.status));
  for (auto& h : response.headers) {
    head += h.first + ": " + h.second + "\r\n";
  }
  head += "\r\n";

  if (mg_write(conn, head.data(), head.size()) <= 0) {
    CHIP_LOG(debug, "HTTPServer", "Client went away before headers were sent");
    return;
  }
  if (!sendBody) {
    return;
  }

  if (response.streamBody) {
    response.streamBody([conn](const uint8_t* data, size_t size) {
      return mg_write(conn, data, size) > 0;
    });
  } else if (response.body != nullptr) {
    if (mg_write(conn, response.body, response.bodySize) <= 0) {
      CHIP_LOG(debug, "HTTPServer", "Client went away before body was sent");
    }
  }
}

void HTTPServer::addCorsHeaders(HTTPResponse& response) {
  response.headers["Access-Control-Allow-Origin"] = "*";
  response.headers["Access-Control-Allow-Methods"] =
      "GET, POST, DELETE, OPTIONS";
  response.headers["Access-Control-Allow-Headers"] = "Content-Type";
}

HTTPServer::Params HTTPServer::extractParams(struct mg_connection* conn) {
  void* data = mg_get_user_connection_data(conn);
  if (data == nullptr) {
    return Params();
  }
  return *(Params*)data;
}

std::optional<std::string> HTTPServer::getHeader(struct mg_connection* conn,
                                                 const std::string& name) {
  const char* value = mg_get_header(conn, name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

std::string HTTPServer::getQueryParam(struct mg_connection* conn,
                                      const std::string& name) {
  const mg_request_info* requestInfo = mg_get_request_info(conn);
  if (requestInfo->query_string == nullptr) {
    return "";
  }

  size_t length = strlen(requestInfo->query_string);
  // Decoded values are never longer than the encoded query
  std::vector<char> value(length + 1);
  int got = mg_get_var(requestInfo->query_string, length, name.c_str(),
                       value.data(), value.size());
  if (got < 0) {
    return "";
  }
  return std::string(value.data(), (size_t)got);
}

std::optional<std::string> HTTPServer::readBody(struct mg_connection* conn,
                                                uint64_t maxBytes) {
  const mg_request_info* requestInfo = mg_get_request_info(conn);
  std::string body;
  if (requestInfo->content_length > 0) {
    if ((uint64_t)requestInfo->content_length > maxBytes) {
      return std::nullopt;
    }
    body.reserve((size_t)requestInfo->content_length);
  }

  char buffer[16 * 1024];
  while (true) {
    int got = mg_read(conn, buffer, sizeof(buffer));
    if (got <= 0) {
      break;
    }
    if (body.size() + (size_t)got > maxBytes) {
      return std::nullopt;
    }
    body.append(buffer, (size_t)got);
  }
  return body;
}
