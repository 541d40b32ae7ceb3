#pragma once

#include <stddef.h>       // for size_t
#include <stdint.h>       // for uint64_t
#include <functional>     // for function
#include <memory>         // for unique_ptr
#include <mutex>          // for mutex
#include <optional>       // for optional
#include <set>            // for set
#include <string>         // for string
#include <unordered_map>  // for unordered_map
#include <utility>        // for pair
#include <vector>         // for vector

#include "CivetServer.h"   // for CivetHandler, CivetServer
#include "HTTPResponse.h"  // for HTTPResponse

namespace chipstream {

class HTTPServer : public CivetHandler {
 public:
  typedef std::function<std::unique_ptr<HTTPResponse>(struct mg_connection* conn)>
      HTTPHandler;
  typedef std::unordered_map<std::string, std::string> Params;

  // Path trie: "/api/songs/:id" binds `id`, a trailing "*" matches the rest.
  class Router {
   public:
    typedef std::pair<HTTPHandler, Params> HandlerAndParams;

    void insert(const std::string& route, HTTPHandler& value);
    HandlerAndParams find(const std::string& route);

   private:
    struct RouterNode {
      std::unordered_map<std::string, std::unique_ptr<RouterNode>> children;
      HTTPHandler value = nullptr;
      std::string paramName = "";

      bool isParam = false;
      bool isCatchAll = false;
    };

    RouterNode root = RouterNode();

    std::vector<std::string> split(const std::string str,
                                   const std::string regex_str);
  };

  HTTPServer(int serverPort,
             const std::vector<std::pair<std::string, std::string>>& options =
                 {});
  ~HTTPServer();

  /**
   * Opens the listening socket. Routes registered before this call are
   * live from the first request; later registrations are bound at once.
   * Returns false when civetweb could not start, typically a busy port.
   */
  bool start();
  bool isRunning() const { return server != nullptr; }
  int port() const { return serverPort; }

  void registerGet(const std::string& url, HTTPHandler handler);
  void registerPost(const std::string& url, HTTPHandler handler);
  void registerDelete(const std::string& url, HTTPHandler handler);
  void registerNotFound(HTTPHandler handler);

  bool handleGet(CivetServer* server, struct mg_connection* conn);
  bool handleHead(CivetServer* server, struct mg_connection* conn);
  bool handlePost(CivetServer* server, struct mg_connection* conn);
  bool handleDelete(CivetServer* server, struct mg_connection* conn);
  bool handleOptions(CivetServer* server, struct mg_connection* conn);

  // Route parameters bound for the request being handled on `conn`.
  static Params extractParams(struct mg_connection* conn);
  static std::optional<std::string> getHeader(struct mg_connection* conn,
                                              const std::string& name);
  static std::string getQueryParam(struct mg_connection* conn,
                                   const std::string& name);

  // Whole request body, nullopt once it grows past `maxBytes`.
  static std::optional<std::string> readBody(struct mg_connection* conn,
                                             uint64_t maxBytes);

  static void addCorsHeaders(HTTPResponse& response);

 private:
  bool dispatch(Router& router, struct mg_connection* conn, bool sendBody);
  void sendResponse(struct mg_connection* conn, HTTPResponse& response,
                    bool sendBody);
  void addRoute(Router& router, const std::string& url, HTTPHandler& handler);

  std::unique_ptr<CivetServer> server;
  std::vector<std::string> civetWebOptions;
  std::set<std::string> civetPrefixes;
  int serverPort;

  Router getRequestsRouter;
  Router postRequestsRouter;
  Router deleteRequestsRouter;
  HTTPHandler notFoundHandler;

  static std::mutex initMutex;
};

}  // namespace chipstream
