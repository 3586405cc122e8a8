#pragma once
#include <crow.h>

#include <future>
#include <string>
#include <utility>

namespace rag_api {

// Owns the crow app and the thread it runs on. Routes are registered on
// get_app() before start().
class Server {
 public:
  Server(const std::string &host, int port);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();
  // Blocks until the serving thread has exited.
  void stop();

  bool is_running() const {
    return running_;
  }
  const std::string &host() const {
    return host_;
  }
  int port() const {
    return port_;
  }

  // Splits "host:port" from the configured base URL. An empty host binds all
  // interfaces. Throws std::invalid_argument on a missing or bad port.
  static std::pair<std::string, int> parse_host_port(const std::string &address);

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  std::future<void> serve_future_;
  bool running_ = false;
};

}  // namespace rag_api
