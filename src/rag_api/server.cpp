#include "rag_api/server.hpp"

#include <stdexcept>

namespace rag_api {

Server::Server(const std::string &host, int port) : host_(host), port_(port) {}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  serve_future_ = std::async(std::launch::async,
                             [this] { app_.port(port_).bindaddr(host_).multithreaded().run(); });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  if (serve_future_.valid()) {
    serve_future_.get();
  }
  running_ = false;
}

std::pair<std::string, int> Server::parse_host_port(const std::string &address) {
  std::string authority = address;
  const size_t scheme_end = authority.find("://");
  if (scheme_end != std::string::npos) {
    authority = authority.substr(scheme_end + 3);
  }
  const size_t path_start = authority.find('/');
  if (path_start != std::string::npos) {
    authority.resize(path_start);
  }

  const size_t colon = authority.rfind(':');
  if (colon == std::string::npos || colon + 1 >= authority.size()) {
    throw std::invalid_argument("Address must have the form host:port, got '" + address + "'");
  }
  const std::string port_text = authority.substr(colon + 1);
  if (port_text.find_first_not_of("0123456789") != std::string::npos || port_text.size() > 5) {
    throw std::invalid_argument("Port is not a number in '" + address + "'");
  }
  const int port = std::stoi(port_text);
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Port out of range in '" + address + "'");
  }
  const std::string host = authority.substr(0, colon);
  return {host.empty() ? "0.0.0.0" : host, port};
}

}  // namespace rag_api
