#include "docqa_api/server.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>

namespace docqa_api {

ServerAddress parse_server_address(const std::string &address) {
  const size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    throw std::invalid_argument("Server address must be host:port, got '" + address + "'");
  }

  const std::string port_text = address.substr(colon + 1);
  if (port_text.empty() || port_text.size() > 5) {
    throw std::invalid_argument("Invalid port in server address '" + address + "'");
  }
  for (char c : port_text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw std::invalid_argument("Invalid port in server address '" + address + "'");
    }
  }

  ServerAddress parsed;
  parsed.host = address.substr(0, colon);
  parsed.port = std::stoi(port_text);
  if (parsed.port < 1 || parsed.port > 65535) {
    throw std::invalid_argument("Port out of range in server address '" + address + "'");
  }
  return parsed;
}

Server::Server(const std::string &address) : address_(parse_server_address(address)) {}

Server::~Server() {
  try {
    stop();
  } catch (const std::exception &e) {
    std::cerr << "Error while stopping server: " << e.what() << std::endl;
  }
}

void Server::start() {
  if (running_) {
    return;
  }
  app_.signal_clear();
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(static_cast<uint16_t>(address_.port)).bindaddr(address_.host).run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}

crow::response Server::dispatch(crow::request &req) {
  if (running_) {
    throw std::logic_error("dispatch() cannot be used while the server is listening");
  }
  if (!routes_validated_) {
    app_.validate();
    routes_validated_ = true;
  }

  crow::response res;
  app_.handle_full(req, res);
  return res;
}

}  // namespace docqa_api
