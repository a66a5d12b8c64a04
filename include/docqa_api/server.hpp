#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace docqa_api {

struct ServerAddress {
  std::string host;
  int port = 0;
};

// Parses a "host:port" listen address such as "127.0.0.1:3030".
// Throws std::invalid_argument for a missing host or a port outside 1-65535.
ServerAddress parse_server_address(const std::string &address);

class Server {
 public:
  explicit Server(const std::string &address);
  ~Server();

  // Disable move and copy operations since crow::SimpleApp doesn't support them
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  const ServerAddress &address() const {
    return address_;
  }

  // Serves on a background thread. Crow's own SIGINT/SIGTERM handling is
  // turned off; the caller decides when to stop().
  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

  // Routes one request through the registered handlers without a socket.
  // Only valid while the server is not started.
  crow::response dispatch(crow::request &req);

 private:
  crow::SimpleApp app_;
  ServerAddress address_;
  std::future<void> server_thread_future_;  // Manages the server thread
  bool running_ = false;
  bool routes_validated_ = false;
};

}  // namespace docqa_api
