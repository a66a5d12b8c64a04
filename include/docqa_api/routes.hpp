#pragma once
#include <exception>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>

#include "server.hpp"

// Forward declarations
namespace docqa_core {
class QuestionAnsweringService;
class DocumentSession;
}  // namespace docqa_core

namespace docqa_api {

class Routes {
 public:
  explicit Routes(std::shared_ptr<docqa_core::QuestionAnsweringService> qa_service);
  ~Routes() = default;

  // Disable copy and move; the live session is guarded by a mutex
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;
  Routes(Routes &&) = delete;
  Routes &operator=(Routes &&) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // HTTP status reported for a failure escaping the core
  static int status_code_for(const std::exception &e);

 private:
  std::shared_ptr<docqa_core::QuestionAnsweringService> qa_service_;

  // Embedding and completion clients are not shared across threads
  std::mutex pipeline_mutex_;

  // One live document at a time; a new upload replaces it
  std::mutex session_mutex_;
  std::shared_ptr<const docqa_core::DocumentSession> current_session_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_upload_document(const crow::request &req);
  crow::response handle_current_document(const crow::request &req);
  crow::response handle_ask(const crow::request &req);

  // Helper methods
  std::shared_ptr<const docqa_core::DocumentSession> current_session();
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json describe_session(const docqa_core::DocumentSession &session);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace docqa_api
