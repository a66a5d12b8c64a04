#include "docqa_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "docqa_core/loaders/document_loader.hpp"
#include "docqa_core/services/question_answering_service.hpp"

namespace docqa_api {

namespace {
constexpr size_t CONTEXT_PREVIEW_CHARS = 200;
}  // namespace

Routes::Routes(std::shared_ptr<docqa_core::QuestionAnsweringService> qa_service)
    : qa_service_(qa_service) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Upload endpoint, replaces the live document
  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_upload_document(req); });

  CROW_ROUTE(app, "/documents/current")
  ([this](const crow::request &req) { return handle_current_document(req); });

  // Question endpoint
  CROW_ROUTE(app, "/ask").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ask(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

int Routes::status_code_for(const std::exception &e) {
  if (auto service_error = dynamic_cast<const docqa_core::ServiceError *>(&e)) {
    switch (service_error->kind()) {
      case docqa_core::ServiceErrorKind::RateLimited:
        return 429;
      case docqa_core::ServiceErrorKind::Timeout:
        return 504;
      default:
        return 502;
    }
  }
  if (dynamic_cast<const docqa_core::ModelError *>(&e)) {
    return 502;
  }
  if (dynamic_cast<const docqa_core::ConfigurationError *>(&e) ||
      dynamic_cast<const docqa_core::VectorIndexError *>(&e) ||
      dynamic_cast<const docqa_core::DocumentLoadError *>(&e) ||
      dynamic_cast<const nlohmann::json::exception *>(&e) ||
      dynamic_cast<const std::invalid_argument *>(&e)) {
    return 400;
  }
  return 500;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("DocQA API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_upload_document(const crow::request &req) {
  // A new upload discards the previous document even if it then fails
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    current_session_.reset();
  }

  try {
    std::string content;
    std::string name = "upload";
    if (req.get_header_value("Content-Type").find("application/json") != std::string::npos) {
      nlohmann::json body = parse_json_body(req.body);
      if (!body.contains("content") || !body["content"].is_string()) {
        throw std::invalid_argument("Missing or invalid 'content' field");
      }
      content = body["content"].get<std::string>();
      name = body.value("name", name);
    } else {
      content = req.body;
      if (const char *name_param = req.url_params.get("name")) {
        name = name_param;
      }
    }

    std::cout << "Loading document '" << name << "' (" << content.size() << " bytes)" << std::endl;
    docqa_core::Document document = docqa_core::DocumentLoader::load_from_string(std::move(content), name);
    std::shared_ptr<const docqa_core::DocumentSession> session;
    {
      std::lock_guard<std::mutex> pipeline_lock(pipeline_mutex_);
      session = qa_service_->load_document(std::move(document));
    }

    {
      std::lock_guard<std::mutex> lock(session_mutex_);
      current_session_ = session;
    }

    return create_json_response(
        create_success_response("Document loaded successfully", describe_session(*session)));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_upload_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), status_code_for(e));
  }
}

crow::response Routes::handle_current_document(const crow::request &req) {
  auto session = current_session();
  if (!session) {
    return create_json_response(create_error_response("No document loaded"), 404);
  }
  return create_json_response(describe_session(*session));
}

crow::response Routes::handle_ask(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    if (!body.contains("question") || !body["question"].is_string()) {
      throw std::invalid_argument("Missing or invalid 'question' field");
    }
    std::string question = body["question"].get<std::string>();

    auto session = current_session();
    if (!session) {
      return create_json_response(
          create_error_response("No document loaded; upload a document before asking questions"),
          409);
    }
    if (body.contains("document_id")) {
      if (!body["document_id"].is_string()) {
        throw std::invalid_argument("Invalid 'document_id' field");
      }
      const std::string document_id = body["document_id"].get<std::string>();
      if (document_id != session->document().document_id) {
        return create_json_response(
            create_error_response("Document " + document_id + " is no longer loaded"), 409);
      }
    }

    std::cout << "Question: " << question << std::endl;
    docqa_core::Answer answer;
    {
      std::lock_guard<std::mutex> pipeline_lock(pipeline_mutex_);
      answer = qa_service_->answer(*session, question);
    }

    nlohmann::json chunk_results = nlohmann::json::array();
    for (const docqa_core::SearchHit &hit : answer.hits) {
      nlohmann::json result_json;
      result_json["chunk_index"] = hit.position;
      result_json["distance"] = hit.distance;
      chunk_results.push_back(result_json);
    }

    nlohmann::json response;
    response["answer"] = answer.text;
    response["document_id"] = session->document().document_id;
    response["context_preview"] = answer.context.substr(0, CONTEXT_PREVIEW_CHARS);
    response["chunks"] = chunk_results;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ask: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), status_code_for(e));
  }
}

std::shared_ptr<const docqa_core::DocumentSession> Routes::current_session() {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return current_session_;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  if (body.empty()) {
    throw std::invalid_argument("Request body is empty");
  }
  return nlohmann::json::parse(body);
}

nlohmann::json Routes::describe_session(const docqa_core::DocumentSession &session) {
  return {{"document_id", session.document().document_id},
          {"name", session.document().source_name},
          {"size", session.document().content.size()},
          {"chunk_count", session.chunks().size()},
          {"dimension", session.index().dimension()}};
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.empty()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response response(status_code);
  response.set_header("Content-Type", "application/json");
  response.body = json_data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return response;
}

}  // namespace docqa_api
