#include "docqa_core/llm/openai_chat_client.hpp"

#include <memory>

namespace docqa_core {

namespace {

std::string trim(const std::string &text) {
  const char *whitespace = " \t\r\n";
  const size_t begin = text.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  const size_t end = text.find_last_not_of(whitespace);
  return text.substr(begin, end - begin + 1);
}

struct SlistDeleter {
  void operator()(curl_slist *list) const {
    curl_slist_free_all(list);
  }
};

}  // namespace

OpenAiChatClient::OpenAiChatClient(const OpenAiChatConfig &config)
    : config_(config), curl_handle_(nullptr) {
  setup_curl_handle();
}

OpenAiChatClient::~OpenAiChatClient() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

void OpenAiChatClient::setup_curl_handle() {
  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw ServiceError(ServiceErrorKind::Unavailable, "Failed to initialize CURL");
  }
}

size_t OpenAiChatClient::write_callback(void *contents, size_t size, size_t nmemb,
                                        std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string OpenAiChatClient::build_url() const {
  std::string url = config_.base_url;
  if (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url + "/chat/completions";
}

nlohmann::json OpenAiChatClient::build_request_body(const std::string &prompt, int max_tokens,
                                                    float temperature) const {
  return {{"model", config_.model},
          {"messages", nlohmann::json::array({{{"role", "user"}, {"content", prompt}}})},
          {"max_tokens", max_tokens},
          {"temperature", temperature}};
}

std::string OpenAiChatClient::complete(const std::string &prompt, int max_tokens,
                                       float temperature) {
  // Document text may carry invalid UTF-8 cut at a chunk edge; replace it
  // rather than let dump() throw.
  const std::string request_json = build_request_body(prompt, max_tokens, temperature)
                                       .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  const std::string url = build_url();
  std::string response_buffer;

  std::unique_ptr<curl_slist, SlistDeleter> headers(
      curl_slist_append(nullptr, "Content-Type: application/json"));
  if (!config_.api_key.empty()) {
    const std::string auth = "Authorization: Bearer " + config_.api_key;
    headers.reset(curl_slist_append(headers.release(), auth.c_str()));
  }

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_json.size()));
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT_MS, config_.timeout_ms);
  curl_easy_setopt(curl_handle_, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl_handle_);
  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw ServiceError(ServiceErrorKind::Timeout,
                       "Completion request exceeded " + std::to_string(config_.timeout_ms) + "ms");
  }
  if (res != CURLE_OK) {
    throw ServiceError(ServiceErrorKind::Unavailable,
                       "CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    throw ServiceError(classify_http_status(http_code),
                       "HTTP " + std::to_string(http_code) + ": " +
                           extract_error_message(response_buffer));
  }

  return parse_completion(response_buffer);
}

std::string OpenAiChatClient::parse_completion(const std::string &response_body) {
  nlohmann::json response;
  try {
    response = nlohmann::json::parse(response_body);
  } catch (const nlohmann::json::parse_error &e) {
    throw ServiceError(ServiceErrorKind::BadResponse,
                       "Completion response is not JSON: " + std::string(e.what()));
  }

  if (!response.contains("choices") || !response["choices"].is_array() ||
      response["choices"].empty()) {
    throw ServiceError(ServiceErrorKind::BadResponse, "Completion response has no choices");
  }
  const auto &choice = response["choices"][0];
  if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
    throw ServiceError(ServiceErrorKind::BadResponse, "Completion choice has no message");
  }
  const auto &message = choice["message"];
  if (!message.contains("content") || !message["content"].is_string()) {
    throw ServiceError(ServiceErrorKind::BadResponse, "Completion choice has no text content");
  }
  return trim(message["content"].get<std::string>());
}

std::string OpenAiChatClient::extract_error_message(const std::string &response_body) {
  auto error_json = nlohmann::json::parse(response_body, nullptr, false);
  if (!error_json.is_discarded() && error_json.contains("error")) {
    const auto &error = error_json["error"];
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
      return error["message"].get<std::string>();
    }
    if (error.is_string()) {
      return error.get<std::string>();
    }
  }
  return response_body.substr(0, 200);
}

}  // namespace docqa_core
