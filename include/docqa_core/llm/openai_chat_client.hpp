#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <string>

#include "docqa_core/llm/answer_service.hpp"

namespace docqa_core {

struct OpenAiChatConfig {
  std::string base_url = "https://api.openai.com/v1";
  std::string model = "gpt-3.5-turbo";
  std::string api_key;  // empty: no Authorization header
  long timeout_ms = 30000;
};

// AnswerService over an OpenAI-compatible /chat/completions endpoint.
class OpenAiChatClient : public AnswerService {
 public:
  explicit OpenAiChatClient(const OpenAiChatConfig &config);
  ~OpenAiChatClient() override;

  // Disable copy constructor and assignment
  OpenAiChatClient(const OpenAiChatClient &) = delete;
  OpenAiChatClient &operator=(const OpenAiChatClient &) = delete;

  std::string complete(const std::string &prompt, int max_tokens, float temperature) override;

  // Request body for a single user-role message; exposed for tests.
  nlohmann::json build_request_body(const std::string &prompt, int max_tokens,
                                    float temperature) const;

  // Pulls choices[0].message.content out of a response body and trims it.
  // Throws ServiceError(BadResponse) when the body has no usable answer.
  static std::string parse_completion(const std::string &response_body);

 private:
  OpenAiChatConfig config_;
  CURL *curl_handle_;

  // Helper methods
  void setup_curl_handle();
  std::string build_url() const;
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
  static std::string extract_error_message(const std::string &response_body);
};

}  // namespace docqa_core
