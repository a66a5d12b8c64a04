#pragma once

#include <exception>
#include <string>

namespace docqa_core {

enum class ServiceErrorKind {
  RateLimited,
  Unauthorized,
  Timeout,
  Unavailable,
  BadResponse
};

inline std::string kind_to_string(ServiceErrorKind kind) {
  switch (kind) {
    case ServiceErrorKind::RateLimited: return "rate_limited";
    case ServiceErrorKind::Unauthorized: return "unauthorized";
    case ServiceErrorKind::Timeout: return "timeout";
    case ServiceErrorKind::Unavailable: return "unavailable";
    case ServiceErrorKind::BadResponse: return "bad_response";
  }
  return "unknown";
}

// Maps a non-2xx HTTP status from the completion endpoint to an error kind.
inline ServiceErrorKind classify_http_status(long status_code) {
  switch (status_code) {
    case 429:
      return ServiceErrorKind::RateLimited;
    case 401:
    case 403:
      return ServiceErrorKind::Unauthorized;
    case 408:
    case 504:
      return ServiceErrorKind::Timeout;
    default:
      if (status_code >= 500) {
        return ServiceErrorKind::Unavailable;
      }
      return ServiceErrorKind::BadResponse;
  }
}

class ServiceError : public std::exception {
 public:
  ServiceError(ServiceErrorKind kind, const std::string &message)
      : kind_(kind), message_("(" + kind_to_string(kind) + ") " + message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ServiceErrorKind kind() const {
    return kind_;
  }

 private:
  ServiceErrorKind kind_;
  std::string message_;
};

// Text-completion endpoint that turns a rendered prompt into an answer.
// Failures surface as ServiceError and are never retried here.
class AnswerService {
 public:
  virtual ~AnswerService() = default;

  virtual std::string complete(const std::string &prompt, int max_tokens, float temperature) = 0;
};

}  // namespace docqa_core
