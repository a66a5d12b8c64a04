#pragma once

#include <exception>
#include <string>

namespace docqa_core {

// Raised for invalid pipeline parameters (chunk sizes, context budget,
// generation options). Always thrown before any work is done.
class ConfigurationError : public std::exception {
 public:
  explicit ConfigurationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace docqa_core
