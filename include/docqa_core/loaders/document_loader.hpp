#pragma once

#include <exception>
#include <filesystem>
#include <string>

#include "docqa_core/types/document.hpp"

namespace docqa_core {

class DocumentLoadError : public std::exception {
 public:
  explicit DocumentLoadError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Upload boundary: accepts UTF-8 text only.
class DocumentLoader {
 public:
  static Document load_from_file(const std::filesystem::path &file_path);

  static Document load_from_string(std::string content, const std::string &source_name);

  // Lowercase hex SHA-256 of content
  static std::string compute_content_hash(const std::string &content);

 private:
  static void validate_utf8(const std::string &content, const std::string &source_name);
};

}  // namespace docqa_core
