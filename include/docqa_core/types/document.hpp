#pragma once

#include <string>

namespace docqa_core {

struct Document {
  std::string document_id;  // hex SHA-256 of content
  std::string source_name;
  std::string content;
};

}  // namespace docqa_core
