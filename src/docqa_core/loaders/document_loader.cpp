#include "docqa_core/loaders/document_loader.hpp"

#include <openssl/evp.h>
#include <utf8.h>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace docqa_core {

Document DocumentLoader::load_from_file(const std::filesystem::path &file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentLoadError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw DocumentLoadError("Failed while reading file: " + file_path.string());
  }
  return load_from_string(buffer.str(), file_path.filename().string());
}

Document DocumentLoader::load_from_string(std::string content, const std::string &source_name) {
  validate_utf8(content, source_name);

  Document document;
  document.document_id = compute_content_hash(content);
  document.source_name = source_name;
  document.content = std::move(content);
  return document;
}

void DocumentLoader::validate_utf8(const std::string &content, const std::string &source_name) {
  auto invalid = utf8::find_invalid(content.begin(), content.end());
  if (invalid != content.end()) {
    throw DocumentLoadError("Document '" + source_name + "' is not valid UTF-8 (first bad byte at offset " +
                            std::to_string(invalid - content.begin()) + ")");
  }
}

std::string DocumentLoader::compute_content_hash(const std::string &content) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw DocumentLoadError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw DocumentLoadError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw DocumentLoadError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw DocumentLoadError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace docqa_core
