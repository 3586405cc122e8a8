#include "rag_core/utils/content_hash.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

#include "rag_core/errors.hpp"

namespace rag_core {

std::string compute_content_hash(const std::string& content) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw RagError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw RagError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw RagError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw RagError("Failed to finalize SHA256 digest");
  }
  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string compute_sections_hash(const std::vector<Section>& sections) {
  std::string buffer;
  for (const auto& section : sections) {
    buffer += section.label;
    buffer += '\x1f';
    buffer += section.content;
    buffer += '\x1e';
  }
  return compute_content_hash(buffer);
}

}  // namespace rag_core
