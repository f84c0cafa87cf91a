#include "core/key_manager.h"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace evx::core {

namespace {

constexpr std::size_t kMaxKeyTextLength = 1024;

bool is_base64_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::string base64_encode(const unsigned char *data, std::size_t size) {
  // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a NUL terminator.
  std::string out(4 * ((size + 2) / 3) + 1, '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                      data, static_cast<int>(size));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::string trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

/// Strict standard-alphabet decoding: padded, no embedded whitespace.
Result<std::vector<unsigned char>, TaskError>
base64_decode(const std::string &encoded) {
  using R = Result<std::vector<unsigned char>, TaskError>;

  const std::string text = trim(encoded);
  if (text.empty() || text.size() % 4 != 0 || text.size() > kMaxKeyTextLength) {
    return R::Err(TaskError::Config(
        "SSE-C key is not valid base64: length must be a non-zero multiple of 4"));
  }

  std::size_t padding = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '=') {
      // '=' is only legal in the last two positions.
      if (i + 2 < text.size()) {
        return R::Err(TaskError::Config(
            "SSE-C key is not valid base64: misplaced padding"));
      }
      ++padding;
    } else if (padding > 0 || !is_base64_char(c)) {
      return R::Err(TaskError::Config(
          "SSE-C key is not valid base64: unexpected character"));
    }
  }

  std::vector<unsigned char> out(text.size() / 4 * 3);
  const int decoded = EVP_DecodeBlock(
      out.data(), reinterpret_cast<const unsigned char *>(text.data()),
      static_cast<int>(text.size()));
  if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) {
    return R::Err(TaskError::Config("SSE-C key is not valid base64"));
  }
  // EVP_DecodeBlock counts the padding bytes as zeros.
  out.resize(static_cast<std::size_t>(decoded) - padding);
  return R::Ok(std::move(out));
}

} // namespace

EncryptionKey KeyManager::generate(const std::string &algorithm) {
  EncryptionKey key;
  if (RAND_bytes(key.raw.data(), static_cast<int>(key.raw.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed to produce key material");
  }
  key.algorithm = algorithm.empty() ? kDefaultAlgorithm : algorithm;
  key.fingerprint = fingerprint(key.raw);
  return key;
}

Result<EncryptionKey, TaskError>
KeyManager::validate(const std::string &encoded, const std::string &algorithm) {
  using R = Result<EncryptionKey, TaskError>;

  auto decoded = base64_decode(encoded);
  if (decoded.is_err()) {
    return R::Err(decoded.error());
  }

  const auto &bytes = decoded.value();
  if (bytes.size() != EncryptionKey::kKeySize) {
    return R::Err(TaskError(
        ErrorCategory::InvalidKeyLength, 2, false,
        "SSE-C key must be exactly 32 bytes (256 bits). Got " +
            std::to_string(bytes.size()) +
            " bytes after base64 decoding. Generate a valid key with: "
            "openssl rand -base64 32",
        "decoded key length " + std::to_string(bytes.size()),
        {{"decoded_length", std::to_string(bytes.size())}}));
  }

  EncryptionKey key;
  std::copy(bytes.begin(), bytes.end(), key.raw.begin());
  key.algorithm = algorithm.empty() ? kDefaultAlgorithm : algorithm;
  key.fingerprint = fingerprint(key.raw);
  return R::Ok(std::move(key));
}

Result<EncryptionKey, TaskError>
KeyManager::validate(const std::string &encoded, const std::string &algorithm,
                     const std::string &expected_fingerprint) {
  auto key = validate(encoded, algorithm);
  if (key.is_err() || expected_fingerprint.empty()) {
    return key;
  }
  if (trim(expected_fingerprint) != key.value().fingerprint) {
    return Result<EncryptionKey, TaskError>::Err(TaskError::Config(
        "SSE-C key MD5 does not match the supplied key"));
  }
  return key;
}

std::string KeyManager::fingerprint(
    const std::array<unsigned char, EncryptionKey::kKeySize> &raw) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (mdctx == nullptr) {
    throw std::runtime_error("Failed to create EVP context for key fingerprint");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  const bool ok = EVP_DigestInit_ex(mdctx, EVP_md5(), nullptr) == 1 &&
                  EVP_DigestUpdate(mdctx, raw.data(), raw.size()) == 1 &&
                  EVP_DigestFinal_ex(mdctx, digest, &digest_len) == 1;
  EVP_MD_CTX_free(mdctx);
  if (!ok) {
    throw std::runtime_error("Failed to compute MD5 key fingerprint");
  }

  return base64_encode(digest, digest_len);
}

std::string KeyManager::encode(const EncryptionKey &key) {
  return base64_encode(key.raw.data(), key.raw.size());
}

} // namespace evx::core
