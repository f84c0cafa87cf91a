#pragma once

#include "core/result.h"
#include "core/task_error.h"

#include <array>
#include <cstddef>
#include <string>

namespace evx::core {

/// SSE-C key material. raw is the secret, fingerprint is base64(MD5(raw)).
/// Both values always come from the same KeyManager call, so the trigger body
/// and the download headers of one invocation can never mix sources.
struct EncryptionKey {
  static constexpr std::size_t kKeySize = 32;

  std::array<unsigned char, kKeySize> raw{};
  std::string algorithm = "AES256";
  std::string fingerprint;
};

/// Pure functions over SSE-C key material: no cache, no global key store.
/// A key created by `export` has to be supplied again by the user for a later
/// `download`; validate() + fingerprint() rebuild byte-identical headers.
class KeyManager {
public:
  static constexpr const char *kDefaultAlgorithm = "AES256";

  /// Fresh key from OpenSSL's CSPRNG. Throws std::runtime_error only if the
  /// system RNG itself is broken.
  static EncryptionKey generate(const std::string &algorithm = kDefaultAlgorithm);

  /// Decode user-supplied base64 material. Fails with Config when the text is
  /// not base64, InvalidKeyLength when it does not decode to 32 bytes.
  static Result<EncryptionKey, TaskError>
  validate(const std::string &encoded,
           const std::string &algorithm = kDefaultAlgorithm);

  /// Same as validate(), additionally checking a user-supplied fingerprint
  /// against the recomputed one. An empty expected_fingerprint is ignored.
  static Result<EncryptionKey, TaskError>
  validate(const std::string &encoded, const std::string &algorithm,
           const std::string &expected_fingerprint);

  /// base64(MD5(raw)). Deterministic, no side effects.
  static std::string
  fingerprint(const std::array<unsigned char, EncryptionKey::kKeySize> &raw);

  /// base64 of the raw key, as sent on the wire and shown to the user once.
  static std::string encode(const EncryptionKey &key);
};

} // namespace evx::core
