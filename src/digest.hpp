#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"

class Logger;

enum class DigestAlgorithm {
  Md5,
  Sha1,
  Sha224,
  Sha256,
  Sha384,
  Sha512
};

enum class BackendPreference {
  Auto,     // native `<algorithm>sum` when on PATH, OpenSSL otherwise
  Native,
  OpenSsl
};

const std::vector<DigestAlgorithm>& supported_digest_algorithms();
std::optional<DigestAlgorithm> parse_digest_algorithm(const std::string& name);
std::string digest_algorithm_name(DigestAlgorithm algorithm);
// GNU coreutils program computing the same digest, e.g. "sha512sum".
std::string native_command_name(DigestAlgorithm algorithm);

std::optional<BackendPreference> parse_backend_preference(const std::string& name);

class ChecksumBackend {
public:
  virtual ~ChecksumBackend() = default;

  // Lowercase hex digest, or nullopt when the file cannot be read.
  // Throws AuditCancelled when the token fires mid-file.
  virtual std::optional<std::string> digest(const std::filesystem::path& file,
                                            const CancellationToken& cancel) const = 0;
  virtual std::string describe() const = 0;
};

class OpenSslChecksumBackend : public ChecksumBackend {
public:
  static constexpr std::size_t kDefaultBlockSize = 64 * 1024;

  explicit OpenSslChecksumBackend(DigestAlgorithm algorithm,
                                  std::size_t block_size = kDefaultBlockSize);

  std::optional<std::string> digest(const std::filesystem::path& file,
                                    const CancellationToken& cancel) const override;
  std::string describe() const override;

private:
  DigestAlgorithm algorithm_;
  std::size_t block_size_;
};

class CommandChecksumBackend : public ChecksumBackend {
public:
  explicit CommandChecksumBackend(std::filesystem::path program);

  std::optional<std::string> digest(const std::filesystem::path& file,
                                    const CancellationToken& cancel) const override;
  std::string describe() const override;

private:
  std::filesystem::path program_;
};

// Throws std::runtime_error when `Native` is requested and the program is missing.
std::shared_ptr<ChecksumBackend> make_checksum_backend(DigestAlgorithm algorithm,
                                                       BackendPreference preference,
                                                       Logger* logger = nullptr);
