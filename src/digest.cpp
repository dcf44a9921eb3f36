#include "digest.hpp"

#include <openssl/evp.h>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

#include "log.hpp"
#include "utils.hpp"

extern char** environ;

namespace {

struct AlgorithmEntry {
  DigestAlgorithm algorithm;
  const char* name;
  const EVP_MD* (*evp)();
};

const AlgorithmEntry kAlgorithms[] = {
  {DigestAlgorithm::Md5,    "md5",    EVP_md5},
  {DigestAlgorithm::Sha1,   "sha1",   EVP_sha1},
  {DigestAlgorithm::Sha224, "sha224", EVP_sha224},
  {DigestAlgorithm::Sha256, "sha256", EVP_sha256},
  {DigestAlgorithm::Sha384, "sha384", EVP_sha384},
  {DigestAlgorithm::Sha512, "sha512", EVP_sha512},
};

const AlgorithmEntry& entry_for(DigestAlgorithm algorithm) {
  for(const auto& entry : kAlgorithms) {
    if(entry.algorithm == algorithm) return entry;
  }
  throw std::invalid_argument("unsupported digest algorithm");
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

struct EvpContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct SpawnActions {
  posix_spawn_file_actions_t actions;
  SpawnActions() {
    if(posix_spawn_file_actions_init(&actions) != 0) {
      throw std::runtime_error("posix_spawn_file_actions_init failed");
    }
  }
  ~SpawnActions() { posix_spawn_file_actions_destroy(&actions); }
  SpawnActions(const SpawnActions&) = delete;
  SpawnActions& operator=(const SpawnActions&) = delete;
};

class FdGuard {
public:
  explicit FdGuard(int fd = -1) : fd_(fd) {}
  ~FdGuard() { reset(); }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;
  int get() const { return fd_; }
  void reset() {
    if(fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }
private:
  int fd_;
};

} // namespace

const std::vector<DigestAlgorithm>& supported_digest_algorithms() {
  static const std::vector<DigestAlgorithm> algorithms = [](){
    std::vector<DigestAlgorithm> out;
    for(const auto& entry : kAlgorithms) out.push_back(entry.algorithm);
    return out;
  }();
  return algorithms;
}

std::optional<DigestAlgorithm> parse_digest_algorithm(const std::string& name) {
  const auto lowered = to_lower(name);
  for(const auto& entry : kAlgorithms) {
    if(lowered == entry.name) return entry.algorithm;
  }
  return std::nullopt;
}

std::string digest_algorithm_name(DigestAlgorithm algorithm) {
  return entry_for(algorithm).name;
}

std::string native_command_name(DigestAlgorithm algorithm) {
  return digest_algorithm_name(algorithm) + "sum";
}

std::optional<BackendPreference> parse_backend_preference(const std::string& name) {
  const auto lowered = to_lower(name);
  if(lowered == "auto") return BackendPreference::Auto;
  if(lowered == "native") return BackendPreference::Native;
  if(lowered == "openssl") return BackendPreference::OpenSsl;
  return std::nullopt;
}

OpenSslChecksumBackend::OpenSslChecksumBackend(DigestAlgorithm algorithm, std::size_t block_size)
  : algorithm_(algorithm),
    block_size_(block_size == 0 ? kDefaultBlockSize : block_size) {}

std::optional<std::string> OpenSslChecksumBackend::digest(const std::filesystem::path& file,
                                                          const CancellationToken& cancel) const {
  std::ifstream in(file, std::ios::binary);
  if(!in) return std::nullopt;

  std::unique_ptr<EVP_MD_CTX, EvpContextDeleter> ctx(EVP_MD_CTX_new());
  if(!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
  if(EVP_DigestInit_ex(ctx.get(), entry_for(algorithm_).evp(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed for " + digest_algorithm_name(algorithm_));
  }

  std::vector<char> buffer(block_size_);
  while(in) {
    cancel.throw_if_cancelled();
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize read = in.gcount();
    if(read > 0) {
      if(EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(read)) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
      }
    }
  }
  if(in.bad()) return std::nullopt;

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  return hex_from_bytes(digest, length);
}

std::string OpenSslChecksumBackend::describe() const {
  return "OpenSSL " + digest_algorithm_name(algorithm_);
}

CommandChecksumBackend::CommandChecksumBackend(std::filesystem::path program)
  : program_(std::move(program)) {}

std::optional<std::string> CommandChecksumBackend::digest(const std::filesystem::path& file,
                                                          const CancellationToken& cancel) const {
  cancel.throw_if_cancelled();

  int fds[2];
  if(::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }
  FdGuard read_end(fds[0]);
  FdGuard write_end(fds[1]);

  SpawnActions spawn;
  posix_spawn_file_actions_adddup2(&spawn.actions, write_end.get(), STDOUT_FILENO);
  posix_spawn_file_actions_addopen(&spawn.actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

  std::string program = program_.string();
  std::string target = file.string();
  std::vector<char*> argv{program.data(), target.data(), nullptr};

  pid_t pid = 0;
  int rc = posix_spawn(&pid, program.c_str(), &spawn.actions, nullptr, argv.data(), environ);
  if(rc != 0) {
    throw std::runtime_error("Unable to run " + program + ": " + std::strerror(rc));
  }
  write_end.reset();

  std::string output;
  char buf[512];
  for(;;) {
    ssize_t n = ::read(read_end.get(), buf, sizeof(buf));
    if(n > 0) {
      output.append(buf, static_cast<std::size_t>(n));
      continue;
    }
    if(n < 0 && errno == EINTR) continue;
    break;
  }

  int status = 0;
  while(::waitpid(pid, &status, 0) < 0) {
    if(errno != EINTR) {
      throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }
  }
  cancel.throw_if_cancelled();

  if(!WIFEXITED(status) || WEXITSTATUS(status) != 0) return std::nullopt;
  auto tokens = split_whitespace(output);
  if(tokens.empty()) return std::nullopt;
  // GNU tools prefix escaped names with a backslash
  std::string digest = tokens.front();
  if(!digest.empty() && digest.front() == '\\') digest.erase(0, 1);
  return to_lower(digest);
}

std::string CommandChecksumBackend::describe() const {
  return program_.string();
}

std::shared_ptr<ChecksumBackend> make_checksum_backend(DigestAlgorithm algorithm,
                                                       BackendPreference preference,
                                                       Logger* logger) {
  const auto command = native_command_name(algorithm);
  if(preference != BackendPreference::OpenSsl) {
    log_info(logger, "Checking for GNU program: {}", command);
    if(auto program = find_program(command)) {
      log_info(logger, "Computing checksums w/ GNU program: {}", program->string());
      return std::make_shared<CommandChecksumBackend>(*program);
    }
    if(preference == BackendPreference::Native) {
      throw std::invalid_argument("Could not find GNU program: " + command);
    }
    log_info(logger, "Could not find GNU program: {}", command);
  }
  log_info(logger, "Computing checksums with OpenSSL digest: {}", digest_algorithm_name(algorithm));
  return std::make_shared<OpenSslChecksumBackend>(algorithm);
}
