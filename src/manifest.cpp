#include "manifest.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include "utils.hpp"

std::string Manifest::file_name(DigestAlgorithm algorithm) {
  return digest_algorithm_name(algorithm) + "sums";
}

std::string Manifest::temp_file_name(const std::string& manifest_name) {
  return "." + manifest_name + ".tmp";
}

bool Manifest::is_manifest_name(const std::string& basename) {
  for(auto algorithm : supported_digest_algorithms()) {
    const auto name = file_name(algorithm);
    if(basename == name || basename == temp_file_name(name)) return true;
  }
  return false;
}

bool Manifest::is_recordable_name(const std::string& basename) {
  return !basename.empty() &&
         std::none_of(basename.begin(), basename.end(),
                      [](unsigned char ch){ return std::isspace(ch); });
}

Manifest Manifest::parse(std::istream& in, std::vector<std::string>* malformed) {
  Manifest manifest;
  std::string line;
  while(std::getline(in, line)) {
    auto tokens = split_whitespace(line);
    if(tokens.empty()) continue;
    if(tokens.size() < 2) {
      if(malformed) malformed->push_back(line);
      continue;
    }
    manifest.entries_[tokens.back()] = tokens.front();
  }
  return manifest;
}

std::optional<Manifest> Manifest::load(const std::filesystem::path& file,
                                       std::string& error,
                                       std::vector<std::string>* malformed) {
  error.clear();
  std::error_code ec;
  const auto status = std::filesystem::status(file, ec);
  if(status.type() == std::filesystem::file_type::not_found) {
    return std::nullopt;
  }
  if(ec) {
    error = ec.message();
    return std::nullopt;
  }
  if(status.type() != std::filesystem::file_type::regular) {
    error = "not a regular file";
    return std::nullopt;
  }
  std::ifstream in(file);
  if(!in) {
    error = std::strerror(errno);
    return std::nullopt;
  }
  auto manifest = parse(in, malformed);
  if(in.bad()) {
    error = "read error";
    return std::nullopt;
  }
  return manifest;
}

std::string Manifest::serialize() const {
  std::ostringstream out;
  for(const auto& [name, digest] : entries_) {
    out << digest << "  " << name << '\n';
  }
  return out.str();
}

bool Manifest::save(const std::filesystem::path& file, std::string& error) const {
  error.clear();
  const auto temp = file.parent_path() / temp_file_name(file.filename().string());
  {
    std::ofstream out(temp, std::ios::trunc);
    if(!out) {
      error = std::strerror(errno);
      return false;
    }
    out << serialize();
    out.flush();
    if(!out) {
      error = "write failed";
      std::error_code ignored;
      std::filesystem::remove(temp, ignored);
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(temp, file, ec);
  if(ec) {
    error = ec.message();
    std::error_code ignored;
    std::filesystem::remove(temp, ignored);
    return false;
  }
  return true;
}

std::optional<std::string> Manifest::get(const std::string& name) const {
  auto it = entries_.find(name);
  if(it == entries_.end()) return std::nullopt;
  return it->second;
}

void Manifest::set(const std::string& name, std::string digest) {
  entries_[name] = std::move(digest);
}

bool Manifest::erase(const std::string& name) {
  return entries_.erase(name) > 0;
}
