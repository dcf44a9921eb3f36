#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "digest.hpp"

// Per-directory checksum record, one "<digest>  <basename>" line per file.
class Manifest {
public:
  using Entries = std::map<std::string, std::string>; // basename -> digest

  static std::string file_name(DigestAlgorithm algorithm);
  // Hidden sibling that save() writes before renaming it into place.
  static std::string temp_file_name(const std::string& manifest_name);
  // True for the manifest name, or its temporary, of any supported algorithm.
  static bool is_manifest_name(const std::string& basename);
  // Whitespace cannot survive the line format.
  static bool is_recordable_name(const std::string& basename);

  // First whitespace-separated token is the digest, the last one the basename;
  // fields in between are ignored. Lines with fewer than two tokens are
  // reported through `malformed`.
  static Manifest parse(std::istream& in, std::vector<std::string>* malformed = nullptr);
  // nullopt when the file is absent, or present but unusable (unreadable,
  // not a regular file); `error` is empty only in the first case.
  static std::optional<Manifest> load(const std::filesystem::path& file,
                                      std::string& error,
                                      std::vector<std::string>* malformed = nullptr);

  std::string serialize() const;
  // Writes to a sibling temporary and renames it over `file`.
  bool save(const std::filesystem::path& file, std::string& error) const;

  bool contains(const std::string& name) const { return entries_.count(name) > 0; }
  std::optional<std::string> get(const std::string& name) const;
  void set(const std::string& name, std::string digest);
  bool erase(const std::string& name);

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const Entries& entries() const { return entries_; }

  bool operator==(const Manifest& other) const { return entries_ == other.entries_; }
  bool operator!=(const Manifest& other) const { return !(*this == other); }

private:
  Entries entries_;
};
