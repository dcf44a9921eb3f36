#pragma once

#include <regex>
#include <string>
#include <vector>

enum class PatternMode {
  Include,
  Exclude
};

// Compiled rsync-style include/exclude rules.
//
// Paths handed to excludes() are absolute; the configured base is stripped
// first so that rules anchored with a leading '/' bind to the audit root.
// Rules are tried in order and the first match decides:
//   Exclude mode: match => excluded, no match => kept.
//   Include mode: match => kept,     no match => excluded.
// An Include set without rules therefore excludes everything.
class PatternSet {
public:
  struct Rule {
    std::string pattern;
    std::string expression;
    std::regex regex;
    bool directory_only = false;
  };

  PatternSet();
  // Throws std::invalid_argument for a pattern that does not compile.
  PatternSet(PatternMode mode,
             const std::vector<std::string>& patterns,
             const std::string& base = "/");

  // Regular expression source for one pattern, without the directory-only
  // trailing separator.
  static std::string translate(const std::string& pattern);

  bool excludes(const std::string& path, bool is_directory) const;
  std::string relative(const std::string& path) const;

  PatternMode mode() const { return mode_; }
  const std::vector<Rule>& rules() const { return rules_; }
  const std::string& base() const { return base_; }

private:
  PatternMode mode_ = PatternMode::Exclude;
  std::vector<Rule> rules_;
  std::string base_;
};

const char* pattern_mode_name(PatternMode mode);
