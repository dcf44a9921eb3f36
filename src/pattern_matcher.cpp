#include "pattern_matcher.hpp"

#include <cstring>
#include <stdexcept>

namespace {

constexpr char kSeparator = '/';
constexpr const char* kAnySegmentRun = "[^/]*";
constexpr const char* kAnyRun = ".*";
constexpr const char* kOneSegmentChar = "[^/]";
constexpr const char* kComponentBoundary = "(?=/|$)";

bool is_regex_special(char c) {
  return c != '\0' && std::strchr(".+*?()[]{}|^$\\", c) != nullptr;
}

void append_literal(std::string& out, char c) {
  if(is_regex_special(c)) out += '\\';
  out += c;
}

// Returns the index of the closing ']' of a bracket expression starting at
// `open`, or npos when the bracket is unterminated.
std::size_t find_class_end(const std::string& body, std::size_t open) {
  std::size_t j = open + 1;
  if(j < body.size() && (body[j] == '!' || body[j] == '^')) ++j;
  if(j < body.size() && body[j] == ']') ++j;
  while(j < body.size() && body[j] != ']') {
    if(body[j] == '[' && j + 1 < body.size() && body[j + 1] == ':') {
      const auto name_end = body.find(":]", j + 2);
      if(name_end != std::string::npos) {
        j = name_end + 2;
        continue;
      }
    }
    ++j;
  }
  return j < body.size() ? j : std::string::npos;
}

} // namespace

const char* pattern_mode_name(PatternMode mode) {
  return mode == PatternMode::Include ? "include" : "exclude";
}

PatternSet::PatternSet() = default;

PatternSet::PatternSet(PatternMode mode,
                       const std::vector<std::string>& patterns,
                       const std::string& base)
  : mode_(mode), base_(base) {
  while(!base_.empty() && base_.back() == kSeparator) base_.pop_back();

  for(const auto& pattern : patterns) {
    if(pattern.empty()) continue;
    Rule rule;
    rule.pattern = pattern;
    rule.directory_only = pattern.size() > 1 && pattern.back() == kSeparator;
    rule.expression = translate(pattern);
    try {
      rule.regex = std::regex(rule.expression, std::regex::ECMAScript | std::regex::optimize);
    } catch(const std::regex_error& e) {
      throw std::invalid_argument("Invalid pattern '" + pattern + "': " + e.what());
    }
    rules_.push_back(std::move(rule));
  }
}

std::string PatternSet::translate(const std::string& pattern) {
  std::string body = pattern;
  if(body.size() > 1 && body.back() == kSeparator) body.pop_back();

  const bool anchored_start = !body.empty() && body.front() == kSeparator;
  const bool globstar = body.find("**") != std::string::npos;
  const bool spans_components = body.find(kSeparator) != std::string::npos;

  // A leading separator binds to the root; anything else may start at any
  // path component.
  std::string out = anchored_start ? "^" : "(^|/)";

  for(std::size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    switch(c) {
      case '\\':
        if(i + 1 < body.size()) {
          append_literal(out, body[++i]);
        } else {
          out += "\\\\";
        }
        break;
      case '*':
        if(i + 1 < body.size() && body[i + 1] == '*') {
          while(i + 1 < body.size() && body[i + 1] == '*') ++i;
          out += kAnyRun;
        } else {
          out += kAnySegmentRun;
        }
        break;
      case '?':
        out += kOneSegmentChar;
        break;
      case '[': {
        const auto close = find_class_end(body, i);
        if(close == std::string::npos) {
          out += "\\[";
          break;
        }
        // A negated class never matches the separator.
        std::size_t j = i + 1;
        out += '[';
        if(body[j] == '!' || body[j] == '^') {
          out += "^/";
          ++j;
        }
        const std::size_t first = j;
        for(; j < close; ++j) {
          const char k = body[j];
          if(k == '\\' || (k == ']' && j == first)) out += '\\';
          out += k;
        }
        out += ']';
        i = close;
        break;
      }
      default:
        append_literal(out, c);
        break;
    }
  }

  // Plain names match the final component only; patterns with '**' or a
  // separator stop at any component boundary.
  if(globstar || spans_components) {
    out += kComponentBoundary;
  } else {
    out += '$';
  }
  return out;
}

std::string PatternSet::relative(const std::string& path) const {
  if(base_.empty()) return path;
  if(path.compare(0, base_.size(), base_) != 0) return path;
  if(path.size() == base_.size()) return std::string(1, kSeparator);
  if(path[base_.size()] != kSeparator) return path;
  return path.substr(base_.size());
}

bool PatternSet::excludes(const std::string& path, bool is_directory) const {
  const std::string candidate = relative(path);
  for(const auto& rule : rules_) {
    if(rule.directory_only && !is_directory) continue;
    if(std::regex_search(candidate, rule.regex)) {
      return mode_ == PatternMode::Exclude;
    }
  }
  return mode_ == PatternMode::Include;
}
