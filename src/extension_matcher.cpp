#include "callpop/extension_matcher.hpp"

#include <cctype>

#include "callpop/strings.hpp"

namespace callpop {

namespace {

bool in_class(const std::string& cls, char ch) {
  for (std::size_t i = 0; i < cls.size(); i++) {
    if (i + 2 < cls.size() && cls[i + 1] == '-') {
      if (ch >= cls[i] && ch <= cls[i + 2]) return true;
      i += 2;
    } else if (cls[i] == ch) {
      return true;
    }
  }
  return false;
}

bool match_from(const std::string& p, std::size_t pi, const std::string& e, std::size_t ei) {
  while (pi < p.size()) {
    char c = static_cast<char>(std::toupper(static_cast<unsigned char>(p[pi])));
    if (c == '.') return ei < e.size();
    if (c == '!') return true;
    if (ei >= e.size()) return false;

    char ch = e[ei];
    bool ok = false;
    if (c == 'X') {
      ok = ch >= '0' && ch <= '9';
    } else if (c == 'Z') {
      ok = ch >= '1' && ch <= '9';
    } else if (c == 'N') {
      ok = ch >= '2' && ch <= '9';
    } else if (c == '[') {
      auto close = p.find(']', pi);
      if (close == std::string::npos) return false;
      ok = in_class(p.substr(pi + 1, close - pi - 1), ch);
      pi = close;
    } else {
      ok = p[pi] == ch;
    }
    if (!ok) return false;
    pi++;
    ei++;
  }
  return ei == e.size();
}

}  // namespace

bool match_dial_pattern(const std::string& pattern, const std::string& extension) {
  if (pattern.empty() || pattern[0] != '_') return pattern == extension;
  return match_from(pattern, 1, extension, 0);
}

bool looks_like_extension(const std::string& s) {
  return all_digits(s) && s.size() <= 6;
}

ExtensionMatcher::ExtensionMatcher(std::vector<std::string> patterns)
    : patterns_(std::move(patterns)) {}

bool ExtensionMatcher::matches(const std::string& extension) const {
  if (extension.empty()) return false;
  if (patterns_.empty()) return looks_like_extension(extension);
  for (const auto& p : patterns_)
    if (match_dial_pattern(p, extension)) return true;
  return false;
}

}  // namespace callpop
