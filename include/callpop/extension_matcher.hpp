#pragma once

#include <string>
#include <vector>

namespace callpop {

// Decides which extensions are monitored. Entries are either literal
// extensions ("101") or dialplan patterns ("_1XX", "_NXXX.").
// With no entries every extension-looking peer (up to 6 digits) matches.
class ExtensionMatcher {
public:
  ExtensionMatcher() = default;
  explicit ExtensionMatcher(std::vector<std::string> patterns);

  bool matches(const std::string& extension) const;
  bool monitors_all() const { return patterns_.empty(); }
  const std::vector<std::string>& patterns() const { return patterns_; }

private:
  std::vector<std::string> patterns_;
};

// X=[0-9] Z=[1-9] N=[2-9] [a-b] ranges, "." one or more, "!" zero or more.
// The leading '_' is required for pattern syntax; otherwise exact match.
bool match_dial_pattern(const std::string& pattern, const std::string& extension);

bool looks_like_extension(const std::string& s);

}  // namespace callpop
