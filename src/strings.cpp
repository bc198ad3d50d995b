#include "callpop/strings.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace callpop {

std::string trim(std::string s) {
  auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
  s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
  return s;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); i++) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

int to_int_safe(const std::string& s, int fallback) {
  std::string t = trim(s);
  if (t.empty()) return fallback;
  try {
    std::size_t used = 0;
    int v = std::stoi(t, &used);
    return used == t.size() ? v : fallback;
  } catch (const std::logic_error&) {
    // invalid_argument or out_of_range
    return fallback;
  }
}

bool all_digits(const std::string& s) {
  return !s.empty() &&
         std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::vector<std::string> split_list(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::string::size_type start = 0;
  while (start <= s.size()) {
    auto end = s.find(sep, start);
    if (end == std::string::npos) end = s.size();
    std::string piece = trim(s.substr(start, end - start));
    if (!piece.empty()) out.push_back(std::move(piece));
    start = end + 1;
  }
  return out;
}

void parse_tech_peer(const std::string& channel, std::string& tech, std::string& peer) {
  tech.clear();
  peer.clear();
  auto slash = channel.find('/');
  if (slash == std::string::npos) return;
  tech = channel.substr(0, slash);
  std::string rest = channel.substr(slash + 1);
  // Local channels carry exten@context
  auto cut = rest.find_first_of(tech == "Local" ? "@;" : "-");
  peer = (cut == std::string::npos) ? rest : rest.substr(0, cut);
}

}  // namespace callpop
