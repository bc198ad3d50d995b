#pragma once

#include <string>
#include <vector>

namespace callpop {

std::string trim(std::string s);
std::string lower(std::string s);
bool iequals(const std::string& a, const std::string& b);

// Returns fallback when s is not a whole decimal integer.
int to_int_safe(const std::string& s, int fallback = 0);

bool all_digits(const std::string& s);

// Splits on sep, trims each piece and drops empty pieces.
std::vector<std::string> split_list(const std::string& s, char sep = ',');

// PJSIP/1001-0000002a -> tech=PJSIP peer=1001
// Local/101@from-internal-00000003;1 -> tech=Local peer=101
void parse_tech_peer(const std::string& channel, std::string& tech, std::string& peer);

}  // namespace callpop
