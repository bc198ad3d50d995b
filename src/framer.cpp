#include "callpop/framer.hpp"

#include <cstring>

#include <spdlog/spdlog.h>

#include "callpop/strings.hpp"

namespace callpop {

std::vector<std::string> LineFramer::feed(const char* data, std::size_t len) {
  std::vector<std::string> out;
  const char* end = data + len;
  const char* p = data;
  while (p < end) {
    const char* nl = static_cast<const char*>(std::memchr(p, '\n', end - p));
    if (nl == nullptr) {
      if (!discarding_) partial_.append(p, end);
      if (partial_.size() > MAX_LINE) {
        spdlog::warn("Dropping oversized AMI line ({} bytes buffered)", partial_.size());
        partial_.clear();
        discarding_ = true;
        oversized_++;
      }
      break;
    }
    if (discarding_) {
      // Resume framing at the line after the oversized one
      discarding_ = false;
    } else if (partial_.size() + (nl - p) > MAX_LINE) {
      spdlog::warn("Dropping oversized AMI line ({} bytes)", partial_.size() + (nl - p));
      oversized_++;
    } else {
      partial_.append(p, nl);
      take_line(std::move(partial_), out);
    }
    partial_.clear();
    p = nl + 1;
  }
  return out;
}

void LineFramer::reset() {
  partial_.clear();
  block_.clear();
  discarding_ = false;
}

void LineFramer::take_line(std::string line, std::vector<std::string>& out) {
  if (!line.empty() && line.back() == '\r') line.pop_back();

  if (trim(line).empty()) {
    // Blank line: closes a block, or is noise between blocks
    if (!block_.empty()) {
      out.push_back(std::move(block_));
      block_.clear();
    }
    return;
  }
  if (!block_.empty()) block_ += '\n';
  block_ += line;
}

}  // namespace callpop
