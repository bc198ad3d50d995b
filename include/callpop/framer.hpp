#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace callpop {

// Cuts an AMI byte stream into blocks. A block is the text between blank
// lines; CRLF and bare LF endings are both accepted. Output does not depend
// on how the input was chunked.
class LineFramer {
public:
  static constexpr std::size_t MAX_LINE = 64 * 1024;

  // Returns the blocks completed by this chunk, lines joined with "\n".
  std::vector<std::string> feed(const char* data, std::size_t len);
  std::vector<std::string> feed(const std::string& data) {
    return feed(data.data(), data.size());
  }

  // Drop everything buffered, e.g. for a new connection.
  void reset();

  // Bytes held back waiting for a line or block terminator.
  std::size_t buffered() const { return partial_.size() + block_.size(); }

  // Lines dropped for exceeding MAX_LINE.
  unsigned long oversized_lines() const { return oversized_; }

private:
  void take_line(std::string line, std::vector<std::string>& out);

  std::string partial_;  // incomplete line
  std::string block_;    // complete lines of the block in progress
  bool discarding_ = false;
  unsigned long oversized_ = 0;
};

}  // namespace callpop
