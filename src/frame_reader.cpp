#include "amilive/frame_reader.hpp"

#include "amilive/error.hpp"

namespace amilive {

FrameReader::FrameReader(bool expect_greeting, std::size_t max_block_bytes)
    : expect_greeting_(expect_greeting), max_block_bytes_(max_block_bytes) {}

void FrameReader::feed(const char* data, std::size_t size) {
  pending_.append(data, size);

  bool overflow = false;
  std::size_t start = 0;
  while (true) {
    auto nl = pending_.find('\n', start);
    if (nl == std::string::npos) break;
    std::string line = pending_.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    start = nl + 1;
    if (!take_line(std::move(line))) overflow = true;
  }
  pending_.erase(0, start);

  // A line that never ends.
  if (current_bytes_ + pending_.size() > max_block_bytes_) {
    pending_.clear();
    if (!discarding_) {
      start_discarding();
      overflow = true;
    }
  }

  if (overflow) {
    throw ProtocolDecodeError("block larger than " + std::to_string(max_block_bytes_) +
                              " bytes dropped");
  }
}

bool FrameReader::take_line(std::string line) {
  if (expect_greeting_ && !greeting_) {
    greeting_ = std::move(line);
    return true;
  }
  if (line.empty()) {
    if (discarding_) {
      discarding_ = false;
      return true;
    }
    // Stray blank lines between blocks carry nothing.
    if (current_.empty()) return true;
    ready_.push_back(std::move(current_));
    current_.clear();
    current_bytes_ = 0;
    return true;
  }
  if (discarding_) return true;

  current_bytes_ += line.size();
  if (current_bytes_ > max_block_bytes_) {
    start_discarding();
    return false;
  }
  current_.push_back(std::move(line));
  return true;
}

void FrameReader::start_discarding() {
  current_.clear();
  current_bytes_ = 0;
  discarding_ = true;
}

std::optional<RawBlock> FrameReader::next() {
  if (ready_.empty()) return std::nullopt;
  RawBlock block = std::move(ready_.front());
  ready_.pop_front();
  return block;
}

}  // namespace amilive
