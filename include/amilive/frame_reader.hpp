#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

#include "amilive/message.hpp"

namespace amilive {

// Splits the manager byte stream into blocks.
//
// Bytes arrive in arbitrary chunks through feed(); complete blocks (every line
// up to the first empty one) are handed out by next() in arrival order. Lines
// end in CRLF, a bare LF is accepted too. The first line of a connection is the
// greeting banner and never becomes a block. Whatever is still buffered when the
// stream ends is simply dropped together with the reader.
//
// A block (or a single unterminated line) larger than max_block_bytes is
// dropped: feed() throws ProtocolDecodeError once, skips the rest of that
// block up to its blank line, and carries on with the next one. Blocks
// completed earlier in the same feed() stay available.
//
// One reader per connection; create a new one after reconnecting.
class FrameReader {
public:
  static constexpr std::size_t kDefaultMaxBlockBytes = 1 << 20;

  explicit FrameReader(bool expect_greeting = true,
                       std::size_t max_block_bytes = kDefaultMaxBlockBytes);

  void feed(const char* data, std::size_t size);
  void feed(const std::string& data) { feed(data.data(), data.size()); }

  std::optional<RawBlock> next();

  // "Asterisk Call Manager/5.0.1" once the first line is in.
  const std::optional<std::string>& greeting() const { return greeting_; }

  // True while lines of an unterminated block are buffered.
  bool has_partial() const { return !current_.empty() || !pending_.empty(); }

  std::size_t ready() const { return ready_.size(); }

private:
  // False when this line pushed the block over the limit.
  bool take_line(std::string line);
  void start_discarding();

  bool expect_greeting_;
  std::size_t max_block_bytes_;
  std::optional<std::string> greeting_;
  std::string pending_;
  RawBlock current_;
  std::size_t current_bytes_ = 0;
  bool discarding_ = false;
  std::deque<RawBlock> ready_;
};

}  // namespace amilive
