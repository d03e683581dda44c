#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace amilive {

// Byte pipe to the manager. All failures (including a clean end of stream)
// are reported as TransportError.
//
// read_some() and write() may run on different threads at the same time;
// shutdown() may be called from any thread and must wake a blocked reader.
class Transport {
public:
  virtual ~Transport() = default;

  virtual void connect(const std::string& host, std::uint16_t port,
                       std::chrono::milliseconds timeout) = 0;

  // Blocks until at least one byte is available.
  virtual std::size_t read_some(char* data, std::size_t size) = 0;

  // Same, but gives up with TransportError after timeout.
  virtual std::size_t read_some(char* data, std::size_t size,
                                std::chrono::milliseconds timeout) = 0;

  virtual void write(const std::string& data) = 0;

  virtual void shutdown() = 0;
};

}  // namespace amilive
