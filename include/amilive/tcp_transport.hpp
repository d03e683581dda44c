#pragma once

#include <boost/asio.hpp>

#include "amilive/transport.hpp"

namespace amilive {

// Transport over a boost::asio TCP socket. The timed operations run the
// private io_context for at most the given duration and cancel on expiry.
class TcpTransport : public Transport {
public:
  TcpTransport();
  ~TcpTransport() override;

  void connect(const std::string& host, std::uint16_t port,
               std::chrono::milliseconds timeout) override;
  std::size_t read_some(char* data, std::size_t size) override;
  std::size_t read_some(char* data, std::size_t size,
                        std::chrono::milliseconds timeout) override;
  void write(const std::string& data) override;
  void shutdown() override;

private:
  boost::asio::io_context io_;
  boost::asio::ip::tcp::socket socket_;
  std::string peer_;
};

}  // namespace amilive
