#include "amilive/tcp_transport.hpp"

#include "amilive/error.hpp"

using boost::asio::ip::tcp;

namespace amilive {

TcpTransport::TcpTransport() : socket_(io_) {}

TcpTransport::~TcpTransport() {
  boost::system::error_code ignored;
  socket_.close(ignored);
}

void TcpTransport::connect(const std::string& host, std::uint16_t port,
                           std::chrono::milliseconds timeout) {
  peer_ = host + ":" + std::to_string(port);

  tcp::resolver resolver(io_);
  boost::system::error_code result = boost::asio::error::would_block;

  resolver.async_resolve(host, std::to_string(port),
      [&](const boost::system::error_code& ec, tcp::resolver::results_type endpoints) {
        if (ec) {
          result = ec;
          return;
        }
        boost::asio::async_connect(socket_, endpoints,
            [&](const boost::system::error_code& ec2, const tcp::endpoint&) { result = ec2; });
      });

  io_.restart();
  io_.run_for(timeout);

  if (result == boost::asio::error::would_block) {
    // Deadline hit: cancel and let the handlers drain before the locals die.
    resolver.cancel();
    boost::system::error_code ignored;
    socket_.close(ignored);
    io_.run();
    throw TransportError("connect to " + peer_ + " timed out");
  }
  if (result) throw TransportError("connect to " + peer_ + ": " + result.message());
}

std::size_t TcpTransport::read_some(char* data, std::size_t size) {
  boost::system::error_code ec;
  std::size_t n = socket_.read_some(boost::asio::buffer(data, size), ec);
  if (ec == boost::asio::error::eof) throw TransportError("connection closed by " + peer_);
  if (ec) throw TransportError("read from " + peer_ + ": " + ec.message());
  return n;
}

std::size_t TcpTransport::read_some(char* data, std::size_t size,
                                    std::chrono::milliseconds timeout) {
  boost::system::error_code result = boost::asio::error::would_block;
  std::size_t n = 0;

  socket_.async_read_some(boost::asio::buffer(data, size),
      [&](const boost::system::error_code& ec, std::size_t bytes) {
        result = ec;
        n = bytes;
      });

  io_.restart();
  io_.run_for(timeout);

  if (result == boost::asio::error::would_block) {
    boost::system::error_code ignored;
    socket_.cancel(ignored);
    io_.run();
    throw TransportError("read from " + peer_ + " timed out");
  }
  if (result == boost::asio::error::eof) throw TransportError("connection closed by " + peer_);
  if (result) throw TransportError("read from " + peer_ + ": " + result.message());
  return n;
}

void TcpTransport::write(const std::string& data) {
  boost::system::error_code ec;
  boost::asio::write(socket_, boost::asio::buffer(data), ec);
  if (ec) throw TransportError("write to " + peer_ + ": " + ec.message());
}

void TcpTransport::shutdown() {
  // Wakes a reader blocked in read_some(); the socket is closed by the destructor.
  boost::system::error_code ignored;
  socket_.shutdown(tcp::socket::shutdown_both, ignored);
}

}  // namespace amilive
