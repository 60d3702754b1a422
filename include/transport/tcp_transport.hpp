#ifndef SEVAULT_TRANSPORT_TCP_TRANSPORT_HPP
#define SEVAULT_TRANSPORT_TCP_TRANSPORT_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "transport/transport.hpp"
#include "transport/connection_state.hpp"

namespace sevault {
namespace transport {

// Transport to a card reader relay over TCP.
// Every APDU travels as a 2-byte big-endian length followed by the bytes,
// in both directions.
class TcpTransport : public Transport {
public:
  // Delete copy operations to prevent socket duplication
  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TcpTransport();
  ~TcpTransport() override;


  // ---- CONNECTION CONTROL ----
  // Resolves and connects to the relay, returns false on failure
  bool connect(const std::string& host, uint16_t port);
  // Closes the socket, safe to call in any state
  void disconnect();


  // ---- EXCHANGE ----
  std::vector<uint8_t> transmit(const std::vector<uint8_t>& command) override;


  // ---- GETTERS ----
  bool is_connected() const;
  ConnectionState::State get_state() const;

private:
  // ---- PARAMETERS ----
  static constexpr std::size_t LENGTH_PREFIX_SIZE = 2;

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
  ConnectionState state_;
  // Serializes exchanges and state changes
  mutable std::mutex io_mutex_;


  // ---- FRAMING ----
  void write_frame(const std::vector<uint8_t>& frame);
  std::vector<uint8_t> read_frame();


  // ---- TEARDOWN ----
  // Closes the socket and moves to CLOSED, caller holds io_mutex_
  void close_socket();
};

} // namespace transport
} // namespace sevault

#endif // SEVAULT_TRANSPORT_TCP_TRANSPORT_HPP
