#include "transport/tcp_transport.hpp"
#include <array>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace sevault {
namespace transport {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpTransport::TcpTransport()
  : socket_(std::make_unique<boost::asio::ip::tcp::socket>(io_context_)) {
  BOOST_LOG_TRIVIAL(debug) << "TCP transport: Instance created";
}

TcpTransport::~TcpTransport() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  close_socket();
  BOOST_LOG_TRIVIAL(debug) << "TCP transport: Instance destroyed";
}


//==============================================
// CONNECTION CONTROL
//==============================================

bool TcpTransport::connect(const std::string& host, uint16_t port) {
  std::lock_guard<std::mutex> lock(io_mutex_);

  if (state_.is_open()) {
    BOOST_LOG_TRIVIAL(debug) << "TCP transport: Already connected";
    return true;
  }

  // A broken link must be closed before reconnecting
  close_socket();
  state_.transition_to(ConnectionState::State::CONNECTING);
  BOOST_LOG_TRIVIAL(info) << "TCP transport: Connecting to reader relay at " << host << ":" << port;

  try {
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port));
    boost::asio::connect(*socket_, endpoints);
    socket_->set_option(boost::asio::ip::tcp::no_delay(true));
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP transport: Connection to " << host << ":" << port << " failed: " << e.what();
    close_socket();
    return false;
  }

  state_.transition_to(ConnectionState::State::OPEN);
  BOOST_LOG_TRIVIAL(info) << "TCP transport: Connected to " << host << ":" << port;
  return true;
}

void TcpTransport::disconnect() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  close_socket();
  BOOST_LOG_TRIVIAL(info) << "TCP transport: Disconnected";
}


//==============================================
// EXCHANGE
//==============================================

std::vector<uint8_t> TcpTransport::transmit(const std::vector<uint8_t>& command) {
  std::lock_guard<std::mutex> lock(io_mutex_);

  if (!state_.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "TCP transport: Transmit attempted in state " << state_.get_state_string();
    throw TransportError("TCP transport: Not connected");
  }

  if (command.size() > 0xFFFF) {
    throw TransportError("TCP transport: Command too large for relay framing");
  }

  try {
    write_frame(command);
    std::vector<uint8_t> response = read_frame();
    BOOST_LOG_TRIVIAL(trace) << "TCP transport: Sent " << command.size()
                             << " bytes, received " << response.size() << " bytes";
    return response;
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP transport: Exchange failed: " << e.what();
    state_.transition_to(ConnectionState::State::BROKEN);
    throw TransportError(std::string("TCP transport: Exchange failed: ") + e.what());
  }
}


//==============================================
// FRAMING
//==============================================

void TcpTransport::write_frame(const std::vector<uint8_t>& frame) {
  std::array<uint8_t, LENGTH_PREFIX_SIZE> prefix;
  boost::endian::store_big_u16(prefix.data(), static_cast<uint16_t>(frame.size()));

  std::array<boost::asio::const_buffer, 2> buffers = {
    boost::asio::buffer(prefix),
    boost::asio::buffer(frame)
  };
  boost::asio::write(*socket_, buffers);
}

std::vector<uint8_t> TcpTransport::read_frame() {
  std::array<uint8_t, LENGTH_PREFIX_SIZE> prefix;
  boost::asio::read(*socket_, boost::asio::buffer(prefix));

  uint16_t length = boost::endian::load_big_u16(prefix.data());
  std::vector<uint8_t> frame(length);
  if (length > 0) {
    boost::asio::read(*socket_, boost::asio::buffer(frame));
  }
  return frame;
}


//==============================================
// GETTERS
//==============================================

bool TcpTransport::is_connected() const {
  std::lock_guard<std::mutex> lock(io_mutex_);
  return state_.is_open();
}

ConnectionState::State TcpTransport::get_state() const {
  std::lock_guard<std::mutex> lock(io_mutex_);
  return state_.get_state();
}


//==============================================
// TEARDOWN
//==============================================

void TcpTransport::close_socket() {
  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;
    socket_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "TCP transport: Shutdown reported: " << ec.message();
    }
    socket_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP transport: Error closing socket: " << ec.message();
    }
  }
  if (state_.get_state() != ConnectionState::State::CLOSED) {
    state_.transition_to(ConnectionState::State::CLOSED);
  }
}

} // namespace transport
} // namespace sevault
