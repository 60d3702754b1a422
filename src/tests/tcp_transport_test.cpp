#include <gtest/gtest.h>
#include "transport/tcp_transport.hpp"
#include "transport/exchange.hpp"
#include "protocol/protocol_error.hpp"
#include "test_utils.hpp"
#include <boost/asio.hpp>
#include <boost/endian/conversion.hpp>
#include <array>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace sevault {
namespace transport {
namespace test {

using boost::asio::ip::tcp;

// Reads one length-prefixed frame, false once the client has gone away
bool read_frame(tcp::socket& socket, std::vector<uint8_t>& frame) {
    std::array<uint8_t, 2> prefix;
    boost::system::error_code ec;
    boost::asio::read(socket, boost::asio::buffer(prefix), ec);
    if (ec) {
        return false;
    }
    frame.resize(boost::endian::load_big_u16(prefix.data()));
    if (!frame.empty()) {
        boost::asio::read(socket, boost::asio::buffer(frame), ec);
    }
    return !ec;
}

void write_frame(tcp::socket& socket, const std::vector<uint8_t>& frame) {
    std::array<uint8_t, 2> prefix;
    boost::endian::store_big_u16(prefix.data(), static_cast<uint16_t>(frame.size()));
    boost::system::error_code ec;
    boost::asio::write(socket, boost::asio::buffer(prefix), ec);
    boost::asio::write(socket, boost::asio::buffer(frame), ec);
}

class TcpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging();
        acceptor_ = std::make_unique<tcp::acceptor>(
            io_context_,
            tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)  // Let OS choose port
        );
        port_ = acceptor_->local_endpoint().port();
    }

    void TearDown() override {
        if (relay_thread_.joinable()) {
            relay_thread_.join();
        }
        acceptor_->close();
    }

    // Accepts one client and hands its socket to the handler on a relay thread
    void start_relay(std::function<void(tcp::socket&)> handler) {
        relay_thread_ = std::thread([this, handler]() {
            tcp::socket socket(io_context_);
            boost::system::error_code ec;
            acceptor_->accept(socket, ec);
            if (ec) {
                return;
            }
            handler(socket);
        });
    }

    // Answers each command with its bytes reversed followed by 9000
    static void reversing_relay(tcp::socket& socket) {
        std::vector<uint8_t> command;
        while (read_frame(socket, command)) {
            std::vector<uint8_t> reply(command.rbegin(), command.rend());
            reply.push_back(0x90);
            reply.push_back(0x00);
            write_frame(socket, reply);
        }
    }

    boost::asio::io_context io_context_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    uint16_t port_ = 0;
    std::thread relay_thread_;
};

TEST_F(TcpTransportTest, ConnectAndExchange) {
    start_relay(reversing_relay);

    TcpTransport transport;
    EXPECT_EQ(transport.get_state(), ConnectionState::State::CLOSED);
    ASSERT_TRUE(transport.connect("127.0.0.1", port_));
    EXPECT_TRUE(transport.is_connected());
    EXPECT_EQ(transport.get_state(), ConnectionState::State::OPEN);

    std::vector<uint8_t> response = transport.transmit({0x80, 0x10, 0x00, 0x00});
    EXPECT_EQ(response, (std::vector<uint8_t>{0x00, 0x00, 0x10, 0x80, 0x90, 0x00}));

    // Exchanges are strictly one after another on the same link
    response = transport.transmit({0x01});
    EXPECT_EQ(response, (std::vector<uint8_t>{0x01, 0x90, 0x00}));

    transport.disconnect();
    EXPECT_EQ(transport.get_state(), ConnectionState::State::CLOSED);
}

TEST_F(TcpTransportTest, LargeFrameCrossesRelay) {
    start_relay(reversing_relay);

    TcpTransport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", port_));

    std::vector<uint8_t> command(4 + 1 + 255, 0xAB);
    std::vector<uint8_t> response = transport.transmit(command);
    ASSERT_EQ(response.size(), command.size() + 2);
    EXPECT_EQ(response[response.size() - 2], 0x90);

    transport.disconnect();
}

TEST_F(TcpTransportTest, ExchangeDecodesResponseFrame) {
    start_relay([](tcp::socket& socket) {
        std::vector<uint8_t> command;
        if (read_frame(socket, command)) {
            write_frame(socket, {0x00, 0x05, 0x90, 0x00});
        }
    });

    TcpTransport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", port_));

    protocol::CommandFrame command;
    command.ins = 0x20;
    command.data = {0x01, 0x02};
    protocol::ResponseFrame response = exchange(transport, command);
    EXPECT_EQ(response.data, (std::vector<uint8_t>{0x00, 0x05}));
    EXPECT_EQ(response.status_word(), 0x9000);

    transport.disconnect();
}

TEST_F(TcpTransportTest, TransmitWithoutConnectionThrows) {
    TcpTransport transport;
    EXPECT_THROW(transport.transmit({0x80, 0x10, 0x00, 0x00}), TransportError);
    EXPECT_EQ(transport.get_state(), ConnectionState::State::CLOSED);
}

TEST_F(TcpTransportTest, ConnectToClosedPortFails) {
    uint16_t unused_port = port_;
    acceptor_->close();

    TcpTransport transport;
    EXPECT_FALSE(transport.connect("127.0.0.1", unused_port));
    EXPECT_FALSE(transport.is_connected());
    EXPECT_EQ(transport.get_state(), ConnectionState::State::CLOSED);
}

TEST_F(TcpTransportTest, RelayHangupBreaksLink) {
    // Accepts and closes without answering
    start_relay([](tcp::socket& socket) {
        std::vector<uint8_t> command;
        read_frame(socket, command);
        socket.close();
    });

    TcpTransport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", port_));

    EXPECT_THROW(transport.transmit({0x80, 0x20, 0x00, 0x00}), TransportError);
    EXPECT_EQ(transport.get_state(), ConnectionState::State::BROKEN);
    EXPECT_FALSE(transport.is_connected());

    // A broken link refuses further exchanges until closed
    EXPECT_THROW(transport.transmit({0x80, 0x20, 0x00, 0x00}), TransportError);

    // exchange() reports the same failure as a protocol error
    protocol::CommandFrame command;
    try {
        exchange(transport, command);
        FAIL() << "Expected ProtocolError";
    } catch (const protocol::ProtocolError& e) {
        EXPECT_EQ(e.kind(), protocol::ErrorKind::CONNECTION_UNAVAILABLE);
    }

    transport.disconnect();
    EXPECT_EQ(transport.get_state(), ConnectionState::State::CLOSED);
}

} // namespace test
} // namespace transport
} // namespace sevault
