#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <stdexcept>
#include <pty.h>
#include <poll.h>
#include <unistd.h>

#include "SerialConnection.h"

using namespace std::chrono_literals;

namespace {

// Pseudo-terminal pair; the slave side stands in for a USB-serial device
class PseudoTerminal {
public:
    PseudoTerminal() {
        char name[128] = {};
        if (::openpty(&m_master, &m_slave, name, nullptr, nullptr) != 0) {
            throw std::runtime_error("openpty failed");
        }
        m_slave_name = name;
    }

    ~PseudoTerminal() {
        if (m_slave >= 0) ::close(m_slave);
        if (m_master >= 0) ::close(m_master);
    }

    PseudoTerminal(const PseudoTerminal&) = delete;
    PseudoTerminal& operator=(const PseudoTerminal&) = delete;

    const std::string& SlaveName() const { return m_slave_name; }

    // Reads from the master until `expected_size` bytes arrived or `timeout` passed
    std::string ReadMaster(size_t expected_size, std::chrono::milliseconds timeout = 2000ms) {
        std::string received;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (received.size() < expected_size && std::chrono::steady_clock::now() < deadline) {
            pollfd pfd{ m_master, POLLIN, 0 };
            if (::poll(&pfd, 1, 50) <= 0) continue;
            char buf[256];
            ssize_t n = ::read(m_master, buf, sizeof(buf));
            if (n <= 0) break;
            received.append(buf, static_cast<size_t>(n));
        }
        return received;
    }

private:
    int m_master = -1;
    int m_slave = -1;
    std::string m_slave_name;
};

} // namespace

TEST(SerialConnectionTest, WriteReachesDeviceUnchanged) {
    PseudoTerminal pty;
    AsioSerialConnection connection(pty.SlaveName(), 9600, 1000ms, 1000ms);

    EXPECT_TRUE(connection.IsOpen());
    EXPECT_EQ(connection.GetIdentifier(), pty.SlaveName());

    connection.Write("PICK_A1\n");

    // Raw mode: no "\n" -> "\r\n" translation
    EXPECT_EQ(pty.ReadMaster(8), "PICK_A1\n");
}

TEST(SerialConnectionTest, BlockedWriteTimesOut) {
    PseudoTerminal pty;
    const auto write_timeout = 200ms;
    AsioSerialConnection connection(pty.SlaveName(), 115200, 1000ms, write_timeout);

    // Nobody drains the master, so the tty buffer fills long before this is written
    const std::string flood(4 * 1024 * 1024, 'X');

    const auto started = std::chrono::steady_clock::now();
    try {
        connection.Write(flood);
        FAIL() << "write into a full tty buffer returned";
    }
    catch (const boost::system::system_error& e) {
        EXPECT_EQ(e.code(), boost::asio::error::timed_out);
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_GE(elapsed, write_timeout);
    EXPECT_LT(elapsed, 2000ms);

    // The connection stays usable for the registry to close
    EXPECT_TRUE(connection.IsOpen());
    EXPECT_NO_THROW(connection.Close());
}

TEST(SerialConnectionTest, WriteAfterCloseThrowsNotConnected) {
    PseudoTerminal pty;
    AsioSerialConnection connection(pty.SlaveName(), 9600, 1000ms, 1000ms);

    connection.Close();
    EXPECT_FALSE(connection.IsOpen());
    EXPECT_NO_THROW(connection.Close());

    try {
        connection.Write("PICK_A1\n");
        FAIL() << "write on a closed port returned";
    }
    catch (const boost::system::system_error& e) {
        EXPECT_EQ(e.code(), boost::asio::error::not_connected);
    }
}

TEST(SerialConnectionTest, FactoryOpensAndRejectsMissingPort) {
    PseudoTerminal pty;
    AsioSerialPortFactory factory(500ms, 500ms);

    std::unique_ptr<ISerialConnection> connection = factory.Open(pty.SlaveName(), 9600);
    ASSERT_TRUE(connection);
    EXPECT_TRUE(connection->IsOpen());

    EXPECT_THROW(factory.Open("/dev/ttyRELAYGATEWAY_MISSING", 9600), boost::system::system_error);
}
