#include "SerialConnection.h"
#include "GatewayLog.h"

#include <algorithm>
#include <cerrno>
#include <termios.h>

// --- AsioSerialConnection Implementations ---

AsioSerialConnection::AsioSerialConnection(const std::string& identifier, unsigned int baud_rate,
    std::chrono::milliseconds read_timeout, std::chrono::milliseconds write_timeout)
    : m_identifier(identifier),
    m_read_timeout(read_timeout),
    m_write_timeout(write_timeout),
    m_port(m_io_context)
{
    m_port.open(m_identifier); // Throws system_error
    try {
        Configure(baud_rate);
    }
    catch (const boost::system::system_error&) {
        boost::system::error_code ignored;
        m_port.close(ignored);
        throw;
    }
}

AsioSerialConnection::~AsioSerialConnection() {
    if (m_port.is_open()) {
        boost::system::error_code ec;
        m_port.close(ec);
        if (ec) AddLog("Serial: close on destroy failed for " + m_identifier + ": " + ec.message(), LogType::WARNING);
    }
}

void AsioSerialConnection::Configure(unsigned int baud_rate) {
    using boost::asio::serial_port_base;
    m_port.set_option(serial_port_base::baud_rate(baud_rate));
    m_port.set_option(serial_port_base::character_size(8));
    m_port.set_option(serial_port_base::parity(serial_port_base::parity::none));
    m_port.set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one));
    m_port.set_option(serial_port_base::flow_control(serial_port_base::flow_control::none));

    // Fixed read timeout (VTIME is in tenths of a second, max 25.5s)
    const int fd = m_port.native_handle();
    termios tio{};
    if (::tcgetattr(fd, &tio) != 0) {
        throw boost::system::system_error(errno, boost::system::system_category(), "tcgetattr " + m_identifier);
    }
    auto deciseconds = std::min<long long>(255, std::max<long long>(1, m_read_timeout.count() / 100));
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = static_cast<cc_t>(deciseconds);
    if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
        throw boost::system::system_error(errno, boost::system::system_category(), "tcsetattr " + m_identifier);
    }

    // Drop whatever the board printed before we attached
    if (::tcflush(fd, TCIOFLUSH) != 0) {
        throw boost::system::system_error(errno, boost::system::system_category(), "tcflush " + m_identifier);
    }
}

void AsioSerialConnection::Write(const std::string& data) {
    if (!m_port.is_open()) {
        throw boost::system::system_error(boost::asio::error::not_connected, "write " + m_identifier);
    }

    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_write(m_port, boost::asio::buffer(data),
        [&result](const boost::system::error_code& ec, std::size_t) { result = ec; });

    m_io_context.restart();
    m_io_context.run_for(m_write_timeout);

    if (!m_io_context.stopped()) {
        // Timed out: cancel and let the aborted handler run before `result` goes out of scope
        boost::system::error_code ignored;
        m_port.cancel(ignored);
        m_io_context.restart();
        m_io_context.run();
        throw boost::system::system_error(boost::asio::error::timed_out, "write " + m_identifier);
    }
    if (result) {
        throw boost::system::system_error(result, "write " + m_identifier);
    }
}

void AsioSerialConnection::Close() {
    if (!m_port.is_open()) return;
    boost::system::error_code ec;
    m_port.close(ec);
    if (ec) {
        throw boost::system::system_error(ec, "close " + m_identifier);
    }
}

// --- AsioSerialPortFactory Implementations ---

std::unique_ptr<ISerialConnection> AsioSerialPortFactory::Open(const std::string& identifier, unsigned int baud_rate) {
    return std::make_unique<AsioSerialConnection>(identifier, baud_rate, m_read_timeout, m_write_timeout);
}
