// SerialConnection.h
#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <boost/asio.hpp>

// --- ISerialConnection Interface ---
// Write-only byte stream to one attached device.
class ISerialConnection {
public:
    virtual ~ISerialConnection() = default;

    virtual const std::string& GetIdentifier() const = 0;
    virtual bool IsOpen() const = 0;

    // Writes every byte or throws boost::system::system_error
    virtual void Write(const std::string& data) = 0;

    // Throws boost::system::system_error when the OS reports a close failure
    virtual void Close() = 0;
};

// --- ISerialPortFactory Interface ---
class ISerialPortFactory {
public:
    virtual ~ISerialPortFactory() = default;

    // Throws boost::system::system_error when the port cannot be opened/configured
    virtual std::unique_ptr<ISerialConnection> Open(const std::string& identifier, unsigned int baud_rate) = 0;
};

// --- AsioSerialConnection ---
// 8N1, no flow control. Each connection owns a private io_context so a write
// can be bounded with run_for() without touching the gateway's event loop.
class AsioSerialConnection : public ISerialConnection {
public:
    AsioSerialConnection(const std::string& identifier, unsigned int baud_rate,
        std::chrono::milliseconds read_timeout, std::chrono::milliseconds write_timeout);
    ~AsioSerialConnection() override;

    AsioSerialConnection(const AsioSerialConnection&) = delete;
    AsioSerialConnection& operator=(const AsioSerialConnection&) = delete;

    const std::string& GetIdentifier() const override { return m_identifier; }
    bool IsOpen() const override { return m_port.is_open(); }

    void Write(const std::string& data) override;
    void Close() override;

private:
    void Configure(unsigned int baud_rate);

    std::string m_identifier;
    std::chrono::milliseconds m_read_timeout;
    std::chrono::milliseconds m_write_timeout;
    boost::asio::io_context m_io_context;
    boost::asio::serial_port m_port;
};

// --- AsioSerialPortFactory ---
class AsioSerialPortFactory : public ISerialPortFactory {
public:
    AsioSerialPortFactory(std::chrono::milliseconds read_timeout, std::chrono::milliseconds write_timeout)
        : m_read_timeout(read_timeout), m_write_timeout(write_timeout) {
    }

    std::unique_ptr<ISerialConnection> Open(const std::string& identifier, unsigned int baud_rate) override;

private:
    std::chrono::milliseconds m_read_timeout;
    std::chrono::milliseconds m_write_timeout;
};
