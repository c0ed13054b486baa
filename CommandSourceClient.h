// CommandSourceClient.h
#pragma once

#include <string>
#include <memory>
#include <optional>
#include <chrono>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

enum class PollOutcome {
    OK,            // 200, command present or not
    HTTP_ERROR,    // Any other status code
    NETWORK_ERROR  // Timeout, refused, DNS, TLS, malformed response
};

struct PollResult {
    PollOutcome outcome = PollOutcome::NETWORK_ERROR;
    int http_status = 0;
    std::optional<std::string> command;
    std::string error; // Transport error text for NETWORK_ERROR
};

struct ParsedUrl {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target;
};

// Accepts http:// and https:// URLs; throws std::invalid_argument otherwise.
ParsedUrl ParseUrl(const std::string& url);

// --- ICommandSource Interface ---
class ICommandSource {
public:
    virtual ~ICommandSource() = default;

    // Single request, no internal retry
    virtual PollResult Poll() = 0;
};

// --- HttpCommandSource ---
// GET against a fixed URL over one kept-alive connection that is reused across polls
// and discarded after any failure. The whole request is bounded by `timeout`.
//
// WARNING: TLS certificate validation is disabled (insecure by configuration).
// Do not reuse this client against endpoints that require server authentication.
class HttpCommandSource : public ICommandSource {
public:
    HttpCommandSource(const std::string& url, std::chrono::milliseconds timeout);
    ~HttpCommandSource() override;

    HttpCommandSource(const HttpCommandSource&) = delete;
    HttpCommandSource& operator=(const HttpCommandSource&) = delete;

    PollResult Poll() override;

    // Number of TCP connections opened so far
    size_t GetConnectCount() const { return m_connect_count; }

private:
    using Clock = std::chrono::steady_clock;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    bool IsConnected() const { return m_plain_stream || m_tls_stream; }
    void Connect(Clock::time_point deadline);
    Response Exchange(Clock::time_point deadline);
    template <typename Stream>
    Response ExchangeOn(Stream& stream, Clock::time_point deadline);
    void RunIo(Clock::time_point deadline);
    void ResetConnection();

    ParsedUrl m_url;
    std::string m_host_header;
    std::chrono::milliseconds m_timeout;

    boost::asio::io_context m_io_context;
    boost::asio::ssl::context m_ssl_context;
    boost::asio::ip::tcp::resolver m_resolver;
    std::unique_ptr<boost::beast::tcp_stream> m_plain_stream;
    std::unique_ptr<boost::beast::ssl_stream<boost::beast::tcp_stream>> m_tls_stream;
    boost::beast::flat_buffer m_buffer;
    size_t m_connect_count = 0;
};
