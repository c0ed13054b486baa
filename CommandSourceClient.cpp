#include "CommandSourceClient.h"
#include "GatewayLog.h"

#include <stdexcept>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {
// Lets the stream's own expiry report beast::error::timeout before the backstop fires
const std::chrono::milliseconds kIoGrace{ 200 };
const char* const kUserAgent = "serial-relay-gateway/1.0";
}

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed;
    std::string rest;
    const std::string lowered = boost::algorithm::to_lower_copy(url);
    if (boost::algorithm::starts_with(lowered, "https://")) {
        parsed.secure = true;
        rest = url.substr(8);
    }
    else if (boost::algorithm::starts_with(lowered, "http://")) {
        rest = url.substr(7);
    }
    else {
        throw std::invalid_argument("Unsupported URL scheme: " + url);
    }

    const size_t path_pos = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_pos);
    parsed.target = (path_pos == std::string::npos) ? "/" : rest.substr(path_pos);
    if (parsed.target[0] == '?') parsed.target.insert(0, "/");

    if (!authority.empty() && authority[0] == '[') {
        // IPv6 literal, e.g. [::1]:8080
        const size_t close = authority.find(']');
        if (close == std::string::npos) throw std::invalid_argument("Malformed IPv6 host: " + url);
        parsed.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') throw std::invalid_argument("Malformed authority: " + url);
            parsed.port = authority.substr(close + 2);
        }
    }
    else {
        const size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            parsed.host = authority.substr(0, colon);
            parsed.port = authority.substr(colon + 1);
        }
        else {
            parsed.host = authority;
        }
    }

    if (parsed.host.empty()) throw std::invalid_argument("Missing host: " + url);
    if (parsed.port.empty()) parsed.port = parsed.secure ? "443" : "80";
    if (parsed.port.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid port: " + url);
    }
    return parsed;
}

// --- HttpCommandSource Implementations ---

HttpCommandSource::HttpCommandSource(const std::string& url, std::chrono::milliseconds timeout)
    : m_url(ParseUrl(url)),
    m_timeout(timeout),
    m_ssl_context(ssl::context::tls_client),
    m_resolver(m_io_context)
{
    const bool default_port = (m_url.secure && m_url.port == "443") || (!m_url.secure && m_url.port == "80");
    m_host_header = default_port ? m_url.host : m_url.host + ":" + m_url.port;

    // Insecure by configuration: the command endpoint's certificate is not validated
    m_ssl_context.set_verify_mode(ssl::verify_none);
    if (m_url.secure) {
        AddLog("CommandSource: TLS certificate validation is DISABLED for " + m_url.host, LogType::WARNING);
    }
}

HttpCommandSource::~HttpCommandSource() {
    ResetConnection();
}

PollResult HttpCommandSource::Poll() {
    PollResult result;
    const auto deadline = Clock::now() + m_timeout;

    try {
        if (!IsConnected()) {
            Connect(deadline);
        }
        Response response = Exchange(deadline);
        if (!response.keep_alive()) {
            ResetConnection();
        }

        result.http_status = static_cast<int>(response.result_int());
        if (response.result() == http::status::ok) {
            result.outcome = PollOutcome::OK;
            std::string text = boost::algorithm::trim_copy(response.body());
            if (!text.empty()) {
                result.command = std::move(text);
            }
        }
        else {
            result.outcome = PollOutcome::HTTP_ERROR;
        }
    }
    catch (const boost::system::system_error& e) {
        ResetConnection();
        result.outcome = PollOutcome::NETWORK_ERROR;
        result.error = e.what();
    }
    catch (const std::exception& e) {
        ResetConnection();
        result.outcome = PollOutcome::NETWORK_ERROR;
        result.error = e.what();
    }
    return result;
}

void HttpCommandSource::RunIo(Clock::time_point deadline) {
    m_io_context.restart();
    m_io_context.run_until(deadline + kIoGrace);
    if (m_io_context.stopped()) return;

    // Still pending past the deadline (e.g. slow DNS): abort and drain the handlers
    boost::system::error_code ignored;
    m_resolver.cancel();
    if (m_plain_stream) m_plain_stream->socket().close(ignored);
    if (m_tls_stream) beast::get_lowest_layer(*m_tls_stream).socket().close(ignored);
    m_io_context.restart();
    m_io_context.run();
    throw beast::system_error(beast::error::timeout, "request to " + m_url.host);
}

void HttpCommandSource::Connect(Clock::time_point deadline) {
    beast::error_code ec;
    tcp::resolver::results_type endpoints;
    m_resolver.async_resolve(m_url.host, m_url.port,
        [&ec, &endpoints](const beast::error_code& e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
        });
    RunIo(deadline);
    if (ec) throw beast::system_error(ec, "resolve " + m_url.host);

    if (m_url.secure) {
        auto stream = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(m_io_context, m_ssl_context);
        // SNI
        if (!SSL_set_tlsext_host_name(stream->native_handle(), m_url.host.c_str())) {
            beast::error_code sni_ec{ static_cast<int>(::ERR_get_error()), net::error::get_ssl_category() };
            throw beast::system_error(sni_ec, "SNI " + m_url.host);
        }
        m_tls_stream = std::move(stream);

        auto& lowest = beast::get_lowest_layer(*m_tls_stream);
        lowest.expires_at(deadline);
        lowest.async_connect(endpoints,
            [&ec](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
        RunIo(deadline);
        if (ec) throw beast::system_error(ec, "connect " + m_url.host);

        lowest.expires_at(deadline);
        m_tls_stream->async_handshake(ssl::stream_base::client,
            [&ec](const beast::error_code& e) { ec = e; });
        RunIo(deadline);
        if (ec) throw beast::system_error(ec, "TLS handshake " + m_url.host);
    }
    else {
        m_plain_stream = std::make_unique<beast::tcp_stream>(m_io_context);
        m_plain_stream->expires_at(deadline);
        m_plain_stream->async_connect(endpoints,
            [&ec](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
        RunIo(deadline);
        if (ec) throw beast::system_error(ec, "connect " + m_url.host);
    }
    ++m_connect_count;
}

template <typename Stream>
HttpCommandSource::Response HttpCommandSource::ExchangeOn(Stream& stream, Clock::time_point deadline) {
    http::request<http::empty_body> request{ http::verb::get, m_url.target, 11 };
    request.set(http::field::host, m_host_header);
    request.set(http::field::user_agent, kUserAgent);
    request.keep_alive(true);

    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_at(deadline);
    http::async_write(stream, request,
        [&ec](const beast::error_code& e, std::size_t) { ec = e; });
    RunIo(deadline);
    if (ec) throw beast::system_error(ec, "send " + m_url.host);

    Response response;
    beast::get_lowest_layer(stream).expires_at(deadline);
    http::async_read(stream, m_buffer, response,
        [&ec](const beast::error_code& e, std::size_t) { ec = e; });
    RunIo(deadline);
    if (ec) throw beast::system_error(ec, "receive " + m_url.host);

    beast::get_lowest_layer(stream).expires_never();
    return response;
}

HttpCommandSource::Response HttpCommandSource::Exchange(Clock::time_point deadline) {
    if (m_tls_stream) return ExchangeOn(*m_tls_stream, deadline);
    return ExchangeOn(*m_plain_stream, deadline);
}

void HttpCommandSource::ResetConnection() {
    // No TLS close_notify: the peer is either gone or about to be replaced
    boost::system::error_code ignored;
    if (m_plain_stream) {
        m_plain_stream->socket().shutdown(tcp::socket::shutdown_both, ignored);
        m_plain_stream->socket().close(ignored);
        m_plain_stream.reset();
    }
    if (m_tls_stream) {
        beast::get_lowest_layer(*m_tls_stream).socket().close(ignored);
        m_tls_stream.reset();
    }
    m_buffer.consume(m_buffer.size());
}
