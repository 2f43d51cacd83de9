// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/config.hpp>
#include <nzbstream/core/error.hpp>
#include <nzbstream/nntp/response.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nzbstream::nntp {

// One logical NNTP session. Used by a single thread at a time.
class NntpSession {
public:
    virtual ~NntpSession() = default;

    // Connect, read the greeting and authenticate
    [[nodiscard]] virtual std::error_code connect() noexcept = 0;

    // BODY <message_id>; returns dot-unstuffed lines
    [[nodiscard]] virtual std::expected<std::vector<std::string>, std::error_code>
    body(const std::string& message_id, const std::string& group) noexcept = 0;

    // False once a transport or protocol error left the session unusable
    [[nodiscard]] virtual bool healthy() const noexcept = 0;

    virtual void close() noexcept = 0;
};

using SessionFactory = std::function<std::unique_ptr<NntpSession>(const core::ProviderConfig&)>;

// NNTP over TCP or TLS with per-operation deadlines
class NntpConnection final : public NntpSession {
public:
    NntpConnection(core::ProviderConfig config,
                   std::chrono::milliseconds connect_timeout,
                   std::chrono::milliseconds io_timeout);
    ~NntpConnection() override;

    NntpConnection(const NntpConnection&) = delete;
    NntpConnection& operator=(const NntpConnection&) = delete;

    [[nodiscard]] std::error_code connect() noexcept override;

    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
    body(const std::string& message_id, const std::string& group) noexcept override;

    [[nodiscard]] bool healthy() const noexcept override { return connected_ && !broken_; }

    void close() noexcept override;

    [[nodiscard]] const std::string& current_group() const noexcept { return current_group_; }

private:
    using TcpSocket = boost::asio::ip::tcp::socket;
    using TlsStream = boost::asio::ssl::stream<TcpSocket>;

    // Run the io_context until done is set or the deadline passes
    [[nodiscard]] std::error_code wait(std::chrono::milliseconds timeout, const bool& done);

    [[nodiscard]] std::error_code open_transport();
    [[nodiscard]] std::error_code write_line(std::string_view line);
    [[nodiscard]] std::error_code fill_buffer();
    [[nodiscard]] std::expected<NntpResponse, std::error_code> read_response();
    [[nodiscard]] std::expected<NntpResponse, std::error_code> command(std::string_view line);
    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code> read_multiline();
    [[nodiscard]] std::error_code authenticate();
    [[nodiscard]] std::error_code select_group(const std::string& group);

    // Mark unusable and map a transport error
    std::error_code fail(const boost::system::error_code& ec) noexcept;
    void abort_transport() noexcept;

    core::ProviderConfig config_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds io_timeout_;

    boost::asio::io_context io_;
    boost::asio::ssl::context ssl_ctx_;
    TlsStream stream_;

    std::vector<char> read_buf_;
    std::string buffer_;            // Received, not yet consumed
    std::string current_group_;
    bool connected_{false};
    bool broken_{false};
};

} // namespace nzbstream::nntp
