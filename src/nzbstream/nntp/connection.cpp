// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/nntp/connection.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>

namespace nzbstream::nntp {

namespace asio = boost::asio;

namespace {

using core::StreamErrc;
using core::make_error_code;

constexpr std::size_t MAX_STATUS_LINE = 4096;
constexpr std::size_t MAX_ARTICLE_BYTES = 32 * 1024 * 1024;

} // namespace

//=============================================================================
// NntpConnection
//=============================================================================

NntpConnection::NntpConnection(core::ProviderConfig config,
                               std::chrono::milliseconds connect_timeout,
                               std::chrono::milliseconds io_timeout)
    : config_(std::move(config))
    , connect_timeout_(connect_timeout)
    , io_timeout_(io_timeout)
    , ssl_ctx_(asio::ssl::context::tls_client)
    , stream_(io_, ssl_ctx_)
    , read_buf_(core::READ_CHUNK_SIZE) {}

NntpConnection::~NntpConnection() {
    close();
}

std::error_code NntpConnection::wait(std::chrono::milliseconds timeout, const bool& done) {
    io_.restart();
    io_.run_for(timeout);
    if (done) return {};

    // Pending handlers reference the caller's stack; the context is never run again
    broken_ = true;
    abort_transport();
    io_.stop();
    spdlog::debug("NNTP {} operation timed out after {}ms", config_.name, timeout.count());
    return make_error_code(StreamErrc::timeout);
}

std::error_code NntpConnection::fail(const boost::system::error_code& ec) noexcept {
    broken_ = true;
    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::ssl::error::stream_truncated) {
        return make_error_code(StreamErrc::connection_closed);
    }
    return make_error_code(StreamErrc::connection_failed);
}

void NntpConnection::abort_transport() noexcept {
    boost::system::error_code ignored;
    stream_.lowest_layer().close(ignored);
}

std::error_code NntpConnection::open_transport() {
    bool done = false;
    boost::system::error_code op_ec;

    asio::ip::tcp::resolver resolver(io_);
    asio::ip::tcp::resolver::results_type endpoints;
    resolver.async_resolve(config_.host, std::to_string(config_.port),
        [&](const boost::system::error_code& ec, asio::ip::tcp::resolver::results_type results) {
            op_ec = ec;
            endpoints = std::move(results);
            done = true;
        });
    if (auto ec = wait(connect_timeout_, done)) return ec;
    if (op_ec) {
        spdlog::warn("Cannot resolve {}: {}", config_.host, op_ec.message());
        broken_ = true;
        return make_error_code(StreamErrc::connection_failed);
    }

    done = false;
    asio::async_connect(stream_.lowest_layer(), endpoints,
        [&](const boost::system::error_code& ec, const asio::ip::tcp::endpoint&) {
            op_ec = ec;
            done = true;
        });
    if (auto ec = wait(connect_timeout_, done)) return ec;
    if (op_ec) {
        spdlog::warn("Cannot connect to {}:{}: {}", config_.host, config_.port, op_ec.message());
        broken_ = true;
        return make_error_code(StreamErrc::connection_failed);
    }

    boost::system::error_code opt_ec;
    stream_.lowest_layer().set_option(asio::ip::tcp::no_delay(true), opt_ec);

    if (!config_.tls) return {};

    boost::system::error_code ssl_ec;
    ssl_ctx_.set_default_verify_paths(ssl_ec);
    stream_.set_verify_mode(asio::ssl::verify_peer, ssl_ec);
    stream_.set_verify_callback(asio::ssl::host_name_verification(config_.host), ssl_ec);
    if (ssl_ec || !SSL_set_tlsext_host_name(stream_.native_handle(), config_.host.c_str())) {
        broken_ = true;
        return make_error_code(StreamErrc::connection_failed);
    }

    done = false;
    stream_.async_handshake(asio::ssl::stream_base::client,
        [&](const boost::system::error_code& ec) {
            op_ec = ec;
            done = true;
        });
    if (auto ec = wait(connect_timeout_, done)) return ec;
    if (op_ec) {
        spdlog::warn("TLS handshake with {} failed: {}", config_.host, op_ec.message());
        broken_ = true;
        return make_error_code(StreamErrc::connection_failed);
    }
    return {};
}

std::error_code NntpConnection::write_line(std::string_view line) {
    if (broken_) return make_error_code(StreamErrc::connection_closed);

    std::string out(line);
    out += "\r\n";

    bool done = false;
    boost::system::error_code op_ec;
    auto handler = [&](const boost::system::error_code& ec, std::size_t) {
        op_ec = ec;
        done = true;
    };

    if (config_.tls) {
        asio::async_write(stream_, asio::buffer(out), handler);
    } else {
        asio::async_write(stream_.next_layer(), asio::buffer(out), handler);
    }

    if (auto ec = wait(io_timeout_, done)) return ec;
    if (op_ec) return fail(op_ec);
    return {};
}

std::error_code NntpConnection::fill_buffer() {
    if (broken_) return make_error_code(StreamErrc::connection_closed);

    bool done = false;
    boost::system::error_code op_ec;
    std::size_t received = 0;
    auto handler = [&](const boost::system::error_code& ec, std::size_t bytes) {
        op_ec = ec;
        received = bytes;
        done = true;
    };

    if (config_.tls) {
        stream_.async_read_some(asio::buffer(read_buf_), handler);
    } else {
        stream_.next_layer().async_read_some(asio::buffer(read_buf_), handler);
    }

    if (auto ec = wait(io_timeout_, done)) return ec;
    if (op_ec) return fail(op_ec);

    buffer_.append(read_buf_.data(), received);
    return {};
}

std::expected<NntpResponse, std::error_code> NntpConnection::read_response() {
    while (true) {
        auto eol = buffer_.find("\r\n");
        if (eol != std::string::npos) {
            auto response = parse_status_line(std::string_view(buffer_).substr(0, eol));
            buffer_.erase(0, eol + 2);
            if (!response) broken_ = true;
            return response;
        }

        if (buffer_.size() > MAX_STATUS_LINE) {
            broken_ = true;
            return std::unexpected(make_error_code(StreamErrc::protocol_error));
        }
        if (auto ec = fill_buffer()) return std::unexpected(ec);
    }
}

std::expected<NntpResponse, std::error_code> NntpConnection::command(std::string_view line) {
    if (auto ec = write_line(line)) return std::unexpected(ec);
    return read_response();
}

std::expected<std::vector<std::string>, std::error_code> NntpConnection::read_multiline() {
    std::size_t search_from = 0;
    while (true) {
        if (auto dot = find_multiline_terminator(buffer_, 0, search_from)) {
            auto lines = split_body_lines(std::string_view(buffer_).substr(0, *dot));
            buffer_.erase(0, *dot + 3);
            return lines;
        }

        if (buffer_.size() > MAX_ARTICLE_BYTES) {
            broken_ = true;
            return std::unexpected(make_error_code(StreamErrc::protocol_error));
        }

        // A terminator split across reads starts at most four bytes back
        search_from = buffer_.size() >= 4 ? buffer_.size() - 4 : 0;
        if (auto ec = fill_buffer()) return std::unexpected(ec);
    }
}

std::error_code NntpConnection::authenticate() {
    if (config_.username.empty()) return {};

    auto r = command("AUTHINFO USER " + config_.username);
    if (!r) return r.error();

    if (r->code == code::PASSWORD_REQUIRED) {
        r = command("AUTHINFO PASS " + config_.password);
        if (!r) return r.error();
    }

    if (r->code == code::AUTH_ACCEPTED) return {};

    spdlog::error("Authentication with {} rejected: {} {}", config_.name, r->code, r->message);
    return make_error_code(StreamErrc::auth_failed);
}

std::error_code NntpConnection::select_group(const std::string& group) {
    auto r = command("GROUP " + group);
    if (!r) return r.error();

    if (auto ec = classify_group_response(*r)) {
        if (ec != StreamErrc::article_not_found) broken_ = true;
        return ec;
    }
    current_group_ = group;
    return {};
}

std::error_code NntpConnection::connect() noexcept {
    if (connected_) return broken_ ? make_error_code(StreamErrc::connection_closed) : std::error_code{};

    try {
        if (auto ec = open_transport()) return ec;

        auto greeting = read_response();
        if (!greeting) return greeting.error();
        if (greeting->code != code::POSTING_ALLOWED && greeting->code != code::POSTING_PROHIBITED) {
            spdlog::warn("Provider {} refused connection: {} {}", config_.name, greeting->code, greeting->message);
            broken_ = true;
            return make_error_code(StreamErrc::connection_failed);
        }
        connected_ = true;

        if (auto ec = authenticate()) {
            broken_ = true;
            return ec;
        }

        spdlog::debug("Connected to {} ({}:{}{})", config_.name, config_.host, config_.port,
                      config_.tls ? ", TLS" : "");
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Connecting to {} failed: {}", config_.name, e.what());
        broken_ = true;
        return make_error_code(StreamErrc::connection_failed);
    }
}

std::expected<std::vector<std::string>, std::error_code>
NntpConnection::body(const std::string& message_id, const std::string& group) noexcept {
    if (!healthy()) return std::unexpected(make_error_code(StreamErrc::connection_closed));

    try {
        if (config_.join_group && !group.empty() && group != current_group_) {
            if (auto ec = select_group(group)) return std::unexpected(ec);
        }

        std::string id = message_id;
        if (id.empty() || id.front() != '<') id = "<" + id + ">";

        auto r = command("BODY " + id);
        if (!r) return std::unexpected(r.error());

        if (auto ec = classify_body_response(*r)) {
            // A miss leaves the session usable; anything else does not
            if (ec != StreamErrc::article_not_found) broken_ = true;
            return std::unexpected(ec);
        }

        return read_multiline();
    } catch (const std::bad_alloc&) {
        broken_ = true;
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }
}

void NntpConnection::close() noexcept {
    if (connected_ && !broken_) {
        try {
            (void)write_line("QUIT");
        } catch (const std::exception& e) {
            spdlog::debug("QUIT to {} failed: {}", config_.name, e.what());
        }
    }
    abort_transport();
    connected_ = false;
    buffer_.clear();
    current_group_.clear();
}

} // namespace nzbstream::nntp
