// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <system_error>
#include <string_view>

namespace nzbstream::core {

enum class StreamErrc {
    success = 0,

    // NNTP / provider
    article_not_found,
    protocol_error,
    connection_failed,
    connection_closed,
    timeout,
    auth_failed,

    // Decoding / input format
    yenc_missing_header,
    yenc_missing_trailer,
    yenc_size_mismatch,
    yenc_crc_mismatch,
    invalid_nzb,

    // Content classification
    rar_only,
    no_media_files,
    not_streamable,

    // Caller errors
    invalid_range,

    // Capacity
    resource_exhausted,
    no_providers,

    // Lookup / lifecycle
    mount_not_found,
    mount_not_ready,
    mount_downloading,
    nzb_unavailable,
    file_not_found,
    segment_not_found,

    // Local
    cache_error,
    io_error,
    config_error,
    cancelled,
};

// Coarse classes the outer layers act on
enum class ErrorKind : std::uint8_t {
    none,
    protocol,
    decode,
    not_streamable,
    range,
    resource_exhausted,
    lookup,
    state,
    io,
};

namespace detail {

struct StreamErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "nzbstream";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<StreamErrc>(ev)) {
            case StreamErrc::success:              return "Success";
            case StreamErrc::article_not_found:    return "Article not found";
            case StreamErrc::protocol_error:       return "Malformed NNTP response";
            case StreamErrc::connection_failed:    return "Could not connect to provider";
            case StreamErrc::connection_closed:    return "Connection closed by provider";
            case StreamErrc::timeout:              return "Operation timed out";
            case StreamErrc::auth_failed:          return "NNTP authentication failed";
            case StreamErrc::yenc_missing_header:  return "yEnc header (=ybegin) not found";
            case StreamErrc::yenc_missing_trailer: return "yEnc trailer (=yend) not found";
            case StreamErrc::yenc_size_mismatch:   return "yEnc decoded size mismatch";
            case StreamErrc::yenc_crc_mismatch:    return "yEnc CRC32 mismatch";
            case StreamErrc::invalid_nzb:          return "Invalid NZB document";
            case StreamErrc::rar_only:             return "RAR-compressed releases cannot be streamed";
            case StreamErrc::no_media_files:       return "No streamable media files found in this release";
            case StreamErrc::not_streamable:       return "Content is not streamable";
            case StreamErrc::invalid_range:        return "Requested range not satisfiable";
            case StreamErrc::resource_exhausted:   return "All providers are saturated or backing off";
            case StreamErrc::no_providers:         return "No NNTP providers configured";
            case StreamErrc::mount_not_found:      return "Mount not found";
            case StreamErrc::mount_not_ready:      return "Mount not ready";
            case StreamErrc::mount_downloading:    return "Mount is downloading";
            case StreamErrc::nzb_unavailable:      return "NZB content not available, mount needs to be recreated";
            case StreamErrc::file_not_found:       return "File not found in release";
            case StreamErrc::segment_not_found:    return "Segment not found";
            case StreamErrc::cache_error:          return "Segment cache error";
            case StreamErrc::io_error:             return "I/O error";
            case StreamErrc::config_error:         return "Invalid configuration";
            case StreamErrc::cancelled:            return "Operation cancelled";
            default:                               return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::StreamErrcCategory& stream_errc_category() noexcept {
    static detail::StreamErrcCategory category;
    return category;
}

inline std::error_code make_error_code(StreamErrc e) noexcept {
    return {static_cast<int>(e), stream_errc_category()};
}

// Classify an error code into the taxonomy callers retry/report on
[[nodiscard]] ErrorKind error_kind(const std::error_code& ec) noexcept;

// HTTP status an outer route layer should answer with
[[nodiscard]] int http_status(const std::error_code& ec) noexcept;

// Whether trying the same article on another provider can help
[[nodiscard]] bool is_retryable_on_other_provider(const std::error_code& ec) noexcept;

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

} // namespace nzbstream::core

namespace std {

template<>
struct is_error_code_enum<nzbstream::core::StreamErrc> : true_type {};

} // namespace std
