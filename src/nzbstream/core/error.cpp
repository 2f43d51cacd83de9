// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/core/error.hpp>

namespace nzbstream::core {

ErrorKind error_kind(const std::error_code& ec) noexcept {
    if (!ec) return ErrorKind::none;
    if (ec.category() != stream_errc_category()) return ErrorKind::io;

    switch (static_cast<StreamErrc>(ec.value())) {
        case StreamErrc::article_not_found:
        case StreamErrc::protocol_error:
        case StreamErrc::connection_failed:
        case StreamErrc::connection_closed:
        case StreamErrc::timeout:
        case StreamErrc::auth_failed:
            return ErrorKind::protocol;

        case StreamErrc::yenc_missing_header:
        case StreamErrc::yenc_missing_trailer:
        case StreamErrc::yenc_size_mismatch:
        case StreamErrc::yenc_crc_mismatch:
        case StreamErrc::invalid_nzb:
            return ErrorKind::decode;

        case StreamErrc::rar_only:
        case StreamErrc::no_media_files:
        case StreamErrc::not_streamable:
            return ErrorKind::not_streamable;

        case StreamErrc::invalid_range:
            return ErrorKind::range;

        case StreamErrc::resource_exhausted:
        case StreamErrc::no_providers:
            return ErrorKind::resource_exhausted;

        case StreamErrc::mount_not_found:
        case StreamErrc::file_not_found:
        case StreamErrc::segment_not_found:
            return ErrorKind::lookup;

        case StreamErrc::mount_not_ready:
        case StreamErrc::mount_downloading:
        case StreamErrc::nzb_unavailable:
            return ErrorKind::state;

        case StreamErrc::success:
            return ErrorKind::none;

        default:
            return ErrorKind::io;
    }
}

int http_status(const std::error_code& ec) noexcept {
    if (ec == StreamErrc::invalid_nzb) return 422;

    switch (error_kind(ec)) {
        case ErrorKind::none:               return 200;
        case ErrorKind::protocol:           return 502;
        case ErrorKind::decode:             return 502;
        case ErrorKind::not_streamable:     return 422;
        case ErrorKind::range:              return 416;
        case ErrorKind::resource_exhausted: return 503;
        case ErrorKind::lookup:             return 404;
        case ErrorKind::state:              return 409;
        case ErrorKind::io:                 return 500;
    }
    return 500;
}

bool is_retryable_on_other_provider(const std::error_code& ec) noexcept {
    // A corrupt copy on one provider may be intact on the next
    auto kind = error_kind(ec);
    return kind == ErrorKind::protocol || (kind == ErrorKind::decode && ec != StreamErrc::invalid_nzb);
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::none:               return "none";
        case ErrorKind::protocol:           return "protocol";
        case ErrorKind::decode:             return "decode";
        case ErrorKind::not_streamable:     return "not_streamable";
        case ErrorKind::range:              return "range";
        case ErrorKind::resource_exhausted: return "resource_exhausted";
        case ErrorKind::lookup:             return "lookup";
        case ErrorKind::state:              return "state";
        case ErrorKind::io:                 return "io";
    }
    return "unknown";
}

} // namespace nzbstream::core
