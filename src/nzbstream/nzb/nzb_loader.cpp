// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/nzb/nzb_loader.hpp>
#include <nzbstream/version.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace nzbstream::nzb {

namespace {

using core::StreamErrc;
using core::make_error_code;

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct Download {
    std::string body;
    bool too_large{false};
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* dl = static_cast<Download*>(userdata);
    if (!dl) return 0;

    std::size_t total = size * nitems;
    if (dl->body.size() + total > MAX_NZB_DOCUMENT_SIZE) {
        // Returning short aborts the transfer
        dl->too_large = true;
        return 0;
    }

    dl->body.append(ptr, total);
    return total;
}

std::expected<std::string, std::error_code> fetch_url(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(StreamErrc::io_error));
    }

    Download dl;

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, NZB_FETCH_MAX_REDIRECTS);
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, NZB_FETCH_TIMEOUT_SEC);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_ACCEPT_ENCODING, "");
    auto agent = user_agent();
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &dl);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (dl.too_large) {
        spdlog::error("NZB at {} exceeds {} bytes", url, MAX_NZB_DOCUMENT_SIZE);
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }
    if (result != CURLE_OK) {
        spdlog::error("Fetching NZB {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(make_error_code(StreamErrc::io_error));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        spdlog::error("Fetching NZB {} failed with HTTP {}", url, http_code);
        return std::unexpected(make_error_code(http_code == 404 ? StreamErrc::file_not_found
                                                                : StreamErrc::io_error));
    }

    return std::move(dl.body);
}

std::expected<std::string, std::error_code> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::error("Cannot open NZB file {}", path);
        return std::unexpected(make_error_code(StreamErrc::file_not_found));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (!file.good() && !file.eof()) {
        return std::unexpected(make_error_code(StreamErrc::io_error));
    }
    return ss.str();
}

} // namespace

bool is_url(std::string_view source) noexcept {
    return source.starts_with("http://") || source.starts_with("https://");
}

std::expected<std::string, std::error_code>
read_nzb_document(std::string_view source) noexcept {
    try {
        if (is_url(source)) {
            return fetch_url(std::string(source));
        }
        return read_file(std::string(source));
    } catch (const std::exception& e) {
        spdlog::error("Reading NZB {} failed: {}", source, e.what());
        return std::unexpected(make_error_code(StreamErrc::io_error));
    }
}

std::expected<ParsedNzb, std::error_code>
load_nzb(std::string_view source) noexcept {
    auto doc = read_nzb_document(source);
    if (!doc) return std::unexpected(doc.error());
    return parse_nzb(*doc);
}

void global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace nzbstream::nzb
