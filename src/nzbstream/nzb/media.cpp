// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/nzb/media.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace nzbstream::nzb {

namespace {

constexpr std::array<std::string_view, 13> VIDEO_EXTENSIONS{
    ".mkv", ".mp4", ".avi", ".mov", ".wmv", ".flv", ".webm",
    ".m4v", ".mpg", ".mpeg", ".ts", ".m2ts", ".vob",
};

constexpr std::array<std::string_view, 8> AUDIO_EXTENSIONS{
    ".mp3", ".flac", ".m4a", ".aac", ".ogg", ".opus", ".wav", ".wma",
};

constexpr std::array<std::pair<std::string_view, std::string_view>, 21> CONTENT_TYPES{{
    {".mkv", "video/x-matroska"},
    {".mp4", "video/mp4"},
    {".m4v", "video/x-m4v"},
    {".avi", "video/x-msvideo"},
    {".mov", "video/quicktime"},
    {".wmv", "video/x-ms-wmv"},
    {".flv", "video/x-flv"},
    {".webm", "video/webm"},
    {".mpg", "video/mpeg"},
    {".mpeg", "video/mpeg"},
    {".ts", "video/mp2t"},
    {".m2ts", "video/mp2t"},
    {".vob", "video/dvd"},
    {".mp3", "audio/mpeg"},
    {".flac", "audio/flac"},
    {".m4a", "audio/mp4"},
    {".aac", "audio/aac"},
    {".ogg", "audio/ogg"},
    {".opus", "audio/opus"},
    {".wav", "audio/wav"},
    {".wma", "audio/x-ms-wma"},
}};

template<std::size_t N>
bool contains(const std::array<std::string_view, N>& list, std::string_view ext) {
    return std::find(list.begin(), list.end(), ext) != list.end();
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

std::string file_extension(std::string_view name) {
    auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) name.remove_prefix(slash + 1);

    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return {};
    return to_lower(name.substr(dot));
}

bool is_video_file(std::string_view name) {
    return contains(VIDEO_EXTENSIONS, file_extension(name));
}

bool is_audio_file(std::string_view name) {
    return contains(AUDIO_EXTENSIONS, file_extension(name));
}

bool is_media_file(std::string_view name) {
    auto ext = file_extension(name);
    return contains(VIDEO_EXTENSIONS, ext) || contains(AUDIO_EXTENSIONS, ext);
}

bool is_rar_file(std::string_view name) {
    auto ext = file_extension(name);
    if (ext == ".rar") return true;

    // Old-style volumes: .r00 .. .r99 (and .r100+ on very large sets)
    return ext.size() >= 4 && ext[1] == 'r' && all_digits(std::string_view(ext).substr(2));
}

ArchiveType archive_type(std::string_view name) {
    if (is_rar_file(name)) return ArchiveType::rar;

    auto ext = file_extension(name);
    if (ext == ".7z") return ArchiveType::sevenzip;
    // Split 7z volumes: name.7z.001
    if (all_digits(std::string_view(ext).substr(ext.empty() ? 0 : 1))) {
        auto lower = to_lower(name);
        if (lower.find(".7z.") != std::string::npos) return ArchiveType::sevenzip;
        if (lower.find(".zip.") != std::string::npos) return ArchiveType::zip;
    }
    if (ext == ".zip") return ArchiveType::zip;
    return ArchiveType::none;
}

std::string_view content_type(std::string_view name) {
    auto ext = file_extension(name);
    for (const auto& [e, type] : CONTENT_TYPES) {
        if (e == ext) return type;
    }
    return "application/octet-stream";
}

std::string_view to_string(ArchiveType type) noexcept {
    switch (type) {
        case ArchiveType::none:     return "none";
        case ArchiveType::rar:      return "rar";
        case ArchiveType::sevenzip: return "7z";
        case ArchiveType::zip:      return "zip";
    }
    return "unknown";
}

} // namespace nzbstream::nzb
