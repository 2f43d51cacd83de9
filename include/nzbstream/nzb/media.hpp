// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace nzbstream::nzb {

enum class ArchiveType : std::uint8_t {
    none,
    rar,
    sevenzip,
    zip,
};

// Lowercase extension including the dot, or empty
[[nodiscard]] std::string file_extension(std::string_view name);

[[nodiscard]] bool is_video_file(std::string_view name);
[[nodiscard]] bool is_audio_file(std::string_view name);

// Video or audio
[[nodiscard]] bool is_media_file(std::string_view name);

// .rar, .r00-.r99 and .partNN.rar volumes
[[nodiscard]] bool is_rar_file(std::string_view name);

[[nodiscard]] ArchiveType archive_type(std::string_view name);

// MIME type for an HTTP Content-Type header
[[nodiscard]] std::string_view content_type(std::string_view name);

[[nodiscard]] std::string_view to_string(ArchiveType type) noexcept;

} // namespace nzbstream::nzb
