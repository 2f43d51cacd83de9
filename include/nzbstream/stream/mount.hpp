// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/nzb/nzb_parser.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nzbstream::stream {

enum class MountStatus : std::uint8_t {
    pending,
    parsing,
    ready,
    downloading,
    error,
    expired,
};

[[nodiscard]] std::string_view to_string(MountStatus status) noexcept;

// A release made available for streaming
struct MountInfo {
    std::string id;
    std::string nzb_hash;
    std::string title;
    MountStatus status{MountStatus::pending};
    std::uint32_t file_count{0};
    std::uint64_t total_size{0};
    std::vector<nzb::NzbFile> media_files;  // Every file of the release, segments included
    std::optional<std::filesystem::path> extracted_file_path;
    std::string error_message;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_access;
};

using MountPtr = std::shared_ptr<const MountInfo>;

// Source of mount records; owned outside the engine
class MountRepository {
public:
    virtual ~MountRepository() = default;

    // nullptr if unknown
    [[nodiscard]] virtual MountPtr get_mount(std::string_view id) = 0;

    // Record an access (keeps the mount from expiring)
    virtual void touch_mount(std::string_view id) = 0;
};

// In-process mounts built from parsed NZBs
class MemoryMountRepository final : public MountRepository {
public:
    // Mount ids derive from the NZB hash so they are stable across runs.
    // Adding the same NZB again returns the existing id.
    std::string add(const nzb::ParsedNzb& parsed, std::string title,
                    MountStatus status = MountStatus::ready);

    [[nodiscard]] MountPtr get_mount(std::string_view id) override;
    void touch_mount(std::string_view id) override;

    bool set_status(std::string_view id, MountStatus status, std::string error_message = {});
    bool set_extracted_file(std::string_view id, std::filesystem::path path);
    bool remove(std::string_view id);

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] static std::string mount_id_for(std::string_view nzb_hash);

private:
    // Mounts are immutable once published; updates replace the pointer
    template <typename Fn>
    bool update(std::string_view id, Fn&& fn);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, MountPtr> mounts_;
};

} // namespace nzbstream::stream
