// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/stream/mount.hpp>
#include <spdlog/spdlog.h>

namespace nzbstream::stream {

namespace {

constexpr std::size_t MOUNT_ID_LENGTH = 16;

} // namespace

std::string_view to_string(MountStatus status) noexcept {
    switch (status) {
        case MountStatus::pending:      return "pending";
        case MountStatus::parsing:      return "parsing";
        case MountStatus::ready:        return "ready";
        case MountStatus::downloading:  return "downloading";
        case MountStatus::error:        return "error";
        case MountStatus::expired:      return "expired";
    }
    return "unknown";
}

std::string MemoryMountRepository::mount_id_for(std::string_view nzb_hash) {
    return std::string(nzb_hash.substr(0, MOUNT_ID_LENGTH));
}

std::string MemoryMountRepository::add(const nzb::ParsedNzb& parsed, std::string title, MountStatus status) {
    auto id = mount_id_for(parsed.hash);

    auto lock = std::unique_lock(mutex_);
    if (mounts_.contains(id)) {
        return id;
    }

    auto mount = std::make_shared<MountInfo>();
    mount->id = id;
    mount->nzb_hash = parsed.hash;
    mount->title = std::move(title);
    mount->status = status;
    mount->file_count = static_cast<std::uint32_t>(parsed.files.size());
    mount->total_size = parsed.total_size;
    mount->media_files = parsed.files;
    mount->created_at = std::chrono::system_clock::now();
    mount->last_access = mount->created_at;

    spdlog::debug("Mounted {} as {} ({} files, {} bytes)", mount->title, id, mount->file_count, mount->total_size);
    mounts_.emplace(id, std::move(mount));
    return id;
}

MountPtr MemoryMountRepository::get_mount(std::string_view id) {
    auto lock = std::unique_lock(mutex_);
    auto it = mounts_.find(std::string(id));
    return it != mounts_.end() ? it->second : nullptr;
}

template <typename Fn>
bool MemoryMountRepository::update(std::string_view id, Fn&& fn) {
    auto lock = std::unique_lock(mutex_);
    auto it = mounts_.find(std::string(id));
    if (it == mounts_.end()) return false;

    auto copy = std::make_shared<MountInfo>(*it->second);
    fn(*copy);
    it->second = std::move(copy);
    return true;
}

void MemoryMountRepository::touch_mount(std::string_view id) {
    update(id, [](MountInfo& mount) { mount.last_access = std::chrono::system_clock::now(); });
}

bool MemoryMountRepository::set_status(std::string_view id, MountStatus status, std::string error_message) {
    bool found = update(id, [&](MountInfo& mount) {
        mount.status = status;
        mount.error_message = std::move(error_message);
    });
    if (found) {
        spdlog::debug("Mount {} is now {}", id, to_string(status));
    }
    return found;
}

bool MemoryMountRepository::set_extracted_file(std::string_view id, std::filesystem::path path) {
    return update(id, [&](MountInfo& mount) { mount.extracted_file_path = std::move(path); });
}

bool MemoryMountRepository::remove(std::string_view id) {
    auto lock = std::unique_lock(mutex_);
    return mounts_.erase(std::string(id)) > 0;
}

std::size_t MemoryMountRepository::size() const {
    auto lock = std::unique_lock(mutex_);
    return mounts_.size();
}

} // namespace nzbstream::stream
