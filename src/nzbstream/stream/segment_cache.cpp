// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/stream/segment_cache.hpp>
#include <nzbstream/core/config.hpp>
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <algorithm>
#include <chrono>
#include <cstring>

namespace nzbstream::stream {

using core::StreamErrc;
using core::make_error_code;

namespace {

constexpr const char* SCHEMA_SQL =
    "CREATE TABLE IF NOT EXISTS segment_cache ("
    " mount_id TEXT NOT NULL,"
    " file_index INTEGER NOT NULL,"
    " segment_index INTEGER NOT NULL,"
    " data BLOB NOT NULL,"
    " size INTEGER NOT NULL,"
    " created_at INTEGER NOT NULL,"
    " PRIMARY KEY (mount_id, file_index, segment_index)"
    ");";

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement prepare(sqlite3* db, const char* sql) noexcept {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        spdlog::warn("Segment cache: prepare failed: {}", sqlite3_errmsg(db));
        sqlite3_finalize(raw);
        return nullptr;
    }
    return Statement(raw);
}

bool bind_key(sqlite3_stmt* stmt, std::string_view mount_id,
              std::uint32_t file_index, std::uint32_t segment_index) noexcept {
    return sqlite3_bind_text(stmt, 1, mount_id.data(), static_cast<int>(mount_id.size()), SQLITE_TRANSIENT) == SQLITE_OK
        && sqlite3_bind_int64(stmt, 2, file_index) == SQLITE_OK
        && sqlite3_bind_int64(stmt, 3, segment_index) == SQLITE_OK;
}

std::int64_t unix_now() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

//=============================================================================
// SegmentCacheService
//=============================================================================

std::expected<std::unique_ptr<SegmentCacheService>, std::error_code>
SegmentCacheService::open(const std::string& path) noexcept {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Cannot open segment cache {}: {}", path, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        sqlite3_close(db);
        return std::unexpected(make_error_code(StreamErrc::cache_error));
    }

    std::unique_ptr<SegmentCacheService> service;
    try {
        service.reset(new SegmentCacheService(path, db));
    } catch (const std::bad_alloc&) {
        sqlite3_close(db);
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }

    sqlite3_busy_timeout(db, 5000);
    if (path != ":memory:") {
        // WAL lets readers proceed while a fetch writes
        if (auto ec = service->exec("PRAGMA journal_mode=WAL;")) {
            spdlog::warn("Segment cache at {} stays in rollback journal mode", path);
        } else if (auto sync_ec = service->exec("PRAGMA synchronous=NORMAL;")) {
            return std::unexpected(sync_ec);
        }
    }
    if (auto ec = service->exec(SCHEMA_SQL)) {
        return std::unexpected(ec);
    }

    spdlog::debug("Segment cache opened at {}", path);
    return service;
}

SegmentCacheService::SegmentCacheService(std::string path, sqlite3* db) noexcept
    : path_(std::move(path))
    , db_(db) {}

SegmentCacheService::~SegmentCacheService() {
    if (db_) sqlite3_close(db_);
}

std::error_code SegmentCacheService::exec(const char* sql) noexcept {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("Segment cache: {} ({})", err ? err : "unknown error", sql);
        sqlite3_free(err);
        return make_error_code(StreamErrc::cache_error);
    }
    return {};
}

std::error_code SegmentCacheService::cache_segment(std::string_view mount_id, std::uint32_t file_index,
                                                   std::uint32_t segment_index,
                                                   std::span<const std::byte> data) noexcept {
    auto lock = std::unique_lock(mutex_);
    auto stmt = prepare(db_,
        "INSERT OR REPLACE INTO segment_cache"
        " (mount_id, file_index, segment_index, data, size, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?);");
    if (!stmt) return make_error_code(StreamErrc::cache_error);

    bool ok = bind_key(stmt.get(), mount_id, file_index, segment_index);
    // A zero-length blob bound from nullptr would become NULL
    ok = ok && (data.empty()
        ? sqlite3_bind_zeroblob(stmt.get(), 4, 0)
        : sqlite3_bind_blob(stmt.get(), 4, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT)) == SQLITE_OK;
    ok = ok && sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(data.size())) == SQLITE_OK;
    ok = ok && sqlite3_bind_int64(stmt.get(), 6, unix_now()) == SQLITE_OK;

    if (!ok || sqlite3_step(stmt.get()) != SQLITE_DONE) {
        spdlog::warn("Failed to cache segment {}/{}/{}: {}", mount_id, file_index, segment_index,
                     sqlite3_errmsg(db_));
        return make_error_code(StreamErrc::cache_error);
    }
    return {};
}

SegmentData SegmentCacheService::get_cached_segment(std::string_view mount_id, std::uint32_t file_index,
                                                    std::uint32_t segment_index) noexcept {
    auto lock = std::unique_lock(mutex_);
    auto stmt = prepare(db_,
        "SELECT data FROM segment_cache"
        " WHERE mount_id = ? AND file_index = ? AND segment_index = ? LIMIT 1;");
    if (!stmt || !bind_key(stmt.get(), mount_id, file_index, segment_index)) {
        return nullptr;
    }

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return nullptr;
    if (rc != SQLITE_ROW) {
        spdlog::warn("Failed to read cached segment {}/{}/{}: {}", mount_id, file_index, segment_index,
                     sqlite3_errmsg(db_));
        return nullptr;
    }

    const void* blob = sqlite3_column_blob(stmt.get(), 0);
    auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt.get(), 0));

    try {
        auto data = std::make_shared<std::vector<std::byte>>(size);
        if (size > 0 && blob) std::memcpy(data->data(), blob, size);
        return data;
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

bool SegmentCacheService::is_segment_cached(std::string_view mount_id, std::uint32_t file_index,
                                            std::uint32_t segment_index) noexcept {
    auto lock = std::unique_lock(mutex_);
    auto stmt = prepare(db_,
        "SELECT 1 FROM segment_cache"
        " WHERE mount_id = ? AND file_index = ? AND segment_index = ? LIMIT 1;");
    if (!stmt || !bind_key(stmt.get(), mount_id, file_index, segment_index)) {
        return false;
    }
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

std::expected<std::uint64_t, std::error_code>
SegmentCacheService::clear_mount_cache(std::string_view mount_id) noexcept {
    auto lock = std::unique_lock(mutex_);
    auto stmt = prepare(db_, "DELETE FROM segment_cache WHERE mount_id = ?;");
    if (!stmt ||
        sqlite3_bind_text(stmt.get(), 1, mount_id.data(), static_cast<int>(mount_id.size()), SQLITE_TRANSIENT) != SQLITE_OK ||
        sqlite3_step(stmt.get()) != SQLITE_DONE) {
        spdlog::warn("Failed to clear segment cache for mount {}: {}", mount_id, sqlite3_errmsg(db_));
        return std::unexpected(make_error_code(StreamErrc::cache_error));
    }

    auto removed = static_cast<std::uint64_t>(sqlite3_changes(db_));
    spdlog::debug("Cleared {} cached segments for mount {}", removed, mount_id);
    return removed;
}

SegmentCacheStats SegmentCacheService::stats() noexcept {
    auto lock = std::unique_lock(mutex_);
    SegmentCacheStats out;
    auto stmt = prepare(db_,
        "SELECT COUNT(*), COALESCE(SUM(size), 0), COUNT(DISTINCT mount_id) FROM segment_cache;");
    if (stmt && sqlite3_step(stmt.get()) == SQLITE_ROW) {
        out.total_segments = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 0));
        out.total_size_bytes = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 1));
        out.mount_count = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 2));
    }
    return out;
}

std::vector<std::uint32_t> SegmentCacheService::critical_segments(std::uint32_t total_segments) {
    std::vector<std::uint32_t> indices;
    if (total_segments == 0) return indices;

    indices.push_back(0);
    for (std::uint32_t i = 1; i <= core::TAIL_SEGMENTS_COUNT; ++i) {
        if (total_segments > i) {
            indices.push_back(total_segments - i);
        }
    }
    return indices;
}

CriticalPrefetchResult SegmentCacheService::prefetch_critical_segments(std::string_view mount_id,
                                                                       std::uint32_t file_index,
                                                                       const nzb::NzbFile& file,
                                                                       nntp::ArticleSource& source) noexcept {
    CriticalPrefetchResult result;
    try {
        result.segments = critical_segments(static_cast<std::uint32_t>(file.segments.size()));
    } catch (const std::bad_alloc&) {
        return result;
    }

    if (result.segments.empty()) {
        spdlog::warn("No segments to prefetch for mount {} file {}", mount_id, file_index);
        return result;
    }

    spdlog::info("Prefetching {} critical segments of {} ({} total)", result.segments.size(), file.name,
                 file.segments.size());

    std::string group = file.groups.empty() ? std::string{} : file.groups.front();
    for (auto index : result.segments) {
        if (is_segment_cached(mount_id, file_index, index)) {
            spdlog::debug("Segment {} of {} already cached", index, file.name);
            ++result.succeeded;
            continue;
        }

        auto article = source.fetch_decoded(file.segments[index].message_id, group);
        if (!article) {
            spdlog::warn("Failed to prefetch segment {} of {}: {}", index, file.name, article.error().message());
            ++result.failed;
            continue;
        }

        if (cache_segment(mount_id, file_index, index, (*article)->data)) {
            ++result.failed;
            continue;
        }
        ++result.succeeded;
    }

    spdlog::info("Critical prefetch of {} complete: {} ok, {} failed", file.name, result.succeeded, result.failed);
    return result;
}

} // namespace nzbstream::stream
