// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/config.hpp>
#include <nzbstream/core/error.hpp>
#include <nzbstream/nntp/connection.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace nzbstream::nntp {

enum class BreakerState : std::uint8_t {
    closed,     // Healthy
    open,       // Backing off, no requests
    half_open,  // Cooldown over, one probe allowed
};

[[nodiscard]] std::string_view to_string(BreakerState state) noexcept;

// Per-provider circuit breaker with exponential backoff. Not synchronized.
class ProviderHealth {
public:
    using Clock = std::chrono::steady_clock;

    ProviderHealth(std::uint32_t failure_threshold,
                   std::chrono::milliseconds backoff_base,
                   std::chrono::milliseconds backoff_max) noexcept;

    // Whether a request may be sent now. In half-open state the first caller
    // takes the probe slot and later callers are refused until it reports.
    [[nodiscard]] bool allow_request(Clock::time_point now) noexcept;

    // State without taking the probe slot
    [[nodiscard]] BreakerState state(Clock::time_point now) const noexcept;

    void record_success() noexcept;
    void record_failure(Clock::time_point now) noexcept;

    // Give the probe slot back without a verdict
    void release_probe() noexcept { probe_in_flight_ = false; }

    [[nodiscard]] std::uint32_t consecutive_failures() const noexcept { return consecutive_failures_; }
    [[nodiscard]] Clock::time_point backoff_until() const noexcept { return backoff_until_; }

    // Backoff for the current failure count
    [[nodiscard]] std::chrono::milliseconds backoff() const noexcept;

private:
    std::uint32_t failure_threshold_;
    std::chrono::milliseconds backoff_base_;
    std::chrono::milliseconds backoff_max_;

    std::uint32_t consecutive_failures_{0};
    Clock::time_point backoff_until_{};
    bool probe_in_flight_{false};
};

struct PoolOptions {
    std::uint32_t failure_threshold{core::FAILURE_THRESHOLD};
    std::chrono::milliseconds backoff_base{core::BACKOFF_BASE_MS};
    std::chrono::milliseconds backoff_max{core::BACKOFF_MAX_MS};
};

struct PoolStats {
    std::string provider;
    std::uint32_t priority{0};
    bool enabled{true};
    std::uint32_t max_connections{0};
    std::uint32_t open{0};
    std::uint32_t idle{0};
    std::uint32_t in_use{0};
    std::uint32_t waiting{0};
    std::uint32_t consecutive_failures{0};
    BreakerState state{BreakerState::closed};
    std::uint64_t requests{0};
    std::uint64_t failures{0};
};

// Bounded set of sessions to one provider
class NntpPool {
public:
    // Exclusive loan of one session; returned to the pool on destruction
    class Lease {
    public:
        Lease() = default;
        ~Lease();

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        [[nodiscard]] NntpSession* operator->() const noexcept { return session_.get(); }
        [[nodiscard]] NntpSession& operator*() const noexcept { return *session_; }
        [[nodiscard]] explicit operator bool() const noexcept { return session_ != nullptr; }

        // Drop the session instead of returning it
        void discard() noexcept;

    private:
        friend class NntpPool;
        Lease(NntpPool* pool, std::unique_ptr<NntpSession> session, std::uint64_t generation) noexcept;

        void give_back(bool reusable) noexcept;

        NntpPool* pool_{nullptr};
        std::unique_ptr<NntpSession> session_;
        std::uint64_t generation_{0};
    };

    NntpPool(core::ProviderConfig config, SessionFactory factory, PoolOptions options = {});
    ~NntpPool();

    NntpPool(const NntpPool&) = delete;
    NntpPool& operator=(const NntpPool&) = delete;

    // Borrow a session, opening one lazily below the ceiling, otherwise
    // waiting up to timeout. Connect failures are recorded as health failures.
    [[nodiscard]] std::expected<Lease, std::error_code>
    acquire(std::chrono::milliseconds timeout) noexcept;

    // Outcome of a request made with a lease
    void record_success() noexcept;
    void record_failure() noexcept;

    // Enabled and not backing off
    [[nodiscard]] bool available() const noexcept;

    [[nodiscard]] PoolStats stats() const;

    // Close idle sessions unused for at least max_idle; returns how many
    std::size_t idle_disconnect(std::chrono::seconds max_idle) noexcept;

    // Apply a partial provider update; connection settings drain idle sessions
    void reconfigure(const core::ProviderConfigPatch& patch) noexcept;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::uint32_t priority() const noexcept;
    [[nodiscard]] core::ProviderConfig config() const;

    void shutdown() noexcept;

private:
    using Clock = std::chrono::steady_clock;

    struct IdleSession {
        std::unique_ptr<NntpSession> session;
        Clock::time_point since;
    };

    void release(std::unique_ptr<NntpSession> session, std::uint64_t generation, bool reusable) noexcept;

    const std::string name_;
    core::ProviderConfig config_;
    SessionFactory factory_;
    ProviderHealth health_;

    std::deque<IdleSession> idle_;
    std::uint32_t open_{0};         // Idle + lent + connecting
    std::uint32_t waiting_{0};
    std::uint64_t generation_{0};   // Bumped when connection settings change
    std::uint64_t requests_{0};
    std::uint64_t failures_{0};
    bool shutdown_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace nzbstream::nntp
