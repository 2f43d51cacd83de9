// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/nntp/pool.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

namespace nzbstream::nntp {

using core::StreamErrc;
using core::make_error_code;

std::string_view to_string(BreakerState state) noexcept {
    switch (state) {
        case BreakerState::closed:    return "closed";
        case BreakerState::open:      return "open";
        case BreakerState::half_open: return "half_open";
    }
    return "unknown";
}

//=============================================================================
// ProviderHealth
//=============================================================================

ProviderHealth::ProviderHealth(std::uint32_t failure_threshold,
                               std::chrono::milliseconds backoff_base,
                               std::chrono::milliseconds backoff_max) noexcept
    : failure_threshold_(std::max<std::uint32_t>(failure_threshold, 1))
    , backoff_base_(backoff_base)
    , backoff_max_(backoff_max) {}

std::chrono::milliseconds ProviderHealth::backoff() const noexcept {
    if (consecutive_failures_ < failure_threshold_) return std::chrono::milliseconds{0};

    auto exponent = std::min<std::uint32_t>(consecutive_failures_ - failure_threshold_, 30);
    auto delay = backoff_base_;
    for (std::uint32_t i = 0; i < exponent && delay < backoff_max_; ++i) {
        delay *= 2;
    }
    return std::min(delay, backoff_max_);
}

BreakerState ProviderHealth::state(Clock::time_point now) const noexcept {
    if (consecutive_failures_ < failure_threshold_) return BreakerState::closed;
    if (now < backoff_until_) return BreakerState::open;
    return BreakerState::half_open;
}

bool ProviderHealth::allow_request(Clock::time_point now) noexcept {
    switch (state(now)) {
        case BreakerState::closed:
            return true;
        case BreakerState::open:
            return false;
        case BreakerState::half_open:
            if (probe_in_flight_) return false;
            probe_in_flight_ = true;
            return true;
    }
    return false;
}

void ProviderHealth::record_success() noexcept {
    consecutive_failures_ = 0;
    backoff_until_ = {};
    probe_in_flight_ = false;
}

void ProviderHealth::record_failure(Clock::time_point now) noexcept {
    ++consecutive_failures_;
    probe_in_flight_ = false;
    if (consecutive_failures_ >= failure_threshold_) {
        backoff_until_ = now + backoff();
    }
}

//=============================================================================
// NntpPool::Lease
//=============================================================================

NntpPool::Lease::Lease(NntpPool* pool, std::unique_ptr<NntpSession> session, std::uint64_t generation) noexcept
    : pool_(pool)
    , session_(std::move(session))
    , generation_(generation) {}

NntpPool::Lease::~Lease() {
    give_back(true);
}

NntpPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_)
    , session_(std::move(other.session_))
    , generation_(other.generation_) {
    other.pool_ = nullptr;
}

NntpPool::Lease& NntpPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        give_back(true);
        pool_ = other.pool_;
        session_ = std::move(other.session_);
        generation_ = other.generation_;
        other.pool_ = nullptr;
    }
    return *this;
}

void NntpPool::Lease::discard() noexcept {
    give_back(false);
}

void NntpPool::Lease::give_back(bool reusable) noexcept {
    if (pool_ && session_) {
        bool healthy = session_->healthy();
        pool_->release(std::move(session_), generation_, reusable && healthy);
    }
    pool_ = nullptr;
}

//=============================================================================
// NntpPool
//=============================================================================

NntpPool::NntpPool(core::ProviderConfig config, SessionFactory factory, PoolOptions options)
    : name_(config.name)
    , config_(std::move(config))
    , factory_(std::move(factory))
    , health_(options.failure_threshold, options.backoff_base, options.backoff_max) {}

NntpPool::~NntpPool() {
    shutdown();
}

std::expected<NntpPool::Lease, std::error_code>
NntpPool::acquire(std::chrono::milliseconds timeout) noexcept {
    auto lock = std::unique_lock(mutex_);

    if (shutdown_) return std::unexpected(make_error_code(StreamErrc::cancelled));
    if (!config_.enabled || !health_.allow_request(Clock::now())) {
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }

    auto deadline = Clock::now() + timeout;
    std::vector<std::unique_ptr<NntpSession>> stale;
    ++waiting_;

    while (true) {
        if (shutdown_) {
            --waiting_;
            health_.release_probe();
            return std::unexpected(make_error_code(StreamErrc::cancelled));
        }

        while (!idle_.empty()) {
            auto entry = std::move(idle_.front());
            idle_.pop_front();
            if (entry.session && entry.session->healthy()) {
                --waiting_;
                ++requests_;
                auto gen = generation_;
                lock.unlock();
                stale.clear();
                return Lease(this, std::move(entry.session), gen);
            }
            --open_;
            stale.push_back(std::move(entry.session));
        }

        if (open_ < config_.max_connections) {
            ++open_;
            --waiting_;
            ++requests_;
            auto gen = generation_;
            auto cfg = config_;
            lock.unlock();
            stale.clear();

            std::unique_ptr<NntpSession> session;
            std::error_code ec;
            try {
                session = factory_(cfg);
            } catch (const std::exception& e) {
                spdlog::error("Creating session for {} failed: {}", name_, e.what());
            }
            ec = session ? session->connect() : make_error_code(StreamErrc::connection_failed);

            if (ec) {
                session.reset();
                lock.lock();
                --open_;
                ++failures_;
                health_.record_failure(Clock::now());
                auto failures = health_.consecutive_failures();
                auto backoff = health_.backoff();
                lock.unlock();
                cv_.notify_one();
                spdlog::warn("Provider {} connect failed: {} ({} consecutive{})", name_, ec.message(),
                             failures, backoff.count() > 0
                                 ? ", backing off " + std::to_string(backoff.count()) + "ms"
                                 : std::string{});
                return std::unexpected(ec);
            }
            return Lease(this, std::move(session), gen);
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            idle_.empty() && open_ >= config_.max_connections) {
            --waiting_;
            health_.release_probe();
            spdlog::debug("Provider {} saturated: no connection within {}ms", name_, timeout.count());
            lock.unlock();
            return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
        }
    }
}

void NntpPool::release(std::unique_ptr<NntpSession> session, std::uint64_t generation, bool reusable) noexcept {
    {
        auto lock = std::unique_lock(mutex_);
        if (reusable && !shutdown_ && generation == generation_ && open_ <= config_.max_connections) {
            idle_.push_back({std::move(session), Clock::now()});
        } else {
            --open_;
        }
    }
    cv_.notify_one();

    // Closing may write QUIT; never under the lock
    session.reset();
}

void NntpPool::record_success() noexcept {
    auto lock = std::unique_lock(mutex_);
    bool recovered = health_.consecutive_failures() > 0;
    health_.record_success();
    lock.unlock();

    if (recovered) {
        spdlog::info("Provider {} healthy again", name_);
    }
}

void NntpPool::record_failure() noexcept {
    auto lock = std::unique_lock(mutex_);
    ++failures_;
    health_.record_failure(Clock::now());
    auto failures = health_.consecutive_failures();
    auto backoff = health_.backoff();
    lock.unlock();

    if (backoff.count() > 0) {
        spdlog::warn("Provider {} backing off for {}ms after {} consecutive failures",
                     name_, backoff.count(), failures);
    }
}

bool NntpPool::available() const noexcept {
    auto lock = std::unique_lock(mutex_);
    return !shutdown_ && config_.enabled && health_.state(Clock::now()) != BreakerState::open;
}

PoolStats NntpPool::stats() const {
    auto lock = std::unique_lock(mutex_);
    PoolStats s;
    s.provider = name_;
    s.priority = config_.priority;
    s.enabled = config_.enabled;
    s.max_connections = config_.max_connections;
    s.open = open_;
    s.idle = static_cast<std::uint32_t>(idle_.size());
    s.in_use = open_ - s.idle;
    s.waiting = waiting_;
    s.consecutive_failures = health_.consecutive_failures();
    s.state = health_.state(Clock::now());
    s.requests = requests_;
    s.failures = failures_;
    return s;
}

std::size_t NntpPool::idle_disconnect(std::chrono::seconds max_idle) noexcept {
    std::vector<std::unique_ptr<NntpSession>> expired;
    {
        auto lock = std::unique_lock(mutex_);
        auto cutoff = Clock::now() - max_idle;
        for (auto it = idle_.begin(); it != idle_.end();) {
            if (it->since <= cutoff) {
                expired.push_back(std::move(it->session));
                it = idle_.erase(it);
                --open_;
            } else {
                ++it;
            }
        }
    }
    if (!expired.empty()) {
        spdlog::debug("Provider {}: closing {} idle connections", name_, expired.size());
        cv_.notify_all();
    }
    return expired.size();
}

void NntpPool::reconfigure(const core::ProviderConfigPatch& patch) noexcept {
    std::vector<std::unique_ptr<NntpSession>> drained;
    {
        auto lock = std::unique_lock(mutex_);
        core::apply_patch(config_, patch);
        if (patch.affects_connections()) {
            ++generation_;
            for (auto& entry : idle_) {
                drained.push_back(std::move(entry.session));
            }
            open_ -= static_cast<std::uint32_t>(idle_.size());
            idle_.clear();
        }
        // A re-enabled or changed provider gets a clean slate
        if (patch.enabled || patch.affects_connections()) {
            health_.record_success();
        }
    }
    cv_.notify_all();
    spdlog::info("Provider {} reconfigured{}", name_,
                 drained.empty() ? std::string{} : ", drained " + std::to_string(drained.size()) + " connections");
}

std::uint32_t NntpPool::priority() const noexcept {
    auto lock = std::unique_lock(mutex_);
    return config_.priority;
}

core::ProviderConfig NntpPool::config() const {
    auto lock = std::unique_lock(mutex_);
    return config_;
}

void NntpPool::shutdown() noexcept {
    std::vector<std::unique_ptr<NntpSession>> closing;
    {
        auto lock = std::unique_lock(mutex_);
        if (shutdown_) return;
        shutdown_ = true;
        for (auto& entry : idle_) {
            closing.push_back(std::move(entry.session));
        }
        open_ -= static_cast<std::uint32_t>(idle_.size());
        idle_.clear();
    }
    cv_.notify_all();
}

} // namespace nzbstream::nntp
