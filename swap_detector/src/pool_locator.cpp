#include "pool_locator.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PoolLocator::PoolLocator(std::vector<std::shared_ptr<PoolSource>> sources,
                         std::shared_ptr<Scheduler> clock,
                         LocatorSettings settings)
    : sources_(std::move(sources))
    , clock_(clock)
    , settings_(settings)
{}

bool PoolLocator::is_expired(const CacheEntry& entry) const {
    return clock_->now() - entry.cached_at >= settings_.cache_ttl;
}

PoolRecord PoolLocator::resolve(const std::string& token_mint) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(token_mint);
        if (it != cache_.end()) {
            if (!is_expired(it->second)) {
                spdlog::debug("Pool cache hit for {}", util::short_addr(token_mint));
                return it->second.record;
            }
            cache_.erase(it);
        }
    }

    std::vector<std::string> attempted;

    // Network calls happen outside the lock
    for (const auto& source : sources_) {
        attempted.push_back(source->name());
        try {
            auto record = source->lookup(token_mint);
            if (!record) {
                spdlog::debug("{}: no pool for {}", source->name(), util::short_addr(token_mint));
                continue;
            }

            spdlog::info("Resolved pool {} for {} via {}",
                         util::short_addr(record->pool_address),
                         util::short_addr(token_mint), source->name());

            std::lock_guard<std::mutex> lock(mutex_);
            cache_[token_mint] = CacheEntry{*record, clock_->now()};
            return *record;

        } catch (const std::exception& e) {
            spdlog::warn("{} lookup failed for {}: {}", source->name(),
                         util::short_addr(token_mint), e.what());
        }
    }

    throw PoolNotFoundError(token_mint, attempted);
}

std::optional<PoolRecord> PoolLocator::cached(const std::string& token_mint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(token_mint);
    if (it == cache_.end() || is_expired(it->second)) {
        return std::nullopt;
    }
    return it->second.record;
}

void PoolLocator::invalidate(const std::string& token_mint) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(token_mint);
}

void PoolLocator::clear_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (is_expired(it->second)) {
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t PoolLocator::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}
