#pragma once

#include "pool_sources.hpp"
#include "scheduler.hpp"
#include "settings.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Resolves a token mint to its SOL-paired pool. Sources are tried in order;
// the first hit wins and is cached for the configured TTL.
class PoolLocator {
public:
    PoolLocator(std::vector<std::shared_ptr<PoolSource>> sources,
                std::shared_ptr<Scheduler> clock,
                LocatorSettings settings = {});

    // Throws PoolNotFoundError naming every tier tried.
    PoolRecord resolve(const std::string& token_mint);

    std::optional<PoolRecord> cached(const std::string& token_mint) const;
    void invalidate(const std::string& token_mint);
    void clear_expired();
    size_t cache_size() const;

private:
    struct CacheEntry {
        PoolRecord record;
        Scheduler::TimePoint cached_at;
    };

    bool is_expired(const CacheEntry& entry) const;

    std::vector<std::shared_ptr<PoolSource>> sources_;
    std::shared_ptr<Scheduler> clock_;
    LocatorSettings settings_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> cache_;
};
