#pragma once

/// @file lookup_cache.hpp
/// @brief Sharded, bounded LRU memo keyed by rounded coordinates.

#include "core/types.hpp"
#include "geo/coordinate.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace meridian::resolver
{
    /// @brief Coordinate rounded to kDecimals places, stored as scaled integers.
    struct CoordinateKey
    {
        static constexpr i32 kDecimals = 3;     // ~111 m at the equator
        static constexpr f64 kScale = 1000.0;

        i32 lat_scaled;
        i32 lon_scaled;

        [[nodiscard]] static CoordinateKey from(const geo::Coordinate& coordinate);

        /// @brief The rounded coordinate this key stands for (always in range).
        [[nodiscard]] geo::Coordinate coordinate() const;

        bool operator==(const CoordinateKey&) const = default;
    };

    struct CoordinateKeyHash
    {
        std::size_t operator()(const CoordinateKey& key) const noexcept
        {
            const u64 packed = (static_cast<u64>(static_cast<u32>(key.lat_scaled)) << 32) |
                               static_cast<u32>(key.lon_scaled);
            // splitmix64 finaliser
            u64 z = packed + 0x9e3779b97f4a7c15ULL;
            z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
            z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
            return static_cast<std::size_t>(z ^ (z >> 31));
        }
    };

    /// @brief Snapshot of cache counters.
    struct CacheStats
    {
        u64 hits = 0;
        u64 misses = 0;
        u64 evictions = 0;
        std::size_t size = 0;
        std::size_t capacity = 0;

        [[nodiscard]] f64 hit_rate() const
        {
            const u64 lookups = hits + misses;
            return lookups == 0 ? 0.0 : static_cast<f64>(hits) / static_cast<f64>(lookups);
        }
    };

    /// @brief Thread-safe LRU cache split into independently locked shards.
    ///
    /// A key always maps to the same shard; each shard runs its own LRU list and
    /// holds at most its share of the total capacity. The compute function of
    /// get_or_compute() runs with no lock held, so two threads missing on the
    /// same key may both compute it; the first insertion wins and both callers
    /// get that value.
    template <typename Value>
    class LookupCache
    {
    public:
        static constexpr std::size_t kDefaultShards = 16;

        /// @param capacity Total entry budget. 0 disables storage (every call computes).
        /// @param shard_count Number of shards (at least 1).
        explicit LookupCache(std::size_t capacity, std::size_t shard_count = kDefaultShards)
            : m_capacity{capacity}
        {
            shard_count = std::max<std::size_t>(shard_count, 1);
            m_shards.reserve(shard_count);
            for (std::size_t i = 0; i < shard_count; ++i)
            {
                auto shard = std::make_unique<Shard>();
                shard->capacity = capacity / shard_count + (i < capacity % shard_count ? 1 : 0);
                m_shards.push_back(std::move(shard));
            }
        }

        LookupCache(const LookupCache&) = delete;
        LookupCache& operator=(const LookupCache&) = delete;

        /// @brief Cached value for key, computing and inserting it on a miss.
        template <typename Compute>
        [[nodiscard]] Value get_or_compute(const CoordinateKey& key, Compute&& compute)
        {
            Shard& shard = shard_for(key);

            {
                std::lock_guard lock(shard.mutex);
                if (auto it = shard.index.find(key); it != shard.index.end())
                {
                    shard.entries.splice(shard.entries.begin(), shard.entries, it->second);
                    m_hits.fetch_add(1, std::memory_order_relaxed);
                    return it->second->second;
                }
            }

            m_misses.fetch_add(1, std::memory_order_relaxed);
            Value value = std::forward<Compute>(compute)();

            std::lock_guard lock(shard.mutex);
            if (shard.capacity == 0)
            {
                return value;
            }
            if (auto it = shard.index.find(key); it != shard.index.end())
            {
                // Another thread filled it while we computed
                shard.entries.splice(shard.entries.begin(), shard.entries, it->second);
                return it->second->second;
            }

            shard.entries.emplace_front(key, value);
            shard.index.emplace(key, shard.entries.begin());
            if (shard.entries.size() > shard.capacity)
            {
                shard.index.erase(shard.entries.back().first);
                shard.entries.pop_back();
                m_evictions.fetch_add(1, std::memory_order_relaxed);
            }
            return value;
        }

        /// @brief Whether key is currently cached (does not touch recency).
        [[nodiscard]] bool contains(const CoordinateKey& key) const
        {
            const Shard& shard = shard_for(key);
            std::lock_guard lock(shard.mutex);
            return shard.index.contains(key);
        }

        void clear()
        {
            for (auto& shard : m_shards)
            {
                std::lock_guard lock(shard->mutex);
                shard->entries.clear();
                shard->index.clear();
            }
        }

        [[nodiscard]] std::size_t size() const
        {
            std::size_t total = 0;
            for (const auto& shard : m_shards)
            {
                std::lock_guard lock(shard->mutex);
                total += shard->entries.size();
            }
            return total;
        }

        [[nodiscard]] CacheStats stats() const
        {
            return CacheStats{
                .hits      = m_hits.load(std::memory_order_relaxed),
                .misses    = m_misses.load(std::memory_order_relaxed),
                .evictions = m_evictions.load(std::memory_order_relaxed),
                .size      = size(),
                .capacity  = m_capacity,
            };
        }

        [[nodiscard]] std::size_t capacity() const { return m_capacity; }
        [[nodiscard]] std::size_t shard_count() const { return m_shards.size(); }

    private:
        using Entry = std::pair<CoordinateKey, Value>;

        struct Shard
        {
            mutable std::mutex mutex;
            std::list<Entry> entries;   // front = most recently used
            std::unordered_map<CoordinateKey, typename std::list<Entry>::iterator, CoordinateKeyHash> index;
            std::size_t capacity = 0;
        };

        Shard& shard_for(const CoordinateKey& key)
        {
            return *m_shards[CoordinateKeyHash{}(key) % m_shards.size()];
        }

        const Shard& shard_for(const CoordinateKey& key) const
        {
            return *m_shards[CoordinateKeyHash{}(key) % m_shards.size()];
        }

        std::vector<std::unique_ptr<Shard>> m_shards;
        std::size_t m_capacity;
        std::atomic<u64> m_hits{0};
        std::atomic<u64> m_misses{0};
        std::atomic<u64> m_evictions{0};
    };

} // namespace meridian::resolver
