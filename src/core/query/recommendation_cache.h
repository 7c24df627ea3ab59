#pragma once

#include "core/ranking/recommendation_result.h"

#include <QHash>
#include <QString>

#include <cstdint>
#include <mutex>
#include <optional>

namespace gr {

// Parameters that fully determine a recommendation over one loaded build.
struct RecommendationRequest {
    QString likedItem;
    int topK = 0;
    double boostFactor = 1.0;

    bool operator==(const RecommendationRequest& other) const
    {
        return likedItem == other.likedItem && topK == other.topK
            && boostFactor == other.boostFactor;
    }
    bool operator!=(const RecommendationRequest& other) const { return !(*this == other); }
};

size_t qHash(const RecommendationRequest& request, size_t seed = 0);

// Finished results of one loaded build, bounded by entry count with
// least-recently-used eviction. Results never expire; the owner clears the
// cache when the build is replaced. maxEntries <= 0 disables caching.
class RecommendationCache {
public:
    explicit RecommendationCache(int maxEntries = 64);

    std::optional<RecommendationResult> get(const RecommendationRequest& request);
    void put(const RecommendationRequest& request, const RecommendationResult& result);
    void clear();

    int maxEntries() const { return m_maxEntries; }

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        int currentSize = 0;
    };
    Stats stats() const;

private:
    struct Entry {
        RecommendationResult result;
        uint64_t lastUsed = 0;
    };

    void evictLeastRecentlyUsed();

    int m_maxEntries = 64;
    mutable std::mutex m_mutex;
    QHash<RecommendationRequest, Entry> m_entries;
    uint64_t m_useCounter = 0;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
};

} // namespace gr
