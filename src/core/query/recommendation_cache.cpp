#include "core/query/recommendation_cache.h"

namespace gr {

size_t qHash(const RecommendationRequest& request, size_t seed)
{
    return qHashMulti(seed, request.likedItem, request.topK, request.boostFactor);
}

RecommendationCache::RecommendationCache(int maxEntries)
    : m_maxEntries(maxEntries)
{
}

std::optional<RecommendationResult> RecommendationCache::get(const RecommendationRequest& request)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(request);
    if (it == m_entries.end()) {
        ++m_misses;
        return std::nullopt;
    }

    it->lastUsed = ++m_useCounter;
    ++m_hits;
    return it->result;
}

void RecommendationCache::put(const RecommendationRequest& request,
                              const RecommendationResult& result)
{
    if (m_maxEntries <= 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_entries.contains(request)) {
        while (m_entries.size() >= m_maxEntries) {
            evictLeastRecentlyUsed();
        }
    }
    m_entries.insert(request, Entry{result, ++m_useCounter});
}

// Linear scan; capacity is a few dozen entries.
void RecommendationCache::evictLeastRecentlyUsed()
{
    auto oldest = m_entries.begin();
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (it->lastUsed < oldest->lastUsed) {
            oldest = it;
        }
    }
    if (oldest != m_entries.end()) {
        m_entries.erase(oldest);
        ++m_evictions;
    }
}

void RecommendationCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

RecommendationCache::Stats RecommendationCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_hits, m_misses, m_evictions, static_cast<int>(m_entries.size())};
}

} // namespace gr
