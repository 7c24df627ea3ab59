#pragma once

#include <QHash>
#include <QSet>
#include <QString>

#include <cstdint>
#include <mutex>

namespace gr {

class CategoryTree;

// Caller-owned memo of item -> categories used by one or more
// recommendation queries. Safe to share between concurrent queries.
class CategoryLookupCache {
public:
    CategoryLookupCache() = default;

    // Cached categories of item, filling from tree's index on a miss. Items
    // the tree does not know map to the empty set.
    QSet<QString> lookup(const QString& item, const CategoryTree& tree);

    void clear();

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        int currentSize = 0;
    };
    Stats stats() const;

private:
    mutable std::mutex m_mutex;
    QHash<QString, QSet<QString>> m_entries;
    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
};

} // namespace gr
