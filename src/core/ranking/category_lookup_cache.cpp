#include "core/ranking/category_lookup_cache.h"
#include "core/taxonomy/category_tree.h"

namespace gr {

QSet<QString> CategoryLookupCache::lookup(const QString& item, const CategoryTree& tree)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto it = m_entries.constFind(item);
        if (it != m_entries.constEnd()) {
            ++m_hits;
            return it.value();
        }
        ++m_misses;
    }

    // Resolve outside the lock; the tree index has its own guard.
    const QSet<QString> categories = tree.categoryIndex().value(item);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.insert(item, categories);
    return categories;
}

void CategoryLookupCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

CategoryLookupCache::Stats CategoryLookupCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_hits, m_misses, static_cast<int>(m_entries.size())};
}

} // namespace gr
