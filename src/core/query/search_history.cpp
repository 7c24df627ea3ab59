#include "core/query/search_history.h"

#include <algorithm>

namespace gr {

SearchHistory::SearchHistory(int limit)
    : m_limit(std::max(limit, 0))
{
}

bool SearchHistory::record(const QString& query)
{
    const QString trimmed = query.trimmed();
    if (trimmed.isEmpty() || m_limit == 0 || m_entries.contains(trimmed)) {
        return false;
    }

    m_entries.append(trimmed);
    while (m_entries.size() > m_limit) {
        m_entries.removeFirst();
    }
    return true;
}

} // namespace gr
