#pragma once

#include <QString>
#include <QStringList>

namespace gr {

// Distinct liked-item queries of a session, oldest first. A repeated query
// keeps its original position; past the limit the oldest entries drop.
class SearchHistory {
public:
    explicit SearchHistory(int limit = 10);

    // Returns true if query was added.
    bool record(const QString& query);

    const QStringList& entries() const { return m_entries; }
    bool contains(const QString& query) const { return m_entries.contains(query); }
    int size() const { return static_cast<int>(m_entries.size()); }
    int limit() const { return m_limit; }
    void clear() { m_entries.clear(); }

private:
    int m_limit = 10;
    QStringList m_entries;
};

} // namespace gr
