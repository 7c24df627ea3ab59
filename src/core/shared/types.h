#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>

namespace gr {

// Vertex kinds of the bipartite interaction graph
enum class VertexKind {
    User,
    Item,
};

QString vertexKindToString(VertexKind kind);
std::optional<VertexKind> vertexKindFromString(const QString& str);

// One normalized user-item interaction from the record stream
struct InteractionRecord {
    QString userId;
    QString itemName;
    int64_t playtime = 0;
    std::optional<bool> recommend;
    std::optional<QString> review;
};

// Population playtime statistics for one item
struct ItemStats {
    double meanPlaytime = 0.0;
    double stdPlaytime = 0.0;
    int sampleCount = 0;
};

// One classified item from the category catalog
struct CatalogEntry {
    QString itemName;
    QStringList categories;
};

} // namespace gr
