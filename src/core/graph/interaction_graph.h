#pragma once

#include "core/shared/types.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace gr {

class Vertex {
public:
    Vertex(QString id, VertexKind kind);

    const QString& id() const { return m_id; }
    VertexKind kind() const { return m_kind; }

    // Neighbour vertex -> edge weight. Iteration order is unspecified.
    const std::unordered_map<const Vertex*, double>& neighbours() const { return m_neighbours; }
    std::optional<double> weightTo(const Vertex* other) const;
    int degree() const { return static_cast<int>(m_neighbours.size()); }

private:
    friend class InteractionGraph;

    void setNeighbour(const Vertex* neighbour, double weight);

    QString m_id;
    VertexKind m_kind;
    std::unordered_map<const Vertex*, double> m_neighbours;
};

// Bipartite weighted graph of users and items. Built once, then read-only:
// const member functions are safe to call from concurrent queries.
class InteractionGraph {
public:
    InteractionGraph() = default;
    InteractionGraph(const InteractionGraph&) = delete;
    InteractionGraph& operator=(const InteractionGraph&) = delete;
    InteractionGraph(InteractionGraph&&) = default;
    InteractionGraph& operator=(InteractionGraph&&) = default;

    // Idempotent. Returns true if the vertex was created; an existing id keeps
    // its first kind.
    bool addVertex(const QString& id, VertexKind kind);

    // Sets the weight in both directions, replacing any previous weight for
    // the pair. No-op (returns false) when either id is unknown, both
    // endpoints share a kind, or the weight is negative or not finite.
    bool addEdge(const QString& id1, const QString& id2, double weight);

    std::vector<const Vertex*> neighborsOfKind(const QString& id, VertexKind kind) const;
    std::optional<double> edgeWeight(const QString& id1, const QString& id2) const;

    const Vertex* vertex(const QString& id) const;
    bool contains(const QString& id) const { return vertex(id) != nullptr; }

    int vertexCount() const { return static_cast<int>(m_vertices.size()); }
    int vertexCount(VertexKind kind) const;
    int edgeCount() const;
    QStringList vertexIds(VertexKind kind) const;

    void clear();

private:
    Vertex* mutableVertex(const QString& id);

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };
    std::unordered_map<QString, std::unique_ptr<Vertex>, QStringHash> m_vertices;
};

} // namespace gr
