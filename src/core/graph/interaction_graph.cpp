#include "core/graph/interaction_graph.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace gr {

Vertex::Vertex(QString id, VertexKind kind)
    : m_id(std::move(id))
    , m_kind(kind)
{
}

std::optional<double> Vertex::weightTo(const Vertex* other) const
{
    const auto it = m_neighbours.find(other);
    if (it == m_neighbours.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Vertex::setNeighbour(const Vertex* neighbour, double weight)
{
    m_neighbours[neighbour] = weight;
}

bool InteractionGraph::addVertex(const QString& id, VertexKind kind)
{
    const auto it = m_vertices.find(id);
    if (it != m_vertices.end()) {
        if (it->second->kind() != kind) {
            LOG_WARN(grGraph, "addVertex: '%s' already exists as %s, ignoring %s",
                     qUtf8Printable(id),
                     qUtf8Printable(vertexKindToString(it->second->kind())),
                     qUtf8Printable(vertexKindToString(kind)));
        }
        return false;
    }

    m_vertices.emplace(id, std::make_unique<Vertex>(id, kind));
    return true;
}

Vertex* InteractionGraph::mutableVertex(const QString& id)
{
    const auto it = m_vertices.find(id);
    return it != m_vertices.end() ? it->second.get() : nullptr;
}

const Vertex* InteractionGraph::vertex(const QString& id) const
{
    const auto it = m_vertices.find(id);
    return it != m_vertices.end() ? it->second.get() : nullptr;
}

bool InteractionGraph::addEdge(const QString& id1, const QString& id2, double weight)
{
    Vertex* v1 = mutableVertex(id1);
    Vertex* v2 = mutableVertex(id2);
    if (v1 == nullptr || v2 == nullptr) {
        return false;
    }

    if (v1->kind() == v2->kind()) {
        LOG_WARN(grGraph, "addEdge: '%s' and '%s' are both %s vertices",
                 qUtf8Printable(id1), qUtf8Printable(id2),
                 qUtf8Printable(vertexKindToString(v1->kind())));
        return false;
    }

    if (!std::isfinite(weight) || weight < 0.0) {
        LOG_WARN(grGraph, "addEdge: rejecting weight %f for '%s' - '%s'",
                 weight, qUtf8Printable(id1), qUtf8Printable(id2));
        return false;
    }

    v1->setNeighbour(v2, weight);
    v2->setNeighbour(v1, weight);
    return true;
}

std::vector<const Vertex*> InteractionGraph::neighborsOfKind(const QString& id,
                                                            VertexKind kind) const
{
    std::vector<const Vertex*> result;
    const Vertex* v = vertex(id);
    if (v == nullptr) {
        return result;
    }

    result.reserve(v->neighbours().size());
    for (const auto& [neighbour, weight] : v->neighbours()) {
        Q_UNUSED(weight);
        if (neighbour->kind() == kind) {
            result.push_back(neighbour);
        }
    }
    return result;
}

std::optional<double> InteractionGraph::edgeWeight(const QString& id1, const QString& id2) const
{
    const Vertex* v1 = vertex(id1);
    const Vertex* v2 = vertex(id2);
    if (v1 == nullptr || v2 == nullptr) {
        return std::nullopt;
    }
    return v1->weightTo(v2);
}

int InteractionGraph::vertexCount(VertexKind kind) const
{
    return static_cast<int>(std::count_if(
        m_vertices.begin(), m_vertices.end(),
        [kind](const auto& entry) { return entry.second->kind() == kind; }));
}

int InteractionGraph::edgeCount() const
{
    // Every edge has exactly one user endpoint.
    int count = 0;
    for (const auto& [id, v] : m_vertices) {
        Q_UNUSED(id);
        if (v->kind() == VertexKind::User) {
            count += v->degree();
        }
    }
    return count;
}

QStringList InteractionGraph::vertexIds(VertexKind kind) const
{
    QStringList ids;
    for (const auto& [id, v] : m_vertices) {
        if (v->kind() == kind) {
            ids.append(id);
        }
    }
    ids.sort();
    return ids;
}

void InteractionGraph::clear()
{
    m_vertices.clear();
}

} // namespace gr
