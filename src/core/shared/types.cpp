#include "core/shared/types.h"

namespace gr {

QString vertexKindToString(VertexKind kind)
{
    switch (kind) {
    case VertexKind::User: return QStringLiteral("user");
    case VertexKind::Item: return QStringLiteral("item");
    }
    return QStringLiteral("unknown");
}

std::optional<VertexKind> vertexKindFromString(const QString& str)
{
    if (str == QLatin1String("user")) return VertexKind::User;
    if (str == QLatin1String("item") || str == QLatin1String("game")) return VertexKind::Item;
    return std::nullopt;
}

} // namespace gr
