#include "core/ingest/catalog_reader.h"
#include "core/taxonomy/category_tree.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace gr {

namespace {

bool isSentinelCategory(const QString& category)
{
    return category.compare(QLatin1String("Unknown"), Qt::CaseInsensitive) == 0
        || category.compare(QLatin1String("Error"), Qt::CaseInsensitive) == 0;
}

void appendCategory(QStringList& out, const QString& raw)
{
    const QString category = raw.trimmed();
    if (category.isEmpty() || isSentinelCategory(category) || out.contains(category)) {
        return;
    }
    out.append(category);
}

} // anonymous namespace

QStringList CatalogReader::parseCategories(const QJsonValue& value)
{
    QStringList categories;
    if (value.isArray()) {
        const QJsonArray array = value.toArray();
        for (const QJsonValue& element : array) {
            if (element.isString()) {
                appendCategory(categories, element.toString());
            }
        }
    } else if (value.isString()) {
        const QStringList parts = value.toString().split(QLatin1Char(','), Qt::SkipEmptyParts);
        for (const QString& part : parts) {
            appendCategory(categories, part);
        }
    }
    return categories;
}

std::optional<CatalogEntry> CatalogReader::parseEntry(const QJsonObject& obj)
{
    const QJsonValue name = obj.value(QStringLiteral("item_name"));
    if (!name.isString() || name.toString().trimmed().isEmpty()) {
        return std::nullopt;
    }

    CatalogEntry entry;
    entry.itemName = name.toString();

    QJsonValue categories = obj.value(QStringLiteral("genre"));
    if (categories.isUndefined()) {
        categories = obj.value(QStringLiteral("categories"));
    }
    entry.categories = parseCategories(categories);
    return entry;
}

std::optional<CatalogReadResult> CatalogReader::parse(const QByteArray& json)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_ERROR(grIngest, "Failed to parse catalog JSON: %s",
                  qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isArray()) {
        LOG_ERROR(grIngest, "Catalog document is not a JSON array");
        return std::nullopt;
    }

    CatalogReadResult result;
    const QJsonArray array = doc.array();
    result.entries.reserve(static_cast<size_t>(array.size()));
    for (qsizetype i = 0; i < array.size(); ++i) {
        const QJsonValue element = array.at(i);
        std::optional<CatalogEntry> entry;
        if (element.isObject()) {
            entry = parseEntry(element.toObject());
        }
        if (!entry.has_value()) {
            LOG_WARN(grIngest, "Skipping catalog entry %lld: missing item_name",
                     static_cast<long long>(i));
            ++result.entriesSkipped;
            continue;
        }
        result.entries.push_back(std::move(*entry));
    }

    LOG_INFO(grIngest, "Read %zu catalog entries (%d skipped)",
             result.entries.size(), result.entriesSkipped);
    return result;
}

std::optional<CatalogReadResult> CatalogReader::readFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR(grIngest, "Failed to open catalog file: %s (%s)",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return std::nullopt;
    }
    return parse(file.readAll());
}

int CatalogReader::buildTree(const std::vector<CatalogEntry>& entries, CategoryTree& tree)
{
    int inserted = 0;
    int uncategorized = 0;
    for (const CatalogEntry& entry : entries) {
        if (entry.categories.isEmpty()) {
            if (tree.insertPath({entry.itemName})) {
                ++inserted;
                ++uncategorized;
            }
            continue;
        }
        for (const QString& category : entry.categories) {
            if (tree.insertPath({category, entry.itemName})) {
                ++inserted;
            }
        }
    }

    LOG_INFO(grTaxonomy, "Inserted %d catalog paths (%d uncategorized items)",
             inserted, uncategorized);
    return inserted;
}

} // namespace gr
