#pragma once

#include "core/shared/types.h"

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace gr {

class CategoryTree;

struct CatalogReadResult {
    std::vector<CatalogEntry> entries;
    int entriesSkipped = 0;
};

// Reads the classifier's catalog: a JSON array of {item_name, genre}
// objects. "categories" is accepted in place of "genre", and the category
// value may be an array of strings or one comma-separated string.
class CatalogReader {
public:
    // Returns nullopt when the document is not a JSON array.
    static std::optional<CatalogReadResult> parse(const QByteArray& json);
    static std::optional<CatalogReadResult> readFile(const QString& filePath);

    static std::optional<CatalogEntry> parseEntry(const QJsonObject& obj);

    // Classifier sentinels ("Unknown", "Error") and blanks yield no categories.
    static QStringList parseCategories(const QJsonValue& value);

    // Inserts [category, item] for every category of every entry, and
    // [item] for entries without categories. Returns the number of paths
    // inserted.
    static int buildTree(const std::vector<CatalogEntry>& entries, CategoryTree& tree);
};

} // namespace gr
