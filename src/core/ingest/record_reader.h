#pragma once

#include "core/shared/types.h"

#include <QByteArray>
#include <QHash>
#include <QString>

#include <optional>
#include <vector>

class QIODevice;

namespace gr {

struct RecordReadResult {
    std::vector<InteractionRecord> records;
    int linesRead = 0;
    int linesSkipped = 0;
};

// Reads the loader's normalized record stream: one JSON object per line with
// user_id, item_name, playtime_forever (alias playtime), and optional
// recommend / review. Malformed lines are skipped individually.
class RecordReader {
public:
    // Returns nullopt if the line is not a valid record; error receives the
    // reason when provided.
    static std::optional<InteractionRecord> parseLine(const QByteArray& line,
                                                      QString* error = nullptr);

    static RecordReadResult read(QIODevice& device);

    // Returns nullopt only when the file cannot be opened.
    static std::optional<RecordReadResult> readFile(const QString& filePath);
};

// Population mean and standard deviation (divide by N) of playtime per item.
// Must run over the full record set before any weight is assigned.
QHash<QString, ItemStats> computePlaytimeStats(const std::vector<InteractionRecord>& records);

} // namespace gr
