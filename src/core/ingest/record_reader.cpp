#include "core/ingest/record_reader.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QIODevice>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

#include <cmath>
#include <limits>

namespace gr {

namespace {

bool setError(QString* error, const QString& message)
{
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

bool readRequiredString(const QJsonObject& obj, const QString& key, QString& out, QString* error)
{
    const QJsonValue value = obj.value(key);
    if (!value.isString()) {
        return setError(error, QStringLiteral("missing or non-string '%1'").arg(key));
    }
    out = value.toString();
    if (out.isEmpty()) {
        return setError(error, QStringLiteral("empty '%1'").arg(key));
    }
    return true;
}

bool readPlaytime(const QJsonObject& obj, int64_t& out, QString* error)
{
    QJsonValue value = obj.value(QStringLiteral("playtime_forever"));
    if (value.isUndefined()) {
        value = obj.value(QStringLiteral("playtime"));
    }
    if (value.isUndefined() || value.isNull()) {
        out = 0;
        return true;
    }
    if (!value.isDouble()) {
        return setError(error, QStringLiteral("non-numeric playtime"));
    }

    const double raw = value.toDouble();
    if (!std::isfinite(raw) || raw < 0.0 || std::floor(raw) != raw) {
        return setError(error, QStringLiteral("playtime %1 is not a non-negative integer").arg(raw));
    }
    // double(INT64_MAX) rounds up to 2^63, which no longer fits.
    if (raw >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return setError(error, QStringLiteral("playtime %1 is out of range").arg(raw));
    }
    out = static_cast<int64_t>(raw);
    return true;
}

} // anonymous namespace

std::optional<InteractionRecord> RecordReader::parseLine(const QByteArray& line, QString* error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(error, parseError.errorString());
        return std::nullopt;
    }
    if (!doc.isObject()) {
        setError(error, QStringLiteral("record is not a JSON object"));
        return std::nullopt;
    }

    const QJsonObject obj = doc.object();
    InteractionRecord record;

    if (!readRequiredString(obj, QStringLiteral("user_id"), record.userId, error)
        || !readRequiredString(obj, QStringLiteral("item_name"), record.itemName, error)
        || !readPlaytime(obj, record.playtime, error)) {
        return std::nullopt;
    }

    const QJsonValue recommend = obj.value(QStringLiteral("recommend"));
    if (recommend.isBool()) {
        record.recommend = recommend.toBool();
    } else if (!recommend.isUndefined() && !recommend.isNull()) {
        setError(error, QStringLiteral("non-boolean 'recommend'"));
        return std::nullopt;
    }

    const QJsonValue review = obj.value(QStringLiteral("review"));
    if (review.isString()) {
        record.review = review.toString();
    } else if (!review.isUndefined() && !review.isNull()) {
        setError(error, QStringLiteral("non-string 'review'"));
        return std::nullopt;
    }

    return record;
}

RecordReadResult RecordReader::read(QIODevice& device)
{
    RecordReadResult result;

    while (!device.atEnd()) {
        const QByteArray line = device.readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }
        ++result.linesRead;

        QString error;
        std::optional<InteractionRecord> record = parseLine(line, &error);
        if (!record.has_value()) {
            ++result.linesSkipped;
            LOG_WARN(grIngest, "Skipping record on line %d: %s",
                     result.linesRead, qUtf8Printable(error));
            continue;
        }
        result.records.push_back(std::move(*record));
    }

    LOG_INFO(grIngest, "Read %zu records (%d skipped)",
             result.records.size(), result.linesSkipped);
    return result;
}

std::optional<RecordReadResult> RecordReader::readFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_ERROR(grIngest, "Failed to open record file: %s (%s)",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return std::nullopt;
    }
    return read(file);
}

QHash<QString, ItemStats> computePlaytimeStats(const std::vector<InteractionRecord>& records)
{
    // Welford's running mean / sum of squared deviations.
    struct Accumulator {
        double mean = 0.0;
        double m2 = 0.0;
        int count = 0;
    };

    QHash<QString, Accumulator> accumulators;
    for (const InteractionRecord& record : records) {
        if (record.itemName.isEmpty() || record.playtime < 0) {
            continue;
        }
        Accumulator& acc = accumulators[record.itemName];
        const double playtime = static_cast<double>(record.playtime);
        ++acc.count;
        const double delta = playtime - acc.mean;
        acc.mean += delta / acc.count;
        acc.m2 += delta * (playtime - acc.mean);
    }

    QHash<QString, ItemStats> stats;
    stats.reserve(accumulators.size());
    for (auto it = accumulators.cbegin(); it != accumulators.cend(); ++it) {
        const Accumulator& acc = it.value();
        ItemStats itemStats;
        itemStats.sampleCount = acc.count;
        itemStats.meanPlaytime = acc.mean;
        itemStats.stdPlaytime = acc.m2 > 0.0 ? std::sqrt(acc.m2 / acc.count) : 0.0;
        stats.insert(it.key(), itemStats);
    }
    return stats;
}

} // namespace gr
