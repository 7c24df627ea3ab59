#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace gr {

std::optional<Settings> SettingsManager::load()
{
    return loadFrom(settingsFilePath());
}

std::optional<Settings> SettingsManager::loadFrom(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(grCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(grCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return saveTo(settings, settingsFilePath());
}

bool SettingsManager::saveTo(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(grCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(grCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(grCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/gamerec/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("recordsPath"), settings.recordsPath);
    json.insert(QStringLiteral("catalogPath"), settings.catalogPath);
    json.insert(QStringLiteral("rootLabel"), settings.rootLabel);
    json.insert(QStringLiteral("defaultTopK"), settings.defaultTopK);
    json.insert(QStringLiteral("boostFactor"), settings.boostFactor);
    json.insert(QStringLiteral("playtimeWeight"), settings.playtimeWeight);
    json.insert(QStringLiteral("recommendBonus"), settings.recommendBonus);
    json.insert(QStringLiteral("notRecommendPenalty"), settings.notRecommendPenalty);
    json.insert(QStringLiteral("sentimentEnabled"), settings.sentimentEnabled);
    json.insert(QStringLiteral("historyLimit"), settings.historyLimit);
    json.insert(QStringLiteral("cacheMaxEntries"), settings.cacheMaxEntries);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.recordsPath = json.value(QStringLiteral("recordsPath")).toString(settings.recordsPath);
    settings.catalogPath = json.value(QStringLiteral("catalogPath")).toString(settings.catalogPath);
    settings.rootLabel = json.value(QStringLiteral("rootLabel")).toString(settings.rootLabel);

    settings.defaultTopK = json.value(QStringLiteral("defaultTopK")).toInt(settings.defaultTopK);
    settings.boostFactor = json.value(QStringLiteral("boostFactor")).toDouble(settings.boostFactor);

    settings.playtimeWeight = json.value(QStringLiteral("playtimeWeight"))
                                  .toDouble(settings.playtimeWeight);
    settings.recommendBonus = json.value(QStringLiteral("recommendBonus"))
                                  .toDouble(settings.recommendBonus);
    settings.notRecommendPenalty = json.value(QStringLiteral("notRecommendPenalty"))
                                       .toDouble(settings.notRecommendPenalty);
    settings.sentimentEnabled = json.value(QStringLiteral("sentimentEnabled"))
                                    .toBool(settings.sentimentEnabled);

    settings.historyLimit = json.value(QStringLiteral("historyLimit")).toInt(settings.historyLimit);
    settings.cacheMaxEntries = json.value(QStringLiteral("cacheMaxEntries"))
                                   .toInt(settings.cacheMaxEntries);

    if (settings.historyLimit < 0) {
        LOG_WARN(grCore, "historyLimit %d is negative, clamping to 0", settings.historyLimit);
        settings.historyLimit = 0;
    }
    if (settings.cacheMaxEntries < 1) {
        LOG_WARN(grCore, "cacheMaxEntries %d is below 1, clamping to 1", settings.cacheMaxEntries);
        settings.cacheMaxEntries = 1;
    }

    return settings;
}

} // namespace gr
