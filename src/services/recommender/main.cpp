#include "recommender_service.h"

#include "core/ranking/recommendation_graph.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QTextStream>

#include <optional>

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitInputError = 1,
    ExitUsageError = 2,
};

struct OutputOptions {
    bool json = false;
    bool graph = false;
    bool unfiltered = false;
    int topK = 15;
    double boostFactor = 1.5;
};

QString formatCategories(const QSet<QString>& categories)
{
    QStringList sorted = categories.values();
    sorted.sort();
    return sorted.join(QStringLiteral(", "));
}

void printResult(QTextStream& out, const QString& likedItem,
                 const gr::RecommendationResult& result, const OutputOptions& options)
{
    if (options.json || options.graph) {
        QJsonObject json = gr::recommendationToJson(likedItem, result);
        if (options.graph) {
            json[QStringLiteral("graph")] =
                gr::RecommendationGraph::build(likedItem, result).toJson();
        }
        out << QJsonDocument(json).toJson(QJsonDocument::Compact) << Qt::endl;
        return;
    }

    if (result.rankedItems.isEmpty()) {
        out << "No results: '" << likedItem
            << "' may not exist in the dataset or has no known category." << Qt::endl;
        return;
    }

    out << "Based on '" << likedItem << "', the top " << result.rankedItems.size()
        << " recommendations:" << Qt::endl;
    for (int i = 0; i < result.rankedItems.size(); ++i) {
        const QString& item = result.rankedItems.at(i);
        out << (i + 1) << ". " << item << " - Score: "
            << QString::number(result.scores.value(item), 'f', 3);
        const QSet<QString> categories = result.categories.value(item);
        if (!categories.isEmpty()) {
            out << " [" << formatCategories(categories) << "]";
        }
        out << Qt::endl;
    }
}

gr::RecommendationResult runQuery(gr::RecommenderService& service, const QString& likedItem,
                                  const OutputOptions& options)
{
    if (options.unfiltered) {
        return service.recommendUnfiltered(likedItem, options.topK);
    }
    return service.recommend(likedItem, options.topK, options.boostFactor);
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("gamerec"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Recommends games similar to a liked game from user play history."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("games"),
                                 QStringLiteral("Liked games. Reads one per line from stdin if omitted."),
                                 QStringLiteral("[games...]"));

    const QCommandLineOption recordsOption(QStringLiteral("records"),
        QStringLiteral("Normalized interaction records (JSON Lines)."), QStringLiteral("file"));
    const QCommandLineOption catalogOption(QStringLiteral("catalog"),
        QStringLiteral("Classified game catalog (JSON array)."), QStringLiteral("file"));
    const QCommandLineOption configOption(QStringLiteral("config"),
        QStringLiteral("Settings file (default: %1).").arg(gr::SettingsManager::settingsFilePath()),
        QStringLiteral("file"));
    const QCommandLineOption topKOption({QStringLiteral("k"), QStringLiteral("top-k")},
        QStringLiteral("Number of recommendations."), QStringLiteral("n"));
    const QCommandLineOption boostOption({QStringLiteral("b"), QStringLiteral("boost")},
        QStringLiteral("Score multiplier."), QStringLiteral("factor"));
    const QCommandLineOption jsonOption(QStringLiteral("json"),
        QStringLiteral("Print one JSON object per query."));
    const QCommandLineOption graphOption(QStringLiteral("graph"),
        QStringLiteral("Include the recommendation graph in JSON output."));
    const QCommandLineOption unfilteredOption(QStringLiteral("unfiltered"),
        QStringLiteral("Rank by co-occurrence only, without the category filter."));
    const QCommandLineOption noSentimentOption(QStringLiteral("no-sentiment"),
        QStringLiteral("Ignore review text when weighting interactions."));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"),
        QStringLiteral("Enable debug logging."));

    parser.addOptions({recordsOption, catalogOption, configOption, topKOption, boostOption,
                       jsonOption, graphOption, unfilteredOption, noSentimentOption,
                       verboseOption});
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("gr.*.debug=true"));
    }

    gr::Settings settings;
    if (parser.isSet(configOption)) {
        std::optional<gr::Settings> loaded = gr::SettingsManager::loadFrom(parser.value(configOption));
        if (!loaded.has_value()) {
            LOG_ERROR(grCore, "Cannot load settings from %s",
                      qUtf8Printable(parser.value(configOption)));
            return ExitInputError;
        }
        settings = *loaded;
    } else if (std::optional<gr::Settings> loaded = gr::SettingsManager::load()) {
        settings = *loaded;
    }

    if (parser.isSet(recordsOption)) {
        settings.recordsPath = parser.value(recordsOption);
    }
    if (parser.isSet(catalogOption)) {
        settings.catalogPath = parser.value(catalogOption);
    }
    if (parser.isSet(noSentimentOption)) {
        settings.sentimentEnabled = false;
    }

    OutputOptions options;
    options.json = parser.isSet(jsonOption);
    options.graph = parser.isSet(graphOption);
    options.unfiltered = parser.isSet(unfilteredOption);
    options.topK = settings.defaultTopK;
    options.boostFactor = settings.boostFactor;

    if (parser.isSet(topKOption)) {
        bool ok = false;
        options.topK = parser.value(topKOption).toInt(&ok);
        if (!ok) {
            QTextStream(stderr) << "Invalid --top-k value: " << parser.value(topKOption) << Qt::endl;
            return ExitUsageError;
        }
    }
    if (parser.isSet(boostOption)) {
        bool ok = false;
        options.boostFactor = parser.value(boostOption).toDouble(&ok);
        if (!ok) {
            QTextStream(stderr) << "Invalid --boost value: " << parser.value(boostOption) << Qt::endl;
            return ExitUsageError;
        }
    }

    if (settings.recordsPath.isEmpty() || settings.catalogPath.isEmpty()) {
        QTextStream(stderr) << "Both --records and --catalog are required "
                               "(or recordsPath / catalogPath in settings)." << Qt::endl;
        return ExitUsageError;
    }

    gr::RecommenderService service(settings);
    if (!service.loadData()) {
        return ExitInputError;
    }

    QTextStream out(stdout);
    const QStringList games = parser.positionalArguments();
    if (!games.isEmpty()) {
        for (const QString& game : games) {
            printResult(out, game, runQuery(service, game, options), options);
        }
        return ExitOk;
    }

    QTextStream in(stdin);
    QString line;
    while (in.readLineInto(&line)) {
        const QString game = line.trimmed();
        if (game.isEmpty()) {
            continue;
        }
        printResult(out, game, runQuery(service, game, options), options);
    }

    if (!options.json && !service.history().entries().isEmpty()) {
        out << "Search history: " << service.history().entries().join(QStringLiteral("; "))
            << Qt::endl;
    }
    return ExitOk;
}
