#include "core/ingest/search_response_parser.h"
#include "core/pipeline/config_manager.h"
#include "core/pipeline/incident_pipeline.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QTextStream>

#include <cstdio>
#include <optional>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInputError = 1;
constexpr int kExitUsage = 2;

void printJson(const QJsonObject& json, bool compact)
{
    QTextStream out(stdout);
    out << QJsonDocument(json).toJson(compact ? QJsonDocument::Compact
                                              : QJsonDocument::Indented);
    if (compact) {
        out << '\n';
    }
}

void printError(const QString& message)
{
    QTextStream err(stderr);
    err << QCoreApplication::applicationName() << ": " << message << '\n';
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("incidentlens-classify"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Splits vector-search incident hits into relevant and non-relevant sets "
        "and prints the analytics snapshot as JSON."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption queryOption(
        {QStringLiteral("q"), QStringLiteral("query")},
        QStringLiteral("Free-text query the hits were retrieved for."),
        QStringLiteral("text"));
    const QCommandLineOption hitsOption(
        QStringLiteral("hits"),
        QStringLiteral("Search response JSON file ({\"result\": [...]} or an array of hits)."),
        QStringLiteral("file"));
    const QCommandLineOption configOption(
        {QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Pipeline configuration JSON (default: %1 when present).")
            .arg(il::ConfigManager::defaultConfigFilePath()),
        QStringLiteral("file"));
    const QCommandLineOption topKOption(
        QStringLiteral("top-k"),
        QStringLiteral("Number of hits requested from the vector store."),
        QStringLiteral("n"));
    const QCommandLineOption compactOption(
        QStringLiteral("compact"),
        QStringLiteral("Print single-line JSON."));
    const QCommandLineOption printConfigOption(
        QStringLiteral("print-default-config"),
        QStringLiteral("Print the default configuration and exit."));

    parser.addOption(queryOption);
    parser.addOption(hitsOption);
    parser.addOption(configOption);
    parser.addOption(topKOption);
    parser.addOption(compactOption);
    parser.addOption(printConfigOption);
    parser.process(app);

    const bool compact = parser.isSet(compactOption);

    if (parser.isSet(printConfigOption)) {
        printJson(il::ConfigManager::toJson(il::PipelineConfig{}), compact);
        return kExitOk;
    }

    if (!parser.isSet(hitsOption)) {
        printError(QStringLiteral("--hits is required"));
        parser.showHelp(kExitUsage);
    }

    std::optional<int> topK;
    if (parser.isSet(topKOption)) {
        bool ok = false;
        const int value = parser.value(topKOption).toInt(&ok);
        if (!ok || value < 0) {
            printError(QStringLiteral("--top-k expects a non-negative integer"));
            return kExitUsage;
        }
        topK = value;
    }

    QString error;
    const std::optional<il::PipelineConfig> config = parser.isSet(configOption)
        ? il::ConfigManager::load(parser.value(configOption), &error)
        : il::ConfigManager::loadDefault(&error);
    if (!config) {
        printError(error);
        return kExitInputError;
    }

    const std::optional<il::IncidentPipeline> pipeline =
        il::IncidentPipeline::create(*config, &error);
    if (!pipeline) {
        printError(QStringLiteral("invalid configuration: %1").arg(error));
        return kExitInputError;
    }

    const std::optional<std::vector<il::RawHit>> hits =
        il::SearchResponseParser::parseFile(parser.value(hitsOption), &error);
    if (!hits) {
        printError(error);
        return kExitInputError;
    }

    const il::PipelineResult result =
        pipeline->run(*hits, parser.value(queryOption), topK);
    printJson(il::pipelineResultToJson(result), compact);
    return kExitOk;
}
