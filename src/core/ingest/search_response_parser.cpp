#include "core/ingest/search_response_parser.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

namespace il {

namespace {

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

std::vector<RawHit> SearchResponseParser::hitsFromArray(const QJsonArray& hits)
{
    std::vector<RawHit> result;
    result.reserve(static_cast<size_t>(hits.size()));

    for (const QJsonValue& value : hits) {
        const QJsonObject hitObject = value.toObject();
        RawHit hit;
        const QJsonValue score = hitObject.value(QStringLiteral("score"));
        if (score.isDouble()) {
            hit.score = score.toDouble();
        }
        const QJsonValue payload = hitObject.value(QStringLiteral("payload"));
        if (payload.isObject()) {
            hit.payload = payload.toObject();
        }
        result.push_back(std::move(hit));
    }
    return result;
}

std::optional<std::vector<RawHit>> SearchResponseParser::parse(const QByteArray& json,
                                                               QString* errorOut)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        const QString message = QStringLiteral("search response is not valid JSON: %1")
                                    .arg(parseError.errorString());
        LOG_WARN(ilIngest, "%s", qUtf8Printable(message));
        setError(errorOut, message);
        return std::nullopt;
    }

    if (doc.isArray()) {
        return hitsFromArray(doc.array());
    }

    const QJsonValue results = doc.object().value(QStringLiteral("result"));
    if (!results.isArray()) {
        const QString message = QStringLiteral("search response has no \"result\" array");
        LOG_WARN(ilIngest, "%s", qUtf8Printable(message));
        setError(errorOut, message);
        return std::nullopt;
    }

    return hitsFromArray(results.toArray());
}

std::optional<std::vector<RawHit>> SearchResponseParser::parseFile(const QString& filePath,
                                                                   QString* errorOut)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        const QString message = QStringLiteral("cannot open search response %1: %2")
                                    .arg(filePath, file.errorString());
        LOG_WARN(ilIngest, "%s", qUtf8Printable(message));
        setError(errorOut, message);
        return std::nullopt;
    }

    const QByteArray raw = file.readAll();
    file.close();
    return parse(raw, errorOut);
}

} // namespace il
