#include "core/analytics/state_bucket.h"

#include <QSet>

namespace il {

namespace {

const QSet<QString>& closedStates()
{
    static const QSet<QString> kClosed = {
        QStringLiteral("closed"), QStringLiteral("resolved"),
        QStringLiteral("done"), QStringLiteral("completed"),
    };
    return kClosed;
}

const QSet<QString>& openStates()
{
    static const QSet<QString> kOpen = {
        QStringLiteral("open"), QStringLiteral("in_progress"),
        QStringLiteral("assigned"), QStringLiteral("pending"),
        QStringLiteral("new"), QStringLiteral("active"),
    };
    return kOpen;
}

} // anonymous namespace

StateBucket classifyState(const QString& state)
{
    const QString normalized = state.trimmed().toLower();
    if (closedStates().contains(normalized)) {
        return StateBucket::Closed;
    }
    if (openStates().contains(normalized)) {
        return StateBucket::Open;
    }
    return StateBucket::Other;
}

QString stateBucketToString(StateBucket bucket)
{
    switch (bucket) {
    case StateBucket::Closed: return QStringLiteral("Closed");
    case StateBucket::Open:   return QStringLiteral("Open");
    case StateBucket::Other:  return QStringLiteral("Other");
    }
    return QStringLiteral("Other");
}

} // namespace il
