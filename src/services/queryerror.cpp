#include "queryerror.h"

#include <QDebug>

bool QueryError::isFatal() const
{
    return kind == QueryErrorKind::Transport || kind == QueryErrorKind::Parse;
}

QString QueryError::toString() const
{
    if (kind == QueryErrorKind::Command) {
        return QStringLiteral("[%1 %2] %3").arg(kindToString(kind)).arg(statusCode).arg(message);
    }
    return QStringLiteral("[%1] %2").arg(kindToString(kind), message);
}

QString QueryError::kindToString(QueryErrorKind kind)
{
    switch (kind) {
    case QueryErrorKind::None:
        return QStringLiteral("None");
    case QueryErrorKind::Transport:
        return QStringLiteral("Transport");
    case QueryErrorKind::Timeout:
        return QStringLiteral("Timeout");
    case QueryErrorKind::Parse:
        return QStringLiteral("Parse");
    case QueryErrorKind::Command:
        return QStringLiteral("Command");
    case QueryErrorKind::Integrity:
        return QStringLiteral("Integrity");
    case QueryErrorKind::Usage:
        return QStringLiteral("Usage");
    }
    return QStringLiteral("Unknown");
}

QueryErrorSeverity QueryError::severityFor(QueryErrorKind kind)
{
    switch (kind) {
    case QueryErrorKind::None:
    case QueryErrorKind::Timeout:
        return QueryErrorSeverity::Info;
    case QueryErrorKind::Command:
    case QueryErrorKind::Usage:
        return QueryErrorSeverity::Warning;
    case QueryErrorKind::Transport:
    case QueryErrorKind::Parse:
    case QueryErrorKind::Integrity:
        return QueryErrorSeverity::Critical;
    }
    return QueryErrorSeverity::Warning;
}

bool setQueryError(QueryError *out, const QueryError &error)
{
    if (out) {
        *out = error;
    }
    return false;
}

void logQueryError(const QString &context, const QueryError &error)
{
    QString logMessage = QStringLiteral("Query: %1 failed: %2").arg(context, error.toString());

    switch (QueryError::severityFor(error.kind)) {
    case QueryErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case QueryErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case QueryErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }
}
