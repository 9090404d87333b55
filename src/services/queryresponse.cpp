#include "queryresponse.h"
#include "queryescape.h"

// QueryRecord

void QueryRecord::insert(const QString &key, const QString &value)
{
    if (!fields_.contains(key)) {
        order_.append(key);
    }
    fields_.insert(key, value);
}

QString QueryRecord::value(const QString &key, const QString &defaultValue) const
{
    auto it = fields_.constFind(key);
    if (it == fields_.constEnd()) {
        return defaultValue;
    }
    return it.value();
}

bool QueryRecord::isFlag(const QString &key) const
{
    auto it = fields_.constFind(key);
    return it != fields_.constEnd() && it.value().isNull();
}

int QueryRecord::intValue(const QString &key, bool *ok) const
{
    bool parsed = false;
    int result = 0;
    if (fields_.contains(key)) {
        result = fields_.value(key).toInt(&parsed);
    }
    if (ok) {
        *ok = parsed;
    }
    return parsed ? result : 0;
}

qint64 QueryRecord::int64Value(const QString &key, bool *ok) const
{
    bool parsed = false;
    qint64 result = 0;
    if (fields_.contains(key)) {
        result = fields_.value(key).toLongLong(&parsed);
    }
    if (ok) {
        *ok = parsed;
    }
    return parsed ? result : 0;
}

QString QueryRecord::toString() const
{
    QStringList parts;
    for (const QString &key : order_) {
        const QString value = fields_.value(key);
        if (value.isNull()) {
            parts.append(key);
        } else {
            parts.append(QStringLiteral("%1=%2").arg(key, value));
        }
    }
    return parts.join(QLatin1Char(' '));
}

bool QueryRecord::operator==(const QueryRecord &other) const
{
    if (fields_.size() != other.fields_.size()) {
        return false;
    }
    for (auto it = fields_.constBegin(); it != fields_.constEnd(); ++it) {
        auto match = other.fields_.constFind(it.key());
        if (match == other.fields_.constEnd() || match.value() != it.value()
            || match.value().isNull() != it.value().isNull()) {
            return false;
        }
    }
    return true;
}

// QueryResponse

QueryResponse::QueryResponse(const QList<QueryRecord> &records, const QueryStatus &status)
    : records_(records)
    , status_(status)
{
}

std::optional<QueryRecord> QueryResponse::first() const
{
    if (records_.isEmpty()) {
        return std::nullopt;
    }
    return records_.first();
}

// QueryEvent

QueryEvent::QueryEvent(const QString &name, const QList<QueryRecord> &records)
    : name_(name)
    , records_(records)
{
}

QueryRecord QueryEvent::data() const
{
    return records_.isEmpty() ? QueryRecord() : records_.first();
}

// QueryResponseParser

namespace {

bool parseRecord(const QString &text, QueryRecord &record, QString *errorMessage)
{
    const QStringList fields = text.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString &field : fields) {
        int eq = field.indexOf(QLatin1Char('='));
        if (eq < 0) {
            record.insert(field, QString());
            continue;
        }

        QString key = field.left(eq);
        QString value;
        if (!QueryEscape::unescape(field.mid(eq + 1), value)) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Invalid escape sequence in field '%1'").arg(key);
            }
            return false;
        }
        // "key=" decodes to an empty (non-null) value
        if (value.isNull()) {
            value = QLatin1String("");
        }
        record.insert(key, value);
    }
    return true;
}

} // namespace

QString QueryResponseParser::leadingToken(const QString &line)
{
    int space = line.indexOf(QLatin1Char(' '));
    return space < 0 ? line : line.left(space);
}

bool QueryResponseParser::parseRecords(const QString &line, QList<QueryRecord> &records,
                                       QString *errorMessage)
{
    QList<QueryRecord> result;
    const QStringList parts = line.split(QLatin1Char('|'));
    for (const QString &part : parts) {
        QueryRecord record;
        if (!parseRecord(part, record, errorMessage)) {
            return false;
        }
        result.append(record);
    }
    records = result;
    return true;
}

bool QueryResponseParser::parseStatusLine(const QString &line, QueryStatus &status,
                                          QString *errorMessage)
{
    auto fail = [errorMessage, &line](const QString &reason) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1: %2").arg(reason, line);
        }
        return false;
    };

    if (leadingToken(line) != QLatin1String("error")) {
        return fail(QStringLiteral("Not a status line"));
    }

    QueryRecord fields;
    QString parseError;
    if (!parseRecord(line.mid(5), fields, &parseError)) {
        return fail(parseError);
    }

    bool ok = false;
    int code = fields.value(QStringLiteral("id")).toInt(&ok);
    if (!ok) {
        return fail(QStringLiteral("Status line without numeric id"));
    }
    if (!fields.contains(QStringLiteral("msg"))) {
        return fail(QStringLiteral("Status line without msg"));
    }

    QueryStatus result;
    result.code = code;
    result.message = fields.value(QStringLiteral("msg"));
    for (const QString &key : fields.keys()) {
        if (key != QLatin1String("id") && key != QLatin1String("msg")) {
            result.extra.insert(key, fields.value(key));
        }
    }
    status = result;
    return true;
}

bool QueryResponseParser::parseResponse(const QStringList &lines, QueryResponse &response,
                                        QString *errorMessage)
{
    if (lines.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Response without status line");
        }
        return false;
    }

    QueryStatus status;
    if (!parseStatusLine(lines.last(), status, errorMessage)) {
        return false;
    }

    QList<QueryRecord> records;
    for (int i = 0; i < lines.size() - 1; ++i) {
        QList<QueryRecord> lineRecords;
        if (!parseRecords(lines.at(i), lineRecords, errorMessage)) {
            return false;
        }
        records.append(lineRecords);
    }

    response = QueryResponse(records, status);
    response.setRawLines(lines);
    return true;
}

bool QueryResponseParser::parseEvent(const QString &line, QueryEvent &event,
                                     QString *errorMessage)
{
    QString name = leadingToken(line);
    if (name.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Event line without name");
        }
        return false;
    }

    QList<QueryRecord> records;
    QString body = line.mid(name.size() + 1);
    if (!body.trimmed().isEmpty() && !parseRecords(body, records, errorMessage)) {
        return false;
    }

    event = QueryEvent(name, records);
    return true;
}
