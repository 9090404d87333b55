/**
 * @file queryresponse.h
 * @brief Decoded query protocol responses, status lines and events.
 */

#ifndef QUERYRESPONSE_H
#define QUERYRESPONSE_H

#include <QHash>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @brief One decoded key/value group of a response or event.
 *
 * Records are sparse: a key that was not sent is simply absent. A bare
 * key (no '=') is present with a null value and reports isFlag() true;
 * "key=" is present with an empty, non-null value. Keys keep the order
 * in which they were first inserted, which for parsed records is the
 * order the server sent them.
 */
class QueryRecord
{
public:
    QueryRecord() = default;

    /**
     * @brief Sets a field. A repeated key keeps its position and takes the new value.
     */
    void insert(const QString &key, const QString &value);

    [[nodiscard]] bool contains(const QString &key) const { return fields_.contains(key); }

    /**
     * @brief Returns the decoded value, or @p defaultValue if the key is absent.
     */
    [[nodiscard]] QString value(const QString &key, const QString &defaultValue = QString()) const;

    /**
     * @brief Checks whether the key was sent without a value.
     */
    [[nodiscard]] bool isFlag(const QString &key) const;

    /**
     * @brief Convenience integer view of a field.
     * @param key Field name.
     * @param ok Set to false when the key is absent or not an integer.
     * @return The value, or 0.
     */
    [[nodiscard]] int intValue(const QString &key, bool *ok = nullptr) const;
    [[nodiscard]] qint64 int64Value(const QString &key, bool *ok = nullptr) const;

    [[nodiscard]] QStringList keys() const { return order_; }
    [[nodiscard]] int size() const { return static_cast<int>(fields_.size()); }
    [[nodiscard]] bool isEmpty() const { return fields_.isEmpty(); }

    /**
     * @brief Formats the record as "key=value" pairs for display.
     */
    [[nodiscard]] QString toString() const;

    /// Equal when both hold the same keys and values; flags differ from empty values
    bool operator==(const QueryRecord &other) const;
    bool operator!=(const QueryRecord &other) const { return !(*this == other); }

private:
    QHash<QString, QString> fields_;
    QStringList order_;
};

/**
 * @brief The status line that terminates every response block.
 */
struct QueryStatus {
    int code = 0;        ///< Server error id, 0 on success
    QString message;     ///< Unescaped message text
    QueryRecord extra;   ///< Any additional fields (failed_permid, extra_msg, ...)

    [[nodiscard]] bool isSuccess() const { return code == 0; }
};

/**
 * @brief A complete command response: zero or more records and one status.
 *
 * The response behaves as a read-only sequence of its records, and
 * offers first() and all() for the common single/multi record cases.
 */
class QueryResponse
{
public:
    using const_iterator = QList<QueryRecord>::const_iterator;

    QueryResponse() = default;
    QueryResponse(const QList<QueryRecord> &records, const QueryStatus &status);

    /**
     * @brief Returns the first record, or nothing if the response is empty.
     */
    [[nodiscard]] std::optional<QueryRecord> first() const;

    /**
     * @brief Returns every record in order.
     */
    [[nodiscard]] QList<QueryRecord> all() const { return records_; }

    [[nodiscard]] const QueryStatus &status() const { return status_; }
    [[nodiscard]] bool isSuccess() const { return status_.isSuccess(); }

    [[nodiscard]] int size() const { return static_cast<int>(records_.size()); }
    [[nodiscard]] bool isEmpty() const { return records_.isEmpty(); }
    [[nodiscard]] const QueryRecord &at(int index) const { return records_.at(index); }
    const QueryRecord &operator[](int index) const { return records_.at(index); }

    [[nodiscard]] const_iterator begin() const { return records_.cbegin(); }
    [[nodiscard]] const_iterator end() const { return records_.cend(); }

    /**
     * @brief The undecoded lines this response was parsed from.
     */
    [[nodiscard]] QStringList rawLines() const { return rawLines_; }
    void setRawLines(const QStringList &lines) { rawLines_ = lines; }

private:
    QList<QueryRecord> records_;
    QueryStatus status_;
    QStringList rawLines_;
};

/**
 * @brief An unsolicited notification pushed by the server.
 */
class QueryEvent
{
public:
    QueryEvent() = default;
    QueryEvent(const QString &name, const QList<QueryRecord> &records);

    [[nodiscard]] QString name() const { return name_; }

    /**
     * @brief Returns the first record of the event body (empty if none).
     */
    [[nodiscard]] QueryRecord data() const;

    /**
     * @brief Returns all records; pipe-separated bodies yield several.
     */
    [[nodiscard]] QList<QueryRecord> records() const { return records_; }

    [[nodiscard]] bool isValid() const { return !name_.isEmpty(); }

private:
    QString name_;
    QList<QueryRecord> records_;
};

Q_DECLARE_METATYPE(QueryRecord)
Q_DECLARE_METATYPE(QueryEvent)

/**
 * @brief Parses wire lines into records, status lines, responses and events.
 *
 * Record grammar: records are separated by '|', fields by spaces. A field
 * is either "key=value" (split at the first '=') or a bare key. Values
 * are unescaped with QueryEscape; an invalid escape fails the parse.
 */
class QueryResponseParser
{
public:
    /**
     * @brief Parses the records of one line.
     * @param line Wire line without terminator.
     * @param records Receives the decoded records.
     * @param errorMessage Receives a description on failure.
     * @return False on an invalid escape sequence.
     */
    static bool parseRecords(const QString &line, QList<QueryRecord> &records,
                             QString *errorMessage = nullptr);

    /**
     * @brief Parses a status line such as "error id=0 msg=ok".
     * @return False if the leading token is not "error" or id/msg is
     *         missing or malformed.
     */
    static bool parseStatusLine(const QString &line, QueryStatus &status,
                                QString *errorMessage = nullptr);

    /**
     * @brief Parses a full response block; the last line must be the status.
     */
    static bool parseResponse(const QStringList &lines, QueryResponse &response,
                              QString *errorMessage = nullptr);

    /**
     * @brief Parses an event line: the leading token is the event name, the
     *        rest is its body.
     */
    static bool parseEvent(const QString &line, QueryEvent &event,
                           QString *errorMessage = nullptr);

    /**
     * @brief Returns the leading token of a line (up to the first space).
     */
    [[nodiscard]] static QString leadingToken(const QString &line);

private:
    QueryResponseParser() = default;
};

#endif // QUERYRESPONSE_H
