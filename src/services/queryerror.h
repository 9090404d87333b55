/**
 * @file queryerror.h
 * @brief Error kinds reported by the query connection and file transfers.
 */

#ifndef QUERYERROR_H
#define QUERYERROR_H

#include <QString>

/**
 * @brief Categories of failures.
 *
 * Transport and Parse failures are fatal to a connection; the others
 * leave it usable.
 */
enum class QueryErrorKind {
    None,       ///< No error
    Transport,  ///< Stream read/write/connect failure or connection closed
    Timeout,    ///< A wait expired; the caller may retry it
    Parse,      ///< Malformed response or event; protocol out of sync
    Command,    ///< Server answered with a nonzero status
    Integrity,  ///< File transfer size or checksum mismatch
    Usage       ///< Invalid call: bad command, nothing to receive, bad local device
};

/**
 * @brief Severity used when logging an error.
 */
enum class QueryErrorSeverity {
    Info,
    Warning,
    Critical
};

/**
 * @brief A failure with its category and a human readable message.
 */
struct QueryError {
    QueryErrorKind kind = QueryErrorKind::None;
    QString message;
    int statusCode = 0;  ///< Server error id for Command errors

    QueryError() = default;
    QueryError(QueryErrorKind k, const QString &msg, int code = 0)
        : kind(k), message(msg), statusCode(code) {}

    [[nodiscard]] bool isError() const { return kind != QueryErrorKind::None; }

    /**
     * @brief Checks whether the error terminates the connection.
     * @return True for Transport and Parse errors.
     */
    [[nodiscard]] bool isFatal() const;

    /**
     * @brief Formats the error as "[Kind] message".
     */
    [[nodiscard]] QString toString() const;

    /**
     * @brief Converts an error kind to a short string for logs.
     */
    [[nodiscard]] static QString kindToString(QueryErrorKind kind);

    /**
     * @brief Maps an error kind to the severity it is logged with.
     */
    [[nodiscard]] static QueryErrorSeverity severityFor(QueryErrorKind kind);
};

/**
 * @brief Stores @p error in @p out if @p out is non-null.
 * @return Always false, so callers can write "return setQueryError(...)".
 */
bool setQueryError(QueryError *out, const QueryError &error);

/**
 * @brief Logs an error through the Qt message handlers.
 * @param context Short description of the failed operation.
 * @param error The error to log.
 */
void logQueryError(const QString &context, const QueryError &error);

#endif // QUERYERROR_H
