/**
 * @file logging.h
 * @brief Verbose switch and wire trace macros for the query session.
 *
 * Everything below is silent unless --verbose was given. Lines written to
 * the server are traced as "Query: >> <line>" and lines read back as
 * "Query: << <line>", so a verbose run reads as a transcript of the
 * session. Outgoing lines come from QueryCommand::traceString(), which
 * masks credentials. File transfer data connections log with an "FT:"
 * prefix through LOG_VERBOSE().
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace tsquery {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

} // namespace tsquery

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (tsquery::verboseLogging) qDebug()

/// Trace a line sent to the server
#define LOG_SENT() if (tsquery::verboseLogging) qDebug().noquote() << "Query: >>"

/// Trace a line received from the server
#define LOG_RECEIVED() if (tsquery::verboseLogging) qDebug().noquote() << "Query: <<"

#endif // LOGGING_H
