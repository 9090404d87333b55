/**
 * @file queryeventclassifier.h
 * @brief Tells event notifications apart from command response lines.
 */

#ifndef QUERYEVENTCLASSIFIER_H
#define QUERYEVENTCLASSIFIER_H

#include <QString>
#include <QStringList>

/**
 * @brief Classifies incoming query protocol lines.
 *
 * The protocol has no framing header, so the receive loop decides what a
 * line is from its leading token and from whether a command response is
 * currently being assembled:
 *
 * 1. A leading token starting with a registered event prefix is an event,
 *    even while a response is in flight.
 * 2. A leading token of exactly "error" is a status line.
 * 3. Any other line belongs to the in-flight response, if there is one.
 * 4. Otherwise the line is unsolicited and is treated as an event.
 */
class QueryEventClassifier
{
public:
    enum class LineKind {
        Event,         ///< Unsolicited notification
        ResponseData,  ///< Record line of the in-flight response
        Status         ///< Terminal status line of the in-flight response
    };

    QueryEventClassifier();

    /**
     * @brief Classifies one line.
     * @param line The line without its terminator.
     * @param responseInFlight True while a command awaits its status line.
     * @return The kind of the line.
     */
    [[nodiscard]] LineKind classify(const QString &line, bool responseInFlight) const;

    /**
     * @brief Registers an additional event-name prefix.
     * @param prefix Prefix such as "notify" or "channel".
     */
    void addEventPrefix(const QString &prefix);

    [[nodiscard]] QStringList eventPrefixes() const { return eventPrefixes_; }

    static constexpr const char *DefaultEventPrefix = "notify";
    static constexpr const char *StatusToken = "error";

private:
    QStringList eventPrefixes_;
};

#endif // QUERYEVENTCLASSIFIER_H
