/**
 * @file queryescape.h
 * @brief Escaping rules for values carried on the query protocol wire.
 */

#ifndef QUERYESCAPE_H
#define QUERYESCAPE_H

#include <QString>

/**
 * @brief Converts parameter values to and from their wire representation.
 *
 * The query protocol separates fields with spaces and records with pipes,
 * so those characters (plus backslash, slash and the ASCII control
 * characters used as delimiters) travel as a backslash followed by a
 * mnemonic letter:
 *
 * | Raw        | Wire  |
 * |------------|-------|
 * | backslash  | `\\`  |
 * | `/`        | `\/`  |
 * | space      | `\s`  |
 * | `|`        | `\p`  |
 * | BEL        | `\a`  |
 * | BS         | `\b`  |
 * | FF         | `\f`  |
 * | LF         | `\n`  |
 * | CR         | `\r`  |
 * | TAB        | `\t`  |
 * | VT         | `\v`  |
 *
 * Unknown escape sequences are rejected rather than passed through.
 */
class QueryEscape
{
public:
    /**
     * @brief Escapes a raw value for transmission.
     * @param raw The unescaped value.
     * @return The wire-safe token.
     */
    [[nodiscard]] static QString escape(const QString &raw);

    /**
     * @brief Reverses escape().
     * @param wire The escaped token as received.
     * @param raw Receives the decoded value on success.
     * @return False if the token contains an unknown escape or ends with
     *         a lone backslash.
     */
    static bool unescape(const QString &wire, QString &raw);

    /**
     * @brief Checks a verb, option or key against the identifier grammar.
     * @param name The name to check.
     * @return True if @p name is a non-empty run of [A-Za-z0-9_].
     */
    [[nodiscard]] static bool isValidIdentifier(const QString &name);

private:
    QueryEscape() = default;
};

#endif // QUERYESCAPE_H
