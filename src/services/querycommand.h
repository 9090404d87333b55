/**
 * @file querycommand.h
 * @brief Builder and encoder for query protocol commands.
 */

#ifndef QUERYCOMMAND_H
#define QUERYCOMMAND_H

#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief A query command: verb, option flags and parameters.
 *
 * Commands are built with chained calls and encoded into a single wire
 * line. Any parameter may carry a sequence of values, in which case the
 * command is pipelined: the encoder emits one pipe-separated segment per
 * sequence element, repeating scalar parameters in every segment.
 *
 * @par Example usage:
 * @code
 * QueryCommand kick = QueryCommand("clientkick")
 *                         .withParam("reasonid", 5)
 *                         .withParam("clid", QList<int>{1, 2, 3});
 * kick.encode();
 * // "clientkick reasonid=5 clid=1|reasonid=5 clid=2|reasonid=5 clid=3"
 * @endcode
 *
 * Options and parameters are emitted in insertion order. Setting an
 * existing key again replaces its value without moving it.
 */
class QueryCommand
{
public:
    QueryCommand() = default;

    /**
     * @brief Creates a command with the given verb and nothing else.
     * @param verb The command verb, e.g. "clientlist".
     */
    explicit QueryCommand(const QString &verb);

    /// @name Building
    /// @{

    /**
     * @brief Adds an option flag (emitted as "-name"). Duplicates are ignored.
     * @param option Option name without the leading dash.
     * @return Reference to this command for chaining.
     */
    QueryCommand &withOption(const QString &option);

    QueryCommand &withParam(const QString &key, const QString &value);
    QueryCommand &withParam(const QString &key, const char *value);
    QueryCommand &withParam(const QString &key, int value);
    QueryCommand &withParam(const QString &key, qint64 value);

    /**
     * @brief Sets a pipelined parameter.
     * @param key Parameter key.
     * @param values One value per pipe segment.
     * @return Reference to this command for chaining.
     */
    QueryCommand &withParam(const QString &key, const QStringList &values);
    QueryCommand &withParam(const QString &key, const QList<int> &values);

    /**
     * @brief Sets a boolean parameter, encoded as 1 or 0.
     */
    QueryCommand &withFlag(const QString &key, bool value);
    /// @}

    /// @name Inspection
    /// @{
    [[nodiscard]] QString verb() const { return verb_; }
    [[nodiscard]] QStringList options() const { return options_; }
    [[nodiscard]] QStringList paramKeys() const;
    [[nodiscard]] bool hasParam(const QString &key) const;

    /**
     * @brief Returns the values of a parameter (one entry for scalars).
     */
    [[nodiscard]] QStringList paramValues(const QString &key) const;

    /**
     * @brief Returns the number of pipe segments encode() will produce.
     */
    [[nodiscard]] int segmentCount() const;

    /**
     * @brief Checks the verb, option names and keys against the
     *        identifier grammar.
     */
    [[nodiscard]] bool isValid() const;
    /// @}

    /**
     * @brief Encodes the command into its wire form (without terminator).
     * @return The encoded line.
     */
    [[nodiscard]] QString encode() const;

    /**
     * @brief Encodes the command with credential values masked, for logs.
     */
    [[nodiscard]] QString traceString() const;

    /**
     * @brief Builds a command from command-line style tokens.
     *
     * The first token is the verb, tokens starting with '-' are options,
     * and "key=value" tokens are parameters. A key given more than once
     * becomes a pipelined parameter. A token without '=' is sent as a
     * key with an empty value.
     *
     * @param tokens The tokens, e.g. {"clientlist", "-uid", "-away"}.
     * @return The command; check isValid() before sending.
     */
    [[nodiscard]] static QueryCommand fromArguments(const QStringList &tokens);

    bool operator==(const QueryCommand &other) const;
    bool operator!=(const QueryCommand &other) const { return !(*this == other); }

private:
    struct Param {
        QString key;
        QStringList values;
        bool sequence = false;

        bool operator==(const Param &other) const
        {
            return key == other.key && values == other.values
                   && sequence == other.sequence;
        }
    };

    QueryCommand &setParam(const QString &key, const QStringList &values, bool sequence);
    [[nodiscard]] QString encodeWith(bool maskCredentials) const;

    QString verb_;
    QStringList options_;
    QList<Param> params_;
};

#endif // QUERYCOMMAND_H
