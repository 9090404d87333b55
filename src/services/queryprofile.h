/**
 * @file queryprofile.h
 * @brief Per-flavour constants of the query interface (ServerQuery, ClientQuery).
 */

#ifndef QUERYPROFILE_H
#define QUERYPROFILE_H

#include <QSet>
#include <QString>

/**
 * @brief Describes one flavour of the query interface.
 *
 * The server-side administration interface and the client-side remote
 * control interface share the wire protocol but differ in default port,
 * greeting length and the set of commands they accept.
 */
struct QueryProfile {
    enum class Kind {
        Server,  ///< ServerQuery, served by the voice server
        Client   ///< ClientQuery, served by a running desktop client
    };

    Kind kind = Kind::Server;
    QString name;
    quint16 defaultPort = 0;
    int greetingLines = 0;          ///< Lines sent by the server before the first prompt
    QString keepaliveCommand;       ///< Lightweight command used to reset the idle timer
    QSet<QString> commands;         ///< Verbs listed by the interface's "help", excluding "quit"

    /**
     * @brief Checks whether a verb belongs to this interface.
     */
    [[nodiscard]] bool supportsCommand(const QString &verb) const { return commands.contains(verb); }

    /// Server closes idle query sessions after this long
    static constexpr int IdleTimeoutMs = 10 * 60 * 1000;

    [[nodiscard]] static QueryProfile server();
    [[nodiscard]] static QueryProfile client();

    /**
     * @brief Looks a profile up by name ("server" or "client").
     * @param name Profile name, case-insensitive.
     * @param ok Set to false for an unknown name (the server profile is returned).
     */
    [[nodiscard]] static QueryProfile fromName(const QString &name, bool *ok = nullptr);
};

#endif // QUERYPROFILE_H
