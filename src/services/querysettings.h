/**
 * @file querysettings.h
 * @brief Connection preferences stored in QSettings.
 */

#ifndef QUERYSETTINGS_H
#define QUERYSETTINGS_H

#include <QString>

#include "queryprofile.h"

class QSettings;

/**
 * @brief Connection and login preferences for the query tool.
 *
 * Stored under the groups "connection", "auth" and "server". Keys that are
 * missing fall back to the selected profile's defaults.
 */
struct QuerySettings {
    QString host = QStringLiteral("localhost");
    quint16 port = 0;                  ///< 0 means the profile's default port
    QString profileName = QStringLiteral("server");
    int timeoutMs = 10000;
    int keepaliveIntervalMs = 0;       ///< 0 disables automatic keepalives

    QString user;                      ///< ServerQuery login name
    QString password;                  ///< ServerQuery login password
    QString apiKey;                    ///< ClientQuery auth key
    int serverId = 0;                  ///< Virtual server to select, 0 for none

    /**
     * @brief Returns the profile named by profileName.
     */
    [[nodiscard]] QueryProfile profile() const;

    /**
     * @brief Returns the configured port, or the profile's default.
     */
    [[nodiscard]] quint16 effectivePort() const;

    /**
     * @brief Reads all values present in @p settings.
     */
    void load(QSettings &settings);

    /**
     * @brief Writes all values to @p settings.
     */
    void save(QSettings &settings) const;
};

#endif // QUERYSETTINGS_H
