#include "querysettings.h"

#include <QSettings>

QueryProfile QuerySettings::profile() const
{
    return QueryProfile::fromName(profileName);
}

quint16 QuerySettings::effectivePort() const
{
    return port != 0 ? port : profile().defaultPort;
}

void QuerySettings::load(QSettings &settings)
{
    host = settings.value("connection/host", host).toString();
    port = static_cast<quint16>(settings.value("connection/port", port).toUInt());
    profileName = settings.value("connection/profile", profileName).toString();
    timeoutMs = settings.value("connection/timeoutMs", timeoutMs).toInt();
    keepaliveIntervalMs = settings.value("connection/keepaliveMs", keepaliveIntervalMs).toInt();

    user = settings.value("auth/user", user).toString();
    password = settings.value("auth/password", password).toString();
    apiKey = settings.value("auth/apikey", apiKey).toString();

    serverId = settings.value("server/id", serverId).toInt();
}

void QuerySettings::save(QSettings &settings) const
{
    settings.setValue("connection/host", host);
    settings.setValue("connection/port", static_cast<int>(port));
    settings.setValue("connection/profile", profileName);
    settings.setValue("connection/timeoutMs", timeoutMs);
    settings.setValue("connection/keepaliveMs", keepaliveIntervalMs);

    settings.setValue("auth/user", user);
    settings.setValue("auth/password", password);
    settings.setValue("auth/apikey", apiKey);

    settings.setValue("server/id", serverId);
}
