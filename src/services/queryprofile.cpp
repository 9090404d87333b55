#include "queryprofile.h"

#include <QStringList>

namespace {

QSet<QString> toSet(const QStringList &verbs)
{
    return QSet<QString>(verbs.cbegin(), verbs.cend());
}

} // namespace

QueryProfile QueryProfile::server()
{
    QueryProfile profile;
    profile.kind = Kind::Server;
    profile.name = QStringLiteral("server");
    profile.defaultPort = 10011;
    profile.greetingLines = 2;
    profile.keepaliveCommand = QStringLiteral("whoami");
    profile.commands = toSet({
        "help", "login", "logout", "version", "hostinfo", "instanceinfo",
        "instanceedit", "bindinglist", "use", "serverlist", "serveridgetbyport",
        "serverdelete", "servercreate", "serverstart", "serverstop",
        "serverprocessstop", "serverinfo", "serverrequestconnectioninfo",
        "servertemppasswordadd", "servertemppassworddel", "servertemppasswordlist",
        "serveredit", "servergrouplist", "servergroupadd", "servergroupdel",
        "servergroupcopy", "servergrouprename", "servergrouppermlist",
        "servergroupaddperm", "servergroupdelperm", "servergroupaddclient",
        "servergroupdelclient", "servergroupclientlist", "servergroupsbyclientid",
        "servergroupautoaddperm", "servergroupautodelperm", "serversnapshotcreate",
        "serversnapshotdeploy", "servernotifyregister", "servernotifyunregister",
        "sendtextmessage", "logview", "logadd", "gm", "channellist", "channelinfo",
        "channelfind", "channelmove", "channelcreate", "channeldelete",
        "channeledit", "channelgrouplist", "channelgroupadd", "channelgroupdel",
        "channelgroupcopy", "channelgrouprename", "channelgroupaddperm",
        "channelgrouppermlist", "channelgroupdelperm", "channelgroupclientlist",
        "setclientchannelgroup", "channelpermlist", "channeladdperm",
        "channeldelperm", "clientlist", "clientinfo", "clientfind", "clientedit",
        "clientdblist", "clientdbinfo", "clientdbfind", "clientdbedit",
        "clientdbdelete", "clientgetids", "clientgetdbidfromuid",
        "clientgetnamefromuid", "clientgetnamefromdbid",
        "clientsetserverquerylogin", "clientupdate", "clientmove", "clientkick",
        "clientpoke", "clientpermlist", "clientaddperm", "clientdelperm",
        "channelclientpermlist", "channelclientaddperm", "channelclientdelperm",
        "permissionlist", "permidgetbyname", "permoverview", "permget", "permfind",
        "permreset", "privilegekeylist", "privilegekeyadd", "privilegekeydelete",
        "privilegekeyuse", "messagelist", "messageadd", "messagedel", "messageget",
        "messageupdateflag", "complainlist", "complainadd", "complaindelall",
        "complaindel", "banclient", "banlist", "banadd", "bandel", "bandelall",
        "ftinitupload", "ftinitdownload", "ftlist", "ftgetfilelist",
        "ftgetfileinfo", "ftstop", "ftdeletefile", "ftcreatedir", "ftrenamefile",
        "customsearch", "custominfo", "whoami"
    });
    return profile;
}

QueryProfile QueryProfile::client()
{
    QueryProfile profile;
    profile.kind = Kind::Client;
    profile.name = QStringLiteral("client");
    profile.defaultPort = 25639;
    profile.greetingLines = 4;
    profile.keepaliveCommand = QStringLiteral("whoami");
    profile.commands = toSet({
        "help", "use", "auth", "banadd", "banclient", "bandelall", "bandel",
        "banlist", "channeladdperm", "channelclientaddperm",
        "channelclientdelperm", "channelclientlist", "channelclientpermlist",
        "channelconnectinfo", "channelcreate", "channeldelete", "channeldelperm",
        "channeledit", "channelgroupadd", "channelgroupaddperm",
        "channelgroupclientlist", "channelgroupdel", "channelgroupdelperm",
        "channelgrouplist", "channelgrouppermlist", "channellist", "channelmove",
        "channelpermlist", "channelvariable", "clientaddperm", "clientdbdelete",
        "clientdbedit", "clientdblist", "clientdelperm", "clientgetdbidfromuid",
        "clientgetids", "clientgetnamefromdbid", "clientgetnamefromuid",
        "clientgetuidfromclid", "clientkick", "clientlist", "clientmove",
        "clientmute", "clientunmute", "clientnotifyregister",
        "clientnotifyunregister", "clientpermlist", "clientpoke", "clientupdate",
        "clientvariable", "complainadd", "complaindelall", "complaindel",
        "complainlist", "currentschandlerid", "ftcreatedir", "ftdeletefile",
        "ftgetfileinfo", "ftgetfilelist", "ftinitdownload", "ftinitupload",
        "ftlist", "ftrenamefile", "ftstop", "hashpassword", "messageadd",
        "messagedel", "messageget", "messagelist", "messageupdateflag",
        "permoverview", "sendtextmessage", "serverconnectinfo",
        "serverconnectionhandlerlist", "servergroupaddclient", "servergroupadd",
        "servergroupaddperm", "servergroupclientlist", "servergroupdelclient",
        "servergroupdel", "servergroupdelperm", "servergrouplist",
        "servergrouppermlist", "servergroupsbyclientid", "servervariable",
        "setclientchannelgroup", "tokenadd", "tokendelete", "tokenlist",
        "tokenuse", "verifychannelpassword", "verifyserverpassword", "whoami"
    });
    return profile;
}

QueryProfile QueryProfile::fromName(const QString &name, bool *ok)
{
    const QString lowered = name.trimmed().toLower();
    if (ok) {
        *ok = (lowered == QLatin1String("server") || lowered == QLatin1String("client"));
    }
    return lowered == QLatin1String("client") ? client() : server();
}
