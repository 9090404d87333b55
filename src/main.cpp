#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QSettings>
#include <QTextStream>

#include "services/queryconnection.h"
#include "services/queryfiletransfer.h"
#include "services/querysettings.h"
#include "utils/logging.h"
#include "version.h"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int reportFailure(const QString &context, const QueryError &error)
{
    err() << context << ": " << error.toString() << Qt::endl;
    return 1;
}

void printResponse(const QueryResponse &response)
{
    for (const QueryRecord &record : response) {
        out() << record.toString() << Qt::endl;
    }
    out().flush();
}

bool authenticate(QueryConnection &connection, const QuerySettings &settings,
                  int timeoutMs, QueryError *error)
{
    QueryResponse response;
    const QueryProfile profile = connection.profile();

    if (profile.kind == QueryProfile::Kind::Server && !settings.user.isEmpty()) {
        QueryCommand login = QueryCommand("login")
                                 .withParam("client_login_name", settings.user)
                                 .withParam("client_login_password", settings.password);
        if (!connection.exec(login, response, timeoutMs, error)) {
            return false;
        }
    }

    if (profile.kind == QueryProfile::Kind::Client && !settings.apiKey.isEmpty()) {
        if (!connection.exec(QueryCommand("auth").withParam("apikey", settings.apiKey),
                             response, timeoutMs, error)) {
            return false;
        }
    }

    if (profile.kind == QueryProfile::Kind::Server && settings.serverId > 0) {
        if (!connection.exec(QueryCommand("use").withParam("sid", settings.serverId),
                             response, timeoutMs, error)) {
            return false;
        }
    }
    return true;
}

int runTransfer(QueryConnection &connection, const QString &pathPair, bool isUpload,
                int channelId, const QString &channelPassword, int timeoutMs)
{
    int split = isUpload ? pathPair.lastIndexOf(':') : pathPair.indexOf(':');
    if (split <= 0 || split == pathPair.size() - 1) {
        err() << (isUpload ? "--upload expects LOCAL:REMOTE" : "--download expects REMOTE:LOCAL")
              << Qt::endl;
        return 1;
    }

    QString localPath = isUpload ? pathPair.left(split) : pathPair.mid(split + 1);
    QString remotePath = isUpload ? pathPair.mid(split + 1) : pathPair.left(split);

    QueryFileTransfer transfer(&connection);
    transfer.setTimeout(timeoutMs);
    QObject::connect(&transfer, &QueryFileTransfer::progress,
                     [](int, qint64 position, qint64 total) {
                         LOG_VERBOSE() << "FT: Progress" << position << "/" << total;
                     });

    QFile file(localPath);
    QueryTransferResult result;
    QueryError error;

    if (isUpload) {
        if (!file.open(QIODevice::ReadOnly)) {
            err() << "Cannot open " << localPath << ": " << file.errorString() << Qt::endl;
            return 1;
        }
        if (!transfer.upload(&file, remotePath, channelId, result,
                             QueryUploadOptions{channelPassword, true, false, -1}, &error)) {
            return reportFailure("upload", error);
        }
    } else {
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            err() << "Cannot open " << localPath << ": " << file.errorString() << Qt::endl;
            return 1;
        }
        if (!transfer.download(&file, remotePath, channelId, result,
                               QueryDownloadOptions{channelPassword, 0}, &error)) {
            return reportFailure("download", error);
        }
    }

    out() << "size=" << result.declaredSize
          << " transferred=" << result.bytesTransferred
          << " md5=" << result.checksum << Qt::endl;
    return 0;
}

int runListen(QueryConnection &connection, const QStringList &events, int timeoutMs)
{
    QueryResponse response;
    QueryError error;

    for (const QString &event : events) {
        QueryCommand registration;
        if (connection.profile().kind == QueryProfile::Kind::Server) {
            registration = QueryCommand("servernotifyregister").withParam("event", event);
            if (event == "channel" || event == "textchannel") {
                registration.withParam("id", 0);
            }
        } else {
            registration = QueryCommand("clientnotifyregister")
                               .withParam("schandlerid", 1)
                               .withParam("event", event);
        }
        if (!connection.exec(registration, response, timeoutMs, &error)) {
            return reportFailure(QStringLiteral("register %1").arg(event), error);
        }
    }

    // Incoming events do not reset the server's idle timer, so the receive
    // thread sends keepalives on a fixed schedule while listening
    if (connection.keepaliveInterval() == 0) {
        connection.setKeepaliveInterval(QueryProfile::IdleTimeoutMs / 2);
    }

    QueryEvent event;
    while (true) {
        if (connection.waitForEvent(event, QueryProfile::IdleTimeoutMs, &error)) {
            for (const QueryRecord &record : event.records()) {
                out() << event.name() << " " << record.toString() << Qt::endl;
            }
            continue;
        }
        if (error.kind != QueryErrorKind::Timeout) {
            return reportFailure("listen", error);
        }
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("tsquery");
    app.setApplicationVersion(TSQUERY_VERSION);
    app.setOrganizationName("tsquery");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Command line client for the TeamSpeak 3 query interface");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "Query command: VERB [-option] [key=value ...]",
                                 "[command...]");

    QCommandLineOption verboseOption(QStringList() << "V" << "verbose",
                                     "Enable verbose logging output");
    QCommandLineOption configOption(QStringList() << "c" << "config",
                                    "Read connection settings from an INI file", "file");
    QCommandLineOption hostOption(QStringList() << "H" << "host", "Query host", "host");
    QCommandLineOption portOption(QStringList() << "p" << "port", "Query port", "port");
    QCommandLineOption clientOption("client", "Use the ClientQuery interface");
    QCommandLineOption userOption(QStringList() << "u" << "user", "ServerQuery login name", "name");
    QCommandLineOption passwordOption("password", "ServerQuery login password", "password");
    QCommandLineOption apiKeyOption("apikey", "ClientQuery API key", "key");
    QCommandLineOption serverIdOption(QStringList() << "s" << "server-id",
                                      "Virtual server to select", "sid");
    QCommandLineOption timeoutOption(QStringList() << "t" << "timeout",
                                     "Response timeout in milliseconds", "ms");
    QCommandLineOption listenOption(QStringList() << "l" << "listen",
                                    "Register for an event class and print events", "event");
    QCommandLineOption uploadOption("upload", "Upload a file", "local:remote");
    QCommandLineOption downloadOption("download", "Download a file", "remote:local");
    QCommandLineOption channelOption("cid", "Channel for file transfers", "cid", "0");
    QCommandLineOption channelPasswordOption("cpw", "Channel password for file transfers",
                                             "password");

    parser.addOptions({verboseOption, configOption, hostOption, portOption, clientOption,
                       userOption, passwordOption, apiKeyOption, serverIdOption,
                       timeoutOption, listenOption, uploadOption, downloadOption,
                       channelOption, channelPasswordOption});

    parser.process(app);

    // Set verbose logging flag
    tsquery::verboseLogging = parser.isSet(verboseOption);

    if (tsquery::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    QuerySettings settings;
    if (parser.isSet(configOption)) {
        QString path = parser.value(configOption);
        if (!QFile::exists(path)) {
            err() << "Config file not found: " << path << Qt::endl;
            return 1;
        }
        QSettings file(path, QSettings::IniFormat);
        settings.load(file);
    }

    if (parser.isSet(hostOption)) {
        settings.host = parser.value(hostOption);
    }
    if (parser.isSet(portOption)) {
        settings.port = static_cast<quint16>(parser.value(portOption).toUInt());
    }
    if (parser.isSet(clientOption)) {
        settings.profileName = "client";
    }
    if (parser.isSet(userOption)) {
        settings.user = parser.value(userOption);
    }
    if (parser.isSet(passwordOption)) {
        settings.password = parser.value(passwordOption);
    }
    if (parser.isSet(apiKeyOption)) {
        settings.apiKey = parser.value(apiKeyOption);
    }
    if (parser.isSet(serverIdOption)) {
        settings.serverId = parser.value(serverIdOption).toInt();
    }
    if (parser.isSet(timeoutOption)) {
        settings.timeoutMs = parser.value(timeoutOption).toInt();
    }

    const QStringList tokens = parser.positionalArguments();
    const bool transferRequested = parser.isSet(uploadOption) || parser.isSet(downloadOption);
    if (tokens.isEmpty() && !transferRequested && !parser.isSet(listenOption)) {
        parser.showHelp(1);
    }

    QueryCommand command = QueryCommand::fromArguments(tokens);
    if (!tokens.isEmpty() && !command.isValid()) {
        err() << "Invalid command: " << tokens.join(' ') << Qt::endl;
        return 1;
    }

    QueryConnection connection(settings.profile());
    connection.setKeepaliveInterval(settings.keepaliveIntervalMs);

    QueryError error;
    if (!connection.connectToHost(settings.host, settings.effectivePort(),
                                  settings.timeoutMs, &error)) {
        return reportFailure("connect", error);
    }

    if (!authenticate(connection, settings, settings.timeoutMs, &error)) {
        return reportFailure("login", error);
    }

    int result = 0;

    if (!tokens.isEmpty()) {
        QueryResponse response;
        bool ok = connection.exec(command, response, settings.timeoutMs, &error);
        printResponse(response);
        if (!ok) {
            result = reportFailure(command.verb(), error);
        }
    }

    int channelId = parser.value(channelOption).toInt();
    QString channelPassword = parser.value(channelPasswordOption);

    if (result == 0 && parser.isSet(uploadOption)) {
        result = runTransfer(connection, parser.value(uploadOption), true,
                             channelId, channelPassword, settings.timeoutMs);
    }
    if (result == 0 && parser.isSet(downloadOption)) {
        result = runTransfer(connection, parser.value(downloadOption), false,
                             channelId, channelPassword, settings.timeoutMs);
    }
    if (result == 0 && parser.isSet(listenOption)) {
        result = runListen(connection, parser.values(listenOption), settings.timeoutMs);
    }

    connection.close();
    return result;
}
