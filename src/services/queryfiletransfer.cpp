#include "queryfiletransfer.h"
#include "utils/logging.h"

#include <QCryptographicHash>
#include <QIODevice>
#include <QTcpSocket>

QAtomicInt QueryFileTransfer::transferIdCounter_(1);

namespace {

// Upper bound on unsent data kept in the socket buffer during uploads
constexpr qint64 MaxPendingWrite = 4 * QueryFileTransfer::BlockSize;

} // namespace

QueryFileTransfer::QueryFileTransfer(IQueryConnection *connection, QObject *parent)
    : QObject(parent)
    , connection_(connection)
{
    qRegisterMetaType<QueryRecord>();
}

int QueryFileTransfer::nextTransferId()
{
    return transferIdCounter_.fetchAndAddOrdered(1);
}

QString QueryFileTransfer::hostFromResponse(const QString &ipField, const QString &fallback)
{
    QString host = ipField.section(QLatin1Char(','), 0, 0).trimmed();
    if (host.isEmpty() || host == QLatin1String("0.0.0.0")) {
        return fallback;
    }
    return host;
}

QList<QueryFileEntry> QueryFileTransfer::parseFileList(const QueryResponse &response)
{
    QList<QueryFileEntry> entries;

    for (const QueryRecord &record : response) {
        QueryFileEntry entry;
        entry.name = record.value(QStringLiteral("name"));
        if (entry.name.isEmpty()) {
            continue;
        }
        entry.path = record.value(QStringLiteral("path"));
        entry.channelId = record.intValue(QStringLiteral("cid"));
        // type 0 is a directory, 1 a file
        entry.isDirectory = record.value(QStringLiteral("type")) == QLatin1String("0");
        entry.size = entry.isDirectory ? 0 : record.int64Value(QStringLiteral("size"));

        bool ok = false;
        qint64 seconds = record.int64Value(QStringLiteral("datetime"), &ok);
        if (ok) {
            entry.modified = QDateTime::fromSecsSinceEpoch(seconds);
        }
        entries.append(entry);
    }

    return entries;
}

bool QueryFileTransfer::upload(QIODevice *source, const QString &remotePath, int channelId,
                               QueryTransferResult &result, const QueryUploadOptions &options,
                               QueryError *error)
{
    result = QueryTransferResult();
    result.direction = QueryTransferResult::Direction::Upload;

    if (!source || !source->isOpen() || !source->isReadable()) {
        return fail(QStringLiteral("Upload"),
                    QueryError(QueryErrorKind::Usage, tr("Upload source is not readable")), error);
    }

    qint64 declaredSize = options.declaredSize >= 0 ? options.declaredSize : source->size();
    if (declaredSize < 0 || (source->isSequential() && options.declaredSize < 0)) {
        return fail(QStringLiteral("Upload"),
                    QueryError(QueryErrorKind::Usage,
                               tr("Size of a sequential source must be declared")), error);
    }

    result.transferId = nextTransferId();
    result.declaredSize = declaredSize;

    QueryCommand command = QueryCommand(QStringLiteral("ftinitupload"))
                               .withParam(QStringLiteral("clientftfid"), result.transferId)
                               .withParam(QStringLiteral("name"), remotePath)
                               .withParam(QStringLiteral("cid"), channelId)
                               .withParam(QStringLiteral("cpw"), options.channelPassword)
                               .withParam(QStringLiteral("size"), declaredSize)
                               .withFlag(QStringLiteral("overwrite"), options.overwrite)
                               .withFlag(QStringLiteral("resume"), options.resume);

    QueryRecord record;
    if (!initTransfer(command, result.transferId, record, error)) {
        return false;
    }

    bool ok = false;
    qint64 seekPosition = record.int64Value(QStringLiteral("seekpos"), &ok);
    if (!ok || seekPosition < 0) {
        return fail(QStringLiteral("Upload"),
                    QueryError(QueryErrorKind::Parse, tr("ftinitupload response without seekpos")),
                    error);
    }
    if (seekPosition > declaredSize) {
        return fail(QStringLiteral("Upload"),
                    QueryError(QueryErrorKind::Integrity,
                               tr("Server resume position %1 is beyond the file size %2")
                                   .arg(seekPosition).arg(declaredSize)), error);
    }
    result.startOffset = seekPosition;

    // Position the source at the server's resume offset
    if (seekPosition > 0) {
        bool positioned = source->isSequential()
                              ? source->skip(seekPosition) == seekPosition
                              : source->seek(seekPosition);
        if (!positioned) {
            return fail(QStringLiteral("Upload"),
                        QueryError(QueryErrorKind::Usage,
                                   tr("Cannot position source at %1").arg(seekPosition)), error);
        }
    }

    QTcpSocket socket;
    if (!openDataChannel(socket, record, error)) {
        return false;
    }

    qDebug() << "FT: Uploading" << remotePath << "from offset" << seekPosition
             << "size" << declaredSize << "id" << result.transferId;

    QCryptographicHash hash(QCryptographicHash::Md5);
    const qint64 remaining = declaredSize - seekPosition;
    qint64 sent = 0;       // Handed to the socket
    qint64 delivered = 0;  // Flushed to the network
    bool socketFailed = false;
    QString interruption;

    connect(&socket, &QTcpSocket::bytesWritten, this, [&delivered](qint64 bytes) {
        delivered += bytes;
    });

    emit progress(result.transferId, seekPosition, declaredSize);

    while (sent < remaining) {
        QByteArray block = source->read(qMin<qint64>(BlockSize, remaining - sent));
        if (block.isEmpty()) {
            interruption = tr("source ended early");
            break;
        }
        if (socket.write(block) != block.size()) {
            socketFailed = true;
            break;
        }
        hash.addData(block);
        sent += block.size();

        while (!socketFailed && socket.bytesToWrite() > MaxPendingWrite) {
            socketFailed = !socket.waitForBytesWritten(timeoutMs_);
        }
        if (socketFailed) {
            break;
        }

        emit progress(result.transferId, seekPosition + sent, declaredSize);
    }

    while (!socketFailed && socket.bytesToWrite() > 0) {
        socketFailed = !socket.waitForBytesWritten(timeoutMs_);
    }

    if (socketFailed) {
        // Whatever is still buffered never reached the peer
        interruption = socket.errorString();
        socket.abort();
        result.bytesTransferred = qMin(sent, delivered);
    } else {
        socket.disconnectFromHost();
        if (socket.state() != QAbstractSocket::UnconnectedState) {
            socket.waitForDisconnected(timeoutMs_);
        }
        result.bytesTransferred = sent;
    }
    result.checksum = hash.result().toHex();

    if (!interruption.isEmpty() || !result.isComplete()) {
        return fail(QStringLiteral("Upload"),
                    QueryError(QueryErrorKind::Integrity,
                               tr("Upload incomplete: sent %1 of %2 bytes (%3)")
                                   .arg(seekPosition + result.bytesTransferred).arg(declaredSize)
                                   .arg(interruption.isEmpty() ? tr("connection lost")
                                                               : interruption)), error);
    }

    qDebug() << "FT: Upload of" << remotePath << "complete," << sent << "bytes, md5" << result.checksum;
    return true;
}

bool QueryFileTransfer::download(QIODevice *sink, const QString &remotePath, int channelId,
                                 QueryTransferResult &result, const QueryDownloadOptions &options,
                                 QueryError *error)
{
    result = QueryTransferResult();
    result.direction = QueryTransferResult::Direction::Download;

    if (!sink || !sink->isOpen() || !sink->isWritable()) {
        return fail(QStringLiteral("Download"),
                    QueryError(QueryErrorKind::Usage, tr("Download target is not writable")), error);
    }
    if (options.seekPosition < 0) {
        return fail(QStringLiteral("Download"),
                    QueryError(QueryErrorKind::Usage, tr("Seek position must not be negative")),
                    error);
    }

    result.transferId = nextTransferId();
    result.startOffset = options.seekPosition;

    QueryCommand command = QueryCommand(QStringLiteral("ftinitdownload"))
                               .withParam(QStringLiteral("clientftfid"), result.transferId)
                               .withParam(QStringLiteral("name"), remotePath)
                               .withParam(QStringLiteral("cid"), channelId)
                               .withParam(QStringLiteral("cpw"), options.channelPassword)
                               .withParam(QStringLiteral("seekpos"), options.seekPosition);

    QueryRecord record;
    if (!initTransfer(command, result.transferId, record, error)) {
        return false;
    }

    bool ok = false;
    qint64 totalSize = record.int64Value(QStringLiteral("size"), &ok);
    if (!ok || totalSize < 0) {
        return fail(QStringLiteral("Download"),
                    QueryError(QueryErrorKind::Parse, tr("ftinitdownload response without size")),
                    error);
    }
    result.declaredSize = totalSize;
    result.expectedChecksum = record.value(QStringLiteral("checksum")).toLatin1().toLower();

    QTcpSocket socket;
    if (!openDataChannel(socket, record, error)) {
        return false;
    }

    qDebug() << "FT: Downloading" << remotePath << "from offset" << options.seekPosition
             << "size" << totalSize << "id" << result.transferId;

    QCryptographicHash hash(QCryptographicHash::Md5);
    const qint64 expected = totalSize - options.seekPosition;
    qint64 received = 0;

    emit progress(result.transferId, options.seekPosition, totalSize);

    while (received < expected) {
        if (socket.bytesAvailable() == 0 && !socket.waitForReadyRead(timeoutMs_)) {
            if (socket.error() == QAbstractSocket::SocketTimeoutError
                && socket.state() == QAbstractSocket::ConnectedState) {
                socket.abort();
                return fail(QStringLiteral("Download"),
                            QueryError(QueryErrorKind::Transport,
                                       tr("Data connection stalled after %1 bytes")
                                           .arg(options.seekPosition + received)), error);
            }
            break;  // Peer closed
        }

        QByteArray block = socket.read(qMin<qint64>(BlockSize, expected - received));
        if (block.isEmpty()) {
            continue;
        }
        if (sink->write(block) != block.size()) {
            socket.abort();
            return fail(QStringLiteral("Download"),
                        QueryError(QueryErrorKind::Usage,
                                   tr("Cannot write to download target: %1")
                                       .arg(sink->errorString())), error);
        }
        hash.addData(block);
        received += block.size();
        emit progress(result.transferId, options.seekPosition + received, totalSize);
    }

    socket.abort();

    result.bytesTransferred = received;
    result.checksum = hash.result().toHex();

    if (!result.isComplete()) {
        return fail(QStringLiteral("Download"),
                    QueryError(QueryErrorKind::Integrity,
                               tr("Download incomplete: received %1 of %2 bytes")
                                   .arg(options.seekPosition + received).arg(totalSize)), error);
    }

    // A server checksum covers the whole file, so it only applies to full downloads
    if (!result.expectedChecksum.isEmpty() && result.startOffset == 0
        && result.expectedChecksum != result.checksum) {
        return fail(QStringLiteral("Download"),
                    QueryError(QueryErrorKind::Integrity,
                               tr("Checksum mismatch: expected %1, got %2")
                                   .arg(QString::fromLatin1(result.expectedChecksum),
                                        QString::fromLatin1(result.checksum))), error);
    }

    qDebug() << "FT: Download of" << remotePath << "complete," << received << "bytes, md5" << result.checksum;
    return true;
}

bool QueryFileTransfer::listFiles(int channelId, const QString &path,
                                  QList<QueryFileEntry> &entries,
                                  const QString &channelPassword, QueryError *error)
{
    QueryCommand command = QueryCommand(QStringLiteral("ftgetfilelist"))
                               .withParam(QStringLiteral("cid"), channelId)
                               .withParam(QStringLiteral("cpw"), channelPassword)
                               .withParam(QStringLiteral("path"), path);

    QueryResponse response;
    QueryError failure;
    if (!connection_->exec(command, response, timeoutMs_, &failure)) {
        // An empty directory is reported as an empty result set
        if (failure.kind == QueryErrorKind::Command && failure.statusCode == EmptyResultSetError) {
            entries.clear();
            return true;
        }
        return fail(QStringLiteral("List files"), failure, error);
    }

    entries = parseFileList(response);
    return true;
}

bool QueryFileTransfer::makeDirectory(int channelId, const QString &path,
                                      const QString &channelPassword, QueryError *error)
{
    QueryCommand command = QueryCommand(QStringLiteral("ftcreatedir"))
                               .withParam(QStringLiteral("cid"), channelId)
                               .withParam(QStringLiteral("cpw"), channelPassword)
                               .withParam(QStringLiteral("dirname"), path);

    QueryResponse response;
    QueryError failure;
    if (!connection_->exec(command, response, timeoutMs_, &failure)) {
        return fail(QStringLiteral("Create directory"), failure, error);
    }
    return true;
}

bool QueryFileTransfer::remove(int channelId, const QStringList &paths,
                               const QString &channelPassword, QueryError *error)
{
    if (paths.isEmpty()) {
        return true;
    }

    QueryCommand command = QueryCommand(QStringLiteral("ftdeletefile"))
                               .withParam(QStringLiteral("cid"), channelId)
                               .withParam(QStringLiteral("cpw"), channelPassword)
                               .withParam(QStringLiteral("name"), paths);

    QueryResponse response;
    QueryError failure;
    if (!connection_->exec(command, response, timeoutMs_, &failure)) {
        return fail(QStringLiteral("Delete"), failure, error);
    }
    return true;
}

bool QueryFileTransfer::rename(int channelId, const QString &oldPath, const QString &newPath,
                               const QString &channelPassword, QueryError *error)
{
    QueryCommand command = QueryCommand(QStringLiteral("ftrenamefile"))
                               .withParam(QStringLiteral("cid"), channelId)
                               .withParam(QStringLiteral("cpw"), channelPassword)
                               .withParam(QStringLiteral("oldname"), oldPath)
                               .withParam(QStringLiteral("newname"), newPath);

    QueryResponse response;
    QueryError failure;
    if (!connection_->exec(command, response, timeoutMs_, &failure)) {
        return fail(QStringLiteral("Rename"), failure, error);
    }
    return true;
}

bool QueryFileTransfer::initTransfer(const QueryCommand &command, int transferId,
                                     QueryRecord &record, QueryError *error)
{
    QueryResponse response;
    QueryError failure;
    if (!connection_->exec(command, response, timeoutMs_, &failure)) {
        return fail(command.verb(), failure, error);
    }

    std::optional<QueryRecord> first = response.first();
    if (!first) {
        return fail(command.verb(),
                    QueryError(QueryErrorKind::Parse, tr("Empty %1 response").arg(command.verb())),
                    error);
    }

    // File errors are reported inside the record rather than in the status line
    bool ok = false;
    int status = first->intValue(QStringLiteral("status"), &ok);
    if (ok && status != 0) {
        return fail(command.verb(),
                    QueryError(QueryErrorKind::Command,
                               first->value(QStringLiteral("msg"), tr("Transfer rejected")),
                               status), error);
    }

    emit transferInitialized(transferId, *first);
    record = *first;
    return true;
}

bool QueryFileTransfer::openDataChannel(QTcpSocket &socket, const QueryRecord &record,
                                        QueryError *error)
{
    QByteArray key = record.value(QStringLiteral("ftkey")).toUtf8();
    if (key.isEmpty()) {
        return fail(QStringLiteral("Data connection"),
                    QueryError(QueryErrorKind::Parse, tr("Response without ftkey")), error);
    }

    bool ok = false;
    int port = record.intValue(QStringLiteral("port"), &ok);
    if (!ok || port <= 0 || port > 65535) {
        return fail(QStringLiteral("Data connection"),
                    QueryError(QueryErrorKind::Parse, tr("Response without valid port")), error);
    }

    QString host = hostFromResponse(record.value(QStringLiteral("ip")), connection_->host());
    LOG_VERBOSE() << "FT: Data connection to" << host << ":" << port;

    socket.connectToHost(host, static_cast<quint16>(port));
    if (!socket.waitForConnected(timeoutMs_)) {
        QString reason = socket.errorString();
        socket.abort();
        return fail(QStringLiteral("Data connection"),
                    QueryError(QueryErrorKind::Transport,
                               tr("Cannot connect to %1:%2: %3").arg(host).arg(port).arg(reason)),
                    error);
    }

    // The key goes out on its own so the data phase only counts payload bytes
    bool sent = socket.write(key) == key.size();
    while (sent && socket.bytesToWrite() > 0) {
        sent = socket.waitForBytesWritten(timeoutMs_);
    }
    if (!sent) {
        QString reason = socket.errorString();
        socket.abort();
        return fail(QStringLiteral("Data connection"),
                    QueryError(QueryErrorKind::Transport, reason), error);
    }
    return true;
}

bool QueryFileTransfer::fail(const QString &context, const QueryError &failure, QueryError *error)
{
    logQueryError(context, failure);
    return setQueryError(error, failure);
}
