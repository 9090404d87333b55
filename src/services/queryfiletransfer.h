/**
 * @file queryfiletransfer.h
 * @brief Uploads and downloads through the server's file transfer interface.
 */

#ifndef QUERYFILETRANSFER_H
#define QUERYFILETRANSFER_H

#include <QAtomicInt>
#include <QByteArray>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

#include "iqueryconnection.h"
#include "queryfileentry.h"

class QIODevice;
class QTcpSocket;

/**
 * @brief Parameters of ftinitupload.
 */
struct QueryUploadOptions {
    QString channelPassword;
    bool overwrite = true;
    bool resume = false;       ///< Ask the server to continue a partial upload
    qint64 declaredSize = -1;  ///< Bytes to announce; -1 uses the source's size
};

/**
 * @brief Parameters of ftinitdownload.
 */
struct QueryDownloadOptions {
    QString channelPassword;
    qint64 seekPosition = 0;   ///< Byte offset to resume from
};

/**
 * @brief Figures of a finished (or failed) transfer session.
 */
struct QueryTransferResult {
    enum class Direction {
        Upload,
        Download
    };

    int transferId = 0;
    Direction direction = Direction::Upload;
    qint64 declaredSize = 0;       ///< Total file size announced for the transfer
    qint64 startOffset = 0;        ///< Position the data phase started at
    qint64 bytesTransferred = 0;   ///< Bytes moved over the data connection
    QByteArray checksum;           ///< Hex MD5 of the bytes moved
    QByteArray expectedChecksum;   ///< Hex MD5 reported by the server, if any

    [[nodiscard]] bool isComplete() const { return startOffset + bytesTransferred == declaredSize; }
};

/**
 * @brief File transfer engine.
 *
 * A transfer is negotiated over the query connection (ftinitupload or
 * ftinitdownload), which yields a transfer key and a port. The engine then
 * opens a separate TCP data connection, sends the key and copies the raw
 * bytes in BlockSize chunks, hashing them as they pass.
 *
 * The data phase runs in the calling thread and blocks until the transfer
 * ends. Each call creates its own session with a process-wide unique
 * transfer id and its own socket, so transfers on different threads never
 * share state.
 *
 * @par Example usage:
 * @code
 * QueryFileTransfer transfer(connection);
 * QFile file("avatar.png");
 * file.open(QIODevice::ReadOnly);
 *
 * QueryTransferResult result;
 * QueryError error;
 * if (!transfer.upload(&file, "/avatar.png", 2, result, {}, &error)) {
 *     logQueryError("upload", error);
 * }
 * @endcode
 */
class QueryFileTransfer : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a file transfer engine.
     * @param connection Query connection used for negotiation (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit QueryFileTransfer(IQueryConnection *connection, QObject *parent = nullptr);

    /// @name Transfers
    /// @{

    /**
     * @brief Uploads the contents of @p source.
     * @param source Open readable device.
     * @param remotePath Destination path inside the channel's repository.
     * @param channelId Channel owning the repository.
     * @param result Receives the session figures, also on failure.
     * @param options ftinitupload parameters.
     * @param error Receives Command, Parse, Transport, Integrity or Usage failures.
     * @return True if the declared size was fully sent.
     */
    bool upload(QIODevice *source, const QString &remotePath, int channelId,
                QueryTransferResult &result,
                const QueryUploadOptions &options = QueryUploadOptions(),
                QueryError *error = nullptr);

    /**
     * @brief Downloads a file into @p sink.
     * @param sink Open writable device.
     * @param remotePath Path inside the channel's repository.
     * @param channelId Channel owning the repository.
     * @param result Receives the session figures, also on failure.
     * @param options ftinitdownload parameters.
     * @param error Receives Command, Parse, Transport, Integrity or Usage failures.
     * @return True if the declared size was received and any reported
     *         checksum matched.
     */
    bool download(QIODevice *sink, const QString &remotePath, int channelId,
                  QueryTransferResult &result,
                  const QueryDownloadOptions &options = QueryDownloadOptions(),
                  QueryError *error = nullptr);
    /// @}

    /// @name Repository Operations
    /// @{
    bool listFiles(int channelId, const QString &path, QList<QueryFileEntry> &entries,
                   const QString &channelPassword = QString(), QueryError *error = nullptr);
    bool makeDirectory(int channelId, const QString &path,
                       const QString &channelPassword = QString(), QueryError *error = nullptr);

    /**
     * @brief Deletes one or more files with a single pipelined command.
     */
    bool remove(int channelId, const QStringList &paths,
                const QString &channelPassword = QString(), QueryError *error = nullptr);
    bool rename(int channelId, const QString &oldPath, const QString &newPath,
                const QString &channelPassword = QString(), QueryError *error = nullptr);
    /// @}

    void setTimeout(int timeoutMs) { timeoutMs_ = timeoutMs; }
    [[nodiscard]] int timeout() const { return timeoutMs_; }

    /**
     * @brief Returns a transfer id unique for the lifetime of the process.
     */
    [[nodiscard]] static int nextTransferId();

    /**
     * @brief Picks the data connection host from an "ip" response field.
     *
     * The field is a comma separated list; the first entry is used.
     * "0.0.0.0" and an empty field mean "same host as the query connection".
     *
     * @param ipField Value of the "ip" field (may be empty).
     * @param fallback Host of the query connection.
     * @return The host to connect to.
     */
    [[nodiscard]] static QString hostFromResponse(const QString &ipField, const QString &fallback);

    /**
     * @brief Converts an ftgetfilelist response into file entries.
     */
    [[nodiscard]] static QList<QueryFileEntry> parseFileList(const QueryResponse &response);

    static constexpr int BlockSize = 4096;
    static constexpr int DefaultTimeoutMs = 10000;
    static constexpr int EmptyResultSetError = 1281;

signals:
    /**
     * @brief Emitted when the server accepted a transfer request.
     * @param transferId Client side transfer id.
     * @param response The first record of the ftinit response.
     */
    void transferInitialized(int transferId, const QueryRecord &response);

    /**
     * @brief Emitted after every block.
     * @param transferId Client side transfer id.
     * @param position Absolute file position reached.
     * @param total Declared file size.
     */
    void progress(int transferId, qint64 position, qint64 total);

private:
    bool initTransfer(const QueryCommand &command, int transferId,
                      QueryRecord &record, QueryError *error);
    bool openDataChannel(QTcpSocket &socket, const QueryRecord &record,
                         QueryError *error);
    bool fail(const QString &context, const QueryError &failure, QueryError *error);

    IQueryConnection *connection_;
    int timeoutMs_ = DefaultTimeoutMs;

    static QAtomicInt transferIdCounter_;
};

#endif // QUERYFILETRANSFER_H
