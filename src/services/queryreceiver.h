/**
 * @file queryreceiver.h
 * @brief Receive-thread worker that owns the query connection's stream.
 */

#ifndef QUERYRECEIVER_H
#define QUERYRECEIVER_H

#include <QByteArray>
#include <QMutex>
#include <QObject>
#include <QQueue>
#include <QString>
#include <QStringList>
#include <QWaitCondition>

#include "iqueryconnection.h"
#include "queryerror.h"
#include "queryeventclassifier.h"
#include "queryresponse.h"

class QIODevice;
class QTimer;

/**
 * @brief State shared between caller threads and the receive thread.
 *
 * Every field is guarded by @c mutex. The receive thread publishes
 * completed responses and events; callers consume them.
 */
struct QueryMailbox {
    QMutex mutex;
    QWaitCondition responseReady;
    QWaitCondition eventReady;
    QWaitCondition stateChanged;

    IQueryConnection::State state = IQueryConnection::State::Disconnected;
    QQueue<QueryResponse> responses;
    QQueue<QueryEvent> events;
    int awaiting = 0;      ///< Collected commands not yet claimed by receive()
    QueryError failure;    ///< Why the connection reached Closing
};

/**
 * @brief A command line queued for transmission.
 */
struct QueryOutgoing {
    QString line;                 ///< Encoded command, without terminator
    QString trace;                ///< Same line with credentials masked
    IQueryConnection::ResponseMode mode = IQueryConnection::ResponseMode::Collect;
};

/**
 * @brief Runs the read loop and serialises writes for one connection.
 *
 * Lives in the connection's dedicated QThread and is the only object that
 * touches the stream. It writes one queued command at a time and sends the
 * next only after the previous command's status line has arrived, so the
 * Nth response always belongs to the Nth command written.
 */
class QueryReceiver : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a receiver.
     * @param mailbox Shared state; must outlive the receiver.
     * @param device Open stream; ownership is taken.
     * @param greetingLines Lines to skip before the connection is ready.
     */
    QueryReceiver(QueryMailbox *mailbox, QIODevice *device, int greetingLines);
    ~QueryReceiver() override;

public slots:
    /**
     * @brief Configures the automatic keepalive.
     * @param command Command sent when the timer fires.
     * @param intervalMs Interval, 0 disables.
     */
    void setKeepalive(const QString &command, int intervalMs);

    /**
     * @brief Connects to the stream's signals. Runs in the receive thread.
     */
    void attach();

    /**
     * @brief Appends a command to the write queue.
     */
    void enqueue(const QueryOutgoing &outgoing);

    /**
     * @brief Sends "quit" and releases the stream. Runs in the receive thread.
     */
    void shutdown();

signals:
    /**
     * @brief Emitted for every event after it has been queued.
     */
    void eventArrived(const QueryEvent &event);

    /**
     * @brief Emitted once when a transport or parse failure closes the stream.
     */
    void failed(const QString &message);

private slots:
    void onReadyRead();
    void onReadChannelFinished();
    void onSocketError();
    void onKeepaliveTimer();

private:
    void processLine(const QString &line);
    void completeResponse();
    void writeNext();
    void markConnected();
    void fail(const QueryError &error);

    QueryMailbox *mailbox_;
    QIODevice *device_;
    QueryEventClassifier classifier_;
    bool failed_ = false;

    QByteArray buffer_;
    int greetingRemaining_;

    QQueue<QueryOutgoing> writeQueue_;
    bool inFlight_ = false;
    QueryOutgoing current_;
    QStringList responseLines_;

    QTimer *keepaliveTimer_ = nullptr;
    QString keepaliveCommand_;
    int keepaliveIntervalMs_ = 0;

    static constexpr int QuitFlushTimeoutMs = 500;
};

#endif // QUERYRECEIVER_H
