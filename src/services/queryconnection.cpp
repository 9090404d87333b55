#include "queryconnection.h"
#include "utils/logging.h"

#include <QDeadlineTimer>
#include <QHostAddress>
#include <QMutexLocker>
#include <QTcpSocket>
#include <QThread>

namespace {

QDeadlineTimer deadlineFor(int timeoutMs)
{
    if (timeoutMs < 0) {
        return QDeadlineTimer(QDeadlineTimer::Forever);
    }
    return QDeadlineTimer(timeoutMs);
}

} // namespace

QueryConnection::QueryConnection(const QueryProfile &profile, QObject *parent)
    : IQueryConnection(parent)
    , profile_(profile)
{
    qRegisterMetaType<QueryEvent>();
}

QueryConnection::~QueryConnection()
{
    close();
}

bool QueryConnection::connectToHost(const QString &host, quint16 port, int timeoutMs,
                                    QueryError *error)
{
    if (thread_ || closed_) {
        return setQueryError(error, QueryError(QueryErrorKind::Usage,
                                               tr("Connection already used")));
    }

    if (port == 0) {
        port = profile_.defaultPort;
    }

    qDebug() << "Query: Connecting to" << host << ":" << port;

    auto *socket = new QTcpSocket();
    socket->connectToHost(host, port);
    if (!socket->waitForConnected(timeoutMs)) {
        QueryError failure(QueryErrorKind::Transport,
                           tr("Cannot connect to %1:%2: %3")
                               .arg(host).arg(port).arg(socket->errorString()));
        delete socket;
        logQueryError(QStringLiteral("Connect"), failure);
        return setQueryError(error, failure);
    }

    host_ = host;
    return open(socket, timeoutMs, error);
}

bool QueryConnection::open(QIODevice *device, int timeoutMs, QueryError *error)
{
    if (!device) {
        return setQueryError(error, QueryError(QueryErrorKind::Usage, tr("No device")));
    }
    if (thread_ || closed_) {
        delete device;
        return setQueryError(error, QueryError(QueryErrorKind::Usage,
                                               tr("Connection already used")));
    }
    if (!device->isOpen() || !device->isReadable() || !device->isWritable()) {
        delete device;
        return setQueryError(error, QueryError(QueryErrorKind::Transport,
                                               tr("Device is not open for reading and writing")));
    }

    if (host_.isEmpty()) {
        auto *socket = qobject_cast<QAbstractSocket *>(device);
        if (socket && !socket->peerAddress().isNull()) {
            host_ = socket->peerAddress().toString();
        } else {
            host_ = QStringLiteral("localhost");
        }
    }

    device->setParent(nullptr);

    thread_ = new QThread(this);
    thread_->setObjectName(QStringLiteral("QueryReceiver"));

    receiver_ = new QueryReceiver(&mailbox_, device, profile_.greetingLines);
    receiver_->setKeepalive(profile_.keepaliveCommand, keepaliveIntervalMs_);
    device->moveToThread(thread_);
    receiver_->moveToThread(thread_);

    connect(thread_, &QThread::started, receiver_, &QueryReceiver::attach);
    connect(receiver_, &QueryReceiver::eventArrived, this, &QueryConnection::onReceiverEvent);
    connect(receiver_, &QueryReceiver::failed, this, &QueryConnection::onReceiverFailed);

    thread_->start();

    QMutexLocker locker(&mailbox_.mutex);
    QDeadlineTimer deadline = deadlineFor(timeoutMs);
    while (mailbox_.state == State::Disconnected) {
        if (!mailbox_.stateChanged.wait(&mailbox_.mutex, deadline)) {
            break;
        }
    }

    if (mailbox_.state == State::Connected) {
        locker.unlock();
        qDebug() << "Query: Connected to" << host_ << "using" << profile_.name << "profile";
        emit stateChanged(State::Connected);
        return true;
    }

    QueryError failure = mailbox_.state == State::Closing
                             ? mailbox_.failure
                             : QueryError(QueryErrorKind::Timeout,
                                          tr("No greeting received within %1 ms").arg(timeoutMs));
    locker.unlock();

    // A connection that never completed its greeting cannot be used
    close();
    return setQueryError(error, failure);
}

bool QueryConnection::send(const QueryCommand &command, ResponseMode mode, QueryError *error)
{
    if (!command.isValid()) {
        return setQueryError(error, QueryError(QueryErrorKind::Usage,
                                               tr("Invalid command: %1").arg(command.verb())));
    }
    if (validateCommands_ && !profile_.supportsCommand(command.verb())) {
        return setQueryError(error, QueryError(QueryErrorKind::Usage,
                                               tr("Unknown %1 query command: %2")
                                                   .arg(profile_.name, command.verb())));
    }

    QueryOutgoing outgoing;
    outgoing.line = command.encode();
    outgoing.trace = command.traceString();
    outgoing.mode = mode;

    QMutexLocker locker(&mailbox_.mutex);
    if (mailbox_.state == State::Disconnected) {
        return setQueryError(error, QueryError(QueryErrorKind::Usage, tr("Not connected")));
    }
    if (mailbox_.state == State::Closing) {
        return setQueryError(error, closedError());
    }
    if (mode == ResponseMode::Collect) {
        ++mailbox_.awaiting;
    }

    // Posting under the mailbox lock keeps close() from tearing the receiver down meanwhile
    QueryReceiver *receiver = receiver_;
    QMetaObject::invokeMethod(receiver, [receiver, outgoing]() {
        receiver->enqueue(outgoing);
    }, Qt::QueuedConnection);
    return true;
}

bool QueryConnection::receive(QueryResponse &response, int timeoutMs, QueryError *error)
{
    QMutexLocker locker(&mailbox_.mutex);
    QDeadlineTimer deadline = deadlineFor(timeoutMs);

    while (mailbox_.responses.isEmpty()) {
        if (mailbox_.state == State::Closing) {
            return setQueryError(error, closedError());
        }
        if (mailbox_.state == State::Disconnected) {
            return setQueryError(error, QueryError(QueryErrorKind::Usage, tr("Not connected")));
        }
        if (mailbox_.awaiting == 0) {
            return setQueryError(error, QueryError(QueryErrorKind::Usage,
                                                   tr("No command is awaiting a response")));
        }
        if (!mailbox_.responseReady.wait(&mailbox_.mutex, deadline)
            && mailbox_.responses.isEmpty()) {
            if (mailbox_.state == State::Closing) {
                return setQueryError(error, closedError());
            }
            return setQueryError(error, QueryError(QueryErrorKind::Timeout,
                                                   tr("No response within %1 ms").arg(timeoutMs)));
        }
    }

    response = mailbox_.responses.dequeue();
    --mailbox_.awaiting;
    return true;
}

bool QueryConnection::exec(const QueryCommand &command, QueryResponse &response,
                           int timeoutMs, QueryError *error)
{
    if (!send(command, ResponseMode::Collect, error)) {
        return false;
    }
    if (!receive(response, timeoutMs, error)) {
        return false;
    }
    if (!response.isSuccess()) {
        return setQueryError(error, QueryError(QueryErrorKind::Command,
                                               response.status().message,
                                               response.status().code));
    }
    return true;
}

bool QueryConnection::waitForEvent(QueryEvent &event, int timeoutMs, QueryError *error)
{
    QMutexLocker locker(&mailbox_.mutex);
    QDeadlineTimer deadline = deadlineFor(timeoutMs);

    while (mailbox_.events.isEmpty()) {
        if (mailbox_.state == State::Closing) {
            return setQueryError(error, closedError());
        }
        if (!mailbox_.eventReady.wait(&mailbox_.mutex, deadline)
            && mailbox_.events.isEmpty()) {
            if (mailbox_.state == State::Closing) {
                return setQueryError(error, closedError());
            }
            return setQueryError(error, QueryError(QueryErrorKind::Timeout,
                                                   tr("No event within %1 ms").arg(timeoutMs)));
        }
    }

    event = mailbox_.events.dequeue();
    return true;
}

bool QueryConnection::sendKeepalive(QueryError *error)
{
    return send(QueryCommand(profile_.keepaliveCommand), ResponseMode::Discard, error);
}

void QueryConnection::close()
{
    if (closed_) {
        return;
    }
    closed_ = true;

    State previous;
    {
        QMutexLocker locker(&mailbox_.mutex);
        previous = mailbox_.state;
        mailbox_.state = State::Closing;
        mailbox_.responses.clear();
        mailbox_.events.clear();
        mailbox_.awaiting = 0;
        if (!mailbox_.failure.isError()) {
            mailbox_.failure = QueryError(QueryErrorKind::Transport, tr("Connection closed"));
        }
        mailbox_.responseReady.wakeAll();
        mailbox_.eventReady.wakeAll();
        mailbox_.stateChanged.wakeAll();
    }

    if (thread_) {
        QMetaObject::invokeMethod(receiver_, &QueryReceiver::shutdown,
                                  Qt::BlockingQueuedConnection);
        thread_->quit();
        thread_->wait();
        delete receiver_;
        receiver_ = nullptr;
        delete thread_;
        thread_ = nullptr;
    }

    if (previous != State::Closing) {
        qDebug() << "Query: Connection to" << host_ << "closed";
        emit stateChanged(State::Closing);
        emit disconnected();
    }
}

IQueryConnection::State QueryConnection::state() const
{
    QMutexLocker locker(&mailbox_.mutex);
    return mailbox_.state;
}

bool QueryConnection::isConnected() const
{
    return state() == State::Connected;
}

void QueryConnection::setKeepaliveInterval(int intervalMs)
{
    keepaliveIntervalMs_ = qMax(0, intervalMs);
    if (receiver_) {
        QueryReceiver *receiver = receiver_;
        QString command = profile_.keepaliveCommand;
        int interval = keepaliveIntervalMs_;
        QMetaObject::invokeMethod(receiver, [receiver, command, interval]() {
            receiver->setKeepalive(command, interval);
        }, Qt::QueuedConnection);
    }
}

int QueryConnection::pendingEventCount() const
{
    QMutexLocker locker(&mailbox_.mutex);
    return static_cast<int>(mailbox_.events.size());
}

int QueryConnection::outstandingResponseCount() const
{
    QMutexLocker locker(&mailbox_.mutex);
    return mailbox_.awaiting;
}

void QueryConnection::onReceiverEvent(const QueryEvent &event)
{
    emit eventReceived(event);
}

void QueryConnection::onReceiverFailed(const QString &message)
{
    emit error(message);
    emit stateChanged(State::Closing);
    emit disconnected();
}

QueryError QueryConnection::closedError() const
{
    // Called with mailbox_.mutex held
    if (mailbox_.failure.isError()) {
        return mailbox_.failure;
    }
    return QueryError(QueryErrorKind::Transport, tr("Connection closed"));
}
