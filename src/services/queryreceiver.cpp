#include "queryreceiver.h"
#include "utils/logging.h"

#include <QAbstractSocket>
#include <QIODevice>
#include <QMutexLocker>
#include <QTimer>

QueryReceiver::QueryReceiver(QueryMailbox *mailbox, QIODevice *device, int greetingLines)
    : QObject(nullptr)
    , mailbox_(mailbox)
    , device_(device)
    , greetingRemaining_(greetingLines)
{
}

QueryReceiver::~QueryReceiver()
{
    // shutdown() normally releases the device in the receive thread
    delete device_;
}

void QueryReceiver::setKeepalive(const QString &command, int intervalMs)
{
    keepaliveCommand_ = command;
    keepaliveIntervalMs_ = intervalMs;

    if (!keepaliveTimer_) {
        return;
    }
    if (intervalMs > 0) {
        keepaliveTimer_->start(intervalMs);
    } else {
        keepaliveTimer_->stop();
    }
}

void QueryReceiver::attach()
{
    connect(device_, &QIODevice::readyRead, this, &QueryReceiver::onReadyRead);
    connect(device_, &QIODevice::readChannelFinished,
            this, &QueryReceiver::onReadChannelFinished);

    if (auto *socket = qobject_cast<QAbstractSocket *>(device_)) {
        connect(socket, &QAbstractSocket::errorOccurred, this, &QueryReceiver::onSocketError);
        connect(socket, &QAbstractSocket::disconnected,
                this, &QueryReceiver::onReadChannelFinished);
    }

    keepaliveTimer_ = new QTimer(this);
    connect(keepaliveTimer_, &QTimer::timeout, this, &QueryReceiver::onKeepaliveTimer);
    if (keepaliveIntervalMs_ > 0) {
        keepaliveTimer_->start(keepaliveIntervalMs_);
    }

    if (greetingRemaining_ <= 0) {
        markConnected();
    }

    // Data may have arrived before the signals were connected
    if (device_->bytesAvailable() > 0) {
        onReadyRead();
    }
}

void QueryReceiver::enqueue(const QueryOutgoing &outgoing)
{
    if (!device_ || failed_) {
        return;
    }
    writeQueue_.enqueue(outgoing);
    writeNext();
}

void QueryReceiver::shutdown()
{
    if (keepaliveTimer_) {
        keepaliveTimer_->stop();
    }
    writeQueue_.clear();

    if (!device_) {
        return;
    }

    disconnect(device_, nullptr, this, nullptr);

    if (device_->isOpen() && device_->isWritable()) {
        LOG_SENT() << "quit";
        device_->write("quit\n");
        if (auto *socket = qobject_cast<QAbstractSocket *>(device_)) {
            socket->waitForBytesWritten(QuitFlushTimeoutMs);
            socket->disconnectFromHost();
        }
    }
    device_->close();

    delete device_;
    device_ = nullptr;
}

void QueryReceiver::onReadyRead()
{
    if (!device_ || failed_) {
        return;
    }

    buffer_.append(device_->readAll());

    qsizetype newline;
    while ((newline = buffer_.indexOf('\n')) >= 0) {
        QByteArray raw = buffer_.left(newline);
        buffer_.remove(0, newline + 1);

        // Servers terminate lines with "\n\r", so the CR leads the next line
        QString line = QString::fromUtf8(raw);
        while (line.startsWith(QLatin1Char('\r'))) {
            line.remove(0, 1);
        }
        while (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
        if (line.isEmpty()) {
            continue;
        }

        processLine(line);
        if (failed_) {
            buffer_.clear();
            return;
        }
    }
}

void QueryReceiver::onReadChannelFinished()
{
    if (device_ && device_->bytesAvailable() > 0) {
        onReadyRead();
    }
    if (failed_) {
        return;
    }
    fail(QueryError(QueryErrorKind::Transport, tr("Connection closed by remote host")));
}

void QueryReceiver::onSocketError()
{
    auto *socket = qobject_cast<QAbstractSocket *>(device_);
    QString message = socket ? socket->errorString() : tr("Socket error");
    fail(QueryError(QueryErrorKind::Transport, message));
}

void QueryReceiver::onKeepaliveTimer()
{
    if (keepaliveCommand_.isEmpty()) {
        return;
    }
    QueryOutgoing keepalive;
    keepalive.line = keepaliveCommand_;
    keepalive.trace = keepaliveCommand_;
    keepalive.mode = IQueryConnection::ResponseMode::Discard;
    enqueue(keepalive);
}

void QueryReceiver::processLine(const QString &line)
{
    LOG_RECEIVED() << line;

    if (greetingRemaining_ > 0) {
        if (--greetingRemaining_ == 0) {
            markConnected();
        }
        return;
    }

    switch (classifier_.classify(line, inFlight_)) {
    case QueryEventClassifier::LineKind::Event: {
        QueryEvent event;
        QString message;
        if (!QueryResponseParser::parseEvent(line, event, &message)) {
            fail(QueryError(QueryErrorKind::Parse, message));
            return;
        }
        {
            QMutexLocker locker(&mailbox_->mutex);
            mailbox_->events.enqueue(event);
            mailbox_->eventReady.wakeAll();
        }
        emit eventArrived(event);
        break;
    }
    case QueryEventClassifier::LineKind::ResponseData:
        responseLines_.append(line);
        break;
    case QueryEventClassifier::LineKind::Status:
        if (!inFlight_) {
            qDebug() << "Query: Dropping status line with no command in flight:" << line;
            return;
        }
        responseLines_.append(line);
        completeResponse();
        break;
    }
}

void QueryReceiver::completeResponse()
{
    QueryResponse response;
    QString message;
    bool ok = QueryResponseParser::parseResponse(responseLines_, response, &message);
    responseLines_.clear();
    inFlight_ = false;

    if (!ok) {
        fail(QueryError(QueryErrorKind::Parse, message));
        return;
    }

    if (!response.isSuccess()) {
        LOG_VERBOSE() << "Query: Command" << current_.trace.section(QLatin1Char(' '), 0, 0)
                      << "returned status" << response.status().code
                      << response.status().message;
    }

    if (current_.mode == IQueryConnection::ResponseMode::Collect) {
        QMutexLocker locker(&mailbox_->mutex);
        mailbox_->responses.enqueue(response);
        mailbox_->responseReady.wakeAll();
    }

    writeNext();
}

void QueryReceiver::writeNext()
{
    if (inFlight_ || greetingRemaining_ > 0 || writeQueue_.isEmpty() || !device_) {
        return;
    }

    current_ = writeQueue_.dequeue();
    inFlight_ = true;

    LOG_SENT() << current_.trace;
    QByteArray data = current_.line.toUtf8();
    data.append('\n');
    if (device_->write(data) != data.size()) {
        fail(QueryError(QueryErrorKind::Transport,
                        tr("Write failed: %1").arg(device_->errorString())));
    }
}

void QueryReceiver::markConnected()
{
    QMutexLocker locker(&mailbox_->mutex);
    if (mailbox_->state == IQueryConnection::State::Disconnected) {
        mailbox_->state = IQueryConnection::State::Connected;
        mailbox_->stateChanged.wakeAll();
    }
    locker.unlock();

    writeNext();
}

void QueryReceiver::fail(const QueryError &error)
{
    if (failed_) {
        return;
    }
    failed_ = true;
    writeQueue_.clear();
    inFlight_ = false;
    responseLines_.clear();
    if (keepaliveTimer_) {
        keepaliveTimer_->stop();
    }

    {
        QMutexLocker locker(&mailbox_->mutex);
        if (mailbox_->state == IQueryConnection::State::Closing) {
            return;
        }
        mailbox_->state = IQueryConnection::State::Closing;
        mailbox_->failure = error;
        mailbox_->awaiting = static_cast<int>(mailbox_->responses.size());
        mailbox_->responseReady.wakeAll();
        mailbox_->eventReady.wakeAll();
        mailbox_->stateChanged.wakeAll();
    }

    logQueryError(QStringLiteral("Connection"), error);
    emit failed(error.message);
}
