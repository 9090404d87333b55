#include "datachannelserver.h"

#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>

#include <memory>

DataChannelServer::DataChannelServer(Mode mode, const QByteArray &key, QObject *parent)
    : QThread(parent)
    , mode_(mode)
    , key_(key)
{
}

bool DataChannelServer::waitUntilListening(int timeoutMs)
{
    return listening_.tryAcquire(1, timeoutMs);
}

void DataChannelServer::run()
{
    QTcpServer server;
    if (!server.listen(QHostAddress::LocalHost, 0)) {
        listening_.release();
        return;
    }
    port_ = server.serverPort();
    listening_.release();

    if (!server.waitForNewConnection(timeoutMs_)) {
        return;
    }
    std::unique_ptr<QTcpSocket> socket(server.nextPendingConnection());
    if (!socket) {
        return;
    }
    accepted_ = true;

    if (mode_ == Mode::Reset) {
        // Closing with unread input makes the kernel answer with RST
        QThread::msleep(100);
        socket->abort();
        return;
    }

    // The client authenticates the transfer with the key before any data
    QByteArray buffer;
    while (buffer.size() < key_.size()) {
        if (socket->bytesAvailable() == 0 && !socket->waitForReadyRead(timeoutMs_)) {
            break;
        }
        buffer.append(socket->readAll());
    }
    receivedKey_ = buffer.left(key_.size());
    QByteArray leftover = buffer.mid(key_.size());

    if (receivedKey_ != key_) {
        socket->abort();
        return;
    }

    if (mode_ == Mode::Receive) {
        received_ = leftover;
        while (socket->waitForReadyRead(timeoutMs_) || socket->bytesAvailable() > 0) {
            received_.append(socket->readAll());
        }
        received_.append(socket->readAll());
        return;
    }

    socket->write(payload_);
    while (socket->bytesToWrite() > 0) {
        if (!socket->waitForBytesWritten(timeoutMs_)) {
            break;
        }
    }
    socket->disconnectFromHost();
    if (socket->state() != QAbstractSocket::UnconnectedState) {
        socket->waitForDisconnected(timeoutMs_);
    }
}
