#include "mockquerytransport.h"

#include <QDeadlineTimer>
#include <QMetaObject>
#include <QMutexLocker>

#include <cstring>

MockQueryTransport::MockQueryTransport(QObject *parent)
    : QIODevice(parent)
{
    open(QIODevice::ReadWrite | QIODevice::Unbuffered);
}

qint64 MockQueryTransport::bytesAvailable() const
{
    QMutexLocker locker(&mutex_);
    return inbound_.size() + QIODevice::bytesAvailable();
}

void MockQueryTransport::mockServerWrite(const QByteArray &data)
{
    {
        QMutexLocker locker(&mutex_);
        inbound_.append(data);
    }
    // Emit in the device's own thread
    QMetaObject::invokeMethod(this, [this]() { emit readyRead(); }, Qt::QueuedConnection);
}

void MockQueryTransport::mockRemoteClose()
{
    QMetaObject::invokeMethod(this, [this]() { emit readChannelFinished(); },
                              Qt::QueuedConnection);
}

QStringList MockQueryTransport::mockWaitForClientLines(int count, int timeoutMs)
{
    QMutexLocker locker(&mutex_);
    QDeadlineTimer deadline(timeoutMs);
    while (linesLocked().size() < count) {
        if (!clientWrote_.wait(&mutex_, deadline)) {
            break;
        }
    }
    return linesLocked();
}

QStringList MockQueryTransport::mockGetClientLines() const
{
    QMutexLocker locker(&mutex_);
    return linesLocked();
}

qint64 MockQueryTransport::readData(char *data, qint64 maxSize)
{
    QMutexLocker locker(&mutex_);
    qint64 count = qMin<qint64>(maxSize, inbound_.size());
    memcpy(data, inbound_.constData(), static_cast<size_t>(count));
    inbound_.remove(0, count);
    return count;
}

qint64 MockQueryTransport::writeData(const char *data, qint64 size)
{
    QMutexLocker locker(&mutex_);
    outbound_.append(data, size);
    clientWrote_.wakeAll();
    return size;
}

QStringList MockQueryTransport::linesLocked() const
{
    QStringList lines;
    qsizetype start = 0;
    qsizetype newline;
    while ((newline = outbound_.indexOf('\n', start)) >= 0) {
        lines.append(QString::fromUtf8(outbound_.mid(start, newline - start)));
        start = newline + 1;
    }
    return lines;
}
