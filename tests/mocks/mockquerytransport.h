/**
 * @file mockquerytransport.h
 * @brief In-memory duplex stream standing in for a query server socket.
 */

#ifndef MOCKQUERYTRANSPORT_H
#define MOCKQUERYTRANSPORT_H

#include <QByteArray>
#include <QIODevice>
#include <QMutex>
#include <QStringList>
#include <QWaitCondition>

/**
 * @brief Scriptable QIODevice playing the server side of a query connection.
 *
 * Tests write server output with mockServerWrite() and inspect what the
 * client sent with mockWaitForClientLines(). The device is thread-safe so
 * the connection's receive thread can read and write it while the test
 * thread scripts the server.
 *
 * The connection takes ownership and deletes the device on close, so keep
 * a QPointer if the test needs to check it afterwards.
 *
 * @par Example usage:
 * @code
 * auto *transport = new MockQueryTransport();
 * transport->mockServerWrite("TS3\n\rWelcome\n\r");
 *
 * QueryConnection conn(QueryProfile::server());
 * conn.open(transport, 1000);
 * conn.send(QueryCommand("whoami"));
 * transport->mockWaitForClientLines(1, 1000);
 * transport->mockServerWrite("virtualserver_id=1\n\rerror id=0 msg=ok\n\r");
 * @endcode
 */
class MockQueryTransport : public QIODevice
{
    Q_OBJECT

public:
    /**
     * @brief Creates a transport that is already open for reading and writing.
     */
    explicit MockQueryTransport(QObject *parent = nullptr);

    bool isSequential() const override { return true; }
    qint64 bytesAvailable() const override;

    /// @name Server Side
    /// @{

    /**
     * @brief Queues bytes for the client to read and signals readyRead.
     */
    void mockServerWrite(const QByteArray &data);

    /**
     * @brief Simulates the server closing the connection.
     */
    void mockRemoteClose();

    /**
     * @brief Blocks until the client has written at least @p count lines.
     * @return The lines written so far (without terminators).
     */
    QStringList mockWaitForClientLines(int count, int timeoutMs);

    /**
     * @brief Returns all complete lines the client has written.
     */
    QStringList mockGetClientLines() const;
    /// @}

protected:
    qint64 readData(char *data, qint64 maxSize) override;
    qint64 writeData(const char *data, qint64 size) override;

private:
    QStringList linesLocked() const;

    mutable QMutex mutex_;
    QWaitCondition clientWrote_;
    QByteArray inbound_;   ///< Server to client
    QByteArray outbound_;  ///< Client to server
};

#endif // MOCKQUERYTRANSPORT_H
