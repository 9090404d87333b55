/**
 * @file datachannelserver.h
 * @brief Threaded stand-in for the server side of a file transfer data connection.
 */

#ifndef DATACHANNELSERVER_H
#define DATACHANNELSERVER_H

#include <QByteArray>
#include <QSemaphore>
#include <QThread>

/**
 * @brief Accepts one data connection, checks the transfer key and then
 *        either receives (upload) or sends (download) raw bytes.
 *
 * Runs the blocking QTcpServer API on its own thread so the transfer engine
 * can block in the test thread at the same time.
 *
 * @par Example usage:
 * @code
 * DataChannelServer server(DataChannelServer::Mode::Send, "transferkey");
 * server.setPayload(QByteArray(10000, 'x'));
 * server.start();
 * QVERIFY(server.waitUntilListening(5000));
 * // ... respond to ftinitdownload with port=server.port()
 * server.wait(5000);
 * @endcode
 */
class DataChannelServer : public QThread
{
    Q_OBJECT

public:
    enum class Mode {
        Receive,  ///< Read everything the client uploads
        Send,     ///< Send the payload, then close
        Reset     ///< Leave the key unread and reset the connection
    };

    DataChannelServer(Mode mode, const QByteArray &key, QObject *parent = nullptr);

    void setPayload(const QByteArray &payload) { payload_ = payload; }
    void setTimeout(int timeoutMs) { timeoutMs_ = timeoutMs; }

    /**
     * @brief Waits until the server accepts connections.
     */
    bool waitUntilListening(int timeoutMs);

    /// @name Results (valid after the thread finished)
    /// @{
    [[nodiscard]] quint16 port() const { return port_; }
    [[nodiscard]] QByteArray receivedKey() const { return receivedKey_; }
    [[nodiscard]] QByteArray received() const { return received_; }
    [[nodiscard]] bool accepted() const { return accepted_; }
    /// @}

protected:
    void run() override;

private:
    Mode mode_;
    QByteArray key_;
    QByteArray payload_;
    int timeoutMs_ = 5000;

    QSemaphore listening_;
    quint16 port_ = 0;
    bool accepted_ = false;
    QByteArray receivedKey_;
    QByteArray received_;
};

#endif // DATACHANNELSERVER_H
