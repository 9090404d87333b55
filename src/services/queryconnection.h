/**
 * @file queryconnection.h
 * @brief Query protocol connection with a dedicated receive thread.
 */

#ifndef QUERYCONNECTION_H
#define QUERYCONNECTION_H

#include "iqueryconnection.h"
#include "queryprofile.h"
#include "queryreceiver.h"

class QIODevice;
class QThread;

/**
 * @brief Query protocol connection.
 *
 * The connection owns one duplex stream. A QueryReceiver running in a
 * dedicated QThread performs every read and write; caller threads only
 * exchange data with it through a mutex-guarded mailbox. This keeps
 * send() and sendKeepalive() non-blocking while receive() and
 * waitForEvent() block on wait conditions with a deadline.
 *
 * Responses are matched to commands strictly in send order. Only one
 * command is on the wire at a time; later commands wait in the receiver's
 * write queue until the previous status line has arrived. Events are
 * queued separately in arrival order.
 *
 * All methods except receive(), waitForEvent() and send() must be called
 * from the thread that owns the connection. Any thread may wait for
 * responses or events, and close() releases all of them.
 *
 * @par Example usage:
 * @code
 * QueryConnection conn(QueryProfile::server());
 * QueryError error;
 * if (!conn.connectToHost("localhost", 10011, 5000, &error)) {
 *     logQueryError("connect", error);
 *     return;
 * }
 * conn.send(QueryCommand("servernotifyregister").withParam("event", "server"));
 * QueryResponse response;
 * conn.receive(response, 5000, &error);
 *
 * QueryEvent event;
 * while (conn.waitForEvent(event, 60000, &error)) {
 *     qDebug() << event.name() << event.data().toString();
 * }
 * @endcode
 */
class QueryConnection : public IQueryConnection
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an unconnected query connection.
     * @param profile Interface flavour (greeting length, command set).
     * @param parent Optional parent QObject for memory management.
     */
    explicit QueryConnection(const QueryProfile &profile = QueryProfile::server(),
                             QObject *parent = nullptr);

    /**
     * @brief Destructor. Closes the connection.
     */
    ~QueryConnection() override;

    /// @name Opening
    /// @{

    /**
     * @brief Opens a TCP connection and consumes the greeting.
     * @param host Hostname or IP address.
     * @param port Query port; 0 selects the profile's default.
     * @param timeoutMs Limit for connecting and for the greeting.
     * @param error Receives the failure reason.
     * @return True once the connection is Connected.
     */
    bool connectToHost(const QString &host, quint16 port, int timeoutMs,
                       QueryError *error = nullptr);

    /**
     * @brief Adopts an already open stream and consumes the greeting.
     *
     * Ownership of @p device is taken; it is moved to the receive thread
     * and deleted by close(). The device must not have a parent.
     *
     * @param device Open, readable and writable stream.
     * @param timeoutMs Limit for the greeting.
     * @param error Receives the failure reason.
     * @return True once the connection is Connected.
     */
    bool open(QIODevice *device, int timeoutMs, QueryError *error = nullptr);
    /// @}

    /// @name IQueryConnection
    /// @{
    bool send(const QueryCommand &command,
              ResponseMode mode = ResponseMode::Collect,
              QueryError *error = nullptr) override;
    bool receive(QueryResponse &response, int timeoutMs,
                 QueryError *error = nullptr) override;
    bool exec(const QueryCommand &command, QueryResponse &response,
              int timeoutMs, QueryError *error = nullptr) override;
    bool waitForEvent(QueryEvent &event, int timeoutMs,
                      QueryError *error = nullptr) override;
    bool sendKeepalive(QueryError *error = nullptr) override;
    void close() override;

    [[nodiscard]] State state() const override;
    [[nodiscard]] bool isConnected() const override;
    [[nodiscard]] QString host() const override { return host_; }
    /// @}

    /// @name Configuration
    /// @{

    /**
     * @brief Enables automatic keepalives from the receive thread.
     * @param intervalMs Interval in milliseconds, 0 disables. Should be well
     *        below QueryProfile::IdleTimeoutMs.
     */
    void setKeepaliveInterval(int intervalMs);
    [[nodiscard]] int keepaliveInterval() const { return keepaliveIntervalMs_; }

    /**
     * @brief Enables rejection of verbs outside the profile's command set.
     */
    void setValidateCommands(bool validate) { validateCommands_ = validate; }
    [[nodiscard]] bool validateCommands() const { return validateCommands_; }

    [[nodiscard]] QueryProfile profile() const { return profile_; }
    /// @}

    /**
     * @brief Returns the number of events waiting in the queue.
     */
    [[nodiscard]] int pendingEventCount() const;

    /**
     * @brief Returns the number of collected responses not yet received.
     */
    [[nodiscard]] int outstandingResponseCount() const;

    static constexpr int DefaultTimeoutMs = 10000;

private slots:
    void onReceiverEvent(const QueryEvent &event);
    void onReceiverFailed(const QString &message);

private:
    [[nodiscard]] QueryError closedError() const;

    QueryProfile profile_;
    QString host_;
    bool validateCommands_ = true;
    int keepaliveIntervalMs_ = 0;
    bool closed_ = false;

    mutable QueryMailbox mailbox_;
    QThread *thread_ = nullptr;
    QueryReceiver *receiver_ = nullptr;
};

#endif // QUERYCONNECTION_H
