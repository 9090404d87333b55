/**
 * @file iqueryconnection.h
 * @brief Interface for query protocol connections.
 *
 * This interface allows dependency injection of query connections, so the
 * file transfer engine and tools can run against a mock in tests.
 */

#ifndef IQUERYCONNECTION_H
#define IQUERYCONNECTION_H

#include <QObject>
#include <QString>

#include "querycommand.h"
#include "queryerror.h"
#include "queryresponse.h"

/**
 * @brief Abstract interface for query protocol connections.
 *
 * All blocking operations take a timeout in milliseconds (negative waits
 * forever) and report failures through an optional QueryError. They return
 * false on failure and never leave a caller blocked once the connection
 * has been closed.
 *
 * @par Example usage:
 * @code
 * QueryConnection *conn = new QueryConnection(QueryProfile::server(), this);
 * QueryError error;
 * if (!conn->connectToHost("localhost", 10011, 5000, &error)) {
 *     logQueryError("connect", error);
 *     return;
 * }
 *
 * QueryResponse response;
 * if (conn->exec(QueryCommand("clientlist"), response, 5000, &error)) {
 *     for (const QueryRecord &client : response) {
 *         qDebug() << client.value("client_nickname");
 *     }
 * }
 * @endcode
 */
class IQueryConnection : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Connection state.
     */
    enum class State {
        Disconnected,  ///< Not yet connected, greeting not consumed
        Connected,     ///< Greeting consumed, commands accepted
        Closing        ///< Closed or failed; terminal for this instance
    };
    Q_ENUM(State)

    /**
     * @brief What happens to the response of a sent command.
     */
    enum class ResponseMode {
        Collect,  ///< Response is queued for receive()
        Discard   ///< Response is consumed and dropped by the connection
    };

    explicit IQueryConnection(QObject *parent = nullptr) : QObject(parent) {}
    ~IQueryConnection() override = default;

    /// @name Commands
    /// @{

    /**
     * @brief Queues a command for transmission without waiting for its reply.
     * @param command The command to send.
     * @param mode Whether the response is collected or discarded.
     * @param error Receives the failure reason.
     * @return False if the command is invalid or the connection is not usable.
     */
    virtual bool send(const QueryCommand &command,
                      ResponseMode mode = ResponseMode::Collect,
                      QueryError *error = nullptr) = 0;

    /**
     * @brief Waits for the oldest collected response.
     * @param response Receives the response.
     * @param timeoutMs Maximum wait; the request stays outstanding on timeout.
     * @param error Receives Timeout, Transport or Usage failures.
     * @return True when a response was delivered.
     */
    virtual bool receive(QueryResponse &response, int timeoutMs,
                         QueryError *error = nullptr) = 0;

    /**
     * @brief Sends a command and waits for its response.
     *
     * A nonzero status is reported as a Command error, with @p response
     * still filled in.
     */
    virtual bool exec(const QueryCommand &command, QueryResponse &response,
                      int timeoutMs, QueryError *error = nullptr) = 0;

    /**
     * @brief Waits for the next event in arrival order.
     */
    virtual bool waitForEvent(QueryEvent &event, int timeoutMs,
                              QueryError *error = nullptr) = 0;

    /**
     * @brief Resets the server's idle timer; the reply is consumed internally.
     */
    virtual bool sendKeepalive(QueryError *error = nullptr) = 0;
    /// @}

    /// @name Connection Management
    /// @{

    /**
     * @brief Closes the connection and releases every waiter. Idempotent.
     */
    virtual void close() = 0;

    [[nodiscard]] virtual State state() const = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;

    /**
     * @brief Returns the remote host, used as fallback for data connections.
     */
    [[nodiscard]] virtual QString host() const = 0;
    /// @}

signals:
    /**
     * @brief Emitted when the connection state changes.
     */
    void stateChanged(IQueryConnection::State state);

    /**
     * @brief Emitted for every event as it arrives, in addition to queueing it.
     */
    void eventReceived(const QueryEvent &event);

    /**
     * @brief Emitted once when the connection reaches Closing.
     */
    void disconnected();

    /**
     * @brief Emitted when a fatal error occurs.
     * @param message Human-readable error description.
     */
    void error(const QString &message);
};

#endif // IQUERYCONNECTION_H
