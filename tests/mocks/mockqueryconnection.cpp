#include "mockqueryconnection.h"

MockQueryConnection::MockQueryConnection(QObject *parent)
    : IQueryConnection(parent)
{
}

bool MockQueryConnection::send(const QueryCommand &command, ResponseMode mode, QueryError *error)
{
    if (state_ != State::Connected) {
        return setQueryError(error, QueryError(QueryErrorKind::Transport, "Connection closed"));
    }
    if (!command.isValid()) {
        return setQueryError(error, QueryError(QueryErrorKind::Usage, "Invalid command"));
    }

    sentCommands_.append(command);

    if (mode == ResponseMode::Collect) {
        QueryStatus unknown;
        unknown.code = 256;
        unknown.message = QStringLiteral("command not found");
        pending_.enqueue(responses_.value(command.verb(), QueryResponse({}, unknown)));
    }
    return true;
}

bool MockQueryConnection::receive(QueryResponse &response, int timeoutMs, QueryError *error)
{
    Q_UNUSED(timeoutMs)

    if (state_ != State::Connected) {
        return setQueryError(error, QueryError(QueryErrorKind::Transport, "Connection closed"));
    }
    if (pending_.isEmpty()) {
        return setQueryError(error, QueryError(QueryErrorKind::Usage,
                                               "No command is awaiting a response"));
    }
    response = pending_.dequeue();
    return true;
}

bool MockQueryConnection::exec(const QueryCommand &command, QueryResponse &response,
                               int timeoutMs, QueryError *error)
{
    if (!send(command, ResponseMode::Collect, error) || !receive(response, timeoutMs, error)) {
        return false;
    }
    if (!response.isSuccess()) {
        return setQueryError(error, QueryError(QueryErrorKind::Command,
                                               response.status().message,
                                               response.status().code));
    }
    return true;
}

bool MockQueryConnection::waitForEvent(QueryEvent &event, int timeoutMs, QueryError *error)
{
    if (events_.isEmpty()) {
        if (state_ != State::Connected) {
            return setQueryError(error, QueryError(QueryErrorKind::Transport, "Connection closed"));
        }
        return setQueryError(error, QueryError(QueryErrorKind::Timeout,
                                               QStringLiteral("No event within %1 ms").arg(timeoutMs)));
    }
    event = events_.dequeue();
    return true;
}

bool MockQueryConnection::sendKeepalive(QueryError *error)
{
    if (state_ != State::Connected) {
        return setQueryError(error, QueryError(QueryErrorKind::Transport, "Connection closed"));
    }
    ++keepaliveCount_;
    return true;
}

void MockQueryConnection::close()
{
    if (state_ == State::Closing) {
        return;
    }
    state_ = State::Closing;
    pending_.clear();
    events_.clear();
    emit stateChanged(state_);
    emit disconnected();
}

void MockQueryConnection::mockSetResponse(const QString &verb, const QueryResponse &response)
{
    responses_.insert(verb, response);
}

void MockQueryConnection::mockQueueEvent(const QueryEvent &event)
{
    events_.enqueue(event);
    emit eventReceived(event);
}

QueryResponse MockQueryConnection::mockMakeResponse(const QMap<QString, QString> &fields,
                                                    int statusCode, const QString &message)
{
    QueryRecord record;
    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        record.insert(it.key(), it.value());
    }

    QueryStatus status;
    status.code = statusCode;
    status.message = message;

    QList<QueryRecord> records;
    if (!fields.isEmpty()) {
        records.append(record);
    }
    return QueryResponse(records, status);
}
