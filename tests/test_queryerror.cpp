/**
 * @file test_queryerror.cpp
 * @brief Unit tests for QueryError.
 *
 * Tests verify:
 * - Default construction means no error
 * - Only transport and parse failures invalidate a connection
 * - Severity mapping used for logging
 * - setQueryError tolerates a null output
 */

#include <QtTest>

#include "services/queryerror.h"

class TestQueryError : public QObject
{
    Q_OBJECT

private slots:
    void defaultIsNoError()
    {
        QueryError error;
        QVERIFY(!error.isError());
        QVERIFY(!error.isFatal());
        QCOMPARE(error.statusCode, 0);
    }

    void fatalKinds()
    {
        QVERIFY(QueryError(QueryErrorKind::Transport, "closed").isFatal());
        QVERIFY(QueryError(QueryErrorKind::Parse, "garbage").isFatal());

        QVERIFY(!QueryError(QueryErrorKind::Timeout, "slow").isFatal());
        QVERIFY(!QueryError(QueryErrorKind::Command, "denied", 2568).isFatal());
        QVERIFY(!QueryError(QueryErrorKind::Integrity, "short").isFatal());
        QVERIFY(!QueryError(QueryErrorKind::Usage, "nothing pending").isFatal());
    }

    void toStringIncludesStatusCode()
    {
        QueryError command(QueryErrorKind::Command, "invalid clientid", 512);
        QCOMPARE(command.toString(), QString("[Command 512] invalid clientid"));

        QueryError timeout(QueryErrorKind::Timeout, "No response within 10 ms");
        QCOMPARE(timeout.toString(), QString("[Timeout] No response within 10 ms"));
    }

    void severity()
    {
        QVERIFY(QueryError::severityFor(QueryErrorKind::Timeout) == QueryErrorSeverity::Info);
        QVERIFY(QueryError::severityFor(QueryErrorKind::Command) == QueryErrorSeverity::Warning);
        QVERIFY(QueryError::severityFor(QueryErrorKind::Usage) == QueryErrorSeverity::Warning);
        QVERIFY(QueryError::severityFor(QueryErrorKind::Transport) == QueryErrorSeverity::Critical);
        QVERIFY(QueryError::severityFor(QueryErrorKind::Integrity) == QueryErrorSeverity::Critical);
    }

    void setQueryErrorFillsOutput()
    {
        QueryError out;
        QVERIFY(!setQueryError(&out, QueryError(QueryErrorKind::Integrity, "mismatch")));
        QVERIFY(out.kind == QueryErrorKind::Integrity);
        QCOMPARE(out.message, QString("mismatch"));

        // Callers may not care about the details
        QVERIFY(!setQueryError(nullptr, QueryError(QueryErrorKind::Usage, "ignored")));
    }

    void logQueryErrorUsesSeverity()
    {
        QTest::ignoreMessage(QtWarningMsg, "Query: Exec failed: [Command 256] command not found");
        logQueryError("Exec", QueryError(QueryErrorKind::Command, "command not found", 256));

        QTest::ignoreMessage(QtCriticalMsg, "Query: Connection failed: [Transport] reset");
        logQueryError("Connection", QueryError(QueryErrorKind::Transport, "reset"));
    }
};

QTEST_MAIN(TestQueryError)
#include "test_queryerror.moc"
