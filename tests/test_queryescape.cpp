/**
 * @file test_queryescape.cpp
 * @brief Unit tests for QueryEscape.
 *
 * Tests verify:
 * - Every reserved character maps to its two-character escape
 * - Unescaping restores the original text
 * - Unknown escapes and trailing backslashes are rejected
 * - Identifier validation
 */

#include <QtTest>

#include "services/queryescape.h"

class TestQueryEscape : public QObject
{
    Q_OBJECT

private slots:
    void escape_data()
    {
        QTest::addColumn<QString>("raw");
        QTest::addColumn<QString>("wire");

        QTest::newRow("plain") << "hello" << "hello";
        QTest::newRow("space") << "invalid clientid" << "invalid\\sclientid";
        QTest::newRow("pipe") << "a|b" << "a\\pb";
        QTest::newRow("slash") << "/dir/file" << "\\/dir\\/file";
        QTest::newRow("backslash") << "C:\\tmp" << "C:\\\\tmp";
        QTest::newRow("newline") << "line1\nline2" << "line1\\nline2";
        QTest::newRow("carriage return") << "a\rb" << "a\\rb";
        QTest::newRow("tab") << "a\tb" << "a\\tb";
        QTest::newRow("bell") << QString("a\ab") << "a\\ab";
        QTest::newRow("backspace") << QString("a\bb") << "a\\bb";
        QTest::newRow("form feed") << QString("a\fb") << "a\\fb";
        QTest::newRow("vertical tab") << QString("a\vb") << "a\\vb";
        QTest::newRow("empty") << "" << "";
    }

    void escape()
    {
        QFETCH(QString, raw);
        QFETCH(QString, wire);

        QCOMPARE(QueryEscape::escape(raw), wire);

        QString decoded;
        QVERIFY(QueryEscape::unescape(wire, decoded));
        QCOMPARE(decoded, raw);
    }

    void escape_PassesUnicodeThrough()
    {
        QString raw = QString::fromUtf8("Grüße 日本");
        QCOMPARE(QueryEscape::escape(raw), QString::fromUtf8("Grüße\\s日本"));
    }

    void escape_OutputHasNoSeparators()
    {
        QString raw = QStringLiteral("a b|c\nd\re\tf\\/");
        QString wire = QueryEscape::escape(raw);

        QVERIFY(!wire.contains(QLatin1Char(' ')));
        QVERIFY(!wire.contains(QLatin1Char('|')));
        QVERIFY(!wire.contains(QLatin1Char('\n')));
        QVERIFY(!wire.contains(QLatin1Char('\r')));
    }

    void unescape_RejectsUnknownEscape()
    {
        QString decoded = QStringLiteral("unchanged");
        QVERIFY(!QueryEscape::unescape(QStringLiteral("bad\\xescape"), decoded));
        QCOMPARE(decoded, QString("unchanged"));
    }

    void unescape_RejectsTrailingBackslash()
    {
        QString decoded;
        QVERIFY(!QueryEscape::unescape(QStringLiteral("dangling\\"), decoded));
    }

    void unescape_AdjacentEscapes()
    {
        QString decoded;
        QVERIFY(QueryEscape::unescape(QStringLiteral("\\\\s"), decoded));
        // Escaped backslash followed by a literal s, not an escaped space
        QCOMPARE(decoded, QString("\\s"));
    }

    void isValidIdentifier()
    {
        QVERIFY(QueryEscape::isValidIdentifier("clientlist"));
        QVERIFY(QueryEscape::isValidIdentifier("client_login_name"));
        QVERIFY(QueryEscape::isValidIdentifier("uid"));
        QVERIFY(QueryEscape::isValidIdentifier("sid2"));

        QVERIFY(!QueryEscape::isValidIdentifier(""));
        QVERIFY(!QueryEscape::isValidIdentifier("client list"));
        QVERIFY(!QueryEscape::isValidIdentifier("key=value"));
        QVERIFY(!QueryEscape::isValidIdentifier("-uid"));
        QVERIFY(!QueryEscape::isValidIdentifier("a|b"));
    }
};

QTEST_MAIN(TestQueryEscape)
#include "test_queryescape.moc"
