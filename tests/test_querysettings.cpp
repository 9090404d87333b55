/**
 * @file test_querysettings.cpp
 * @brief Unit tests for QuerySettings persistence.
 */

#include <QtTest>
#include <QSettings>
#include <QTemporaryDir>

#include "services/querysettings.h"

class TestQuerySettings : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir_ = nullptr;

    QString configPath() const { return tempDir_->filePath("tsquery.ini"); }

private slots:
    void init()
    {
        tempDir_ = new QTemporaryDir();
        QVERIFY(tempDir_->isValid());
    }

    void cleanup()
    {
        delete tempDir_;
        tempDir_ = nullptr;
    }

    void defaults()
    {
        QuerySettings settings;
        QCOMPARE(settings.host, QString("localhost"));
        QCOMPARE(settings.port, static_cast<quint16>(0));
        QCOMPARE(settings.effectivePort(), static_cast<quint16>(10011));
        QVERIFY(settings.profile().kind == QueryProfile::Kind::Server);
        QCOMPARE(settings.timeoutMs, 10000);
        QCOMPARE(settings.keepaliveIntervalMs, 0);
    }

    void clientProfileDefaultPort()
    {
        QuerySettings settings;
        settings.profileName = "client";
        QCOMPARE(settings.effectivePort(), static_cast<quint16>(25639));

        settings.port = 25640;
        QCOMPARE(settings.effectivePort(), static_cast<quint16>(25640));
    }

    void loadFromIni()
    {
        {
            QFile file(configPath());
            QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
            file.write("[connection]\n"
                       "host=ts.example.com\n"
                       "port=10022\n"
                       "profile=server\n"
                       "timeoutMs=2500\n"
                       "keepaliveMs=60000\n"
                       "[auth]\n"
                       "user=serveradmin\n"
                       "password=secret\n"
                       "[server]\n"
                       "id=3\n");
        }

        QSettings ini(configPath(), QSettings::IniFormat);
        QuerySettings settings;
        settings.load(ini);

        QCOMPARE(settings.host, QString("ts.example.com"));
        QCOMPARE(settings.port, static_cast<quint16>(10022));
        QCOMPARE(settings.timeoutMs, 2500);
        QCOMPARE(settings.keepaliveIntervalMs, 60000);
        QCOMPARE(settings.user, QString("serveradmin"));
        QCOMPARE(settings.password, QString("secret"));
        QVERIFY(settings.apiKey.isEmpty());
        QCOMPARE(settings.serverId, 3);
    }

    void missingKeysKeepDefaults()
    {
        QSettings ini(configPath(), QSettings::IniFormat);
        QuerySettings settings;
        settings.host = "preset";
        settings.load(ini);

        QCOMPARE(settings.host, QString("preset"));
        QCOMPARE(settings.profileName, QString("server"));
    }

    void saveAndReload()
    {
        QuerySettings original;
        original.host = "10.1.1.1";
        original.port = 25639;
        original.profileName = "client";
        original.apiKey = "ABCD-EFGH";
        original.keepaliveIntervalMs = 30000;

        {
            QSettings ini(configPath(), QSettings::IniFormat);
            original.save(ini);
            ini.sync();
            QCOMPARE(ini.status(), QSettings::NoError);
        }

        QSettings ini(configPath(), QSettings::IniFormat);
        QuerySettings loaded;
        loaded.load(ini);

        QCOMPARE(loaded.host, original.host);
        QCOMPARE(loaded.port, original.port);
        QVERIFY(loaded.profile().kind == QueryProfile::Kind::Client);
        QCOMPARE(loaded.apiKey, original.apiKey);
        QCOMPARE(loaded.keepaliveIntervalMs, 30000);
    }
};

QTEST_MAIN(TestQuerySettings)
#include "test_querysettings.moc"
