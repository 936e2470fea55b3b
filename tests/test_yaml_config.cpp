#include <QtTest>
#include "core/YamlConfig.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private slots:
    void testLoadDefaults();
    void testLoadFromFile();
    void testMalformedFileKeepsDefaults();
    void testMissingFileKeepsDefaults();
    void testSaveAndReload();
    void testUnknownKeysSurviveSave();
    void testValueByPath();
    void testValueByPathNested();
    void testValueByPathMissing();
    void testSetValueByPath();
    void testSetValueByPathRejectsUnknown();
};

void TestYamlConfig::testLoadDefaults()
{
    kcb::YamlConfig config;
    QCOMPARE(config.daemonService(), QString("org.kde.kdeconnect"));
    QCOMPARE(config.callTimeoutMs(), 5000);
    QCOMPARE(config.failFast(), false);
    QCOMPARE(config.retryMaxAttempts(), 4);
    QCOMPARE(config.retryInitialBackoffMs(), 250);
    QCOMPARE(config.retryMaxBackoffMs(), 4000);
    QCOMPARE(config.pairingRequestTimeoutMs(), 30000);
    QCOMPARE(config.inboundWins(), true);
    QCOMPARE(config.unreachableTimeoutSecs(), 300);
    QCOMPARE(config.sweepIntervalSecs(), 30);
    QCOMPARE(config.commandTimeoutMs(), 45000);
    QCOMPARE(config.suppressDaemonNotifications(), true);
    QCOMPARE(config.nativeNotifications(), true);
    QCOMPARE(config.notifyrcPath(), QString());
    QCOMPARE(config.lockTimeoutMs(), 2000);
    QCOMPARE(config.socketPath(), QString());
    QCOMPARE(config.logLevel(), QString("info"));
}

void TestYamlConfig::testLoadFromFile()
{
    kcb::YamlConfig config;
    QVERIFY(config.load(QString(TEST_DATA_DIR) + "/test_config.yaml"));

    QCOMPARE(config.callTimeoutMs(), 1500);
    QCOMPARE(config.failFast(), true);
    QCOMPARE(config.retryMaxAttempts(), 2);
    // Sibling keys the file leaves out keep their defaults
    QCOMPARE(config.retryInitialBackoffMs(), 250);
    QCOMPARE(config.pairingRequestTimeoutMs(), 10000);
    QCOMPARE(config.inboundWins(), false);
    QCOMPARE(config.unreachableTimeoutSecs(), 60);
    QCOMPARE(config.sweepIntervalSecs(), 30);
    QCOMPARE(config.suppressDaemonNotifications(), false);
    QCOMPARE(config.notifyrcPath(), QString("/tmp/kcb-test/kdeconnect.notifyrc"));
    QCOMPARE(config.logLevel(), QString("debug"));
}

void TestYamlConfig::testMalformedFileKeepsDefaults()
{
    kcb::YamlConfig config;
    QVERIFY(!config.load(QString(TEST_DATA_DIR) + "/malformed_config.yaml"));
    QCOMPARE(config.callTimeoutMs(), 5000);
    QCOMPARE(config.retryMaxAttempts(), 4);
}

void TestYamlConfig::testMissingFileKeepsDefaults()
{
    kcb::YamlConfig config;
    QVERIFY(!config.load(QDir::tempPath() + "/kcb_no_such_config.yaml"));
    QCOMPARE(config.pairingRequestTimeoutMs(), 30000);
}

void TestYamlConfig::testSaveAndReload()
{
    kcb::YamlConfig config;
    config.setPairingRequestTimeoutMs(12000);
    config.setInboundWins(false);
    config.setSocketPath("/tmp/kcb.sock");

    QString tmpPath = QDir::tempPath() + "/kcb_test_config.yaml";
    QVERIFY(config.save(tmpPath));

    kcb::YamlConfig loaded;
    QVERIFY(loaded.load(tmpPath));
    QCOMPARE(loaded.pairingRequestTimeoutMs(), 12000);
    QCOMPARE(loaded.inboundWins(), false);
    QCOMPARE(loaded.socketPath(), QString("/tmp/kcb.sock"));

    QFile::remove(tmpPath);
}

void TestYamlConfig::testUnknownKeysSurviveSave()
{
    kcb::YamlConfig config;
    QVERIFY(config.load(QString(TEST_DATA_DIR) + "/test_config.yaml"));

    QString tmpPath = QDir::tempPath() + "/kcb_test_config_unknown.yaml";
    QVERIFY(config.save(tmpPath));

    kcb::YamlConfig loaded;
    QVERIFY(loaded.load(tmpPath));
    QCOMPARE(loaded.valueByPath("applet.compact").toBool(), true);

    QFile::remove(tmpPath);
}

void TestYamlConfig::testValueByPath()
{
    kcb::YamlConfig config;
    QCOMPARE(config.valueByPath("daemon.call_timeout_ms").toInt(), 5000);
    QCOMPARE(config.valueByPath("pairing.inbound_wins").toBool(), true);
    QCOMPARE(config.valueByPath("logging.level").toString(), QString("info"));
}

void TestYamlConfig::testValueByPathNested()
{
    kcb::YamlConfig config;
    QCOMPARE(config.valueByPath("daemon.retry.max_backoff_ms").toInt(), 4000);
}

void TestYamlConfig::testValueByPathMissing()
{
    kcb::YamlConfig config;
    QVERIFY(!config.valueByPath("daemon.nonexistent").isValid());
    QVERIFY(!config.valueByPath("nope.nope.nope").isValid());
    QVERIFY(!config.valueByPath("").isValid());
}

void TestYamlConfig::testSetValueByPath()
{
    kcb::YamlConfig config;
    QVERIFY(config.setValueByPath("daemon.retry.max_attempts", 7));
    QCOMPARE(config.retryMaxAttempts(), 7);

    QVERIFY(config.setValueByPath("notifications.native", false));
    QCOMPARE(config.nativeNotifications(), false);

    QVERIFY(config.setValueByPath("ipc.socket_path", QString("/run/kcb.sock")));
    QCOMPARE(config.socketPath(), QString("/run/kcb.sock"));
}

void TestYamlConfig::testSetValueByPathRejectsUnknown()
{
    kcb::YamlConfig config;
    QVERIFY(!config.setValueByPath("daemon.bogus", 1));
    QVERIFY(!config.setValueByPath("daemon.retry", 1));  // not a leaf
    QVERIFY(!config.setValueByPath("", 1));
    QVERIFY(!config.valueByPath("daemon.bogus").isValid());
}

QTEST_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
