#include <QtTest>
#include <QDir>
#include "core/YamlConfig.hpp"
#include "core/services/ConfigService.hpp"

class TestConfigService : public QObject {
    Q_OBJECT
private slots:
    void testReadValues();
    void testWriteValues();
    void testWriteEmitsChange();
    void testRejectsUnknownKey();
    void testTypedHelpers();
    void testSaveAndReload();
};

void TestConfigService::testReadValues()
{
    kcb::YamlConfig yaml;
    kcb::ConfigService svc(&yaml, QDir::tempPath() + "/kcb_test_cs.yaml");

    QCOMPARE(svc.value("daemon.service").toString(), QString("org.kde.kdeconnect"));
    QCOMPARE(svc.value("session.command_timeout_ms").toInt(), 45000);
    QCOMPARE(svc.value("notifications.suppress_daemon").toBool(), true);
    QVERIFY(!svc.value("nonexistent.key").isValid());
}

void TestConfigService::testWriteValues()
{
    kcb::YamlConfig yaml;
    kcb::ConfigService svc(&yaml, QDir::tempPath() + "/kcb_test_cs.yaml");

    QVERIFY(svc.setValue("pairing.request_timeout_ms", 500));
    QCOMPARE(svc.value("pairing.request_timeout_ms").toInt(), 500);
    QCOMPARE(yaml.pairingRequestTimeoutMs(), 500);
}

void TestConfigService::testWriteEmitsChange()
{
    kcb::YamlConfig yaml;
    kcb::ConfigService svc(&yaml, QDir::tempPath() + "/kcb_test_cs.yaml");
    QSignalSpy spy(&svc, &kcb::ConfigService::configChanged);

    svc.setValue("daemon.fail_fast", true);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("daemon.fail_fast"));
    QCOMPARE(spy.at(0).at(1).toBool(), true);
}

void TestConfigService::testRejectsUnknownKey()
{
    kcb::YamlConfig yaml;
    kcb::ConfigService svc(&yaml, QDir::tempPath() + "/kcb_test_cs.yaml");
    QSignalSpy spy(&svc, &kcb::ConfigService::configChanged);

    QVERIFY(!svc.setValue("daemon.no_such_key", 3));
    QCOMPARE(spy.count(), 0);
}

void TestConfigService::testTypedHelpers()
{
    kcb::YamlConfig yaml;
    kcb::ConfigService svc(&yaml, QDir::tempPath() + "/kcb_test_cs.yaml");

    QCOMPARE(kcb::configInt(&svc, "devices.sweep_interval_s", 1), 30);
    QCOMPARE(kcb::configInt(&svc, "devices.missing", 11), 11);
    QCOMPARE(kcb::configBool(&svc, "pairing.inbound_wins", false), true);
    QCOMPARE(kcb::configString(&svc, "notifications.notifyrc_path", "/fallback"),
             QString("/fallback"));
    QCOMPARE(kcb::configInt(nullptr, "devices.sweep_interval_s", 5), 5);
}

void TestConfigService::testSaveAndReload()
{
    QString path = QDir::tempPath() + "/kcb_test_config_svc.yaml";

    {
        kcb::YamlConfig yaml;
        kcb::ConfigService svc(&yaml, path);
        svc.setValue("devices.unreachable_timeout_s", 42);
        QVERIFY(svc.save());
    }

    {
        kcb::YamlConfig yaml;
        yaml.load(path);
        kcb::ConfigService svc(&yaml, path);
        QCOMPARE(svc.value("devices.unreachable_timeout_s").toInt(), 42);
    }

    QFile::remove(path);
}

QTEST_MAIN(TestConfigService)
#include "test_config_service.moc"
