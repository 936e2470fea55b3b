#include <QTest>
#include <QJsonArray>
#include <QJsonDocument>
#include "core/session/SessionSnapshot.hpp"

class TestSessionSnapshot : public QObject {
    Q_OBJECT

private:
    static kcb::SessionSnapshot sample()
    {
        kcb::SessionSnapshot snap;
        snap.sequence = 42;
        snap.daemonAvailable = true;

        kcb::Device phone;
        phone.id = "phone-123";
        phone.name = "Pixel";
        phone.type = kcb::DeviceType::Phone;
        phone.reachability = kcb::Reachability::Reachable;
        phone.pairState = kcb::PairState::RequestSent;
        phone.lastSeen = QDateTime(QDate(2024, 5, 1), QTime(12, 30, 15, 250), Qt::UTC);
        phone.battery = kcb::BatteryStatus{64, true};
        phone.connectivity = kcb::ConnectivityStatus{3, "LTE"};
        snap.devices.append(phone);

        kcb::Device laptop;
        laptop.id = "thinkpad";
        laptop.type = kcb::DeviceType::Laptop;
        snap.devices.append(laptop);

        kcb::PairingSession session;
        session.deviceId = "phone-123";
        session.state = kcb::PairState::RequestSent;
        session.token = 7;
        session.deadline = phone.lastSeen.addSecs(30);
        snap.pairingSessions.append(session);

        kcb::PluginRecord battery;
        battery.deviceId = "phone-123";
        battery.kind = kcb::PluginKind::Battery;
        battery.available = true;
        battery.enabled = true;
        battery.lastSync = phone.lastSeen;
        snap.plugins.append(battery);

        kcb::SuppressionRule rule;
        rule.deviceId = "phone-123";
        rule.daemonSuppressed = true;
        rule.redirected = {kcb::EventClass::PairingRequest, kcb::EventClass::TransferComplete};
        snap.suppressionRules.append(rule);
        return snap;
    }

private slots:
    void jsonLayout()
    {
        const QJsonObject obj = sample().toJson();
        QCOMPARE(obj["sequence"].toInteger(), qint64(42));
        QCOMPARE(obj["daemon_available"].toBool(), true);

        const QJsonObject dev = obj["devices"].toArray().at(0).toObject();
        QCOMPARE(dev["id"].toString(), QString("phone-123"));
        QCOMPARE(dev["type"].toString(), QString("phone"));
        QCOMPARE(dev["pair_state"].toString(), QString("request_sent"));
        QCOMPARE(dev["last_seen"].toString(), QString("2024-05-01T12:30:15.250Z"));
        QCOMPARE(dev["battery"].toObject()["charge"].toInt(), 64);
        QCOMPARE(dev["battery"].toObject()["charging"].toBool(), true);
        QCOMPARE(dev["connectivity"].toObject()["strength"].toInt(), 3);
        QCOMPARE(dev["connectivity"].toObject()["network_type"].toString(), QString("LTE"));

        // No plugin status reported: the keys are left out
        const QJsonObject laptop = obj["devices"].toArray().at(1).toObject();
        QVERIFY(!laptop.contains("battery"));
        QVERIFY(!laptop.contains("connectivity"));

        const QJsonObject plugin = obj["plugins"].toArray().at(0).toObject();
        QCOMPARE(plugin["kind"].toString(), QString("battery"));

        const QJsonArray redirected =
            obj["suppression"].toArray().at(0).toObject()["redirected"].toArray();
        QCOMPARE(redirected.size(), 2);
        QCOMPARE(redirected.at(0).toString(), QString("pairing_request"));
    }

    void parsesWhatItWrites()
    {
        const kcb::SessionSnapshot original = sample();
        const QByteArray wire = QJsonDocument(original.toJson()).toJson(QJsonDocument::Compact);
        auto parsed = kcb::SessionSnapshot::fromJson(QJsonDocument::fromJson(wire).object());
        QVERIFY(parsed.has_value());

        QCOMPARE(parsed->sequence, quint64(42));
        auto dev = parsed->device("phone-123");
        QVERIFY(dev.has_value());
        QCOMPARE(dev->pairState, kcb::PairState::RequestSent);
        QVERIFY(dev->isReachable());
        QCOMPARE(dev->lastSeen, original.devices.at(0).lastSeen);
        QVERIFY(dev->battery == original.devices.at(0).battery);
        QVERIFY(dev->connectivity == original.devices.at(0).connectivity);
        QVERIFY(!parsed->device("thinkpad")->battery.has_value());

        QCOMPARE(parsed->pairingSessions.at(0).token, quint64(7));
        QVERIFY(parsed->plugin("phone-123", kcb::PluginKind::Battery)->enabled);
        QVERIFY(!parsed->plugin("phone-123", kcb::PluginKind::Sms).has_value());
        QCOMPARE(parsed->suppressionRules.at(0).redirected.size(), 2);
    }

    void rejectsMissingFields()
    {
        QVERIFY(!kcb::SessionSnapshot::fromJson(QJsonObject()).has_value());

        QJsonObject noDevices;
        noDevices["sequence"] = 3;
        QVERIFY(!kcb::SessionSnapshot::fromJson(noDevices).has_value());
    }

    void skipsUnknownPluginKinds()
    {
        QJsonObject obj = sample().toJson();
        QJsonArray plugins = obj["plugins"].toArray();
        QJsonObject alien;
        alien["device"] = "phone-123";
        alien["kind"] = "teleport";
        plugins.append(alien);
        obj["plugins"] = plugins;

        auto parsed = kcb::SessionSnapshot::fromJson(obj);
        QVERIFY(parsed.has_value());
        QCOMPARE(parsed->plugins.size(), 1);
    }

    void trackerAcceptsOnlyNewerSequences()
    {
        kcb::SnapshotTracker tracker;
        QVERIFY(tracker.accept(1));
        QVERIFY(tracker.accept(3));
        QVERIFY(!tracker.accept(3));
        QVERIFY(!tracker.accept(2));
        QCOMPARE(tracker.latest(), quint64(3));

        // After a reconnect the server may start over
        tracker.reset();
        QVERIFY(tracker.accept(1));
    }
};

QTEST_MAIN(TestSessionSnapshot)
#include "test_session_snapshot.moc"
