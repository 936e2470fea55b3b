#include <QTest>
#include <QSignalSpy>
#include <QJsonDocument>
#include <QLocalServer>
#include <QLocalSocket>
#include <QTemporaryDir>
#include "FakeBusGateway.hpp"
#include "core/notify/KConfigFileStore.hpp"
#include "core/notify/NotificationArbiter.hpp"
#include "core/services/EventBus.hpp"
#include "core/services/IConfigService.hpp"
#include "core/services/IpcServer.hpp"
#include "core/services/SessionClient.hpp"
#include "core/session/SessionManager.hpp"

namespace {

class MockConfigService : public kcb::IConfigService {
public:
    QVariant value(const QString& key) const override { return values.value(key); }
    bool setValue(const QString& key, const QVariant& v) override
    {
        values[key] = v;
        return true;
    }
    bool save() override { return true; }

    QVariantMap values;
};

using Result = std::shared_ptr<std::optional<kcb::CommandResult>>;

QByteArray snapshotLine(quint64 sequence, const QString& name)
{
    kcb::SessionSnapshot snap;
    snap.sequence = sequence;
    kcb::Device d;
    d.id = "phone-123";
    d.name = name;
    snap.devices.append(d);
    QJsonObject obj = snap.toJson();
    obj["type"] = "snapshot";
    return QJsonDocument(obj).toJson(QJsonDocument::Compact) + "\n";
}

} // namespace

class TestSessionClient : public QObject {
    Q_OBJECT

private:
    QTemporaryDir dir_;
    MockConfigService config_;
    std::unique_ptr<FakeBusGateway> bus_;
    std::unique_ptr<kcb::EventBus> events_;
    std::unique_ptr<kcb::SessionManager> manager_;
    std::unique_ptr<kcb::IpcServer> server_;
    QString socketPath_;

    void startServer()
    {
        server_ = std::make_unique<kcb::IpcServer>();
        server_->setSessionManager(manager_.get());
        server_->setEventBus(events_.get());
        QVERIFY(server_->start(socketPath_));
    }

    Result submit(kcb::SessionClient& client, kcb::CommandKind kind, const QString& deviceId)
    {
        auto result = std::make_shared<std::optional<kcb::CommandResult>>();
        kcb::CommandRequest request;
        request.kind = kind;
        request.deviceId = deviceId;
        client.submit(request, [result](const kcb::CommandResult& r) { *result = r; });
        return result;
    }

private slots:
    void init()
    {
        QVERIFY(dir_.isValid());
        socketPath_ = dir_.filePath("kcb.sock");
        config_.values["devices.sweep_interval_s"] = 3600;

        bus_ = std::make_unique<FakeBusGateway>();
        FakeBusGateway::Device phone;
        phone.name = "Pixel 7";
        bus_->addDevice("phone-123", phone);

        events_ = std::make_unique<kcb::EventBus>();
        auto* arbiter = new kcb::NotificationArbiter(
            std::make_unique<kcb::KConfigFileStore>(dir_.filePath("kdeconnect.notifyrc"), 500),
            dir_.filePath("notify-backup.yaml"));
        manager_ = std::make_unique<kcb::SessionManager>(bus_.get(), &config_, arbiter);
        manager_->setEventBus(events_.get());
        manager_->start();
        QTRY_VERIFY(manager_->snapshot().device("phone-123").has_value());
        startServer();
    }

    void cleanup()
    {
        server_.reset();
        manager_.reset();
        events_.reset();
        bus_.reset();
    }

    void receivesSnapshotOnConnect()
    {
        kcb::SessionClient client(socketPath_);
        QSignalSpy connected(&client, &kcb::SessionClient::connectedChanged);
        client.connectToService();

        QTRY_VERIFY(client.isConnected());
        QVERIFY(connected.count() >= 1);
        QTRY_VERIFY(client.snapshot().device("phone-123").has_value());
        QCOMPARE(client.snapshot().device("phone-123")->name, QString("Pixel 7"));
        QCOMPARE(client.snapshot().sequence, manager_->snapshot().sequence);
    }

    void followsPublishedSnapshots()
    {
        kcb::SessionClient client(socketPath_);
        client.connectToService();
        QTRY_VERIFY(client.snapshot().sequence > 0);

        bus_->emitSignal("phone-123", kcb::daemon::kNameChanged, {QString("Work phone")});
        QTRY_COMPARE(client.snapshot().device("phone-123")->name, QString("Work phone"));
    }

    void eventsArePushed()
    {
        kcb::SessionClient client(socketPath_);
        QSignalSpy events(&client, &kcb::SessionClient::eventReceived);
        client.connectToService();
        QTRY_VERIFY(client.snapshot().sequence > 0);

        auto result = submit(client, kcb::CommandKind::RequestPair, "phone-123");
        QTRY_VERIFY(!events.isEmpty());
        QCOMPARE(events.at(0).at(0).toString(), QString("pairing/request_sent"));

        bus_->setPairState("phone-123", 3);
        QTRY_VERIFY(result->has_value());
        QVERIFY((*result)->ok());
        QTRY_COMPARE(client.snapshot().device("phone-123")->pairState, kcb::PairState::Paired);
    }

    void errorsKeepTheirKind()
    {
        kcb::SessionClient client(socketPath_);
        client.connectToService();
        QTRY_VERIFY(client.isConnected());

        auto notPaired = submit(client, kcb::CommandKind::Unpair, "phone-123");
        QTRY_VERIFY(notPaired->has_value());
        QCOMPARE((*notPaired)->error, kcb::ErrorKind::NotPaired);

        auto unknown = submit(client, kcb::CommandKind::AcceptPair, "ghost");
        QTRY_VERIFY(unknown->has_value());
        QCOMPARE((*unknown)->error, kcb::ErrorKind::UnknownDevice);
    }

    void submitWhileDisconnectedFails()
    {
        kcb::SessionClient client(dir_.filePath("nobody-home.sock"));
        auto result = submit(client, kcb::CommandKind::RequestPair, "phone-123");
        QVERIFY(result->has_value());
        QCOMPARE((*result)->error, kcb::ErrorKind::BusUnavailable);
    }

    void pendingCommandsFailOnDisconnect()
    {
        kcb::SessionClient client(socketPath_);
        client.setReconnectInterval(60000);
        client.connectToService();
        QTRY_VERIFY(client.snapshot().sequence > 0);

        // Stays pending until the phone answers
        auto result = submit(client, kcb::CommandKind::RequestPair, "phone-123");
        QTRY_COMPARE(bus_->callCount(kcb::daemon::kRequestPairing), 1);
        QVERIFY(!result->has_value());

        server_.reset();
        QTRY_VERIFY(result->has_value());
        QCOMPARE((*result)->error, kcb::ErrorKind::BusUnavailable);
        QVERIFY(!client.isConnected());
    }

    void reconnectsAfterServerRestart()
    {
        kcb::SessionClient client(socketPath_);
        client.setReconnectInterval(50);
        client.connectToService();
        QTRY_VERIFY(client.snapshot().sequence > 0);
        const quint64 seen = client.snapshot().sequence;

        server_.reset();
        QTRY_VERIFY(!client.isConnected());

        startServer();
        QSignalSpy snapshots(&client, &kcb::SessionClient::snapshotChanged);
        QTRY_VERIFY(client.isConnected());

        // Same sequence as before the restart, still taken after a reconnect
        QTRY_COMPARE(snapshots.count(), 1);
        QCOMPARE(client.snapshot().sequence, seen);
    }

    void outOfOrderSnapshotsAreDropped()
    {
        // Plain socket server pushing hand-made snapshots
        const QString path = dir_.filePath("fake.sock");
        QLocalServer fake;
        QVERIFY(fake.listen(path));

        kcb::SessionClient client(path);
        QSignalSpy snapshots(&client, &kcb::SessionClient::snapshotChanged);
        client.connectToService();
        QTRY_VERIFY(fake.hasPendingConnections());
        QLocalSocket* peer = fake.nextPendingConnection();

        peer->write(snapshotLine(5, "five"));
        peer->write(snapshotLine(3, "three"));
        peer->write(snapshotLine(5, "five again"));
        peer->write(snapshotLine(6, "six"));
        peer->flush();

        QTRY_COMPARE(client.snapshot().sequence, quint64(6));
        QCOMPARE(snapshots.count(), 2);
        QCOMPARE(client.snapshot().device("phone-123")->name, QString("six"));
    }
};

QTEST_MAIN(TestSessionClient)
#include "test_session_client.moc"
