#pragma once
#include "core/session/SessionManager.hpp"
#include "core/session/SessionSnapshot.hpp"
#include <QObject>
#include <QLocalSocket>
#include <QJsonObject>
#include <QMap>
#include <functional>

namespace kcb {

/// Consumer side of the IpcServer protocol.
///
/// Subscribes on connect, keeps the newest snapshot (older sequence numbers
/// are discarded) and reconnects every few seconds while the session
/// daemon is away.
class SessionClient : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool connected READ isConnected NOTIFY connectedChanged)

public:
    explicit SessionClient(const QString& socketPath, QObject* parent = nullptr);

    bool isConnected() const;
    SessionSnapshot snapshot() const { return snapshot_; }

    void connectToService();
    void setReconnectInterval(int ms) { reconnectMs_ = ms; }

    /// The callback fires once with the server's verdict, or BusUnavailable
    /// if the connection drops first.
    void submit(const CommandRequest& request, ResultCallback callback);

    /// Asks for the current snapshot outside the subscription stream.
    void refresh();

signals:
    void connectedChanged();
    void snapshotChanged(const kcb::SessionSnapshot& snapshot);
    void eventReceived(const QString& topic, const QJsonObject& payload);

private slots:
    void onConnected();
    void onDisconnected();
    void onReadyRead();
    void onError(QLocalSocket::LocalSocketError error);

private:
    void scheduleReconnect();
    void sendRequest(const QString& command, const QJsonObject& data = {},
                     ResultCallback callback = {});
    void handleMessage(const QJsonObject& message);
    void applySnapshot(const QJsonObject& obj);
    void failPending();

    QLocalSocket* socket_ = nullptr;
    QString socketPath_;
    QByteArray readBuffer_;
    int reconnectMs_ = 5000;
    bool reconnectScheduled_ = false;
    int nextId_ = 1;
    QMap<QString, ResultCallback> pending_;
    SnapshotTracker tracker_;
    SessionSnapshot snapshot_;
};

} // namespace kcb
