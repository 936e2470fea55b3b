#pragma once

#include <QObject>
#include <QHash>
#include <QJsonObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QSet>

namespace kcb {

class IEventBus;
class SessionManager;
struct SessionSnapshot;

/// Unix domain socket IPC server for session consumers (tray applet, CLI).
///
/// Newline-delimited JSON in both directions. A request carries "command",
/// an optional "id" echoed in the response and an optional "data" object.
/// Clients that sent "subscribe" also receive every published snapshot and
/// every session event as unsolicited pushes.
class IpcServer : public QObject {
    Q_OBJECT

public:
    explicit IpcServer(QObject* parent = nullptr);
    ~IpcServer() override;

    /// Start listening. Returns false if the socket cannot be bound.
    bool start(const QString& socketPath);
    void stop();

    // Inject dependencies
    void setSessionManager(SessionManager* manager);
    void setEventBus(IEventBus* eventBus);

    int subscriberCount() const { return subscribers_.size(); }

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    void handleRequest(QLocalSocket* socket, const QByteArray& line);
    void handleSubscribe(QLocalSocket* socket, const QJsonValue& id);
    void handleSnapshot(QLocalSocket* socket, const QJsonValue& id);
    void handleCommand(QLocalSocket* socket, const QJsonValue& id, const QString& command,
                       const QJsonObject& data);

    void onSnapshot(const SessionSnapshot& snapshot);
    void onEvent(const QString& topic, const QVariantMap& payload);
    void broadcast(const QJsonObject& message);

    static void send(QLocalSocket* socket, const QJsonObject& message);
    static QJsonObject response(const QJsonValue& id, const QString& error = {});

    QLocalServer* server_ = nullptr;
    SessionManager* manager_ = nullptr;
    IEventBus* eventBus_ = nullptr;
    int eventSubscription_ = -1;
    QHash<QLocalSocket*, QByteArray> buffers_;
    QSet<QLocalSocket*> subscribers_;
};

} // namespace kcb
