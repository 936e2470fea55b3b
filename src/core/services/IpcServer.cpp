#include "IpcServer.hpp"
#include "IEventBus.hpp"
#include "core/session/SessionManager.hpp"
#include <QJsonDocument>
#include <QFile>
#include <QPointer>
#include <QDebug>

namespace kcb {

namespace {
// A client that sends this much without a newline is dropped
constexpr int kMaxLineBytes = 1 << 20;
}

IpcServer::IpcServer(QObject* parent)
    : QObject(parent)
{
}

IpcServer::~IpcServer()
{
    if (eventBus_ && eventSubscription_ >= 0)
        eventBus_->unsubscribe(eventSubscription_);
    stop();
}

bool IpcServer::start(const QString& socketPath)
{
    if (server_) return false;

    // Remove stale socket file
    QFile::remove(socketPath);

    server_ = new QLocalServer(this);
    server_->setSocketOptions(QLocalServer::UserAccessOption);

    connect(server_, &QLocalServer::newConnection, this, &IpcServer::onNewConnection);

    if (!server_->listen(socketPath)) {
        qWarning() << "[Ipc] Failed to listen on" << socketPath << ":" << server_->errorString();
        delete server_;
        server_ = nullptr;
        return false;
    }

    qInfo() << "[Ipc] Listening on" << socketPath;
    return true;
}

void IpcServer::stop()
{
    subscribers_.clear();
    buffers_.clear();
    if (server_) {
        server_->close();
        delete server_;
        server_ = nullptr;
    }
}

void IpcServer::setSessionManager(SessionManager* manager)
{
    if (manager_)
        disconnect(manager_, nullptr, this, nullptr);
    manager_ = manager;
    if (manager_)
        connect(manager_, &SessionManager::snapshotPublished, this, &IpcServer::onSnapshot);
}

void IpcServer::setEventBus(IEventBus* eventBus)
{
    if (eventBus_ && eventSubscription_ >= 0)
        eventBus_->unsubscribe(eventSubscription_);
    eventBus_ = eventBus;
    eventSubscription_ = -1;
    if (eventBus_) {
        eventSubscription_ = eventBus_->subscribe(QStringLiteral("*"),
            [this](const QString& topic, const QVariantMap& payload) { onEvent(topic, payload); });
    }
}

void IpcServer::onNewConnection()
{
    while (auto* socket = server_->nextPendingConnection()) {
        buffers_.insert(socket, {});
        connect(socket, &QLocalSocket::readyRead, this, &IpcServer::onReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, &IpcServer::onDisconnected);
    }
}

void IpcServer::onReadyRead()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    QByteArray& buffer = buffers_[socket];
    buffer.append(socket->readAll());

    int newline;
    while ((newline = buffer.indexOf('\n')) >= 0) {
        const QByteArray line = buffer.left(newline).trimmed();
        buffer.remove(0, newline + 1);
        if (!line.isEmpty())
            handleRequest(socket, line);
        if (!buffers_.contains(socket))
            return;
    }

    if (buffer.size() > kMaxLineBytes) {
        qWarning() << "[Ipc] Client sent an oversized request, disconnecting";
        socket->disconnectFromServer();
    }
}

void IpcServer::onDisconnected()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    buffers_.remove(socket);
    subscribers_.remove(socket);
    socket->deleteLater();
}

void IpcServer::handleRequest(QLocalSocket* socket, const QByteArray& line)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (!doc.isObject()) {
        send(socket, response(QJsonValue(), QStringLiteral("InvalidJson")));
        return;
    }

    const QJsonObject obj = doc.object();
    const QJsonValue id = obj.value("id");
    const QString command = obj.value("command").toString();
    const QJsonObject data = obj.value("data").toObject();

    if (!manager_) {
        send(socket, response(id, errorKindName(ErrorKind::BusUnavailable)));
        return;
    }

    if (command == QLatin1String("subscribe"))
        handleSubscribe(socket, id);
    else if (command == QLatin1String("snapshot"))
        handleSnapshot(socket, id);
    else if (commandKindFromName(command))
        handleCommand(socket, id, command, data);
    else
        send(socket, response(id, QStringLiteral("UnknownCommand")));
}

void IpcServer::handleSubscribe(QLocalSocket* socket, const QJsonValue& id)
{
    subscribers_.insert(socket);
    send(socket, response(id));

    QJsonObject push = manager_->snapshot().toJson();
    push["type"] = QStringLiteral("snapshot");
    send(socket, push);
}

void IpcServer::handleSnapshot(QLocalSocket* socket, const QJsonValue& id)
{
    QJsonObject reply = response(id);
    reply["snapshot"] = manager_->snapshot().toJson();
    send(socket, reply);
}

void IpcServer::handleCommand(QLocalSocket* socket, const QJsonValue& id, const QString& command,
                              const QJsonObject& data)
{
    CommandRequest request;
    request.kind = *commandKindFromName(command);
    request.deviceId = data.value("device").toString();
    if (request.deviceId.isEmpty()) {
        send(socket, response(id, QStringLiteral("InvalidRequest")));
        return;
    }

    if (request.kind == CommandKind::SetPluginEnabled) {
        request.plugin = pluginKindFromName(data.value("plugin").toString());
        if (request.plugin == PluginKind::Unknown || !data.value("enabled").isBool()) {
            send(socket, response(id, QStringLiteral("InvalidRequest")));
            return;
        }
        request.enabled = data.value("enabled").toBool();
    }

    // The client may be gone by the time the command settles
    QPointer<QLocalSocket> target(socket);
    manager_->submit(request, [target, id](const CommandResult& result) {
        if (!target || target->state() != QLocalSocket::ConnectedState)
            return;
        send(target, response(id, result.ok() ? QString() : errorKindName(result.error)));
    });
}

void IpcServer::onSnapshot(const SessionSnapshot& snapshot)
{
    if (subscribers_.isEmpty())
        return;
    QJsonObject push = snapshot.toJson();
    push["type"] = QStringLiteral("snapshot");
    broadcast(push);
}

void IpcServer::onEvent(const QString& topic, const QVariantMap& payload)
{
    if (subscribers_.isEmpty())
        return;
    QJsonObject push = QJsonObject::fromVariantMap(payload);
    push["type"] = QStringLiteral("event");
    push["topic"] = topic;
    broadcast(push);
}

void IpcServer::broadcast(const QJsonObject& message)
{
    for (auto* socket : std::as_const(subscribers_))
        send(socket, message);
}

void IpcServer::send(QLocalSocket* socket, const QJsonObject& message)
{
    socket->write(QJsonDocument(message).toJson(QJsonDocument::Compact) + "\n");
    socket->flush();
}

QJsonObject IpcServer::response(const QJsonValue& id, const QString& error)
{
    QJsonObject obj;
    if (!id.isUndefined() && !id.isNull())
        obj["id"] = id;
    obj["ok"] = error.isEmpty();
    if (!error.isEmpty())
        obj["error"] = error;
    return obj;
}

} // namespace kcb
