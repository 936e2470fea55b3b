#include "SessionClient.hpp"
#include <QJsonDocument>
#include <QDebug>
#include <QTimer>

namespace kcb {

SessionClient::SessionClient(const QString& socketPath, QObject* parent)
    : QObject(parent)
    , socketPath_(socketPath)
{
    socket_ = new QLocalSocket(this);
    connect(socket_, &QLocalSocket::connected, this, &SessionClient::onConnected);
    connect(socket_, &QLocalSocket::disconnected, this, &SessionClient::onDisconnected);
    connect(socket_, &QLocalSocket::readyRead, this, &SessionClient::onReadyRead);
    connect(socket_, &QLocalSocket::errorOccurred, this, &SessionClient::onError);
}

bool SessionClient::isConnected() const
{
    return socket_->state() == QLocalSocket::ConnectedState;
}

void SessionClient::connectToService()
{
    reconnectScheduled_ = false;
    if (socket_->state() != QLocalSocket::UnconnectedState)
        return;
    socket_->connectToServer(socketPath_);
}

void SessionClient::scheduleReconnect()
{
    if (reconnectScheduled_)
        return;
    reconnectScheduled_ = true;
    QTimer::singleShot(reconnectMs_, this, &SessionClient::connectToService);
}

void SessionClient::submit(const CommandRequest& request, ResultCallback callback)
{
    if (!isConnected()) {
        callback(CommandResult::failure(ErrorKind::BusUnavailable));
        return;
    }

    QJsonObject data;
    data["device"] = request.deviceId;
    if (request.kind == CommandKind::SetPluginEnabled) {
        data["plugin"] = pluginKindName(request.plugin);
        data["enabled"] = request.enabled;
    }
    sendRequest(commandKindName(request.kind), data, std::move(callback));
}

void SessionClient::refresh()
{
    sendRequest(QStringLiteral("snapshot"));
}

void SessionClient::onConnected()
{
    qInfo() << "[Client] Connected to" << socketPath_;
    // A restarted server numbers its snapshots from the start again
    tracker_.reset();
    emit connectedChanged();
    sendRequest(QStringLiteral("subscribe"));
}

void SessionClient::onDisconnected()
{
    qInfo() << "[Client] Disconnected from" << socketPath_;
    readBuffer_.clear();
    failPending();
    emit connectedChanged();
    // Retry after 5 seconds
    scheduleReconnect();
}

void SessionClient::onError(QLocalSocket::LocalSocketError error)
{
    if (error == QLocalSocket::ServerNotFoundError ||
        error == QLocalSocket::ConnectionRefusedError) {
        // Daemon not running yet, retry
        scheduleReconnect();
    }
}

void SessionClient::onReadyRead()
{
    readBuffer_ += socket_->readAll();
    while (true) {
        int idx = readBuffer_.indexOf('\n');
        if (idx < 0) break;
        QByteArray line = readBuffer_.left(idx);
        readBuffer_ = readBuffer_.mid(idx + 1);

        QJsonParseError err;
        QJsonDocument doc = QJsonDocument::fromJson(line, &err);
        if (err.error == QJsonParseError::NoError && doc.isObject())
            handleMessage(doc.object());
        else
            qWarning() << "[Client] Unparseable message:" << err.errorString();
    }
}

void SessionClient::sendRequest(const QString& command, const QJsonObject& data,
                                ResultCallback callback)
{
    if (!isConnected()) return;

    QString id = QString::number(nextId_++);
    if (callback)
        pending_[id] = std::move(callback);

    QJsonObject msg;
    msg["id"] = id;
    msg["command"] = command;
    if (!data.isEmpty())
        msg["data"] = data;

    QByteArray bytes = QJsonDocument(msg).toJson(QJsonDocument::Compact) + "\n";
    socket_->write(bytes);
    socket_->flush();
}

void SessionClient::handleMessage(const QJsonObject& message)
{
    const QString type = message["type"].toString();
    if (type == QLatin1String("snapshot")) {
        applySnapshot(message);
        return;
    }
    if (type == QLatin1String("event")) {
        emit eventReceived(message["topic"].toString(), message);
        return;
    }

    if (message.contains("snapshot"))
        applySnapshot(message["snapshot"].toObject());

    const QString id = message["id"].toString();
    auto it = pending_.find(id);
    if (it == pending_.end())
        return;
    ResultCallback callback = it.value();
    pending_.erase(it);

    if (message["ok"].toBool()) {
        callback(CommandResult::success());
        return;
    }
    const QString error = message["error"].toString();
    ErrorKind kind = errorKindFromName(error);
    if (kind == ErrorKind::None) {
        // Protocol-level failure (malformed request, unknown command)
        qWarning() << "[Client] Request" << id << "refused:" << error;
        kind = ErrorKind::CallFailed;
    }
    callback(CommandResult::failure(kind));
}

void SessionClient::applySnapshot(const QJsonObject& obj)
{
    auto snap = SessionSnapshot::fromJson(obj);
    if (!snap) {
        qWarning() << "[Client] Malformed snapshot";
        return;
    }
    if (!tracker_.accept(snap->sequence)) {
        qDebug() << "[Client] Dropping stale snapshot" << snap->sequence
                 << "(have" << tracker_.latest() << ")";
        return;
    }
    snapshot_ = *snap;
    emit snapshotChanged(snapshot_);
}

void SessionClient::failPending()
{
    const auto callbacks = pending_.values();
    pending_.clear();
    for (const auto& cb : callbacks)
        cb(CommandResult::failure(ErrorKind::BusUnavailable));
}

} // namespace kcb
