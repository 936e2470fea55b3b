#include "NotificationService.hpp"
#include <QDBusMessage>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QDebug>
#include <QTimer>
#include <QUuid>

namespace kcb {

namespace {
const QString kService = QStringLiteral("org.freedesktop.Notifications");
const QString kPath = QStringLiteral("/org/freedesktop/Notifications");
const QString kInterface = QStringLiteral("org.freedesktop.Notifications");
const QString kAppName = QStringLiteral("KDE Connect Bridge");
const QString kAppIcon = QStringLiteral("kdeconnect");
}

NotificationService::NotificationService(const QDBusConnection& connection, QObject* parent)
    : QObject(parent)
    , connection_(connection)
{
    if (!connection_.isConnected()) {
        qWarning() << "[Notify] Session bus not reachable, desktop notifications disabled";
        return;
    }
    connection_.connect(kService, kPath, kInterface, QStringLiteral("ActionInvoked"),
                        this, SLOT(onActionInvoked(uint,QString)));
    connection_.connect(kService, kPath, kInterface, QStringLiteral("NotificationClosed"),
                        this, SLOT(onNotificationClosed(uint,uint)));
}

QString NotificationService::post(const QVariantMap& data)
{
    Notification n;
    n.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    n.summary = data.value("summary").toString();
    n.body = data.value("body").toString();
    n.actions = data.value("actions").toStringList();
    n.urgency = qBound(0, data.value("urgency", 1).toInt(), 2);
    n.ttlMs = data.value("ttlMs", 0).toInt();

    notifications_.insert(n.id, n);
    emit notificationAdded(n);

    const QString id = n.id;
    if (!connection_.isConnected()) {
        // No bus to answer; drop it once the caller has the id
        QTimer::singleShot(0, this, [this, id]() { drop(id); });
        return id;
    }

    QVariantMap hints;
    hints["urgency"] = QVariant::fromValue(static_cast<uchar>(n.urgency));
    hints["desktop-entry"] = QStringLiteral("org.kde.kdeconnect.daemon");

    QDBusMessage msg = QDBusMessage::createMethodCall(kService, kPath, kInterface,
                                                      QStringLiteral("Notify"));
    msg << kAppName << uint(0) << kAppIcon << n.summary << n.body << n.actions << hints
        << (n.ttlMs > 0 ? n.ttlMs : 0);

    auto* watcher = new QDBusPendingCallWatcher(connection_.asyncCall(msg), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher, id]() {
        watcher->deleteLater();
        QDBusPendingReply<uint> reply = *watcher;

        if (reply.isError()) {
            qWarning() << "[Notify] Notify failed:" << reply.error().name() << reply.error().message();
            drop(id);
            return;
        }

        const uint serverId = reply.value();
        auto it = notifications_.find(id);
        if (it == notifications_.end())
            return;
        it->serverId = serverId;
        if (it->closeRequested) {
            closeOnServer(serverId);
            notifications_.erase(it);
            emit notificationRemoved(id);
        }
    });

    return id;
}

void NotificationService::dismiss(const QString& notificationId)
{
    auto it = notifications_.find(notificationId);
    if (it == notifications_.end())
        return;

    if (it->serverId == 0) {
        // Notify has not answered yet
        it->closeRequested = true;
        return;
    }
    closeOnServer(it->serverId);
    notifications_.erase(it);
    emit notificationRemoved(notificationId);
}

void NotificationService::drop(const QString& id)
{
    if (notifications_.remove(id) > 0)
        emit notificationRemoved(id);
}

void NotificationService::closeOnServer(uint serverId)
{
    QDBusMessage msg = QDBusMessage::createMethodCall(kService, kPath, kInterface,
                                                      QStringLiteral("CloseNotification"));
    msg << serverId;
    auto* watcher = new QDBusPendingCallWatcher(connection_.asyncCall(msg), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [watcher, serverId]() {
        watcher->deleteLater();
        if (watcher->isError())
            qDebug() << "[Notify] CloseNotification" << serverId << "failed:" << watcher->error().message();
    });
}

QString NotificationService::localId(uint serverId) const
{
    for (auto it = notifications_.constBegin(); it != notifications_.constEnd(); ++it) {
        if (it->serverId == serverId)
            return it.key();
    }
    return {};
}

void NotificationService::onActionInvoked(uint serverId, const QString& action)
{
    const QString id = localId(serverId);
    if (id.isEmpty())
        return;  // another application's notification

    qInfo() << "[Notify] Action" << action << "on" << id;
    if (actionHandler_)
        actionHandler_(id, action);
}

void NotificationService::onNotificationClosed(uint serverId, uint reason)
{
    const QString id = localId(serverId);
    if (id.isEmpty())
        return;

    qDebug() << "[Notify]" << id << "closed, reason" << reason;
    notifications_.remove(id);
    emit notificationRemoved(id);
}

} // namespace kcb
