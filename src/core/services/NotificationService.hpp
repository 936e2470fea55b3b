#pragma once

#include "INotificationService.hpp"
#include <QObject>
#include <QDBusConnection>
#include <QHash>
#include <QStringList>

namespace kcb {

struct Notification {
    QString id;
    QString summary;
    QString body;
    QStringList actions;  // key, label, key, label, ...
    int urgency = 1;
    int ttlMs = 0;        // 0 = persistent until dismissed
    uint serverId = 0;    // assigned by the notification server
    bool closeRequested = false;
};

/// Desktop notifications through org.freedesktop.Notifications.
///
/// IDs handed out are local; the server's id arrives asynchronously and a
/// dismiss issued before it lands is replayed once it does.
class NotificationService : public QObject, public INotificationService {
    Q_OBJECT
public:
    explicit NotificationService(const QDBusConnection& connection, QObject* parent = nullptr);

    QString post(const QVariantMap& notification) override;
    void dismiss(const QString& notificationId) override;
    void setActionHandler(ActionCallback callback) override { actionHandler_ = std::move(callback); }

    QList<Notification> active() const { return notifications_.values(); }

signals:
    void notificationAdded(const kcb::Notification& n);
    void notificationRemoved(const QString& id);

private slots:
    void onActionInvoked(uint serverId, const QString& action);
    void onNotificationClosed(uint serverId, uint reason);

private:
    QString localId(uint serverId) const;
    void closeOnServer(uint serverId);
    void drop(const QString& id);

    QDBusConnection connection_;
    QHash<QString, Notification> notifications_;
    ActionCallback actionHandler_;
};

} // namespace kcb
