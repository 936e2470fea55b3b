#pragma once

#include <QVariantMap>
#include <QString>
#include <functional>

namespace kcb {

class INotificationService {
public:
    virtual ~INotificationService() = default;

    using ActionCallback = std::function<void(const QString& notificationId, const QString& action)>;

    /// Post a notification. Required fields: summary.
    /// Optional: body, actions (QStringList of key/label pairs),
    /// urgency (0 low, 1 normal, 2 critical), ttlMs (0 = persistent).
    /// Returns notification ID.
    virtual QString post(const QVariantMap& notification) = 0;

    /// Dismiss a notification by ID.
    virtual void dismiss(const QString& notificationId) = 0;

    /// Invoked when the user picks one of a notification's actions.
    virtual void setActionHandler(ActionCallback callback) = 0;
};

} // namespace kcb
