#pragma once

#include "core/session/SessionManager.hpp"
#include <QObject>
#include <QHash>
#include <functional>

namespace kcb {

class IEventBus;
class INotificationService;

/// Surfaces pairing events routed to the native path as desktop
/// notifications, and turns the prompt's accept/reject actions back into
/// pairing commands.
class NativeNotifier : public QObject {
    Q_OBJECT

public:
    using CommandSink = std::function<void(const CommandRequest& request, ResultCallback callback)>;

    NativeNotifier(INotificationService* notifications, IEventBus* eventBus, CommandSink submit,
                   QObject* parent = nullptr);
    ~NativeNotifier() override;

    void start();

    /// Expiry of the informational notifications.
    void setTransientTtl(int ms) { transientTtlMs_ = ms; }

    bool hasPrompt(const QString& deviceId) const { return prompts_.contains(deviceId); }

private:
    void onEvent(const QString& topic, const QVariantMap& payload);
    void onAction(const QString& notificationId, const QString& action);
    void closePrompt(const QString& deviceId);
    void postTransient(const QString& summary, const QString& body);

    INotificationService* notifications_;
    IEventBus* eventBus_;
    CommandSink submit_;
    int subscription_ = -1;
    int transientTtlMs_ = 8000;
    QHash<QString, QString> prompts_;        // device id -> notification id
    QHash<QString, QString> promptDevices_;  // notification id -> device id
};

} // namespace kcb
