#pragma once

#include "core/bus/IBusGateway.hpp"
#include <QObject>
#include <QDBusConnection>
#include <QDBusMessage>
#include <QHash>
#include <QSet>

class QDBusServiceWatcher;

namespace kcb {

class IConfigService;

/// IBusGateway over QtDBus for kdeconnectd.
///
/// Signal matches are registered lazily per signal name with an empty
/// object path, so one match covers every device object. They are torn
/// down and re-registered whenever the daemon re-appears on the bus.
class KdeConnectGateway : public QObject, public IBusGateway {
    Q_OBJECT

public:
    explicit KdeConnectGateway(IConfigService* config, QObject* parent = nullptr);
    KdeConnectGateway(IConfigService* config, const QDBusConnection& connection,
                      QObject* parent = nullptr);

    void start();

    bool isAvailable() const override { return available_; }
    int subscribe(const QString& signalName, SignalCallback callback) override;
    void unsubscribe(int subscriptionId) override;
    int watchAvailability(AvailabilityCallback callback) override;
    void call(const BusCall& call, ReplyCallback callback) override;

    /// Backoff before retry number `attempt` (1-based).
    int backoffForAttempt(int attempt) const;

    static BusError classify(const QDBusError& error);
    static QVariant unwrap(const QVariant& value);

private slots:
    void onBusSignal(const QDBusMessage& message);

private:
    struct Subscription {
        QString name;
        SignalCallback callback;
    };

    void connectSignal(const QString& name);
    void disconnectSignal(const QString& name);
    void resubscribeAll();
    void setAvailable(bool available);
    void dispatch(const BusCall& call, const ReplyCallback& callback, int attempt);

    QDBusConnection bus_;
    QString service_;
    int callTimeoutMs_ = 5000;
    int maxAttempts_ = 4;
    int initialBackoffMs_ = 250;
    int maxBackoffMs_ = 4000;

    bool available_ = false;
    QDBusServiceWatcher* watcher_ = nullptr;

    int nextId_ = 1;
    QHash<int, Subscription> subscriptions_;
    QHash<int, AvailabilityCallback> availabilityWatchers_;
    QSet<QString> connectedSignals_;
};

} // namespace kcb
