#include "core/bus/KdeConnectGateway.hpp"
#include "core/bus/DaemonProtocol.hpp"
#include "core/services/IConfigService.hpp"
#include <QDBusArgument>
#include <QDBusConnectionInterface>
#include <QDBusMetaType>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusReply>
#include <QDBusServiceWatcher>
#include <QDBusVariant>
#include <QDebug>
#include <QTimer>

namespace kcb {

KdeConnectGateway::KdeConnectGateway(IConfigService* config, QObject* parent)
    : KdeConnectGateway(config, QDBusConnection::sessionBus(), parent)
{
}

KdeConnectGateway::KdeConnectGateway(IConfigService* config, const QDBusConnection& connection,
                                     QObject* parent)
    : QObject(parent)
    , bus_(connection)
    , service_(configString(config, "daemon.service", daemon::kDefaultService))
    , callTimeoutMs_(configInt(config, "daemon.call_timeout_ms", 5000))
    , maxAttempts_(qMax(1, configInt(config, "daemon.retry.max_attempts", 4)))
    , initialBackoffMs_(configInt(config, "daemon.retry.initial_backoff_ms", 250))
    , maxBackoffMs_(configInt(config, "daemon.retry.max_backoff_ms", 4000))
{
}

void KdeConnectGateway::start()
{
    if (!bus_.isConnected()) {
        qWarning() << "[Gateway] Session bus not reachable:" << bus_.lastError().message();
        setAvailable(false);
        return;
    }

    watcher_ = new QDBusServiceWatcher(service_, bus_,
        QDBusServiceWatcher::WatchForRegistration | QDBusServiceWatcher::WatchForUnregistration,
        this);
    connect(watcher_, &QDBusServiceWatcher::serviceRegistered, this, [this]() {
        qInfo() << "[Gateway]" << service_ << "appeared on the bus, re-subscribing";
        resubscribeAll();
        setAvailable(true);
    });
    connect(watcher_, &QDBusServiceWatcher::serviceUnregistered, this, [this]() {
        qWarning() << "[Gateway]" << service_ << "left the bus";
        setAvailable(false);
    });

    const QDBusReply<bool> registered = bus_.interface()->isServiceRegistered(service_);
    if (!registered.isValid())
        qWarning() << "[Gateway] Cannot query bus names:" << registered.error().message();
    setAvailable(registered.isValid() && registered.value());
    qInfo() << "[Gateway] Watching" << service_ << (available_ ? "(running)" : "(not running)");
}

void KdeConnectGateway::setAvailable(bool available)
{
    if (available_ == available)
        return;
    available_ = available;

    const auto watchers = availabilityWatchers_.values();
    for (const auto& cb : watchers)
        cb(available);
}

int KdeConnectGateway::watchAvailability(AvailabilityCallback callback)
{
    const int id = nextId_++;
    availabilityWatchers_.insert(id, std::move(callback));
    return id;
}

int KdeConnectGateway::subscribe(const QString& signalName, SignalCallback callback)
{
    const int id = nextId_++;
    subscriptions_.insert(id, {signalName, std::move(callback)});
    if (!connectedSignals_.contains(signalName)) {
        connectedSignals_.insert(signalName);
        connectSignal(signalName);
    }
    return id;
}

void KdeConnectGateway::unsubscribe(int subscriptionId)
{
    auto it = subscriptions_.find(subscriptionId);
    if (it == subscriptions_.end()) {
        availabilityWatchers_.remove(subscriptionId);
        return;
    }

    const QString name = it->name;
    subscriptions_.erase(it);
    for (const auto& sub : std::as_const(subscriptions_)) {
        if (sub.name == name)
            return;
    }
    connectedSignals_.remove(name);
    disconnectSignal(name);
}

void KdeConnectGateway::connectSignal(const QString& name)
{
    const QString iface = daemon::signalInterface(name);
    const QString member = daemon::signalMember(name);
    // Empty path: match the signal on every object the daemon exports
    const bool ok = bus_.connect(service_, QString(), iface, member,
                                 this, SLOT(onBusSignal(QDBusMessage)));
    if (!ok)
        qWarning() << "[Gateway] Cannot subscribe to" << iface << member << bus_.lastError().message();
}

void KdeConnectGateway::disconnectSignal(const QString& name)
{
    bus_.disconnect(service_, QString(), daemon::signalInterface(name), daemon::signalMember(name),
                    this, SLOT(onBusSignal(QDBusMessage)));
}

void KdeConnectGateway::resubscribeAll()
{
    for (const auto& name : std::as_const(connectedSignals_)) {
        disconnectSignal(name);
        connectSignal(name);
    }
}

void KdeConnectGateway::onBusSignal(const QDBusMessage& message)
{
    BusSignal signal;
    signal.name = daemon::signalName(message.interface(), message.member());
    for (const auto& arg : message.arguments())
        signal.args.append(unwrap(arg));

    if (daemon::isDaemonSignal(signal.name))
        signal.deviceId = signal.args.isEmpty() ? QString() : signal.args.first().toString();
    else
        signal.deviceId = daemon::deviceIdFromPath(message.path());

    QList<SignalCallback> targets;
    for (const auto& sub : std::as_const(subscriptions_)) {
        if (sub.name == signal.name)
            targets.append(sub.callback);
    }
    for (const auto& cb : targets)
        cb(signal);
}

void KdeConnectGateway::call(const BusCall& call, ReplyCallback callback)
{
    dispatch(call, callback, 1);
}

void KdeConnectGateway::dispatch(const BusCall& call, const ReplyCallback& callback, int attempt)
{
    const QString path = daemon::objectPath(call.deviceId, call.object);
    QDBusMessage msg = QDBusMessage::createMethodCall(service_, path, call.interface, call.method);
    msg.setArguments(call.args);

    QDBusPendingCall pending = bus_.asyncCall(msg, callTimeoutMs_);
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [this, watcher, call, callback, attempt]() {
        watcher->deleteLater();

        BusReply reply;
        if (watcher->isError()) {
            reply.error = classify(watcher->error());
            if (reply.error.isTransient() && attempt < maxAttempts_) {
                const int delay = backoffForAttempt(attempt);
                qDebug() << "[Gateway]" << call.method << "failed with" << reply.error.name
                         << ", attempt" << attempt << "of" << maxAttempts_
                         << ", retrying in" << delay << "ms";
                QTimer::singleShot(delay, this, [this, call, callback, attempt]() {
                    dispatch(call, callback, attempt + 1);
                });
                return;
            }
            qWarning() << "[Gateway]" << call.method << "on" << (call.deviceId.isEmpty() ? "daemon" : call.deviceId)
                       << "failed:" << reply.error.name << reply.error.message;
        } else {
            for (const auto& v : watcher->reply().arguments())
                reply.values.append(unwrap(v));
        }
        callback(reply);
    });
}

int KdeConnectGateway::backoffForAttempt(int attempt) const
{
    int delay = initialBackoffMs_;
    for (int i = 1; i < attempt && delay < maxBackoffMs_; ++i)
        delay *= 2;
    return qMin(delay, maxBackoffMs_);
}

BusError KdeConnectGateway::classify(const QDBusError& error)
{
    BusError result;
    result.name = error.name();
    result.message = error.message();

    switch (error.type()) {
    case QDBusError::NoError:
        result.kind = BusErrorKind::None;
        break;
    case QDBusError::ServiceUnknown:
    case QDBusError::NoServer:
    case QDBusError::Disconnected:
        result.kind = BusErrorKind::Unavailable;
        break;
    case QDBusError::NoReply:
    case QDBusError::Timeout:
    case QDBusError::TimedOut:
        result.kind = BusErrorKind::Timeout;
        break;
    default:
        result.kind = BusErrorKind::Remote;
        break;
    }
    return result;
}

QVariant KdeConnectGateway::unwrap(const QVariant& value)
{
    if (value.userType() == qMetaTypeId<QDBusVariant>())
        return unwrap(value.value<QDBusVariant>().variant());

    if (value.userType() == qMetaTypeId<QDBusArgument>()) {
        const QDBusArgument arg = value.value<QDBusArgument>();
        const QString signature = arg.currentSignature();
        if (signature == QLatin1String("as"))
            return qdbus_cast<QStringList>(arg);
        if (signature == QLatin1String("a{sv}"))
            return unwrap(qdbus_cast<QVariantMap>(arg));
        return value;
    }

    if (value.userType() == QMetaType::QVariantMap) {
        QVariantMap map = value.toMap();
        for (auto it = map.begin(); it != map.end(); ++it)
            it.value() = unwrap(it.value());
        return map;
    }

    return value;
}

} // namespace kcb
