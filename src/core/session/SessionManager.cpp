#include "core/session/SessionManager.hpp"
#include "core/bus/DaemonProtocol.hpp"
#include "core/notify/NotificationArbiter.hpp"
#include "core/services/IConfigService.hpp"
#include "core/services/IEventBus.hpp"
#include <QDebug>
#include <QTimer>

namespace kcb {

QString commandKindName(CommandKind kind)
{
    switch (kind) {
    case CommandKind::RequestPair:      return QStringLiteral("request_pair");
    case CommandKind::AcceptPair:       return QStringLiteral("accept_pair");
    case CommandKind::RejectPair:       return QStringLiteral("reject_pair");
    case CommandKind::Unpair:           return QStringLiteral("unpair");
    case CommandKind::SetPluginEnabled: return QStringLiteral("set_plugin_enabled");
    case CommandKind::CancelPairing:    return QStringLiteral("cancel_pairing");
    }
    return QString();
}

std::optional<CommandKind> commandKindFromName(const QString& name)
{
    for (CommandKind k : {CommandKind::RequestPair, CommandKind::AcceptPair, CommandKind::RejectPair,
                          CommandKind::Unpair, CommandKind::SetPluginEnabled,
                          CommandKind::CancelPairing}) {
        if (commandKindName(k) == name)
            return k;
    }
    return std::nullopt;
}

SessionManager::SessionManager(IBusGateway* bus, IConfigService* config,
                               NotificationArbiter* arbiter, QObject* parent)
    : QObject(parent)
    , bus_(bus)
    , arbiter_(arbiter)
    , registry_(new DeviceRegistry(this))
    , pairing_(new PairingStateMachine(this))
    , queue_(new DeviceWorkQueue(this))
    , sweepTimer_(new QTimer(this))
    , commandTimeoutMs_(configInt(config, "session.command_timeout_ms", 45000))
    , unreachableTimeoutS_(configInt(config, "devices.unreachable_timeout_s", 300))
    , sweepIntervalS_(configInt(config, "devices.sweep_interval_s", 30))
    , failFast_(configBool(config, "daemon.fail_fast", false))
{
    arbiter_->setParent(this);
    pairing_->setRequestTimeout(configInt(config, "pairing.request_timeout_ms", 30000));
    pairing_->setInboundWins(configBool(config, "pairing.inbound_wins", true));

    connect(registry_, &DeviceRegistry::deviceChanged, this, [this]() { dirty_ = true; });
    connect(registry_, &DeviceRegistry::deviceRemoved, this, [this]() { dirty_ = true; });
    connect(queue_, &DeviceWorkQueue::settled, this, [this]() { publishIfDirty(); });

    connect(pairing_, &PairingStateMachine::requestExpired, this,
            [this](const QString& deviceId, quint64 token) {
        queue_->enqueue(deviceId, QStringLiteral("expire"), [this, deviceId, token](const Done& done) {
            handleTransition(deviceId, pairing_->expire(deviceId, token));
            done();
        });
    });

    sweepTimer_->setInterval(sweepIntervalS_ * 1000);
    connect(sweepTimer_, &QTimer::timeout, this, &SessionManager::sweep);
}

SessionManager::~SessionManager()
{
    for (int id : std::as_const(subscriptions_))
        bus_->unsubscribe(id);
    if (availabilityWatch_ >= 0)
        bus_->unsubscribe(availabilityWatch_);
}

void SessionManager::start()
{
    availabilityWatch_ = bus_->watchAvailability([this](bool available) {
        onAvailabilityChanged(available);
    });

    const QStringList signalNames = {
        daemon::kDeviceAdded, daemon::kDeviceRemoved, daemon::kDeviceVisibilityChanged,
        daemon::kDeviceListChanged, daemon::kReachableChanged, daemon::kPairStateChanged,
        daemon::kNameChanged, daemon::kTypeChanged, daemon::kPluginsChanged,
        daemon::kBatteryRefreshed, daemon::kConnectivityRefreshed,
    };
    for (const auto& name : signalNames)
        subscriptions_.append(bus_->subscribe(name, [this](const BusSignal& s) { onSignal(s); }));

    arbiter_->recover();
    sweepTimer_->start();

    daemonAvailable_ = bus_->isAvailable();
    dirty_ = true;
    qInfo() << "[Session] Started, daemon" << (daemonAvailable_ ? "available" : "not running");
    if (daemonAvailable_)
        resync();
    publishIfDirty();
}

void SessionManager::shutdown()
{
    sweepTimer_->stop();
    const auto rules = arbiter_->rules();
    for (const auto& rule : rules) {
        if (!arbiter_->revert(rule.deviceId))
            qWarning() << "[Session] Could not restore daemon notifications for" << rule.deviceId
                       << ", backup kept for the next start";
    }
    qInfo() << "[Session] Shut down";
}

// --- Commands ---

void SessionManager::submit(const CommandRequest& request, ResultCallback callback)
{
    auto pending = std::make_shared<PendingCommand>();
    pending->request = request;
    pending->callback = std::move(callback);
    pending->timer = new QTimer(this);
    pending->timer->setSingleShot(true);
    connect(pending->timer, &QTimer::timeout, this, [this, pending]() {
        finish(pending, CommandResult::failure(ErrorKind::Timeout));
    });
    pending->timer->start(commandTimeoutMs_);

    const QString& id = request.deviceId;
    if (!registry_->contains(id)) {
        finish(pending, CommandResult::failure(ErrorKind::UnknownDevice));
        return;
    }
    if (failFast_ && !daemonAvailable_ && request.kind != CommandKind::CancelPairing) {
        finish(pending, CommandResult::failure(ErrorKind::BusUnavailable));
        return;
    }
    if (request.kind == CommandKind::SetPluginEnabled) {
        if (request.plugin == PluginKind::Unknown) {
            finish(pending, CommandResult::failure(ErrorKind::InvalidState));
            return;
        }
        if (pairing_->state(id) != PairState::Paired) {
            finish(pending, CommandResult::failure(ErrorKind::NotPaired));
            return;
        }
    }

    qDebug() << "[Session]" << commandKindName(request.kind) << id << "queued";
    queue_->enqueue(id, commandKindName(request.kind), [this, pending](const Done& done) {
        if (pending->finished) {
            done();
            return;
        }
        if (pending->request.kind == CommandKind::CancelPairing) {
            execute(pending, done);
            return;
        }
        whenAvailable([this, pending, done]() {
            if (pending->finished) {
                done();
                return;
            }
            execute(pending, done);
        });
    });
}

void SessionManager::finish(const PendingPtr& pending, const CommandResult& result)
{
    if (pending->finished)
        return;
    pending->finished = true;
    if (pending->timer) {
        pending->timer->stop();
        pending->timer->deleteLater();
        pending->timer = nullptr;
    }

    if (!result.ok()) {
        qInfo() << "[Session]" << commandKindName(pending->request.kind) << pending->request.deviceId
                << "failed:" << errorKindName(result.error);
    }
    if (pending->callback)
        pending->callback(result);
}

void SessionManager::whenAvailable(std::function<void()> task)
{
    if (daemonAvailable_) {
        task();
        return;
    }
    availabilityWaiters_.append(std::move(task));
}

void SessionManager::execute(const PendingPtr& pending, const Done& done)
{
    switch (pending->request.kind) {
    case CommandKind::RequestPair:      runRequestPair(pending, done); break;
    case CommandKind::AcceptPair:       runAcceptPair(pending, done); break;
    case CommandKind::RejectPair:       runRejectPair(pending, done); break;
    case CommandKind::Unpair:           runUnpair(pending, done); break;
    case CommandKind::SetPluginEnabled: runSetPluginEnabled(pending, done); break;
    case CommandKind::CancelPairing:    runCancelPairing(pending, done); break;
    }
}

void SessionManager::runRequestPair(const PendingPtr& pending, const Done& done)
{
    const QString id = pending->request.deviceId;

    // Asking to pair with a device that is already asking us is an accept
    if (pairing_->state(id) == PairState::RequestReceived) {
        runAcceptPair(pending, done);
        return;
    }

    const PairingTransition t = pairing_->requestPairing(id);
    if (t.error != ErrorKind::None) {
        finish(pending, CommandResult::failure(t.error));
        done();
        return;
    }

    // Resolved later by the transition that ends this request
    pairWaiters_.insert(id, PairWaiter{t.token, pending});
    handleTransition(id, t);

    const quint64 token = t.token;
    deviceCall(id, daemon::kRequestPairing, {}, [this, id, token, done](const BusReply& reply) {
        if (!reply.ok()) {
            auto w = pairWaiters_.find(id);
            if (w != pairWaiters_.end() && w->token == token) {
                const PendingPtr waiting = w->pending;
                pairWaiters_.erase(w);
                finish(waiting, CommandResult::failure(fromBusError(reply.error, true)));
            }
            handleTransition(id, pairing_->resolve(id, token, PairingStateMachine::Reply::Failed));
        }
        done();
    });
}

void SessionManager::runAcceptPair(const PendingPtr& pending, const Done& done)
{
    const QString id = pending->request.deviceId;
    const auto session = pairing_->session(id);
    if (!session || session->state != PairState::RequestReceived) {
        finish(pending, CommandResult::failure(ErrorKind::InvalidState));
        done();
        return;
    }

    const quint64 token = session->token;
    deviceCall(id, daemon::kAcceptPairing, {}, [this, id, token, pending, done](const BusReply& reply) {
        if (reply.ok()) {
            const PairingTransition t = pairing_->resolve(id, token, PairingStateMachine::Reply::Accepted);
            handleTransition(id, t);
            if (t.error == ErrorKind::StaleToken && pairing_->state(id) != PairState::Paired)
                finish(pending, CommandResult::failure(ErrorKind::InvalidState));
            else
                finish(pending, CommandResult::success());
        } else {
            handleTransition(id, pairing_->resolve(id, token, PairingStateMachine::Reply::Failed));
            finish(pending, CommandResult::failure(fromBusError(reply.error, true)));
        }
        done();
    });
}

void SessionManager::runRejectPair(const PendingPtr& pending, const Done& done)
{
    const QString id = pending->request.deviceId;
    const auto session = pairing_->session(id);
    if (!session || session->state != PairState::RequestReceived) {
        finish(pending, CommandResult::failure(ErrorKind::InvalidState));
        done();
        return;
    }

    handleTransition(id, pairing_->resolve(id, session->token, PairingStateMachine::Reply::Rejected));
    finish(pending, CommandResult::success());

    deviceCall(id, daemon::kRejectPairing, {}, [id, done](const BusReply& reply) {
        if (!reply.ok())
            qWarning() << "[Session]" << id << "daemon did not take the rejection:" << reply.error.message;
        done();
    });
}

void SessionManager::runUnpair(const PendingPtr& pending, const Done& done)
{
    const QString id = pending->request.deviceId;
    const PairingTransition t = pairing_->beginUnpair(id);
    if (t.error != ErrorKind::None) {
        finish(pending, CommandResult::failure(t.error));
        done();
        return;
    }
    handleTransition(id, t);

    deviceCall(id, daemon::kUnpair, {}, [this, id, pending, done](const BusReply& reply) {
        handleTransition(id, pairing_->finishUnpair(id, reply.ok()));
        finish(pending, reply.ok() ? CommandResult::success()
                                   : CommandResult::failure(fromBusError(reply.error, true)));
        done();
    });
}

void SessionManager::runSetPluginEnabled(const PendingPtr& pending, const Done& done)
{
    const QString id = pending->request.deviceId;
    const PluginKind kind = pending->request.plugin;
    const bool enabled = pending->request.enabled;
    const bool paired = pairing_->state(id) == PairState::Paired;

    switch (plugins_.beginSetEnabled(id, kind, enabled, paired)) {
    case PluginNegotiator::EnableDecision::NotPaired:
        finish(pending, CommandResult::failure(ErrorKind::NotPaired));
        done();
        return;
    case PluginNegotiator::EnableDecision::Unavailable:
        finish(pending, CommandResult::failure(ErrorKind::InvalidState));
        done();
        return;
    case PluginNegotiator::EnableDecision::AlreadySet:
        finish(pending, CommandResult::success());
        done();
        return;
    case PluginNegotiator::EnableDecision::Proceed:
        break;
    }

    // Consumers see the requested value while the daemon call is out
    dirty_ = true;
    publishIfDirty();
    deviceCall(id, daemon::kSetPluginEnabled, {daemonPluginId(kind), enabled},
               [this, id, kind, pending, done](const BusReply& reply) {
        if (plugins_.completeSetEnabled(id, kind, reply.ok()))
            dirty_ = true;
        finish(pending, reply.ok() ? CommandResult::success()
                                   : CommandResult::failure(fromBusError(reply.error, false)));
        done();
    });
}

void SessionManager::runCancelPairing(const PendingPtr& pending, const Done& done)
{
    const QString id = pending->request.deviceId;
    const PairingTransition t = pairing_->cancel(id);
    if (t.error != ErrorKind::Cancelled) {
        finish(pending, CommandResult::failure(t.error));
        done();
        return;
    }

    handleTransition(id, t);
    finish(pending, CommandResult::success());

    if (!daemonAvailable_) {
        done();
        return;
    }
    deviceCall(id, daemon::kCancelPairing, {}, [id, done](const BusReply& reply) {
        if (!reply.ok())
            qWarning() << "[Session]" << id << "daemon did not take the cancellation:" << reply.error.message;
        done();
    });
}

ErrorKind SessionManager::fromBusError(const BusError& error, bool pairing)
{
    if (error.isTransient())
        return ErrorKind::BusUnavailable;
    return pairing ? ErrorKind::PairingFailed : ErrorKind::CallFailed;
}

// --- State propagation ---

void SessionManager::handleTransition(const QString& deviceId, const PairingTransition& t)
{
    if (t.error == ErrorKind::StaleToken) {
        qDebug() << "[Session]" << deviceId << "stale reply dropped, token" << t.token;
        return;
    }
    if (!t.changed)
        return;

    dirty_ = true;
    if (t.to != PairState::Unknown) {
        DeviceUpdate update;
        update.pairState = t.to;
        registry_->upsert(deviceId, update);
    }

    const bool wasPaired = t.from == PairState::Paired || t.from == PairState::Unpairing;
    if (t.to == PairState::Paired && !wasPaired) {
        if (arbiter_->suppress(deviceId) != ErrorKind::None)
            publishEvent(QStringLiteral("suppression/unavailable"), deviceId);
        // Capabilities only count once paired
        enqueueRefresh(deviceId);
    } else if (t.to == PairState::Unpaired && wasPaired) {
        if (!arbiter_->revert(deviceId))
            qWarning() << "[Session]" << deviceId << "daemon notifications not restored yet";
        plugins_.markUnavailable(deviceId);
        registry_->setBattery(deviceId, std::nullopt);
        registry_->setConnectivity(deviceId, std::nullopt);
    }

    if (t.tieBreak) {
        const quint64 token = t.token;
        queue_->enqueue(deviceId, QStringLiteral("accept crossed request"),
                        [this, deviceId, token](const Done& done) {
            deviceCall(deviceId, daemon::kAcceptPairing, {}, [this, deviceId, token, done](const BusReply& reply) {
                if (!reply.ok())
                    handleTransition(deviceId, pairing_->resolve(deviceId, token, PairingStateMachine::Reply::Failed));
                done();
            });
        });
    }

    QString topic;
    switch (t.to) {
    case PairState::RequestSent:
        topic = QStringLiteral("pairing/request_sent");
        break;
    case PairState::RequestReceived:
        topic = QStringLiteral("pairing/requested");
        break;
    case PairState::Paired:
        topic = t.error == ErrorKind::PairingFailed ? QStringLiteral("pairing/failed")
                                                    : QStringLiteral("pairing/paired");
        break;
    case PairState::Unpairing:
        topic = QStringLiteral("pairing/unpairing");
        break;
    case PairState::Unpaired:
        switch (t.error) {
        case ErrorKind::PairingRejected: topic = QStringLiteral("pairing/rejected"); break;
        case ErrorKind::PairingTimedOut: topic = QStringLiteral("pairing/timed_out"); break;
        case ErrorKind::PairingFailed:   topic = QStringLiteral("pairing/failed"); break;
        case ErrorKind::Cancelled:       topic = QStringLiteral("pairing/cancelled"); break;
        default:                         topic = QStringLiteral("pairing/unpaired"); break;
        }
        break;
    case PairState::Unknown:
        break;
    }
    if (!topic.isEmpty()) {
        QVariantMap extra;
        extra["token"] = static_cast<qint64>(t.token);
        extra["from"] = pairStateName(t.from);
        extra["to"] = pairStateName(t.to);
        if (t.error != ErrorKind::None)
            extra["error"] = errorKindName(t.error);
        publishEvent(topic, deviceId, extra);
    }

    auto w = pairWaiters_.find(deviceId);
    if (w != pairWaiters_.end() && w->token == t.token && !isPendingPairState(t.to)) {
        const PendingPtr waiting = w->pending;
        pairWaiters_.erase(w);
        if (t.to == PairState::Paired && t.error == ErrorKind::None)
            finish(waiting, CommandResult::success());
        else
            finish(waiting, CommandResult::failure(t.error == ErrorKind::None ? ErrorKind::PairingFailed
                                                                              : t.error));
    }
}

void SessionManager::applyDaemonPairState(const QString& deviceId, DaemonPairState reported)
{
    const PairingTransition t = pairing_->daemonReported(deviceId, reported);
    if (t.error == ErrorKind::StaleToken && reported == DaemonPairState::Paired) {
        // The peer accepted a request we had already cancelled; take it back
        qInfo() << "[Session]" << deviceId << "withdrawing pairing accepted after cancel";
        queue_->enqueue(deviceId, QStringLiteral("withdraw"), [this, deviceId](const Done& done) {
            deviceCall(deviceId, daemon::kUnpair, {}, [deviceId, done](const BusReply& reply) {
                if (!reply.ok())
                    qWarning() << "[Session]" << deviceId << "cannot withdraw pairing:" << reply.error.message;
                done();
            });
        });
    }
    handleTransition(deviceId, t);
}

void SessionManager::onAvailabilityChanged(bool available)
{
    if (available == daemonAvailable_)
        return;
    daemonAvailable_ = available;
    dirty_ = true;

    if (!available) {
        qWarning() << "[Session] Daemon went away, devices marked unreachable";
        const QStringList ids = registry_->deviceIds();
        for (const auto& id : ids)
            registry_->markUnreachable(id);
        publishEvent(QStringLiteral("daemon/unavailable"), QString());
        publishIfDirty();
        return;
    }

    qInfo() << "[Session] Daemon available, resyncing";
    publishEvent(QStringLiteral("daemon/available"), QString());
    resync();

    const auto waiters = availabilityWaiters_;
    availabilityWaiters_.clear();
    for (const auto& task : waiters)
        task();
    publishIfDirty();
}

// --- Daemon signals ---

void SessionManager::onSignal(const BusSignal& signal)
{
    if (signal.name == daemon::kDeviceListChanged) {
        resync();
        return;
    }

    const QString id = signal.deviceId;
    if (id.isEmpty())
        return;

    const bool known = registry_->contains(id);
    if (signal.name == daemon::kDeviceRemoved && !known)
        return;
    if (signal.name == daemon::kDeviceAdded || signal.name == daemon::kPluginsChanged || !known) {
        enqueueRefresh(id);
        return;
    }

    queue_->enqueue(id, signal.name, [this, signal](const Done& done) {
        applySignal(signal);
        done();
    });
}

void SessionManager::applySignal(const BusSignal& signal)
{
    const QString& id = signal.deviceId;
    if (!registry_->contains(id))
        return;  // swept while queued

    DeviceUpdate update;
    if (signal.name == daemon::kDeviceRemoved) {
        // Kept until the sweep; the daemon forgets devices it cannot see
        registry_->markUnreachable(id);
        return;
    }
    if (signal.name == daemon::kDeviceVisibilityChanged) {
        update.reachability = signal.args.value(1).toBool() ? Reachability::Reachable
                                                            : Reachability::Unreachable;
    } else if (signal.name == daemon::kReachableChanged) {
        update.reachability = signal.args.value(0).toBool() ? Reachability::Reachable
                                                            : Reachability::Unreachable;
    } else if (signal.name == daemon::kNameChanged) {
        update.name = signal.args.value(0).toString();
    } else if (signal.name == daemon::kTypeChanged) {
        update.type = deviceTypeFromName(signal.args.value(0).toString());
    } else if (signal.name == daemon::kBatteryRefreshed) {
        if (pairing_->state(id) != PairState::Paired)
            return;
        BatteryStatus battery;
        battery.charging = signal.args.value(0).toBool();
        battery.charge = signal.args.value(1, -1).toInt();
        registry_->setBattery(id, battery);
        return;
    } else if (signal.name == daemon::kConnectivityRefreshed) {
        if (pairing_->state(id) != PairState::Paired)
            return;
        ConnectivityStatus connectivity;
        connectivity.networkType = signal.args.value(0).toString();
        connectivity.strength = signal.args.value(1, -1).toInt();
        registry_->setConnectivity(id, connectivity);
        return;
    } else if (signal.name == daemon::kPairStateChanged) {
        const auto reported = daemonPairStateFromInt(signal.args.value(0).toInt());
        if (!reported) {
            qWarning() << "[Session]" << id << "unknown pair state" << signal.args.value(0);
            return;
        }
        applyDaemonPairState(id, *reported);
        return;
    } else {
        return;
    }
    registry_->upsert(id, update);
}

void SessionManager::enqueueRefresh(const QString& deviceId, const std::function<void()>& after)
{
    queue_->enqueue(deviceId, QStringLiteral("refresh"), [this, deviceId, after](const Done& done) {
        refreshDevice(deviceId, [after, done]() {
            if (after)
                after();
            done();
        });
    });
}

void SessionManager::refreshDevice(const QString& deviceId, const Done& done)
{
    const BusCall call{deviceId, daemon::kPropertiesInterface, daemon::kGetAll, {daemon::kDeviceInterface}};
    bus_->call(call, [this, deviceId, done](const BusReply& reply) {
        if (!reply.ok()) {
            qWarning() << "[Session]" << deviceId << "properties unavailable:" << reply.error.message;
            done();
            return;
        }

        const QVariantMap props = reply.first().toMap();
        const bool isNew = !registry_->contains(deviceId);

        DeviceUpdate update;
        if (props.contains(daemon::kPropName))
            update.name = props.value(daemon::kPropName).toString();
        if (props.contains(daemon::kPropType))
            update.type = deviceTypeFromName(props.value(daemon::kPropType).toString());
        update.reachability = props.value(daemon::kPropReachable).toBool() ? Reachability::Reachable
                                                                          : Reachability::Unreachable;
        registry_->upsert(deviceId, update);
        if (isNew)
            publishEvent(QStringLiteral("device/added"), deviceId);

        std::optional<DaemonPairState> reported =
            daemonPairStateFromInt(props.value(daemon::kPropPairState, -1).toInt());
        if (!reported && props.contains(QStringLiteral("isPaired"))) {
            // Daemons before pairState only export a boolean
            reported = props.value(QStringLiteral("isPaired")).toBool() ? DaemonPairState::Paired
                                                                         : DaemonPairState::NotPaired;
        }
        if (reported)
            applyDaemonPairState(deviceId, *reported);
        else
            handleTransition(deviceId, pairing_->discover(deviceId, false));

        fetchCapabilities(deviceId, props.value(daemon::kPropSupportedPlugins).toStringList(), done);
    });
}

void SessionManager::fetchCapabilities(const QString& deviceId, const QStringList& supported,
                                       const Done& done)
{
    if (pairing_->state(deviceId) != PairState::Paired) {
        done();
        return;
    }

    deviceCall(deviceId, daemon::kLoadedPlugins, {}, [this, deviceId, supported, done](const BusReply& reply) {
        if (!reply.ok()) {
            qWarning() << "[Session]" << deviceId << "loaded plugins unavailable:" << reply.error.message;
            done();
            return;
        }

        QStringList unknown;
        const CapabilityReport report =
            CapabilityReport::fromDaemon(supported, reply.first().toStringList(), &unknown);
        if (!unknown.isEmpty())
            qDebug() << "[Session]" << deviceId << "not tracking plugins" << unknown;
        if (plugins_.reconcile(deviceId, report, pairing_->state(deviceId) == PairState::Paired))
            dirty_ = true;

        fetchPluginStatus(deviceId, PluginKind::Battery, [this, deviceId, done]() {
            fetchPluginStatus(deviceId, PluginKind::SignalStrength, done);
        });
    });
}

void SessionManager::fetchPluginStatus(const QString& deviceId, PluginKind kind, const Done& done)
{
    // The plugin object only exists on the bus while the plugin is loaded
    const auto record = plugins_.record(deviceId, kind);
    if (!record || !record->available || !record->enabled) {
        applyPluginStatus(deviceId, kind, std::nullopt);
        done();
        return;
    }

    const bool battery = kind == PluginKind::Battery;
    BusCall call;
    call.deviceId = deviceId;
    call.object = battery ? daemon::kBatteryObject : daemon::kConnectivityObject;
    call.interface = daemon::kPropertiesInterface;
    call.method = daemon::kGetAll;
    call.args = {battery ? daemon::kBatteryInterface : daemon::kConnectivityInterface};

    bus_->call(call, [this, deviceId, kind, done](const BusReply& reply) {
        if (reply.ok())
            applyPluginStatus(deviceId, kind, reply.first().toMap());
        else
            qDebug() << "[Session]" << deviceId << pluginKindName(kind) << "status unavailable:"
                     << reply.error.message;
        done();
    });
}

void SessionManager::applyPluginStatus(const QString& deviceId, PluginKind kind,
                                       const std::optional<QVariantMap>& properties)
{
    if (kind == PluginKind::Battery) {
        std::optional<BatteryStatus> battery;
        if (properties) {
            battery = BatteryStatus();
            battery->charge = properties->value(daemon::kPropCharge, -1).toInt();
            battery->charging = properties->value(daemon::kPropIsCharging).toBool();
        }
        registry_->setBattery(deviceId, battery);
    } else if (kind == PluginKind::SignalStrength) {
        std::optional<ConnectivityStatus> connectivity;
        if (properties) {
            connectivity = ConnectivityStatus();
            connectivity->strength = properties->value(daemon::kPropNetworkStrength, -1).toInt();
            connectivity->networkType = properties->value(daemon::kPropNetworkType).toString();
        }
        registry_->setConnectivity(deviceId, connectivity);
    }
}

void SessionManager::resync()
{
    queue_->enqueue(QString(), QStringLiteral("resync"), [this](const Done& done) {
        const BusCall call{QString(), daemon::kDaemonInterface, daemon::kDevices, {false, false}};
        bus_->call(call, [this, done](const BusReply& reply) {
            if (!reply.ok()) {
                qWarning() << "[Session] Cannot list devices:" << reply.error.message;
                done();
                return;
            }

            const QStringList ids = reply.first().toStringList();
            qInfo() << "[Session] Daemon lists" << ids.size() << "devices";
            const QStringList known = registry_->deviceIds();
            for (const auto& id : known) {
                if (!ids.contains(id))
                    registry_->markUnreachable(id);
            }

            // Suppression recovered from a previous run is kept only for
            // devices that turn out to be paired still
            auto release = [this]() {
                QStringList paired;
                for (const auto& s : pairing_->sessions()) {
                    if (s.state == PairState::Paired || s.state == PairState::Unpairing)
                        paired.append(s.deviceId);
                }
                arbiter_->releaseUnlisted(paired);
                dirty_ = true;
            };
            if (ids.isEmpty())
                release();

            auto remaining = std::make_shared<int>(ids.size());
            for (const auto& id : ids) {
                enqueueRefresh(id, [remaining, release]() {
                    if (--*remaining == 0)
                        release();
                });
            }
            done();
        });
    });
}

void SessionManager::sweep()
{
    if (arbiter_->hasPendingRestore() && arbiter_->retryRestore())
        dirty_ = true;

    const QStringList stale = registry_->staleDevices(registry_->now(), unreachableTimeoutS_);
    for (const auto& id : stale) {
        const PairState state = pairing_->state(id);
        if (state == PairState::Paired || state == PairState::Unpairing)
            continue;
        if (queue_->isBusy(id))
            continue;
        qInfo() << "[Session]" << id << "unreachable for over" << unreachableTimeoutS_ << "s, removing";
        removeDevice(id);
    }
    publishIfDirty();
}

void SessionManager::removeDevice(const QString& deviceId)
{
    pairing_->forget(deviceId);

    auto w = pairWaiters_.find(deviceId);
    if (w != pairWaiters_.end()) {
        const PendingPtr waiting = w->pending;
        pairWaiters_.erase(w);
        finish(waiting, CommandResult::failure(ErrorKind::UnknownDevice));
    }

    if (arbiter_->rule(deviceId) && !arbiter_->revert(deviceId))
        qWarning() << "[Session]" << deviceId << "daemon notifications not restored yet";
    plugins_.removeDevice(deviceId);
    registry_->remove(deviceId);
    dirty_ = true;
    publishEvent(QStringLiteral("device/removed"), deviceId);
}

// --- Helpers ---

void SessionManager::deviceCall(const QString& deviceId, const QString& method,
                                const QVariantList& args, IBusGateway::ReplyCallback callback)
{
    bus_->call(BusCall{deviceId, daemon::kDeviceInterface, method, args}, std::move(callback));
}

void SessionManager::publishEvent(const QString& topic, const QString& deviceId,
                                  const QVariantMap& extra)
{
    if (!eventBus_)
        return;

    QVariantMap payload = extra;
    if (!deviceId.isEmpty()) {
        payload["device"] = deviceId;
        if (auto dev = registry_->device(deviceId))
            payload["name"] = dev->name;
        payload["path"] = deliveryPathName(arbiter_->route(deviceId, EventClass::PairingRequest));
    }
    eventBus_->publish(topic, payload);
}

void SessionManager::publishIfDirty()
{
    if (!dirty_)
        return;
    dirty_ = false;

    SessionSnapshot snap;
    snap.sequence = ++sequence_;
    snap.daemonAvailable = daemonAvailable_;
    snap.devices = registry_->snapshot();
    snap.pairingSessions = pairing_->sessions();
    snap.plugins = plugins_.records();
    snap.suppressionRules = arbiter_->rules();
    latest_ = snap;

    qDebug() << "[Session] Snapshot" << snap.sequence << "with" << snap.devices.size() << "devices";
    emit snapshotPublished(latest_);
}

} // namespace kcb
