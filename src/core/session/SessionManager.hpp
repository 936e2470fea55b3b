#pragma once

#include "core/bus/IBusGateway.hpp"
#include "core/session/DeviceRegistry.hpp"
#include "core/session/DeviceWorkQueue.hpp"
#include "core/session/PairingStateMachine.hpp"
#include "core/session/PluginNegotiator.hpp"
#include "core/session/SessionSnapshot.hpp"
#include <QObject>
#include <QHash>
#include <QList>
#include <functional>
#include <memory>
#include <optional>

class QTimer;

namespace kcb {

class IConfigService;
class IEventBus;
class NotificationArbiter;

enum class CommandKind {
    RequestPair,
    AcceptPair,
    RejectPair,
    Unpair,
    SetPluginEnabled,
    CancelPairing
};

QString commandKindName(CommandKind kind);
std::optional<CommandKind> commandKindFromName(const QString& name);

struct CommandRequest {
    CommandKind kind = CommandKind::RequestPair;
    QString deviceId;
    PluginKind plugin = PluginKind::Unknown;  // SetPluginEnabled only
    bool enabled = false;                     // SetPluginEnabled only
};

/// Root of the session: owns the registry, pairing machine, plugin
/// negotiator and notification arbiter, and is the only writer to them.
///
/// Every mutation for a device (consumer command, daemon signal, expiry)
/// runs on that device's lane of a DeviceWorkQueue. When a lane task
/// settles and something changed, a snapshot with the next sequence number
/// is published.
class SessionManager : public QObject {
    Q_OBJECT

public:
    /// Takes ownership of the arbiter (re-parented).
    SessionManager(IBusGateway* bus, IConfigService* config, NotificationArbiter* arbiter,
                   QObject* parent = nullptr);
    ~SessionManager() override;

    void setEventBus(IEventBus* eventBus) { eventBus_ = eventBus; }

    /// Subscribes to the daemon, recovers a leftover suppression backup and
    /// runs the first resync if the daemon is up.
    void start();

    /// Hands notifications back to the daemon before exit. The pairings
    /// stay; the next start suppresses again.
    void shutdown();

    /// The callback fires exactly once, with success or a typed error,
    /// at the latest after session.command_timeout_ms.
    void submit(const CommandRequest& request, ResultCallback callback);

    /// Latest published snapshot.
    SessionSnapshot snapshot() const { return latest_; }
    bool isDaemonAvailable() const { return daemonAvailable_; }

    /// Lists the daemon's devices and refreshes each of them.
    void resync();

    /// Removes devices that stayed unreachable past devices.unreachable_timeout_s.
    void sweep();

    const DeviceRegistry* registry() const { return registry_; }
    const PairingStateMachine* pairing() const { return pairing_; }
    const PluginNegotiator& plugins() const { return plugins_; }
    NotificationArbiter* arbiter() const { return arbiter_; }
    DeviceRegistry* registry() { return registry_; }

signals:
    void snapshotPublished(const kcb::SessionSnapshot& snapshot);

private:
    struct PendingCommand {
        CommandRequest request;
        ResultCallback callback;
        QTimer* timer = nullptr;
        bool finished = false;
    };
    using PendingPtr = std::shared_ptr<PendingCommand>;
    using Done = DeviceWorkQueue::Done;

    struct PairWaiter {
        quint64 token = 0;
        PendingPtr pending;
    };

    void finish(const PendingPtr& pending, const CommandResult& result);
    void whenAvailable(std::function<void()> task);
    void execute(const PendingPtr& pending, const Done& done);

    void runRequestPair(const PendingPtr& pending, const Done& done);
    void runAcceptPair(const PendingPtr& pending, const Done& done);
    void runRejectPair(const PendingPtr& pending, const Done& done);
    void runUnpair(const PendingPtr& pending, const Done& done);
    void runSetPluginEnabled(const PendingPtr& pending, const Done& done);
    void runCancelPairing(const PendingPtr& pending, const Done& done);

    void handleTransition(const QString& deviceId, const PairingTransition& t);
    void applyDaemonPairState(const QString& deviceId, DaemonPairState reported);

    void onAvailabilityChanged(bool available);
    void onSignal(const BusSignal& signal);
    void applySignal(const BusSignal& signal);

    void refreshDevice(const QString& deviceId, const Done& done);
    void fetchCapabilities(const QString& deviceId, const QStringList& supported, const Done& done);
    void fetchPluginStatus(const QString& deviceId, PluginKind kind, const Done& done);
    void applyPluginStatus(const QString& deviceId, PluginKind kind,
                           const std::optional<QVariantMap>& properties);
    void enqueueRefresh(const QString& deviceId, const std::function<void()>& after = {});
    void removeDevice(const QString& deviceId);

    void deviceCall(const QString& deviceId, const QString& method, const QVariantList& args,
                    IBusGateway::ReplyCallback callback);
    void publishEvent(const QString& topic, const QString& deviceId, const QVariantMap& extra = {});
    void publishIfDirty();

    static ErrorKind fromBusError(const BusError& error, bool pairing);

    IBusGateway* bus_;
    IEventBus* eventBus_ = nullptr;
    NotificationArbiter* arbiter_;
    DeviceRegistry* registry_;
    PairingStateMachine* pairing_;
    PluginNegotiator plugins_;
    DeviceWorkQueue* queue_;
    QTimer* sweepTimer_;

    int commandTimeoutMs_;
    int unreachableTimeoutS_;
    int sweepIntervalS_;
    bool failFast_;

    bool daemonAvailable_ = false;
    bool dirty_ = false;
    quint64 sequence_ = 0;
    SessionSnapshot latest_;

    QHash<QString, PairWaiter> pairWaiters_;
    QList<std::function<void()>> availabilityWaiters_;
    QList<int> subscriptions_;
    int availabilityWatch_ = -1;
};

} // namespace kcb
