#pragma once

#include "core/session/SessionTypes.hpp"
#include <QObject>
#include <QHash>
#include <QList>
#include <QStringList>
#include <functional>
#include <optional>

namespace kcb {

/// Partial device report; only the fields that are set get merged.
struct DeviceUpdate {
    std::optional<QString> name;
    std::optional<DeviceType> type;
    std::optional<Reachability> reachability;
    std::optional<PairState> pairState;
};

/// In-memory table of every device the daemon has reported since start.
///
/// Reports are merged last-writer-wins in arrival order: each applied
/// report is stamped with a registry-wide arrival counter, the wall clock
/// only feeds lastSeen.
class DeviceRegistry : public QObject {
    Q_OBJECT

public:
    using Clock = std::function<QDateTime()>;

    explicit DeviceRegistry(QObject* parent = nullptr);

    /// Returns true if observable state changed (lastSeen alone does not count).
    bool upsert(const QString& deviceId, const DeviceUpdate& update);
    bool markUnreachable(const QString& deviceId);

    /// Plugin status; nullopt clears it. Unknown devices are ignored.
    bool setBattery(const QString& deviceId, const std::optional<BatteryStatus>& battery);
    bool setConnectivity(const QString& deviceId, const std::optional<ConnectivityStatus>& connectivity);
    bool remove(const QString& deviceId);

    bool contains(const QString& deviceId) const;
    std::optional<Device> device(const QString& deviceId) const;

    /// Copies, sorted by device id.
    QList<Device> snapshot() const;
    QStringList deviceIds() const;

    /// Unreachable devices whose last report is older than timeoutSecs.
    QStringList staleDevices(const QDateTime& now, int timeoutSecs) const;

    void setClock(Clock clock);
    QDateTime now() const { return clock_(); }

signals:
    void deviceChanged(const QString& deviceId);
    void deviceRemoved(const QString& deviceId);

private:
    QHash<QString, Device> devices_;
    quint64 arrivalCounter_ = 0;
    Clock clock_;
};

} // namespace kcb
