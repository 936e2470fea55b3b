#include "core/session/DeviceRegistry.hpp"
#include <QDebug>
#include <algorithm>

namespace kcb {

DeviceRegistry::DeviceRegistry(QObject* parent)
    : QObject(parent)
    , clock_([] { return QDateTime::currentDateTimeUtc(); })
{
}

void DeviceRegistry::setClock(Clock clock)
{
    clock_ = std::move(clock);
}

bool DeviceRegistry::upsert(const QString& deviceId, const DeviceUpdate& update)
{
    if (deviceId.isEmpty())
        return false;

    auto it = devices_.find(deviceId);
    bool changed = false;
    if (it == devices_.end()) {
        Device dev;
        dev.id = deviceId;
        it = devices_.insert(deviceId, dev);
        changed = true;
        qInfo() << "[Registry] New device" << deviceId;
    }

    Device& dev = it.value();
    if (update.name && *update.name != dev.name) {
        dev.name = *update.name;
        changed = true;
    }
    if (update.type && *update.type != dev.type) {
        dev.type = *update.type;
        changed = true;
    }
    if (update.reachability && *update.reachability != dev.reachability) {
        dev.reachability = *update.reachability;
        changed = true;
    }
    if (update.pairState && *update.pairState != dev.pairState) {
        dev.pairState = *update.pairState;
        changed = true;
    }

    dev.arrival = ++arrivalCounter_;
    dev.lastSeen = clock_();

    if (changed)
        emit deviceChanged(deviceId);
    return changed;
}

bool DeviceRegistry::markUnreachable(const QString& deviceId)
{
    auto it = devices_.find(deviceId);
    if (it == devices_.end() || it->reachability == Reachability::Unreachable)
        return false;

    it->reachability = Reachability::Unreachable;
    it->arrival = ++arrivalCounter_;
    it->lastSeen = clock_();
    emit deviceChanged(deviceId);
    return true;
}

bool DeviceRegistry::setBattery(const QString& deviceId, const std::optional<BatteryStatus>& battery)
{
    auto it = devices_.find(deviceId);
    if (it == devices_.end() || it->battery == battery)
        return false;

    it->battery = battery;
    it->arrival = ++arrivalCounter_;
    emit deviceChanged(deviceId);
    return true;
}

bool DeviceRegistry::setConnectivity(const QString& deviceId,
                                     const std::optional<ConnectivityStatus>& connectivity)
{
    auto it = devices_.find(deviceId);
    if (it == devices_.end() || it->connectivity == connectivity)
        return false;

    it->connectivity = connectivity;
    it->arrival = ++arrivalCounter_;
    emit deviceChanged(deviceId);
    return true;
}

bool DeviceRegistry::remove(const QString& deviceId)
{
    if (devices_.remove(deviceId) == 0)
        return false;

    qInfo() << "[Registry] Removed device" << deviceId;
    emit deviceRemoved(deviceId);
    return true;
}

bool DeviceRegistry::contains(const QString& deviceId) const
{
    return devices_.contains(deviceId);
}

std::optional<Device> DeviceRegistry::device(const QString& deviceId) const
{
    auto it = devices_.constFind(deviceId);
    if (it == devices_.constEnd())
        return std::nullopt;
    return it.value();
}

QList<Device> DeviceRegistry::snapshot() const
{
    QList<Device> result = devices_.values();
    std::sort(result.begin(), result.end(), [](const Device& a, const Device& b) {
        return a.id < b.id;
    });
    return result;
}

QStringList DeviceRegistry::deviceIds() const
{
    QStringList ids = devices_.keys();
    ids.sort();
    return ids;
}

QStringList DeviceRegistry::staleDevices(const QDateTime& now, int timeoutSecs) const
{
    QStringList result;
    for (auto it = devices_.constBegin(); it != devices_.constEnd(); ++it) {
        const Device& dev = it.value();
        if (dev.isReachable())
            continue;
        if (dev.lastSeen.isValid() && dev.lastSeen.secsTo(now) > timeoutSecs)
            result.append(dev.id);
    }
    result.sort();
    return result;
}

} // namespace kcb
