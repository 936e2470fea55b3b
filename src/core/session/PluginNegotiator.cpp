#include "core/session/PluginNegotiator.hpp"
#include <QDebug>

namespace kcb {

CapabilityReport CapabilityReport::fromDaemon(const QStringList& supported,
                                              const QStringList& loaded,
                                              QStringList* unknownIds)
{
    CapabilityReport report;
    for (const auto& id : supported) {
        const PluginKind kind = pluginKindFromDaemonId(id);
        if (kind == PluginKind::Unknown) {
            if (unknownIds)
                unknownIds->append(id);
            continue;
        }
        report.plugins.insert(kind, loaded.contains(id));
    }
    return report;
}

PluginNegotiator::PluginNegotiator()
    : clock_([] { return QDateTime::currentDateTimeUtc(); })
{
}

void PluginNegotiator::setClock(Clock clock)
{
    clock_ = std::move(clock);
}

bool PluginNegotiator::reconcile(const QString& deviceId, const CapabilityReport& report,
                                 bool paired)
{
    auto& entries = devices_[deviceId];
    const QDateTime now = clock_();
    bool changed = false;

    for (auto it = report.plugins.constBegin(); it != report.plugins.constEnd(); ++it) {
        const bool enabled = paired && it.value();
        auto existing = entries.find(it.key());
        if (existing == entries.end()) {
            Entry e;
            e.record.deviceId = deviceId;
            e.record.kind = it.key();
            e.record.available = true;
            e.record.enabled = enabled;
            e.record.lastSync = now;
            entries.insert(it.key(), e);
            changed = true;
            continue;
        }

        PluginRecord& rec = existing->record;
        if (!rec.available || rec.enabled != enabled) {
            rec.available = true;
            rec.enabled = enabled;
            rec.lastSync = now;
            changed = true;
        }
    }

    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (report.plugins.contains(it.key()))
            continue;
        PluginRecord& rec = it->record;
        if (rec.available || rec.enabled) {
            rec.available = false;
            rec.enabled = false;
            rec.lastSync = now;
            changed = true;
        }
    }

    if (changed)
        qDebug() << "[Plugins]" << deviceId << "reconciled" << report.plugins.size() << "plugins";
    return changed;
}

PluginNegotiator::EnableDecision PluginNegotiator::beginSetEnabled(const QString& deviceId,
                                                                   PluginKind kind,
                                                                   bool enabled, bool paired)
{
    if (!paired)
        return EnableDecision::NotPaired;

    auto dev = devices_.find(deviceId);
    if (dev == devices_.end())
        return EnableDecision::Unavailable;
    auto it = dev->find(kind);
    if (it == dev->end() || !it->record.available)
        return EnableDecision::Unavailable;

    Entry& e = it.value();
    if (e.inFlight) {
        if (*e.inFlight == enabled)
            return EnableDecision::AlreadySet;
    } else if (e.record.enabled == enabled) {
        return EnableDecision::AlreadySet;
    }

    if (!e.inFlight)
        e.previous = e.record.enabled;
    e.inFlight = enabled;
    e.record.enabled = enabled;
    return EnableDecision::Proceed;
}

bool PluginNegotiator::completeSetEnabled(const QString& deviceId, PluginKind kind, bool succeeded)
{
    auto dev = devices_.find(deviceId);
    if (dev == devices_.end())
        return false;
    auto it = dev->find(kind);
    if (it == dev->end() || !it->inFlight)
        return false;

    Entry& e = it.value();
    e.inFlight.reset();
    if (succeeded) {
        e.record.lastSync = clock_();
        return true;
    }

    qWarning() << "[Plugins]" << deviceId << pluginKindName(kind) << "rolled back to" << e.previous;
    e.record.enabled = e.previous;
    return true;
}

bool PluginNegotiator::markUnavailable(const QString& deviceId)
{
    auto dev = devices_.find(deviceId);
    if (dev == devices_.end())
        return false;

    const QDateTime now = clock_();
    bool changed = false;
    for (auto it = dev->begin(); it != dev->end(); ++it) {
        it->inFlight.reset();
        if (it->record.available || it->record.enabled) {
            it->record.available = false;
            it->record.enabled = false;
            it->record.lastSync = now;
            changed = true;
        }
    }
    return changed;
}

bool PluginNegotiator::removeDevice(const QString& deviceId)
{
    return devices_.remove(deviceId) > 0;
}

std::optional<PluginRecord> PluginNegotiator::record(const QString& deviceId, PluginKind kind) const
{
    auto dev = devices_.constFind(deviceId);
    if (dev == devices_.constEnd())
        return std::nullopt;
    auto it = dev->constFind(kind);
    if (it == dev->constEnd())
        return std::nullopt;
    return it->record;
}

QList<PluginRecord> PluginNegotiator::records(const QString& deviceId) const
{
    QList<PluginRecord> result;
    auto dev = devices_.constFind(deviceId);
    if (dev == devices_.constEnd())
        return result;
    for (const auto& e : *dev)
        result.append(e.record);
    return result;
}

QList<PluginRecord> PluginNegotiator::records() const
{
    QList<PluginRecord> result;
    for (auto dev = devices_.constBegin(); dev != devices_.constEnd(); ++dev) {
        for (const auto& e : dev.value())
            result.append(e.record);
    }
    return result;
}

} // namespace kcb
