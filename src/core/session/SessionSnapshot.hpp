#pragma once

#include "core/notify/NotificationArbiter.hpp"
#include "core/session/PairingStateMachine.hpp"
#include "core/session/PluginNegotiator.hpp"
#include "core/session/SessionTypes.hpp"
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <optional>

namespace kcb {

/// Immutable copy of the whole session state, as handed to consumers.
/// Lists are sorted by device id (then plugin kind) so equal states
/// serialize identically.
struct SessionSnapshot {
    quint64 sequence = 0;
    bool daemonAvailable = false;
    QList<Device> devices;
    QList<PairingSession> pairingSessions;
    QList<PluginRecord> plugins;
    QList<SuppressionRule> suppressionRules;

    std::optional<Device> device(const QString& deviceId) const;
    std::optional<PluginRecord> plugin(const QString& deviceId, PluginKind kind) const;

    QJsonObject toJson() const;
    static std::optional<SessionSnapshot> fromJson(const QJsonObject& obj);
};

/// Drops snapshots that arrive out of order: only a sequence strictly
/// greater than the last accepted one is taken.
class SnapshotTracker {
public:
    bool accept(quint64 sequence);
    quint64 latest() const { return latest_; }
    void reset() { latest_ = 0; }

private:
    quint64 latest_ = 0;
};

} // namespace kcb

Q_DECLARE_METATYPE(kcb::SessionSnapshot)
