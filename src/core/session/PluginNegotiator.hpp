#pragma once

#include "core/session/PluginKind.hpp"
#include <QDateTime>
#include <QMap>
#include <QStringList>
#include <functional>
#include <optional>

namespace kcb {

struct PluginRecord {
    QString deviceId;
    PluginKind kind = PluginKind::Unknown;
    bool available = false;  // reported by the daemon
    bool enabled = false;    // locally requested / loaded
    QDateTime lastSync;
};

/// One capability report from the daemon. A kind present in the map is
/// available; its value says whether the daemon has it loaded.
struct CapabilityReport {
    QMap<PluginKind, bool> plugins;

    /// Builds a report from the daemon's supportedPlugins / loadedPlugins
    /// lists. Plugin ids outside the known set go to unknownIds.
    static CapabilityReport fromDaemon(const QStringList& supported,
                                       const QStringList& loaded,
                                       QStringList* unknownIds = nullptr);
};

/// Per (device, kind) plugin records, reconciled against daemon reports.
class PluginNegotiator {
public:
    using Clock = std::function<QDateTime()>;

    enum class EnableDecision {
        Proceed,      // optimistic value applied, daemon call needed
        AlreadySet,   // target value already current or in flight
        NotPaired,
        Unavailable   // kind unknown or not offered by the device
    };

    PluginNegotiator();

    /// Merges a report. Records are created for new kinds, unreported kinds
    /// become unavailable but are kept. The report overwrites optimistic
    /// state; enabled stays false unless the device is paired.
    /// Returns true if any record changed.
    bool reconcile(const QString& deviceId, const CapabilityReport& report, bool paired);

    EnableDecision beginSetEnabled(const QString& deviceId, PluginKind kind,
                                   bool enabled, bool paired);
    /// Settles an in-flight setEnabled; a failure restores the prior value.
    /// Returns true if the record changed.
    bool completeSetEnabled(const QString& deviceId, PluginKind kind, bool succeeded);

    /// Device unpaired: everything unavailable and disabled, records kept.
    bool markUnavailable(const QString& deviceId);
    bool removeDevice(const QString& deviceId);

    std::optional<PluginRecord> record(const QString& deviceId, PluginKind kind) const;
    QList<PluginRecord> records(const QString& deviceId) const;
    QList<PluginRecord> records() const;

    void setClock(Clock clock);

private:
    struct Entry {
        PluginRecord record;
        std::optional<bool> inFlight;
        bool previous = false;
    };

    QMap<QString, QMap<PluginKind, Entry>> devices_;
    Clock clock_;
};

} // namespace kcb
