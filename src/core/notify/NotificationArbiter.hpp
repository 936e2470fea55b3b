#pragma once

#include "core/notify/IDaemonConfigStore.hpp"
#include "core/notify/SuppressionBackup.hpp"
#include "core/session/SessionTypes.hpp"
#include <QObject>
#include <QMap>
#include <QStringList>
#include <memory>
#include <optional>

namespace kcb {

enum class EventClass {
    PairingRequest,
    TransferComplete,
    AndroidNotification
};

enum class DeliveryPath {
    Daemon,
    Native
};

QString eventClassName(EventClass c);
std::optional<EventClass> eventClassFromName(const QString& name);
QString deliveryPathName(DeliveryPath p);

struct SuppressionRule {
    QString deviceId;
    bool daemonSuppressed = false;
    QList<EventClass> redirected;
};

/// Decides which producer (the daemon's notifier or ours) surfaces each
/// notification class, and edits the daemon's notifyrc accordingly.
///
/// The notifyrc is shared by every device: the backup is taken when the
/// first device is suppressed and restored when the last one leaves.
class NotificationArbiter : public QObject {
    Q_OBJECT

public:
    NotificationArbiter(std::unique_ptr<IDaemonConfigStore> store, const QString& backupPath,
                        QObject* parent = nullptr);

    /// When disabled the daemon path always delivers and nothing is mutated.
    void setEnabled(bool enabled) { enabled_ = enabled; }
    bool isEnabled() const { return enabled_; }

    /// Device reached Paired. Returns SuppressionUnavailable if the daemon
    /// config could not be mutated; the daemon path then stays active.
    ErrorKind suppress(const QString& deviceId);

    /// Device unpaired or removed. Returns false if the daemon config could
    /// not be restored; the backup and the last device's rule are then kept
    /// until retryRestore() or another revert() gets the file back.
    bool revert(const QString& deviceId);

    bool hasPendingRestore() const { return backup_ && backup_->devices.isEmpty(); }
    bool retryRestore();

    DeliveryPath route(const QString& deviceId, EventClass eventClass) const;

    std::optional<SuppressionRule> rule(const QString& deviceId) const;
    QList<SuppressionRule> rules() const;

    /// Loads a backup left by a previous run and re-adopts its devices.
    void recover();

    /// Reverts recovered devices that are no longer paired.
    void releaseUnlisted(const QStringList& pairedDevices);

    IDaemonConfigStore* store() const { return store_.get(); }

signals:
    void suppressionUnavailable(const QString& deviceId);

private:
    struct Edit {
        QString group;
        QString key;
        QString value;
    };
    static const QList<Edit>& suppressionEdits();
    static QList<EventClass> redirectedClasses();

    bool applySuppression(const QString& deviceId);
    bool restore();
    void dropReleased();

    std::unique_ptr<IDaemonConfigStore> store_;
    QString backupPath_;
    bool enabled_ = true;
    QMap<QString, SuppressionRule> rules_;
    QStringList releasing_;  // released, rule kept until the restore lands
    std::optional<SuppressionBackup> backup_;
};

} // namespace kcb
