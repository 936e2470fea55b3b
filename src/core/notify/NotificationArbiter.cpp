#include "core/notify/NotificationArbiter.hpp"
#include "core/notify/KConfigDocument.hpp"
#include <QDebug>

namespace kcb {

QString eventClassName(EventClass c)
{
    switch (c) {
    case EventClass::PairingRequest:      return QStringLiteral("pairing_request");
    case EventClass::TransferComplete:    return QStringLiteral("transfer_complete");
    case EventClass::AndroidNotification: return QStringLiteral("android_notification");
    }
    return QString();
}

std::optional<EventClass> eventClassFromName(const QString& name)
{
    for (EventClass c : {EventClass::PairingRequest, EventClass::TransferComplete,
                         EventClass::AndroidNotification}) {
        if (eventClassName(c) == name)
            return c;
    }
    return std::nullopt;
}

QString deliveryPathName(DeliveryPath p)
{
    return p == DeliveryPath::Native ? QStringLiteral("native") : QStringLiteral("daemon");
}

NotificationArbiter::NotificationArbiter(std::unique_ptr<IDaemonConfigStore> store,
                                         const QString& backupPath, QObject* parent)
    : QObject(parent)
    , store_(std::move(store))
    , backupPath_(backupPath)
{
}

const QList<NotificationArbiter::Edit>& NotificationArbiter::suppressionEdits()
{
    static const QList<Edit> edits = [] {
        QList<Edit> list;
        // pairRequest is the event kdeconnectd actually raises for inbound requests
        for (const char* key : {"Action", "Execute", "Sound"})
            list.append(Edit{QStringLiteral("Event/pairRequest"), QString::fromLatin1(key), QString()});
        list.append(Edit{QStringLiteral("Event/pairRequest"), QStringLiteral("Popup"), QStringLiteral("false")});

        const char* events[] = {"pairingRequest", "pairingRequestReceived", "notification",
                                "transferReceived", "transferComplete"};
        for (const char* event : events) {
            const QString group = QStringLiteral("Event/") + QString::fromLatin1(event);
            list.append(Edit{group, QStringLiteral("Action"), QString()});
            list.append(Edit{group, QStringLiteral("Popup"), QStringLiteral("false")});
        }
        return list;
    }();
    return edits;
}

QList<EventClass> NotificationArbiter::redirectedClasses()
{
    return {EventClass::PairingRequest, EventClass::TransferComplete,
            EventClass::AndroidNotification};
}

ErrorKind NotificationArbiter::suppress(const QString& deviceId)
{
    if (releasing_.contains(deviceId)) {
        // Paired again before the file could be restored; it is still suppressed
        releasing_.removeAll(deviceId);
        backup_->devices.append(deviceId);
        dropReleased();
        if (!backup_->save(backupPath_))
            qWarning() << "[Arbiter] Suppression backup" << backupPath_ << "may be out of date";
        qInfo() << "[Arbiter]" << deviceId << "daemon notifications still suppressed";
        return ErrorKind::None;
    }

    auto it = rules_.constFind(deviceId);
    if (it != rules_.constEnd() && it->daemonSuppressed)
        return ErrorKind::None;

    SuppressionRule rule;
    rule.deviceId = deviceId;

    if (!enabled_) {
        rules_.insert(deviceId, rule);
        return ErrorKind::None;
    }

    if (applySuppression(deviceId)) {
        dropReleased();
        rule.daemonSuppressed = true;
        rule.redirected = redirectedClasses();
        rules_.insert(deviceId, rule);
        qInfo() << "[Arbiter]" << deviceId << "daemon notifications suppressed";
        return ErrorKind::None;
    }

    rules_.insert(deviceId, rule);
    qWarning() << "[Arbiter]" << deviceId << "cannot suppress daemon notifications in"
               << store_->location() << ", duplicates possible";
    emit suppressionUnavailable(deviceId);
    return ErrorKind::SuppressionUnavailable;
}

bool NotificationArbiter::applySuppression(const QString& deviceId)
{
    const std::optional<SuppressionBackup> previous = backup_;
    SuppressionBackup next = previous ? *previous : SuppressionBackup();

    const bool ok = store_->transact([&](IDaemonConfigStore::Content& content) {
        if (!previous) {
            next.fileExisted = content.has_value();
            next.original = content.value_or(QByteArray());
        }

        KConfigDocument doc = KConfigDocument::parse(content.value_or(QByteArray()));
        for (const Edit& e : suppressionEdits()) {
            if (!next.hasKey(e.group, e.key))
                next.keys.append(SuppressionBackup::KeyPrior{e.group, e.key, doc.value(e.group, e.key)});
            doc.setValue(e.group, e.key, e.value);
        }
        content = doc.toBytes();
        next.applied = *content;
        if (!next.devices.contains(deviceId))
            next.devices.append(deviceId);

        // The backup must be durable before the daemon config is touched
        return next.save(backupPath_);
    });

    if (ok) {
        backup_ = next;
        return true;
    }

    const bool rolledBack = previous ? previous->save(backupPath_)
                                     : SuppressionBackup::discard(backupPath_);
    if (!rolledBack)
        qWarning() << "[Arbiter] Suppression backup" << backupPath_ << "may be out of date";
    return false;
}

bool NotificationArbiter::revert(const QString& deviceId)
{
    auto it = rules_.find(deviceId);
    if (it == rules_.end())
        return true;

    if (!it->daemonSuppressed || !backup_) {
        rules_.erase(it);
        return true;
    }

    backup_->devices.removeAll(deviceId);
    if (!backup_->devices.isEmpty()) {
        rules_.erase(it);
        qInfo() << "[Arbiter]" << deviceId << "released," << backup_->devices.size()
                << "devices still suppressed";
        return backup_->save(backupPath_);
    }

    // Last one out. The rule stays until the file is back, the daemon is
    // silent until then and the native path has to keep delivering.
    if (!releasing_.contains(deviceId))
        releasing_.append(deviceId);
    return restore();
}

bool NotificationArbiter::retryRestore()
{
    if (!hasPendingRestore())
        return true;
    qInfo() << "[Arbiter] Retrying restore of" << store_->location();
    return restore();
}

void NotificationArbiter::dropReleased()
{
    for (const auto& id : std::as_const(releasing_))
        rules_.remove(id);
    releasing_.clear();
}

bool NotificationArbiter::restore()
{
    const SuppressionBackup backup = *backup_;

    bool verbatim = false;
    const bool ok = store_->transact([&](IDaemonConfigStore::Content& content) {
        if (content && *content == backup.applied) {
            verbatim = true;
            if (backup.fileExisted)
                content = backup.original;
            else
                content.reset();
            return true;
        }
        if (!content)
            return true;  // removed by someone else, nothing to restore onto

        // Edited since we wrote it: put back only the keys we changed
        KConfigDocument doc = KConfigDocument::parse(*content);
        for (const auto& k : backup.keys) {
            if (k.prior) {
                doc.setValue(k.group, k.key, *k.prior);
            } else {
                doc.removeKey(k.group, k.key);
                doc.removeGroupIfEmpty(k.group);
            }
        }
        content = doc.toBytes();
        return true;
    });

    if (!ok) {
        qWarning() << "[Arbiter] Cannot restore" << store_->location() << ", keeping backup";
        if (!backup_->save(backupPath_))
            qWarning() << "[Arbiter] Suppression backup" << backupPath_ << "may be out of date";
        return false;
    }

    qInfo() << "[Arbiter] Restored" << store_->location() << (verbatim ? "verbatim" : "per key");
    backup_.reset();
    dropReleased();
    return SuppressionBackup::discard(backupPath_);
}

DeliveryPath NotificationArbiter::route(const QString& deviceId, EventClass eventClass) const
{
    auto it = rules_.constFind(deviceId);
    if (it != rules_.constEnd() && it->daemonSuppressed && it->redirected.contains(eventClass))
        return DeliveryPath::Native;

    // The notifyrc is not per device: while any device holds suppression the
    // daemon stays silent for every device, so the native path must deliver
    for (const auto& rule : rules_) {
        if (rule.daemonSuppressed && rule.redirected.contains(eventClass))
            return DeliveryPath::Native;
    }
    // A leftover from a previous run that could not be restored yet
    if (backup_ && redirectedClasses().contains(eventClass))
        return DeliveryPath::Native;
    return DeliveryPath::Daemon;
}

std::optional<SuppressionRule> NotificationArbiter::rule(const QString& deviceId) const
{
    auto it = rules_.constFind(deviceId);
    if (it == rules_.constEnd())
        return std::nullopt;
    return it.value();
}

QList<SuppressionRule> NotificationArbiter::rules() const
{
    return rules_.values();
}

void NotificationArbiter::recover()
{
    std::optional<SuppressionBackup> loaded = SuppressionBackup::load(backupPath_);
    if (!loaded)
        return;

    backup_ = std::move(loaded);
    for (const auto& id : backup_->devices) {
        SuppressionRule rule;
        rule.deviceId = id;
        rule.daemonSuppressed = true;
        rule.redirected = redirectedClasses();
        rules_.insert(id, rule);
    }
    qInfo() << "[Arbiter] Recovered suppression for" << backup_->devices;

    if (backup_->devices.isEmpty() && !restore())
        qWarning() << "[Arbiter] Leftover suppression not reverted, retrying on next start";
}

void NotificationArbiter::releaseUnlisted(const QStringList& pairedDevices)
{
    const QStringList ids = rules_.keys();
    for (const auto& id : ids) {
        if (!pairedDevices.contains(id) && !revert(id))
            qWarning() << "[Arbiter]" << id << "suppression not reverted";
    }
}

} // namespace kcb
