#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

namespace kcb {

/// Pre-mutation state of the daemon's notification config, persisted so
/// suppression can be reverted after a restart or crash.
struct SuppressionBackup {
    struct KeyPrior {
        QString group;
        QString key;
        std::optional<QString> prior;  // nullopt: key did not exist
    };

    bool fileExisted = false;
    QByteArray original;   // file bytes before the first mutation
    QByteArray applied;    // file bytes as we last wrote them
    QList<KeyPrior> keys;
    QStringList devices;   // devices currently holding suppression

    bool hasKey(const QString& group, const QString& key) const;

    bool save(const QString& path) const;
    static std::optional<SuppressionBackup> load(const QString& path);
    static bool discard(const QString& path);
};

} // namespace kcb
