#pragma once

#include "core/notify/IDaemonConfigStore.hpp"

namespace kcb {

/// IDaemonConfigStore over a KConfig file on disk. Uses the same
/// "<file>.lock" QLockFile convention as KConfig, so the daemon and
/// kwriteconfig observe our writes as atomic.
class KConfigFileStore : public IDaemonConfigStore {
public:
    KConfigFileStore(const QString& path, int lockTimeoutMs);

    QString location() const override { return path_; }
    bool read(Content& content) const override;
    bool transact(const Mutation& mutation) override;

private:
    bool write(const Content& content);

    QString path_;
    int lockTimeoutMs_;
};

} // namespace kcb
