#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace kcb {

class YamlConfig {
public:
    YamlConfig();

    /// Load and deep-merge a user file over the built-in defaults.
    /// Returns false (and keeps defaults) if the file is missing or malformed.
    bool load(const QString& filePath);
    bool save(const QString& filePath) const;

    // Daemon / bus
    QString daemonService() const;
    int callTimeoutMs() const;
    bool failFast() const;
    int retryMaxAttempts() const;
    int retryInitialBackoffMs() const;
    int retryMaxBackoffMs() const;

    // Pairing
    int pairingRequestTimeoutMs() const;
    void setPairingRequestTimeoutMs(int v);
    bool inboundWins() const;
    void setInboundWins(bool v);

    // Devices
    int unreachableTimeoutSecs() const;
    int sweepIntervalSecs() const;

    // Session
    int commandTimeoutMs() const;

    // Notifications
    bool suppressDaemonNotifications() const;
    bool nativeNotifications() const;
    QString notifyrcPath() const;
    QString backupPath() const;
    int lockTimeoutMs() const;

    // IPC
    QString socketPath() const;
    void setSocketPath(const QString& v);

    // Logging
    QString logLevel() const;

    // Generic dot-path access (e.g. "daemon.retry.max_attempts")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;  // single source of truth, no shadow state

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace kcb
