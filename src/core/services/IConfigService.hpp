#pragma once

#include <QString>
#include <QVariant>

namespace kcb {

class IConfigService {
public:
    virtual ~IConfigService() = default;

    /// Read a config value by dot-notation key (e.g., "pairing.request_timeout_ms").
    /// Returns invalid QVariant if key not found.
    virtual QVariant value(const QString& key) const = 0;

    /// Write a config value. Only keys known to the defaults are accepted.
    /// Must be called from the main thread (single-writer rule).
    virtual bool setValue(const QString& key, const QVariant& value) = 0;

    /// Flush config to disk.
    virtual bool save() = 0;
};

// Typed reads with a fallback for absent keys or a missing service.
inline int configInt(const IConfigService* config, const QString& key, int fallback)
{
    if (!config) return fallback;
    bool ok = false;
    int v = config->value(key).toInt(&ok);
    return ok ? v : fallback;
}

inline bool configBool(const IConfigService* config, const QString& key, bool fallback)
{
    if (!config) return fallback;
    QVariant v = config->value(key);
    return v.isValid() ? v.toBool() : fallback;
}

inline QString configString(const IConfigService* config, const QString& key,
                            const QString& fallback = {})
{
    if (!config) return fallback;
    QString v = config->value(key).toString();
    return v.isEmpty() ? fallback : v;
}

} // namespace kcb
