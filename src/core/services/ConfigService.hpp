#pragma once

#include <QObject>
#include "IConfigService.hpp"

namespace kcb {

class YamlConfig;

/// Concrete IConfigService wrapping YamlConfig.
/// Does NOT own the YamlConfig (caller manages lifetime).
class ConfigService : public QObject, public IConfigService {
    Q_OBJECT
public:
    explicit ConfigService(YamlConfig* config, const QString& configPath, QObject* parent = nullptr);

    QVariant value(const QString& key) const override;
    bool setValue(const QString& key, const QVariant& value) override;
    bool save() override;

signals:
    void configChanged(const QString& path, const QVariant& value);

private:
    YamlConfig* config_;
    QString configPath_;
};

} // namespace kcb
