#include "core/YamlConfig.hpp"
#include <QSaveFile>
#include <QStringList>
#include <boost/log/trivial.hpp>

namespace kcb {

// Deep merge: mappings recurse, sequences and scalars in the overlay
// replace the base entirely, keys missing from the overlay keep defaults.
// Keys the defaults do not know are carried over untouched.
static YAML::Node mergeOver(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull())
        return YAML::Clone(overlay);

    if (base.IsMap() && overlay.IsMap()) {
        YAML::Node result = YAML::Clone(base);
        for (auto it = overlay.begin(); it != overlay.end(); ++it) {
            const auto key = it->first.as<std::string>();
            if (result[key])
                result[key] = mergeOver(result[key], it->second);
            else
                result[key] = YAML::Clone(it->second);
        }
        return result;
    }

    return YAML::Clone(overlay);
}

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["daemon"]["service"] = "org.kde.kdeconnect";
    root_["daemon"]["call_timeout_ms"] = 5000;
    root_["daemon"]["fail_fast"] = false;
    root_["daemon"]["retry"]["max_attempts"] = 4;
    root_["daemon"]["retry"]["initial_backoff_ms"] = 250;
    root_["daemon"]["retry"]["max_backoff_ms"] = 4000;

    root_["pairing"]["request_timeout_ms"] = 30000;
    root_["pairing"]["inbound_wins"] = true;

    root_["devices"]["unreachable_timeout_s"] = 300;
    root_["devices"]["sweep_interval_s"] = 30;

    root_["session"]["command_timeout_ms"] = 45000;

    root_["notifications"]["suppress_daemon"] = true;
    root_["notifications"]["native"] = true;
    root_["notifications"]["notifyrc_path"] = "";
    root_["notifications"]["backup_path"] = "";
    root_["notifications"]["lock_timeout_ms"] = 2000;

    root_["ipc"]["socket_path"] = "";

    root_["logging"]["level"] = "info";
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);

    try {
        YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = mergeOver(defaults, loaded);
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Config " << filePath.toStdString()
                                 << " not loaded, using defaults: " << e.what();
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "Loaded config from " << filePath.toStdString();
    return true;
}

bool YamlConfig::save(const QString& filePath) const
{
    YAML::Emitter out;
    out << root_;

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        BOOST_LOG_TRIVIAL(warning) << "Cannot write config " << filePath.toStdString();
        return false;
    }
    file.write(out.c_str(), static_cast<qint64>(out.size()));
    file.write("\n");
    return file.commit();
}

// --- Daemon / bus ---

QString YamlConfig::daemonService() const
{
    return QString::fromStdString(
        root_["daemon"]["service"].as<std::string>("org.kde.kdeconnect"));
}

int YamlConfig::callTimeoutMs() const
{
    return root_["daemon"]["call_timeout_ms"].as<int>(5000);
}

bool YamlConfig::failFast() const
{
    return root_["daemon"]["fail_fast"].as<bool>(false);
}

int YamlConfig::retryMaxAttempts() const
{
    return root_["daemon"]["retry"]["max_attempts"].as<int>(4);
}

int YamlConfig::retryInitialBackoffMs() const
{
    return root_["daemon"]["retry"]["initial_backoff_ms"].as<int>(250);
}

int YamlConfig::retryMaxBackoffMs() const
{
    return root_["daemon"]["retry"]["max_backoff_ms"].as<int>(4000);
}

// --- Pairing ---

int YamlConfig::pairingRequestTimeoutMs() const
{
    return root_["pairing"]["request_timeout_ms"].as<int>(30000);
}

void YamlConfig::setPairingRequestTimeoutMs(int v)
{
    root_["pairing"]["request_timeout_ms"] = v;
}

bool YamlConfig::inboundWins() const
{
    return root_["pairing"]["inbound_wins"].as<bool>(true);
}

void YamlConfig::setInboundWins(bool v)
{
    root_["pairing"]["inbound_wins"] = v;
}

// --- Devices ---

int YamlConfig::unreachableTimeoutSecs() const
{
    return root_["devices"]["unreachable_timeout_s"].as<int>(300);
}

int YamlConfig::sweepIntervalSecs() const
{
    return root_["devices"]["sweep_interval_s"].as<int>(30);
}

// --- Session ---

int YamlConfig::commandTimeoutMs() const
{
    return root_["session"]["command_timeout_ms"].as<int>(45000);
}

// --- Notifications ---

bool YamlConfig::suppressDaemonNotifications() const
{
    return root_["notifications"]["suppress_daemon"].as<bool>(true);
}

bool YamlConfig::nativeNotifications() const
{
    return root_["notifications"]["native"].as<bool>(true);
}

QString YamlConfig::notifyrcPath() const
{
    return QString::fromStdString(root_["notifications"]["notifyrc_path"].as<std::string>(""));
}

QString YamlConfig::backupPath() const
{
    return QString::fromStdString(root_["notifications"]["backup_path"].as<std::string>(""));
}

int YamlConfig::lockTimeoutMs() const
{
    return root_["notifications"]["lock_timeout_ms"].as<int>(2000);
}

// --- IPC ---

QString YamlConfig::socketPath() const
{
    return QString::fromStdString(root_["ipc"]["socket_path"].as<std::string>(""));
}

void YamlConfig::setSocketPath(const QString& v)
{
    root_["ipc"]["socket_path"] = v.toStdString();
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const std::string s = node.Scalar();

    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool intOk = false;
    int i = QString::fromStdString(s).toInt(&intOk);
    if (intOk) return QVariant(i);

    bool dblOk = false;
    double d = QString::fromStdString(s).toDouble(&dblOk);
    if (dblOk) return QVariant(d);

    return QVariant(QString::fromStdString(s));
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    const QStringList parts = dottedKey.split('.');

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : parts) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return yamlScalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only leaves that exist in the defaults tree are writable
    {
        YAML::Node defaults = buildDefaultsNode();
        for (const auto& part : parts) {
            if (!defaults.IsMap()) return false;
            defaults.reset(defaults[part.toStdString()]);
            if (!defaults.IsDefined()) return false;
        }
        if (!defaults.IsScalar()) return false;
    }

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i) {
        if (!node.IsMap()) return false;
        node.reset(node[parts[i].toStdString()]);
    }

    const std::string leafKey = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leafKey] = value.toBool();
        break;
    case QMetaType::Int:
        node[leafKey] = value.toInt();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[leafKey] = value.toDouble();
        break;
    default:
        node[leafKey] = value.toString().toStdString();
        break;
    }

    return true;
}

} // namespace kcb
