#include "core/notify/SuppressionBackup.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>

namespace kcb {

namespace {

YAML::Binary toBinary(const QByteArray& bytes)
{
    return YAML::Binary(reinterpret_cast<const unsigned char*>(bytes.constData()),
                        static_cast<std::size_t>(bytes.size()));
}

QByteArray fromBinary(const YAML::Node& node)
{
    if (!node)
        return {};
    const YAML::Binary bin = node.as<YAML::Binary>();
    return QByteArray(reinterpret_cast<const char*>(bin.data()), static_cast<int>(bin.size()));
}

} // namespace

bool SuppressionBackup::hasKey(const QString& group, const QString& key) const
{
    for (const auto& k : keys) {
        if (k.group == group && k.key == key)
            return true;
    }
    return false;
}

bool SuppressionBackup::save(const QString& path) const
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "file_existed" << YAML::Value << fileExisted;
    out << YAML::Key << "original" << YAML::Value << toBinary(original);
    out << YAML::Key << "applied" << YAML::Value << toBinary(applied);

    out << YAML::Key << "keys" << YAML::Value << YAML::BeginSeq;
    for (const auto& k : keys) {
        out << YAML::BeginMap;
        out << YAML::Key << "group" << YAML::Value << k.group.toStdString();
        out << YAML::Key << "key" << YAML::Value << k.key.toStdString();
        if (k.prior)
            out << YAML::Key << "prior" << YAML::Value << YAML::DoubleQuoted << k.prior->toStdString();
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "devices" << YAML::Value << YAML::BeginSeq;
    for (const auto& d : devices)
        out << d.toStdString();
    out << YAML::EndSeq;
    out << YAML::EndMap;

    if (!out.good()) {
        BOOST_LOG_TRIVIAL(error) << "Cannot encode suppression backup: " << out.GetLastError();
        return false;
    }

    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        BOOST_LOG_TRIVIAL(warning) << "Cannot create directory for " << path.toStdString();
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        BOOST_LOG_TRIVIAL(warning) << "Cannot write suppression backup " << path.toStdString();
        return false;
    }
    file.write(out.c_str(), static_cast<qint64>(out.size()));
    file.write("\n");
    if (!file.commit()) {
        BOOST_LOG_TRIVIAL(warning) << "Cannot commit suppression backup " << path.toStdString();
        return false;
    }
    return true;
}

std::optional<SuppressionBackup> SuppressionBackup::load(const QString& path)
{
    if (!QFile::exists(path))
        return std::nullopt;

    try {
        YAML::Node root = YAML::LoadFile(path.toStdString());
        SuppressionBackup backup;
        backup.fileExisted = root["file_existed"].as<bool>(false);
        backup.original = fromBinary(root["original"]);
        backup.applied = fromBinary(root["applied"]);

        for (const auto& k : root["keys"]) {
            KeyPrior prior;
            prior.group = QString::fromStdString(k["group"].as<std::string>());
            prior.key = QString::fromStdString(k["key"].as<std::string>());
            if (k["prior"])
                prior.prior = QString::fromStdString(k["prior"].as<std::string>());
            backup.keys.append(prior);
        }
        for (const auto& d : root["devices"])
            backup.devices.append(QString::fromStdString(d.as<std::string>()));

        BOOST_LOG_TRIVIAL(info) << "Loaded suppression backup " << path.toStdString()
                                << " (" << backup.devices.size() << " devices)";
        return backup;
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Suppression backup " << path.toStdString()
                                 << " unreadable: " << e.what();
        return std::nullopt;
    }
}

bool SuppressionBackup::discard(const QString& path)
{
    if (!QFile::exists(path))
        return true;
    if (!QFile::remove(path)) {
        BOOST_LOG_TRIVIAL(warning) << "Cannot remove suppression backup " << path.toStdString();
        return false;
    }
    return true;
}

} // namespace kcb
