#include "core/session/PluginKind.hpp"

namespace kcb {

namespace {

struct KindEntry {
    PluginKind kind;
    const char* name;
    const char* daemonId;
};

const KindEntry kKinds[] = {
    {PluginKind::Clipboard,      "clipboard",       "kdeconnect_clipboard"},
    {PluginKind::Sms,            "sms",             "kdeconnect_sms"},
    {PluginKind::Notifications,  "notifications",   "kdeconnect_notifications"},
    {PluginKind::MediaControl,   "media_control",   "kdeconnect_mprisremote"},
    {PluginKind::FileTransfer,   "file_transfer",   "kdeconnect_share"},
    {PluginKind::Battery,        "battery",         "kdeconnect_battery"},
    {PluginKind::FindPhone,      "find_phone",      "kdeconnect_findmyphone"},
    {PluginKind::RemoteCommands, "remote_commands", "kdeconnect_runcommand"},
    {PluginKind::SignalStrength, "signal_strength", "kdeconnect_connectivity_report"},
    {PluginKind::BrowseDevice,   "browse_device",   "kdeconnect_sftp"},
};

} // namespace

QList<PluginKind> allPluginKinds()
{
    QList<PluginKind> kinds;
    for (const auto& e : kKinds)
        kinds.append(e.kind);
    return kinds;
}

QString pluginKindName(PluginKind kind)
{
    for (const auto& e : kKinds) {
        if (e.kind == kind)
            return QString::fromLatin1(e.name);
    }
    return QStringLiteral("unknown");
}

PluginKind pluginKindFromName(const QString& name)
{
    for (const auto& e : kKinds) {
        if (name == QLatin1String(e.name))
            return e.kind;
    }
    return PluginKind::Unknown;
}

QString daemonPluginId(PluginKind kind)
{
    for (const auto& e : kKinds) {
        if (e.kind == kind)
            return QString::fromLatin1(e.daemonId);
    }
    return {};
}

PluginKind pluginKindFromDaemonId(const QString& id)
{
    for (const auto& e : kKinds) {
        if (id == QLatin1String(e.daemonId))
            return e.kind;
    }
    return PluginKind::Unknown;
}

} // namespace kcb
