#pragma once

#include <QHashFunctions>
#include <QList>
#include <QString>

namespace kcb {

enum class PluginKind {
    Unknown,
    Clipboard,
    Sms,
    Notifications,
    MediaControl,
    FileTransfer,
    Battery,
    FindPhone,
    RemoteCommands,
    SignalStrength,
    BrowseDevice
};

QList<PluginKind> allPluginKinds();

/// Consumer-facing name, e.g. "clipboard", "media_control".
QString pluginKindName(PluginKind kind);
PluginKind pluginKindFromName(const QString& name);

/// Daemon plugin id, e.g. "kdeconnect_mprisremote".
QString daemonPluginId(PluginKind kind);
PluginKind pluginKindFromDaemonId(const QString& id);

inline size_t qHash(PluginKind kind, size_t seed = 0) noexcept
{
    return ::qHash(static_cast<int>(kind), seed);
}

} // namespace kcb
