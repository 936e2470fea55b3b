#pragma once

#include <QString>
#include <QStringList>

namespace kcb {
namespace daemon {

// Object layout of kdeconnectd on the session bus
inline const QString kDefaultService = QStringLiteral("org.kde.kdeconnect");
inline const QString kDaemonPath = QStringLiteral("/modules/kdeconnect");
inline const QString kDevicesPath = QStringLiteral("/modules/kdeconnect/devices/");
inline const QString kDaemonInterface = QStringLiteral("org.kde.kdeconnect.daemon");
inline const QString kDeviceInterface = QStringLiteral("org.kde.kdeconnect.device");
inline const QString kPropertiesInterface = QStringLiteral("org.freedesktop.DBus.Properties");

// Daemon methods
inline const QString kDevices = QStringLiteral("devices");

// Device methods
inline const QString kRequestPairing = QStringLiteral("requestPairing");
inline const QString kAcceptPairing = QStringLiteral("acceptPairing");
inline const QString kRejectPairing = QStringLiteral("rejectPairing");
inline const QString kCancelPairing = QStringLiteral("cancelPairing");
inline const QString kUnpair = QStringLiteral("unpair");
inline const QString kSetPluginEnabled = QStringLiteral("setPluginEnabled");
inline const QString kLoadedPlugins = QStringLiteral("loadedPlugins");
inline const QString kGetAll = QStringLiteral("GetAll");

// Daemon signals (first argument is the device id)
inline const QString kDeviceAdded = QStringLiteral("deviceAdded");
inline const QString kDeviceRemoved = QStringLiteral("deviceRemoved");
inline const QString kDeviceVisibilityChanged = QStringLiteral("deviceVisibilityChanged");
inline const QString kDeviceListChanged = QStringLiteral("deviceListChanged");

// Device signals (device id comes from the object path)
inline const QString kReachableChanged = QStringLiteral("reachableChanged");
inline const QString kPairStateChanged = QStringLiteral("pairStateChanged");
inline const QString kNameChanged = QStringLiteral("nameChanged");
inline const QString kTypeChanged = QStringLiteral("typeChanged");
inline const QString kPluginsChanged = QStringLiteral("pluginsChanged");

// Plugin objects below a device path, with the properties read from them
inline const QString kBatteryObject = QStringLiteral("battery");
inline const QString kBatteryInterface = QStringLiteral("org.kde.kdeconnect.device.battery");
inline const QString kPropCharge = QStringLiteral("charge");
inline const QString kPropIsCharging = QStringLiteral("isCharging");
inline const QString kConnectivityObject = QStringLiteral("connectivity_report");
inline const QString kConnectivityInterface = QStringLiteral("org.kde.kdeconnect.device.connectivity_report");
inline const QString kPropNetworkType = QStringLiteral("cellularNetworkType");
inline const QString kPropNetworkStrength = QStringLiteral("cellularNetworkStrength");

// Plugin signals. Both plugins call theirs "refreshed", so the name carries
// the plugin object: battery.refreshed(bool isCharging, int charge),
// connectivity_report.refreshed(QString networkType, int strength)
inline const QString kBatteryRefreshed = QStringLiteral("battery.refreshed");
inline const QString kConnectivityRefreshed = QStringLiteral("connectivity_report.refreshed");

// Device properties
inline const QString kPropName = QStringLiteral("name");
inline const QString kPropType = QStringLiteral("type");
inline const QString kPropReachable = QStringLiteral("isReachable");
inline const QString kPropPairState = QStringLiteral("pairState");
inline const QString kPropSupportedPlugins = QStringLiteral("supportedPlugins");

inline bool isDaemonSignal(const QString& name)
{
    return name == kDeviceAdded || name == kDeviceRemoved
        || name == kDeviceVisibilityChanged || name == kDeviceListChanged;
}

/// Interface a subscribed signal name lives on.
inline QString signalInterface(const QString& name)
{
    if (isDaemonSignal(name))
        return kDaemonInterface;
    const int dot = name.lastIndexOf(QLatin1Char('.'));
    return dot < 0 ? kDeviceInterface : kDeviceInterface + QLatin1Char('.') + name.left(dot);
}

inline QString signalMember(const QString& name)
{
    return name.section(QLatin1Char('.'), -1);
}

/// Subscription name of an incoming signal, the inverse of the two above.
inline QString signalName(const QString& interface, const QString& member)
{
    const QString pluginPrefix = kDeviceInterface + QLatin1Char('.');
    if (interface.startsWith(pluginPrefix))
        return interface.mid(pluginPrefix.size()) + QLatin1Char('.') + member;
    return member;
}

inline QString devicePath(const QString& deviceId)
{
    return kDevicesPath + deviceId;
}

inline QString objectPath(const QString& deviceId, const QString& object)
{
    if (deviceId.isEmpty())
        return kDaemonPath;
    return object.isEmpty() ? devicePath(deviceId) : devicePath(deviceId) + QLatin1Char('/') + object;
}

/// "/modules/kdeconnect/devices/<id>[/plugin]" -> "<id>", otherwise empty.
inline QString deviceIdFromPath(const QString& path)
{
    if (!path.startsWith(kDevicesPath))
        return {};
    return path.mid(kDevicesPath.size()).section(QLatin1Char('/'), 0, 0);
}

} // namespace daemon
} // namespace kcb
