#pragma once

#include <QDateTime>
#include <QString>
#include <functional>
#include <optional>

namespace kcb {

enum class Reachability {
    Unreachable,
    Reachable
};

enum class DeviceType {
    Unknown,
    Phone,
    Tablet,
    Desktop,
    Laptop,
    Tv
};

enum class PairState {
    Unknown,          // never reported by the daemon
    Unpaired,
    RequestSent,      // outbound request pending
    RequestReceived,  // inbound request pending
    Paired,
    Unpairing
};

enum class ErrorKind {
    None,
    BusUnavailable,
    NotPaired,
    PairingRejected,
    PairingTimedOut,
    PairingFailed,
    StaleToken,
    SuppressionUnavailable,
    UnknownDevice,
    InvalidState,
    Cancelled,
    CallFailed,
    Timeout
};

struct CommandResult {
    ErrorKind error = ErrorKind::None;

    bool ok() const { return error == ErrorKind::None; }

    static CommandResult success() { return {}; }
    static CommandResult failure(ErrorKind kind) { return {kind}; }
};

using ResultCallback = std::function<void(const CommandResult& result)>;

/// Reported by the battery plugin of a paired device.
struct BatteryStatus {
    int charge = -1;  // percent, -1 until reported
    bool charging = false;

    bool operator==(const BatteryStatus& other) const
    {
        return charge == other.charge && charging == other.charging;
    }
    bool operator!=(const BatteryStatus& other) const { return !(*this == other); }
};

/// Reported by the connectivity_report plugin of a paired phone.
struct ConnectivityStatus {
    int strength = -1;    // cellular signal in bars (0-4), -1 until reported
    QString networkType;  // "LTE", "5G", ...

    bool operator==(const ConnectivityStatus& other) const
    {
        return strength == other.strength && networkType == other.networkType;
    }
    bool operator!=(const ConnectivityStatus& other) const { return !(*this == other); }
};

struct Device {
    QString id;
    QString name;
    DeviceType type = DeviceType::Unknown;
    Reachability reachability = Reachability::Unreachable;
    PairState pairState = PairState::Unknown;
    QDateTime lastSeen;
    quint64 arrival = 0;  // arrival order of the last applied report
    std::optional<BatteryStatus> battery;            // only while the plugin is loaded
    std::optional<ConnectivityStatus> connectivity;

    bool isReachable() const { return reachability == Reachability::Reachable; }
};

QString pairStateName(PairState state);
PairState pairStateFromName(const QString& name);

QString deviceTypeName(DeviceType type);
DeviceType deviceTypeFromName(const QString& name);

QString errorKindName(ErrorKind kind);
ErrorKind errorKindFromName(const QString& name);

bool isPendingPairState(PairState state);

} // namespace kcb
