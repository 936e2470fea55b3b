#include "core/session/SessionTypes.hpp"

namespace kcb {

QString pairStateName(PairState state)
{
    switch (state) {
    case PairState::Unpaired:        return QStringLiteral("unpaired");
    case PairState::RequestSent:     return QStringLiteral("request_sent");
    case PairState::RequestReceived: return QStringLiteral("request_received");
    case PairState::Paired:          return QStringLiteral("paired");
    case PairState::Unpairing:       return QStringLiteral("unpairing");
    case PairState::Unknown:
    default:                         return QStringLiteral("unknown");
    }
}

PairState pairStateFromName(const QString& name)
{
    if (name == QLatin1String("unpaired")) return PairState::Unpaired;
    if (name == QLatin1String("request_sent")) return PairState::RequestSent;
    if (name == QLatin1String("request_received")) return PairState::RequestReceived;
    if (name == QLatin1String("paired")) return PairState::Paired;
    if (name == QLatin1String("unpairing")) return PairState::Unpairing;
    return PairState::Unknown;
}

QString deviceTypeName(DeviceType type)
{
    switch (type) {
    case DeviceType::Phone:   return QStringLiteral("phone");
    case DeviceType::Tablet:  return QStringLiteral("tablet");
    case DeviceType::Desktop: return QStringLiteral("desktop");
    case DeviceType::Laptop:  return QStringLiteral("laptop");
    case DeviceType::Tv:      return QStringLiteral("tv");
    case DeviceType::Unknown:
    default:                  return QStringLiteral("unknown");
    }
}

DeviceType deviceTypeFromName(const QString& name)
{
    const QString n = name.toLower();
    // The daemon reports "smartphone"; consumers use "phone"
    if (n == QLatin1String("smartphone") || n == QLatin1String("phone"))
        return DeviceType::Phone;
    if (n == QLatin1String("tablet")) return DeviceType::Tablet;
    if (n == QLatin1String("desktop")) return DeviceType::Desktop;
    if (n == QLatin1String("laptop")) return DeviceType::Laptop;
    if (n == QLatin1String("tv")) return DeviceType::Tv;
    return DeviceType::Unknown;
}

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:                   return QStringLiteral("None");
    case ErrorKind::BusUnavailable:         return QStringLiteral("BusUnavailable");
    case ErrorKind::NotPaired:              return QStringLiteral("NotPaired");
    case ErrorKind::PairingRejected:        return QStringLiteral("PairingRejected");
    case ErrorKind::PairingTimedOut:        return QStringLiteral("PairingTimedOut");
    case ErrorKind::PairingFailed:          return QStringLiteral("PairingFailed");
    case ErrorKind::StaleToken:             return QStringLiteral("StaleToken");
    case ErrorKind::SuppressionUnavailable: return QStringLiteral("SuppressionUnavailable");
    case ErrorKind::UnknownDevice:          return QStringLiteral("UnknownDevice");
    case ErrorKind::InvalidState:           return QStringLiteral("InvalidState");
    case ErrorKind::Cancelled:              return QStringLiteral("Cancelled");
    case ErrorKind::CallFailed:             return QStringLiteral("CallFailed");
    case ErrorKind::Timeout:                return QStringLiteral("Timeout");
    }
    return QStringLiteral("None");
}

ErrorKind errorKindFromName(const QString& name)
{
    static const ErrorKind kinds[] = {
        ErrorKind::BusUnavailable, ErrorKind::NotPaired, ErrorKind::PairingRejected,
        ErrorKind::PairingTimedOut, ErrorKind::PairingFailed, ErrorKind::StaleToken,
        ErrorKind::SuppressionUnavailable, ErrorKind::UnknownDevice, ErrorKind::InvalidState,
        ErrorKind::Cancelled, ErrorKind::CallFailed, ErrorKind::Timeout,
    };
    for (ErrorKind k : kinds) {
        if (errorKindName(k) == name)
            return k;
    }
    return ErrorKind::None;
}

bool isPendingPairState(PairState state)
{
    return state == PairState::RequestSent || state == PairState::RequestReceived;
}

} // namespace kcb
