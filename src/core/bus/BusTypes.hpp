#pragma once

#include <QString>
#include <QVariant>
#include <QVariantList>

namespace kcb {

enum class BusErrorKind {
    None,
    Unavailable,  // daemon not on the bus, or connection dropped
    Timeout,      // no reply within the call timeout
    Remote        // the daemon answered with an error
};

struct BusError {
    BusErrorKind kind = BusErrorKind::None;
    QString name;     // D-Bus error name, e.g. org.freedesktop.DBus.Error.ServiceUnknown
    QString message;

    bool isError() const { return kind != BusErrorKind::None; }
    bool isTransient() const
    {
        return kind == BusErrorKind::Unavailable || kind == BusErrorKind::Timeout;
    }
};

struct BusReply {
    BusError error;
    QVariantList values;  // D-Bus variants and containers already unwrapped

    bool ok() const { return !error.isError(); }
    QVariant first() const { return values.isEmpty() ? QVariant() : values.first(); }
};

/// A method call on the daemon object (empty deviceId), on a device object,
/// or on one of a device's plugin objects (object set, e.g. "battery").
struct BusCall {
    QString deviceId;
    QString interface;
    QString method;
    QVariantList args;
    QString object;
};

struct BusSignal {
    QString deviceId;  // from the object path, or the first argument for daemon signals
    QString name;
    QVariantList args;
};

} // namespace kcb
