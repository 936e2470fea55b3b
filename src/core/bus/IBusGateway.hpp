#pragma once

#include "core/bus/BusTypes.hpp"
#include <functional>

namespace kcb {

/// Typed access to the device-protocol daemon over the session bus.
///
/// Subscriptions survive daemon restarts: the gateway re-establishes its
/// bus matches whenever the daemon re-registers, callers keep their ids.
/// Every call may fail; transient failures are retried inside the gateway.
class IBusGateway {
public:
    virtual ~IBusGateway() = default;

    using SignalCallback = std::function<void(const BusSignal& signal)>;
    using ReplyCallback = std::function<void(const BusReply& reply)>;
    using AvailabilityCallback = std::function<void(bool available)>;

    virtual bool isAvailable() const = 0;

    /// Subscribe to a daemon or device signal by name. Returns a subscription ID.
    virtual int subscribe(const QString& signalName, SignalCallback callback) = 0;
    virtual void unsubscribe(int subscriptionId) = 0;

    /// Called with true when the daemon (re)appears and false when it goes away.
    virtual int watchAvailability(AvailabilityCallback callback) = 0;

    /// The callback is invoked exactly once, asynchronously.
    virtual void call(const BusCall& call, ReplyCallback callback) = 0;
};

} // namespace kcb
