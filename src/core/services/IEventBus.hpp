#pragma once

#include <QString>
#include <QVariant>
#include <functional>

namespace kcb {

/// String-keyed publish/subscribe bus for session events.
/// Payloads are QVariantMaps keyed by topics such as "pairing/timed_out".
/// A subscription topic ending in '*' matches every topic with that prefix.
/// Subscribers are invoked on the main thread (Qt::QueuedConnection).
class IEventBus {
public:
    virtual ~IEventBus() = default;

    using Callback = std::function<void(const QString& topic, const QVariantMap& payload)>;

    /// Subscribe to a topic or a "prefix*" pattern. Returns a subscription ID.
    /// Thread-safe.
    virtual int subscribe(const QString& pattern, Callback callback) = 0;

    /// Unsubscribe by subscription ID.
    /// Thread-safe.
    virtual void unsubscribe(int subscriptionId) = 0;

    /// Publish an event. Matching subscribers are invoked
    /// asynchronously on the main thread.
    /// Thread-safe (can be called from any thread).
    virtual void publish(const QString& topic, const QVariantMap& payload = {}) = 0;
};

} // namespace kcb
