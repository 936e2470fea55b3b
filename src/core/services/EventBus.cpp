#include "EventBus.hpp"
#include <QMetaObject>
#include <QList>
#include <algorithm>

namespace kcb {

EventBus::EventBus(QObject* parent) : QObject(parent) {}

int EventBus::subscribe(const QString& pattern, Callback callback)
{
    QMutexLocker lock(&mutex_);
    int id = nextId_++;
    Subscription sub;
    sub.prefix = pattern.endsWith('*');
    sub.pattern = sub.prefix ? pattern.chopped(1) : pattern;
    sub.callback = std::move(callback);
    subscriptions_.insert(id, std::move(sub));
    return id;
}

void EventBus::unsubscribe(int subscriptionId)
{
    QMutexLocker lock(&mutex_);
    subscriptions_.remove(subscriptionId);
}

bool EventBus::matches(const Subscription& sub, const QString& topic)
{
    return sub.prefix ? topic.startsWith(sub.pattern) : topic == sub.pattern;
}

void EventBus::publish(const QString& topic, const QVariantMap& payload)
{
    QList<Callback> targets;
    {
        QMutexLocker lock(&mutex_);
        // Ascending id order keeps delivery in subscription order
        QList<int> ids = subscriptions_.keys();
        std::sort(ids.begin(), ids.end());
        for (int id : ids) {
            const auto& sub = subscriptions_[id];
            if (matches(sub, topic))
                targets.append(sub.callback);
        }
    }

    for (const auto& cb : targets) {
        QMetaObject::invokeMethod(this, [cb, topic, payload]() {
            cb(topic, payload);
        }, Qt::QueuedConnection);
    }
}

} // namespace kcb
