#pragma once

#include "IEventBus.hpp"
#include <QObject>
#include <QMutex>
#include <QHash>

namespace kcb {

class EventBus : public QObject, public IEventBus {
    Q_OBJECT
public:
    explicit EventBus(QObject* parent = nullptr);

    int subscribe(const QString& pattern, Callback callback) override;
    void unsubscribe(int subscriptionId) override;
    void publish(const QString& topic, const QVariantMap& payload = {}) override;

private:
    struct Subscription {
        QString pattern;
        bool prefix = false;
        Callback callback;
    };

    static bool matches(const Subscription& sub, const QString& topic);

    QMutex mutex_;
    int nextId_ = 1;
    QHash<int, Subscription> subscriptions_;
};

} // namespace kcb
