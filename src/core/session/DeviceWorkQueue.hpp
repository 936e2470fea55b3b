#pragma once

#include <QObject>
#include <QHash>
#include <QList>
#include <functional>
#include <memory>

namespace kcb {

/// Ordered task lanes keyed by device id.
///
/// Within a lane one task runs at a time; the next starts only after the
/// running task calls its Done callback (typically from a bus reply).
/// Different lanes never wait on each other. The empty lane id is used for
/// daemon-wide work such as listing devices.
class DeviceWorkQueue : public QObject {
    Q_OBJECT

public:
    using Done = std::function<void()>;
    using Task = std::function<void(const Done& done)>;

    explicit DeviceWorkQueue(QObject* parent = nullptr);

    void enqueue(const QString& lane, const QString& label, Task task);

    bool isBusy(const QString& lane) const;
    int pending(const QString& lane) const;

signals:
    /// A task in the lane finished; emitted before the next one starts.
    void settled(const QString& lane);

private:
    struct Item {
        QString label;
        Task task;
    };
    struct Lane {
        QList<Item> queue;
        bool running = false;
        bool draining = false;
    };

    void drain(const QString& laneId);

    QHash<QString, std::shared_ptr<Lane>> lanes_;
};

} // namespace kcb
