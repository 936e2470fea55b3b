#include "core/session/DeviceWorkQueue.hpp"
#include <QDebug>
#include <QPointer>

namespace kcb {

DeviceWorkQueue::DeviceWorkQueue(QObject* parent)
    : QObject(parent)
{
}

void DeviceWorkQueue::enqueue(const QString& lane, const QString& label, Task task)
{
    auto& slot = lanes_[lane];
    if (!slot)
        slot = std::make_shared<Lane>();
    slot->queue.append(Item{label, std::move(task)});
    drain(lane);
}

bool DeviceWorkQueue::isBusy(const QString& lane) const
{
    auto l = lanes_.value(lane);
    return l && (l->running || !l->queue.isEmpty());
}

int DeviceWorkQueue::pending(const QString& lane) const
{
    auto l = lanes_.value(lane);
    return l ? l->queue.size() : 0;
}

void DeviceWorkQueue::drain(const QString& laneId)
{
    std::shared_ptr<Lane> lane = lanes_.value(laneId);
    if (!lane || lane->draining)
        return;

    // Tasks that complete synchronously re-enter drain(); the flag turns
    // that into another turn of this loop instead of recursion
    lane->draining = true;
    while (!lane->running && !lane->queue.isEmpty()) {
        Item item = lane->queue.takeFirst();
        lane->running = true;

        QPointer<DeviceWorkQueue> self(this);
        std::weak_ptr<Lane> weak = lane;
        auto fired = std::make_shared<bool>(false);
        const QString label = item.label;
        item.task([self, weak, fired, laneId, label]() {
            if (*fired) {
                qWarning() << "[WorkQueue]" << laneId << label << "completed twice";
                return;
            }
            *fired = true;
            auto l = weak.lock();
            if (!self || !l)
                return;
            l->running = false;
            emit self->settled(laneId);
            self->drain(laneId);
        });
    }
    lane->draining = false;

    if (!lane->running && lane->queue.isEmpty() && lanes_.value(laneId) == lane)
        lanes_.remove(laneId);
}

} // namespace kcb
