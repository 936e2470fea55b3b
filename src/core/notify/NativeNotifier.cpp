#include "core/notify/NativeNotifier.hpp"
#include "core/notify/NotificationArbiter.hpp"
#include "core/services/IEventBus.hpp"
#include "core/services/INotificationService.hpp"
#include <QDebug>

namespace kcb {

namespace {
const QString kAccept = QStringLiteral("accept");
const QString kReject = QStringLiteral("reject");

QString displayName(const QVariantMap& payload)
{
    const QString name = payload.value("name").toString();
    return name.isEmpty() ? payload.value("device").toString() : name;
}
}

NativeNotifier::NativeNotifier(INotificationService* notifications, IEventBus* eventBus,
                               CommandSink submit, QObject* parent)
    : QObject(parent)
    , notifications_(notifications)
    , eventBus_(eventBus)
    , submit_(std::move(submit))
{
}

NativeNotifier::~NativeNotifier()
{
    if (eventBus_ && subscription_ >= 0)
        eventBus_->unsubscribe(subscription_);
}

void NativeNotifier::start()
{
    notifications_->setActionHandler([this](const QString& id, const QString& action) {
        onAction(id, action);
    });
    subscription_ = eventBus_->subscribe(QStringLiteral("pairing/*"),
                                         [this](const QString& topic, const QVariantMap& payload) {
        onEvent(topic, payload);
    });
}

void NativeNotifier::onEvent(const QString& topic, const QVariantMap& payload)
{
    const QString deviceId = payload.value("device").toString();
    if (deviceId.isEmpty())
        return;

    const bool native = payload.value("path").toString() == deliveryPathName(DeliveryPath::Native);

    if (topic == QLatin1String("pairing/requested")) {
        if (!native || prompts_.contains(deviceId))
            return;
        const QString name = displayName(payload);
        QVariantMap n;
        n["summary"] = QString("%1 wants to pair").arg(name);
        n["body"] = QString("Accept the pairing request from %1?").arg(name);
        n["actions"] = QStringList{kAccept, QString("Accept"), kReject, QString("Reject")};
        n["urgency"] = 2;
        n["ttlMs"] = 0;
        const QString id = notifications_->post(n);
        prompts_.insert(deviceId, id);
        promptDevices_.insert(id, deviceId);
        qInfo() << "[Notifier] Pairing prompt for" << deviceId;
        return;
    }

    // Every other pairing transition settles an open prompt
    closePrompt(deviceId);

    if (!native)
        return;
    const QString name = displayName(payload);
    const bool outbound = payload.value("from").toString() == pairStateName(PairState::RequestSent);
    if (topic == QLatin1String("pairing/timed_out")) {
        postTransient(QString("Pairing timed out"),
                      outbound ? QString("%1 did not answer in time").arg(name)
                               : QString("The pairing request from %1 expired").arg(name));
    } else if (topic == QLatin1String("pairing/rejected") && outbound) {
        postTransient(QString("Pairing rejected"), QString("%1 rejected the pairing request").arg(name));
    }
}

void NativeNotifier::onAction(const QString& notificationId, const QString& action)
{
    auto it = promptDevices_.find(notificationId);
    if (it == promptDevices_.end())
        return;

    CommandRequest request;
    if (action == kAccept)
        request.kind = CommandKind::AcceptPair;
    else if (action == kReject)
        request.kind = CommandKind::RejectPair;
    else
        return;  // "default" (body clicked) leaves the prompt open
    request.deviceId = it.value();

    closePrompt(request.deviceId);
    qInfo() << "[Notifier]" << commandKindName(request.kind) << "from prompt for" << request.deviceId;
    submit_(request, [request](const CommandResult& result) {
        if (!result.ok())
            qWarning() << "[Notifier]" << commandKindName(request.kind) << "for" << request.deviceId
                       << "failed:" << errorKindName(result.error);
    });
}

void NativeNotifier::closePrompt(const QString& deviceId)
{
    const QString id = prompts_.take(deviceId);
    if (id.isEmpty())
        return;
    promptDevices_.remove(id);
    notifications_->dismiss(id);
}

void NativeNotifier::postTransient(const QString& summary, const QString& body)
{
    QVariantMap n;
    n["summary"] = summary;
    n["body"] = body;
    n["urgency"] = 1;
    n["ttlMs"] = transientTtlMs_;
    notifications_->post(n);
}

} // namespace kcb
