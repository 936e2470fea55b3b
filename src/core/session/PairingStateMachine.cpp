#include "core/session/PairingStateMachine.hpp"
#include <QDebug>
#include <QTimer>
#include <algorithm>

namespace kcb {

std::optional<DaemonPairState> daemonPairStateFromInt(int value)
{
    switch (value) {
    case 0: return DaemonPairState::NotPaired;
    case 1: return DaemonPairState::Requested;
    case 2: return DaemonPairState::RequestedByPeer;
    case 3: return DaemonPairState::Paired;
    default: return std::nullopt;
    }
}

PairingStateMachine::PairingStateMachine(QObject* parent)
    : QObject(parent)
{
}

PairingStateMachine::~PairingStateMachine()
{
    for (auto& s : sessions_)
        disarm(s);
}

PairState PairingStateMachine::state(const QString& deviceId) const
{
    auto it = sessions_.constFind(deviceId);
    if (it != sessions_.constEnd())
        return it->state;
    if (unpaired_.contains(deviceId))
        return PairState::Unpaired;
    return PairState::Unknown;
}

std::optional<PairingSession> PairingStateMachine::session(const QString& deviceId) const
{
    auto it = sessions_.constFind(deviceId);
    if (it == sessions_.constEnd())
        return std::nullopt;

    PairingSession s;
    s.deviceId = deviceId;
    s.state = it->state;
    s.token = it->token;
    s.deadline = it->deadline;
    return s;
}

QList<PairingSession> PairingStateMachine::sessions() const
{
    QList<PairingSession> result;
    QStringList ids = sessions_.keys();
    ids.sort();
    for (const auto& id : ids)
        result.append(*session(id));
    return result;
}

PairingTransition PairingStateMachine::discover(const QString& deviceId, bool daemonPaired)
{
    PairingTransition t;
    t.from = t.to = state(deviceId);
    if (t.from != PairState::Unknown)
        return t;

    if (daemonPaired) {
        Session s;
        s.state = PairState::Paired;
        s.token = ++lastToken_;
        sessions_.insert(deviceId, s);
        t.token = s.token;
    } else {
        unpaired_.insert(deviceId);
    }

    t.to = state(deviceId);
    t.changed = true;
    qInfo() << "[Pairing]" << deviceId << "discovered as" << pairStateName(t.to);
    return t;
}

PairingTransition PairingStateMachine::requestPairing(const QString& deviceId)
{
    const PairState current = state(deviceId);
    if (current != PairState::Unpaired) {
        PairingTransition t;
        t.from = t.to = current;
        t.error = current == PairState::Unknown ? ErrorKind::UnknownDevice
                                                : ErrorKind::InvalidState;
        return t;
    }
    return openRequest(deviceId, PairState::RequestSent);
}

PairingTransition PairingStateMachine::receiveRequest(const QString& deviceId)
{
    const PairState current = state(deviceId);

    if (current == PairState::Unknown || current == PairState::Unpaired)
        return openRequest(deviceId, PairState::RequestReceived);

    PairingTransition t;
    t.from = t.to = current;

    if (current == PairState::RequestSent) {
        if (!inboundWins_) {
            qInfo() << "[Pairing]" << deviceId << "inbound request ignored, outbound request pending";
            return t;
        }
        qInfo() << "[Pairing]" << deviceId << "crossed requests, inbound wins";
        t = settle(deviceId, PairState::Paired, ErrorKind::None);
        t.tieBreak = true;
    }
    return t;
}

PairingTransition PairingStateMachine::resolve(const QString& deviceId, quint64 token, Reply reply)
{
    PairingTransition t;
    t.from = t.to = state(deviceId);

    auto it = sessions_.find(deviceId);
    if (it == sessions_.end() || it->token != token) {
        qDebug() << "[Pairing]" << deviceId << "dropping stale reply for token" << token;
        t.error = ErrorKind::StaleToken;
        t.token = token;
        return t;
    }

    const bool pending = isPendingPairState(it->state);
    switch (reply) {
    case Reply::Accepted:
        if (pending)
            return settle(deviceId, PairState::Paired, ErrorKind::None);
        break;
    case Reply::Rejected:
        if (pending)
            return settle(deviceId, PairState::Unpaired, ErrorKind::PairingRejected);
        break;
    case Reply::Failed:
        // A tie-break pairs optimistically; a failed accept call undoes it
        if (pending || it->state == PairState::Paired)
            return settle(deviceId, PairState::Unpaired, ErrorKind::PairingFailed);
        break;
    }

    t.token = token;
    return t;
}

PairingTransition PairingStateMachine::cancel(const QString& deviceId)
{
    PairingTransition t;
    t.from = t.to = state(deviceId);
    if (t.from != PairState::RequestSent) {
        t.error = ErrorKind::InvalidState;
        return t;
    }

    CancelMarker marker;
    marker.token = sessions_.value(deviceId).token;
    marker.deadline = sessions_.value(deviceId).deadline;
    t = settle(deviceId, PairState::Unpaired, ErrorKind::Cancelled);
    // An acceptance for this request may still arrive until its deadline
    cancelled_.insert(deviceId, marker);
    qInfo() << "[Pairing]" << deviceId << "request" << marker.token << "cancelled";
    return t;
}

PairingTransition PairingStateMachine::expire(const QString& deviceId, quint64 token)
{
    PairingTransition t;
    t.from = t.to = state(deviceId);

    auto it = sessions_.constFind(deviceId);
    if (it == sessions_.constEnd() || it->token != token || !isPendingPairState(it->state)) {
        qDebug() << "[Pairing]" << deviceId << "ignoring expiry of stale token" << token;
        t.error = ErrorKind::StaleToken;
        t.token = token;
        return t;
    }

    qInfo() << "[Pairing]" << deviceId << "request" << token << "timed out";
    return settle(deviceId, PairState::Unpaired, ErrorKind::PairingTimedOut);
}

PairingTransition PairingStateMachine::beginUnpair(const QString& deviceId)
{
    PairingTransition t;
    t.from = t.to = state(deviceId);
    if (t.from != PairState::Paired) {
        t.error = ErrorKind::NotPaired;
        return t;
    }

    Session& s = sessions_[deviceId];
    s.state = PairState::Unpairing;
    t.to = s.state;
    t.token = s.token;
    t.changed = true;
    return t;
}

PairingTransition PairingStateMachine::finishUnpair(const QString& deviceId, bool succeeded)
{
    PairingTransition t;
    t.from = t.to = state(deviceId);
    if (t.from != PairState::Unpairing)
        return t;

    if (succeeded)
        return settle(deviceId, PairState::Unpaired, ErrorKind::None);

    Session& s = sessions_[deviceId];
    s.state = PairState::Paired;
    t.to = s.state;
    t.token = s.token;
    t.changed = true;
    t.error = ErrorKind::PairingFailed;
    return t;
}

PairingTransition PairingStateMachine::daemonReported(const QString& deviceId,
                                                      DaemonPairState reported)
{
    const PairState current = state(deviceId);
    PairingTransition t;
    t.from = t.to = current;

    switch (reported) {
    case DaemonPairState::NotPaired:
        switch (current) {
        case PairState::Unknown:
            return discover(deviceId, false);
        case PairState::RequestSent:
            return settle(deviceId, PairState::Unpaired, ErrorKind::PairingRejected);
        case PairState::RequestReceived:
            // Peer withdrew its request
            return settle(deviceId, PairState::Unpaired, ErrorKind::Cancelled);
        case PairState::Paired:
        case PairState::Unpairing:
            return settle(deviceId, PairState::Unpaired, ErrorKind::None);
        case PairState::Unpaired:
            break;
        }
        return t;

    case DaemonPairState::Requested:
        if (current == PairState::Unpaired && cancelled_.contains(deviceId)
            && now() <= cancelled_.value(deviceId).deadline) {
            // Echo of the request we cancelled
            t.token = cancelled_.value(deviceId).token;
            t.error = ErrorKind::StaleToken;
            return t;
        }
        if (current == PairState::Unknown || current == PairState::Unpaired)
            return openRequest(deviceId, PairState::RequestSent);
        return t;

    case DaemonPairState::RequestedByPeer:
        return receiveRequest(deviceId);

    case DaemonPairState::Paired:
        switch (current) {
        case PairState::Unknown:
            return discover(deviceId, true);
        case PairState::RequestSent:
        case PairState::RequestReceived:
            return settle(deviceId, PairState::Paired, ErrorKind::None);
        case PairState::Unpaired:
            if (cancelled_.contains(deviceId)) {
                const CancelMarker marker = cancelled_.take(deviceId);
                if (now() <= marker.deadline) {
                    t.token = marker.token;
                    t.error = ErrorKind::StaleToken;
                    qDebug() << "[Pairing]" << deviceId << "dropping pairing reply for cancelled token" << t.token;
                    return t;
                }
            }
            {
                // Paired by another client of the daemon
                unpaired_.remove(deviceId);
                Session s;
                s.state = PairState::Paired;
                s.token = ++lastToken_;
                sessions_.insert(deviceId, s);
                t.to = PairState::Paired;
                t.token = s.token;
                t.changed = true;
                qInfo() << "[Pairing]" << deviceId << "paired outside this session";
            }
            return t;
        case PairState::Paired:
        case PairState::Unpairing:
            break;
        }
        return t;
    }
    return t;
}

PairingTransition PairingStateMachine::forget(const QString& deviceId)
{
    PairingTransition t;
    t.from = state(deviceId);
    t.to = PairState::Unknown;

    auto it = sessions_.find(deviceId);
    if (it != sessions_.end()) {
        t.token = it->token;
        disarm(*it);
        sessions_.erase(it);
    }
    unpaired_.remove(deviceId);
    cancelled_.remove(deviceId);
    t.changed = t.from != PairState::Unknown;
    return t;
}

PairingTransition PairingStateMachine::openRequest(const QString& deviceId, PairState pending)
{
    PairingTransition t;
    t.from = state(deviceId);

    unpaired_.remove(deviceId);
    cancelled_.remove(deviceId);

    Session s;
    s.state = pending;
    s.token = ++lastToken_;
    s.deadline = now().addMSecs(requestTimeoutMs_);
    s.timer = new QTimer(this);
    s.timer->setSingleShot(true);
    const quint64 token = s.token;
    connect(s.timer, &QTimer::timeout, this, [this, deviceId, token]() {
        emit requestExpired(deviceId, token);
    });
    s.timer->start(requestTimeoutMs_);
    sessions_.insert(deviceId, s);

    t.to = pending;
    t.token = token;
    t.changed = true;
    qInfo() << "[Pairing]" << deviceId << pairStateName(pending) << "token" << token;
    return t;
}

PairingTransition PairingStateMachine::settle(const QString& deviceId, PairState to, ErrorKind error)
{
    PairingTransition t;
    Session& s = sessions_[deviceId];
    t.from = s.state;
    t.token = s.token;
    t.error = error;
    disarm(s);

    if (to == PairState::Unpaired) {
        sessions_.remove(deviceId);
        unpaired_.insert(deviceId);
    } else {
        s.state = to;
        s.deadline = QDateTime();
    }

    t.to = to;
    t.changed = t.from != t.to;
    qInfo() << "[Pairing]" << deviceId << pairStateName(t.from) << "->" << pairStateName(t.to)
            << (error == ErrorKind::None ? QString() : errorKindName(error));
    return t;
}

void PairingStateMachine::disarm(Session& session)
{
    if (session.timer) {
        session.timer->stop();
        session.timer->deleteLater();
        session.timer = nullptr;
    }
}

} // namespace kcb
