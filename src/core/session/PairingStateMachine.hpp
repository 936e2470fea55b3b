#pragma once

#include "core/session/SessionTypes.hpp"
#include <QObject>
#include <QHash>
#include <QList>
#include <QSet>
#include <optional>

class QTimer;

namespace kcb {

/// Pair state as carried by the daemon's pairStateChanged(int) signal.
enum class DaemonPairState {
    NotPaired = 0,
    Requested = 1,        // requested by this side
    RequestedByPeer = 2,
    Paired = 3
};

std::optional<DaemonPairState> daemonPairStateFromInt(int value);

struct PairingSession {
    QString deviceId;
    PairState state = PairState::Unknown;
    quint64 token = 0;
    QDateTime deadline;  // set while a request is outstanding
};

/// Outcome of one state machine operation.
struct PairingTransition {
    bool changed = false;
    PairState from = PairState::Unknown;
    PairState to = PairState::Unknown;
    ErrorKind error = ErrorKind::None;
    quint64 token = 0;
    bool tieBreak = false;  // inbound request accepted our pending outbound one
};

/// Per-device pairing sessions.
///
/// A session exists only while a device is RequestSent, RequestReceived,
/// Paired or Unpairing. Devices resting in Unpaired are tracked without a
/// session. Every request (either direction) gets a fresh token from a
/// counter that is never reset, and replies are matched against it.
class PairingStateMachine : public QObject {
    Q_OBJECT

public:
    enum class Reply {
        Accepted,
        Rejected,
        Failed
    };

    explicit PairingStateMachine(QObject* parent = nullptr);
    ~PairingStateMachine() override;

    void setRequestTimeout(int ms) { requestTimeoutMs_ = ms; }
    int requestTimeout() const { return requestTimeoutMs_; }
    void setInboundWins(bool inboundWins) { inboundWins_ = inboundWins; }
    bool inboundWins() const { return inboundWins_; }

    PairState state(const QString& deviceId) const;
    std::optional<PairingSession> session(const QString& deviceId) const;
    QList<PairingSession> sessions() const;

    /// First sighting of a device: Unpaired, or Paired if the daemon
    /// already holds a pairing for it. No-op for known devices.
    PairingTransition discover(const QString& deviceId, bool daemonPaired);

    PairingTransition requestPairing(const QString& deviceId);
    PairingTransition receiveRequest(const QString& deviceId);
    PairingTransition resolve(const QString& deviceId, quint64 token, Reply reply);
    PairingTransition cancel(const QString& deviceId);
    PairingTransition expire(const QString& deviceId, quint64 token);
    PairingTransition beginUnpair(const QString& deviceId);
    PairingTransition finishUnpair(const QString& deviceId, bool succeeded);
    PairingTransition daemonReported(const QString& deviceId, DaemonPairState reported);

    /// Drops every trace of a removed device.
    PairingTransition forget(const QString& deviceId);

signals:
    /// Emitted when the expiry timer of an outstanding request fires.
    /// The owner is expected to feed it back through expire().
    void requestExpired(const QString& deviceId, quint64 token);

private:
    struct Session {
        PairState state = PairState::Unknown;
        quint64 token = 0;
        QDateTime deadline;
        QTimer* timer = nullptr;
    };

    PairingTransition openRequest(const QString& deviceId, PairState pending);
    PairingTransition settle(const QString& deviceId, PairState to, ErrorKind error);
    void disarm(Session& session);
    static QDateTime now() { return QDateTime::currentDateTimeUtc(); }

    QHash<QString, Session> sessions_;
    QSet<QString> unpaired_;
    struct CancelMarker {
        quint64 token = 0;
        QDateTime deadline;  // of the cancelled request
    };

    QHash<QString, CancelMarker> cancelled_;
    quint64 lastToken_ = 0;
    int requestTimeoutMs_ = 30000;
    bool inboundWins_ = true;
};

} // namespace kcb
