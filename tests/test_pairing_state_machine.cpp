#include <QTest>
#include <QSignalSpy>
#include "core/session/PairingStateMachine.hpp"

using kcb::PairState;
using kcb::ErrorKind;
using Reply = kcb::PairingStateMachine::Reply;

class TestPairingStateMachine : public QObject {
    Q_OBJECT

private slots:
    void discoverUnpairedHasNoSession()
    {
        kcb::PairingStateMachine psm;
        QCOMPARE(psm.state("phone-123"), PairState::Unknown);

        auto t = psm.discover("phone-123", false);
        QVERIFY(t.changed);
        QCOMPARE(t.from, PairState::Unknown);
        QCOMPARE(t.to, PairState::Unpaired);
        QCOMPARE(psm.state("phone-123"), PairState::Unpaired);
        QVERIFY(!psm.session("phone-123").has_value());

        QVERIFY(!psm.discover("phone-123", true).changed);
    }

    void discoverPreviouslyPaired()
    {
        kcb::PairingStateMachine psm;
        auto t = psm.discover("phone-123", true);
        QCOMPARE(t.to, PairState::Paired);
        QVERIFY(psm.session("phone-123").has_value());
    }

    void outboundRequestAccepted()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);

        auto req = psm.requestPairing("phone-123");
        QVERIFY(req.changed);
        QCOMPARE(req.to, PairState::RequestSent);
        QVERIFY(req.token > 0);
        auto session = psm.session("phone-123");
        QVERIFY(session->deadline.isValid());

        auto acc = psm.resolve("phone-123", req.token, Reply::Accepted);
        QCOMPARE(acc.to, PairState::Paired);
        QCOMPARE(acc.error, ErrorKind::None);
        QVERIFY(!psm.session("phone-123")->deadline.isValid());
    }

    void requestFromWrongStateIsRejected()
    {
        kcb::PairingStateMachine psm;
        QCOMPARE(psm.requestPairing("ghost").error, ErrorKind::UnknownDevice);

        psm.discover("phone-123", true);
        auto t = psm.requestPairing("phone-123");
        QVERIFY(!t.changed);
        QCOMPARE(t.error, ErrorKind::InvalidState);
    }

    void rejectReturnsToUnpaired()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);
        auto req = psm.requestPairing("phone-123");

        auto t = psm.resolve("phone-123", req.token, Reply::Rejected);
        QCOMPARE(t.to, PairState::Unpaired);
        QCOMPARE(t.error, ErrorKind::PairingRejected);
        QVERIFY(!psm.session("phone-123").has_value());

        // A new request may be issued afterwards, with a newer token
        auto again = psm.requestPairing("phone-123");
        QVERIFY(again.changed);
        QVERIFY(again.token > req.token);
    }

    void staleTokenNeverChangesState()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);
        auto first = psm.requestPairing("phone-123");
        psm.resolve("phone-123", first.token, Reply::Rejected);
        auto second = psm.requestPairing("phone-123");

        for (Reply r : {Reply::Accepted, Reply::Rejected, Reply::Failed}) {
            auto t = psm.resolve("phone-123", first.token, r);
            QVERIFY(!t.changed);
            QCOMPARE(t.error, ErrorKind::StaleToken);
            QCOMPARE(psm.state("phone-123"), PairState::RequestSent);
            QCOMPARE(psm.session("phone-123")->token, second.token);
        }
    }

    void timeoutExpiresRequest()
    {
        kcb::PairingStateMachine psm;
        psm.setRequestTimeout(50);
        psm.discover("phone-123", false);
        connect(&psm, &kcb::PairingStateMachine::requestExpired, &psm,
                [&psm](const QString& id, quint64 token) { psm.expire(id, token); });
        QSignalSpy spy(&psm, &kcb::PairingStateMachine::requestExpired);

        auto req = psm.requestPairing("phone-123");
        QTRY_COMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(1).value<quint64>(), req.token);
        QCOMPARE(psm.state("phone-123"), PairState::Unpaired);
    }

    void expireReportsTimedOut()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);
        auto req = psm.receiveRequest("phone-123");
        QCOMPARE(req.to, PairState::RequestReceived);

        auto t = psm.expire("phone-123", req.token);
        QCOMPARE(t.to, PairState::Unpaired);
        QCOMPARE(t.error, ErrorKind::PairingTimedOut);

        auto late = psm.expire("phone-123", req.token);
        QVERIFY(!late.changed);
        QCOMPARE(late.error, ErrorKind::StaleToken);
    }

    void resolvedRequestDoesNotExpire()
    {
        kcb::PairingStateMachine psm;
        psm.setRequestTimeout(30);
        psm.discover("phone-123", false);
        QSignalSpy spy(&psm, &kcb::PairingStateMachine::requestExpired);

        auto req = psm.requestPairing("phone-123");
        psm.resolve("phone-123", req.token, Reply::Accepted);
        QTest::qWait(80);
        QCOMPARE(spy.count(), 0);
    }

    void inboundWinsOverOutbound()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);
        psm.requestPairing("phone-123");

        auto t = psm.receiveRequest("phone-123");
        QVERIFY(t.changed);
        QVERIFY(t.tieBreak);
        QCOMPARE(t.to, PairState::Paired);
    }

    void inboundIgnoredWhenOutboundWins()
    {
        kcb::PairingStateMachine psm;
        psm.setInboundWins(false);
        psm.discover("phone-123", false);
        auto req = psm.requestPairing("phone-123");

        auto t = psm.receiveRequest("phone-123");
        QVERIFY(!t.changed);
        QCOMPARE(psm.state("phone-123"), PairState::RequestSent);
        QCOMPARE(psm.session("phone-123")->token, req.token);
    }

    void failedAcceptAfterTieBreakUndoesPairing()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);
        psm.requestPairing("phone-123");
        auto tie = psm.receiveRequest("phone-123");

        auto t = psm.resolve("phone-123", tie.token, Reply::Failed);
        QCOMPARE(t.to, PairState::Unpaired);
        QCOMPARE(t.error, ErrorKind::PairingFailed);
    }

    void cancelledRequestIgnoresLateReply()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);
        auto req = psm.requestPairing("phone-123");

        auto c = psm.cancel("phone-123");
        QCOMPARE(c.to, PairState::Unpaired);
        QCOMPARE(c.error, ErrorKind::Cancelled);

        auto reply = psm.resolve("phone-123", req.token, Reply::Accepted);
        QVERIFY(!reply.changed);
        QCOMPARE(reply.error, ErrorKind::StaleToken);

        auto report = psm.daemonReported("phone-123", kcb::DaemonPairState::Paired);
        QVERIFY(!report.changed);
        QCOMPARE(report.error, ErrorKind::StaleToken);
        QCOMPARE(psm.state("phone-123"), PairState::Unpaired);
    }

    void cancelMarkerOutlivesDaemonEcho()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);
        psm.requestPairing("phone-123");
        psm.cancel("phone-123");

        // The daemon confirms our cancelPairing call before the peer's answer lands
        QVERIFY(!psm.daemonReported("phone-123", kcb::DaemonPairState::NotPaired).changed);

        // A late "requested" echo does not reopen the request
        QCOMPARE(psm.daemonReported("phone-123", kcb::DaemonPairState::Requested).error,
                 ErrorKind::StaleToken);
        QCOMPARE(psm.state("phone-123"), PairState::Unpaired);

        auto late = psm.daemonReported("phone-123", kcb::DaemonPairState::Paired);
        QCOMPARE(late.error, ErrorKind::StaleToken);
        QCOMPARE(psm.state("phone-123"), PairState::Unpaired);

        // Consumed: a second report is a pairing made elsewhere
        auto adopted = psm.daemonReported("phone-123", kcb::DaemonPairState::Paired);
        QCOMPARE(adopted.to, PairState::Paired);
    }

    void cancelOnlyForOutbound()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);
        QCOMPARE(psm.cancel("phone-123").error, ErrorKind::InvalidState);
        psm.receiveRequest("phone-123");
        QCOMPARE(psm.cancel("phone-123").error, ErrorKind::InvalidState);
    }

    void unpairRoundTrip()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", true);

        auto begin = psm.beginUnpair("phone-123");
        QCOMPARE(begin.to, PairState::Unpairing);
        QVERIFY(psm.session("phone-123").has_value());

        auto done = psm.finishUnpair("phone-123", true);
        QCOMPARE(done.to, PairState::Unpaired);
        QVERIFY(!psm.session("phone-123").has_value());
    }

    void failedUnpairStaysPaired()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", true);
        psm.beginUnpair("phone-123");

        auto t = psm.finishUnpair("phone-123", false);
        QCOMPARE(t.to, PairState::Paired);
        QCOMPARE(t.error, ErrorKind::PairingFailed);
    }

    void unpairRequiresPaired()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);
        QCOMPARE(psm.beginUnpair("phone-123").error, ErrorKind::NotPaired);
    }

    void daemonReports()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);

        QCOMPARE(psm.daemonReported("phone-123", kcb::DaemonPairState::RequestedByPeer).to,
                 PairState::RequestReceived);
        QCOMPARE(psm.daemonReported("phone-123", kcb::DaemonPairState::Paired).to,
                 PairState::Paired);

        // Remote unpair
        auto t = psm.daemonReported("phone-123", kcb::DaemonPairState::NotPaired);
        QCOMPARE(t.to, PairState::Unpaired);
        QCOMPARE(t.error, ErrorKind::None);

        // Paired from another daemon client is adopted
        QCOMPARE(psm.daemonReported("phone-123", kcb::DaemonPairState::Paired).to,
                 PairState::Paired);
    }

    void daemonNotPairedRejectsOutbound()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", false);
        psm.requestPairing("phone-123");

        auto t = psm.daemonReported("phone-123", kcb::DaemonPairState::NotPaired);
        QCOMPARE(t.to, PairState::Unpaired);
        QCOMPARE(t.error, ErrorKind::PairingRejected);
    }

    void forgetDropsSession()
    {
        kcb::PairingStateMachine psm;
        psm.discover("phone-123", true);
        auto t = psm.forget("phone-123");
        QVERIFY(t.changed);
        QCOMPARE(psm.state("phone-123"), PairState::Unknown);
        QVERIFY(psm.sessions().isEmpty());
    }

    void daemonPairStateValues()
    {
        QCOMPARE(*kcb::daemonPairStateFromInt(3), kcb::DaemonPairState::Paired);
        QVERIFY(!kcb::daemonPairStateFromInt(7).has_value());
    }
};

QTEST_MAIN(TestPairingStateMachine)
#include "test_pairing_state_machine.moc"
