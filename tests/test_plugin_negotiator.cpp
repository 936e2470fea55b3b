#include <QTest>
#include "core/session/PluginNegotiator.hpp"

using kcb::PluginKind;
using Decision = kcb::PluginNegotiator::EnableDecision;

namespace {

kcb::CapabilityReport report(std::initializer_list<std::pair<PluginKind, bool>> entries)
{
    kcb::CapabilityReport r;
    for (const auto& e : entries)
        r.plugins.insert(e.first, e.second);
    return r;
}

bool sameRecords(const QList<kcb::PluginRecord>& a, const QList<kcb::PluginRecord>& b)
{
    if (a.size() != b.size())
        return false;
    for (int i = 0; i < a.size(); ++i) {
        if (a[i].deviceId != b[i].deviceId || a[i].kind != b[i].kind
            || a[i].available != b[i].available || a[i].enabled != b[i].enabled
            || a[i].lastSync != b[i].lastSync)
            return false;
    }
    return true;
}

} // namespace

class TestPluginNegotiator : public QObject {
    Q_OBJECT

private slots:
    void reconcileCreatesRecords()
    {
        kcb::PluginNegotiator n;
        QVERIFY(n.reconcile("phone-123", report({{PluginKind::Sms, false},
                                                 {PluginKind::Clipboard, true}}), true));

        QCOMPARE(n.records("phone-123").size(), 2);
        auto sms = n.record("phone-123", PluginKind::Sms);
        QVERIFY(sms->available);
        QVERIFY(!sms->enabled);
        QVERIFY(n.record("phone-123", PluginKind::Clipboard)->enabled);
        QVERIFY(!n.record("phone-123", PluginKind::Battery).has_value());
    }

    void reconcileIsIdempotent()
    {
        kcb::PluginNegotiator n;
        QDateTime t = QDateTime::fromSecsSinceEpoch(100, Qt::UTC);
        n.setClock([&t] { return t; });

        const auto r = report({{PluginKind::Sms, true}, {PluginKind::Battery, false}});
        n.reconcile("phone-123", r, true);
        const auto first = n.records();

        t = t.addSecs(60);
        QVERIFY(!n.reconcile("phone-123", r, true));
        QVERIFY(sameRecords(first, n.records()));
    }

    void missingKindsBecomeUnavailable()
    {
        kcb::PluginNegotiator n;
        n.reconcile("phone-123", report({{PluginKind::Sms, true}, {PluginKind::Clipboard, true}}), true);
        n.reconcile("phone-123", report({{PluginKind::Sms, true}}), true);

        auto clip = n.record("phone-123", PluginKind::Clipboard);
        QVERIFY(clip.has_value());
        QVERIFY(!clip->available);
        QVERIFY(!clip->enabled);
        QCOMPARE(n.records("phone-123").size(), 2);
    }

    void enabledNeverTrueUnlessPaired()
    {
        kcb::PluginNegotiator n;
        n.reconcile("phone-123", report({{PluginKind::Sms, true}}), false);
        QVERIFY(!n.record("phone-123", PluginKind::Sms)->enabled);
    }

    void setEnabledRequiresPaired()
    {
        kcb::PluginNegotiator n;
        n.reconcile("phone-123", report({{PluginKind::Sms, false}}), false);
        QCOMPARE(n.beginSetEnabled("phone-123", PluginKind::Sms, true, false), Decision::NotPaired);
        QVERIFY(!n.record("phone-123", PluginKind::Sms)->enabled);
    }

    void setEnabledUnavailableKind()
    {
        kcb::PluginNegotiator n;
        n.reconcile("phone-123", report({{PluginKind::Sms, false}}), true);
        QCOMPARE(n.beginSetEnabled("phone-123", PluginKind::Battery, true, true), Decision::Unavailable);
        QCOMPARE(n.beginSetEnabled("ghost", PluginKind::Sms, true, true), Decision::Unavailable);
    }

    void setEnabledOptimisticThenConfirmed()
    {
        kcb::PluginNegotiator n;
        n.reconcile("phone-123", report({{PluginKind::Sms, false}}), true);

        QCOMPARE(n.beginSetEnabled("phone-123", PluginKind::Sms, true, true), Decision::Proceed);
        QVERIFY(n.record("phone-123", PluginKind::Sms)->enabled);
        // Same target while in flight
        QCOMPARE(n.beginSetEnabled("phone-123", PluginKind::Sms, true, true), Decision::AlreadySet);

        QVERIFY(n.completeSetEnabled("phone-123", PluginKind::Sms, true));
        QCOMPARE(n.beginSetEnabled("phone-123", PluginKind::Sms, true, true), Decision::AlreadySet);
        QVERIFY(n.record("phone-123", PluginKind::Sms)->enabled);
    }

    void failedCallRollsBack()
    {
        kcb::PluginNegotiator n;
        n.reconcile("phone-123", report({{PluginKind::Sms, false}}), true);

        n.beginSetEnabled("phone-123", PluginKind::Sms, true, true);
        QVERIFY(n.completeSetEnabled("phone-123", PluginKind::Sms, false));
        QVERIFY(!n.record("phone-123", PluginKind::Sms)->enabled);
    }

    void daemonReportOverwritesOptimisticState()
    {
        kcb::PluginNegotiator n;
        n.reconcile("phone-123", report({{PluginKind::Sms, false}}), true);
        n.beginSetEnabled("phone-123", PluginKind::Sms, true, true);
        n.completeSetEnabled("phone-123", PluginKind::Sms, true);

        n.reconcile("phone-123", report({{PluginKind::Sms, false}}), true);
        QVERIFY(!n.record("phone-123", PluginKind::Sms)->enabled);
    }

    void markUnavailableKeepsRecords()
    {
        kcb::PluginNegotiator n;
        n.reconcile("phone-123", report({{PluginKind::Sms, true}, {PluginKind::Clipboard, true}}), true);

        QVERIFY(n.markUnavailable("phone-123"));
        const auto recs = n.records("phone-123");
        QCOMPARE(recs.size(), 2);
        for (const auto& r : recs) {
            QVERIFY(!r.available);
            QVERIFY(!r.enabled);
        }
    }

    void removeDeviceDropsRecords()
    {
        kcb::PluginNegotiator n;
        n.reconcile("phone-123", report({{PluginKind::Sms, true}}), true);
        QVERIFY(n.removeDevice("phone-123"));
        QVERIFY(n.records().isEmpty());
    }

    void reportFromDaemonIds()
    {
        QStringList unknown;
        auto r = kcb::CapabilityReport::fromDaemon(
            {"kdeconnect_sms", "kdeconnect_clipboard", "kdeconnect_ping"},
            {"kdeconnect_clipboard"}, &unknown);

        QCOMPARE(r.plugins.size(), 2);
        QCOMPARE(r.plugins.value(PluginKind::Sms), false);
        QCOMPARE(r.plugins.value(PluginKind::Clipboard), true);
        QCOMPARE(unknown, QStringList({"kdeconnect_ping"}));
    }

    void pluginKindNames()
    {
        QCOMPARE(kcb::allPluginKinds().size(), 10);
        for (PluginKind k : kcb::allPluginKinds()) {
            QCOMPARE(kcb::pluginKindFromName(kcb::pluginKindName(k)), k);
            QCOMPARE(kcb::pluginKindFromDaemonId(kcb::daemonPluginId(k)), k);
        }
        QCOMPARE(kcb::daemonPluginId(PluginKind::MediaControl), QString("kdeconnect_mprisremote"));
        QCOMPARE(kcb::pluginKindFromName("teleport"), PluginKind::Unknown);
    }
};

QTEST_MAIN(TestPluginNegotiator)
#include "test_plugin_negotiator.moc"
