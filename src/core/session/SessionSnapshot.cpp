#include "core/session/SessionSnapshot.hpp"
#include <QJsonArray>

namespace kcb {

namespace {

QString isoTime(const QDateTime& t)
{
    return t.isValid() ? t.toString(Qt::ISODateWithMs) : QString();
}

QDateTime parseTime(const QJsonValue& v)
{
    const QString s = v.toString();
    return s.isEmpty() ? QDateTime() : QDateTime::fromString(s, Qt::ISODateWithMs);
}

QJsonObject deviceToJson(const Device& d)
{
    QJsonObject obj;
    obj["id"] = d.id;
    obj["name"] = d.name;
    obj["type"] = deviceTypeName(d.type);
    obj["reachable"] = d.isReachable();
    obj["pair_state"] = pairStateName(d.pairState);
    obj["last_seen"] = isoTime(d.lastSeen);
    if (d.battery) {
        QJsonObject battery;
        battery["charge"] = d.battery->charge;
        battery["charging"] = d.battery->charging;
        obj["battery"] = battery;
    }
    if (d.connectivity) {
        QJsonObject connectivity;
        connectivity["strength"] = d.connectivity->strength;
        connectivity["network_type"] = d.connectivity->networkType;
        obj["connectivity"] = connectivity;
    }
    return obj;
}

Device deviceFromJson(const QJsonObject& obj)
{
    Device d;
    d.id = obj["id"].toString();
    d.name = obj["name"].toString();
    d.type = deviceTypeFromName(obj["type"].toString());
    d.reachability = obj["reachable"].toBool() ? Reachability::Reachable : Reachability::Unreachable;
    d.pairState = pairStateFromName(obj["pair_state"].toString());
    d.lastSeen = parseTime(obj["last_seen"]);
    if (obj["battery"].isObject()) {
        const QJsonObject battery = obj["battery"].toObject();
        d.battery = BatteryStatus();
        d.battery->charge = battery["charge"].toInt(-1);
        d.battery->charging = battery["charging"].toBool();
    }
    if (obj["connectivity"].isObject()) {
        const QJsonObject connectivity = obj["connectivity"].toObject();
        d.connectivity = ConnectivityStatus();
        d.connectivity->strength = connectivity["strength"].toInt(-1);
        d.connectivity->networkType = connectivity["network_type"].toString();
    }
    return d;
}

} // namespace

std::optional<Device> SessionSnapshot::device(const QString& deviceId) const
{
    for (const auto& d : devices) {
        if (d.id == deviceId)
            return d;
    }
    return std::nullopt;
}

std::optional<PluginRecord> SessionSnapshot::plugin(const QString& deviceId, PluginKind kind) const
{
    for (const auto& p : plugins) {
        if (p.deviceId == deviceId && p.kind == kind)
            return p;
    }
    return std::nullopt;
}

QJsonObject SessionSnapshot::toJson() const
{
    QJsonArray devs;
    for (const auto& d : devices)
        devs.append(deviceToJson(d));

    QJsonArray pairing;
    for (const auto& s : pairingSessions) {
        QJsonObject obj;
        obj["device"] = s.deviceId;
        obj["state"] = pairStateName(s.state);
        obj["token"] = static_cast<qint64>(s.token);
        obj["deadline"] = isoTime(s.deadline);
        pairing.append(obj);
    }

    QJsonArray plugs;
    for (const auto& p : plugins) {
        QJsonObject obj;
        obj["device"] = p.deviceId;
        obj["kind"] = pluginKindName(p.kind);
        obj["available"] = p.available;
        obj["enabled"] = p.enabled;
        obj["last_sync"] = isoTime(p.lastSync);
        plugs.append(obj);
    }

    QJsonArray rules;
    for (const auto& r : suppressionRules) {
        QJsonArray classes;
        for (EventClass c : r.redirected)
            classes.append(eventClassName(c));
        QJsonObject obj;
        obj["device"] = r.deviceId;
        obj["daemon_suppressed"] = r.daemonSuppressed;
        obj["redirected"] = classes;
        rules.append(obj);
    }

    QJsonObject obj;
    obj["sequence"] = static_cast<qint64>(sequence);
    obj["daemon_available"] = daemonAvailable;
    obj["devices"] = devs;
    obj["pairing"] = pairing;
    obj["plugins"] = plugs;
    obj["suppression"] = rules;
    return obj;
}

std::optional<SessionSnapshot> SessionSnapshot::fromJson(const QJsonObject& obj)
{
    if (!obj.contains("sequence") || !obj["devices"].isArray())
        return std::nullopt;

    SessionSnapshot snap;
    snap.sequence = static_cast<quint64>(obj["sequence"].toInteger());
    snap.daemonAvailable = obj["daemon_available"].toBool();

    for (const auto& v : obj["devices"].toArray())
        snap.devices.append(deviceFromJson(v.toObject()));

    for (const auto& v : obj["pairing"].toArray()) {
        const QJsonObject o = v.toObject();
        PairingSession s;
        s.deviceId = o["device"].toString();
        s.state = pairStateFromName(o["state"].toString());
        s.token = static_cast<quint64>(o["token"].toInteger());
        s.deadline = parseTime(o["deadline"]);
        snap.pairingSessions.append(s);
    }

    for (const auto& v : obj["plugins"].toArray()) {
        const QJsonObject o = v.toObject();
        PluginRecord p;
        p.deviceId = o["device"].toString();
        p.kind = pluginKindFromName(o["kind"].toString());
        if (p.kind == PluginKind::Unknown)
            continue;
        p.available = o["available"].toBool();
        p.enabled = o["enabled"].toBool();
        p.lastSync = parseTime(o["last_sync"]);
        snap.plugins.append(p);
    }

    for (const auto& v : obj["suppression"].toArray()) {
        const QJsonObject o = v.toObject();
        SuppressionRule r;
        r.deviceId = o["device"].toString();
        r.daemonSuppressed = o["daemon_suppressed"].toBool();
        for (const auto& c : o["redirected"].toArray()) {
            if (auto cls = eventClassFromName(c.toString()))
                r.redirected.append(*cls);
        }
        snap.suppressionRules.append(r);
    }

    return snap;
}

bool SnapshotTracker::accept(quint64 sequence)
{
    if (sequence <= latest_)
        return false;
    latest_ = sequence;
    return true;
}

} // namespace kcb
