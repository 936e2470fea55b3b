#include "core/notify/KConfigDocument.hpp"

namespace kcb {

KConfigDocument KConfigDocument::parse(const QByteArray& bytes)
{
    KConfigDocument doc;
    if (bytes.isEmpty())
        return doc;

    QList<QByteArray> rawLines = bytes.split('\n');
    doc.trailingNewline_ = bytes.endsWith('\n');
    if (doc.trailingNewline_)
        rawLines.removeLast();

    QString currentGroup;
    for (const QByteArray& raw : rawLines) {
        Line line;
        line.raw = raw;
        const QString text = QString::fromUtf8(raw).trimmed();

        if (text.startsWith('[') && text.contains(']')) {
            line.kind = Line::Kind::Group;
            currentGroup = text.mid(1, text.lastIndexOf(']') - 1);
            line.group = currentGroup;
        } else if (!text.isEmpty() && !text.startsWith('#') && text.contains('=')) {
            const int eq = text.indexOf('=');
            line.kind = Line::Kind::Entry;
            line.group = currentGroup;
            line.key = text.left(eq).trimmed();
            line.value = text.mid(eq + 1).trimmed();
        }
        doc.lines_.append(line);
    }
    return doc;
}

int KConfigDocument::findEntry(const QString& group, const QString& key) const
{
    for (int i = 0; i < lines_.size(); ++i) {
        const Line& l = lines_.at(i);
        if (l.kind == Line::Kind::Entry && l.group == group && l.key == key)
            return i;
    }
    return -1;
}

int KConfigDocument::findHeader(const QString& group) const
{
    for (int i = 0; i < lines_.size(); ++i) {
        const Line& l = lines_.at(i);
        if (l.kind == Line::Kind::Group && l.group == group)
            return i;
    }
    return -1;
}

std::optional<QString> KConfigDocument::value(const QString& group, const QString& key) const
{
    const int i = findEntry(group, key);
    if (i < 0)
        return std::nullopt;
    return lines_.at(i).value;
}

bool KConfigDocument::hasGroup(const QString& group) const
{
    return findHeader(group) >= 0;
}

bool KConfigDocument::setValue(const QString& group, const QString& key, const QString& value)
{
    Line entry;
    entry.kind = Line::Kind::Entry;
    entry.group = group;
    entry.key = key;
    entry.value = value;
    entry.raw = (key + QLatin1Char('=') + value).toUtf8();

    const int existing = findEntry(group, key);
    if (existing >= 0) {
        if (lines_.at(existing).value == value)
            return false;
        lines_[existing] = entry;
        return true;
    }

    // The default group has no header and lives above the first one (header == -1)
    const int header = findHeader(group);
    if (header < 0 && !group.isEmpty()) {
        if (!lines_.isEmpty() && !lines_.last().raw.trimmed().isEmpty()) {
            Line blank;
            lines_.append(blank);
        }
        Line h;
        h.kind = Line::Kind::Group;
        h.group = group;
        h.raw = (QLatin1Char('[') + group + QLatin1Char(']')).toUtf8();
        lines_.append(h);
        lines_.append(entry);
        return true;
    }

    int insertAt = header + 1;
    for (int i = header + 1; i < lines_.size(); ++i) {
        if (lines_.at(i).kind == Line::Kind::Group)
            break;
        if (lines_.at(i).kind == Line::Kind::Entry)
            insertAt = i + 1;
    }
    lines_.insert(insertAt, entry);
    return true;
}

bool KConfigDocument::removeKey(const QString& group, const QString& key)
{
    const int i = findEntry(group, key);
    if (i < 0)
        return false;
    lines_.removeAt(i);
    return true;
}

bool KConfigDocument::removeGroupIfEmpty(const QString& group)
{
    const int header = findHeader(group);
    if (header < 0)
        return false;

    int end = header + 1;
    for (; end < lines_.size(); ++end) {
        const Line& l = lines_.at(end);
        if (l.kind == Line::Kind::Group)
            break;
        if (l.kind == Line::Kind::Entry || !l.raw.trimmed().isEmpty())
            return false;
    }

    const bool wasLast = end == lines_.size();
    lines_.erase(lines_.begin() + header, lines_.begin() + end);
    if (wasLast && !lines_.isEmpty() && lines_.last().raw.trimmed().isEmpty())
        lines_.removeLast();
    return true;
}

QByteArray KConfigDocument::toBytes() const
{
    QByteArray out;
    for (int i = 0; i < lines_.size(); ++i) {
        if (i > 0)
            out.append('\n');
        out.append(lines_.at(i).raw);
    }
    if (trailingNewline_ && !lines_.isEmpty())
        out.append('\n');
    return out;
}

} // namespace kcb
