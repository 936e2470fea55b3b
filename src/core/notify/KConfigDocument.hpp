#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <optional>

namespace kcb {

/// Minimal editor for KConfig-style INI files (kdeconnect.notifyrc).
///
/// Lines that are not touched are written back byte for byte, so a
/// document that is parsed and serialised without edits reproduces its
/// input exactly. Group headers are matched literally ("[Event/pairRequest]").
class KConfigDocument {
public:
    static KConfigDocument parse(const QByteArray& bytes);

    std::optional<QString> value(const QString& group, const QString& key) const;
    bool hasGroup(const QString& group) const;

    /// Returns true if the document changed.
    bool setValue(const QString& group, const QString& key, const QString& value);
    bool removeKey(const QString& group, const QString& key);
    bool removeGroupIfEmpty(const QString& group);

    QByteArray toBytes() const;

private:
    struct Line {
        enum class Kind { Other, Group, Entry };
        Kind kind = Kind::Other;
        QByteArray raw;   // without the line terminator
        QString group;    // owning group (for entries) or the header's group
        QString key;
        QString value;
    };

    int findEntry(const QString& group, const QString& key) const;
    int findHeader(const QString& group) const;

    QList<Line> lines_;
    bool trailingNewline_ = true;
};

} // namespace kcb
