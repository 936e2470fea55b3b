#pragma once

#include <QByteArray>
#include <QString>
#include <functional>
#include <optional>

namespace kcb {

/// The daemon's notification configuration file, shared with the daemon
/// and the user. Content is std::nullopt when the file does not exist.
class IDaemonConfigStore {
public:
    using Content = std::optional<QByteArray>;
    /// Receives the freshly read content and edits it in place.
    /// Returning false aborts without writing.
    using Mutation = std::function<bool(Content& content)>;

    virtual ~IDaemonConfigStore() = default;

    virtual QString location() const = 0;

    virtual bool read(Content& content) const = 0;

    /// Locks the file, re-reads it, applies the mutation and writes the
    /// result back (setting content to nullopt removes the file).
    /// Returns false on lock timeout, I/O failure or an aborted mutation.
    virtual bool transact(const Mutation& mutation) = 0;
};

} // namespace kcb
