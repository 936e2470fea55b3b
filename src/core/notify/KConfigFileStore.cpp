#include "core/notify/KConfigFileStore.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>
#include <QSaveFile>
#include <boost/log/trivial.hpp>

namespace kcb {

KConfigFileStore::KConfigFileStore(const QString& path, int lockTimeoutMs)
    : path_(path)
    , lockTimeoutMs_(lockTimeoutMs)
{
}

bool KConfigFileStore::read(Content& content) const
{
    QFile file(path_);
    if (!file.exists()) {
        content.reset();
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        BOOST_LOG_TRIVIAL(warning) << "Cannot read " << path_.toStdString()
                                   << ": " << file.errorString().toStdString();
        return false;
    }
    content = file.readAll();
    return true;
}

bool KConfigFileStore::transact(const Mutation& mutation)
{
    const QString dir = QFileInfo(path_).absolutePath();
    if (!QDir().mkpath(dir)) {
        BOOST_LOG_TRIVIAL(warning) << "Cannot create " << dir.toStdString();
        return false;
    }

    QLockFile lock(path_ + QStringLiteral(".lock"));
    if (!lock.tryLock(lockTimeoutMs_)) {
        BOOST_LOG_TRIVIAL(warning) << "Timed out locking " << path_.toStdString()
                                   << " (error " << static_cast<int>(lock.error()) << ")";
        return false;
    }

    Content current;
    if (!read(current))
        return false;

    Content next = current;
    if (!mutation(next))
        return false;
    if (next == current)
        return true;

    return write(next);
}

bool KConfigFileStore::write(const Content& content)
{
    if (!content) {
        if (QFile::exists(path_) && !QFile::remove(path_)) {
            BOOST_LOG_TRIVIAL(warning) << "Cannot remove " << path_.toStdString();
            return false;
        }
        BOOST_LOG_TRIVIAL(debug) << "Removed " << path_.toStdString();
        return true;
    }

    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly)) {
        BOOST_LOG_TRIVIAL(warning) << "Cannot write " << path_.toStdString()
                                   << ": " << file.errorString().toStdString();
        return false;
    }
    if (file.write(*content) != content->size()) {
        file.cancelWriting();
        BOOST_LOG_TRIVIAL(warning) << "Short write to " << path_.toStdString();
        return false;
    }
    if (!file.commit()) {
        BOOST_LOG_TRIVIAL(warning) << "Cannot commit " << path_.toStdString()
                                   << ": " << file.errorString().toStdString();
        return false;
    }
    BOOST_LOG_TRIVIAL(debug) << "Wrote " << content->size() << " bytes to " << path_.toStdString();
    return true;
}

} // namespace kcb
