#include "session_lock.h"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>

namespace devrun {

Q_LOGGING_CATEGORY(lcLock, "devrun.session")

SessionLock::SessionLock(const QString& lockPath)
    : m_path(lockPath)
    , m_lock(lockPath) {
    // 不按时间判定过期，只在持有者进程消失时回收
    m_lock.setStaleLockTime(0);
}

SessionLock::~SessionLock() {
    release();
}

bool SessionLock::acquire(QString& error) {
    error.clear();
    if (m_locked) {
        return true;
    }
    if (!QDir().mkpath(QFileInfo(m_path).absolutePath())) {
        error = QStringLiteral("cannot create state directory for %1").arg(m_path);
        return false;
    }

    if (m_lock.tryLock(0)) {
        m_locked = true;
        qCDebug(lcLock, "acquired %s", qUtf8Printable(m_path));
        return true;
    }

    switch (m_lock.error()) {
    case QLockFile::LockFailedError: {
        qint64 pid = 0;
        QString host;
        QString app;
        if (m_lock.getLockInfo(&pid, &host, &app)) {
            error = QStringLiteral("another session is active for this project (pid %1 on %2)")
                        .arg(pid)
                        .arg(host);
        } else {
            error = QStringLiteral("another session is active for this project");
        }
        break;
    }
    case QLockFile::PermissionError:
        error = QStringLiteral("permission denied creating lock file %1").arg(m_path);
        break;
    default:
        error = QStringLiteral("cannot create lock file %1").arg(m_path);
        break;
    }
    return false;
}

void SessionLock::release() {
    if (!m_locked) {
        return;
    }
    m_lock.unlock();
    m_locked = false;
    qCDebug(lcLock, "released %s", qUtf8Printable(m_path));
}

} // namespace devrun
