#pragma once

#include <QLockFile>
#include <QString>

#include "devrun/devrun_export.h"

namespace devrun {

/**
 * 每个项目目录同一时刻只允许一个会话
 * 基于 QLockFile；持有者进程已不存在时锁文件会被自动清理。
 */
class DEVRUN_API SessionLock {
public:
    explicit SessionLock(const QString& lockPath);
    ~SessionLock();

    SessionLock(const SessionLock&) = delete;
    SessionLock& operator=(const SessionLock&) = delete;

    bool acquire(QString& error);
    void release();

    bool isLocked() const { return m_locked; }
    QString path() const { return m_path; }

private:
    QString m_path;
    QLockFile m_lock;
    bool m_locked = false;
};

} // namespace devrun
