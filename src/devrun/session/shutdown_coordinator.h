#pragma once

#include <QList>
#include <QString>
#include <QStringList>

#include <functional>

#include "devrun/devrun_export.h"

namespace devrun {

class SessionLock;

/**
 * 会话关闭协调器
 *
 * 组件按启动顺序 addStep()，关闭时逆序执行：应用 → sidecar → workflow engine，
 * 最后释放会话锁。某一步失败只记录为 ShutdownError 警告，不影响后续步骤。
 * 幂等：执行过的步骤会被移除，重复调用不会重复停止。
 */
class DEVRUN_API ShutdownCoordinator {
public:
    using StopFn = std::function<bool(QString& error)>;

    explicit ShutdownCoordinator(SessionLock* lock = nullptr);

    void setLock(SessionLock* lock) { m_lock = lock; }
    void addStep(const QString& name, StopFn stop);

    /// 逆序停止所有已登记进程，不释放锁；返回各步骤错误
    QStringList teardownProcesses();

    /// teardownProcesses() + 释放会话锁
    QStringList shutdown();

    bool hasPendingSteps() const { return !m_steps.isEmpty(); }
    bool isShutDown() const { return m_shutDown; }
    /// 实际执行过的步骤名，按执行顺序
    QStringList stopOrder() const { return m_stopOrder; }
    QStringList errors() const { return m_errors; }

private:
    struct Step {
        QString name;
        StopFn stop;
    };

    SessionLock* m_lock = nullptr;
    QList<Step> m_steps;
    QStringList m_stopOrder;
    QStringList m_errors;
    bool m_shutDown = false;
};

} // namespace devrun
