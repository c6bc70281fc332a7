#pragma once

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <memory>

#include "devrun/devrun_export.h"
#include "devrun/process/managed_process.h"

namespace devrun {

class CancellationToken;

enum class ProcessStatus {
    Starting,
    Running,
    Healthy,
    Failed,
    Stopped
};

DEVRUN_API QString processStatusName(ProcessStatus status);

/**
 * 一个受管 OS 进程的句柄
 * 只属于启动它的 supervisor，不共享。
 *
 * 状态迁移：Starting → Running → Healthy；进程退出后为 Stopped（主动停止
 * 或退出码 0）或 Failed（启动失败、崩溃、非零退出）。
 */
class DEVRUN_API ProcessHandle : public QObject {
    Q_OBJECT
public:
    enum class WaitResult { Done, TimedOut, Cancelled };

    ProcessHandle(std::unique_ptr<ManagedProcess> process,
                  const ProcessSpec& spec,
                  QObject* parent = nullptr);
    ~ProcessHandle() override;

    const QString& name() const { return m_spec.name; }
    const ProcessSpec& spec() const { return m_spec; }
    ProcessStatus status() const { return m_status; }
    QDateTime startedAt() const { return m_startedAt; }
    bool hasExited() const { return m_exited; }
    int lastExitCode() const { return m_lastExitCode; }
    bool crashed() const { return m_crashed; }
    bool stopRequested() const { return m_stopRequested; }
    QString failureReason() const { return m_failureReason; }
    QStringList outputTail(int maxLines = 40) const;

    /// Starting/Running/Healthy 且进程尚未退出
    bool isAlive() const;

    void start();
    void markHealthy();
    void markFailed(const QString& reason);

    /// 异步停止：SIGTERM，graceMs 后仍存活则 SIGKILL；退出时发射 exited(..., expected=true)
    void requestStop(int graceMs);

    /// 同步停止，供关闭流程使用；已退出或从未运行时直接返回 true
    bool stop(int graceMs, QString& error);

    WaitResult waitForStarted(int timeoutMs, const CancellationToken* token = nullptr);
    WaitResult waitForExit(int timeoutMs, const CancellationToken* token = nullptr);

    static constexpr int kKillWaitMs = 3000;

signals:
    void started();
    void startFailed(const QString& error);
    void exited(int exitCode, bool crashed, bool expected);
    void statusChanged(devrun::ProcessStatus status);

private:
    void setStatus(ProcessStatus status);
    void onStarted();
    void onFailedToStart(const QString& error);
    void onFinished(int exitCode, bool crashed);

    std::unique_ptr<ManagedProcess> m_process;
    ProcessSpec m_spec;
    ProcessStatus m_status = ProcessStatus::Starting;
    QDateTime m_startedAt;
    bool m_startCalled = false;
    bool m_running = false;
    bool m_exited = false;
    bool m_crashed = false;
    bool m_stopRequested = false;
    int m_lastExitCode = -1;
    QString m_failureReason;
    QTimer m_killTimer;
};

} // namespace devrun
