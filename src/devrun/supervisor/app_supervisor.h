#pragma once

#include <QObject>
#include <QString>
#include <QStringList>

#include <memory>

#include "devrun/devrun_export.h"
#include "devrun/config/orchestrator_config.h"
#include "devrun/core/failure.h"
#include "devrun/process/process_handle.h"

namespace devrun {

class CancellationToken;
class RestartDebouncer;
class SourceWatcher;

/**
 * 应用进程监督者
 *
 * 前台运行应用，输出实时转发到终端。热重载时源码变更经防抖后触发
 * 重启周期：SIGTERM → 宽限期 → SIGKILL → 旧实例退出后才启动新实例。
 * 重启周期严格串行，周期内的新请求最多合并为一个待执行重启，
 * 因此任意时刻最多只有一个应用实例在运行。
 *
 * 重启周期之外的退出：非零退出码或崩溃为 AppCrash，退出码 0 为正常结束。
 */
class DEVRUN_API AppSupervisor : public QObject {
    Q_OBJECT
public:
    struct Outcome {
        bool cancelled = false;
        bool crashed = false;    // 崩溃或非零退出
        int exitCode = 0;
        QString reason;
        QStringList logTail;

        Failure failure() const;
    };

    AppSupervisor(const OrchestratorConfig& config,
                  ProcessFactory* processes,
                  QObject* parent = nullptr);
    ~AppSupervisor() override;

    bool start(bool hotReload, QString& error);

    /// 阻塞直到应用在重启周期之外退出，或令牌被取消
    Outcome waitForTermination(const CancellationToken* token);

    void requestRestart(const QStringList& changedPaths = {});

    /// 停止监视并停止当前实例；幂等
    bool stop(int graceMs, QString& error);

    ProcessHandle* current() const { return m_current.get(); }
    bool hasTerminated() const { return m_terminated; }
    /// 仅在 hasTerminated() 后有意义
    const Outcome& outcome() const { return m_outcome; }
    bool isRestarting() const { return m_restarting; }
    bool hasPendingRestart() const { return m_pendingRestart; }
    int restartCount() const { return m_restartCount; }
    int instanceCount() const { return m_instanceCount; }
    RestartDebouncer* debouncer() const { return m_debouncer; }
    SourceWatcher* watcher() const { return m_watcher; }

    static constexpr int kDiagnosticTailLines = 40;

signals:
    void instanceStarted(int instance);
    void restartCompleted(int restartCount);
    void appExited(int exitCode, bool crashed);

private:
    void launch();
    void beginRestart();
    void onInstanceExited(ProcessHandle* handle, int exitCode, bool crashed, bool expected);

    const OrchestratorConfig& m_config;
    ProcessFactory* m_processes = nullptr;

    std::unique_ptr<ProcessHandle> m_current;
    RestartDebouncer* m_debouncer = nullptr;
    SourceWatcher* m_watcher = nullptr;

    bool m_started = false;
    bool m_stopping = false;
    bool m_restarting = false;
    bool m_pendingRestart = false;
    bool m_terminated = false;
    int m_restartCount = 0;
    int m_instanceCount = 0;
    Outcome m_outcome;
};

} // namespace devrun
