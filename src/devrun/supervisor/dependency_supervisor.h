#pragma once

#include <QObject>
#include <QString>

#include <memory>

#include "devrun/devrun_export.h"
#include "devrun/config/orchestrator_config.h"
#include "devrun/core/failure.h"
#include "devrun/health/health_check_result.h"
#include "devrun/health/health_probe.h"
#include "devrun/process/process_handle.h"

namespace devrun {

class CancellationToken;

enum class DependencyState {
    NotStarted,
    Starting,
    AwaitingReady,
    Degraded,
    Recovering,
    Ready,
    Failed
};

DEVRUN_API QString dependencyStateName(DependencyState state);

/// 依赖集合：恰好两个进程句柄，两者都 Healthy 时才算 Ready
struct DEVRUN_API DependencySet {
    std::unique_ptr<ProcessHandle> workflowEngine;
    std::unique_ptr<ProcessHandle> sidecar;

    bool isReady() const;
};

/**
 * 依赖监督者：workflow engine + sidecar runtime 作为一个整体启动、探活、停止
 *
 * NotStarted → Starting → AwaitingReady → Ready
 *                              ↓
 *                          Degraded → Recovering → Ready | Failed
 *
 * sidecar 探活失败（进程存活但不就绪，或在启动期间退出）时进入 Degraded，
 * 每个会话最多恢复一次：停止 sidecar → 重置本地运行时 → 重启 → 重新探活。
 * workflow engine 失败不做恢复，直接 Failed。
 * 停止由 ShutdownCoordinator 负责，bringUp 失败时不会自行清理。
 */
class DEVRUN_API DependencySupervisor : public QObject {
    Q_OBJECT
public:
    struct BringUpResult {
        bool ready = false;
        Failure failure;
    };

    DependencySupervisor(const OrchestratorConfig& config,
                         ProcessFactory* processes,
                         HealthProbe* probe,
                         QObject* parent = nullptr);
    ~DependencySupervisor() override;

    /// @param resetRuntimeFirst 运行时配置缺失时先重置，计入唯一一次恢复
    BringUpResult bringUp(const CancellationToken* token, bool resetRuntimeFirst = false);

    DependencyState state() const { return m_state; }
    bool isReady() const { return m_state == DependencyState::Ready && m_set.isReady(); }
    int recoveryAttempts() const { return m_recoveryAttempts; }

    const DependencySet& dependencySet() const { return m_set; }
    ProcessHandle* workflowEngine() const { return m_set.workflowEngine.get(); }
    ProcessHandle* sidecar() const { return m_set.sidecar.get(); }

    bool stopWorkflowEngine(int graceMs, QString& error);
    bool stopSidecar(int graceMs, QString& error);

    static constexpr int kMaxRecoveryAttempts = 1;
    static constexpr int kDiagnosticTailLines = 40;

signals:
    void stateChanged(devrun::DependencyState state);

private:
    struct ReadinessResult {
        HealthCheckResult workflow;
        HealthCheckResult sidecar;
        bool cancelled = false;
    };

    void setState(DependencyState state);
    std::unique_ptr<ProcessHandle> launch(const QString& name, const CommandSpec& command,
                                          bool appendLog = false);
    ReadinessResult awaitReadiness(bool pollWorkflow, const CancellationToken* token);
    BringUpResult recoverSidecar(const HealthCheckResult& firstFailure, const CancellationToken* token);
    bool resetRuntime(const CancellationToken* token, QString& error);
    void recordReset(bool ok, const QString& error);
    BringUpResult fail(const QString& origin, const QString& message, const QStringList& tail);
    BringUpResult cancelled(const CancellationToken* token);

    const OrchestratorConfig& m_config;
    ProcessFactory* m_processes = nullptr;
    HealthProbe* m_probe = nullptr;

    DependencySet m_set;
    DependencyState m_state = DependencyState::NotStarted;
    int m_recoveryAttempts = 0;
    // 恢复前的 sidecar 输出，用于失败诊断
    QStringList m_previousSidecarTail;
};

} // namespace devrun
