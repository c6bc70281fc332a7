#pragma once

#include <QObject>
#include <QStringList>

#include <memory>

#include "devrun/devrun_export.h"
#include "devrun/config/orchestrator_config.h"
#include "devrun/core/failure.h"
#include "devrun/health/health_probe.h"
#include "devrun/preflight/preflight_checker.h"
#include "devrun/process/managed_process.h"
#include "devrun/session/session_lock.h"
#include "devrun/session/shutdown_coordinator.h"
#include "devrun/testing/test_report.h"

namespace devrun {

class AppSupervisor;
class CancellationToken;
class DependencySupervisor;
class HealthPoller;
class TestLoopController;

/**
 * 一次 devrun 调用的会话
 *
 * 预检 → 获取项目锁 → run / test 流程 → ShutdownCoordinator 拆除。
 * 无论正常结束、中断还是启动失败，都经过同一个关闭路径。
 */
class DEVRUN_API RunSession : public QObject {
    Q_OBJECT
public:
    struct Backends {
        ProcessFactory* processes = nullptr;
        HealthProbe* probe = nullptr;
        PreflightChecker::ExecutableLocator locator;
    };

    RunSession(const OrchestratorConfig& config,
               const Backends& backends,
               CancellationToken* token,
               QObject* parent = nullptr);
    ~RunSession() override;

    /// 运行整个会话，返回进程退出码
    int exec();

    const Failure& failure() const { return m_failure; }
    const PreflightReport& preflight() const { return m_preflight; }
    const TestReport& testReport() const { return m_testReport; }
    QStringList shutdownErrors() const { return m_shutdownErrors; }

    SessionLock& lock() { return m_lock; }
    ShutdownCoordinator& coordinator() { return m_coordinator; }
    DependencySupervisor* dependencies() const { return m_dependencies.get(); }
    AppSupervisor* app() const { return m_app.get(); }
    TestLoopController* tests() const { return m_tests.get(); }

private:
    int execRun(bool resetRuntimeFirst);
    int execTests(bool resetRuntimeFirst);
    int finish(const Failure& failure);
    void pollAppHealth();
    void reportPreflight() const;

    const OrchestratorConfig& m_config;
    Backends m_backends;
    CancellationToken* m_token = nullptr;

    SessionLock m_lock;
    ShutdownCoordinator m_coordinator;
    PreflightReport m_preflight;
    Failure m_failure;
    TestReport m_testReport;
    QStringList m_shutdownErrors;

    std::unique_ptr<DependencySupervisor> m_dependencies;
    std::unique_ptr<AppSupervisor> m_app;
    std::unique_ptr<TestLoopController> m_tests;
    std::unique_ptr<HealthPoller> m_appPoller;
};

} // namespace devrun
