#pragma once

#include <QObject>

#include <memory>

#include "devrun/devrun_export.h"
#include "devrun/config/orchestrator_config.h"
#include "devrun/health/health_probe.h"
#include "devrun/process/managed_process.h"
#include "devrun/testing/test_report.h"

namespace devrun {

class AppSupervisor;
class CancellationToken;
class DependencySupervisor;
class ShutdownCoordinator;

/**
 * 测试循环控制器
 *
 * - unit：直接运行单元测试命令，不启动依赖
 * - e2e：依赖 Ready → 启动应用（关闭热重载）→ 应用健康 → 运行 e2e 命令，
 *   结束后无论结果如何都拆除应用与依赖
 * - all：unit 后 e2e；unit 失败不跳过 e2e
 *
 * 进程停止步骤登记到 ShutdownCoordinator，中断时由会话统一拆除。
 */
class DEVRUN_API TestLoopController : public QObject {
    Q_OBJECT
public:
    TestLoopController(const OrchestratorConfig& config,
                       ProcessFactory* processes,
                       HealthProbe* probe,
                       ShutdownCoordinator* coordinator,
                       QObject* parent = nullptr);
    ~TestLoopController() override;

    /// @param resetRuntimeFirst 透传给依赖启动（运行时配置缺失且允许恢复时）
    TestReport run(const CancellationToken* token, bool resetRuntimeFirst = false);

    /// 生成测试命令：追加 -x / -v，coverage 时包装为 coverage run -m
    CommandSpec testCommand(const CommandSpec& base, bool appendCoverage) const;

    DependencySupervisor* dependencies() const { return m_dependencies.get(); }
    AppSupervisor* app() const { return m_app.get(); }

    /// pytest 退出码 5：没有收集到用例
    static constexpr int kPytestNoTestsCollected = 5;
    static constexpr int kPytestTestsFailed = 1;

private:
    PhaseReport runUnit(const CancellationToken* token, Failure& infrastructure);
    PhaseReport runE2e(const CancellationToken* token, bool resetRuntimeFirst, Failure& infrastructure);
    PhaseReport runTestCommand(const QString& phase, const CommandSpec& command,
                               const CancellationToken* token, Failure& infrastructure);
    void runCoverageReport(const CancellationToken* token);
    void teardown();

    const OrchestratorConfig& m_config;
    ProcessFactory* m_processes = nullptr;
    HealthProbe* m_probe = nullptr;
    ShutdownCoordinator* m_coordinator = nullptr;

    std::unique_ptr<DependencySupervisor> m_dependencies;
    std::unique_ptr<AppSupervisor> m_app;
    bool m_coverageStarted = false;
};

} // namespace devrun
