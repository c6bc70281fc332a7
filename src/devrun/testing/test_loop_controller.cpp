#include "test_loop_controller.h"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QFileInfo>
#include <QLoggingCategory>

#include "devrun/core/cancellation_token.h"
#include "devrun/health/health_gate.h"
#include "devrun/process/process_handle.h"
#include "devrun/session/shutdown_coordinator.h"
#include "devrun/supervisor/app_supervisor.h"
#include "devrun/supervisor/dependency_supervisor.h"

namespace devrun {

Q_LOGGING_CATEGORY(lcTests, "devrun.tests")

namespace {

constexpr int kExcerptSourceLines = 200;
constexpr int kCoverageReportTimeoutMs = 60000;

Failure cancelledFailure(const CancellationToken* token, const QString& origin) {
    const QString reason = token ? token->reason() : QString();
    return Failure::make(FailureKind::Cancelled, origin,
                         reason.isEmpty() ? QStringLiteral("cancelled")
                                          : QStringLiteral("cancelled by %1").arg(reason));
}

} // namespace

TestLoopController::TestLoopController(const OrchestratorConfig& config,
                                       ProcessFactory* processes,
                                       HealthProbe* probe,
                                       ShutdownCoordinator* coordinator,
                                       QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_processes(processes)
    , m_probe(probe)
    , m_coordinator(coordinator) {
}

TestLoopController::~TestLoopController() = default;

TestReport TestLoopController::run(const CancellationToken* token, bool resetRuntimeFirst) {
    TestReport report;
    report.mode = m_config.mode;
    report.startedAt = QDateTime::currentDateTimeUtc();

    switch (m_config.mode) {
    case RunMode::TestUnit:
        report.unit = runUnit(token, report.infrastructure);
        break;
    case RunMode::TestE2e:
        report.e2e = runE2e(token, resetRuntimeFirst, report.infrastructure);
        break;
    case RunMode::TestAll:
        report.unit = runUnit(token, report.infrastructure);
        // unit 失败不跳过 e2e，只有中断才跳过
        if (report.infrastructure.isNone()) {
            report.e2e = runE2e(token, resetRuntimeFirst, report.infrastructure);
        }
        break;
    case RunMode::Run:
        report.infrastructure = Failure::make(FailureKind::ConfigError, QStringLiteral("tests"),
                                              QStringLiteral("run mode has no test phases"));
        break;
    }

    if (m_config.coverage && m_coverageStarted
        && report.infrastructure.kind != FailureKind::Cancelled) {
        runCoverageReport(token);
    }

    report.finalize();
    qCInfo(lcTests, "%s", qUtf8Printable(report.summary()));
    return report;
}

CommandSpec TestLoopController::testCommand(const CommandSpec& base, bool appendCoverage) const {
    CommandSpec command = base;

    int pytestIndex = -1;
    const bool programIsPytest = QFileInfo(command.program).fileName() == QLatin1String("pytest");
    if (!programIsPytest) {
        pytestIndex = command.args.indexOf(QStringLiteral("pytest"));
    }
    if (!programIsPytest && pytestIndex < 0) {
        if (m_config.coverage || m_config.failFast || m_config.verbose) {
            qCWarning(lcTests, "'%s' does not invoke pytest, test options not applied",
                      qUtf8Printable(base.program));
        }
        return command;
    }

    if (m_config.coverage) {
        QStringList wrapper{QStringLiteral("run")};
        if (appendCoverage) {
            wrapper << QStringLiteral("--append");
        }
        wrapper << QStringLiteral("-m");
        if (programIsPytest) {
            // pytest ... → coverage run -m pytest ...
            command.args = wrapper + QStringList{QStringLiteral("pytest")} + command.args;
            command.program = QStringLiteral("coverage");
        } else {
            // uv run pytest ... → uv run coverage run -m pytest ...
            // python -m pytest ... → python -m coverage run -m pytest ...
            wrapper.prepend(QStringLiteral("coverage"));
            for (int i = 0; i < wrapper.size(); ++i) {
                command.args.insert(pytestIndex + i, wrapper.at(i));
            }
        }
    }
    if (m_config.failFast) {
        command.args << QStringLiteral("-x");
    }
    if (m_config.verbose) {
        command.args << QStringLiteral("-v");
    }
    return command;
}

PhaseReport TestLoopController::runUnit(const CancellationToken* token, Failure& infrastructure) {
    qCInfo(lcTests, "running unit tests");
    return runTestCommand(QStringLiteral("unit"), testCommand(m_config.unitTests, false),
                          token, infrastructure);
}

PhaseReport TestLoopController::runE2e(const CancellationToken* token,
                                       bool resetRuntimeFirst,
                                       Failure& infrastructure) {
    PhaseReport report;
    report.name = QStringLiteral("e2e");
    auto phaseError = [&](const Failure& failure) {
        report.outcome = PhaseOutcome::Error;
        report.failure = failure;
        infrastructure = failure;
        teardown();
        return report;
    };

    qCInfo(lcTests, "starting dependencies for e2e tests");
    m_dependencies = std::make_unique<DependencySupervisor>(m_config, m_processes, m_probe);
    DependencySupervisor* deps = m_dependencies.get();
    const int graceMs = m_config.graceMs;
    m_coordinator->addStep(QStringLiteral("workflow-engine"), [deps, graceMs](QString& error) {
        return deps->stopWorkflowEngine(graceMs, error);
    });
    m_coordinator->addStep(QStringLiteral("sidecar"), [deps, graceMs](QString& error) {
        return deps->stopSidecar(graceMs, error);
    });

    const DependencySupervisor::BringUpResult bringUp = deps->bringUp(token, resetRuntimeFirst);
    if (!bringUp.ready) {
        return phaseError(bringUp.failure);
    }

    m_app = std::make_unique<AppSupervisor>(m_config, m_processes);
    AppSupervisor* app = m_app.get();
    m_coordinator->addStep(QStringLiteral("app"), [app, graceMs](QString& error) {
        return app->stop(graceMs, error);
    });

    QString error;
    if (!app->start(/*hotReload=*/false, error)) {
        return phaseError(Failure::make(FailureKind::AppCrash, QStringLiteral("app"), error,
                                        app->outcome().logTail));
    }

    qCInfo(lcTests, "waiting for application at %s",
           qUtf8Printable(m_config.appHealthUrl().toString()));
    HealthGate gate(m_probe);
    const HealthCheckResult health = gate.waitUntilHealthy(
        HealthTarget{QStringLiteral("app"), m_config.appHealthUrl()},
        m_config.appHealth, token,
        [app]() { return app->hasTerminated() ? app->outcome().reason : QString(); });

    if (!health.success) {
        if (health.cancelled || (token && token->isCancelled())) {
            return phaseError(cancelledFailure(token, QStringLiteral("app")));
        }
        if (app->hasTerminated()) {
            return phaseError(Failure::make(
                FailureKind::AppCrash, QStringLiteral("app"),
                QStringLiteral("application exited before becoming healthy: %1")
                    .arg(app->outcome().reason),
                app->outcome().logTail));
        }
        return phaseError(Failure::make(
            FailureKind::HealthTimeout, QStringLiteral("app"),
            QStringLiteral("application not healthy after %1 ms (%2 attempts): %3")
                .arg(health.elapsedMs)
                .arg(health.attempts)
                .arg(health.error),
            app->current()->outputTail(AppSupervisor::kDiagnosticTailLines)));
    }
    app->current()->markHealthy();
    qCInfo(lcTests, "application healthy after %lld ms, running e2e tests", health.elapsedMs);

    report = runTestCommand(QStringLiteral("e2e"), testCommand(m_config.e2eTests, m_coverageStarted),
                            token, infrastructure);
    if (infrastructure.isNone() && app->hasTerminated()) {
        // 用例结束时应用已经退出：用例结果不可信
        return phaseError(Failure::make(
            FailureKind::AppCrash, QStringLiteral("app"),
            QStringLiteral("application exited during e2e tests: %1").arg(app->outcome().reason),
            app->outcome().logTail));
    }
    teardown();
    return report;
}

PhaseReport TestLoopController::runTestCommand(const QString& phase,
                                               const CommandSpec& command,
                                               const CancellationToken* token,
                                               Failure& infrastructure) {
    const ProcessSpec spec = m_config.processSpec(phase + QStringLiteral("-tests"), command,
                                                  /*forwardOutput=*/true);
    PhaseReport report;
    report.name = phase;
    report.command = spec.displayCommand();

    if (token && token->isCancelled()) {
        report.outcome = PhaseOutcome::Error;
        report.failure = cancelledFailure(token, phase);
        infrastructure = report.failure;
        return report;
    }

    QElapsedTimer clock;
    clock.start();
    ProcessHandle handle(m_processes->create(spec), spec);
    AppSupervisor* app = m_app.get();

    QEventLoop loop;
    connect(&handle, &ProcessHandle::exited, &loop, &QEventLoop::quit);
    if (token) {
        connect(token, &CancellationToken::cancelled, &loop, &QEventLoop::quit);
    }
    if (app) {
        connect(app, &AppSupervisor::appExited, &loop, &QEventLoop::quit);
    }

    handle.start();
    if (m_config.coverage && !handle.hasExited()) {
        m_coverageStarted = true;
    }
    auto interrupted = [&]() {
        return (token && token->isCancelled()) || (app && app->hasTerminated());
    };
    if (!handle.hasExited() && !interrupted()) {
        loop.exec();
    }
    report.durationMs = clock.elapsed();

    if (!handle.hasExited()) {
        QString stopError;
        if (!handle.stop(m_config.graceMs, stopError)) {
            qCWarning(lcTests, "%s", qUtf8Printable(stopError));
        }
        report.exitCode = handle.lastExitCode();
        report.outcome = PhaseOutcome::Error;
        if (token && token->isCancelled()) {
            report.failure = cancelledFailure(token, phase);
        } else {
            report.failure = Failure::make(
                FailureKind::AppCrash, QStringLiteral("app"),
                QStringLiteral("application exited during %1 tests: %2").arg(phase, app->outcome().reason),
                app->outcome().logTail);
        }
        infrastructure = report.failure;
        return report;
    }

    report.exitCode = handle.lastExitCode();
    const bool failedToStart = handle.crashed() && handle.lastExitCode() < 0
                               && handle.failureReason().startsWith(QLatin1String("failed to start"));
    if (failedToStart) {
        report.outcome = PhaseOutcome::Error;
        report.failureExcerpt = QStringList{handle.failureReason()};
    } else if (!handle.crashed() && report.exitCode == 0) {
        report.outcome = PhaseOutcome::Passed;
    } else if (!handle.crashed() && report.exitCode == kPytestNoTestsCollected) {
        qCWarning(lcTests, "%s: no tests collected", qUtf8Printable(phase));
        report.outcome = PhaseOutcome::Passed;
    } else if (!handle.crashed() && report.exitCode == kPytestTestsFailed) {
        report.outcome = PhaseOutcome::Failed;
    } else {
        report.outcome = PhaseOutcome::Error;
    }

    if (report.outcome != PhaseOutcome::Passed && !failedToStart) {
        report.failureExcerpt =
            TestReport::extractFailureExcerpt(handle.outputTail(kExcerptSourceLines));
    }
    qCInfo(lcTests, "%s tests %s (exit %d, %lld ms)", qUtf8Printable(phase),
           qUtf8Printable(phaseOutcomeName(report.outcome)), report.exitCode, report.durationMs);
    return report;
}

void TestLoopController::runCoverageReport(const CancellationToken* token) {
    const ProcessSpec spec = m_config.processSpec(QStringLiteral("coverage-report"),
                                                  m_config.coverageReport,
                                                  /*forwardOutput=*/true);
    ProcessHandle handle(m_processes->create(spec), spec);
    handle.start();
    const ProcessHandle::WaitResult wait = handle.waitForExit(kCoverageReportTimeoutMs, token);
    if (wait != ProcessHandle::WaitResult::Done) {
        QString error;
        if (!handle.stop(m_config.graceMs, error)) {
            qCWarning(lcTests, "%s", qUtf8Printable(error));
        }
        qCWarning(lcTests, "coverage report did not complete");
        return;
    }
    if (handle.crashed() || handle.lastExitCode() != 0) {
        qCWarning(lcTests, "coverage report failed: %s", qUtf8Printable(handle.failureReason()));
    }
}

void TestLoopController::teardown() {
    const QStringList errors = m_coordinator->teardownProcesses();
    if (!errors.isEmpty()) {
        qCWarning(lcTests, "teardown finished with %lld warning(s)",
                  static_cast<long long>(errors.size()));
    }
}

} // namespace devrun
