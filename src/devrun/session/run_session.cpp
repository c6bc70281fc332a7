#include "run_session.h"

#include <QLoggingCategory>

#include "devrun/core/cancellation_token.h"
#include "devrun/health/health_poller.h"
#include "devrun/supervisor/app_supervisor.h"
#include "devrun/supervisor/dependency_supervisor.h"
#include "devrun/testing/test_loop_controller.h"

namespace devrun {

Q_LOGGING_CATEGORY(lcSession, "devrun.session")

RunSession::RunSession(const OrchestratorConfig& config,
                       const Backends& backends,
                       CancellationToken* token,
                       QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_backends(backends)
    , m_token(token)
    , m_lock(config.lockPath()) {
    if (!m_backends.locator) {
        m_backends.locator = &PreflightChecker::locateOnPath;
    }
}

RunSession::~RunSession() {
    if (!m_coordinator.isShutDown()) {
        m_coordinator.shutdown();
    }
}

int RunSession::exec() {
    qCInfo(lcSession, "devrun %s in %s", qUtf8Printable(runModeName(m_config.mode)),
           qUtf8Printable(m_config.projectDir));

    PreflightChecker checker(m_config, m_backends.locator);
    m_preflight = checker.run();
    reportPreflight();

    bool resetRuntimeFirst = false;
    if (m_preflight.status == PreflightStatus::Degraded
        && (m_config.recoverMissingRuntimeConfig || m_preflight.onlyIncompleteReset())) {
        qCWarning(lcSession, "sidecar runtime not initialized, it will be reset before start");
        resetRuntimeFirst = true;
    } else if (!m_preflight.isReady()) {
        return finish(Failure::make(FailureKind::EnvironmentBlocker, QStringLiteral("preflight"),
                                    m_preflight.summary()));
    }

    QString error;
    if (!m_lock.acquire(error)) {
        return finish(Failure::make(FailureKind::SessionBusy, QStringLiteral("session"), error));
    }
    m_coordinator.setLock(&m_lock);

    if (m_config.mode == RunMode::Run) {
        return execRun(resetRuntimeFirst);
    }
    return execTests(resetRuntimeFirst);
}

int RunSession::execRun(bool resetRuntimeFirst) {
    m_dependencies = std::make_unique<DependencySupervisor>(m_config, m_backends.processes,
                                                            m_backends.probe);
    DependencySupervisor* deps = m_dependencies.get();
    const int graceMs = m_config.graceMs;
    m_coordinator.addStep(QStringLiteral("workflow-engine"), [deps, graceMs](QString& error) {
        return deps->stopWorkflowEngine(graceMs, error);
    });
    m_coordinator.addStep(QStringLiteral("sidecar"), [deps, graceMs](QString& error) {
        return deps->stopSidecar(graceMs, error);
    });

    const DependencySupervisor::BringUpResult bringUp = deps->bringUp(m_token, resetRuntimeFirst);
    if (!bringUp.ready) {
        return finish(bringUp.failure);
    }
    qCInfo(lcSession, "dependencies ready: workflow engine :%d (UI :%d), sidecar :%d",
           m_config.ports.temporal, m_config.ports.temporalUi, m_config.ports.daprHttp);

    if (m_token && m_token->isCancelled()) {
        return finish(Failure::make(FailureKind::Cancelled, QStringLiteral("session"),
                                    QStringLiteral("cancelled before application start")));
    }

    m_app = std::make_unique<AppSupervisor>(m_config, m_backends.processes);
    AppSupervisor* app = m_app.get();
    m_coordinator.addStep(QStringLiteral("app"), [app, graceMs](QString& error) {
        return app->stop(graceMs, error);
    });
    connect(app, &AppSupervisor::instanceStarted, this, &RunSession::pollAppHealth);
    connect(app, &AppSupervisor::appExited, this, [this]() {
        if (m_appPoller) m_appPoller->cancel();
    });

    QString error;
    if (!app->start(m_config.hotReload, error)) {
        return finish(Failure::make(FailureKind::AppCrash, QStringLiteral("app"), error,
                                    app->outcome().logTail));
    }
    qCInfo(lcSession, "application started%s, press Ctrl+C to stop",
           m_config.hotReload ? " with hot reload" : "");

    const AppSupervisor::Outcome outcome = app->waitForTermination(m_token);
    if (outcome.cancelled) {
        // 应用已在运行，用户中断属于正常结束
        return finish(Failure());
    }
    return finish(outcome.failure());
}

int RunSession::execTests(bool resetRuntimeFirst) {
    m_tests = std::make_unique<TestLoopController>(m_config, m_backends.processes,
                                                   m_backends.probe, &m_coordinator);
    m_testReport = m_tests->run(m_token, resetRuntimeFirst);

    QString error;
    if (!m_testReport.writeToFile(m_config.reportPath(), error)) {
        qCWarning(lcSession, "%s", qUtf8Printable(error));
    } else {
        qCInfo(lcSession, "test report written to %s", qUtf8Printable(m_config.reportPath()));
    }

    Failure failure = m_testReport.infrastructure;
    if (failure.isNone() && m_testReport.hasTestFailure()) {
        failure = Failure::make(FailureKind::TestFailure, QStringLiteral("tests"),
                                m_testReport.summary());
    }
    finish(failure);
    return m_testReport.exitCode;
}

int RunSession::finish(const Failure& failure) {
    m_failure = failure;
    if (m_appPoller) {
        m_appPoller->cancel();
    }

    switch (failure.kind) {
    case FailureKind::None:
        break;
    case FailureKind::Cancelled:
        qCInfo(lcSession, "%s", qUtf8Printable(failure.describe()));
        break;
    default:
        qCCritical(lcSession, "%s", qUtf8Printable(failure.describe()));
        for (const QString& line : failure.logTail) {
            qCCritical(lcSession, "  | %s", qUtf8Printable(line));
        }
        break;
    }

    m_shutdownErrors = m_coordinator.shutdown();
    return exitCodeFor(failure.kind);
}

void RunSession::pollAppHealth() {
    if (m_appPoller) {
        m_appPoller->cancel();
        m_appPoller.release()->deleteLater();
    }
    m_appPoller = std::make_unique<HealthPoller>(
        m_backends.probe, HealthTarget{QStringLiteral("app"), m_config.appHealthUrl()},
        m_config.appHealth);
    connect(m_appPoller.get(), &HealthPoller::finished, this,
            [this](const HealthCheckResult& result) {
                if (result.cancelled) {
                    return;
                }
                if (result.success) {
                    if (m_app && m_app->current()) {
                        m_app->current()->markHealthy();
                    }
                    qCInfo(lcSession, "application ready at %s",
                           qUtf8Printable(m_config.appHealthUrl().toString()));
                } else {
                    qCWarning(lcSession, "application not healthy after %lld ms: %s",
                              result.elapsedMs, qUtf8Printable(result.error));
                }
            });
    m_appPoller->start();
}

void RunSession::reportPreflight() const {
    if (m_preflight.isReady()) {
        qCDebug(lcSession, "preflight ok");
        return;
    }
    for (const EnvironmentBlocker& blocker : m_preflight.blockers) {
        qCWarning(lcSession, "%s", qUtf8Printable(blocker.describe()));
        if (!blocker.hint.isEmpty()) {
            qCWarning(lcSession, "  hint: %s", qUtf8Printable(blocker.hint));
        }
    }
}

} // namespace devrun
