#include "dependency_supervisor.h"

#include <QEventLoop>
#include <QLoggingCategory>

#include "devrun/core/cancellation_token.h"
#include "devrun/health/health_poller.h"
#include "devrun/runtime/runtime_state.h"

namespace devrun {

Q_LOGGING_CATEGORY(lcDeps, "devrun.dependencies")

namespace {

const QString kWorkflowEngine = QStringLiteral("workflow-engine");
const QString kSidecar = QStringLiteral("sidecar");

QString exitReason(const ProcessHandle* handle) {
    if (!handle->failureReason().isEmpty()) {
        return handle->failureReason();
    }
    return QStringLiteral("exited with code %1").arg(handle->lastExitCode());
}

} // namespace

QString dependencyStateName(DependencyState state) {
    switch (state) {
    case DependencyState::NotStarted:    return QStringLiteral("not_started");
    case DependencyState::Starting:      return QStringLiteral("starting");
    case DependencyState::AwaitingReady: return QStringLiteral("awaiting_ready");
    case DependencyState::Degraded:      return QStringLiteral("degraded");
    case DependencyState::Recovering:    return QStringLiteral("recovering");
    case DependencyState::Ready:         return QStringLiteral("ready");
    case DependencyState::Failed:        return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

bool DependencySet::isReady() const {
    return workflowEngine && sidecar
           && workflowEngine->status() == ProcessStatus::Healthy
           && sidecar->status() == ProcessStatus::Healthy
           && workflowEngine->isAlive() && sidecar->isAlive();
}

DependencySupervisor::DependencySupervisor(const OrchestratorConfig& config,
                                           ProcessFactory* processes,
                                           HealthProbe* probe,
                                           QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_processes(processes)
    , m_probe(probe) {
}

DependencySupervisor::~DependencySupervisor() = default;

DependencySupervisor::BringUpResult DependencySupervisor::bringUp(const CancellationToken* token,
                                                                  bool resetRuntimeFirst) {
    if (m_state != DependencyState::NotStarted) {
        // 不改变当前状态
        return BringUpResult{false,
                             Failure::make(FailureKind::DependencyStartupFailure,
                                           QStringLiteral("dependencies"),
                                           QStringLiteral("bring-up already attempted in this session"))};
    }
    setState(DependencyState::Starting);
    if (token && token->isCancelled()) {
        return cancelled(token);
    }

    if (resetRuntimeFirst) {
        setState(DependencyState::Recovering);
        ++m_recoveryAttempts;
        QString error;
        if (!resetRuntime(token, error)) {
            if (token && token->isCancelled()) {
                return cancelled(token);
            }
            return fail(kSidecar, QStringLiteral("sidecar runtime reset failed: %1").arg(error), {});
        }
        setState(DependencyState::Starting);
    }

    m_set.workflowEngine = launch(kWorkflowEngine, m_config.workflowEngine);
    m_set.sidecar = launch(kSidecar, m_config.sidecar);

    setState(DependencyState::AwaitingReady);
    const ReadinessResult readiness = awaitReadiness(true, token);
    if (readiness.cancelled) {
        return cancelled(token);
    }

    if (!readiness.workflow.success) {
        m_set.workflowEngine->markFailed(readiness.workflow.error);
        return fail(kWorkflowEngine,
                    QStringLiteral("workflow engine not ready: %1").arg(readiness.workflow.error),
                    m_set.workflowEngine->outputTail(kDiagnosticTailLines));
    }
    m_set.workflowEngine->markHealthy();
    qCInfo(lcDeps, "workflow engine ready after %lld ms", readiness.workflow.elapsedMs);

    if (readiness.sidecar.success) {
        m_set.sidecar->markHealthy();
        qCInfo(lcDeps, "sidecar ready after %lld ms", readiness.sidecar.elapsedMs);
        setState(DependencyState::Ready);
        return BringUpResult{true, Failure()};
    }

    return recoverSidecar(readiness.sidecar, token);
}

bool DependencySupervisor::stopWorkflowEngine(int graceMs, QString& error) {
    error.clear();
    if (!m_set.workflowEngine) {
        return true;
    }
    return m_set.workflowEngine->stop(graceMs, error);
}

bool DependencySupervisor::stopSidecar(int graceMs, QString& error) {
    error.clear();
    if (!m_set.sidecar) {
        return true;
    }
    return m_set.sidecar->stop(graceMs, error);
}

void DependencySupervisor::setState(DependencyState state) {
    if (m_state == state) return;
    qCDebug(lcDeps, "dependencies: %s -> %s",
            qUtf8Printable(dependencyStateName(m_state)),
            qUtf8Printable(dependencyStateName(state)));
    m_state = state;
    emit stateChanged(state);
}

std::unique_ptr<ProcessHandle> DependencySupervisor::launch(const QString& name,
                                                            const CommandSpec& command,
                                                            bool appendLog) {
    ProcessSpec spec = m_config.processSpec(name, command);
    spec.appendLog = appendLog;
    auto handle = std::make_unique<ProcessHandle>(m_processes->create(spec), spec);
    handle->start();
    return handle;
}

DependencySupervisor::ReadinessResult DependencySupervisor::awaitReadiness(
    bool pollWorkflow, const CancellationToken* token) {
    ReadinessResult result;

    HealthPoller sidecarPoller(m_probe,
                               HealthTarget{kSidecar, m_config.sidecarHealthUrl()},
                               m_config.dependencyHealth);
    std::unique_ptr<HealthPoller> workflowPoller;
    if (pollWorkflow) {
        workflowPoller = std::make_unique<HealthPoller>(
            m_probe, HealthTarget{kWorkflowEngine, m_config.workflowHealthUrl()},
            m_config.dependencyHealth);
    }

    ProcessHandle* sidecar = m_set.sidecar.get();
    ProcessHandle* workflow = m_set.workflowEngine.get();

    QEventLoop loop;
    // 任一被轮询进程退出即中止它的轮询；workflow engine 在 sidecar 恢复期间
    // 退出时同样视为失败
    auto abortOnExit = [](ProcessHandle* handle, HealthPoller* poller) {
        return [handle, poller](int, bool, bool) {
            poller->abort(QStringLiteral("%1 %2").arg(handle->name(), exitReason(handle)));
        };
    };
    connect(sidecar, &ProcessHandle::exited, &sidecarPoller, abortOnExit(sidecar, &sidecarPoller));
    if (workflowPoller) {
        connect(workflow, &ProcessHandle::exited, workflowPoller.get(),
                abortOnExit(workflow, workflowPoller.get()));
    } else if (workflow) {
        connect(workflow, &ProcessHandle::exited, &sidecarPoller, [&sidecarPoller, workflow]() {
            sidecarPoller.abort(QStringLiteral("%1 %2").arg(workflow->name(), exitReason(workflow)));
        });
    }

    auto settled = [&]() {
        if (!sidecarPoller.isFinished()) {
            // workflow engine 失败不可恢复，无需等待 sidecar
            return workflowPoller && workflowPoller->isFinished()
                   && !workflowPoller->result().success;
        }
        return !workflowPoller || workflowPoller->isFinished();
    };
    auto maybeQuit = [&]() {
        if (settled()) loop.quit();
    };
    connect(&sidecarPoller, &HealthPoller::finished, &loop, maybeQuit);
    if (workflowPoller) {
        connect(workflowPoller.get(), &HealthPoller::finished, &loop, maybeQuit);
    }
    if (token) {
        connect(token, &CancellationToken::cancelled, &loop, [&]() {
            result.cancelled = true;
            sidecarPoller.cancel();
            if (workflowPoller) workflowPoller->cancel();
            loop.quit();
        });
    }

    // 启动前已退出（如可执行文件缺失，在 start() 中同步失败）
    sidecarPoller.start();
    if (!sidecar->isAlive()) {
        sidecarPoller.abort(QStringLiteral("%1 %2").arg(sidecar->name(), exitReason(sidecar)));
    }
    if (workflowPoller) {
        workflowPoller->start();
        if (!workflow->isAlive()) {
            workflowPoller->abort(QStringLiteral("%1 %2").arg(workflow->name(), exitReason(workflow)));
        }
    }

    if (!settled() && !(token && token->isCancelled())) {
        loop.exec();
    }
    if (token && token->isCancelled()) {
        result.cancelled = true;
        sidecarPoller.cancel();
        if (workflowPoller) workflowPoller->cancel();
    }

    result.sidecar = sidecarPoller.result();
    if (workflowPoller) {
        result.workflow = workflowPoller->result();
    } else {
        result.workflow.success = workflow && workflow->isAlive();
        if (!result.workflow.success && workflow) {
            result.workflow.error = QStringLiteral("%1 %2").arg(workflow->name(), exitReason(workflow));
        }
    }
    return result;
}

DependencySupervisor::BringUpResult DependencySupervisor::recoverSidecar(
    const HealthCheckResult& firstFailure, const CancellationToken* token) {
    setState(DependencyState::Degraded);
    qCWarning(lcDeps, "sidecar not ready: %s", qUtf8Printable(firstFailure.error));

    if (m_recoveryAttempts >= kMaxRecoveryAttempts) {
        m_set.sidecar->markFailed(firstFailure.error);
        return fail(kSidecar,
                    QStringLiteral("sidecar not ready after runtime recovery: %1").arg(firstFailure.error),
                    m_set.sidecar->outputTail(kDiagnosticTailLines));
    }

    setState(DependencyState::Recovering);
    ++m_recoveryAttempts;
    qCWarning(lcDeps, "attempting sidecar recovery (%d/%d)", m_recoveryAttempts,
              kMaxRecoveryAttempts);

    QString error;
    m_previousSidecarTail = m_set.sidecar->outputTail(kDiagnosticTailLines);
    if (!m_set.sidecar->stop(m_config.graceMs, error)) {
        m_set.sidecar->markFailed(error);
        return fail(kSidecar, QStringLiteral("could not stop sidecar for recovery: %1").arg(error),
                    m_previousSidecarTail);
    }

    if (!resetRuntime(token, error)) {
        if (token && token->isCancelled()) {
            return cancelled(token);
        }
        m_set.sidecar->markFailed(error);
        return fail(kSidecar, QStringLiteral("sidecar runtime reset failed: %1").arg(error),
                    m_previousSidecarTail);
    }
    if (token && token->isCancelled()) {
        return cancelled(token);
    }

    // 追加写日志，保留恢复前的输出
    m_set.sidecar = launch(kSidecar, m_config.sidecar, true);
    const ReadinessResult readiness = awaitReadiness(false, token);
    if (readiness.cancelled) {
        return cancelled(token);
    }
    if (!readiness.workflow.success) {
        m_set.workflowEngine->markFailed(readiness.workflow.error);
        return fail(kWorkflowEngine,
                    QStringLiteral("workflow engine exited during sidecar recovery: %1")
                        .arg(readiness.workflow.error),
                    m_set.workflowEngine->outputTail(kDiagnosticTailLines));
    }
    if (!readiness.sidecar.success) {
        m_set.sidecar->markFailed(readiness.sidecar.error);
        QStringList tail;
        tail << QStringLiteral("--- before runtime reset (%1) ---").arg(firstFailure.error);
        tail << m_previousSidecarTail;
        tail << QStringLiteral("--- after runtime reset ---");
        tail << m_set.sidecar->outputTail(kDiagnosticTailLines);
        return fail(kSidecar,
                    QStringLiteral("sidecar not ready after runtime recovery: %1")
                        .arg(readiness.sidecar.error),
                    tail);
    }

    m_set.sidecar->markHealthy();
    qCInfo(lcDeps, "sidecar recovered, ready after %lld ms", readiness.sidecar.elapsedMs);
    setState(DependencyState::Ready);
    return BringUpResult{true, Failure()};
}

bool DependencySupervisor::resetRuntime(const CancellationToken* token, QString& error) {
    error.clear();
    qCWarning(lcDeps, "resetting local sidecar runtime");

    int step = 0;
    for (const CommandSpec& command : m_config.sidecarReset) {
        ++step;
        const ProcessSpec spec = m_config.processSpec(
            QStringLiteral("sidecar-reset-%1").arg(step), command);
        ProcessHandle handle(m_processes->create(spec), spec);
        handle.start();

        const ProcessHandle::WaitResult wait =
            handle.waitForExit(m_config.sidecarResetTimeoutMs, token);
        if (wait != ProcessHandle::WaitResult::Done) {
            QString stopError;
            if (!handle.stop(0, stopError)) {
                qCWarning(lcDeps, "%s", qUtf8Printable(stopError));
            }
            error = wait == ProcessHandle::WaitResult::Cancelled
                        ? QStringLiteral("cancelled during '%1'").arg(spec.displayCommand())
                        : QStringLiteral("'%1' timed out after %2 ms")
                              .arg(spec.displayCommand())
                              .arg(m_config.sidecarResetTimeoutMs);
            // 被中断的重置不代表运行时损坏，保持状态文件不变
            if (wait != ProcessHandle::WaitResult::Cancelled) {
                recordReset(false, error);
            }
            return false;
        }
        if (handle.crashed() || handle.lastExitCode() != 0) {
            error = QStringLiteral("'%1' %2").arg(spec.displayCommand(), exitReason(&handle));
            const QStringList tail = handle.outputTail(5);
            if (!tail.isEmpty()) {
                error += QStringLiteral(": ") + tail.join(QStringLiteral(" | "));
            }
            recordReset(false, error);
            return false;
        }
    }

    recordReset(true, QString());
    return true;
}

void DependencySupervisor::recordReset(bool ok, const QString& error) {
    const QString path = m_config.runtimeStatePath();
    QString loadError;
    RuntimeState state = RuntimeState::load(path, loadError);
    if (!loadError.isEmpty()) {
        // 损坏的状态文件正是重置要修复的对象，直接覆盖
        state = RuntimeState();
    }
    state.initialized = ok;
    state.lastResetAt = QDateTime::currentDateTimeUtc();
    state.resetCount += 1;
    state.lastResetError = error;

    QString saveError;
    if (!state.save(path, saveError)) {
        qCWarning(lcDeps, "failed to record runtime state: %s", qUtf8Printable(saveError));
    }
}

DependencySupervisor::BringUpResult DependencySupervisor::fail(const QString& origin,
                                                               const QString& message,
                                                               const QStringList& tail) {
    setState(DependencyState::Failed);
    qCWarning(lcDeps, "%s", qUtf8Printable(message));
    return BringUpResult{false,
                         Failure::make(FailureKind::DependencyStartupFailure, origin, message, tail)};
}

DependencySupervisor::BringUpResult DependencySupervisor::cancelled(const CancellationToken* token) {
    const QString reason = token ? token->reason() : QString();
    qCInfo(lcDeps, "dependency bring-up cancelled: %s",
           qUtf8Printable(reason.isEmpty() ? QStringLiteral("no reason") : reason));
    return BringUpResult{false,
                         Failure::make(FailureKind::Cancelled, QStringLiteral("dependencies"),
                                       QStringLiteral("dependency bring-up cancelled"))};
}

} // namespace devrun
