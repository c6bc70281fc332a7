#include "app_supervisor.h"

#include <QEventLoop>
#include <QLoggingCategory>

#include "devrun/core/cancellation_token.h"
#include "devrun/supervisor/restart_debouncer.h"
#include "devrun/supervisor/source_watcher.h"

namespace devrun {

Q_LOGGING_CATEGORY(lcApp, "devrun.app")

namespace {
const QString kApp = QStringLiteral("app");
}

Failure AppSupervisor::Outcome::failure() const {
    if (!crashed) {
        return Failure();
    }
    return Failure::make(FailureKind::AppCrash, kApp, reason, logTail);
}

AppSupervisor::AppSupervisor(const OrchestratorConfig& config,
                             ProcessFactory* processes,
                             QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_processes(processes) {
    m_debouncer = new RestartDebouncer(m_config.debounceMs, this);
    connect(m_debouncer, &RestartDebouncer::triggered,
            this, [this](const QStringList& paths) { requestRestart(paths); });
}

AppSupervisor::~AppSupervisor() {
    if (m_current && m_current->isAlive()) {
        QString error;
        if (!stop(0, error)) {
            qCWarning(lcApp, "%s", qUtf8Printable(error));
        }
    }
}

bool AppSupervisor::start(bool hotReload, QString& error) {
    error.clear();
    if (m_started) {
        error = QStringLiteral("application already started");
        return false;
    }
    m_started = true;

    if (hotReload) {
        m_watcher = new SourceWatcher(m_config.projectDir, m_config.watchIgnore,
                                      m_config.watchSuffixes, this);
        connect(m_watcher, &SourceWatcher::changed, this, [this](const QString& path) {
            if (m_stopping || m_terminated) return;
            qCDebug(lcApp, "changed: %s", qUtf8Printable(path));
            m_debouncer->notifyChange(path);
        });
        QString watchError;
        if (!m_watcher->start(watchError)) {
            qCWarning(lcApp, "hot reload disabled: %s", qUtf8Printable(watchError));
        }
    }

    launch();
    if (m_current->hasExited() && m_terminated) {
        error = m_outcome.reason;
        return false;
    }
    return true;
}

AppSupervisor::Outcome AppSupervisor::waitForTermination(const CancellationToken* token) {
    if (!m_terminated && !(token && token->isCancelled())) {
        QEventLoop loop;
        connect(this, &AppSupervisor::appExited, &loop, &QEventLoop::quit);
        if (token) {
            connect(token, &CancellationToken::cancelled, &loop, &QEventLoop::quit);
        }
        loop.exec();
    }

    if (m_terminated) {
        return m_outcome;
    }
    Outcome outcome;
    outcome.cancelled = true;
    outcome.reason = token ? token->reason() : QString();
    return outcome;
}

void AppSupervisor::requestRestart(const QStringList& changedPaths) {
    if (m_stopping || m_terminated || !m_current) {
        return;
    }
    if (m_restarting) {
        m_pendingRestart = true;
        return;
    }
    if (!changedPaths.isEmpty()) {
        QString what = changedPaths.first();
        if (changedPaths.size() > 1) {
            what += QStringLiteral(" and %1 more").arg(changedPaths.size() - 1);
        }
        qCInfo(lcApp, "change detected (%s), restarting application", qUtf8Printable(what));
    }
    beginRestart();
}

bool AppSupervisor::stop(int graceMs, QString& error) {
    error.clear();
    m_stopping = true;
    m_pendingRestart = false;
    m_debouncer->cancel();
    if (m_watcher) {
        m_watcher->stop();
    }
    if (!m_current) {
        return true;
    }
    return m_current->stop(graceMs, error);
}

void AppSupervisor::launch() {
    ProcessSpec spec = m_config.processSpec(kApp, m_config.app, /*forwardOutput=*/true);
    spec.appendLog = m_instanceCount > 0;

    if (m_current) {
        // 可能正处于旧句柄的 exited 信号发射中
        m_current.release()->deleteLater();
    }
    m_current = std::make_unique<ProcessHandle>(m_processes->create(spec), spec);
    ProcessHandle* handle = m_current.get();
    connect(handle, &ProcessHandle::exited, this,
            [this, handle](int exitCode, bool crashed, bool expected) {
                onInstanceExited(handle, exitCode, crashed, expected);
            });

    ++m_instanceCount;
    handle->start();
    if (!handle->hasExited()) {
        emit instanceStarted(m_instanceCount);
    }
}

void AppSupervisor::beginRestart() {
    m_restarting = true;
    m_debouncer->cancel();
    if (m_current->isAlive()) {
        m_current->requestStop(m_config.graceMs);
        return;
    }
    // 旧实例已退出（不会再有 exited 信号），直接启动新实例
    onInstanceExited(m_current.get(), m_current->lastExitCode(), m_current->crashed(), true);
}

void AppSupervisor::onInstanceExited(ProcessHandle* handle, int exitCode, bool crashed,
                                     bool expected) {
    if (handle != m_current.get()) {
        return;
    }

    if (m_stopping) {
        m_restarting = false;
        return;
    }

    if (m_restarting && expected) {
        launch();
        if (m_terminated) {
            // 新实例启动失败，已按意外退出处理
            return;
        }
        m_restarting = false;
        ++m_restartCount;
        qCInfo(lcApp, "application restarted (#%d)", m_restartCount);
        emit restartCompleted(m_restartCount);
        if (m_pendingRestart && !m_terminated) {
            m_pendingRestart = false;
            beginRestart();
        }
        return;
    }

    m_restarting = false;
    m_pendingRestart = false;
    m_terminated = true;
    m_debouncer->cancel();
    if (m_watcher) {
        m_watcher->stop();
    }

    m_outcome = Outcome();
    m_outcome.exitCode = exitCode;
    m_outcome.crashed = crashed || exitCode != 0;
    m_outcome.logTail = handle->outputTail(kDiagnosticTailLines);
    if (m_outcome.crashed) {
        m_outcome.reason = handle->failureReason().isEmpty()
                               ? QStringLiteral("application exited with code %1").arg(exitCode)
                               : QStringLiteral("application %1").arg(handle->failureReason());
        qCWarning(lcApp, "%s", qUtf8Printable(m_outcome.reason));
    } else {
        m_outcome.reason = QStringLiteral("application exited normally");
        qCInfo(lcApp, "application exited normally");
    }
    emit appExited(exitCode, m_outcome.crashed);
}

} // namespace devrun
