#include "process_handle.h"

#include <QEventLoop>
#include <QLoggingCategory>

#include "devrun/core/cancellation_token.h"

namespace devrun {

Q_LOGGING_CATEGORY(lcHandle, "devrun.process")

QString processStatusName(ProcessStatus status) {
    switch (status) {
    case ProcessStatus::Starting: return QStringLiteral("starting");
    case ProcessStatus::Running:  return QStringLiteral("running");
    case ProcessStatus::Healthy:  return QStringLiteral("healthy");
    case ProcessStatus::Failed:   return QStringLiteral("failed");
    case ProcessStatus::Stopped:  return QStringLiteral("stopped");
    }
    return QStringLiteral("unknown");
}

ProcessHandle::ProcessHandle(std::unique_ptr<ManagedProcess> process,
                             const ProcessSpec& spec,
                             QObject* parent)
    : QObject(parent)
    , m_process(std::move(process))
    , m_spec(spec) {
    m_killTimer.setSingleShot(true);
    connect(&m_killTimer, &QTimer::timeout, this, [this]() {
        if (!isAlive()) return;
        qCWarning(lcHandle, "%s did not exit within grace period, killing",
                  qUtf8Printable(name()));
        m_process->kill();
    });

    // ⚠ 先连接再 start()：failedToStart 可能在 start() 内部同步触发
    connect(m_process.get(), &ManagedProcess::started, this, &ProcessHandle::onStarted);
    connect(m_process.get(), &ManagedProcess::failedToStart, this, &ProcessHandle::onFailedToStart);
    connect(m_process.get(), &ManagedProcess::finished, this, &ProcessHandle::onFinished);
}

ProcessHandle::~ProcessHandle() {
    m_killTimer.stop();
    if (m_process) {
        m_process->disconnect(this);
    }
}

QStringList ProcessHandle::outputTail(int maxLines) const {
    return m_process ? m_process->outputTail(maxLines) : QStringList();
}

bool ProcessHandle::isAlive() const {
    return m_startCalled && !m_exited;
}

void ProcessHandle::start() {
    if (m_startCalled) {
        return;
    }
    m_startCalled = true;
    m_startedAt = QDateTime::currentDateTimeUtc();
    setStatus(ProcessStatus::Starting);
    qCInfo(lcHandle, "starting %s: %s", qUtf8Printable(name()),
           qUtf8Printable(m_spec.displayCommand()));
    m_process->start();
}

void ProcessHandle::markHealthy() {
    if (m_exited) return;
    setStatus(ProcessStatus::Healthy);
}

void ProcessHandle::markFailed(const QString& reason) {
    m_failureReason = reason;
    setStatus(ProcessStatus::Failed);
}

void ProcessHandle::requestStop(int graceMs) {
    if (!isAlive()) {
        return;
    }
    if (m_stopRequested) {
        return;
    }
    m_stopRequested = true;
    qCInfo(lcHandle, "stopping %s (grace %d ms)", qUtf8Printable(name()), graceMs);
    if (graceMs <= 0) {
        m_process->kill();
        return;
    }
    m_process->terminate();
    m_killTimer.start(graceMs);
}

bool ProcessHandle::stop(int graceMs, QString& error) {
    error.clear();
    if (!isAlive()) {
        return true;
    }

    requestStop(graceMs);
    if (waitForExit(qMax(graceMs, 0) + kKillWaitMs) != WaitResult::Done || isAlive()) {
        error = QStringLiteral("%1 (pid %2) did not exit after SIGKILL")
                    .arg(name())
                    .arg(m_process->processId());
        return false;
    }
    return true;
}

ProcessHandle::WaitResult ProcessHandle::waitForStarted(int timeoutMs,
                                                        const CancellationToken* token) {
    if (m_running || m_exited) return WaitResult::Done;
    if (token && token->isCancelled()) return WaitResult::Cancelled;

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    connect(this, &ProcessHandle::started, &loop, &QEventLoop::quit);
    connect(this, &ProcessHandle::exited, &loop, &QEventLoop::quit);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    if (token) {
        connect(token, &CancellationToken::cancelled, &loop, &QEventLoop::quit);
    }
    if (timeoutMs >= 0) {
        timer.start(timeoutMs);
    }
    loop.exec();

    if (m_running || m_exited) return WaitResult::Done;
    if (token && token->isCancelled()) return WaitResult::Cancelled;
    return WaitResult::TimedOut;
}

ProcessHandle::WaitResult ProcessHandle::waitForExit(int timeoutMs,
                                                     const CancellationToken* token) {
    if (!m_startCalled || m_exited) return WaitResult::Done;
    if (token && token->isCancelled()) return WaitResult::Cancelled;

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    connect(this, &ProcessHandle::exited, &loop, &QEventLoop::quit);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    if (token) {
        connect(token, &CancellationToken::cancelled, &loop, &QEventLoop::quit);
    }
    if (timeoutMs >= 0) {
        timer.start(timeoutMs);
    }
    loop.exec();

    if (m_exited) return WaitResult::Done;
    if (token && token->isCancelled()) return WaitResult::Cancelled;
    return WaitResult::TimedOut;
}

void ProcessHandle::setStatus(ProcessStatus status) {
    if (m_status == status) return;
    m_status = status;
    emit statusChanged(status);
}

void ProcessHandle::onStarted() {
    m_running = true;
    if (m_status == ProcessStatus::Starting) {
        setStatus(ProcessStatus::Running);
    }
    emit started();
}

void ProcessHandle::onFailedToStart(const QString& error) {
    m_running = false;
    m_exited = true;
    m_crashed = true;
    m_lastExitCode = -1;
    m_failureReason = QStringLiteral("failed to start: %1").arg(error);
    qCWarning(lcHandle, "%s %s", qUtf8Printable(name()), qUtf8Printable(m_failureReason));
    setStatus(ProcessStatus::Failed);
    emit startFailed(error);
    // 与 finished 保持"始终发射 exited"的不变量
    emit exited(-1, true, m_stopRequested);
}

void ProcessHandle::onFinished(int exitCode, bool crashed) {
    m_killTimer.stop();
    m_running = false;
    m_exited = true;
    m_crashed = crashed;
    m_lastExitCode = exitCode;

    if (m_stopRequested) {
        setStatus(ProcessStatus::Stopped);
    } else if (crashed || exitCode != 0) {
        m_failureReason = crashed ? QStringLiteral("crashed")
                                  : QStringLiteral("exited with code %1").arg(exitCode);
        setStatus(ProcessStatus::Failed);
    } else {
        setStatus(ProcessStatus::Stopped);
    }
    qCInfo(lcHandle, "%s exited (code %d%s)", qUtf8Printable(name()), exitCode,
           m_stopRequested ? ", requested" : "");
    emit exited(exitCode, crashed, m_stopRequested);
}

} // namespace devrun
