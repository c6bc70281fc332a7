#include "child_process.h"

#include <QLoggingCategory>

#include <cstdio>

#ifdef Q_OS_UNIX
#include <signal.h>
#include <unistd.h>
#endif

#ifdef Q_OS_LINUX
#include <sys/prctl.h>
#endif

namespace devrun {

Q_LOGGING_CATEGORY(lcChild, "devrun.process")

namespace {

void forward(FILE* stream, const QByteArray& data) {
    if (data.isEmpty()) return;
    std::fwrite(data.constData(), 1, static_cast<size_t>(data.size()), stream);
    std::fflush(stream);
}

} // namespace

ChildProcess::ChildProcess(const ProcessSpec& spec, QObject* parent)
    : ManagedProcess(parent)
    , m_spec(spec)
    , m_tail(kTailLines) {
    m_proc.setProgram(spec.program);
    m_proc.setArguments(spec.arguments);
    if (!spec.workingDirectory.isEmpty()) {
        m_proc.setWorkingDirectory(spec.workingDirectory);
    }
    if (!spec.environment.isEmpty()) {
        m_proc.setProcessEnvironment(spec.environment);
    }
    m_proc.setProcessChannelMode(QProcess::SeparateChannels);
    // 前台进程不接管 stdin，测试进程与应用都不需要交互输入
    m_proc.setInputChannelMode(QProcess::ManagedInputChannel);

    connect(&m_proc, &QProcess::readyReadStandardOutput, this, &ChildProcess::onStdout);
    connect(&m_proc, &QProcess::readyReadStandardError, this, &ChildProcess::onStderr);
    connect(&m_proc, &QProcess::started, this, [this]() {
        m_started = true;
        qCDebug(lcChild, "%s started (pid %lld)", qUtf8Printable(m_spec.name), m_proc.processId());
        emit started();
    });
    connect(&m_proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, &ChildProcess::onFinished);
    connect(&m_proc, &QProcess::errorOccurred, this, [this](QProcess::ProcessError err) {
        // FailedToStart 时 Qt 不会发射 finished
        if (err != QProcess::FailedToStart || m_done) return;
        m_done = true;
        const QString reason = m_proc.errorString();
        if (m_logWriter) m_logWriter->note("failed to start: " + reason);
        emit failedToStart(reason);
    });
}

ChildProcess::~ChildProcess() {
    if (m_proc.state() != QProcess::NotRunning) {
        m_proc.disconnect(this);
        sendSignal(true);
        m_proc.waitForFinished(1000);
    }
}

void ChildProcess::prepareChild() {
#if defined(Q_OS_LINUX)
    const pid_t parentPid = getpid();
    m_proc.setChildProcessModifier([parentPid] {
        setpgid(0, 0);
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        // 防竞态：父进程在 fork 后、prctl 前已退出
        if (getppid() != parentPid) {
            _exit(1);
        }
    });
#elif defined(Q_OS_UNIX)
    m_proc.setChildProcessModifier([] { setpgid(0, 0); });
#endif
}

void ChildProcess::start() {
    if (!m_spec.logPath.isEmpty()) {
        m_logWriter = std::make_unique<ProcessLogWriter>(m_spec.logPath, !m_spec.appendLog);
        m_logWriter->note("$ " + m_spec.displayCommand());
    }
    prepareChild();
    m_proc.start();
}

void ChildProcess::sendSignal(bool force) {
#ifdef Q_OS_UNIX
    const qint64 pid = m_proc.processId();
    if (pid <= 0) {
        return;
    }
    const int signo = force ? SIGKILL : SIGTERM;
    // 先发给整个进程组（uv/dapr 等会派生孙进程），进程组尚未建立时退回单进程
    if (::kill(-static_cast<pid_t>(pid), signo) != 0) {
        ::kill(static_cast<pid_t>(pid), signo);
    }
#else
    if (force) {
        m_proc.kill();
    } else {
        m_proc.terminate();
    }
#endif
}

void ChildProcess::terminate() {
    if (m_proc.state() == QProcess::NotRunning) return;
    if (m_logWriter) m_logWriter->note("sending SIGTERM");
    sendSignal(false);
}

void ChildProcess::kill() {
    if (m_proc.state() == QProcess::NotRunning) return;
    if (m_logWriter) m_logWriter->note("sending SIGKILL");
    sendSignal(true);
}

bool ChildProcess::isRunning() const {
    return m_proc.state() != QProcess::NotRunning;
}

qint64 ChildProcess::processId() const {
    return m_proc.processId();
}

QStringList ChildProcess::outputTail(int maxLines) const {
    return m_tail.tail(maxLines);
}

void ChildProcess::onStdout() {
    const QByteArray data = m_proc.readAllStandardOutput();
    m_tail.appendStdout(data);
    if (m_logWriter) m_logWriter->appendStdout(data);
    if (m_spec.forwardOutput) forward(stdout, data);
}

void ChildProcess::onStderr() {
    const QByteArray data = m_proc.readAllStandardError();
    m_tail.appendStderr(data);
    if (m_logWriter) m_logWriter->appendStderr(data);
    if (m_spec.forwardOutput) forward(stderr, data);
}

void ChildProcess::drainOutput() {
    onStdout();
    onStderr();
}

void ChildProcess::onFinished(int exitCode, QProcess::ExitStatus status) {
    if (m_done) return;
    m_done = true;

    // 排空管道尾部数据
    drainOutput();

    const bool crashed = status == QProcess::CrashExit;
    if (m_logWriter) {
        m_logWriter->note(QStringLiteral("exited (code %1%2)")
                              .arg(exitCode)
                              .arg(crashed ? QStringLiteral(", crashed") : QString()));
    }
    qCDebug(lcChild, "%s exited (code %d, %s)", qUtf8Printable(m_spec.name), exitCode,
            crashed ? "crash" : "normal");
    emit finished(exitCode, crashed);
}

std::unique_ptr<ManagedProcess> ChildProcessFactory::create(const ProcessSpec& spec) {
    return std::make_unique<ChildProcess>(spec);
}

} // namespace devrun
