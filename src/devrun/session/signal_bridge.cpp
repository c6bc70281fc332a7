#include "signal_bridge.h"

#include <QLoggingCategory>
#include <QSocketNotifier>

#include <cerrno>
#include <csignal>
#include <cstring>

#ifdef Q_OS_UNIX
#include <fcntl.h>
#include <unistd.h>
#endif

#include "devrun/core/cancellation_token.h"

namespace devrun {

Q_LOGGING_CATEGORY(lcSignal, "devrun.signal")

namespace {

#ifdef Q_OS_UNIX
int s_pipe[2] = {-1, -1};

constexpr int kSignals[] = {SIGINT, SIGTERM, SIGHUP};
struct sigaction s_previous[3];

void onSignal(int signo) {
    const int savedErrno = errno;
    const unsigned char byte = static_cast<unsigned char>(signo);
    if (s_pipe[1] >= 0) {
        ssize_t ignored = ::write(s_pipe[1], &byte, 1);
        (void)ignored;
    }
    errno = savedErrno;
}

bool setNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0
           && ::fcntl(fd, F_SETFD, FD_CLOEXEC) == 0;
}
#endif

QString signalName(int signo) {
    switch (signo) {
    case SIGINT:  return QStringLiteral("SIGINT");
    case SIGTERM: return QStringLiteral("SIGTERM");
#ifdef SIGHUP
    case SIGHUP:  return QStringLiteral("SIGHUP");
#endif
    default:      return QStringLiteral("signal %1").arg(signo);
    }
}

} // namespace

SignalBridge::SignalBridge(CancellationToken* token, QObject* parent)
    : QObject(parent)
    , m_token(token) {
}

SignalBridge::~SignalBridge() {
    uninstall();
}

bool SignalBridge::install(QString& error) {
    error.clear();
    if (m_installed) {
        return true;
    }
#ifdef Q_OS_UNIX
    if (s_pipe[0] >= 0) {
        error = QStringLiteral("signal bridge already installed in this process");
        return false;
    }
    if (::pipe(s_pipe) != 0) {
        error = QStringLiteral("pipe() failed: %1").arg(QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }
    if (!setNonBlocking(s_pipe[0]) || !setNonBlocking(s_pipe[1])) {
        error = QStringLiteral("fcntl() failed: %1").arg(QString::fromLocal8Bit(std::strerror(errno)));
        ::close(s_pipe[0]);
        ::close(s_pipe[1]);
        s_pipe[0] = s_pipe[1] = -1;
        return false;
    }

    m_notifier = new QSocketNotifier(s_pipe[0], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &SignalBridge::onReadable);

    for (int i = 0; i < 3; ++i) {
        struct sigaction sa {};
        sa.sa_handler = onSignal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;
        if (::sigaction(kSignals[i], &sa, &s_previous[i]) != 0) {
            qCWarning(lcSignal, "cannot install handler for %s",
                      qUtf8Printable(signalName(kSignals[i])));
        }
    }
    m_installed = true;
    return true;
#else
    error = QStringLiteral("signal bridge is only supported on POSIX systems");
    return false;
#endif
}

void SignalBridge::uninstall() {
    if (!m_installed) {
        return;
    }
#ifdef Q_OS_UNIX
    for (int i = 0; i < 3; ++i) {
        ::sigaction(kSignals[i], &s_previous[i], nullptr);
    }
    delete m_notifier;
    m_notifier = nullptr;
    ::close(s_pipe[0]);
    ::close(s_pipe[1]);
    s_pipe[0] = s_pipe[1] = -1;
#endif
    m_installed = false;
}

void SignalBridge::onReadable() {
#ifdef Q_OS_UNIX
    unsigned char byte = 0;
    while (::read(s_pipe[0], &byte, 1) == 1) {
        const int signo = byte;
        ++m_signalCount;
        emit signalReceived(signo);

        if (m_token && !m_token->isCancelled()) {
            qCInfo(lcSignal, "%s received, shutting down", qUtf8Printable(signalName(signo)));
            m_token->cancel(signalName(signo));
        } else {
            qCWarning(lcSignal, "%s received while shutting down, ignored",
                      qUtf8Printable(signalName(signo)));
        }
    }
#endif
}

} // namespace devrun
