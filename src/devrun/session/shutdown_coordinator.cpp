#include "shutdown_coordinator.h"

#include <QLoggingCategory>

#include "devrun/core/failure.h"
#include "devrun/session/session_lock.h"

namespace devrun {

Q_LOGGING_CATEGORY(lcShutdown, "devrun.shutdown")

ShutdownCoordinator::ShutdownCoordinator(SessionLock* lock)
    : m_lock(lock) {
}

void ShutdownCoordinator::addStep(const QString& name, StopFn stop) {
    m_steps.append(Step{name, std::move(stop)});
}

QStringList ShutdownCoordinator::teardownProcesses() {
    QStringList errors;
    while (!m_steps.isEmpty()) {
        const Step step = m_steps.takeLast();
        m_stopOrder.append(step.name);

        QString error;
        if (!step.stop(error)) {
            const Failure failure = Failure::make(FailureKind::ShutdownError, step.name,
                                                  error.isEmpty() ? QStringLiteral("stop failed")
                                                                  : error);
            qCWarning(lcShutdown, "%s", qUtf8Printable(failure.describe()));
            errors.append(failure.describe());
        } else {
            qCDebug(lcShutdown, "%s stopped", qUtf8Printable(step.name));
        }
    }
    m_errors.append(errors);
    return errors;
}

QStringList ShutdownCoordinator::shutdown() {
    if (m_shutDown) {
        return {};
    }
    const QStringList errors = teardownProcesses();
    if (m_lock) {
        m_lock->release();
    }
    m_shutDown = true;
    qCDebug(lcShutdown, "shutdown complete (%lld warning(s))",
            static_cast<long long>(errors.size()));
    return errors;
}

} // namespace devrun
