#include "health_gate.h"

#include <QEventLoop>
#include <QTimer>

#include "devrun/core/cancellation_token.h"
#include "devrun/health/health_poller.h"

namespace devrun {

HealthGate::HealthGate(HealthProbe* probe)
    : m_probe(probe) {
}

HealthCheckResult HealthGate::waitUntilHealthy(const HealthTarget& target,
                                               const PollPolicy& policy,
                                               const CancellationToken* token,
                                               std::function<QString()> breakFlag) {
    HealthPoller poller(m_probe, target, policy);
    if (token && token->isCancelled()) {
        poller.cancel();
        return poller.result();
    }

    QEventLoop loop;
    QTimer breakTimer;
    QObject::connect(&poller, &HealthPoller::finished, &loop, &QEventLoop::quit);
    if (token) {
        QObject::connect(token, &CancellationToken::cancelled, &poller, [&poller]() {
            poller.cancel();
        });
    }
    if (breakFlag) {
        breakTimer.setInterval(kBreakCheckIntervalMs);
        QObject::connect(&breakTimer, &QTimer::timeout, &poller, [&poller, &breakFlag]() {
            const QString reason = breakFlag();
            if (!reason.isEmpty()) {
                poller.abort(reason);
            }
        });
        breakTimer.start();
    }

    poller.start();
    if (!poller.isFinished()) {
        loop.exec();
    }
    breakTimer.stop();
    return poller.result();
}

} // namespace devrun
