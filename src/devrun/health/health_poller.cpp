#include "health_poller.h"

#include <QLoggingCategory>

namespace devrun {

Q_LOGGING_CATEGORY(lcHealth, "devrun.health")

HealthPoller::HealthPoller(HealthProbe* probe,
                           const HealthTarget& target,
                           const PollPolicy& policy,
                           QObject* parent)
    : QObject(parent)
    , m_probe(probe)
    , m_target(target)
    , m_policy(policy) {
    m_intervalTimer.setInterval(qMax(1, m_policy.intervalMs));
    connect(&m_intervalTimer, &QTimer::timeout, this, &HealthPoller::tick);

    m_deadlineTimer.setSingleShot(true);
    connect(&m_deadlineTimer, &QTimer::timeout, this, [this]() {
        finish(false, QString());
    });
}

void HealthPoller::start() {
    if (m_clock.isValid()) {
        return;
    }
    m_clock.start();
    qCDebug(lcHealth, "polling %s at %s (interval %d ms, timeout %d ms)",
            qUtf8Printable(m_target.name), qUtf8Printable(m_target.url.toString()),
            m_policy.intervalMs, m_policy.timeoutMs);

    m_deadlineTimer.start(qMax(0, m_policy.timeoutMs));
    m_intervalTimer.start();
    tick();
}

void HealthPoller::cancel() {
    if (m_finished) return;
    m_result.cancelled = true;
    finish(false, QStringLiteral("cancelled"));
}

void HealthPoller::abort(const QString& reason) {
    if (m_finished) return;
    finish(false, reason);
}

void HealthPoller::tick() {
    if (m_finished || m_inFlight) {
        return;
    }

    const qint64 remaining = m_policy.timeoutMs - m_clock.elapsed();
    if (remaining <= 0) {
        finish(false, QString());
        return;
    }

    m_inFlight = true;
    ++m_result.attempts;
    const quint64 generation = ++m_generation;
    const int probeTimeout = static_cast<int>(qMin<qint64>(m_policy.probeTimeoutMs, remaining));
    m_probe->probe(m_target.url, probeTimeout, this,
                   [this, generation](const ProbeOutcome& outcome) {
                       onOutcome(generation, outcome);
                   });
}

void HealthPoller::onOutcome(quint64 generation, const ProbeOutcome& outcome) {
    if (generation != m_generation) {
        return;
    }
    m_inFlight = false;
    if (m_finished) {
        return;
    }

    m_result.latencyMs = outcome.latencyMs;
    // 截止之后到达的结果不算数
    if (m_clock.elapsed() > m_policy.timeoutMs) {
        finish(false, QString());
        return;
    }

    if (outcome.healthy) {
        finish(true, QString());
        return;
    }

    m_lastError = outcome.error;
    qCDebug(lcHealth, "%s not ready (attempt %d): %s", qUtf8Printable(m_target.name),
            m_result.attempts, qUtf8Printable(outcome.error));
}

void HealthPoller::finish(bool success, const QString& error) {
    if (m_finished) return;
    m_finished = true;
    m_intervalTimer.stop();
    m_deadlineTimer.stop();
    ++m_generation;  // 丢弃仍在途的探测结果

    m_result.timestamp = QDateTime::currentDateTimeUtc();
    m_result.success = success;
    m_result.elapsedMs = m_clock.isValid() ? m_clock.elapsed() : 0;

    if (!success && error.isEmpty()) {
        m_result.timedOut = true;
        m_result.error = QStringLiteral("%1 not healthy after %2 ms (%3 attempts)")
                             .arg(m_target.name)
                             .arg(m_policy.timeoutMs)
                             .arg(m_result.attempts);
        if (!m_lastError.isEmpty()) {
            m_result.error += ", last error: " + m_lastError;
        }
    } else {
        m_result.error = error;
    }

    if (success) {
        qCInfo(lcHealth, "%s healthy after %lld ms (%d attempts)", qUtf8Printable(m_target.name),
               m_result.elapsedMs, m_result.attempts);
    } else if (!m_result.cancelled) {
        qCWarning(lcHealth, "%s", qUtf8Printable(m_result.error));
    }
    emit finished(m_result);
}

} // namespace devrun
