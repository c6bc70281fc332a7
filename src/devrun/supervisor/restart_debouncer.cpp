#include "restart_debouncer.h"

#include <QLoggingCategory>

namespace devrun {

Q_LOGGING_CATEGORY(lcDebounce, "devrun.reload")

RestartDebouncer::RestartDebouncer(int windowMs, QObject* parent)
    : QObject(parent) {
    m_timer.setSingleShot(true);
    m_timer.setInterval(qMax(0, windowMs));
    connect(&m_timer, &QTimer::timeout, this, &RestartDebouncer::fire);
}

void RestartDebouncer::notifyChange(const QString& path) {
    if (m_timer.isActive()) {
        ++m_coalescedCount;
    }
    if (!m_pending.contains(path)) {
        m_pending.append(path);
    }
    m_timer.start();
}

void RestartDebouncer::cancel() {
    m_timer.stop();
    m_pending.clear();
}

void RestartDebouncer::fire() {
    const QStringList paths = m_pending;
    m_pending.clear();
    ++m_triggerCount;
    qCDebug(lcDebounce, "change burst settled: %lld path(s)", static_cast<long long>(paths.size()));
    emit triggered(paths);
}

} // namespace devrun
