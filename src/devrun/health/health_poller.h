#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

#include "devrun/devrun_export.h"
#include "devrun/health/health_check_result.h"
#include "devrun/health/health_probe.h"

namespace devrun {

/**
 * 固定间隔健康轮询（不做指数退避）
 *
 * - start() 立即探测一次，之后每 intervalMs 探测一次；上一次探测未返回时跳过本轮
 * - 单次探测超时被截断到剩余预算内，总时长不超过 timeoutMs + intervalMs
 * - 截止时间之后返回的探测结果一律不算成功
 * - 只观察不重启：重启决策属于调用方
 *
 * finished() 只发射一次。
 */
class DEVRUN_API HealthPoller : public QObject {
    Q_OBJECT
public:
    HealthPoller(HealthProbe* probe,
                 const HealthTarget& target,
                 const PollPolicy& policy,
                 QObject* parent = nullptr);

    void start();
    void cancel();
    void abort(const QString& reason);

    bool isRunning() const { return m_clock.isValid() && !m_finished; }
    bool isFinished() const { return m_finished; }
    const HealthTarget& target() const { return m_target; }
    const HealthCheckResult& result() const { return m_result; }

signals:
    void finished(const devrun::HealthCheckResult& result);

private:
    void tick();
    void onOutcome(quint64 generation, const ProbeOutcome& outcome);
    void finish(bool success, const QString& error);

    HealthProbe* m_probe = nullptr;
    HealthTarget m_target;
    PollPolicy m_policy;

    QTimer m_intervalTimer;
    QTimer m_deadlineTimer;
    QElapsedTimer m_clock;
    HealthCheckResult m_result;
    QString m_lastError;
    quint64 m_generation = 0;
    bool m_inFlight = false;
    bool m_finished = false;
};

} // namespace devrun
