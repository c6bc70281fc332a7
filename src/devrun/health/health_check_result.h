#pragma once

#include <QDateTime>
#include <QString>
#include <QUrl>

#include "devrun/devrun_export.h"

namespace devrun {

struct DEVRUN_API HealthTarget {
    QString name;
    QUrl url;
};

struct DEVRUN_API PollPolicy {
    int intervalMs = 500;
    int timeoutMs = 30000;
    int probeTimeoutMs = 2000;  // 单次探测上限，会被剩余预算截断
};

struct DEVRUN_API HealthCheckResult {
    QDateTime timestamp;
    bool success = false;
    bool cancelled = false;
    bool timedOut = false;
    qint64 latencyMs = 0;   // 最后一次探测的耗时
    qint64 elapsedMs = 0;   // 轮询总耗时
    int attempts = 0;
    QString error;
};

} // namespace devrun
