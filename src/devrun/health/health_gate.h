#pragma once

#include <functional>

#include "devrun/devrun_export.h"
#include "devrun/health/health_check_result.h"
#include "devrun/health/health_probe.h"

namespace devrun {

class CancellationToken;

/**
 * 阻塞式健康门
 * 在嵌套事件循环中等待 HealthPoller 结束。
 * @param token 取消令牌，触发后立即返回 cancelled 结果
 * @param breakFlag 中断判断函数（如被轮询进程已退出），返回非空原因时中止等待
 */
class DEVRUN_API HealthGate {
public:
    explicit HealthGate(HealthProbe* probe);

    HealthCheckResult waitUntilHealthy(const HealthTarget& target,
                                       const PollPolicy& policy,
                                       const CancellationToken* token = nullptr,
                                       std::function<QString()> breakFlag = {});

    static constexpr int kBreakCheckIntervalMs = 50;

private:
    HealthProbe* m_probe;
};

} // namespace devrun
