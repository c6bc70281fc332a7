#pragma once

#include <QString>
#include <QVector>

#include <functional>

#include "devrun/devrun_export.h"
#include "devrun/config/orchestrator_config.h"

namespace devrun {

enum class PreflightStatus {
    Ready,
    Degraded,   // 只有运行时未初始化类问题
    Blocked     // 缺少二进制或项目目录
};

DEVRUN_API QString preflightStatusName(PreflightStatus status);

struct DEVRUN_API EnvironmentBlocker {
    enum class Kind {
        MissingProject,
        MissingBinary,
        RuntimeNotInitialized,
        RuntimeResetIncomplete    // 配置存在，但上一次重置失败
    };

    Kind kind = Kind::MissingBinary;
    QString subject;
    QString detail;
    QString hint;

    QString describe() const;
};

struct DEVRUN_API PreflightReport {
    PreflightStatus status = PreflightStatus::Ready;
    QVector<EnvironmentBlocker> blockers;

    bool isReady() const { return status == PreflightStatus::Ready; }
    bool onlyRuntimeBlockers() const;
    /// 唯一的问题是上一次运行时重置未完成，可由一次重置修复
    bool onlyIncompleteReset() const;
    QString summary() const;
};

/**
 * 环境预检（只读）
 * 在任何进程启动之前检查：项目目录、所需二进制是否可发现、
 * sidecar 运行时是否真正可用（配置文件 + 运行时状态文件），不自动重试。
 */
class DEVRUN_API PreflightChecker {
public:
    /// 返回可执行文件绝对路径，找不到时返回空串
    using ExecutableLocator = std::function<QString(const QString& program)>;

    explicit PreflightChecker(const OrchestratorConfig& config,
                              ExecutableLocator locator = {});

    PreflightReport run() const;

    static QString locateOnPath(const QString& program);

private:
    void checkSidecarRuntime(PreflightReport& report) const;

    const OrchestratorConfig& m_config;
    ExecutableLocator m_locator;
};

} // namespace devrun
