#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "devrun/devrun_export.h"

namespace devrun {

enum class FailureKind {
    None,
    ConfigError,
    EnvironmentBlocker,
    SessionBusy,
    DependencyStartupFailure,
    HealthTimeout,
    AppCrash,
    TestFailure,
    ShutdownError,
    Cancelled
};

namespace ExitCode {
constexpr int Success = 0;
constexpr int TestFailure = 1;
constexpr int UsageError = 2;
constexpr int EnvironmentBlocker = 10;
constexpr int SessionBusy = 11;
constexpr int DependencyStartupFailure = 12;
constexpr int HealthTimeout = 13;
constexpr int AppCrash = 14;
constexpr int Cancelled = 130;
} // namespace ExitCode

struct DEVRUN_API Failure {
    FailureKind kind = FailureKind::None;
    QString origin;       // "app" / "sidecar" / "workflow-engine" / "preflight" ...
    QString message;
    QStringList logTail;  // 失败进程最后的输出行

    bool isNone() const { return kind == FailureKind::None; }
    bool isInfrastructure() const;

    static Failure make(FailureKind kind,
                        const QString& origin,
                        const QString& message,
                        const QStringList& logTail = {});

    QString describe() const;
    QJsonObject toJson() const;
};

DEVRUN_API QString failureKindName(FailureKind kind);
DEVRUN_API int exitCodeFor(FailureKind kind);

} // namespace devrun
