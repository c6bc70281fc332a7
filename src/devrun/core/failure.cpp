#include "failure.h"

#include <QJsonArray>

namespace devrun {

bool Failure::isInfrastructure() const {
    switch (kind) {
    case FailureKind::EnvironmentBlocker:
    case FailureKind::SessionBusy:
    case FailureKind::DependencyStartupFailure:
    case FailureKind::HealthTimeout:
    case FailureKind::AppCrash:
        return true;
    default:
        return false;
    }
}

Failure Failure::make(FailureKind kind,
                      const QString& origin,
                      const QString& message,
                      const QStringList& logTail) {
    Failure f;
    f.kind = kind;
    f.origin = origin;
    f.message = message;
    f.logTail = logTail;
    return f;
}

QString Failure::describe() const {
    if (isNone()) {
        return QStringLiteral("ok");
    }
    QString text = failureKindName(kind);
    if (!origin.isEmpty()) {
        text += " [" + origin + "]";
    }
    if (!message.isEmpty()) {
        text += ": " + message;
    }
    return text;
}

QJsonObject Failure::toJson() const {
    QJsonObject obj;
    obj["kind"] = failureKindName(kind);
    obj["origin"] = origin;
    obj["message"] = message;
    obj["infrastructure"] = isInfrastructure();
    if (!logTail.isEmpty()) {
        obj["logTail"] = QJsonArray::fromStringList(logTail);
    }
    return obj;
}

QString failureKindName(FailureKind kind) {
    switch (kind) {
    case FailureKind::None:                     return QStringLiteral("None");
    case FailureKind::ConfigError:              return QStringLiteral("ConfigError");
    case FailureKind::EnvironmentBlocker:       return QStringLiteral("EnvironmentBlocker");
    case FailureKind::SessionBusy:              return QStringLiteral("SessionBusy");
    case FailureKind::DependencyStartupFailure: return QStringLiteral("DependencyStartupFailure");
    case FailureKind::HealthTimeout:            return QStringLiteral("HealthTimeout");
    case FailureKind::AppCrash:                 return QStringLiteral("AppCrash");
    case FailureKind::TestFailure:              return QStringLiteral("TestFailure");
    case FailureKind::ShutdownError:            return QStringLiteral("ShutdownError");
    case FailureKind::Cancelled:                return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}

int exitCodeFor(FailureKind kind) {
    switch (kind) {
    case FailureKind::None:                     return ExitCode::Success;
    case FailureKind::ConfigError:              return ExitCode::UsageError;
    case FailureKind::EnvironmentBlocker:       return ExitCode::EnvironmentBlocker;
    case FailureKind::SessionBusy:              return ExitCode::SessionBusy;
    case FailureKind::DependencyStartupFailure: return ExitCode::DependencyStartupFailure;
    case FailureKind::HealthTimeout:            return ExitCode::HealthTimeout;
    case FailureKind::AppCrash:                 return ExitCode::AppCrash;
    case FailureKind::TestFailure:              return ExitCode::TestFailure;
    case FailureKind::ShutdownError:            return ExitCode::Success;
    case FailureKind::Cancelled:                return ExitCode::Cancelled;
    }
    return ExitCode::UsageError;
}

} // namespace devrun
