#include "preflight_checker.h"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QStandardPaths>

#include "devrun/runtime/runtime_state.h"

namespace devrun {

Q_LOGGING_CATEGORY(lcPreflight, "devrun.preflight")

QString preflightStatusName(PreflightStatus status) {
    switch (status) {
    case PreflightStatus::Ready:    return QStringLiteral("ready");
    case PreflightStatus::Degraded: return QStringLiteral("degraded");
    case PreflightStatus::Blocked:  return QStringLiteral("blocked");
    }
    return QStringLiteral("unknown");
}

QString EnvironmentBlocker::describe() const {
    QString text = subject + ": " + detail;
    if (!hint.isEmpty()) {
        text += " (" + hint + ")";
    }
    return text;
}

bool PreflightReport::onlyRuntimeBlockers() const {
    for (const EnvironmentBlocker& b : blockers) {
        if (b.kind != EnvironmentBlocker::Kind::RuntimeNotInitialized
            && b.kind != EnvironmentBlocker::Kind::RuntimeResetIncomplete) {
            return false;
        }
    }
    return !blockers.isEmpty();
}

bool PreflightReport::onlyIncompleteReset() const {
    for (const EnvironmentBlocker& b : blockers) {
        if (b.kind != EnvironmentBlocker::Kind::RuntimeResetIncomplete) {
            return false;
        }
    }
    return !blockers.isEmpty();
}

QString PreflightReport::summary() const {
    if (blockers.isEmpty()) {
        return QStringLiteral("environment ready");
    }
    QStringList lines;
    for (const EnvironmentBlocker& b : blockers) {
        lines.append(b.describe());
    }
    return lines.join("; ");
}

PreflightChecker::PreflightChecker(const OrchestratorConfig& config, ExecutableLocator locator)
    : m_config(config)
    , m_locator(locator ? std::move(locator) : ExecutableLocator(&PreflightChecker::locateOnPath)) {
}

QString PreflightChecker::locateOnPath(const QString& program) {
    if (program.contains('/')) {
        const QFileInfo info(program);
        return (info.isFile() && info.isExecutable()) ? info.absoluteFilePath() : QString();
    }
    return QStandardPaths::findExecutable(program);
}

PreflightReport PreflightChecker::run() const {
    PreflightReport report;

    if (!QFileInfo(m_config.projectDir).isDir()) {
        EnvironmentBlocker b;
        b.kind = EnvironmentBlocker::Kind::MissingProject;
        b.subject = m_config.projectDir;
        b.detail = QStringLiteral("project directory does not exist");
        b.hint = QStringLiteral("pass --path <app directory>");
        report.blockers.append(b);
        report.status = PreflightStatus::Blocked;
        return report;
    }

    for (const QString& program : m_config.requiredPrograms()) {
        if (!m_locator(program).isEmpty()) {
            continue;
        }
        EnvironmentBlocker b;
        b.kind = EnvironmentBlocker::Kind::MissingBinary;
        b.subject = program;
        b.detail = QStringLiteral("not found on PATH");
        b.hint = QStringLiteral("install %1 and make sure it is on PATH").arg(program);
        report.blockers.append(b);
    }

    // 二进制缺失时不再检查运行时，避免重复报告同一根因
    const bool sidecarMissing = m_locator(m_config.sidecar.program).isEmpty();
    if (m_config.needsDependencies() && !sidecarMissing) {
        checkSidecarRuntime(report);
    }

    if (report.blockers.isEmpty()) {
        report.status = PreflightStatus::Ready;
    } else if (report.onlyRuntimeBlockers()) {
        report.status = PreflightStatus::Degraded;
    } else {
        report.status = PreflightStatus::Blocked;
    }

    for (const EnvironmentBlocker& b : report.blockers) {
        qCWarning(lcPreflight, "blocker: %s", qUtf8Printable(b.describe()));
    }
    qCDebug(lcPreflight, "preflight %s", qUtf8Printable(preflightStatusName(report.status)));
    return report;
}

void PreflightChecker::checkSidecarRuntime(PreflightReport& report) const {
    const QString program = m_config.sidecar.program;

    if (!m_config.sidecarConfigPath.isEmpty() && !QFileInfo::exists(m_config.sidecarConfigPath)) {
        EnvironmentBlocker b;
        b.kind = EnvironmentBlocker::Kind::RuntimeNotInitialized;
        b.subject = program;
        b.detail = QStringLiteral("runtime config %1 is missing").arg(m_config.sidecarConfigPath);
        b.hint = QStringLiteral("run '%1 init --slim'").arg(program);
        report.blockers.append(b);
        return;
    }

    QString error;
    const RuntimeState state = RuntimeState::load(m_config.runtimeStatePath(), error);
    if (!error.isEmpty()) {
        EnvironmentBlocker b;
        b.kind = EnvironmentBlocker::Kind::RuntimeNotInitialized;
        b.subject = program;
        b.detail = error;
        b.hint = QStringLiteral("delete %1 and run '%2 init --slim'")
                     .arg(QDir::toNativeSeparators(m_config.runtimeStatePath()), program);
        report.blockers.append(b);
        return;
    }
    if (!state.present || state.initialized) {
        return;
    }

    // 手动 init 之后配置文件比上次重置新，视为已重新初始化
    if (!m_config.sidecarConfigPath.isEmpty() && state.lastResetAt.isValid()) {
        const QDateTime configModified =
            QFileInfo(m_config.sidecarConfigPath).lastModified().toUTC();
        if (configModified.isValid() && configModified > state.lastResetAt) {
            qCInfo(lcPreflight, "%s is newer than the last failed reset, runtime re-initialized",
                   qUtf8Printable(m_config.sidecarConfigPath));
            return;
        }
    }

    EnvironmentBlocker b;
    b.kind = EnvironmentBlocker::Kind::RuntimeResetIncomplete;
    b.subject = program;
    b.detail = state.lastResetError.isEmpty()
                   ? QStringLiteral("runtime state is marked uninitialized")
                   : QStringLiteral("last runtime reset failed: %1").arg(state.lastResetError);
    b.hint = QStringLiteral("the runtime is reset once before start; or run '%1 init --slim'")
                 .arg(program);
    report.blockers.append(b);
}

} // namespace devrun
