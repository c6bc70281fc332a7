#pragma once

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QFile>
#include <QString>

#include <functional>

#include "devrun/config/orchestrator_config.h"

namespace test_support {

inline QString exeSuffix() {
#ifdef Q_OS_WIN
    return ".exe";
#else
    return QString();
#endif
}

inline QString testBinaryPath(const QString& baseName) {
    return QCoreApplication::applicationDirPath() + "/" + baseName + exeSuffix();
}

inline bool waitUntil(const std::function<bool()>& pred, int timeoutMs) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < timeoutMs) {
        if (pred()) {
            return true;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
    }
    return pred();
}

inline void pumpEvents(int ms) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    }
}

inline bool writeFile(const QString& path, const QByteArray& content) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

/// 缩短所有超时，配合假进程/假探测使用
inline devrun::OrchestratorConfig fastConfig(const QString& projectDir,
                                             devrun::RunMode mode = devrun::RunMode::Run) {
    devrun::OrchestratorConfig cfg = devrun::OrchestratorConfig::defaults();
    cfg.projectDir = projectDir;
    cfg.mode = mode;
    cfg.hotReload = mode == devrun::RunMode::Run;
    cfg.sidecarConfigPath = projectDir + "/dapr-config.yaml";
    cfg.dependencyHealth = devrun::PollPolicy{20, 400, 100};
    cfg.appHealth = devrun::PollPolicy{20, 400, 100};
    cfg.graceMs = 200;
    cfg.debounceMs = 50;
    cfg.sidecarResetTimeoutMs = 2000;
    return cfg;
}

} // namespace test_support
