#pragma once

#include <QString>

#include "devrun/devrun_export.h"

namespace devrun {

class DEVRUN_API OrchestratorLogger {
public:
    struct Config {
        QString logLevel = "info";
        QString logDir;               // 为空时只输出到控制台
        qint64 maxFileBytes = 10 * 1024 * 1024;
        int maxFiles = 3;
    };

    static bool init(const Config& config, QString& error);
    static void shutdown();

private:
    OrchestratorLogger() = delete;
};

} // namespace devrun
