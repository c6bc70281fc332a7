#include "orchestrator_logger.h"

#include <QDir>

#include <cstring>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace devrun {

namespace {

spdlog::level::level_enum toSpdlogLevel(const QString& level) {
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn")  return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

static QtMessageHandler s_previousHandler = nullptr;

void qtToSpdlogHandler(QtMsgType type,
                       const QMessageLogContext& context,
                       const QString& msg) {
    auto logger = spdlog::default_logger();
    // 带分类的消息加上分类名前缀（devrun.health 等）
    std::string text;
    if (context.category && std::strcmp(context.category, "default") != 0) {
        text = std::string("[") + context.category + "] " + msg.toStdString();
    } else {
        text = msg.toStdString();
    }
    switch (type) {
    case QtDebugMsg:    logger->debug("{}", text); break;
    case QtInfoMsg:     logger->info("{}", text); break;
    case QtWarningMsg:  logger->warn("{}", text); break;
    case QtCriticalMsg: logger->error("{}", text); break;
    case QtFatalMsg:    logger->critical("{}", text); abort();
    }
}

} // namespace

bool OrchestratorLogger::init(const Config& config, QString& error) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!config.logDir.isEmpty()) {
            if (!QDir().mkpath(config.logDir)) {
                error = QString("cannot create log directory %1").arg(config.logDir);
                return false;
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (config.logDir + "/devrun.log").toStdString(),
                static_cast<size_t>(config.maxFileBytes),
                static_cast<size_t>(config.maxFiles)));
        }

        auto logger = std::make_shared<spdlog::logger>("devrun", sinks.begin(), sinks.end());

        logger->set_level(toSpdlogLevel(config.logLevel));
        logger->set_pattern("%Y-%m-%dT%H:%M:%S.%eZ [%L] %v",
                            spdlog::pattern_time_type::utc);
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);
        s_previousHandler = qInstallMessageHandler(qtToSpdlogHandler);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        error = QString("failed to initialize logger: %1").arg(ex.what());
        return false;
    }
}

void OrchestratorLogger::shutdown() {
    qInstallMessageHandler(s_previousHandler);
    s_previousHandler = nullptr;
    spdlog::shutdown();
}

} // namespace devrun
