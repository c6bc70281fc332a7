#include <QCoreApplication>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QTextStream>

#include <cstdio>

#include "devrun/config/cli_args.h"
#include "devrun/config/orchestrator_config.h"
#include "devrun/core/cancellation_token.h"
#include "devrun/core/failure.h"
#include "devrun/health/health_probe.h"
#include "devrun/logging/orchestrator_logger.h"
#include "devrun/process/child_process.h"
#include "devrun/session/run_session.h"
#include "devrun/session/signal_bridge.h"

using namespace devrun;

namespace {

constexpr const char* kVersion = "0.1.0";

void printHelp() {
    QTextStream err(stderr);
    err << "Usage: devrun <command> [options]\n"
        << "Commands:\n"
        << "  run                      Start dependencies and the application\n"
        << "  test                     Run unit and/or e2e tests\n"
        << "Common options:\n"
        << "  -p, --path <dir>         Project directory (default: .)\n"
        << "  --log-level=<level>      debug|info|warn|error (default: info)\n"
        << "  -h, --help               Show this help\n"
        << "  --version                Show version\n"
        << "Run options:\n"
        << "  --no-watch               Disable hot reload\n"
        << "Test options:\n"
        << "  -t, --type <type>        unit|e2e|all (default: all)\n"
        << "  --coverage               Collect coverage and print a report\n"
        << "  --fail-fast              Stop at the first failing test (default)\n"
        << "  --no-fail-fast           Run every test and aggregate failures\n"
        << "  -v, --verbose            Verbose pytest output and debug logging\n"
        << "Exit codes:\n"
        << "  0 success, 1 test failure, 2 usage error, 10 environment blocker,\n"
        << "  11 session busy, 12 dependency startup failure, 13 health timeout,\n"
        << "  14 application crash, 130 cancelled\n";
    err.flush();
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("devrun");
    QCoreApplication::setApplicationVersion(kVersion);

    const CliArgs args = CliArgs::parse(app.arguments());
    if (args.help) {
        printHelp();
        return ExitCode::Success;
    }
    if (args.version) {
        std::fprintf(stderr, "devrun %s\n", kVersion);
        return ExitCode::Success;
    }
    if (!args.error.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(args.error));
        std::fprintf(stderr, "Run 'devrun --help' for usage.\n");
        return ExitCode::UsageError;
    }

    QString cfgErr;
    const OrchestratorConfig config =
        OrchestratorConfig::build(args, QProcessEnvironment::systemEnvironment(), cfgErr);
    if (!cfgErr.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(cfgErr));
        return ExitCode::UsageError;
    }

    OrchestratorLogger::Config logConfig;
    logConfig.logLevel = config.logLevel;
    // 项目目录不存在时由预检报告，这里不去创建它
    if (QFileInfo(config.projectDir).isDir()) {
        logConfig.logDir = config.logDir();
    }
    QString logErr;
    if (!OrchestratorLogger::init(logConfig, logErr)) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(logErr));
        return ExitCode::UsageError;
    }

    CancellationToken token;
    SignalBridge signalBridge(&token);
    QString sigErr;
    if (!signalBridge.install(sigErr)) {
        qWarning("%s", qUtf8Printable(sigErr));
    }

    ChildProcessFactory processes;
    HttpHealthProbe probe;
    RunSession::Backends backends;
    backends.processes = &processes;
    backends.probe = &probe;

    int exitCode = ExitCode::Success;
    {
        RunSession session(config, backends, &token);
        exitCode = session.exec();
    }

    signalBridge.uninstall();
    OrchestratorLogger::shutdown();
    return exitCode;
}
