#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>
#include <QUrl>

#include "devrun/devrun_export.h"
#include "devrun/config/cli_args.h"
#include "devrun/health/health_check_result.h"
#include "devrun/process/managed_process.h"

namespace devrun {

enum class RunMode {
    Run,
    TestUnit,
    TestE2e,
    TestAll
};

DEVRUN_API QString runModeName(RunMode mode);

struct DEVRUN_API CommandSpec {
    QString program;
    QStringList args;
};

struct DEVRUN_API PortConfig {
    int app = 8000;
    int daprHttp = 3500;
    int daprGrpc = 50001;
    int daprMetrics = 3100;
    int temporal = 7233;
    int temporalUi = 8233;
};

/**
 * 一次会话的不可变配置
 * 在 main 中按 默认值 → devrun.json → 环境变量端口 → 命令行 的顺序构建一次，
 * 之后以 const 引用传入所有组件。
 */
struct DEVRUN_API OrchestratorConfig {
    QString projectDir;
    RunMode mode = RunMode::Run;
    bool hotReload = true;
    bool coverage = false;
    bool failFast = true;
    bool verbose = false;
    QString logLevel = "info";

    PortConfig ports;

    CommandSpec workflowEngine{"temporal",
                               {"server", "start-dev",
                                "--db-filename", "{state_dir}/temporal.db",
                                "--port", "{temporal_port}",
                                "--ui-port", "{temporal_ui_port}"}};
    CommandSpec sidecar{"dapr",
                        {"run",
                         "--app-id", "app",
                         "--app-port", "{app_port}",
                         "--dapr-http-port", "{dapr_http_port}",
                         "--dapr-grpc-port", "{dapr_grpc_port}",
                         "--metrics-port", "{dapr_metrics_port}",
                         "--dapr-http-max-request-size", "1024",
                         "--resources-path", "components"}};
    QList<CommandSpec> sidecarReset{{"dapr", {"uninstall"}},
                                    {"dapr", {"init", "--slim"}}};
    CommandSpec app{"uv", {"run", "main.py"}};
    CommandSpec unitTests{"uv", {"run", "pytest", "tests/unit"}};
    CommandSpec e2eTests{"uv", {"run", "pytest", "tests/e2e"}};
    CommandSpec coverageReport{"uv", {"run", "coverage", "report"}};

    QString sidecarConfigPath;   // 默认 ~/.dapr/config.yaml
    bool recoverMissingRuntimeConfig = false;

    QString workflowHealthPath = "/";
    QString sidecarHealthPath = "/v1.0/healthz/outbound";
    QString appHealthPath = "/server/health";

    PollPolicy dependencyHealth{500, 30000, 2000};
    PollPolicy appHealth{1000, 120000, 3000};

    int debounceMs = 500;
    int graceMs = 5000;
    int sidecarResetTimeoutMs = 120000;
    QStringList watchIgnore{".git", ".devrun", ".venv", "venv", "__pycache__",
                            "node_modules", ".pytest_cache", ".mypy_cache",
                            ".ruff_cache", "dist", "build"};
    QStringList watchSuffixes{"py", "json", "yaml", "yml", "toml", "env", "sql", "html", "js", "css"};

    static OrchestratorConfig defaults();

    /// 按层叠顺序构建；projectPath 相对路径按当前目录解析
    static OrchestratorConfig build(const CliArgs& args,
                                    const QProcessEnvironment& env,
                                    QString& error);

    /// 读取 <project>/devrun.json；文件不存在不算错误
    bool loadFile(const QString& filePath, QString& error);
    bool applyEnvironment(const QProcessEnvironment& env, QString& error);
    void applyArgs(const CliArgs& args);

    bool needsDependencies() const { return mode != RunMode::TestUnit; }
    QStringList requiredPrograms() const;

    QString stateDir() const;
    QString logDir() const;
    QString lockPath() const;
    QString runtimeStatePath() const;
    QString reportPath() const;

    QUrl workflowHealthUrl() const;
    QUrl sidecarHealthUrl() const;
    QUrl appHealthUrl() const;

    QStringList expandArgs(const QStringList& args) const;
    QProcessEnvironment childEnvironment() const;
    ProcessSpec processSpec(const QString& name, const CommandSpec& command,
                            bool forwardOutput = false) const;
};

} // namespace devrun
