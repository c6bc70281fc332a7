#include "orchestrator_config.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>

namespace devrun {

namespace {

bool isValidLogLevel(const QString& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

bool readInt(const QJsonObject& obj, const QString& key, int minValue, int maxValue,
             int& out, QString& error) {
    if (!obj.contains(key)) {
        return true;
    }
    const QJsonValue v = obj.value(key);
    if (!v.isDouble() || v.toDouble() != static_cast<double>(v.toInt())) {
        error = "config field '" + key + "' must be an integer";
        return false;
    }
    const int value = v.toInt();
    if (value < minValue || value > maxValue) {
        error = "config field '" + key + "' out of range";
        return false;
    }
    out = value;
    return true;
}

bool readString(const QJsonObject& obj, const QString& key, QString& out, QString& error) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.value(key).isString()) {
        error = "config field '" + key + "' must be a string";
        return false;
    }
    out = obj.value(key).toString();
    return true;
}

bool readStringList(const QJsonObject& obj, const QString& key, QStringList& out, QString& error) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.value(key).isArray()) {
        error = "config field '" + key + "' must be an array of strings";
        return false;
    }
    QStringList list;
    for (const QJsonValue& item : obj.value(key).toArray()) {
        if (!item.isString()) {
            error = "config field '" + key + "' must be an array of strings";
            return false;
        }
        list.append(item.toString());
    }
    out = list;
    return true;
}

bool checkKnownFields(const QJsonObject& obj, const QSet<QString>& known,
                      const QString& scope, QString& error) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!known.contains(it.key())) {
            error = "unknown field in " + scope + ": " + it.key();
            return false;
        }
    }
    return true;
}

bool readCommand(const QJsonValue& value, const QString& name, CommandSpec& out, QString& error) {
    if (!value.isObject()) {
        error = "command '" + name + "' must be an object";
        return false;
    }
    const QJsonObject obj = value.toObject();
    if (!checkKnownFields(obj, {"program", "args"}, "command '" + name + "'", error)) {
        return false;
    }
    CommandSpec cmd = out;
    if (!readString(obj, "program", cmd.program, error)) return false;
    if (!readStringList(obj, "args", cmd.args, error)) return false;
    if (cmd.program.isEmpty()) {
        error = "command '" + name + "' has an empty program";
        return false;
    }
    out = cmd;
    return true;
}

bool readPolicy(const QJsonObject& obj, const QString& key, PollPolicy& out, QString& error) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.value(key).isObject()) {
        error = "config field '" + key + "' must be an object";
        return false;
    }
    const QJsonObject p = obj.value(key).toObject();
    if (!checkKnownFields(p, {"intervalMs", "timeoutMs", "probeTimeoutMs"}, key, error)) {
        return false;
    }
    PollPolicy policy = out;
    if (!readInt(p, "intervalMs", 10, 60000, policy.intervalMs, error)) return false;
    if (!readInt(p, "timeoutMs", 100, 3600000, policy.timeoutMs, error)) return false;
    if (!readInt(p, "probeTimeoutMs", 10, 60000, policy.probeTimeoutMs, error)) return false;
    out = policy;
    return true;
}

bool readPortEnv(const QProcessEnvironment& env, const QString& name, int& out, QString& error) {
    if (!env.contains(name)) {
        return true;
    }
    bool ok = false;
    const QString raw = env.value(name).trimmed();
    const int value = raw.toInt(&ok);
    if (!ok || value < 1 || value > 65535) {
        error = "invalid port in " + name + ": " + raw;
        return false;
    }
    out = value;
    return true;
}

QUrl localUrl(int port, const QString& path) {
    QUrl url;
    url.setScheme("http");
    url.setHost("127.0.0.1");
    url.setPort(port);
    url.setPath(path.startsWith('/') ? path : "/" + path);
    return url;
}

} // namespace

QString runModeName(RunMode mode) {
    switch (mode) {
    case RunMode::Run:      return QStringLiteral("run");
    case RunMode::TestUnit: return QStringLiteral("test-unit");
    case RunMode::TestE2e:  return QStringLiteral("test-e2e");
    case RunMode::TestAll:  return QStringLiteral("test-all");
    }
    return QStringLiteral("unknown");
}

OrchestratorConfig OrchestratorConfig::defaults() {
    OrchestratorConfig cfg;
    cfg.projectDir = QDir::currentPath();
    cfg.sidecarConfigPath = QDir::homePath() + "/.dapr/config.yaml";
    return cfg;
}

OrchestratorConfig OrchestratorConfig::build(const CliArgs& args,
                                             const QProcessEnvironment& env,
                                             QString& error) {
    OrchestratorConfig cfg = defaults();
    cfg.projectDir = QDir::cleanPath(QDir(args.projectPath).absolutePath());

    if (!cfg.loadFile(cfg.projectDir + "/devrun.json", error)) {
        return cfg;
    }
    if (!cfg.applyEnvironment(env, error)) {
        return cfg;
    }
    cfg.applyArgs(args);
    error.clear();
    return cfg;
}

bool OrchestratorConfig::loadFile(const QString& filePath, QString& error) {
    error.clear();
    if (!QFileInfo::exists(filePath)) {
        return true;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open config file: " + filePath;
        return false;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = "devrun.json parse error: " + parseErr.errorString();
        return false;
    }
    if (!doc.isObject()) {
        error = "devrun.json must contain a JSON object";
        return false;
    }

    const QJsonObject obj = doc.object();
    static const QSet<QString> known = {
        "logLevel", "ports", "commands", "sidecarReset", "sidecarConfigPath",
        "recoverMissingRuntimeConfig", "appHealthPath", "workflowHealthPath",
        "sidecarHealthPath", "dependencyHealth", "appHealth", "debounceMs", "graceMs",
        "sidecarResetTimeoutMs", "watchIgnore", "watchSuffixes"};
    if (!checkKnownFields(obj, known, "devrun.json", error)) {
        return false;
    }

    OrchestratorConfig cfg = *this;

    if (!readString(obj, "logLevel", cfg.logLevel, error)) return false;
    if (!isValidLogLevel(cfg.logLevel)) {
        error = "invalid config logLevel: " + cfg.logLevel;
        return false;
    }

    if (obj.contains("ports")) {
        if (!obj.value("ports").isObject()) {
            error = "config field 'ports' must be an object";
            return false;
        }
        const QJsonObject p = obj.value("ports").toObject();
        if (!checkKnownFields(p, {"app", "daprHttp", "daprGrpc", "daprMetrics", "temporal", "temporalUi"},
                              "ports", error)) {
            return false;
        }
        if (!readInt(p, "app", 1, 65535, cfg.ports.app, error)) return false;
        if (!readInt(p, "daprHttp", 1, 65535, cfg.ports.daprHttp, error)) return false;
        if (!readInt(p, "daprGrpc", 1, 65535, cfg.ports.daprGrpc, error)) return false;
        if (!readInt(p, "daprMetrics", 1, 65535, cfg.ports.daprMetrics, error)) return false;
        if (!readInt(p, "temporal", 1, 65535, cfg.ports.temporal, error)) return false;
        if (!readInt(p, "temporalUi", 1, 65535, cfg.ports.temporalUi, error)) return false;
    }

    if (obj.contains("commands")) {
        if (!obj.value("commands").isObject()) {
            error = "config field 'commands' must be an object";
            return false;
        }
        const QJsonObject c = obj.value("commands").toObject();
        if (!checkKnownFields(c, {"workflowEngine", "sidecar", "app", "unitTests", "e2eTests",
                                  "coverageReport"}, "commands", error)) {
            return false;
        }
        if (c.contains("workflowEngine") && !readCommand(c.value("workflowEngine"), "workflowEngine", cfg.workflowEngine, error)) return false;
        if (c.contains("sidecar") && !readCommand(c.value("sidecar"), "sidecar", cfg.sidecar, error)) return false;
        if (c.contains("app") && !readCommand(c.value("app"), "app", cfg.app, error)) return false;
        if (c.contains("unitTests") && !readCommand(c.value("unitTests"), "unitTests", cfg.unitTests, error)) return false;
        if (c.contains("e2eTests") && !readCommand(c.value("e2eTests"), "e2eTests", cfg.e2eTests, error)) return false;
        if (c.contains("coverageReport") && !readCommand(c.value("coverageReport"), "coverageReport", cfg.coverageReport, error)) return false;
    }

    if (obj.contains("sidecarReset")) {
        if (!obj.value("sidecarReset").isArray()) {
            error = "config field 'sidecarReset' must be an array of commands";
            return false;
        }
        QList<CommandSpec> steps;
        for (const QJsonValue& item : obj.value("sidecarReset").toArray()) {
            CommandSpec step;
            if (!readCommand(item, "sidecarReset", step, error)) return false;
            steps.append(step);
        }
        cfg.sidecarReset = steps;
    }

    if (!readString(obj, "sidecarConfigPath", cfg.sidecarConfigPath, error)) return false;
    if (obj.contains("recoverMissingRuntimeConfig")) {
        if (!obj.value("recoverMissingRuntimeConfig").isBool()) {
            error = "config field 'recoverMissingRuntimeConfig' must be a boolean";
            return false;
        }
        cfg.recoverMissingRuntimeConfig = obj.value("recoverMissingRuntimeConfig").toBool();
    }

    if (!readString(obj, "appHealthPath", cfg.appHealthPath, error)) return false;
    if (!readString(obj, "workflowHealthPath", cfg.workflowHealthPath, error)) return false;
    if (!readString(obj, "sidecarHealthPath", cfg.sidecarHealthPath, error)) return false;
    if (!readPolicy(obj, "dependencyHealth", cfg.dependencyHealth, error)) return false;
    if (!readPolicy(obj, "appHealth", cfg.appHealth, error)) return false;
    if (!readInt(obj, "debounceMs", 0, 60000, cfg.debounceMs, error)) return false;
    if (!readInt(obj, "graceMs", 0, 600000, cfg.graceMs, error)) return false;
    if (!readInt(obj, "sidecarResetTimeoutMs", 1000, 3600000, cfg.sidecarResetTimeoutMs, error)) return false;
    if (!readStringList(obj, "watchIgnore", cfg.watchIgnore, error)) return false;
    if (!readStringList(obj, "watchSuffixes", cfg.watchSuffixes, error)) return false;

    *this = cfg;
    error.clear();
    return true;
}

bool OrchestratorConfig::applyEnvironment(const QProcessEnvironment& env, QString& error) {
    PortConfig p = ports;
    if (!readPortEnv(env, "ATLAN_APP_HTTP_PORT", p.app, error)) return false;
    if (!readPortEnv(env, "ATLAN_DAPR_HTTP_PORT", p.daprHttp, error)) return false;
    if (!readPortEnv(env, "ATLAN_DAPR_GRPC_PORT", p.daprGrpc, error)) return false;
    if (!readPortEnv(env, "ATLAN_DAPR_METRICS_PORT", p.daprMetrics, error)) return false;
    if (!readPortEnv(env, "ATLAN_TEMPORAL_PORT", p.temporal, error)) return false;
    if (!readPortEnv(env, "ATLAN_TEMPORAL_UI_PORT", p.temporalUi, error)) return false;
    ports = p;
    error.clear();
    return true;
}

void OrchestratorConfig::applyArgs(const CliArgs& args) {
    if (args.command == "run") {
        mode = RunMode::Run;
        hotReload = !args.noWatch;
    } else if (args.command == "test") {
        if (args.testType == "unit") {
            mode = RunMode::TestUnit;
        } else if (args.testType == "e2e") {
            mode = RunMode::TestE2e;
        } else {
            mode = RunMode::TestAll;
        }
        // e2e 中应用始终关闭热重载
        hotReload = false;
        coverage = args.coverage;
        failFast = args.failFast;
        verbose = args.verbose;
    }
    if (args.hasLogLevel) {
        logLevel = args.logLevel;
    } else if (verbose) {
        logLevel = "debug";
    }
}

QStringList OrchestratorConfig::requiredPrograms() const {
    QStringList programs;
    auto add = [&programs](const QString& program) {
        if (!program.isEmpty() && !programs.contains(program)) {
            programs.append(program);
        }
    };

    switch (mode) {
    case RunMode::Run:
        add(workflowEngine.program);
        add(sidecar.program);
        add(app.program);
        break;
    case RunMode::TestUnit:
        add(unitTests.program);
        break;
    case RunMode::TestE2e:
        add(workflowEngine.program);
        add(sidecar.program);
        add(app.program);
        add(e2eTests.program);
        break;
    case RunMode::TestAll:
        add(unitTests.program);
        add(workflowEngine.program);
        add(sidecar.program);
        add(app.program);
        add(e2eTests.program);
        break;
    }
    return programs;
}

QString OrchestratorConfig::stateDir() const {
    return projectDir + "/.devrun";
}

QString OrchestratorConfig::logDir() const {
    return stateDir() + "/logs";
}

QString OrchestratorConfig::lockPath() const {
    return stateDir() + "/session.lock";
}

QString OrchestratorConfig::runtimeStatePath() const {
    return stateDir() + "/runtime_state.json";
}

QString OrchestratorConfig::reportPath() const {
    return stateDir() + "/test-report.json";
}

QUrl OrchestratorConfig::workflowHealthUrl() const {
    return localUrl(ports.temporalUi, workflowHealthPath);
}

QUrl OrchestratorConfig::sidecarHealthUrl() const {
    return localUrl(ports.daprHttp, sidecarHealthPath);
}

QUrl OrchestratorConfig::appHealthUrl() const {
    return localUrl(ports.app, appHealthPath);
}

QStringList OrchestratorConfig::expandArgs(const QStringList& args) const {
    const QList<QPair<QString, QString>> vars = {
        {"{app_port}", QString::number(ports.app)},
        {"{dapr_http_port}", QString::number(ports.daprHttp)},
        {"{dapr_grpc_port}", QString::number(ports.daprGrpc)},
        {"{dapr_metrics_port}", QString::number(ports.daprMetrics)},
        {"{temporal_port}", QString::number(ports.temporal)},
        {"{temporal_ui_port}", QString::number(ports.temporalUi)},
        {"{state_dir}", stateDir()},
        {"{project_dir}", projectDir},
    };

    QStringList out;
    out.reserve(args.size());
    for (QString arg : args) {
        for (const auto& var : vars) {
            arg.replace(var.first, var.second);
        }
        out.append(arg);
    }
    return out;
}

QProcessEnvironment OrchestratorConfig::childEnvironment() const {
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert("ATLAN_APP_HTTP_PORT", QString::number(ports.app));
    env.insert("ATLAN_DAPR_HTTP_PORT", QString::number(ports.daprHttp));
    env.insert("ATLAN_DAPR_GRPC_PORT", QString::number(ports.daprGrpc));
    env.insert("ATLAN_DAPR_METRICS_PORT", QString::number(ports.daprMetrics));
    env.insert("ATLAN_TEMPORAL_PORT", QString::number(ports.temporal));
    env.insert("ATLAN_TEMPORAL_UI_PORT", QString::number(ports.temporalUi));
    env.insert("DAPR_HTTP_PORT", QString::number(ports.daprHttp));
    env.insert("DAPR_GRPC_PORT", QString::number(ports.daprGrpc));
    env.insert("TEMPORAL_HOST_URL", QStringLiteral("localhost:%1").arg(ports.temporal));
    env.insert("PYTHONUNBUFFERED", "1");
    return env;
}

ProcessSpec OrchestratorConfig::processSpec(const QString& name, const CommandSpec& command,
                                            bool forwardOutput) const {
    ProcessSpec spec;
    spec.name = name;
    spec.program = command.program;
    spec.arguments = expandArgs(command.args);
    spec.workingDirectory = projectDir;
    spec.environment = childEnvironment();
    spec.logPath = logDir() + "/" + name + ".log";
    spec.forwardOutput = forwardOutput;
    return spec;
}

} // namespace devrun
