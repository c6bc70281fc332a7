#include "cli_args.h"

namespace devrun {

namespace {

bool isValidLogLevel(const QString& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

// 同时支持 "--opt=value" 与 "--opt value" / "-o value"
bool takeValue(const QStringList& args, int& i, const QString& shortName,
               const QString& longName, QString& out, bool& matched) {
    const QString& arg = args[i];
    matched = false;
    if (arg.startsWith(longName + "=")) {
        matched = true;
        out = arg.mid(longName.size() + 1);
        return true;
    }
    if (arg == longName || (!shortName.isEmpty() && arg == shortName)) {
        matched = true;
        if (i + 1 >= args.size()) {
            return false;
        }
        out = args[++i];
        return true;
    }
    return true;
}

} // namespace

CliArgs CliArgs::parse(const QStringList& args) {
    CliArgs result;

    int i = 1;
    for (; i < args.size(); ++i) {
        const QString& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            result.help = true;
            continue;
        }
        if (arg == "--version") {
            result.version = true;
            continue;
        }
        if (!arg.startsWith('-')) {
            break;
        }
        result.error = "unknown option: " + arg;
        return result;
    }

    if (i >= args.size()) {
        if (!result.help && !result.version) {
            result.error = "missing command (run | test)";
        }
        return result;
    }

    result.command = args[i];
    if (result.command != "run" && result.command != "test") {
        result.error = "unknown command: " + result.command;
        return result;
    }
    const bool isTest = result.command == "test";

    for (++i; i < args.size(); ++i) {
        const QString& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            result.help = true;
            continue;
        }

        QString value;
        bool matched = false;

        if (!takeValue(args, i, "-p", "--path", value, matched)) {
            result.error = "missing value for " + arg;
            return result;
        }
        if (matched) {
            if (value.isEmpty()) {
                result.error = "path cannot be empty";
                return result;
            }
            result.projectPath = value;
            continue;
        }

        if (!takeValue(args, i, QString(), "--log-level", value, matched)) {
            result.error = "missing value for " + arg;
            return result;
        }
        if (matched) {
            if (!isValidLogLevel(value)) {
                result.error = "invalid log level: " + value;
                return result;
            }
            result.logLevel = value;
            result.hasLogLevel = true;
            continue;
        }

        if (!isTest) {
            if (arg == "--no-watch") {
                result.noWatch = true;
                continue;
            }
            result.error = "unknown option for run: " + arg;
            return result;
        }

        if (!takeValue(args, i, "-t", "--type", value, matched)) {
            result.error = "missing value for " + arg;
            return result;
        }
        if (matched) {
            if (value != "unit" && value != "e2e" && value != "all") {
                result.error = "invalid test type: " + value + " (expected unit, e2e or all)";
                return result;
            }
            result.testType = value;
            continue;
        }
        if (arg == "--coverage") {
            result.coverage = true;
            continue;
        }
        if (arg == "--fail-fast") {
            result.failFast = true;
            continue;
        }
        if (arg == "--no-fail-fast") {
            result.failFast = false;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            result.verbose = true;
            continue;
        }

        result.error = "unknown option for test: " + arg;
        return result;
    }

    return result;
}

} // namespace devrun
