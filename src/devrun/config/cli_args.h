#pragma once

#include <QString>
#include <QStringList>

#include "devrun/devrun_export.h"

namespace devrun {

struct DEVRUN_API CliArgs {
    QString command;            // "run" / "test"
    QString projectPath = ".";
    QString logLevel = "info";

    // run
    bool noWatch = false;

    // test
    QString testType = "all";   // unit / e2e / all
    bool coverage = false;
    bool failFast = true;
    bool verbose = false;

    bool hasLogLevel = false;

    bool help = false;
    bool version = false;
    QString error;

    static CliArgs parse(const QStringList& args);
};

} // namespace devrun
