#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <QRegularExpression>
#include <QTemporaryDir>

#include "devrun/logging/orchestrator_logger.h"

using namespace devrun;

namespace {

Q_LOGGING_CATEGORY(lcLoggerTest, "devrun.test")

QStringList readLogLines(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) return {};
    QStringList lines;
    while (!file.atEnd()) {
        QString line = QString::fromUtf8(file.readLine()).trimmed();
        if (!line.isEmpty()) lines.append(line);
    }
    return lines;
}

} // namespace

TEST(OrchestratorLoggerTest, InfoLevelFiltersDebug) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());

    OrchestratorLogger::Config cfg;
    cfg.logLevel = "info";
    cfg.logDir = tmpDir.path();
    QString error;
    ASSERT_TRUE(OrchestratorLogger::init(cfg, error)) << qPrintable(error);
    qDebug("d");
    qInfo("i");
    qWarning("w");
    qCritical("e");
    OrchestratorLogger::shutdown();

    const auto lines = readLogLines(tmpDir.path() + "/devrun.log");
    EXPECT_EQ(lines.size(), 3);
    for (const auto& line : lines) {
        EXPECT_FALSE(line.contains("[D]"));
    }
}

TEST(OrchestratorLoggerTest, ErrorLevelKeepsOnlyErrors) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());

    OrchestratorLogger::Config cfg;
    cfg.logLevel = "error";
    cfg.logDir = tmpDir.path();
    QString error;
    ASSERT_TRUE(OrchestratorLogger::init(cfg, error)) << qPrintable(error);
    qInfo("i");
    qWarning("w");
    qCritical("e");
    OrchestratorLogger::shutdown();

    const auto lines = readLogLines(tmpDir.path() + "/devrun.log");
    ASSERT_EQ(lines.size(), 1);
    EXPECT_TRUE(lines[0].contains("[E] e"));
}

TEST(OrchestratorLoggerTest, TimestampAndCategoryPrefix) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());

    OrchestratorLogger::Config cfg;
    cfg.logLevel = "debug";
    cfg.logDir = tmpDir.path();
    QString error;
    ASSERT_TRUE(OrchestratorLogger::init(cfg, error)) << qPrintable(error);
    qCWarning(lcLoggerTest, "sidecar not ready");
    qInfo("plain");
    OrchestratorLogger::shutdown();

    const auto lines = readLogLines(tmpDir.path() + "/devrun.log");
    ASSERT_EQ(lines.size(), 2);
    const QRegularExpression re(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z \[W\] \[devrun\.test\] sidecar not ready$)");
    EXPECT_TRUE(re.match(lines[0]).hasMatch()) << qPrintable(lines[0]);
    EXPECT_TRUE(lines[1].endsWith("[I] plain"));
}

TEST(OrchestratorLoggerTest, CreatesMissingLogDirectory) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    const QString logDir = tmpDir.path() + "/.devrun/logs";

    OrchestratorLogger::Config cfg;
    cfg.logDir = logDir;
    QString error;
    ASSERT_TRUE(OrchestratorLogger::init(cfg, error)) << qPrintable(error);
    qInfo("hello");
    OrchestratorLogger::shutdown();

    EXPECT_TRUE(QDir(logDir).exists());
    EXPECT_EQ(readLogLines(logDir + "/devrun.log").size(), 1);
}

TEST(OrchestratorLoggerTest, ConsoleOnlyWithoutLogDir) {
    OrchestratorLogger::Config cfg;
    QString error;
    ASSERT_TRUE(OrchestratorLogger::init(cfg, error)) << qPrintable(error);
    qInfo("console only");
    OrchestratorLogger::shutdown();
    SUCCEED();
}
