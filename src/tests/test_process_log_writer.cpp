#include <gtest/gtest.h>

#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>

#include "devrun/process/process_log_writer.h"

using namespace devrun;

namespace {

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

const QRegularExpression kTimestampRe(
    R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z \| .+$)");

} // namespace

TEST(ProcessLogWriterTest, LinesAreTimestamped) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    const QString logPath = tmpDir.path() + "/logs/app.log";

    {
        ProcessLogWriter writer(logPath);
        EXPECT_TRUE(writer.isOpen());
        writer.appendStdout("INFO:     Uvicorn running on http://0.0.0.0:8000\n");
        writer.appendStderr("DeprecationWarning: old api\n");
    }

    const auto lines = readLogLines(logPath);
    ASSERT_EQ(lines.size(), 2);
    EXPECT_TRUE(kTimestampRe.match(lines[0]).hasMatch());
    EXPECT_TRUE(lines[0].contains("Uvicorn running"));
    EXPECT_FALSE(lines[0].contains("[stderr]"));
    EXPECT_TRUE(lines[1].contains("[stderr] DeprecationWarning"));
}

TEST(ProcessLogWriterTest, PartialLinesJoinAcrossChunks) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    const QString logPath = tmpDir.path() + "/app.log";

    {
        ProcessLogWriter writer(logPath);
        writer.appendStdout("part");
        writer.appendStdout("ial\r\nnext");
    }

    const auto lines = readLogLines(logPath);
    ASSERT_EQ(lines.size(), 2);
    EXPECT_TRUE(lines[0].endsWith("| partial"));
    // 析构时写出残留的半行
    EXPECT_TRUE(lines[1].endsWith("| next"));
}

TEST(ProcessLogWriterTest, NotesAreMarked) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    const QString logPath = tmpDir.path() + "/sidecar.log";

    {
        ProcessLogWriter writer(logPath);
        writer.note("sending SIGTERM");
    }

    const auto lines = readLogLines(logPath);
    ASSERT_EQ(lines.size(), 1);
    EXPECT_TRUE(lines[0].contains("[devrun] sending SIGTERM"));
}

TEST(ProcessLogWriterTest, TruncateVersusAppend) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    const QString logPath = tmpDir.path() + "/app.log";

    {
        ProcessLogWriter writer(logPath);
        writer.appendStdout("first\n");
    }
    {
        ProcessLogWriter writer(logPath, /*truncate=*/false);
        writer.appendStdout("second\n");
    }
    EXPECT_EQ(readLogLines(logPath).size(), 2);

    {
        ProcessLogWriter writer(logPath);
        writer.appendStdout("third\n");
    }
    const auto lines = readLogLines(logPath);
    ASSERT_EQ(lines.size(), 1);
    EXPECT_TRUE(lines[0].contains("third"));
}
