#pragma once

#include <QByteArray>
#include <QString>
#include <memory>
#include <spdlog/spdlog.h>

#include "devrun/devrun_export.h"

namespace devrun {

/**
 * 单个受管进程的日志文件（logs/<name>.log）
 * 每个会话开始时截断，按行写入，stderr 行带 [stderr] 前缀。
 */
class DEVRUN_API ProcessLogWriter {
public:
    /// @param truncate 会话内首次打开时截断；热重载重启的新实例追加写入
    explicit ProcessLogWriter(const QString& logPath, bool truncate = true);
    ~ProcessLogWriter();

    ProcessLogWriter(const ProcessLogWriter&) = delete;
    ProcessLogWriter& operator=(const ProcessLogWriter&) = delete;

    void appendStdout(const QByteArray& data);
    void appendStderr(const QByteArray& data);
    void note(const QString& text);

    QString logPath() const { return m_logPath; }
    bool isOpen() const { return m_logger != nullptr; }

private:
    void processBuffer(QByteArray& buf, const char* prefix);

    std::shared_ptr<spdlog::logger> m_logger;
    QByteArray m_stdoutBuf;
    QByteArray m_stderrBuf;
    QString m_logPath;

    static constexpr qint64 kMaxBufferBytes = 1 * 1024 * 1024;  // 1MB
};

} // namespace devrun
