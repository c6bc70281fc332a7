#include "process_log_writer.h"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>

#include <spdlog/sinks/basic_file_sink.h>

namespace devrun {

Q_LOGGING_CATEGORY(lcProcessLog, "devrun.process.log")

ProcessLogWriter::ProcessLogWriter(const QString& logPath, bool truncate)
    : m_logPath(logPath)
{
    if (!QDir().mkpath(QFileInfo(logPath).absolutePath())) {
        qCWarning(lcProcessLog, "cannot create log directory for %s", qUtf8Printable(logPath));
        return;
    }

    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            logPath.toStdString(), truncate);

        // 不注册到 spdlog 全局表，同名进程重启时不会冲突
        m_logger = std::make_shared<spdlog::logger>("proc_" + logPath.toStdString(), sink);
        m_logger->set_pattern("%Y-%m-%dT%H:%M:%S.%eZ | %v",
                              spdlog::pattern_time_type::utc);
        m_logger->set_level(spdlog::level::trace);
        m_logger->flush_on(spdlog::level::trace);
    } catch (const spdlog::spdlog_ex& ex) {
        qCWarning(lcProcessLog, "failed to create logger for %s: %s",
                  qUtf8Printable(logPath), ex.what());
        m_logger.reset();
    }
}

ProcessLogWriter::~ProcessLogWriter() {
    if (!m_logger) return;
    if (!m_stdoutBuf.isEmpty()) {
        m_logger->info("{}", m_stdoutBuf.toStdString());
    }
    if (!m_stderrBuf.isEmpty()) {
        m_logger->info("[stderr] {}", m_stderrBuf.toStdString());
    }
    m_logger->flush();
}

void ProcessLogWriter::processBuffer(QByteArray& buf, const char* prefix) {
    if (!m_logger) { buf.clear(); return; }
    while (true) {
        const int nl = buf.indexOf('\n');
        if (nl < 0) break;
        QByteArray line = buf.left(nl);
        buf.remove(0, nl + 1);
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        if (prefix) {
            m_logger->info("{} {}", prefix, line.toStdString());
        } else {
            m_logger->info("{}", line.toStdString());
        }
    }
}

void ProcessLogWriter::appendStdout(const QByteArray& data) {
    m_stdoutBuf.append(data);
    processBuffer(m_stdoutBuf, nullptr);
    if (m_stdoutBuf.size() > kMaxBufferBytes) {
        if (m_logger) m_logger->info("{}", m_stdoutBuf.toStdString());
        m_stdoutBuf.clear();
    }
}

void ProcessLogWriter::appendStderr(const QByteArray& data) {
    m_stderrBuf.append(data);
    processBuffer(m_stderrBuf, "[stderr]");
    if (m_stderrBuf.size() > kMaxBufferBytes) {
        if (m_logger) m_logger->info("[stderr] {}", m_stderrBuf.toStdString());
        m_stderrBuf.clear();
    }
}

void ProcessLogWriter::note(const QString& text) {
    if (m_logger) {
        m_logger->info("[devrun] {}", text.toStdString());
    }
}

} // namespace devrun
