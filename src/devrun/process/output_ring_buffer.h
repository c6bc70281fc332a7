#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <deque>

#include "devrun/devrun_export.h"

namespace devrun {

/**
 * 有界输出环形缓冲
 * 按行保存进程最近的输出（stdout/stderr 交错），超出 maxLines 时丢弃最旧的行。
 * 每个通道未以换行结尾的残留数据单独缓存，tail() 时附在末尾返回。
 */
class DEVRUN_API OutputRingBuffer {
public:
    explicit OutputRingBuffer(int maxLines = 200);

    void appendStdout(const QByteArray& data);
    void appendStderr(const QByteArray& data);
    QStringList tail(int maxLines = -1) const;
    void clear();

    int lineCount() const { return static_cast<int>(m_lines.size()); }
    qint64 droppedLines() const { return m_dropped; }

    static constexpr int kMaxPartialBytes = 64 * 1024;

private:
    void processBuffer(QByteArray& buf, const char* prefix);
    void pushLine(const QString& line);

    int m_maxLines;
    std::deque<QString> m_lines;
    QByteArray m_stdoutBuf;
    QByteArray m_stderrBuf;
    qint64 m_dropped = 0;
};

} // namespace devrun
