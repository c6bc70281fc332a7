#include "output_ring_buffer.h"

namespace devrun {

namespace {

QString decorate(QByteArray line, const char* prefix) {
    if (line.endsWith('\r')) {
        line.chop(1);
    }
    const QString text = QString::fromUtf8(line);
    return prefix ? QString::fromLatin1(prefix) + ' ' + text : text;
}

} // namespace

OutputRingBuffer::OutputRingBuffer(int maxLines)
    : m_maxLines(maxLines > 0 ? maxLines : 1) {
}

void OutputRingBuffer::appendStdout(const QByteArray& data) {
    m_stdoutBuf.append(data);
    processBuffer(m_stdoutBuf, nullptr);
}

void OutputRingBuffer::appendStderr(const QByteArray& data) {
    m_stderrBuf.append(data);
    processBuffer(m_stderrBuf, "[stderr]");
}

void OutputRingBuffer::processBuffer(QByteArray& buf, const char* prefix) {
    while (true) {
        const int nl = buf.indexOf('\n');
        if (nl < 0) {
            break;
        }
        pushLine(decorate(buf.left(nl), prefix));
        buf.remove(0, nl + 1);
    }

    // 无换行的超长输出直接截断成一行
    if (buf.size() > kMaxPartialBytes) {
        pushLine(decorate(buf, prefix));
        buf.clear();
    }
}

QStringList OutputRingBuffer::tail(int maxLines) const {
    QStringList all;
    for (const QString& line : m_lines) {
        all.append(line);
    }
    if (!m_stdoutBuf.isEmpty()) {
        all.append(decorate(m_stdoutBuf, nullptr));
    }
    if (!m_stderrBuf.isEmpty()) {
        all.append(decorate(m_stderrBuf, "[stderr]"));
    }

    if (maxLines < 0 || maxLines >= all.size()) {
        return all;
    }
    return all.mid(all.size() - maxLines);
}

void OutputRingBuffer::clear() {
    m_lines.clear();
    m_stdoutBuf.clear();
    m_stderrBuf.clear();
    m_dropped = 0;
}

void OutputRingBuffer::pushLine(const QString& line) {
    m_lines.push_back(line);
    while (static_cast<int>(m_lines.size()) > m_maxLines) {
        m_lines.pop_front();
        ++m_dropped;
    }
}

} // namespace devrun
