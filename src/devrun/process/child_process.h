#pragma once

#include <QProcess>
#include <memory>

#include "devrun/devrun_export.h"
#include "devrun/process/managed_process.h"
#include "devrun/process/output_ring_buffer.h"
#include "devrun/process/process_log_writer.h"

namespace devrun {

/**
 * QProcess 实现的受管进程
 * - 子进程放入独立进程组：终端 Ctrl+C 只送达编排器，由其按顺序拆除
 * - Linux 下设置 PR_SET_PDEATHSIG，编排器被强杀时子进程随之退出
 * - stdout/stderr 同时写入环形缓冲、日志文件，前台进程还会转发到终端
 */
class DEVRUN_API ChildProcess : public ManagedProcess {
    Q_OBJECT
public:
    explicit ChildProcess(const ProcessSpec& spec, QObject* parent = nullptr);
    ~ChildProcess() override;

    void start() override;
    void terminate() override;
    void kill() override;

    bool isRunning() const override;
    qint64 processId() const override;
    QStringList outputTail(int maxLines) const override;

    const ProcessSpec& spec() const { return m_spec; }

    static constexpr int kTailLines = 200;

private:
    void prepareChild();
    void sendSignal(bool force);
    void drainOutput();
    void onStdout();
    void onStderr();
    void onFinished(int exitCode, QProcess::ExitStatus status);

    ProcessSpec m_spec;
    QProcess m_proc;
    OutputRingBuffer m_tail;
    std::unique_ptr<ProcessLogWriter> m_logWriter;
    bool m_started = false;
    bool m_done = false;
};

class DEVRUN_API ChildProcessFactory : public ProcessFactory {
public:
    std::unique_ptr<ManagedProcess> create(const ProcessSpec& spec) override;
};

} // namespace devrun
