#pragma once

#include <QObject>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include <memory>

#include "devrun/devrun_export.h"

namespace devrun {

struct DEVRUN_API ProcessSpec {
    QString name;             // "workflow-engine" / "sidecar" / "app" / "unit-tests" ...
    QString program;
    QStringList arguments;
    QString workingDirectory;
    QProcessEnvironment environment;  // 为空时继承当前环境
    QString logPath;          // 为空时不写日志文件
    bool appendLog = false;   // 追加而非截断日志文件
    bool forwardOutput = false;  // 前台进程：输出实时转发到终端

    QString displayCommand() const;
};

/**
 * 受管进程后端接口
 * 生产实现为 ChildProcess (QProcess)，测试中注入假实现。
 *
 * 事件约定：start() 之后要么发射 failedToStart()，要么依次发射
 * started() 与 finished()，二者必居其一且各只发射一次。
 * failedToStart() 可能在 start() 内部同步发射。
 */
class DEVRUN_API ManagedProcess : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~ManagedProcess() override = default;

    virtual void start() = 0;
    virtual void terminate() = 0;  // 优雅终止 (SIGTERM)
    virtual void kill() = 0;       // 强制终止 (SIGKILL)

    virtual bool isRunning() const = 0;
    virtual qint64 processId() const = 0;
    virtual QStringList outputTail(int maxLines) const = 0;

signals:
    void started();
    void failedToStart(const QString& error);
    void finished(int exitCode, bool crashed);
};

class DEVRUN_API ProcessFactory {
public:
    virtual ~ProcessFactory() = default;
    virtual std::unique_ptr<ManagedProcess> create(const ProcessSpec& spec) = 0;
};

} // namespace devrun
