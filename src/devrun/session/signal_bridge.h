#pragma once

#include <QObject>
#include <QString>

#include "devrun/devrun_export.h"

class QSocketNotifier;

namespace devrun {

class CancellationToken;

/**
 * 把 SIGINT / SIGTERM / SIGHUP 转成一次协作式取消
 *
 * 信号处理函数只向自管道写一个字节（async-signal-safe），
 * 读端由 QSocketNotifier 在事件循环中处理。第一个信号取消令牌，
 * 关闭期间再收到的信号只记录日志。
 * 进程内只能有一个实例。
 */
class DEVRUN_API SignalBridge : public QObject {
    Q_OBJECT
public:
    explicit SignalBridge(CancellationToken* token, QObject* parent = nullptr);
    ~SignalBridge() override;

    bool install(QString& error);
    void uninstall();

    bool isInstalled() const { return m_installed; }
    int signalCount() const { return m_signalCount; }

signals:
    void signalReceived(int signo);

private:
    void onReadable();

    CancellationToken* m_token = nullptr;
    QSocketNotifier* m_notifier = nullptr;
    int m_signalCount = 0;
    bool m_installed = false;
};

} // namespace devrun
