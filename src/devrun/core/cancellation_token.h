#pragma once

#include <QObject>
#include <QString>

#include "devrun/devrun_export.h"

namespace devrun {

/**
 * 协作式取消令牌
 * 由信号处理或致命错误触发一次，所有阻塞等待（健康轮询、进程退出、
 * 文件变更）都监听 cancelled() 并尽快返回。
 */
class DEVRUN_API CancellationToken : public QObject {
    Q_OBJECT
public:
    explicit CancellationToken(QObject* parent = nullptr);

    bool isCancelled() const { return m_cancelled; }
    QString reason() const { return m_reason; }

    /// 幂等：只有第一次调用会发射 cancelled()
    void cancel(const QString& reason = QString());

signals:
    void cancelled(const QString& reason);

private:
    bool m_cancelled = false;
    QString m_reason;
};

} // namespace devrun
