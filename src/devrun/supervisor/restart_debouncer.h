#pragma once

#include <QObject>
#include <QStringList>
#include <QTimer>

#include "devrun/devrun_export.h"

namespace devrun {

/**
 * 尾沿防抖：窗口内的多次变更合并为一次 triggered()
 * 每次 notifyChange() 都会重新计时，窗口静默后才发射。
 */
class DEVRUN_API RestartDebouncer : public QObject {
    Q_OBJECT
public:
    explicit RestartDebouncer(int windowMs, QObject* parent = nullptr);

    void notifyChange(const QString& path);
    void cancel();

    bool isPending() const { return m_timer.isActive(); }
    int windowMs() const { return m_timer.interval(); }
    /// 已发射 triggered() 的次数
    int triggerCount() const { return m_triggerCount; }
    /// 被合并掉（未单独触发）的事件数
    int coalescedCount() const { return m_coalescedCount; }

signals:
    void triggered(const QStringList& changedPaths);

private:
    void fire();

    QTimer m_timer;
    QStringList m_pending;
    int m_triggerCount = 0;
    int m_coalescedCount = 0;
};

} // namespace devrun
