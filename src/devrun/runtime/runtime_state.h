#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include "devrun/devrun_export.h"

namespace devrun {

/**
 * 持久化的 sidecar 运行时状态（.devrun/runtime_state.json）
 * 预检读取；只有 DependencySupervisor 的恢复流程会写入。
 */
struct DEVRUN_API RuntimeState {
    bool present = false;        // 文件是否存在
    bool initialized = false;
    QDateTime lastResetAt;
    int resetCount = 0;
    QString lastResetError;

    static RuntimeState load(const QString& filePath, QString& error);
    bool save(const QString& filePath, QString& error) const;

    QJsonObject toJson() const;
};

} // namespace devrun
