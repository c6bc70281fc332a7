#pragma once

#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QUrl>

#include <functional>

#include "devrun/devrun_export.h"

namespace devrun {

struct DEVRUN_API ProbeOutcome {
    bool healthy = false;
    int httpStatus = 0;
    qint64 latencyMs = 0;
    QString error;
};

/**
 * 单次健康探测后端
 * probe() 立即返回；回调在事件循环中最多调用一次。
 * context 销毁后回调不再调用，进行中的请求随之中止。
 */
class DEVRUN_API HealthProbe {
public:
    using Callback = std::function<void(const ProbeOutcome&)>;

    virtual ~HealthProbe() = default;
    virtual void probe(const QUrl& url, int timeoutMs, QObject* context, Callback callback) = 0;
};

/// GET 请求，2xx 视为健康
class DEVRUN_API HttpHealthProbe : public HealthProbe {
public:
    HttpHealthProbe();

    void probe(const QUrl& url, int timeoutMs, QObject* context, Callback callback) override;

private:
    QNetworkAccessManager m_manager;
};

} // namespace devrun
