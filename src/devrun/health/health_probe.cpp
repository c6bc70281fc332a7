#include "health_probe.h"

#include <QElapsedTimer>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>

#include <memory>

namespace devrun {

HttpHealthProbe::HttpHealthProbe() {
    // 本地回环探测不走系统代理
    m_manager.setProxy(QNetworkProxy::NoProxy);
}

void HttpHealthProbe::probe(const QUrl& url, int timeoutMs, QObject* context, Callback callback) {
    QNetworkRequest request(url);
    request.setTransferTimeout(qMax(1, timeoutMs));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setRawHeader("User-Agent", "devrun-health/1");

    auto clock = std::make_shared<QElapsedTimer>();
    clock->start();

    QNetworkReply* reply = m_manager.get(request);
    // 挂到 context 上：轮询方销毁时请求一并中止释放
    reply->setParent(context);

    QObject::connect(reply, &QNetworkReply::finished, context, [reply, clock, callback]() {
        ProbeOutcome outcome;
        outcome.latencyMs = clock->elapsed();
        outcome.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

        if (reply->error() == QNetworkReply::OperationCanceledError && outcome.httpStatus == 0) {
            outcome.error = QStringLiteral("probe timed out after %1 ms").arg(outcome.latencyMs);
        } else if (outcome.httpStatus >= 200 && outcome.httpStatus < 300) {
            outcome.healthy = true;
        } else if (outcome.httpStatus != 0) {
            outcome.error = QStringLiteral("HTTP %1").arg(outcome.httpStatus);
        } else {
            outcome.error = reply->errorString();
        }

        reply->deleteLater();
        callback(outcome);
    });
}

} // namespace devrun
