#pragma once

#include <QMap>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include <functional>

/// @brief Local HTTP stub answering GET health endpoints (no Q_OBJECT needed)
class HealthStubServer : public QTcpServer {
public:
    struct Response {
        int status = 200;
        QByteArray body = "ok";
        int delayMs = 0;
    };

    using Handler = std::function<Response()>;

    explicit HealthStubServer(QObject* parent = nullptr)
        : QTcpServer(parent) {
        connect(this, &QTcpServer::newConnection, [this]() {
            while (auto* sock = nextPendingConnection()) {
                connect(sock, &QTcpSocket::readyRead, [this, sock]() {
                    handleData(sock);
                });
                connect(sock, &QTcpSocket::disconnected,
                        sock, &QObject::deleteLater);
            }
        });
    }

    void route(const QByteArray& path, Handler handler) {
        m_routes[path] = std::move(handler);
    }

    int hits(const QByteArray& path) const { return m_hits.value(path); }

    QString baseUrl() const {
        return QString("http://127.0.0.1:%1").arg(serverPort());
    }

private:
    void handleData(QTcpSocket* sock) {
        m_buffers[sock].append(sock->readAll());
        const QByteArray& buf = m_buffers[sock];
        if (buf.indexOf("\r\n\r\n") < 0) return;

        const QList<QByteArray> parts = buf.left(buf.indexOf("\r\n")).split(' ');
        m_buffers.remove(sock);
        if (parts.size() < 2 || parts[0] != "GET") {
            sendResponse(sock, {405, "method not allowed", 0});
            return;
        }

        QByteArray path = parts[1];
        const int qmark = path.indexOf('?');
        if (qmark >= 0) path = path.left(qmark);
        ++m_hits[path];

        auto it = m_routes.find(path);
        if (it == m_routes.end()) {
            sendResponse(sock, {404, "not found", 0});
            return;
        }

        const Response resp = it.value()();
        if (resp.delayMs > 0) {
            auto* timer = new QTimer(sock);
            timer->setSingleShot(true);
            connect(timer, &QTimer::timeout, [this, sock, resp]() {
                sendResponse(sock, resp);
            });
            timer->start(resp.delayMs);
        } else {
            sendResponse(sock, resp);
        }
    }

    void sendResponse(QTcpSocket* sock, const Response& resp) {
        if (!sock || sock->state() != QAbstractSocket::ConnectedState) return;
        QByteArray out;
        out += "HTTP/1.1 " + QByteArray::number(resp.status) + " Status\r\n";
        out += "Content-Type: text/plain\r\n";
        out += "Content-Length: " + QByteArray::number(resp.body.size()) + "\r\n";
        out += "Connection: close\r\n";
        out += "\r\n";
        out += resp.body;
        sock->write(out);
        sock->flush();
        sock->disconnectFromHost();
    }

    QMap<QByteArray, Handler> m_routes;
    QMap<QByteArray, int> m_hits;
    QMap<QTcpSocket*, QByteArray> m_buffers;
};
