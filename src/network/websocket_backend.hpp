#pragma once

#include "network/socket_backend.hpp"
#include <QAbstractSocket>
#include <QObject>
#include <memory>

class QWebSocket;

namespace sketchsync::network {

/**
 * WebSocketBackend - SocketBackend on top of QWebSocket.
 *
 * QWebSocket keeps reporting close code 1000 after a dropped TCP
 * connection, so any socket error seen before the close marks it abnormal.
 */
class WebSocketBackend final : public QObject, public SocketBackend {
    Q_OBJECT

public:
    explicit WebSocketBackend(QObject* parent = nullptr);
    ~WebSocketBackend() override;

    void open(const QUrl& url) override;
    void close() override;
    Result<void, Error> send_binary(const QByteArray& data) override;

private slots:
    void onConnected();
    void onDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onBinaryFrame(const QByteArray& frame, bool isLastFrame);
    void onTextMessage(const QString& message);

private:
    std::unique_ptr<QWebSocket> socket_;
    bool errored_ = false;
    bool closed_reported_ = true;

    void reportClosed(int code, const QString& reason);
};

} // namespace sketchsync::network
