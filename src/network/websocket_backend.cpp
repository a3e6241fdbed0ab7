#include "network/websocket_backend.hpp"
#include "network/transport.hpp"

#include <QWebSocket>
#include <QWebSocketProtocol>

namespace sketchsync::network {

namespace {
#if QT_VERSION >= QT_VERSION_CHECK(6, 5, 0)
const auto WebSocketError = &QWebSocket::errorOccurred;
#else
const auto WebSocketError =
    QOverload<QAbstractSocket::SocketError>::of(&QWebSocket::error);
#endif
} // namespace

WebSocketBackend::WebSocketBackend(QObject* parent)
    : QObject(parent)
    , socket_(std::make_unique<QWebSocket>(QString(), QWebSocketProtocol::Version13))
{
    connect(socket_.get(), &QWebSocket::connected,
            this, &WebSocketBackend::onConnected);
    connect(socket_.get(), &QWebSocket::disconnected,
            this, &WebSocketBackend::onDisconnected);
    connect(socket_.get(), WebSocketError,
            this, &WebSocketBackend::onSocketError);
    connect(socket_.get(), &QWebSocket::binaryFrameReceived,
            this, &WebSocketBackend::onBinaryFrame);
    connect(socket_.get(), &QWebSocket::textMessageReceived,
            this, &WebSocketBackend::onTextMessage);
}

WebSocketBackend::~WebSocketBackend() {
    // No callbacks into a transport that is being torn down.
    socket_->disconnect(this);
    socket_->abort();
}

void WebSocketBackend::open(const QUrl& url) {
    errored_ = false;
    closed_reported_ = false;
    qCDebug(sketchsyncSyncLog) << "WebSocketBackend: opening" << url;
    socket_->open(url);
}

void WebSocketBackend::close() {
    socket_->close(QWebSocketProtocol::CloseCodeNormal);
}

Result<void, Error> WebSocketBackend::send_binary(const QByteArray& data) {
    if (socket_->state() != QAbstractSocket::ConnectedState) {
        return Result<void, Error>::err(Error{"Socket is not connected", ErrorCode::NotConnected});
    }
    const qint64 sent = socket_->sendBinaryMessage(data);
    if (sent != static_cast<qint64>(data.size())) {
        return Result<void, Error>::err(Error{
            "Short write: " + std::to_string(sent) + " of " + std::to_string(data.size()) + " bytes"});
    }
    return Result<void, Error>::ok();
}

void WebSocketBackend::onConnected() {
    if (on_open) {
        on_open();
    }
}

void WebSocketBackend::onDisconnected() {
    const int code = errored_ ? CLOSE_CODE_ABNORMAL : static_cast<int>(socket_->closeCode());
    reportClosed(code, socket_->closeReason());
}

void WebSocketBackend::onSocketError(QAbstractSocket::SocketError error) {
    // The peer finishing our own close handshake is not a failure.
    if (error == QAbstractSocket::RemoteHostClosedError &&
        socket_->state() == QAbstractSocket::ClosingState) {
        return;
    }

    errored_ = true;
    const auto message = socket_->errorString();
    if (on_error) {
        on_error(message);
    }

    // A failed connect never reaches the connected state, so no
    // disconnected() follows it.
    if (socket_->state() == QAbstractSocket::UnconnectedState) {
        reportClosed(CLOSE_CODE_ABNORMAL, message);
    }
}

void WebSocketBackend::onBinaryFrame(const QByteArray& frame, bool isLastFrame) {
    if (on_binary_frame) {
        on_binary_frame(frame, isLastFrame);
    }
}

void WebSocketBackend::onTextMessage(const QString& message) {
    if (on_text) {
        on_text(message);
    }
}

void WebSocketBackend::reportClosed(int code, const QString& reason) {
    if (closed_reported_) {
        return;
    }
    closed_reported_ = true;
    if (on_closed) {
        on_closed(code, reason);
    }
}

std::unique_ptr<SocketBackend> createSocketBackend() {
    return std::make_unique<WebSocketBackend>();
}

} // namespace sketchsync::network
