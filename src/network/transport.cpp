#include "network/transport.hpp"
#include "network/control_message.hpp"

#include <QDebug>
#include <QTimer>

Q_LOGGING_CATEGORY(sketchsyncSyncLog, "sketchsync.sync")

namespace sketchsync::network {

QString connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return QStringLiteral("disconnected");
        case ConnectionState::Connecting: return QStringLiteral("connecting");
        case ConnectionState::Connected: return QStringLiteral("connected");
        case ConnectionState::Reconnecting: return QStringLiteral("reconnecting");
    }
    return QStringLiteral("unknown");
}

SyncTransport::SyncTransport(TransportOptions options,
                             std::unique_ptr<SocketBackend> backend,
                             QObject* parent)
    : QObject(parent)
    , options_(std::move(options))
    , backend_(backend ? std::move(backend) : createSocketBackend())
    , reconnect_timer_(std::make_unique<QTimer>())
{
    reconnect_timer_->setSingleShot(true);
    connect(reconnect_timer_.get(), &QTimer::timeout, this, [this]() {
        if (state_ == ConnectionState::Reconnecting) {
            connectNow();
        }
    });

    backend_->on_open = [this]() { handleOpen(); };
    backend_->on_closed = [this](int code, QString reason) { handleClosed(code, reason); };
    backend_->on_binary_frame = [this](QByteArray frame, bool last) { handleBinaryFrame(frame, last); };
    backend_->on_text = [this](QString message) { handleText(message); };
    backend_->on_error = [this](QString message) { handleError(message); };
}

SyncTransport::~SyncTransport() {
    reconnect_timer_->stop();
    backend_->on_open = nullptr;
    backend_->on_closed = nullptr;
    backend_->on_binary_frame = nullptr;
    backend_->on_text = nullptr;
    backend_->on_error = nullptr;
}

void SyncTransport::open() {
    if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Connected) {
        return;
    }
    reconnect_timer_->stop();
    attempts_ = 0;
    connectNow();
}

void SyncTransport::close() {
    reconnect_timer_->stop();
    const bool active = state_ == ConnectionState::Connecting || state_ == ConnectionState::Connected;
    inbound_.clear();
    discarding_ = false;
    attempts_ = 0;
    setState(ConnectionState::Disconnected);
    if (active) {
        backend_->close();
    }
}

Result<void, Error> SyncTransport::sendSnapshot(const QByteArray& bytes) {
    if (state_ != ConnectionState::Connected) {
        qCDebug(sketchsyncSyncLog) << "SyncTransport: dropping snapshot of" << bytes.size()
                                   << "bytes while" << connectionStateName(state_);
        return Result<void, Error>::err(Error{"Not connected", ErrorCode::NotConnected});
    }
    auto sent = backend_->send_binary(bytes);
    if (sent.is_err()) {
        qCWarning(sketchsyncSyncLog) << "SyncTransport: send failed:"
                                     << QString::fromStdString(sent.unwrap_err().message);
    }
    return sent;
}

bool SyncTransport::reconnectPending() const {
    return reconnect_timer_->isActive();
}

void SyncTransport::setState(ConnectionState state) {
    if (state_ != state) {
        qCDebug(sketchsyncSyncLog) << "SyncTransport:" << connectionStateName(state_)
                                   << "->" << connectionStateName(state);
        state_ = state;
        emit stateChanged(state);
    }
}

void SyncTransport::connectNow() {
    abnormal_ = false;
    inbound_.clear();
    discarding_ = false;
    setState(ConnectionState::Connecting);
    backend_->open(options_.endpoint);
}

void SyncTransport::scheduleReconnect() {
    const auto delay = options_.reconnect.delay_for_attempt(attempts_ + 1);
    if (!delay) {
        qWarning() << "SyncTransport: giving up on" << options_.endpoint.toString()
                   << "after" << attempts_ << "reconnect attempts";
        setState(ConnectionState::Disconnected);
        emit reconnectGaveUp();
        return;
    }

    ++attempts_;
    setState(ConnectionState::Reconnecting);
    const int delay_ms = static_cast<int>(delay->count());
    qInfo() << "SyncTransport: reconnecting in" << delay_ms << "ms (attempt" << attempts_ << ")";
    emit reconnectScheduled(attempts_, delay_ms);
    reconnect_timer_->start(delay_ms);
}

void SyncTransport::handleOpen() {
    if (state_ != ConnectionState::Connecting) {
        return;
    }
    qInfo() << "SyncTransport: connected to" << options_.endpoint.toString();
    attempts_ = 0;
    setState(ConnectionState::Connected);
    emit connected();
}

void SyncTransport::handleClosed(int code, const QString& reason) {
    inbound_.clear();
    discarding_ = false;

    // Closed locally, or a late report for a connection already given up on.
    if (state_ == ConnectionState::Disconnected || state_ == ConnectionState::Reconnecting) {
        return;
    }

    if (state_ == ConnectionState::Connected) {
        emit disconnected(code);
    }

    if (code == CLOSE_CODE_NORMAL && !abnormal_) {
        qInfo() << "SyncTransport: closed cleanly" << reason;
        attempts_ = 0;
        setState(ConnectionState::Disconnected);
        return;
    }

    qWarning() << "SyncTransport: connection lost, code" << code << reason;
    scheduleReconnect();
}

void SyncTransport::handleBinaryFrame(const QByteArray& frame, bool isLastFrame) {
    if (state_ != ConnectionState::Connected) {
        return;
    }

    if (discarding_) {
        discarding_ = !isLastFrame;
        return;
    }

    if (inbound_.size() + frame.size() > options_.max_message_bytes) {
        qCWarning(sketchsyncSyncLog) << "SyncTransport: dropping inbound message larger than"
                                     << options_.max_message_bytes << "bytes";
        inbound_.clear();
        discarding_ = !isLastFrame;
        return;
    }

    inbound_.append(frame);
    if (!isLastFrame) {
        return;
    }

    QByteArray message;
    message.swap(inbound_);
    emit snapshotReceived(message);
}

void SyncTransport::handleText(const QString& message) {
    const auto parsed = parseControlMessage(message.toUtf8());
    if (!parsed) {
        qCDebug(sketchsyncSyncLog) << "SyncTransport: ignoring unrecognized text message";
        return;
    }

    switch (parsed->kind) {
        case ControlMessage::Kind::Error:
            qWarning() << "SyncTransport: relay error:" << parsed->message;
            break;
        case ControlMessage::Kind::Info:
            qInfo() << "SyncTransport: relay info:" << parsed->message;
            break;
        case ControlMessage::Kind::Other:
            qCDebug(sketchsyncSyncLog) << "SyncTransport: ignoring control message" << parsed->type;
            return;
    }
    emit controlMessageReceived(parsed->type, parsed->message);
}

void SyncTransport::handleError(const QString& message) {
    abnormal_ = true;
    qCWarning(sketchsyncSyncLog) << "SyncTransport: socket error:" << message;
    emit error(message);
}

} // namespace sketchsync::network
