#pragma once

#include "core/result.hpp"
#include "network/reconnect_policy.hpp"
#include "network/socket_backend.hpp"
#include <QByteArray>
#include <QLoggingCategory>
#include <QObject>
#include <QString>
#include <QUrl>
#include <memory>

class QTimer;

Q_DECLARE_LOGGING_CATEGORY(sketchsyncSyncLog)

namespace sketchsync::network {

inline constexpr const char* DEFAULT_ENDPOINT = "ws://localhost:4080/sync";

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};

[[nodiscard]] QString connectionStateName(ConnectionState state);

struct TransportOptions {
    QUrl endpoint{QString::fromLatin1(DEFAULT_ENDPOINT)};
    ReconnectPolicy reconnect;
    qsizetype max_message_bytes = 64 * 1024 * 1024;
};

/**
 * SyncTransport - Connection to the rendezvous relay.
 *
 * Disconnected --open()--> Connecting --socket open--> Connected
 * Connected/Connecting --abnormal close--> Reconnecting --delay--> Connecting
 * any --clean close or close()--> Disconnected
 *
 * Inbound binary messages may arrive split over several frames; they are
 * buffered until the last frame and then emitted as one snapshot.
 */
class SyncTransport : public QObject {
    Q_OBJECT

public:
    explicit SyncTransport(TransportOptions options,
                           std::unique_ptr<SocketBackend> backend = nullptr,
                           QObject* parent = nullptr);
    ~SyncTransport() override;

    /**
     * Connect to the endpoint. No-op while connecting or connected.
     */
    void open();

    /**
     * Close cleanly and cancel any pending reconnect.
     */
    void close();

    /**
     * Send one binary snapshot. Fails with NotConnected when offline.
     */
    Result<void, Error> sendSnapshot(const QByteArray& bytes);

    [[nodiscard]] ConnectionState state() const { return state_; }
    [[nodiscard]] bool isConnected() const { return state_ == ConnectionState::Connected; }
    [[nodiscard]] int reconnectAttempts() const { return attempts_; }
    [[nodiscard]] const QUrl& endpoint() const { return options_.endpoint; }
    [[nodiscard]] bool reconnectPending() const;

signals:
    void stateChanged(sketchsync::network::ConnectionState state);
    void connected();
    void disconnected(int closeCode);
    void snapshotReceived(const QByteArray& bytes);
    void controlMessageReceived(const QString& type, const QString& message);
    void reconnectScheduled(int attempt, int delayMs);
    void reconnectGaveUp();
    void error(const QString& message);

private:
    TransportOptions options_;
    std::unique_ptr<SocketBackend> backend_;
    std::unique_ptr<QTimer> reconnect_timer_;

    ConnectionState state_ = ConnectionState::Disconnected;
    int attempts_ = 0;
    bool abnormal_ = false;

    QByteArray inbound_;
    bool discarding_ = false;

    void setState(ConnectionState state);
    void connectNow();
    void scheduleReconnect();

    void handleOpen();
    void handleClosed(int code, const QString& reason);
    void handleBinaryFrame(const QByteArray& frame, bool isLastFrame);
    void handleText(const QString& message);
    void handleError(const QString& message);
};

} // namespace sketchsync::network

Q_DECLARE_METATYPE(sketchsync::network::ConnectionState)
