#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <functional>
#include <memory>

namespace sketchsync::network {

/**
 * Close code of a clean WebSocket shutdown (RFC 6455).
 */
inline constexpr int CLOSE_CODE_NORMAL = 1000;

/**
 * Reported when the connection dropped without a close handshake.
 */
inline constexpr int CLOSE_CODE_ABNORMAL = 1006;

/**
 * SocketBackend - Abstract interface for the duplex message socket.
 *
 * on_closed is reported at most once per open().
 */
class SocketBackend {
public:
    virtual ~SocketBackend() = default;

    virtual void open(const QUrl& url) = 0;

    /**
     * Start a clean close (code 1000).
     */
    virtual void close() = 0;

    virtual Result<void, Error> send_binary(const QByteArray& data) = 0;

    // Callbacks
    std::function<void()> on_open;
    std::function<void(int close_code, QString reason)> on_closed;
    std::function<void(QByteArray frame, bool is_last_frame)> on_binary_frame;
    std::function<void(QString message)> on_text;
    std::function<void(QString message)> on_error;
};

/**
 * Create the production WebSocket backend.
 */
std::unique_ptr<SocketBackend> createSocketBackend();

} // namespace sketchsync::network
