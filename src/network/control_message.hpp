#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

namespace sketchsync::network {

/**
 * ControlMessage - Out of band notice sent as a text frame.
 *
 * {"type": "error" | "info" | ..., "message": "..."}
 */
struct ControlMessage {
    enum class Kind {
        Error,
        Info,
        Other
    };

    Kind kind = Kind::Other;
    QString type;
    QString message;
};

[[nodiscard]] std::optional<ControlMessage> parseControlMessage(const QByteArray& payload);
[[nodiscard]] QByteArray serializeControlMessage(const ControlMessage& message);

} // namespace sketchsync::network
