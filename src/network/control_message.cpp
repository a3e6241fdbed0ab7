#include "network/control_message.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace sketchsync::network {

std::optional<ControlMessage> parseControlMessage(const QByteArray& payload) {
    if (payload.isEmpty()) {
        return std::nullopt;
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }

    const auto obj = doc.object();
    const auto type = obj.value(QStringLiteral("type"));
    if (!type.isString()) {
        return std::nullopt;
    }

    ControlMessage out;
    out.type = type.toString();
    out.message = obj.value(QStringLiteral("message")).toString();
    if (out.type == QStringLiteral("error")) {
        out.kind = ControlMessage::Kind::Error;
    } else if (out.type == QStringLiteral("info")) {
        out.kind = ControlMessage::Kind::Info;
    }
    return out;
}

QByteArray serializeControlMessage(const ControlMessage& message) {
    QJsonObject obj;
    obj.insert(QStringLiteral("type"), message.type);
    obj.insert(QStringLiteral("message"), message.message);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

} // namespace sketchsync::network
