#include "ui/cli/show_document.hpp"
#include "core/presence.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace sketchsync::ui {

namespace {

[[nodiscard]] QString render_id_suffix(const std::string& id, bool includeIds) {
    return includeIds ? (QStringLiteral(" (") + QString::fromStdString(id) + QStringLiteral(")")) : QString{};
}

[[nodiscard]] QString render_element_line(const canvas::CanvasElement& element, bool includeIds) {
    return std::visit([includeIds](const auto& e) -> QString {
        using T = std::decay_t<decltype(e)>;
        const auto suffix = render_id_suffix(e.id, includeIds);
        const auto by = QStringLiteral(" by ") + QString::fromStdString(presence::cursor_label(e.creator));
        if constexpr (std::is_same_v<T, canvas::Stroke>) {
            return QStringLiteral("- stroke ") + QString::number(e.points.size()) + QStringLiteral(" pts, ")
                + QString::fromStdString(e.color) + QStringLiteral(" w") + QString::number(e.width)
                + by + suffix;
        } else {
            return QStringLiteral("- note \"") + QString::fromStdString(e.text) + QStringLiteral("\" at (")
                + QString::number(e.position.x) + QStringLiteral(", ") + QString::number(e.position.y)
                + QStringLiteral(")") + by + suffix;
        }
    }, element);
}

[[nodiscard]] QJsonObject point_json(const canvas::Point& p) {
    QJsonObject obj;
    obj.insert(QStringLiteral("x"), p.x);
    obj.insert(QStringLiteral("y"), p.y);
    return obj;
}

[[nodiscard]] QJsonObject element_json(const canvas::CanvasElement& element, bool includeIds) {
    QJsonObject obj;
    const auto type = canvas::type_name(canvas::get_type(element));
    obj.insert(QStringLiteral("type"), QString::fromLatin1(type.data(), static_cast<qsizetype>(type.size())));
    if (includeIds) {
        obj.insert(QStringLiteral("id"), QString::fromStdString(canvas::element_id(element)));
    }
    obj.insert(QStringLiteral("creator"), QString::fromStdString(canvas::element_creator(element)));
    obj.insert(QStringLiteral("timestamp"), static_cast<qint64>(canvas::element_timestamp(element).millis()));

    std::visit([&obj](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, canvas::Stroke>) {
            QJsonArray points;
            for (const auto& p : e.points) {
                points.append(point_json(p));
            }
            obj.insert(QStringLiteral("points"), points);
            obj.insert(QStringLiteral("color"), QString::fromStdString(e.color));
            obj.insert(QStringLiteral("width"), e.width);
        } else if constexpr (std::is_same_v<T, canvas::Note>) {
            obj.insert(QStringLiteral("text"), QString::fromStdString(e.text));
            obj.insert(QStringLiteral("position"), point_json(e.position));
            obj.insert(QStringLiteral("color"), QString::fromStdString(e.color));
        }
    }, element);
    return obj;
}

} // namespace

QString format_document(const canvas::Document& doc,
                        const ActorId& self,
                        Timestamp now,
                        const ShowOptions& options) {
    if (!doc.canvas) {
        return QStringLiteral("(document has no canvas)\n");
    }

    QStringList out;
    out.append(QStringLiteral("# ") + QString::fromStdString(doc.canvas->title));
    if (doc.canvas->elements.empty()) {
        out.append(QStringLiteral("(empty canvas)"));
    }
    for (const auto& element : doc.canvas->elements) {
        out.append(render_element_line(element, options.includeIds));
    }

    const auto cursors = presence::live_cursors(doc, self, now);
    if (!cursors.empty()) {
        out.append(QStringLiteral("Live cursors:"));
        for (const auto& cursor : cursors) {
            out.append(QStringLiteral("  ") + QString::fromStdString(cursor.label)
                       + QStringLiteral(" at (") + QString::number(cursor.position.x)
                       + QStringLiteral(", ") + QString::number(cursor.position.y) + QStringLiteral(")"));
        }
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_document_json(const canvas::Document& doc,
                             const ActorId& self,
                             Timestamp now,
                             const ShowOptions& options) {
    QJsonObject root;
    if (!doc.canvas) {
        root.insert(QStringLiteral("canvas"), QJsonValue::Null);
        return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
    }

    root.insert(QStringLiteral("title"), QString::fromStdString(doc.canvas->title));

    QJsonArray elements;
    for (const auto& element : doc.canvas->elements) {
        elements.append(element_json(element, options.includeIds));
    }
    root.insert(QStringLiteral("elements"), elements);

    QJsonArray cursors;
    for (const auto& cursor : presence::live_cursors(doc, self, now)) {
        QJsonObject entry;
        entry.insert(QStringLiteral("actorId"), QString::fromStdString(cursor.actor));
        entry.insert(QStringLiteral("label"), QString::fromStdString(cursor.label));
        entry.insert(QStringLiteral("x"), cursor.position.x);
        entry.insert(QStringLiteral("y"), cursor.position.y);
        entry.insert(QStringLiteral("lastActive"), static_cast<qint64>(cursor.last_active.millis()));
        cursors.append(entry);
    }
    root.insert(QStringLiteral("cursors"), cursors);

    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

} // namespace sketchsync::ui
