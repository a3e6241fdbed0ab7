#include "ui/controllers/SketchController.hpp"
#include "core/presence.hpp"

#include <QDebug>
#include <QVariantMap>

namespace sketchsync::ui {

namespace {

QString current_title(const canvas::Document& doc) {
    return doc.canvas ? QString::fromStdString(doc.canvas->title) : QString();
}

QVariantMap to_variant(const canvas::Point& p) {
    QVariantMap out;
    out["x"] = p.x;
    out["y"] = p.y;
    return out;
}

QVariantMap to_variant(const canvas::CanvasElement& element) {
    QVariantMap out;
    out["id"] = QString::fromStdString(canvas::element_id(element));
    const auto type = canvas::type_name(canvas::get_type(element));
    out["type"] = QString::fromLatin1(type.data(), static_cast<qsizetype>(type.size()));
    out["creator"] = QString::fromStdString(canvas::element_creator(element));
    out["timestamp"] = static_cast<qint64>(canvas::element_timestamp(element).millis());
    std::visit([&out](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, canvas::Stroke>) {
            QVariantList points;
            for (const auto& p : e.points) {
                points.append(to_variant(p));
            }
            out["points"] = points;
            out["color"] = QString::fromStdString(e.color);
            out["width"] = e.width;
        } else if constexpr (std::is_same_v<T, canvas::Note>) {
            out["text"] = QString::fromStdString(e.text);
            out["position"] = to_variant(e.position);
            out["color"] = QString::fromStdString(e.color);
        }
    }, element);
    return out;
}

} // namespace

SketchController::SketchController(store::ReplicaStore& store,
                                   network::SyncTransport& transport,
                                   std::chrono::milliseconds heartbeat_interval,
                                   QObject* parent)
    : QObject(parent)
    , store_(store)
    , transport_(transport)
    , heartbeat_(std::make_unique<CursorHeartbeat>(
          [this](double x, double y) { applyCursor(x, y); }, heartbeat_interval))
    , connected_(transport.isConnected())
    , title_(current_title(store.document()))
    , init_error_(QString::fromStdString(store.initialization_error().value_or(std::string())))
{
    observer_id_ = store_.subscribe([this](const canvas::Document&, store::ChangeOrigin) {
        onDocumentChanged();
    });

    connect(&transport_, &network::SyncTransport::stateChanged,
            this, [this](network::ConnectionState) {
                emit connectionStateChanged();
                const bool now_connected = transport_.isConnected();
                if (now_connected != connected_) {
                    connected_ = now_connected;
                    emit connectedChanged();
                }
            });
}

SketchController::~SketchController() {
    heartbeat_->stop();
    store_.unsubscribe(observer_id_);
}

bool SketchController::isConnected() const {
    return connected_;
}

QString SketchController::connectionState() const {
    return network::connectionStateName(transport_.state());
}

QString SketchController::initializationError() const {
    return init_error_;
}

QString SketchController::actorId() const {
    return QString::fromStdString(store_.actor());
}

QString SketchController::title() const {
    return title_;
}

int SketchController::elementCount() const {
    const auto& doc = store_.document();
    return doc.canvas ? static_cast<int>(doc.canvas->elements.size()) : 0;
}

bool SketchController::addStroke(const QVariantList& points, const QString& color, int width) {
    std::vector<canvas::Point> parsed;
    parsed.reserve(static_cast<size_t>(points.size()));
    for (const auto& value : points) {
        const auto map = value.toMap();
        bool ok_x = false;
        bool ok_y = false;
        const double x = map.value("x").toDouble(&ok_x);
        const double y = map.value("y").toDouble(&ok_y);
        if (!ok_x || !ok_y) {
            emit error(QStringLiteral("Stroke point without numeric x/y"));
            return false;
        }
        parsed.push_back(canvas::Point{x, y});
    }
    return report(store_.add_stroke(std::move(parsed), color.toStdString(), width));
}

bool SketchController::addNote(const QString& text, double x, double y, const QString& color) {
    return report(store_.add_note(text.toStdString(), canvas::Point{x, y}, color.toStdString()));
}

bool SketchController::updateNote(const QString& id, const QString& text) {
    return report(store_.update_note(id.toStdString(), text.toStdString()));
}

bool SketchController::updateTitle(const QString& title) {
    return report(store_.update_title(title.toStdString()));
}

bool SketchController::updateCursor(double x, double y) {
    heartbeat_->setPosition(x, y);
    return report(store_.update_cursor(store_.actor(), x, y));
}

bool SketchController::resetDocument() {
    return report(store_.reset());
}

QVariantList SketchController::elements() const {
    QVariantList out;
    const auto& doc = store_.document();
    if (!doc.canvas) {
        return out;
    }
    for (const auto& element : doc.canvas->elements) {
        out.append(to_variant(element));
    }
    return out;
}

QVariantList SketchController::liveCursors() const {
    QVariantList out;
    for (const auto& cursor : presence::live_cursors(store_.document(), store_.actor(), Timestamp::now())) {
        QVariantMap entry;
        entry["actorId"] = QString::fromStdString(cursor.actor);
        entry["label"] = QString::fromStdString(cursor.label);
        entry["x"] = cursor.position.x;
        entry["y"] = cursor.position.y;
        entry["lastActive"] = static_cast<qint64>(cursor.last_active.millis());
        out.append(entry);
    }
    return out;
}

void SketchController::startPresence() {
    heartbeat_->start();
}

void SketchController::stopPresence() {
    heartbeat_->stop();
}

bool SketchController::report(const Result<void, Error>& result) {
    if (result.is_ok()) {
        return true;
    }
    const auto message = QString::fromStdString(result.unwrap_err().message);
    qWarning() << "SketchController:" << message;
    emit error(message);

    // A failed repair changes the status without changing the document.
    refreshStatus();
    return false;
}

void SketchController::applyCursor(double x, double y) {
    auto result = store_.update_cursor(store_.actor(), x, y);
    if (result.is_err()) {
        qCDebug(sketchsyncSyncLog) << "SketchController: heartbeat dropped:"
                                   << QString::fromStdString(result.unwrap_err().message);
    }
}

void SketchController::onDocumentChanged() {
    refreshStatus();
    emit documentChanged();
}

void SketchController::refreshStatus() {
    const auto title = current_title(store_.document());
    if (title != title_) {
        title_ = title;
        emit titleChanged();
    }

    const auto init_error = QString::fromStdString(store_.initialization_error().value_or(std::string()));
    if (init_error != init_error_) {
        init_error_ = init_error;
        emit initializationErrorChanged();
    }
}

} // namespace sketchsync::ui
