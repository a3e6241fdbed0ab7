#pragma once

#include "core/replica_store.hpp"
#include "network/transport.hpp"
#include "ui/controllers/CursorHeartbeat.hpp"
#include <QObject>
#include <QString>
#include <QVariantList>
#include <chrono>
#include <memory>

namespace sketchsync::ui {

/**
 * SketchController - Facade for rendering and input collaborators.
 *
 * Holds references to the store and the transport; neither is owned.
 * Rendering reads elements()/liveCursors() and never mutates the document.
 */
class SketchController : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool connected READ isConnected NOTIFY connectedChanged)
    Q_PROPERTY(QString connectionState READ connectionState NOTIFY connectionStateChanged)
    Q_PROPERTY(QString initializationError READ initializationError NOTIFY initializationErrorChanged)
    Q_PROPERTY(QString actorId READ actorId CONSTANT)
    Q_PROPERTY(QString title READ title NOTIFY titleChanged)
    Q_PROPERTY(int elementCount READ elementCount NOTIFY documentChanged)

public:
    SketchController(store::ReplicaStore& store,
                     network::SyncTransport& transport,
                     std::chrono::milliseconds heartbeat_interval = std::chrono::milliseconds(1000),
                     QObject* parent = nullptr);
    ~SketchController() override;

    [[nodiscard]] bool isConnected() const;
    [[nodiscard]] QString connectionState() const;
    [[nodiscard]] QString initializationError() const;
    [[nodiscard]] QString actorId() const;
    [[nodiscard]] QString title() const;
    [[nodiscard]] int elementCount() const;

    /**
     * points: list of {"x": number, "y": number} maps.
     */
    Q_INVOKABLE bool addStroke(const QVariantList& points, const QString& color, int width);
    Q_INVOKABLE bool addNote(const QString& text, double x, double y, const QString& color);
    Q_INVOKABLE bool updateNote(const QString& id, const QString& text);
    Q_INVOKABLE bool updateTitle(const QString& title);

    /**
     * Pointer moved. Also becomes the position the heartbeat repeats.
     */
    Q_INVOKABLE bool updateCursor(double x, double y);
    Q_INVOKABLE bool resetDocument();

    Q_INVOKABLE QVariantList elements() const;
    Q_INVOKABLE QVariantList liveCursors() const;

    Q_INVOKABLE void startPresence();
    Q_INVOKABLE void stopPresence();

    [[nodiscard]] CursorHeartbeat& heartbeat() { return *heartbeat_; }

signals:
    void connectedChanged();
    void connectionStateChanged();
    void initializationErrorChanged();
    void titleChanged();
    void documentChanged();
    void error(const QString& message);

private:
    store::ReplicaStore& store_;
    network::SyncTransport& transport_;
    std::unique_ptr<CursorHeartbeat> heartbeat_;
    store::ReplicaStore::ObserverId observer_id_ = 0;

    bool connected_ = false;
    QString title_;
    QString init_error_;

    bool report(const Result<void, Error>& result);
    void applyCursor(double x, double y);
    void onDocumentChanged();
    void refreshStatus();
};

} // namespace sketchsync::ui
