#pragma once

#include "core/canvas.hpp"
#include <QObject>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

class QTimer;

namespace sketchsync::ui {

/**
 * CursorHeartbeat - Re-sends the last known pointer position on a fixed
 * interval so a resting cursor stays live for other replicas.
 *
 * It only produces positions; pointer-move updates go through the same sink
 * independently.
 */
class CursorHeartbeat : public QObject {
    Q_OBJECT

public:
    using Sink = std::function<void(double x, double y)>;

    explicit CursorHeartbeat(Sink sink,
                             std::chrono::milliseconds interval = std::chrono::milliseconds(1000),
                             QObject* parent = nullptr);
    ~CursorHeartbeat() override;

    /**
     * Remember the latest pointer position without sending it.
     */
    void setPosition(double x, double y);

    void start();
    void stop();

    [[nodiscard]] bool isActive() const;
    [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }
    [[nodiscard]] const std::optional<canvas::Point>& lastPosition() const { return position_; }

signals:
    void beat(double x, double y);

private:
    Sink sink_;
    std::chrono::milliseconds interval_;
    std::unique_ptr<QTimer> timer_;
    std::optional<canvas::Point> position_;

    void tick();
};

} // namespace sketchsync::ui
