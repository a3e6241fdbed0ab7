#include "ui/controllers/CursorHeartbeat.hpp"

#include <QTimer>

namespace sketchsync::ui {

CursorHeartbeat::CursorHeartbeat(Sink sink, std::chrono::milliseconds interval, QObject* parent)
    : QObject(parent)
    , sink_(std::move(sink))
    , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000))
    , timer_(std::make_unique<QTimer>())
{
    timer_->setInterval(interval_);
    connect(timer_.get(), &QTimer::timeout, this, &CursorHeartbeat::tick);
}

CursorHeartbeat::~CursorHeartbeat() {
    timer_->stop();
}

void CursorHeartbeat::setPosition(double x, double y) {
    position_ = canvas::Point{x, y};
}

void CursorHeartbeat::start() {
    timer_->start();
}

void CursorHeartbeat::stop() {
    timer_->stop();
}

bool CursorHeartbeat::isActive() const {
    return timer_->isActive();
}

void CursorHeartbeat::tick() {
    // Nothing to refresh until the pointer has been seen once.
    if (!position_) {
        return;
    }
    if (sink_) {
        sink_(position_->x, position_->y);
    }
    emit beat(position_->x, position_->y);
}

} // namespace sketchsync::ui
