#include "network/sync_session.hpp"

#include <QDebug>
#include <QTimer>

Q_LOGGING_CATEGORY(sketchsyncStoreLog, "sketchsync.store")

namespace sketchsync::network {

SyncSession::SyncSession(store::ReplicaStore& store, SyncTransport& transport, QObject* parent)
    : QObject(parent)
    , store_(store)
    , transport_(transport)
    , persist_timer_(std::make_unique<QTimer>())
{
    persist_timer_->setSingleShot(true);
    persist_timer_->setInterval(0);
    connect(persist_timer_.get(), &QTimer::timeout, this, [this]() {
        auto result = persistNow();
        if (result.is_err()) {
            const auto message = QString::fromStdString(result.unwrap_err().message);
            qWarning() << "SyncSession: failed to persist replica:" << message;
            emit persistFailed(message);
        }
    });

    observer_id_ = store_.subscribe([this](const canvas::Document&, store::ChangeOrigin origin) {
        onStoreChanged(origin);
    });

    connect(&transport_, &SyncTransport::connected, this, &SyncSession::sendFullState);
    connect(&transport_, &SyncTransport::snapshotReceived, this, &SyncSession::onSnapshotReceived);
}

SyncSession::~SyncSession() {
    store_.unsubscribe(observer_id_);
}

void SyncSession::enablePersistence(storage::ReplicaRepository& repository, std::string doc_key) {
    repository_ = &repository;
    doc_key_ = std::move(doc_key);
}

Result<void, Error> SyncSession::persistNow() {
    if (!repository_) {
        return Result<void, Error>::err(Error{"Persistence is not enabled", ErrorCode::Storage});
    }
    return repository_->save_snapshot(storage::ReplicaSnapshot{
        .doc_key = doc_key_,
        .snapshot = store_.save(),
        .actor_id = store_.actor(),
        .updated_at = Timestamp::now()
    });
}

void SyncSession::onStoreChanged(store::ChangeOrigin origin) {
    if (repository_) {
        persist_timer_->start();
    }

    switch (origin) {
        case store::ChangeOrigin::Local:
        case store::ChangeOrigin::Reset:
            sendFullState();
            break;
        case store::ChangeOrigin::Remote:
        case store::ChangeOrigin::Loaded:
            break;
    }
}

void SyncSession::onSnapshotReceived(const QByteArray& bytes) {
    auto result = store_.merge_incoming(asBytes(bytes));
    if (result.is_err()) {
        ++rejected_;
        const auto reason = QString::fromStdString(result.unwrap_err().message);
        qCWarning(sketchsyncStoreLog) << "SyncSession: discarded remote snapshot:" << reason;
        emit mergeRejected(reason);
        return;
    }

    const auto& stats = result.unwrap();
    if (stats.added == 0) {
        qCDebug(sketchsyncStoreLog) << "SyncSession: remote snapshot had nothing new ("
                                    << stats.duplicates << "known changes)";
        return;
    }

    ++merged_;
    qCDebug(sketchsyncStoreLog) << "SyncSession: merged" << stats.added << "remote changes";
    emit remoteMerged(static_cast<int>(stats.added));
}

void SyncSession::sendFullState() {
    if (!transport_.isConnected()) {
        return;
    }
    auto result = transport_.sendSnapshot(toByteArray(store_.save()));
    if (result.is_ok()) {
        ++sent_;
    }
}

} // namespace sketchsync::network
