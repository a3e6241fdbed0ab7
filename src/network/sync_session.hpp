#pragma once

#include "core/replica_store.hpp"
#include "core/result.hpp"
#include "network/transport.hpp"
#include "storage/replica_repository.hpp"
#include <QByteArray>
#include <QLoggingCategory>
#include <QObject>
#include <memory>
#include <span>
#include <string>

class QTimer;

Q_DECLARE_LOGGING_CATEGORY(sketchsyncStoreLog)

namespace sketchsync::network {

[[nodiscard]] inline QByteArray toByteArray(const std::vector<uint8_t>& bytes) {
    return QByteArray(reinterpret_cast<const char*>(bytes.data()), static_cast<qsizetype>(bytes.size()));
}

[[nodiscard]] inline std::span<const uint8_t> asBytes(const QByteArray& bytes) {
    return {reinterpret_cast<const uint8_t*>(bytes.constData()), static_cast<size_t>(bytes.size())};
}

/**
 * SyncSession - Full-state sync between one ReplicaStore and one transport.
 *
 * Sends the whole history once per connection and again after every local
 * change. Remote snapshots are merged into the store and never echoed.
 * Neither the store nor the transport is owned.
 */
class SyncSession : public QObject {
    Q_OBJECT

public:
    SyncSession(store::ReplicaStore& store, SyncTransport& transport, QObject* parent = nullptr);
    ~SyncSession() override;

    /**
     * Persist the replica after changes, coalesced per event loop turn.
     * The repository must outlive the session.
     */
    void enablePersistence(storage::ReplicaRepository& repository,
                           std::string doc_key = storage::ReplicaRepository::DEFAULT_DOC_KEY);

    [[nodiscard]] Result<void, Error> persistNow();

    [[nodiscard]] int snapshotsSent() const { return sent_; }
    [[nodiscard]] int snapshotsMerged() const { return merged_; }
    [[nodiscard]] int snapshotsRejected() const { return rejected_; }

signals:
    void remoteMerged(int changesAdded);
    void mergeRejected(const QString& reason);
    void persistFailed(const QString& reason);

private:
    store::ReplicaStore& store_;
    SyncTransport& transport_;
    store::ReplicaStore::ObserverId observer_id_ = 0;

    storage::ReplicaRepository* repository_ = nullptr;
    std::string doc_key_;
    std::unique_ptr<QTimer> persist_timer_;

    int sent_ = 0;
    int merged_ = 0;
    int rejected_ = 0;

    void onStoreChanged(store::ChangeOrigin origin);
    void onSnapshotReceived(const QByteArray& bytes);
    void sendFullState();
};

} // namespace sketchsync::network
