#include <catch2/catch_test_macros.hpp>

#include "integration/test_support.hpp"
#include "network/transport.hpp"

#include <QSignalSpy>

using namespace sketchsync;
using namespace sketchsync::network;
using namespace sketchsync::testing;
using namespace std::chrono_literals;

namespace {

struct Harness {
    FakeSocketBackend* backend = nullptr;
    std::unique_ptr<SyncTransport> transport;

    explicit Harness(TransportOptions options = fastOptions()) {
        auto fake = std::make_unique<FakeSocketBackend>();
        backend = fake.get();
        transport = std::make_unique<SyncTransport>(std::move(options), std::move(fake));
    }

    static TransportOptions fastOptions() {
        TransportOptions options;
        options.endpoint = QUrl(QStringLiteral("ws://relay.test:4080/sync"));
        options.reconnect.initial_delay = 10ms;
        return options;
    }

    void connect() {
        transport->open();
        backend->acceptOpen();
    }
};

} // namespace

TEST_CASE("SyncTransport: open connects to the endpoint", "[network][transport]") {
    Harness h;
    QSignalSpy stateSpy(h.transport.get(), &SyncTransport::stateChanged);
    QSignalSpy connectedSpy(h.transport.get(), &SyncTransport::connected);

    REQUIRE(h.transport->state() == ConnectionState::Disconnected);

    h.transport->open();
    REQUIRE(h.transport->state() == ConnectionState::Connecting);
    REQUIRE(h.backend->open_calls == 1);
    REQUIRE(h.backend->last_url == QUrl(QStringLiteral("ws://relay.test:4080/sync")));

    SECTION("opening again while connecting is a no-op") {
        h.transport->open();
        REQUIRE(h.backend->open_calls == 1);
    }

    h.backend->acceptOpen();
    REQUIRE(h.transport->isConnected());
    REQUIRE(connectedSpy.count() == 1);
    REQUIRE(stateSpy.count() == 2);
}

TEST_CASE("SyncTransport: sending requires a connection", "[network][transport]") {
    Harness h;

    auto offline = h.transport->sendSnapshot("abc");
    REQUIRE(offline.is_err());
    REQUIRE(offline.unwrap_err().is(ErrorCode::NotConnected));
    REQUIRE(h.backend->sent.isEmpty());

    h.connect();
    REQUIRE(h.transport->sendSnapshot("abc").is_ok());
    REQUIRE(h.backend->sent == QList<QByteArray>{"abc"});
}

TEST_CASE("SyncTransport: a clean close does not reconnect", "[network][transport]") {
    Harness h;
    h.connect();
    QSignalSpy disconnectedSpy(h.transport.get(), &SyncTransport::disconnected);
    QSignalSpy scheduledSpy(h.transport.get(), &SyncTransport::reconnectScheduled);

    h.backend->remoteClose();

    REQUIRE(h.transport->state() == ConnectionState::Disconnected);
    REQUIRE(disconnectedSpy.count() == 1);
    REQUIRE(disconnectedSpy.at(0).at(0).toInt() == CLOSE_CODE_NORMAL);
    REQUIRE(scheduledSpy.count() == 0);
    REQUIRE_FALSE(h.transport->reconnectPending());

    spinFor(50);
    REQUIRE(h.backend->open_calls == 1);
}

TEST_CASE("SyncTransport: an abnormal close schedules a reconnect", "[network][transport]") {
    Harness h;
    h.connect();
    QSignalSpy scheduledSpy(h.transport.get(), &SyncTransport::reconnectScheduled);

    h.backend->drop();

    REQUIRE(h.transport->state() == ConnectionState::Reconnecting);
    REQUIRE(h.transport->reconnectPending());
    REQUIRE(scheduledSpy.count() == 1);
    REQUIRE(scheduledSpy.at(0).at(0).toInt() == 1);
    REQUIRE(scheduledSpy.at(0).at(1).toInt() == 10);

    REQUIRE(spinUntil([&] { return h.backend->open_calls == 2; }));
    REQUIRE(h.transport->state() == ConnectionState::Connecting);

    h.backend->acceptOpen();
    REQUIRE(h.transport->isConnected());
    REQUIRE(h.transport->reconnectAttempts() == 0);
}

TEST_CASE("SyncTransport: a socket error makes the close abnormal", "[network][transport]") {
    Harness h;
    QSignalSpy errorSpy(h.transport.get(), &SyncTransport::error);

    h.transport->open();
    h.backend->refuse();

    REQUIRE(errorSpy.count() == 1);
    REQUIRE(h.transport->state() == ConnectionState::Reconnecting);
}

TEST_CASE("SyncTransport: gives up after the configured attempts", "[network][transport]") {
    auto options = Harness::fastOptions();
    options.reconnect.max_attempts = 2;
    Harness h(options);
    QSignalSpy gaveUpSpy(h.transport.get(), &SyncTransport::reconnectGaveUp);
    QSignalSpy scheduledSpy(h.transport.get(), &SyncTransport::reconnectScheduled);

    h.transport->open();
    h.backend->refuse();
    REQUIRE(spinUntil([&] { return h.backend->open_calls == 2; }));
    h.backend->refuse();
    REQUIRE(spinUntil([&] { return h.backend->open_calls == 3; }));
    h.backend->refuse();

    REQUIRE(gaveUpSpy.count() == 1);
    REQUIRE(scheduledSpy.count() == 2);
    REQUIRE(h.transport->state() == ConnectionState::Disconnected);
    REQUIRE_FALSE(h.transport->reconnectPending());

    SECTION("open() starts a fresh round of attempts") {
        h.transport->open();
        h.backend->refuse();
        REQUIRE(h.transport->state() == ConnectionState::Reconnecting);
        REQUIRE(h.transport->reconnectAttempts() == 1);
    }
}

TEST_CASE("SyncTransport: close cancels a pending reconnect", "[network][transport]") {
    auto options = Harness::fastOptions();
    options.reconnect.initial_delay = 30ms;
    Harness h(options);
    h.connect();
    h.backend->drop();
    REQUIRE(h.transport->reconnectPending());

    h.transport->close();

    REQUIRE(h.transport->state() == ConnectionState::Disconnected);
    REQUIRE_FALSE(h.transport->reconnectPending());
    spinFor(80);
    REQUIRE(h.backend->open_calls == 1);
}

TEST_CASE("SyncTransport: local close is clean", "[network][transport]") {
    Harness h;
    h.connect();
    QSignalSpy scheduledSpy(h.transport.get(), &SyncTransport::reconnectScheduled);

    h.transport->close();

    REQUIRE(h.backend->close_calls == 1);
    REQUIRE(h.transport->state() == ConnectionState::Disconnected);
    REQUIRE(scheduledSpy.count() == 0);
}

TEST_CASE("SyncTransport: multi-frame messages are reassembled", "[network][transport]") {
    Harness h;
    h.connect();
    QSignalSpy snapshotSpy(h.transport.get(), &SyncTransport::snapshotReceived);

    h.backend->deliver("SK", false);
    h.backend->deliver("\x01\x01", false);
    REQUIRE(snapshotSpy.count() == 0);
    h.backend->deliver("tail", true);

    REQUIRE(snapshotSpy.count() == 1);
    REQUIRE(snapshotSpy.at(0).at(0).toByteArray() == QByteArray("SK\x01\x01tail"));

    SECTION("a drop discards a partial message") {
        h.backend->deliver("partial", false);
        h.backend->drop();
        REQUIRE(spinUntil([&] { return h.backend->open_calls == 2; }));
        h.backend->acceptOpen();
        h.backend->deliver("fresh", true);
        REQUIRE(snapshotSpy.count() == 2);
        REQUIRE(snapshotSpy.at(1).at(0).toByteArray() == QByteArray("fresh"));
    }
}

TEST_CASE("SyncTransport: oversized messages are dropped", "[network][transport]") {
    auto options = Harness::fastOptions();
    options.max_message_bytes = 4;
    Harness h(options);
    h.connect();
    QSignalSpy snapshotSpy(h.transport.get(), &SyncTransport::snapshotReceived);

    h.backend->deliver("abc", false);
    h.backend->deliver("def", false);
    h.backend->deliver("g", true);
    REQUIRE(snapshotSpy.count() == 0);

    h.backend->deliver("xy", true);
    REQUIRE(snapshotSpy.count() == 1);
    REQUIRE(snapshotSpy.at(0).at(0).toByteArray() == QByteArray("xy"));
}

TEST_CASE("SyncTransport: frames outside a connection are ignored", "[network][transport]") {
    Harness h;
    QSignalSpy snapshotSpy(h.transport.get(), &SyncTransport::snapshotReceived);

    h.transport->open();
    h.backend->deliver("early", true);

    REQUIRE(snapshotSpy.count() == 0);
}

TEST_CASE("SyncTransport: text frames carry control messages", "[network][transport]") {
    Harness h;
    h.connect();
    QSignalSpy controlSpy(h.transport.get(), &SyncTransport::controlMessageReceived);

    h.backend->deliverText(QStringLiteral(R"({"type":"error","message":"room is full"})"));
    h.backend->deliverText(QStringLiteral(R"({"type":"info","message":"welcome"})"));
    h.backend->deliverText(QStringLiteral(R"({"type":"cursor","message":"ignored"})"));
    h.backend->deliverText(QStringLiteral("not json"));

    REQUIRE(controlSpy.count() == 2);
    REQUIRE(controlSpy.at(0).at(0).toString() == QStringLiteral("error"));
    REQUIRE(controlSpy.at(0).at(1).toString() == QStringLiteral("room is full"));
    REQUIRE(controlSpy.at(1).at(0).toString() == QStringLiteral("info"));
    REQUIRE(h.transport->isConnected());
}
