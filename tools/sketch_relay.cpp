#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QHash>
#include <QHostAddress>
#include <QWebSocket>
#include <QWebSocketServer>

#include "network/control_message.hpp"

// Development rendezvous relay: every binary message is forwarded to all
// other clients, and a joining client is sent the latest snapshot of each
// connected peer so it catches up without waiting for their next edit.

namespace {

class Relay : public QObject {
public:
    explicit Relay(QObject* parent = nullptr)
        : QObject(parent)
        , server_(QStringLiteral("sketch_relay"), QWebSocketServer::NonSecureMode)
    {
        connect(&server_, &QWebSocketServer::newConnection, this, [this]() {
            while (auto* socket = server_.nextPendingConnection()) {
                accept(socket);
            }
        });
    }

    bool listen(const QHostAddress& address, quint16 port) {
        if (!server_.listen(address, port)) {
            qCritical().noquote() << "sketch_relay: cannot listen on" << address.toString() << port
                                  << server_.errorString();
            return false;
        }
        qInfo().noquote() << "sketch_relay: listening on" << server_.serverUrl().toString();
        return true;
    }

private:
    QWebSocketServer server_;
    QHash<QWebSocket*, QByteArray> latest_;
    QByteArray retained_;

    void accept(QWebSocket* socket) {
        socket->setParent(this);
        qInfo().noquote() << "sketch_relay: client joined from" << socket->peerAddress().toString();

        connect(socket, &QWebSocket::binaryMessageReceived, this, [this, socket](const QByteArray& message) {
            latest_[socket] = message;
            retained_ = message;
            for (auto it = latest_.cbegin(); it != latest_.cend(); ++it) {
                if (it.key() != socket) {
                    it.key()->sendBinaryMessage(message);
                }
            }
        });
        connect(socket, &QWebSocket::disconnected, this, [this, socket]() {
            latest_.remove(socket);
            qInfo() << "sketch_relay: client left," << latest_.size() << "connected";
            socket->deleteLater();
        });

        bool caught_up = false;
        for (auto it = latest_.cbegin(); it != latest_.cend(); ++it) {
            if (!it.value().isEmpty()) {
                socket->sendBinaryMessage(it.value());
                caught_up = true;
            }
        }
        if (!caught_up && !retained_.isEmpty()) {
            socket->sendBinaryMessage(retained_);
        }
        latest_.insert(socket, QByteArray());

        sketchsync::network::ControlMessage hello;
        hello.type = QStringLiteral("info");
        hello.message = QStringLiteral("%1 client(s) connected").arg(latest_.size());
        socket->sendTextMessage(QString::fromUtf8(sketchsync::network::serializeControlMessage(hello)));
    }
};

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("sketch_relay");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("SketchSync development relay"));
    parser.addHelpOption();

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("Port to listen on (default 4080)."),
        QStringLiteral("port"),
        QStringLiteral("4080"));
    parser.addOption(portOption);
    parser.process(app);

    bool ok = false;
    const int port = parser.value(portOption).toInt(&ok);
    if (!ok || port <= 0 || port > 65535) {
        qCritical() << "sketch_relay: invalid port" << parser.value(portOption);
        return 1;
    }

    Relay relay;
    if (!relay.listen(QHostAddress::Any, static_cast<quint16>(port))) {
        return 1;
    }
    return app.exec();
}
