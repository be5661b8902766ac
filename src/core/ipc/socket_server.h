#pragma once

#include "core/ipc/message.h"
#include <QHash>
#include <QList>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <functional>
#include <memory>

namespace lp {

// Local-socket JSON server. All members are used from the owning thread.
class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    // Start listening on the given socket path. A stale socket file left by
    // a crashed process is removed; a live one is an error.
    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;

    void setRequestHandler(RequestHandler handler);

    // Send a notification to every connected client
    void broadcast(const QJsonObject& notification);
    int clientCount() const { return static_cast<int>(m_clients.size()); }

    static constexpr int kMaxReadBufferSize = 4 * IpcMessage::kMaxMessageSize;

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private slots:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    bool detachClient(QLocalSocket* client);
    void dropClient(QLocalSocket* client);
    void processBuffer(QLocalSocket* client);

    std::unique_ptr<QLocalServer> m_server;
    QList<QLocalSocket*> m_clients;
    QHash<QLocalSocket*, QByteArray> m_readBuffers;
    RequestHandler m_handler;
    bool m_closing = false;
};

} // namespace lp
