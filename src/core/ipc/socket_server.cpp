#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"
#include <QJsonObject>

namespace lp {

namespace {

bool socketHasActivePeer(const QString& socketPath)
{
    QLocalSocket liveCheck;
    liveCheck.connectToServer(socketPath);
    const bool connected = liveCheck.waitForConnected(150);
    if (connected) {
        liveCheck.disconnectFromServer();
        if (liveCheck.state() != QLocalSocket::UnconnectedState) {
            liveCheck.waitForDisconnected(50);
        }
    }
    return connected;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>())
{
    connect(m_server.get(), &QLocalServer::newConnection,
            this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);

    if (m_server->listen(socketPath)) {
        LOG_INFO(lpIpc, "Listening on %s", qPrintable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        const QString err = m_server->errorString();
        LOG_ERROR(lpIpc, "Failed to listen on %s: %s", qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    if (socketHasActivePeer(socketPath)) {
        const QString err = QStringLiteral("Socket already in use by an active service: %1")
                                .arg(socketPath);
        LOG_ERROR(lpIpc, "%s", qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_WARN(lpIpc, "Removing stale socket %s", qPrintable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        const QString err = m_server->errorString();
        LOG_ERROR(lpIpc, "Failed to listen on %s after stale cleanup: %s",
                  qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_INFO(lpIpc, "Listening on %s", qPrintable(socketPath));
    return true;
}

void SocketServer::close()
{
    if (m_closing) {
        return;
    }
    m_closing = true;

    // Detach bookkeeping first so disconnect callbacks see nothing to do.
    const QList<QLocalSocket*> clients = m_clients;
    m_clients.clear();
    m_readBuffers.clear();

    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        if (client->state() != QLocalSocket::UnconnectedState) {
            client->disconnectFromServer();
        }
        client->deleteLater();
    }

    if (m_server->isListening()) {
        const QString path = m_server->fullServerName();
        m_server->close();
        LOG_INFO(lpIpc, "Server closed: %s", qPrintable(path));
    }

    m_closing = false;
}

bool SocketServer::isListening() const
{
    return m_server->isListening();
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::broadcast(const QJsonObject& notification)
{
    const QByteArray encoded = IpcMessage::encode(notification);
    if (encoded.isEmpty()) {
        LOG_WARN(lpIpc, "Failed to encode broadcast notification");
        return;
    }

    for (QLocalSocket* client : m_clients) {
        client->write(encoded);
        client->flush();
    }

    LOG_DEBUG(lpIpc, "Broadcast %s to %d client(s)",
              qPrintable(notification.value(QStringLiteral("method")).toString()),
              static_cast<int>(m_clients.size()));
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        LOG_INFO(lpIpc, "Client connected (fd=%lld)",
                 static_cast<long long>(client->socketDescriptor()));

        m_clients.append(client);
        m_readBuffers.insert(client, QByteArray());

        connect(client, &QLocalSocket::readyRead,
                this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected,
                this, &SocketServer::onClientDisconnected);

        emit clientConnected();
    }
}

void SocketServer::onClientReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client || !m_readBuffers.contains(client)) {
        return;
    }

    QByteArray& buffer = m_readBuffers[client];
    buffer.append(client->readAll());

    if (buffer.size() > kMaxReadBufferSize) {
        LOG_ERROR(lpIpc, "Client read buffer exceeded %d bytes, disconnecting client",
                  kMaxReadBufferSize);
        dropClient(client);
        return;
    }

    processBuffer(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client) {
        return;
    }

    if (detachClient(client)) {
        LOG_INFO(lpIpc, "Client disconnected");
        client->deleteLater();
        emit clientDisconnected();
    }
}

bool SocketServer::detachClient(QLocalSocket* client)
{
    const bool removedClient = m_clients.removeOne(client);
    const bool removedBuffer = m_readBuffers.remove(client) > 0;
    return removedClient || removedBuffer;
}

void SocketServer::dropClient(QLocalSocket* client)
{
    const bool wasTracked = detachClient(client);
    client->disconnect(this);
    client->disconnectFromServer();
    if (wasTracked) {
        client->deleteLater();
        emit clientDisconnected();
    }
}

void SocketServer::processBuffer(QLocalSocket* client)
{
    while (m_readBuffers.contains(client)) {
        QByteArray& buffer = m_readBuffers[client];
        const IpcMessage::DecodeResult result = IpcMessage::decode(buffer);

        if (result.status == IpcMessage::DecodeStatus::Incomplete) {
            return;
        }
        if (result.status == IpcMessage::DecodeStatus::Invalid) {
            if (result.bytesConsumed <= 0) {
                LOG_WARN(lpIpc, "Unrecoverable frame from client, disconnecting");
                dropClient(client);
                return;
            }
            buffer.remove(0, result.bytesConsumed);
            continue;
        }

        buffer.remove(0, result.bytesConsumed);

        const QJsonObject& incoming = result.json;
        const QString type = incoming.value(QStringLiteral("type")).toString();
        const QString method = incoming.value(QStringLiteral("method")).toString();

        if (type == QLatin1String("request")) {
            LOG_DEBUG(lpIpc, "Received request: method=%s id=%lld", qPrintable(method),
                      static_cast<long long>(incoming.value(QStringLiteral("id")).toInteger()));

            QJsonObject response;
            if (m_handler) {
                response = m_handler(incoming);
            } else {
                const uint64_t id =
                    static_cast<uint64_t>(incoming.value(QStringLiteral("id")).toInteger());
                response = IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                                 QStringLiteral("No request handler registered"));
            }

            // The handler may have shut the server down.
            if (!m_readBuffers.contains(client)) {
                return;
            }
            const QByteArray encoded = IpcMessage::encode(response);
            if (!encoded.isEmpty()) {
                client->write(encoded);
                client->flush();
            }
        } else if (type == QLatin1String("notification")) {
            LOG_DEBUG(lpIpc, "Received notification: method=%s", qPrintable(method));
            if (m_handler) {
                m_handler(incoming);
            }
        } else {
            LOG_WARN(lpIpc, "Received unknown message type: %s", qPrintable(type));
        }
    }
}

} // namespace lp
