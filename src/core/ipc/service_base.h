#pragma once

#include "core/ipc/socket_server.h"
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <memory>

namespace lp {

// Base for a local-socket JSON service: routes ping/shutdown and leaves
// everything else to handleRequest() overrides.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Bind the socket without entering the event loop.
    bool listen(const QString& socketPath);

    // listen() on the default path, print "ready" and enter the event loop.
    int run();

    const QString& serviceName() const { return m_serviceName; }

    static QString socketPath(const QString& serviceName);
    static QString runtimeDirectory();
    static QString socketDirectory();

    // Entry point for one decoded request or notification.
    QJsonObject dispatch(const QJsonObject& request) { return handleRequest(request); }

protected:
    virtual QJsonObject handleRequest(const QJsonObject& request);

    // Runs before the event loop is asked to quit.
    virtual void onShutdownRequested() {}

    QJsonObject handlePing(const QJsonObject& request);
    QJsonObject handleShutdown(const QJsonObject& request);

    void sendNotification(const QString& method, const QJsonObject& params = {});

    static uint64_t requestId(const QJsonObject& request);

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
};

} // namespace lp
