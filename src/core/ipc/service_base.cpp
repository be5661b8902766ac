#include "core/ipc/service_base.h"
#include "core/shared/logging.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <sys/types.h>
#include <unistd.h>

#include <cstdio>

namespace lp {

namespace {

QString defaultRuntimeRoot()
{
    const uid_t uid = getuid();
    return QStringLiteral("/tmp/learnpulse-%1").arg(uid);
}

QString normalizedEnvPath(const char* envName)
{
    const QString value = qEnvironmentVariable(envName).trimmed();
    if (value.isEmpty()) {
        return {};
    }
    return QDir::cleanPath(value);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>())
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
}

ServiceBase::~ServiceBase() = default;

bool ServiceBase::listen(const QString& path)
{
    QDir dir = QFileInfo(path).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        LOG_ERROR(lpIpc, "Failed to create socket directory: %s", qPrintable(dir.path()));
        return false;
    }

    if (!m_server->listen(path)) {
        LOG_ERROR(lpIpc, "Service '%s' failed to start", qPrintable(m_serviceName));
        return false;
    }

    LOG_INFO(lpIpc, "Service '%s' started on %s", qPrintable(m_serviceName), qPrintable(path));
    return true;
}

int ServiceBase::run()
{
    if (!listen(socketPath(m_serviceName))) {
        return 1;
    }

    // Readiness line for whoever launched us
    fprintf(stdout, "ready\n");
    fflush(stdout);

    return QCoreApplication::exec();
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir::cleanPath(socketDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".sock"));
}

QString ServiceBase::runtimeDirectory()
{
    const QString runtimeDir = normalizedEnvPath("LEARNPULSE_RUNTIME_DIR");
    if (!runtimeDir.isEmpty()) {
        return runtimeDir;
    }
    return defaultRuntimeRoot();
}

QString ServiceBase::socketDirectory()
{
    const QString socketDir = normalizedEnvPath("LEARNPULSE_SOCKET_DIR");
    if (!socketDir.isEmpty()) {
        return socketDir;
    }
    return runtimeDirectory();
}

uint64_t ServiceBase::requestId(const QJsonObject& request)
{
    return static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger());
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();

    if (method == QLatin1String("ping")) {
        return handlePing(request);
    }
    if (method == QLatin1String("shutdown")) {
        return handleShutdown(request);
    }

    LOG_WARN(lpIpc, "Unknown method '%s' in service '%s'",
             qPrintable(method), qPrintable(m_serviceName));
    return IpcMessage::makeError(requestId(request), IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown method: %1").arg(method));
}

QJsonObject ServiceBase::handlePing(const QJsonObject& request)
{
    QJsonObject result;
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    result[QStringLiteral("service")] = m_serviceName;

    LOG_DEBUG(lpIpc, "Ping received for service '%s'", qPrintable(m_serviceName));
    return IpcMessage::makeResponse(requestId(request), result);
}

QJsonObject ServiceBase::handleShutdown(const QJsonObject& request)
{
    LOG_INFO(lpIpc, "Shutdown requested for service '%s'", qPrintable(m_serviceName));

    onShutdownRequested();

    QJsonObject result;
    result[QStringLiteral("shutting_down")] = true;

    // Quit after the response has been written
    if (QCoreApplication::instance()) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    }

    return IpcMessage::makeResponse(requestId(request), result);
}

void ServiceBase::sendNotification(const QString& method, const QJsonObject& params)
{
    m_server->broadcast(IpcMessage::makeNotification(method, params));
}

} // namespace lp
