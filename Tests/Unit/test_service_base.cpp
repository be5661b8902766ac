#include <QtTest/QtTest>

#include "core/ipc/message.h"
#include "core/ipc/service_base.h"

#include <QDir>

namespace {

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* key, const QByteArray& value)
        : m_key(key)
        , m_hadOriginal(qEnvironmentVariableIsSet(key))
        , m_original(qgetenv(key))
    {
        qputenv(m_key, value);
    }

    ~ScopedEnvVar()
    {
        if (m_hadOriginal) {
            qputenv(m_key, m_original);
        } else {
            qunsetenv(m_key);
        }
    }

private:
    const char* m_key;
    bool m_hadOriginal = false;
    QByteArray m_original;
};

} // namespace

class TestServiceBase : public QObject {
    Q_OBJECT

private slots:
    void testRuntimeDirectoryOverrideAndPathNormalization();
    void testSocketFallsBackToRuntimeDirectory();
    void testHandlePingRequest();
    void testUnknownMethodReturnsNotFoundError();
};

void TestServiceBase::testRuntimeDirectoryOverrideAndPathNormalization()
{
    const QByteArray runtimeRaw = "/tmp/lp-runtime/../lp-runtime";
    const QByteArray socketRaw = "/tmp/lp-sockets/./nested/..";

    ScopedEnvVar runtimeEnv("LEARNPULSE_RUNTIME_DIR", runtimeRaw);
    ScopedEnvVar socketEnv("LEARNPULSE_SOCKET_DIR", socketRaw);

    QCOMPARE(lp::ServiceBase::runtimeDirectory(),
             QDir::cleanPath(QString::fromUtf8(runtimeRaw)));
    QCOMPARE(lp::ServiceBase::socketDirectory(),
             QDir::cleanPath(QString::fromUtf8(socketRaw)));
    QCOMPARE(lp::ServiceBase::socketPath(QStringLiteral("engine-test")),
             QDir::cleanPath(QString::fromUtf8(socketRaw) + "/engine-test.sock"));
}

void TestServiceBase::testSocketFallsBackToRuntimeDirectory()
{
    const QByteArray runtimeRaw = "/tmp/lp-runtime-fallback/./nested/..";

    ScopedEnvVar runtimeEnv("LEARNPULSE_RUNTIME_DIR", runtimeRaw);
    ScopedEnvVar socketEnv("LEARNPULSE_SOCKET_DIR", QByteArray());

    const QString runtime = QDir::cleanPath(QString::fromUtf8(runtimeRaw));
    QCOMPARE(lp::ServiceBase::runtimeDirectory(), runtime);
    QCOMPARE(lp::ServiceBase::socketDirectory(), runtime);
}

void TestServiceBase::testHandlePingRequest()
{
    lp::ServiceBase service(QStringLiteral("service-base-unit"));
    const QJsonObject request = lp::IpcMessage::makeRequest(11, QStringLiteral("ping"));

    const QJsonObject response = service.dispatch(request);
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    QCOMPARE(response.value(QStringLiteral("id")).toInteger(), 11);

    const QJsonObject result = response.value(QStringLiteral("result")).toObject();
    QCOMPARE(result.value(QStringLiteral("pong")).toBool(), true);
    QCOMPARE(result.value(QStringLiteral("service")).toString(), QStringLiteral("service-base-unit"));
    QVERIFY(result.value(QStringLiteral("timestamp")).toInteger() > 0);
}

void TestServiceBase::testUnknownMethodReturnsNotFoundError()
{
    lp::ServiceBase service(QStringLiteral("service-base-unit"));
    const QJsonObject request =
        lp::IpcMessage::makeRequest(27, QStringLiteral("unknown.method"));

    const QJsonObject response = service.dispatch(request);
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("error"));
    QCOMPARE(response.value(QStringLiteral("id")).toInteger(), 27);

    const QJsonObject error = response.value(QStringLiteral("error")).toObject();
    QCOMPARE(error.value(QStringLiteral("code")).toInt(),
             static_cast<int>(lp::IpcErrorCode::NotFound));
    QCOMPARE(error.value(QStringLiteral("codeString")).toString(),
             lp::ipcErrorCodeToString(lp::IpcErrorCode::NotFound));
    QVERIFY(error.value(QStringLiteral("message"))
                .toString()
                .contains(QStringLiteral("unknown.method")));
}

QTEST_MAIN(TestServiceBase)
#include "test_service_base.moc"
