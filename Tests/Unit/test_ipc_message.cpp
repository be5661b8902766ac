#include <QtTest/QtTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtEndian>
#include "core/ipc/message.h"
#include "core/shared/ipc_messages.h"

namespace {

QByteArray frameRaw(const QByteArray& payload)
{
    QByteArray frame;
    const quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    frame.append(reinterpret_cast<const char*>(&len), 4);
    frame.append(payload);
    return frame;
}

} // namespace

class TestIpcMessage : public QObject {
    Q_OBJECT

private slots:
    // ── Envelopes ────────────────────────────────────────────────
    void testMakeRequestOmitsEmptyParams();
    void testMakeErrorCarriesCodeString();
    void testConflictCodeString();
    void testNotificationHasNoId();

    // ── Decode ───────────────────────────────────────────────────
    void testRoundtripSignalRequest();
    void testIncompleteHeader();
    void testPartialPayload();
    void testConsumesOnlyFirstFrame();
    void testOversizedLengthDropsBuffer();
    void testMalformedJsonSkipsFrame();
    void testNonObjectPayloadSkipsFrame();
};

void TestIpcMessage::testMakeRequestOmitsEmptyParams()
{
    const QJsonObject req = lp::IpcMessage::makeRequest(1, QStringLiteral("get_engine_health"));
    QCOMPARE(req[QStringLiteral("type")].toString(), QStringLiteral("request"));
    QCOMPARE(req[QStringLiteral("id")].toInteger(), 1);
    QVERIFY(!req.contains(QStringLiteral("params")));
}

void TestIpcMessage::testMakeErrorCarriesCodeString()
{
    const QJsonObject err = lp::IpcMessage::makeError(
        3, lp::IpcErrorCode::PermissionDenied, QStringLiteral("Rejection (Consent): scope_not_granted"));
    QCOMPARE(err[QStringLiteral("type")].toString(), QStringLiteral("error"));

    const QJsonObject errObj = err[QStringLiteral("error")].toObject();
    QCOMPARE(errObj[QStringLiteral("code")].toInt(),
             static_cast<int>(lp::IpcErrorCode::PermissionDenied));
    QCOMPARE(errObj[QStringLiteral("codeString")].toString(), QStringLiteral("PERMISSION_DENIED"));
    QCOMPARE(errObj[QStringLiteral("message")].toString(),
             QStringLiteral("Rejection (Consent): scope_not_granted"));
}

void TestIpcMessage::testConflictCodeString()
{
    QCOMPARE(static_cast<int>(lp::IpcErrorCode::Conflict), 9);
    QCOMPARE(lp::ipcErrorCodeToString(lp::IpcErrorCode::Conflict), QStringLiteral("CONFLICT"));
    QCOMPARE(lp::ipcErrorCodeToString(lp::IpcErrorCode::ServiceUnavailable),
             QStringLiteral("SERVICE_UNAVAILABLE"));
}

void TestIpcMessage::testNotificationHasNoId()
{
    const QJsonObject notif = lp::IpcMessage::makeNotification(
        QStringLiteral("intervention_triggered"),
        QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("s1")}});
    QCOMPARE(notif[QStringLiteral("type")].toString(), QStringLiteral("notification"));
    QVERIFY(!notif.contains(QStringLiteral("id")));
    QCOMPARE(notif[QStringLiteral("params")].toObject()[QStringLiteral("sessionId")].toString(),
             QStringLiteral("s1"));
}

void TestIpcMessage::testRoundtripSignalRequest()
{
    QJsonObject payload;
    payload[QStringLiteral("sessionId")] = QStringLiteral("s1");
    payload[QStringLiteral("elementContext")] = QStringLiteral("Übung 3: Größe");
    const QJsonObject req = lp::IpcMessage::makeRequest(
        42, QStringLiteral("submit_signal"), QJsonObject{{QStringLiteral("payload"), payload}});

    const QByteArray encoded = lp::IpcMessage::encode(req);
    QVERIFY(!encoded.isEmpty());

    const lp::IpcMessage::DecodeResult decoded = lp::IpcMessage::decode(encoded);
    QCOMPARE(decoded.status, lp::IpcMessage::DecodeStatus::Ok);
    QCOMPARE(decoded.bytesConsumed, static_cast<int>(encoded.size()));
    QCOMPARE(decoded.json[QStringLiteral("method")].toString(), QStringLiteral("submit_signal"));
    QCOMPARE(decoded.json[QStringLiteral("params")].toObject()[QStringLiteral("payload")]
                 .toObject()[QStringLiteral("elementContext")].toString(),
             payload[QStringLiteral("elementContext")].toString());
}

void TestIpcMessage::testIncompleteHeader()
{
    const lp::IpcMessage::DecodeResult decoded = lp::IpcMessage::decode(QByteArray("\x00\x00", 2));
    QCOMPARE(decoded.status, lp::IpcMessage::DecodeStatus::Incomplete);
    QCOMPARE(decoded.bytesConsumed, 0);

    QCOMPARE(lp::IpcMessage::decode(QByteArray()).status, lp::IpcMessage::DecodeStatus::Incomplete);
}

void TestIpcMessage::testPartialPayload()
{
    const QByteArray encoded = lp::IpcMessage::encode(
        lp::IpcMessage::makeRequest(1, QStringLiteral("ping")));
    const lp::IpcMessage::DecodeResult decoded =
        lp::IpcMessage::decode(encoded.left(encoded.size() - 3));
    QCOMPARE(decoded.status, lp::IpcMessage::DecodeStatus::Incomplete);
}

void TestIpcMessage::testConsumesOnlyFirstFrame()
{
    const QByteArray first = lp::IpcMessage::encode(
        lp::IpcMessage::makeRequest(1, QStringLiteral("ping")));
    const QByteArray second = lp::IpcMessage::encode(
        lp::IpcMessage::makeRequest(2, QStringLiteral("list_alerts")));

    const lp::IpcMessage::DecodeResult decoded = lp::IpcMessage::decode(first + second);
    QCOMPARE(decoded.status, lp::IpcMessage::DecodeStatus::Ok);
    QCOMPARE(decoded.bytesConsumed, static_cast<int>(first.size()));
    QCOMPARE(decoded.json[QStringLiteral("id")].toInteger(), 1);
}

void TestIpcMessage::testOversizedLengthDropsBuffer()
{
    QByteArray buffer;
    const quint32 len = qToBigEndian(static_cast<quint32>(lp::IpcMessage::kMaxMessageSize + 1));
    buffer.append(reinterpret_cast<const char*>(&len), 4);
    buffer.append("{}");

    const lp::IpcMessage::DecodeResult decoded = lp::IpcMessage::decode(buffer);
    QCOMPARE(decoded.status, lp::IpcMessage::DecodeStatus::Invalid);
    QCOMPARE(decoded.bytesConsumed, 0);
}

void TestIpcMessage::testMalformedJsonSkipsFrame()
{
    const QByteArray bad = frameRaw(QByteArray("{not json"));
    const QByteArray good = lp::IpcMessage::encode(
        lp::IpcMessage::makeRequest(5, QStringLiteral("ping")));

    const lp::IpcMessage::DecodeResult decoded = lp::IpcMessage::decode(bad + good);
    QCOMPARE(decoded.status, lp::IpcMessage::DecodeStatus::Invalid);
    QCOMPARE(decoded.bytesConsumed, static_cast<int>(bad.size()));

    const lp::IpcMessage::DecodeResult next =
        lp::IpcMessage::decode((bad + good).mid(decoded.bytesConsumed));
    QCOMPARE(next.status, lp::IpcMessage::DecodeStatus::Ok);
    QCOMPARE(next.json[QStringLiteral("id")].toInteger(), 5);
}

void TestIpcMessage::testNonObjectPayloadSkipsFrame()
{
    const QByteArray frame = frameRaw(QByteArray("[1,2,3]"));
    const lp::IpcMessage::DecodeResult decoded = lp::IpcMessage::decode(frame);
    QCOMPARE(decoded.status, lp::IpcMessage::DecodeStatus::Invalid);
    QCOMPARE(decoded.bytesConsumed, static_cast<int>(frame.size()));
}

QTEST_MAIN(TestIpcMessage)
#include "test_ipc_message.moc"
