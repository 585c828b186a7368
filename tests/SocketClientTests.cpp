// SocketClientTests.cpp
//
// Transport behaviour against a loopback Socket.IO endpoint, plus the compact
// telemetry decoding the worker applies to simpleJsonData.
//

#include <gtest/gtest.h>

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QThread>

#include <atomic>
#include <initializer_list>
#include <thread>

#include "client/protocol_capabilities.hpp"
#include "client/socket_client.hpp"
#include "client/socket_worker.hpp"
#include "mocks/FakeSocketIoServer.hpp"

using namespace fl::client;
using fl::protocol::InboundEvent;
using fl::test::FakeSocketIoServer;
using fl::test::spin_for;
using fl::test::spin_until;

namespace {

constexpr int kWaitMs = 5000;

QByteArray bytes(std::initializer_list<int> values) {
    QByteArray out;
    for (const int value : values) {
        out.append(static_cast<char>(value));
    }
    return out;
}

// {"id": "07-ABC"}
QByteArray packed_telemetry() {
    return bytes({0x81, 0xA2, 'i', 'd', 0xA6, '0', '7', '-', 'A', 'B', 'C'});
}

QJsonObject placeholder(int num) {
    QJsonObject obj;
    obj.insert(QStringLiteral("_placeholder"), true);
    obj.insert(QStringLiteral("num"), num);
    return obj;
}

InboundEvent compact_event(const QJsonValue &arg, const QVector<QByteArray> &attachments = {}) {
    InboundEvent event;
    event.name = QLatin1String(events::kCompactTelemetry);
    event.args.append(arg);
    event.attachments = attachments;
    return event;
}

class SocketClientTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(server.listen()); }

    void connectClient() { client.connectToBackend(QStringLiteral("127.0.0.1"), server.port(), 3001); }

    bool waitConnected() {
        return spin_until([this]() { return client.isConnected(); }, kWaitMs);
    }

    FakeSocketIoServer server;
    SocketClient client;
};

}  // namespace

TEST(CompactTelemetry, AttachmentIsDecodedToAnObject) {
    QString error;
    const auto telemetry = decode_compact_telemetry(compact_event(placeholder(0), {packed_telemetry()}), &error);
    ASSERT_TRUE(telemetry.has_value()) << error.toStdString();
    EXPECT_TRUE(error.isEmpty());
    EXPECT_EQ(telemetry->value(QStringLiteral("id")).toString(), QStringLiteral("07-ABC"));
}

TEST(CompactTelemetry, InlineObjectPassesThrough) {
    QJsonObject frame;
    frame.insert(QStringLiteral("deviceId"), QStringLiteral("08-B"));
    const auto telemetry = decode_compact_telemetry(compact_event(frame));
    ASSERT_TRUE(telemetry.has_value());
    EXPECT_EQ(telemetry->value(QStringLiteral("deviceId")).toString(), QStringLiteral("08-B"));
}

TEST(CompactTelemetry, MissingOrCorruptAttachmentReportsError) {
    QString error;
    EXPECT_FALSE(decode_compact_telemetry(compact_event(placeholder(1), {packed_telemetry()}), &error).has_value());
    EXPECT_EQ(error, QStringLiteral("simpleJsonData attachment 1 missing"));

    EXPECT_FALSE(decode_compact_telemetry(compact_event(placeholder(0), {bytes({0x81, 0xA2, 'i'})}), &error)
                     .has_value());
    EXPECT_TRUE(error.startsWith(QStringLiteral("simpleJsonData decode failed")));
}

TEST(CompactTelemetry, NonObjectIsIgnoredWithoutError) {
    QString error = QStringLiteral("stale");
    EXPECT_FALSE(decode_compact_telemetry(compact_event(placeholder(0), {bytes({0x93, 1, 2, 3})}), &error)
                     .has_value());
    EXPECT_TRUE(error.isEmpty());
    EXPECT_FALSE(decode_compact_telemetry(compact_event(QJsonValue(42)), &error).has_value());
    EXPECT_TRUE(error.isEmpty());
}

TEST_F(SocketClientTest, EmitWithoutTransportRecordsError) {
    client.emitEvent(QLatin1String(events::kTareAll));

    EXPECT_FALSE(client.isRunning());
    EXPECT_EQ(client.connection().lastError, QStringLiteral("emit 'tareAll' failed: no socket"));
}

TEST_F(SocketClientTest, EmitBeforeNamespaceAckRecordsError) {
    server.ignoreNamespaceConnects = true;
    connectClient();
    ASSERT_TRUE(spin_until([this]() { return server.count(QStringLiteral("40")) == 1; }, kWaitMs));

    client.emitEvent(QLatin1String(events::kTareAll));

    ASSERT_TRUE(spin_until(
        [this]() {
            return client.connection().lastError == QStringLiteral("emit 'tareAll' failed: namespace not connected");
        },
        1000));
    EXPECT_FALSE(client.isConnected());
    EXPECT_EQ(server.count(QStringLiteral("42")), 0);
}

TEST_F(SocketClientTest, ConnectsOnNamespaceAcknowledgement) {
    std::atomic<int> connects{0};
    client.on(QLatin1String(events::kConnect), [&connects](const QJsonValue &) { ++connects; });

    connectClient();

    ASSERT_TRUE(spin_until([&connects]() { return connects.load() == 1; }, kWaitMs));
    EXPECT_TRUE(client.isConnected());
    EXPECT_EQ(client.connectionEpoch(), 1u);
    EXPECT_EQ(client.connection().transportPort, server.port());
    EXPECT_EQ(server.count(QStringLiteral("40")), 1);
}

TEST_F(SocketClientTest, EmittedEventsReachTheServer) {
    connectClient();
    ASSERT_TRUE(waitConnected());

    client.emitEvent(QLatin1String(events::kGetConnectedDevices));
    QJsonObject config;
    config.insert(QStringLiteral("key"), QStringLiteral("rate"));
    client.emitEvent(QLatin1String(events::kUpdateBackendConfig), config);

    ASSERT_TRUE(spin_until([this]() { return server.messages.size() >= 3; }, kWaitMs));
    EXPECT_EQ(server.messages.at(1), QStringLiteral("42[\"getConnectedDevices\"]"));
    EXPECT_EQ(server.messages.at(2), QStringLiteral("42[\"updateDynamoConfig\",{\"key\":\"rate\"}]"));
}

TEST_F(SocketClientTest, CompactTelemetryIsDeliveredAsJsonData) {
    QMutex mutex;
    QJsonObject received;
    std::atomic<int> telemetry{0};
    std::atomic<int> compact{0};
    client.on(QLatin1String(events::kTelemetry), [&](const QJsonValue &payload) {
        QMutexLocker locker(&mutex);
        received = payload.toObject();
        ++telemetry;
    });
    client.on(QLatin1String(events::kCompactTelemetry), [&compact](const QJsonValue &) { ++compact; });

    connectClient();
    ASSERT_TRUE(waitConnected());
    server.sendText(QStringLiteral("451-[\"simpleJsonData\",{\"_placeholder\":true,\"num\":0}]"));
    server.sendBinary(packed_telemetry());

    ASSERT_TRUE(spin_until([&telemetry]() { return telemetry.load() == 1; }, kWaitMs));
    QMutexLocker locker(&mutex);
    EXPECT_EQ(received.value(QStringLiteral("id")).toString(), QStringLiteral("07-ABC"));
    EXPECT_EQ(compact.load(), 0);
}

TEST_F(SocketClientTest, BackoffStartsOverAfterSuccessfulConnect) {
    server.rejectNamespaceConnects = 1;
    server.dropAfterConnect = true;
    QVector<int> delays;
    QObject::connect(&client, &SocketClient::reconnectScheduled, &client,
                     [&delays](int delayMs) { delays.append(delayMs); });

    connectClient();

    ASSERT_TRUE(spin_until([&delays]() { return delays.size() >= 2; }, kWaitMs));
    // First after the refused attempt, then after the drop that followed a
    // successful connect.
    EXPECT_EQ(delays.at(0), 500);
    EXPECT_EQ(delays.at(1), 500);
    EXPECT_EQ(server.namespaceConnects, 1);
}

TEST_F(SocketClientTest, DisconnectEndsRetries) {
    server.rejectNamespaceConnects = 1000;
    connectClient();
    ASSERT_TRUE(spin_until([this]() { return server.connections >= 2; }, kWaitMs));

    client.disconnectFromBackend();
    EXPECT_FALSE(client.isRunning());

    spin_for(200);
    const int seen = server.connections;
    spin_for(1500);
    EXPECT_EQ(server.connections, seen);
}

TEST_F(SocketClientTest, DisconnectDispatchesDisconnectBeforeReturning) {
    std::atomic<int> disconnects{0};
    client.on(QLatin1String(events::kDisconnect), [&disconnects](const QJsonValue &) { ++disconnects; });
    connectClient();
    ASSERT_TRUE(waitConnected());

    client.disconnectFromBackend();

    EXPECT_EQ(disconnects.load(), 1);
    EXPECT_FALSE(client.isConnected());
    EXPECT_FALSE(client.isRunning());
}

TEST_F(SocketClientTest, PostRunsOnTransportThreadUntilStopped) {
    connectClient();
    ASSERT_TRUE(waitConnected());

    std::atomic<QThread *> ranOn{nullptr};
    client.post([&ranOn]() { ranOn = QThread::currentThread(); });
    ASSERT_TRUE(spin_until([&ranOn]() { return ranOn.load() != nullptr; }, kWaitMs));
    EXPECT_NE(ranOn.load(), QThread::currentThread());

    client.disconnectFromBackend();
    std::atomic<bool> late{false};
    client.post([&late]() { late = true; });
    spin_for(100);
    EXPECT_FALSE(late.load());
}

TEST_F(SocketClientTest, OtherThreadsMayEmitWhileOwnerReconnects) {
    std::atomic<bool> done{false};
    std::atomic<int> posted{0};
    std::thread caller([&]() {
        while (!done.load()) {
            client.emitEvent(QLatin1String(events::kGetConnectedDevices));
            client.post([&posted]() { ++posted; });
            QThread::usleep(200);
        }
    });

    for (int i = 0; i < 5; ++i) {
        connectClient();
        spin_for(60);
        client.disconnectFromBackend();
    }
    done = true;
    caller.join();

    EXPECT_FALSE(client.isRunning());
    EXPECT_FALSE(client.isConnected());
}
