// HardwareServiceTests.cpp
//
// Service wiring over a live transport: connect-time requests, device list and
// liveness publication, and what a lost connection clears.
//

#include <gtest/gtest.h>

#include <QtCore/QSet>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <memory>

#include "client/hardware_service.hpp"
#include "mocks/FakeSocketIoServer.hpp"

using namespace fl::client;
using fl::test::FakeSocketIoServer;
using fl::test::spin_for;
using fl::test::spin_until;

namespace {

constexpr int kWaitMs = 5000;

class HardwareServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(server.listen());
        service.setDecayWindowMs(60000);
        QObject::connect(&service, &HardwareService::connectionStatusChanged, &receiver,
                         [this](const QString &status) { statuses.append(status); });
        QObject::connect(&service, &HardwareService::deviceListUpdated, &receiver,
                         [this](const QVector<DeviceListing> &devices) { deviceLists.append(devices); });
        QObject::connect(&service, &HardwareService::activeDevicesUpdated, &receiver,
                         [this](const QSet<QString> &ids) { activeSets.append(ids); });
        QObject::connect(&service, &HardwareService::groupError, &receiver,
                         [this](const QString &message) { errors.append(message); });
    }

    bool connectService() {
        service.connectToBackend(QStringLiteral("127.0.0.1"), server.port());
        return spin_until([this]() { return statuses.contains(QStringLiteral("Connected")); }, kWaitMs);
    }

    // One listed device that is also streaming.
    bool seedStreamingDevice() {
        server.sendEvent(QStringLiteral("[\"connectedDeviceList\",[{\"axfId\":\"07-AAAA\",\"name\":\"Launch\"}]]"));
        server.sendEvent(QStringLiteral("[\"jsonData\",{\"deviceId\":\"07-AAAA\",\"fz\":1.5}]"));
        return spin_until(
            [this]() {
                return !deviceLists.isEmpty() && deviceLists.last().size() == 1 && !activeSets.isEmpty() &&
                       activeSets.last().contains(QStringLiteral("07-AAAA"));
            },
            kWaitMs);
    }

    bool listAndActiveSetCleared() const {
        return !deviceLists.isEmpty() && deviceLists.last().isEmpty() && !activeSets.isEmpty() &&
               activeSets.last().isEmpty();
    }

    FakeSocketIoServer server;
    QStringList statuses;
    QVector<QVector<DeviceListing>> deviceLists;
    QVector<QSet<QString>> activeSets;
    QStringList errors;
    QObject receiver;
    HardwareService service;
};

}  // namespace

TEST_F(HardwareServiceTest, ConnectStartsDataThenQueriesDiscovery) {
    ASSERT_TRUE(connectService());

    ASSERT_TRUE(spin_until([this]() { return server.count(QStringLiteral("42[\"getGroups\"]")) == 1; }, kWaitMs));
    const int start = server.messages.indexOf(QStringLiteral("42[\"startDataReception\",{}]"));
    const int config = server.messages.indexOf(QStringLiteral("42[\"getDynamoConfig\"]"));
    const int settings = server.messages.indexOf(QStringLiteral("42[\"getDeviceSettings\",{}]"));
    const int devices = server.messages.indexOf(QStringLiteral("42[\"getConnectedDevices\"]"));
    ASSERT_GE(start, 0);
    EXPECT_LT(start, config);
    EXPECT_LT(config, settings);
    EXPECT_LT(settings, devices);
    EXPECT_TRUE(service.isConnected());
}

TEST_F(HardwareServiceTest, ZeroConnectedClearsActiveDevicesAndList) {
    ASSERT_TRUE(connectService());
    ASSERT_TRUE(seedStreamingDevice());
    ASSERT_TRUE(spin_until([this]() { return server.count(QStringLiteral("42[\"getConnectedDevices\"]")) == 1; },
                           kWaitMs));

    server.sendEvent(QStringLiteral("[\"connectionStatusUpdate\",{\"G1\":{\"devices\":{\"07-AAAA\":false}}}]"));

    ASSERT_TRUE(spin_until([this]() { return listAndActiveSetCleared(); }, kWaitMs));
    // The device list is requested again.
    EXPECT_TRUE(spin_until([this]() { return server.count(QStringLiteral("42[\"getConnectedDevices\"]")) == 2; },
                           kWaitMs));
    EXPECT_TRUE(service.directorySnapshot().connectedDeviceIds.isEmpty());
}

TEST_F(HardwareServiceTest, DroppedConnectionClearsStateAndAbandonsFormation) {
    ASSERT_TRUE(connectService());
    ASSERT_TRUE(seedStreamingDevice());

    PositionMapping desired;
    desired.insert(QStringLiteral("Launch Zone"), QStringLiteral("07-AAAA"));
    service.findOrCreateGroup(desired, QStringLiteral("PitchingMound"), QStringLiteral("Pitching Mound"));
    ASSERT_TRUE(spin_until(
        [this]() { return server.count(QStringLiteral("42[\"createTemporaryGroup\"")) == 1; }, kWaitMs));

    server.dropCurrent();

    ASSERT_TRUE(spin_until(
        [this]() { return statuses.contains(QStringLiteral("Disconnected")) && listAndActiveSetCleared(); },
        kWaitMs));
    ASSERT_TRUE(spin_until([this]() { return statuses.count(QStringLiteral("Connected")) == 2; }, kWaitMs));

    // Past the first fallback step: an abandoned request sends nothing more.
    spin_for(kFallbackDelayMs + 300);
    EXPECT_EQ(server.count(QStringLiteral("42[\"createDeviceGroup\"")), 0);
    EXPECT_TRUE(errors.isEmpty());
}

TEST_F(HardwareServiceTest, DisconnectReportsStatusAndStopsTransport) {
    ASSERT_TRUE(connectService());

    service.disconnectFromBackend();

    ASSERT_TRUE(spin_until([this]() { return statuses.last() == QStringLiteral("Disconnected"); }, kWaitMs));
    EXPECT_FALSE(service.isConnected());
    EXPECT_TRUE(deviceLists.last().isEmpty());
}

TEST_F(HardwareServiceTest, DestroyingAConnectedServiceClosesTheSocket) {
    auto local = std::make_unique<HardwareService>();
    local->connectToBackend(QStringLiteral("127.0.0.1"), server.port());
    ASSERT_TRUE(spin_until([&local]() { return local->isConnected(); }, kWaitMs));
    const int closedBefore = server.closed;

    local.reset();

    EXPECT_TRUE(spin_until([this, closedBefore]() { return server.closed > closedBefore; }, kWaitMs));
}
