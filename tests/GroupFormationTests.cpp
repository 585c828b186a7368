// GroupFormationTests.cpp
//
// Find-or-create flow against a fake channel and a virtual clock.
//

#include <gtest/gtest.h>

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>

#include "client/device_directory.hpp"
#include "client/group_formation.hpp"
#include "mocks/FakeEventChannel.hpp"
#include "mocks/ManualScheduler.hpp"

using namespace fl::client;
using fl::test::FakeEventChannel;
using fl::test::ManualScheduler;

namespace {

const QString kDefinition = QStringLiteral("PitchingMound");
const QString kName = QStringLiteral("Pitching Mound");

QJsonObject mapping(const char *position, const char *deviceId) {
    QJsonObject obj;
    obj.insert(QStringLiteral("positionId"), QLatin1String(position));
    obj.insert(QStringLiteral("deviceId"), QLatin1String(deviceId));
    return obj;
}

QJsonObject mound_group(const char *id) {
    QJsonObject group;
    group.insert(QStringLiteral("axfId"), QLatin1String(id));
    group.insert(QStringLiteral("name"), kName);
    group.insert(QStringLiteral("groupConfiguration"), QStringLiteral("Pitching Mound"));
    group.insert(QStringLiteral("mappings"), QJsonArray{mapping("Launch Zone", "07-AAAA"),
                                                        mapping("Upper Landing Zone", "08-BBBB"),
                                                        mapping("Lower Landing Zone", "08-CCCC")});
    return group;
}

PositionMapping desired_mound() {
    PositionMapping desired;
    desired.insert(QStringLiteral("Launch Zone"), QStringLiteral("07aaaa"));
    desired.insert(QStringLiteral("Upper Landing Zone"), QStringLiteral("08-bbbb"));
    desired.insert(QStringLiteral("Lower Landing Zone"), QStringLiteral("08CCCC"));
    return desired;
}

QJsonObject status(const char *statusText, const char *message) {
    QJsonObject obj;
    obj.insert(QStringLiteral("status"), QLatin1String(statusText));
    obj.insert(QStringLiteral("message"), QLatin1String(message));
    return obj;
}

class GroupFormationTest : public ::testing::Test {
protected:
    void SetUp() override {
        QObject::connect(&formation, &GroupFormation::groupFound, [this](const QJsonObject &group) {
            found.push_back(group);
        });
        QObject::connect(&formation, &GroupFormation::groupCreated, [this](const QJsonObject &group) {
            created.push_back(group);
        });
        QObject::connect(&formation, &GroupFormation::groupError,
                         [this](const QString &message) { errors.push_back(message); });
        QObject::connect(&formation, &GroupFormation::refreshRequested, [this]() { ++refreshes; });
    }

    int outcomes() const { return static_cast<int>(found.size() + created.size() + errors.size()); }

    void deliver(const char *event, const QJsonValue &payload) {
        channel.deliver(QLatin1String(event), payload);
        scheduler.runPending();
    }

    void publishGroups(const QJsonArray &groups) {
        QJsonObject payload;
        payload.insert(QStringLiteral("response"), groups);
        directory.onDirectoryEvent(QLatin1String(events::kConnectedGroupsStatus), payload, scheduler.now());
        formation.onDirectoryRefreshed();
    }

    FakeEventChannel channel;
    DeviceDirectory directory;
    ManualScheduler scheduler;
    GroupFormation formation{channel, directory, scheduler};

    QVector<QJsonObject> found;
    QVector<QJsonObject> created;
    QVector<QString> errors;
    int refreshes = 0;
};

}  // namespace

TEST_F(GroupFormationTest, ExistingGroupIsFoundWithoutBackendTraffic) {
    publishGroups(QJsonArray{mound_group("G7")});

    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);

    ASSERT_EQ(found.size(), 1);
    EXPECT_EQ(found.front().value(QStringLiteral("axfId")).toString(), QStringLiteral("G7"));
    EXPECT_TRUE(channel.sent.isEmpty());
    EXPECT_FALSE(formation.hasPending());
}

TEST_F(GroupFormationTest, DifferentDevicesDoNotMatch) {
    publishGroups(QJsonArray{mound_group("G7")});
    PositionMapping desired = desired_mound();
    desired.insert(QStringLiteral("Launch Zone"), QStringLiteral("07-FFFF"));

    formation.findOrCreateGroup(desired, kDefinition, kName);

    EXPECT_TRUE(found.isEmpty());
    EXPECT_EQ(channel.count(QLatin1String(events::kCreateTemporaryGroup)), 1);
}

TEST_F(GroupFormationTest, NotConnectedFailsImmediately) {
    channel.connected = false;

    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);

    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors.front(), QStringLiteral("Not connected to backend"));
    EXPECT_TRUE(channel.sent.isEmpty());
}

TEST_F(GroupFormationTest, NoMatchWithoutCreateReportsError) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName, false);

    EXPECT_EQ(errors.size(), 1);
    EXPECT_EQ(outcomes(), 1);
    EXPECT_TRUE(channel.sent.isEmpty());
}

TEST_F(GroupFormationTest, CreateSendsSnakeCasePayloadWithDefaultPositions) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);

    const FakeEventChannel::Sent *sent = channel.last(QLatin1String(events::kCreateTemporaryGroup));
    ASSERT_NE(sent, nullptr);
    const QJsonObject payload = sent->payload.toObject();
    EXPECT_EQ(payload.value(QStringLiteral("group_definition_id")).toString(), kDefinition);
    EXPECT_EQ(payload.value(QStringLiteral("name")).toString(), kName);
    EXPECT_FALSE(payload.value(QStringLiteral("disable_virtual_devices")).toBool(true));

    const QJsonArray mappings = payload.value(QStringLiteral("mappings")).toArray();
    ASSERT_EQ(mappings.size(), 3);
    const QJsonObject launch = mappings.at(0).toObject();
    EXPECT_EQ(launch.value(QStringLiteral("position_id")).toString(), QStringLiteral("Launch Zone"));
    EXPECT_EQ(launch.value(QStringLiteral("mapping_index")).toInt(), 0);
    EXPECT_EQ(launch.value(QStringLiteral("rotation")).toInt(), -90);
    EXPECT_EQ(launch.value(QStringLiteral("device_id")).toString(), QStringLiteral("07aaaa"));
    EXPECT_EQ(mappings.at(2).toObject().value(QStringLiteral("mapping_index")).toInt(), 2);
    EXPECT_EQ(formation.stage(), FormationStage::Initial);
}

TEST_F(GroupFormationTest, EphemeralCreationResolvesOnceAndIsFoundOnRepeat) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);

    QJsonObject data;
    data.insert(QStringLiteral("group_id"), QStringLiteral("G1"));
    QJsonObject response = status("success", "Temporary group created");
    response.insert(QStringLiteral("data"), data);
    deliver(events::kCreateTemporaryGroupStatus, response);

    ASSERT_EQ(created.size(), 1);
    EXPECT_EQ(created.front().value(QStringLiteral("axfId")).toString(), QStringLiteral("G1"));
    EXPECT_EQ(refreshes, 0);

    scheduler.advance(kRefreshAfterCreateMs);
    EXPECT_EQ(refreshes, 1);

    scheduler.advance(kCreationDeadlineMs);
    EXPECT_EQ(channel.count(QLatin1String(events::kCreateDeviceGroup)), 0);
    EXPECT_EQ(outcomes(), 1);

    const int sentBefore = channel.sent.size();
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    ASSERT_EQ(found.size(), 1);
    EXPECT_EQ(found.front().value(QStringLiteral("axfId")).toString(), QStringLiteral("G1"));
    EXPECT_EQ(channel.sent.size(), sentBefore);
}

TEST_F(GroupFormationTest, GroupCreatedUnderDefinitionNameIsFoundOnRepeat) {
    QJsonObject definition;
    definition.insert(QStringLiteral("axf_id"), QStringLiteral("def-123"));
    definition.insert(QStringLiteral("name"), kName);
    QJsonObject definitions;
    definitions.insert(QStringLiteral("data"), QJsonArray{definition});
    directory.onDirectoryEvent(QLatin1String(events::kGroupDefinitionsStatus), definitions, scheduler.now());

    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    const FakeEventChannel::Sent *sent = channel.last(QLatin1String(events::kCreateTemporaryGroup));
    ASSERT_NE(sent, nullptr);
    EXPECT_EQ(sent->payload.toObject().value(QStringLiteral("group_definition_id")).toString(),
              QStringLiteral("def-123"));

    QJsonObject data;
    data.insert(QStringLiteral("group_id"), QStringLiteral("G9"));
    QJsonObject response = status("success", "");
    response.insert(QStringLiteral("data"), data);
    deliver(events::kCreateTemporaryGroupStatus, response);
    ASSERT_EQ(created.size(), 1);
    EXPECT_EQ(created.front().value(QStringLiteral("groupConfiguration")).toString(), kName);

    const int sentBefore = channel.sent.size();
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    ASSERT_EQ(found.size(), 1);
    EXPECT_EQ(found.front().value(QStringLiteral("axfId")).toString(), QStringLiteral("G9"));
    EXPECT_EQ(channel.sent.size(), sentBefore);
    EXPECT_FALSE(formation.hasPending());
}

TEST_F(GroupFormationTest, GroupTaggedWithResolvedDefinitionIdMatches) {
    QJsonObject definition;
    definition.insert(QStringLiteral("axf_id"), QStringLiteral("def-123"));
    definition.insert(QStringLiteral("name"), kName);
    directory.onDirectoryEvent(QLatin1String(events::kGroupDefinitions), QJsonArray{definition}, scheduler.now());

    QJsonObject group = mound_group("G4");
    group.remove(QStringLiteral("groupConfiguration"));
    group.insert(QStringLiteral("groupDefinitionId"), QStringLiteral("def-123"));
    publishGroups(QJsonArray{group});

    formation.findOrCreateGroup(desired_mound(), kDefinition, kName, false);

    ASSERT_EQ(found.size(), 1);
    EXPECT_TRUE(errors.isEmpty());
    EXPECT_TRUE(channel.sent.isEmpty());
}

TEST_F(GroupFormationTest, GroupObjectResponseResolvesCreated) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);

    QJsonObject wrapped;
    wrapped.insert(QStringLiteral("response"), mound_group("G2"));
    deliver(events::kCreateDeviceGroupStatus, wrapped);

    ASSERT_EQ(created.size(), 1);
    EXPECT_EQ(created.front().value(QStringLiteral("axfId")).toString(), QStringLiteral("G2"));
    EXPECT_EQ(refreshes, 1);
    ASSERT_TRUE(directory.resolveGroupForDevice(QStringLiteral("07aaaa")).has_value());
    EXPECT_EQ(*directory.resolveGroupForDevice(QStringLiteral("07aaaa")), QStringLiteral("G2"));
}

TEST_F(GroupFormationTest, LegacySaveReinitializesAndWaitsForRefreshedDirectory) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    deliver(events::kGroupUpdateStatus, status("success", "Group saved successfully. Restart to apply."));

    EXPECT_EQ(formation.stage(), FormationStage::ReinitWait);
    EXPECT_EQ(channel.count(QLatin1String(events::kReinitializeGroups)), 1);
    EXPECT_EQ(outcomes(), 0);

    scheduler.advance(kReinitRecheckFirstMs);
    EXPECT_EQ(refreshes, 1);
    EXPECT_EQ(outcomes(), 0);

    publishGroups(QJsonArray{mound_group("G3")});

    ASSERT_EQ(found.size(), 1);
    EXPECT_EQ(found.front().value(QStringLiteral("axfId")).toString(), QStringLiteral("G3"));
    EXPECT_EQ(outcomes(), 1);

    scheduler.advance(10000);
    EXPECT_EQ(outcomes(), 1);
}

TEST_F(GroupFormationTest, ScheduledRecheckMatchesGroupAlreadyInDirectory) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    deliver(events::kGroupUpdateStatus, status("success", "Saved, restart required"));

    // The directory learns the group without a refresh notification.
    QJsonObject payload;
    payload.insert(QStringLiteral("data"), QJsonArray{mound_group("G4")});
    directory.onDirectoryEvent(QLatin1String(events::kConnectedGroupList), payload, 0);
    EXPECT_EQ(outcomes(), 0);

    scheduler.advance(kReinitRecheckFirstMs);
    ASSERT_EQ(found.size(), 1);
    EXPECT_EQ(found.front().value(QStringLiteral("axfId")).toString(), QStringLiteral("G4"));
}

TEST_F(GroupFormationTest, RejectedReinitializeFallsBackToLegacyCommandOnce) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    deliver(events::kGroupUpdateStatus, status("success", "Group saved successfully"));

    QJsonObject rejected;
    rejected.insert(QStringLiteral("status"), QStringLiteral("error"));
    deliver(events::kReinitializeGroupsStatus, rejected);
    deliver(events::kReinitializeGroupsStatus, rejected);

    EXPECT_EQ(channel.count(QLatin1String(events::kReinitializeGroupsLegacy)), 1);
}

TEST_F(GroupFormationTest, UnansweredCreationRetriesEachFallbackOnceThenTimesOut) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);

    scheduler.advance(kFallbackDelayMs);
    EXPECT_EQ(channel.count(QLatin1String(events::kCreateDeviceGroup)), 1);
    EXPECT_EQ(channel.count(QLatin1String(events::kSaveGroupLegacy)), 0);
    const QJsonObject camel = channel.last(QLatin1String(events::kCreateDeviceGroup))->payload.toObject();
    EXPECT_EQ(camel.value(QStringLiteral("groupDefinitionId")).toString(), kDefinition);
    EXPECT_EQ(camel.value(QStringLiteral("mappings")).toArray().at(0).toObject().value(QStringLiteral("positionId")),
              QJsonValue(QStringLiteral("Launch Zone")));

    scheduler.advance(kFallbackDelayMs);
    EXPECT_EQ(channel.count(QLatin1String(events::kSaveGroupLegacy)), 1);
    EXPECT_EQ(formation.stage(), FormationStage::LegacyRetry);
    EXPECT_EQ(outcomes(), 0);

    scheduler.advance(kCreationDeadlineMs - 2 * kFallbackDelayMs);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors.front(), QStringLiteral("Timed out waiting for the backend to create the group"));

    scheduler.advance(20000);
    EXPECT_EQ(channel.count(QLatin1String(events::kCreateDeviceGroup)), 1);
    EXPECT_EQ(channel.count(QLatin1String(events::kSaveGroupLegacy)), 1);
    EXPECT_EQ(outcomes(), 1);
}

TEST_F(GroupFormationTest, FallbackIsSkippedWhileDisconnected) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    channel.connected = false;

    scheduler.advance(2 * kFallbackDelayMs);

    EXPECT_EQ(channel.count(QLatin1String(events::kCreateDeviceGroup)), 0);
    EXPECT_EQ(channel.count(QLatin1String(events::kSaveGroupLegacy)), 0);
}

TEST_F(GroupFormationTest, ReinitWaitExtendsTheDeadline) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    scheduler.advance(4000);
    deliver(events::kGroupUpdateStatus, status("success", "Group saved successfully"));

    scheduler.advance(kCreationDeadlineMs - 4000);
    EXPECT_TRUE(errors.isEmpty());

    scheduler.advance(kReinitDeadlineMs - (kCreationDeadlineMs - 4000) - 1);
    EXPECT_TRUE(errors.isEmpty());

    scheduler.advance(1);
    EXPECT_EQ(errors.size(), 1);
}

TEST_F(GroupFormationTest, BackendErrorResolvesImmediatelyWithoutRetry) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);

    QJsonObject response;
    response.insert(QStringLiteral("error"), QStringLiteral("Device 07-AAAA already grouped"));
    deliver(events::kCreateTemporaryGroupStatus, response);

    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors.front(), QStringLiteral("Device 07-AAAA already grouped"));
    scheduler.advance(10000);
    EXPECT_EQ(channel.count(QLatin1String(events::kCreateDeviceGroup)), 0);
    EXPECT_EQ(outcomes(), 1);
}

TEST_F(GroupFormationTest, UnrecognizedResponseDoesNotStopFallback) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);

    deliver(events::kCreateTemporaryGroupStatus, QJsonValue(QStringLiteral("ok")));
    scheduler.advance(kFallbackDelayMs);

    EXPECT_EQ(outcomes(), 0);
    EXPECT_EQ(channel.count(QLatin1String(events::kCreateDeviceGroup)), 1);
}

TEST_F(GroupFormationTest, ResponsesFromAnotherEpochAreIgnored) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    channel.epoch = 2;

    QJsonObject wrapped;
    wrapped.insert(QStringLiteral("response"), mound_group("G5"));
    deliver(events::kCreateDeviceGroupStatus, wrapped);

    EXPECT_EQ(outcomes(), 0);
    EXPECT_TRUE(formation.hasPending());
}

TEST_F(GroupFormationTest, LateResponseAfterResolutionIsIgnored) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    scheduler.advance(kCreationDeadlineMs);
    ASSERT_EQ(errors.size(), 1);

    QJsonObject wrapped;
    wrapped.insert(QStringLiteral("response"), mound_group("G6"));
    deliver(events::kCreateDeviceGroupStatus, wrapped);

    EXPECT_TRUE(created.isEmpty());
    EXPECT_EQ(outcomes(), 1);
}

TEST_F(GroupFormationTest, AbandonDropsThePendingRequestSilently) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    formation.abandon();

    scheduler.advance(20000);

    EXPECT_EQ(outcomes(), 0);
    EXPECT_EQ(channel.count(QLatin1String(events::kCreateDeviceGroup)), 0);
}

TEST_F(GroupFormationTest, NewRequestSupersedesThePreviousOne) {
    formation.findOrCreateGroup(desired_mound(), kDefinition, kName);
    scheduler.advance(1000);
    PositionMapping other = desired_mound();
    other.insert(QStringLiteral("Launch Zone"), QStringLiteral("07-EEEE"));
    formation.findOrCreateGroup(other, kDefinition, kName);

    // Only the second request's deadline produces an outcome.
    scheduler.advance(kCreationDeadlineMs - 1000);
    EXPECT_EQ(outcomes(), 0);
    scheduler.advance(1000);
    EXPECT_EQ(outcomes(), 1);
    EXPECT_EQ(channel.count(QLatin1String(events::kCreateDeviceGroup)), 1);
}

TEST(GroupFormationMappings, DefinitionPositionsAreUsedAndExtrasAppended) {
    DirectorySnapshot snapshot;
    GroupDefinition definition;
    definition.definitionId = QStringLiteral("PM-2");
    definition.name = QStringLiteral("Pitching Mound");
    definition.requiredPositions = {{QStringLiteral("Launch Zone"), 4, 180}, {QStringLiteral("Landing"), 5, 0}};
    snapshot.definitions.append(definition);

    PositionMapping desired;
    desired.insert(QStringLiteral("Launch Zone"), QStringLiteral("07-A"));
    desired.insert(QStringLiteral("Landing"), QStringLiteral("08-B"));
    desired.insert(QStringLiteral("Spare"), QStringLiteral("08-C"));

    QString resolved;
    const QJsonArray mappings = build_mappings(snapshot, desired, QStringLiteral("PitchingMound"), &resolved);

    EXPECT_EQ(resolved, QStringLiteral("PM-2"));
    ASSERT_EQ(mappings.size(), 3);
    EXPECT_EQ(mappings.at(0).toObject().value(QStringLiteral("rotation")).toInt(), 180);
    const QJsonObject spare = mappings.at(2).toObject();
    EXPECT_EQ(spare.value(QStringLiteral("position_id")).toString(), QStringLiteral("Spare"));
    EXPECT_EQ(spare.value(QStringLiteral("mapping_index")).toInt(), 6);
    EXPECT_EQ(spare.value(QStringLiteral("rotation")).toInt(), 0);
}

TEST(GroupFormationResponses, ShapesAreClassified) {
    EXPECT_EQ(interpret_create_response(mound_group("G1")).kind, ResponseKind::Created);

    QJsonObject ephemeral = status("success", "");
    ephemeral.insert(QStringLiteral("data"), QJsonObject{{QStringLiteral("groupId"), QStringLiteral("T1")}});
    const CreateResponse temp = interpret_create_response(ephemeral);
    EXPECT_EQ(temp.kind, ResponseKind::CreatedEphemeral);
    EXPECT_EQ(temp.groupId, QStringLiteral("T1"));

    EXPECT_EQ(interpret_create_response(status("success", "Please restart the backend")).kind,
              ResponseKind::Persisted);
    EXPECT_EQ(interpret_create_response(status("failed", "Invalid mapping")).kind, ResponseKind::Rejected);
    EXPECT_EQ(interpret_create_response(status("success", "")).kind, ResponseKind::Unrecognized);
    EXPECT_EQ(interpret_create_response(QJsonArray{}).kind, ResponseKind::Unrecognized);
}
