#pragma once

#include <QtCore/QLatin1String>
#include <QtCore/QString>

#include <array>

namespace fl::client {

// What a response event is expected to carry. Backend generations are told
// apart by the shape of what arrives, so the hint only orders interpretation.
enum class ResponseShape {
    None,
    GroupObject,     // group object with an id, possibly inside `response`
    EphemeralGroup,  // {status, data: {group_id}}
    LegacySave,      // {status, message: "...restart..."}
    Status,          // generic {status, message}
};

enum class DirectoryEventKind {
    None,
    DeviceList,
    GroupDefinitions,
    ConnectedGroups,
    DeviceTypes,
    ConnectionStatus,
};

struct InboundCapability {
    const char *event;
    ResponseShape shape;
    DirectoryEventKind directory;
};

namespace events {

// Lifecycle and telemetry.
inline constexpr char kConnect[] = "connect";
inline constexpr char kDisconnect[] = "disconnect";
inline constexpr char kError[] = "error";
inline constexpr char kTelemetry[] = "jsonData";
inline constexpr char kCompactTelemetry[] = "simpleJsonData";

// Outbound commands.
inline constexpr char kStartDataReception[] = "startDataReception";
inline constexpr char kStopDataReception[] = "stopDataReception";
inline constexpr char kGetDeviceSettings[] = "getDeviceSettings";
inline constexpr char kGetDeviceTypes[] = "getDeviceTypes";
inline constexpr char kGetGroupDefinitions[] = "getGroupDefinitions";
inline constexpr char kGetConnectedDevices[] = "getConnectedDevices";
inline constexpr char kGetConnectedGroups[] = "getConnectedGroups";
inline constexpr char kGetGroupsLegacy[] = "getGroups";
inline constexpr char kCreateTemporaryGroup[] = "createTemporaryGroup";
inline constexpr char kCreateDeviceGroup[] = "createDeviceGroup";
inline constexpr char kSaveGroupLegacy[] = "saveGroup";
inline constexpr char kReinitializeGroups[] = "reinitializeDeviceGroups";
inline constexpr char kReinitializeGroupsLegacy[] = "reinitializeConnectedDevices";
inline constexpr char kGetBackendConfig[] = "getDynamoConfig";
inline constexpr char kUpdateBackendConfig[] = "updateDynamoConfig";
inline constexpr char kSetReferenceTime[] = "setReferenceTime";
inline constexpr char kTareAll[] = "tareAll";
inline constexpr char kStartCapture[] = "startCapture";
inline constexpr char kStopCapture[] = "stopCapture";

// Inbound responses.
inline constexpr char kCreateTemporaryGroupStatus[] = "createTemporaryGroupStatus";
inline constexpr char kCreateDeviceGroupStatus[] = "createDeviceGroupStatus";
inline constexpr char kGroupUpdateStatus[] = "groupUpdateStatus";
inline constexpr char kReinitializeGroupsStatus[] = "reinitializeDeviceGroupsStatus";
inline constexpr char kReinitializeGroupsLegacyStatus[] = "reinitializeConnectedDevicesStatus";
inline constexpr char kConnectedDeviceList[] = "connectedDeviceList";
inline constexpr char kDeviceTypesStatus[] = "getDeviceTypesStatus";
inline constexpr char kGroupDefinitionsStatus[] = "getGroupDefinitionsStatus";
inline constexpr char kGroupDefinitions[] = "groupDefinitions";
inline constexpr char kConnectedGroupsStatus[] = "getConnectedGroupsStatus";
inline constexpr char kGroupsStatusLegacy[] = "getGroupsStatus";
inline constexpr char kConnectedGroupList[] = "connectedGroupList";
inline constexpr char kConnectionStatusUpdate[] = "connectionStatusUpdate";
inline constexpr char kBackendConfigStatus[] = "getDynamoConfigStatus";
inline constexpr char kStartDataReceptionStatus[] = "startDataReceptionStatus";

}  // namespace events

inline constexpr std::array<InboundCapability, 14> kInboundCapabilities{{
    {events::kCreateTemporaryGroupStatus, ResponseShape::EphemeralGroup, DirectoryEventKind::None},
    {events::kCreateDeviceGroupStatus, ResponseShape::GroupObject, DirectoryEventKind::None},
    {events::kGroupUpdateStatus, ResponseShape::LegacySave, DirectoryEventKind::None},
    {events::kReinitializeGroupsStatus, ResponseShape::Status, DirectoryEventKind::None},
    {events::kReinitializeGroupsLegacyStatus, ResponseShape::Status, DirectoryEventKind::None},
    {events::kConnectedDeviceList, ResponseShape::None, DirectoryEventKind::DeviceList},
    {events::kDeviceTypesStatus, ResponseShape::None, DirectoryEventKind::DeviceTypes},
    {events::kGroupDefinitionsStatus, ResponseShape::None, DirectoryEventKind::GroupDefinitions},
    {events::kGroupDefinitions, ResponseShape::None, DirectoryEventKind::GroupDefinitions},
    {events::kConnectedGroupsStatus, ResponseShape::None, DirectoryEventKind::ConnectedGroups},
    {events::kGroupsStatusLegacy, ResponseShape::None, DirectoryEventKind::ConnectedGroups},
    {events::kConnectedGroupList, ResponseShape::None, DirectoryEventKind::ConnectedGroups},
    {events::kConnectionStatusUpdate, ResponseShape::None, DirectoryEventKind::ConnectionStatus},
    {events::kStartDataReceptionStatus, ResponseShape::Status, DirectoryEventKind::None},
}};

// Creation commands in fallback order, with the key style each one validates.
enum class PayloadStyle {
    SnakeCase,
    CamelCase,
};

struct CreateCommand {
    const char *event;
    PayloadStyle style;
};

inline constexpr std::array<CreateCommand, 3> kCreateCommands{{
    {events::kCreateTemporaryGroup, PayloadStyle::SnakeCase},
    {events::kCreateDeviceGroup, PayloadStyle::CamelCase},
    {events::kSaveGroupLegacy, PayloadStyle::SnakeCase},
}};

inline constexpr std::array<const char *, 2> kReinitializeCommands{{
    events::kReinitializeGroups,
    events::kReinitializeGroupsLegacy,
}};

inline constexpr std::array<const char *, 6> kDiscoveryCommands{{
    events::kGetDeviceSettings,
    events::kGetDeviceTypes,
    events::kGetGroupDefinitions,
    events::kGetConnectedDevices,
    events::kGetConnectedGroups,
    events::kGetGroupsLegacy,
}};

inline ResponseShape response_shape_for(const QString &event) {
    for (const auto &capability : kInboundCapabilities) {
        if (event == QLatin1String(capability.event)) {
            return capability.shape;
        }
    }
    return ResponseShape::None;
}

inline DirectoryEventKind directory_kind_for(const QString &event) {
    for (const auto &capability : kInboundCapabilities) {
        if (event == QLatin1String(capability.event)) {
            return capability.directory;
        }
    }
    return DirectoryEventKind::None;
}

}  // namespace fl::client
