#pragma once

#include <QtCore/QHash>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>
#include <QtCore/QMetaType>
#include <QtCore/QMutex>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <optional>

#include "protocol_capabilities.hpp"

namespace fl::client {

enum class DeviceType {
    Unknown,
    Type06,
    Type07,
    Type08,
    Type10,
    Type11,
    Type12,
};

// "07" -> Type07. Anything else is Unknown.
DeviceType device_type_from_code(const QString &code);
QString device_type_code(DeviceType type);

// The first two characters of the id win; the backend's hint is the fallback.
DeviceType infer_device_type(const QString &axfId, const QJsonValue &hint = QJsonValue());

// Trimmed, lower-cased, hyphens removed: "07-ABCD" -> "07abcd".
QString normalize_device_id(const QString &id);

// Lower-cased alphanumerics only: "Pitching Mound" -> "pitchingmound".
QString normalize_label(const QString &label);

struct DeviceRecord {
    QString axfId;
    QString displayName;
    DeviceType deviceType = DeviceType::Unknown;
    qint64 lastSeenAt = 0;
};

// What external consumers receive: {name, id, type}.
struct DeviceListing {
    QString name;
    QString id;
    QString type;

    bool operator==(const DeviceListing &other) const {
        return name == other.name && id == other.id && type == other.type;
    }
};

struct GroupPosition {
    QString positionId;
    int mappingIndex = 0;
    int rotation = 0;
};

struct GroupDefinition {
    QString definitionId;
    QString name;
    QVector<GroupPosition> requiredPositions;
};

struct GroupMapping {
    QString positionId;
    QString deviceId;
};

struct GroupInstance {
    QString groupId;
    QString name;
    QString configurationLabel;
    QString definitionId;
    QVector<GroupMapping> mappings;
    QStringList deviceIds;
    QStringList memberIds;
    QJsonObject raw;

    // position -> normalized device id, from `mappings` or else from
    // positioned `members` or `devices` entries.
    QHash<QString, QString> positionMap() const;
};

enum class EnvelopeShape {
    Flat,
    DataWrapped,
    ResponseWrapped,
    GroupsWrapped,
    DevicesWrapped,
    Empty,
};

struct Envelope {
    EnvelopeShape shape = EnvelopeShape::Empty;
    QJsonArray items;
};

Envelope decode_envelope(const QJsonValue &payload);

GroupInstance parse_group(const QJsonObject &obj);
std::optional<GroupDefinition> parse_definition(const QJsonObject &obj);
std::optional<DeviceRecord> parse_device(const QJsonObject &obj, qint64 nowMs);

struct DirectorySnapshot {
    QVector<DeviceRecord> devices;
    QVector<GroupInstance> groups;
    QVector<GroupDefinition> definitions;
    QJsonValue deviceTypes;
    QSet<QString> connectedDeviceIds;
};

struct DirectoryUpdate {
    DirectoryEventKind kind = DirectoryEventKind::None;
    EnvelopeShape shape = EnvelopeShape::Empty;
    bool devicesChanged = false;
    QVector<DeviceListing> devices;
    bool groupsChanged = false;
    bool definitionsChanged = false;
    bool connectionStatusChanged = false;
    bool zeroConnected = false;
};

// Cache of what the backend reported about devices and groups. Writers are
// the dispatch thread; readers take a snapshot.
class DeviceDirectory {
public:
    DirectoryUpdate onDirectoryEvent(const QString &eventName, const QJsonValue &payload, qint64 nowMs);

    std::optional<QString> resolveGroupForDevice(const QString &deviceId) const;
    DirectorySnapshot snapshot() const;

    void rememberGroup(const GroupInstance &group);
    void clearConnectionState();

private:
    QVector<DeviceListing> applyDeviceList(const QJsonArray &items, bool itemsAreGroups, qint64 nowMs);

    mutable QMutex mutex_;
    QVector<DeviceRecord> devices_;
    QVector<GroupInstance> groups_;
    QVector<GroupDefinition> definitions_;
    QJsonValue deviceTypes_;
    QSet<QString> connected_;
};

}  // namespace fl::client

Q_DECLARE_METATYPE(fl::client::DeviceListing)
