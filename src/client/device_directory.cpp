#include "device_directory.hpp"

#include <QtCore/QMutexLocker>

#include "common/json_util.hpp"
#include "common/logger.hpp"

using fl::common::Logger;
using fl::common::LogLevel;
using fl::json::first_string;

namespace fl::client {

namespace {

const QString kCategory = QStringLiteral("directory");

bool is_group_object(const QJsonObject &obj) {
    if (!obj.value(QLatin1String("devices")).isArray()) {
        return false;
    }
    return obj.contains(QLatin1String("isDeviceGroup")) || obj.contains(QLatin1String("groupConfiguration")) ||
           obj.contains(QLatin1String("is_device_group")) || obj.contains(QLatin1String("group_configuration"));
}

// `devices` before `groups`; a present but empty array still counts as the shape.
bool container_items(const QJsonObject &obj, QJsonArray *items, EnvelopeShape *shape = nullptr) {
    const QJsonValue devices = obj.value(QLatin1String("devices"));
    const QJsonValue groups = obj.value(QLatin1String("groups"));
    if (!devices.isArray() && !groups.isArray()) {
        return false;
    }
    const bool useGroups =
        groups.isArray() && (!devices.isArray() || (devices.toArray().isEmpty() && !groups.toArray().isEmpty()));
    *items = useGroups ? groups.toArray() : devices.toArray();
    if (shape) {
        *shape = useGroups ? EnvelopeShape::GroupsWrapped : EnvelopeShape::DevicesWrapped;
    }
    return true;
}

QJsonValue type_hint(const QJsonObject &obj) {
    for (const char *key : {"deviceTypeId", "device_type_id", "deviceType", "device_type", "type"}) {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (fl::json::is_truthy(value)) {
            return value;
        }
    }
    return QJsonValue();
}

void collect_positions(const QJsonArray &entries, std::initializer_list<const char *> idKeys,
                       QHash<QString, QString> *out) {
    for (const auto &entry : entries) {
        if (!entry.isObject()) {
            continue;
        }
        const QJsonObject obj = entry.toObject();
        const QString position = first_string(obj, {"position", "positionId", "position_id"});
        const QString device = first_string(obj, idKeys);
        if (!position.isEmpty() && !device.isEmpty()) {
            out->insert(position, normalize_device_id(device));
        }
    }
}

QStringList collect_ids(const QJsonArray &entries, std::initializer_list<const char *> idKeys) {
    QStringList ids;
    for (const auto &entry : entries) {
        if (!entry.isObject()) {
            continue;
        }
        const QString id = first_string(entry.toObject(), idKeys);
        if (!id.isEmpty()) {
            ids.append(id);
        }
    }
    return ids;
}

}  // namespace

DeviceType device_type_from_code(const QString &code) {
    const QString trimmed = code.trimmed();
    if (trimmed == QLatin1String("06")) {
        return DeviceType::Type06;
    }
    if (trimmed == QLatin1String("07")) {
        return DeviceType::Type07;
    }
    if (trimmed == QLatin1String("08")) {
        return DeviceType::Type08;
    }
    if (trimmed == QLatin1String("10")) {
        return DeviceType::Type10;
    }
    if (trimmed == QLatin1String("11")) {
        return DeviceType::Type11;
    }
    if (trimmed == QLatin1String("12")) {
        return DeviceType::Type12;
    }
    return DeviceType::Unknown;
}

QString device_type_code(DeviceType type) {
    switch (type) {
        case DeviceType::Type06:
            return QStringLiteral("06");
        case DeviceType::Type07:
            return QStringLiteral("07");
        case DeviceType::Type08:
            return QStringLiteral("08");
        case DeviceType::Type10:
            return QStringLiteral("10");
        case DeviceType::Type11:
            return QStringLiteral("11");
        case DeviceType::Type12:
            return QStringLiteral("12");
        case DeviceType::Unknown:
            break;
    }
    return {};
}

DeviceType infer_device_type(const QString &axfId, const QJsonValue &hint) {
    const DeviceType fromPrefix = device_type_from_code(axfId.trimmed().left(2));
    if (fromPrefix != DeviceType::Unknown) {
        return fromPrefix;
    }
    if (hint.isString()) {
        return device_type_from_code(hint.toString());
    }
    if (hint.isDouble()) {
        // Numeric type ids drop the leading zero: 7 -> "07".
        return device_type_from_code(QStringLiteral("%1").arg(hint.toInt(), 2, 10, QLatin1Char('0')));
    }
    return DeviceType::Unknown;
}

QString normalize_device_id(const QString &id) {
    return id.trimmed().toLower().remove(QLatin1Char('-'));
}

QString normalize_label(const QString &label) {
    QString out;
    out.reserve(label.size());
    for (const QChar ch : label) {
        if (ch.isLetterOrNumber()) {
            out.append(ch.toLower());
        }
    }
    return out;
}

QHash<QString, QString> GroupInstance::positionMap() const {
    QHash<QString, QString> map;
    for (const auto &mapping : mappings) {
        if (!mapping.positionId.isEmpty() && !mapping.deviceId.isEmpty()) {
            map.insert(mapping.positionId, normalize_device_id(mapping.deviceId));
        }
    }
    if (!map.isEmpty()) {
        return map;
    }
    collect_positions(raw.value(QLatin1String("members")).toArray(), {"deviceId", "device_id", "axfId", "id"}, &map);
    if (!map.isEmpty()) {
        return map;
    }
    collect_positions(raw.value(QLatin1String("devices")).toArray(), {"axfId", "id", "deviceId", "device_id"}, &map);
    return map;
}

Envelope decode_envelope(const QJsonValue &payload) {
    Envelope envelope;
    if (payload.isArray()) {
        envelope.shape = EnvelopeShape::Flat;
        envelope.items = payload.toArray();
        return envelope;
    }
    if (!payload.isObject()) {
        return envelope;
    }

    const QJsonObject obj = payload.toObject();
    if (obj.contains(QLatin1String("response")) || obj.contains(QLatin1String("data"))) {
        QJsonValue inner = obj.value(QLatin1String("response"));
        EnvelopeShape shape = EnvelopeShape::ResponseWrapped;
        if (!fl::json::is_truthy(inner)) {
            inner = obj.value(QLatin1String("data"));
            shape = EnvelopeShape::DataWrapped;
        }
        if (inner.isArray()) {
            envelope.shape = shape;
            envelope.items = inner.toArray();
        } else if (inner.isObject() && container_items(inner.toObject(), &envelope.items)) {
            envelope.shape = shape;
        }
        return envelope;
    }

    EnvelopeShape shape = EnvelopeShape::Empty;
    if (container_items(obj, &envelope.items, &shape)) {
        envelope.shape = shape;
    }
    return envelope;
}

GroupInstance parse_group(const QJsonObject &obj) {
    GroupInstance group;
    group.groupId = first_string(obj, {"axfId", "axf_id", "groupId", "id"});
    group.name = first_string(obj, {"name", "groupName", "group_name"});
    group.configurationLabel =
        first_string(obj, {"groupConfiguration", "group_configuration", "configuration", "configurationId",
                           "configuration_id"});
    group.definitionId = first_string(obj, {"groupDefinitionId", "group_definition_id"});

    for (const auto &entry : obj.value(QLatin1String("mappings")).toArray()) {
        if (!entry.isObject()) {
            continue;
        }
        const QJsonObject mappingObj = entry.toObject();
        GroupMapping mapping;
        mapping.positionId = first_string(mappingObj, {"position", "positionId", "position_id"});
        mapping.deviceId = first_string(mappingObj, {"deviceId", "device_id"});
        if (!mapping.positionId.isEmpty() || !mapping.deviceId.isEmpty()) {
            group.mappings.append(mapping);
        }
    }
    group.deviceIds = collect_ids(obj.value(QLatin1String("devices")).toArray(), {"axfId", "id", "deviceId", "device_id"});
    group.memberIds =
        collect_ids(obj.value(QLatin1String("members")).toArray(), {"deviceId", "device_id", "axfId", "id"});
    group.raw = obj;
    return group;
}

std::optional<GroupDefinition> parse_definition(const QJsonObject &obj) {
    GroupDefinition definition;
    definition.definitionId = first_string(obj, {"axf_id", "axfId"});
    definition.name = first_string(obj, {"name", "group_definition_name", "groupDefinitionName"});
    if (definition.definitionId.isEmpty() && definition.name.isEmpty()) {
        return std::nullopt;
    }
    const QJsonArray positions = fl::json::first_array(
        obj, {"required_group_positions", "requiredGroupPositions", "required_devices", "requiredDevices"});
    for (const auto &entry : positions) {
        if (!entry.isObject()) {
            continue;
        }
        const QJsonObject positionObj = entry.toObject();
        GroupPosition position;
        position.positionId = first_string(positionObj, {"position_id", "positionId"});
        if (position.positionId.isEmpty()) {
            continue;
        }
        position.mappingIndex = fl::json::first_int(positionObj, {"mapping_index", "mappingIndex"}).value_or(0);
        position.rotation = fl::json::first_int(positionObj, {"rotation"}).value_or(0);
        definition.requiredPositions.append(position);
    }
    return definition;
}

std::optional<DeviceRecord> parse_device(const QJsonObject &obj, qint64 nowMs) {
    DeviceRecord record;
    record.axfId =
        first_string(obj, {"axfId", "axf_id", "deviceAxfId", "device_axf_id", "id", "deviceId", "device_id"});
    if (record.axfId.isEmpty()) {
        return std::nullopt;
    }
    record.displayName = first_string(obj, {"name", "deviceName"});
    if (record.displayName.isEmpty()) {
        record.displayName = QStringLiteral("Unknown");
    }
    record.deviceType = infer_device_type(record.axfId, type_hint(obj));
    record.lastSeenAt = nowMs;
    return record;
}

DirectoryUpdate DeviceDirectory::onDirectoryEvent(const QString &eventName, const QJsonValue &payload, qint64 nowMs) {
    DirectoryUpdate update;
    update.kind = directory_kind_for(eventName);
    if (update.kind == DirectoryEventKind::None) {
        return update;
    }

    QMutexLocker locker(&mutex_);
    switch (update.kind) {
        case DirectoryEventKind::DeviceList: {
            const Envelope envelope = decode_envelope(payload);
            update.shape = envelope.shape;
            update.devices = applyDeviceList(envelope.items, false, nowMs);
            update.devicesChanged = true;
            break;
        }
        case DirectoryEventKind::GroupDefinitions: {
            const Envelope envelope = decode_envelope(payload);
            update.shape = envelope.shape;
            definitions_.clear();
            for (const auto &item : envelope.items) {
                if (!item.isObject()) {
                    continue;
                }
                const auto definition = parse_definition(item.toObject());
                if (definition.has_value()) {
                    definitions_.append(*definition);
                }
            }
            update.definitionsChanged = true;
            Logger::instance().log(LogLevel::Debug, kCategory,
                                   QStringLiteral("%1 group definitions").arg(definitions_.size()));
            break;
        }
        case DirectoryEventKind::ConnectedGroups: {
            const Envelope envelope = decode_envelope(payload);
            update.shape = envelope.shape;
            groups_.clear();
            for (const auto &item : envelope.items) {
                if (item.isObject()) {
                    groups_.append(parse_group(item.toObject()));
                }
            }
            update.groupsChanged = true;
            update.devices = applyDeviceList(envelope.items, true, nowMs);
            update.devicesChanged = true;
            Logger::instance().log(LogLevel::Debug, kCategory, QStringLiteral("%1 connected groups").arg(groups_.size()));
            break;
        }
        case DirectoryEventKind::DeviceTypes: {
            const Envelope envelope = decode_envelope(payload);
            update.shape = envelope.shape;
            deviceTypes_ = envelope.shape == EnvelopeShape::Empty ? payload : QJsonValue(envelope.items);
            break;
        }
        case DirectoryEventKind::ConnectionStatus: {
            QSet<QString> connected;
            const QJsonObject byGroup = payload.toObject();
            for (auto it = byGroup.begin(); it != byGroup.end(); ++it) {
                const QJsonObject devices = it.value().toObject().value(QLatin1String("devices")).toObject();
                for (auto dev = devices.begin(); dev != devices.end(); ++dev) {
                    if (fl::json::is_truthy(dev.value())) {
                        connected.insert(dev.key());
                    }
                }
            }
            connected_ = connected;
            update.connectionStatusChanged = true;
            update.zeroConnected = connected_.isEmpty();
            break;
        }
        case DirectoryEventKind::None:
            break;
    }
    return update;
}

QVector<DeviceListing> DeviceDirectory::applyDeviceList(const QJsonArray &items, bool itemsAreGroups, qint64 nowMs) {
    QVector<QJsonObject> flattened;
    for (const auto &item : items) {
        if (!item.isObject()) {
            continue;
        }
        const QJsonObject obj = item.toObject();
        const bool isGroup = is_group_object(obj) || (itemsAreGroups && obj.value(QLatin1String("devices")).isArray());
        if (!isGroup) {
            flattened.append(obj);
            continue;
        }
        for (const auto &device : obj.value(QLatin1String("devices")).toArray()) {
            if (device.isObject()) {
                flattened.append(device.toObject());
            }
        }
    }

    QVector<DeviceListing> listings;
    for (const auto &obj : flattened) {
        const auto record = parse_device(obj, nowMs);
        if (!record.has_value()) {
            continue;
        }
        bool replaced = false;
        for (auto &existing : devices_) {
            if (existing.axfId == record->axfId) {
                existing = *record;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            devices_.append(*record);
        }
        listings.append(DeviceListing{record->displayName, record->axfId, device_type_code(record->deviceType)});
    }
    Logger::instance().log(LogLevel::Debug, kCategory, QStringLiteral("Device list: %1 devices").arg(listings.size()));
    return listings;
}

std::optional<QString> DeviceDirectory::resolveGroupForDevice(const QString &deviceId) const {
    const QString wanted = normalize_device_id(deviceId);
    if (wanted.isEmpty()) {
        return std::nullopt;
    }
    QMutexLocker locker(&mutex_);
    for (const auto &group : groups_) {
        if (group.groupId.isEmpty()) {
            continue;
        }
        for (const auto &id : group.deviceIds) {
            if (normalize_device_id(id) == wanted) {
                return group.groupId;
            }
        }
        for (const auto &mapping : group.mappings) {
            if (!mapping.deviceId.isEmpty() && normalize_device_id(mapping.deviceId) == wanted) {
                return group.groupId;
            }
        }
        for (const auto &id : group.memberIds) {
            if (normalize_device_id(id) == wanted) {
                return group.groupId;
            }
        }
    }
    return std::nullopt;
}

DirectorySnapshot DeviceDirectory::snapshot() const {
    QMutexLocker locker(&mutex_);
    DirectorySnapshot snapshot;
    snapshot.devices = devices_;
    snapshot.groups = groups_;
    snapshot.definitions = definitions_;
    snapshot.deviceTypes = deviceTypes_;
    snapshot.connectedDeviceIds = connected_;
    return snapshot;
}

void DeviceDirectory::rememberGroup(const GroupInstance &group) {
    if (group.groupId.isEmpty()) {
        return;
    }
    QMutexLocker locker(&mutex_);
    const QString key = normalize_device_id(group.groupId);
    for (auto &existing : groups_) {
        if (normalize_device_id(existing.groupId) == key) {
            existing = group;
            return;
        }
    }
    groups_.append(group);
}

void DeviceDirectory::clearConnectionState() {
    QMutexLocker locker(&mutex_);
    connected_.clear();
}

}  // namespace fl::client
