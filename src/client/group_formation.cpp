#include "group_formation.hpp"

#include <QtCore/QPointer>
#include <QtCore/QSet>

#include <algorithm>

#include "common/json_util.hpp"
#include "common/logger.hpp"

using fl::common::Logger;
using fl::common::LogLevel;

namespace fl::client {

namespace {

const QString kCategory = QStringLiteral("formation");

void log(LogLevel level, const QString &message) {
    Logger::instance().log(level, kCategory, message);
}

const GroupPosition kDefaultPositions[] = {
    {QStringLiteral("Launch Zone"), 0, -90},
    {QStringLiteral("Upper Landing Zone"), 1, 0},
    {QStringLiteral("Lower Landing Zone"), 2, 0},
};

QJsonArray camel_mappings(const QJsonArray &snake) {
    QJsonArray out;
    for (const auto &entry : snake) {
        const QJsonObject obj = entry.toObject();
        QJsonObject camel;
        camel.insert(QStringLiteral("positionId"), obj.value(QLatin1String("position_id")));
        camel.insert(QStringLiteral("mappingIndex"), obj.value(QLatin1String("mapping_index")));
        camel.insert(QStringLiteral("deviceId"), obj.value(QLatin1String("device_id")));
        camel.insert(QStringLiteral("rotation"), obj.value(QLatin1String("rotation")).toInt(0));
        out.append(camel);
    }
    return out;
}

QString describe_error(const QJsonValue &error) {
    return error.isString() ? error.toString() : fl::json::compact(error);
}

bool reports_failure(const QJsonValue &payload) {
    const QJsonObject obj = payload.toObject();
    if (fl::json::is_truthy(obj.value(QLatin1String("error")))) {
        return true;
    }
    const QString status = obj.value(QLatin1String("status")).toString().trimmed().toLower();
    return status == QLatin1String("error") || status == QLatin1String("failed") || status == QLatin1String("failure");
}

}  // namespace

CreateResponse interpret_create_response(const QJsonValue &payload) {
    CreateResponse response;
    if (!payload.isObject()) {
        return response;
    }
    const QJsonObject obj = payload.toObject();

    // Many backends wrap the result as {status, message, response}.
    const QJsonValue inner = obj.value(QLatin1String("response"));
    const QJsonObject groupObj = inner.isObject() ? inner.toObject() : obj;

    const QString groupId = fl::json::first_string(groupObj, {"axfId", "axf_id", "groupId", "id"});
    if (!groupId.isEmpty()) {
        response.kind = ResponseKind::Created;
        response.group = groupObj;
        response.groupId = groupId;
        return response;
    }

    const QString status = obj.value(QLatin1String("status")).toString().trimmed().toLower();
    const QString message = obj.value(QLatin1String("message")).toString();
    QJsonValue error = obj.value(QLatin1String("error"));
    if (!fl::json::is_truthy(error)) {
        error = groupObj.value(QLatin1String("error"));
    }
    const bool hasError = fl::json::is_truthy(error);

    if (status == QLatin1String("success") && !hasError) {
        const QJsonObject data = obj.value(QLatin1String("data")).toObject();
        const QString ephemeralId = fl::json::first_string(data, {"group_id", "groupId", "axfId"});
        if (!ephemeralId.isEmpty()) {
            response.kind = ResponseKind::CreatedEphemeral;
            response.groupId = ephemeralId;
            return response;
        }
        const QString lowered = message.toLower();
        if (lowered.contains(QLatin1String("restart")) || lowered.contains(QLatin1String("saved successfully"))) {
            response.kind = ResponseKind::Persisted;
            response.message = message;
        }
        return response;
    }

    if (hasError) {
        response.kind = ResponseKind::Rejected;
        response.message = describe_error(error);
        return response;
    }
    if (!message.isEmpty()) {
        response.kind = ResponseKind::Rejected;
        response.message = message;
    }
    return response;
}

std::optional<GroupDefinition> resolve_definition(const DirectorySnapshot &snapshot, const QString &definitionId) {
    const QString wanted = normalize_label(definitionId);
    for (const auto &candidate : snapshot.definitions) {
        if (candidate.definitionId.compare(definitionId, Qt::CaseInsensitive) == 0 ||
            (!candidate.name.isEmpty() && normalize_label(candidate.name) == wanted)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<GroupInstance> find_matching_group(const DirectorySnapshot &snapshot, const PositionMapping &desired,
                                                 const QString &definitionId) {
    if (normalize_label(definitionId).isEmpty() || desired.isEmpty()) {
        return std::nullopt;
    }
    // A group may carry the requested id, the resolved definition id or the
    // definition's display name.
    QSet<QString> accepted{normalize_label(definitionId)};
    if (const auto definition = resolve_definition(snapshot, definitionId)) {
        accepted.insert(normalize_label(definition->definitionId));
        accepted.insert(normalize_label(definition->name));
    }
    accepted.remove(QString());

    QHash<QString, QString> wanted;
    for (auto it = desired.begin(); it != desired.end(); ++it) {
        wanted.insert(it.key().trimmed(), normalize_device_id(it.value()));
    }

    for (const auto &group : snapshot.groups) {
        const QString label = normalize_label(group.configurationLabel);
        bool matches = accepted.contains(normalize_label(group.definitionId));
        for (auto it = accepted.cbegin(); !matches && !label.isEmpty() && it != accepted.cend(); ++it) {
            matches = label.contains(*it);
        }
        if (matches && group.positionMap() == wanted) {
            return group;
        }
    }
    return std::nullopt;
}

QJsonArray build_mappings(const DirectorySnapshot &snapshot, const PositionMapping &desired,
                          const QString &definitionId, QString *resolvedDefinitionId) {
    const auto definition = resolve_definition(snapshot, definitionId);
    if (resolvedDefinitionId) {
        *resolvedDefinitionId =
            definition && !definition->definitionId.isEmpty() ? definition->definitionId : definitionId;
    }

    QVector<GroupPosition> required;
    if (definition) {
        required = definition->requiredPositions;
    }
    if (required.isEmpty()) {
        required = QVector<GroupPosition>(std::begin(kDefaultPositions), std::end(kDefaultPositions));
    }

    QJsonArray mappings;
    QSet<QString> listed;
    int nextIndex = 0;
    for (const auto &position : required) {
        listed.insert(position.positionId);
        nextIndex = std::max(nextIndex, position.mappingIndex + 1);
        const QString deviceId = desired.value(position.positionId).trimmed();
        if (deviceId.isEmpty()) {
            continue;
        }
        QJsonObject entry;
        entry.insert(QStringLiteral("position_id"), position.positionId);
        entry.insert(QStringLiteral("mapping_index"), position.mappingIndex);
        entry.insert(QStringLiteral("device_id"), deviceId);
        entry.insert(QStringLiteral("rotation"), position.rotation);
        mappings.append(entry);
    }
    for (auto it = desired.begin(); it != desired.end(); ++it) {
        if (listed.contains(it.key()) || it.value().trimmed().isEmpty()) {
            continue;
        }
        QJsonObject entry;
        entry.insert(QStringLiteral("position_id"), it.key());
        entry.insert(QStringLiteral("mapping_index"), nextIndex++);
        entry.insert(QStringLiteral("device_id"), it.value().trimmed());
        entry.insert(QStringLiteral("rotation"), 0);
        mappings.append(entry);
    }
    return mappings;
}

QJsonObject creation_payload(const QString &definitionId, const QString &groupName, const QJsonArray &mappings,
                             PayloadStyle style) {
    QJsonObject payload;
    if (style == PayloadStyle::CamelCase) {
        payload.insert(QStringLiteral("groupDefinitionId"), definitionId);
        payload.insert(QStringLiteral("name"), groupName);
        payload.insert(QStringLiteral("disableVirtualDevices"), false);
        payload.insert(QStringLiteral("mappings"), camel_mappings(mappings));
    } else {
        payload.insert(QStringLiteral("group_definition_id"), definitionId);
        payload.insert(QStringLiteral("name"), groupName);
        payload.insert(QStringLiteral("disable_virtual_devices"), false);
        payload.insert(QStringLiteral("mappings"), mappings);
    }
    return payload;
}

GroupFormation::GroupFormation(EventChannel &channel, DeviceDirectory &directory, fl::common::Scheduler &scheduler,
                               QObject *parent)
    : QObject(parent), channel_(channel), directory_(directory), scheduler_(scheduler) {
    QPointer<GroupFormation> self(this);
    for (const auto &capability : kInboundCapabilities) {
        const QString event = QLatin1String(capability.event);
        const bool createStatus = capability.shape == ResponseShape::GroupObject ||
                                  capability.shape == ResponseShape::EphemeralGroup ||
                                  capability.shape == ResponseShape::LegacySave;
        const bool reinitStatus = event == QLatin1String(events::kReinitializeGroupsStatus) ||
                                  event == QLatin1String(events::kReinitializeGroupsLegacyStatus);
        if (!createStatus && !reinitStatus) {
            continue;
        }
        handlerIds_.append(channel_.on(event, [this, self, event, createStatus](const QJsonValue &payload) {
            const quint64 epoch = channel_.connectionEpoch();
            scheduler_.post([self, event, payload, epoch, createStatus]() {
                if (!self) {
                    return;
                }
                if (createStatus) {
                    self->onCreateStatus(event, payload, epoch);
                } else {
                    self->onReinitStatus(event, payload, epoch);
                }
            });
        }));
    }
}

GroupFormation::~GroupFormation() {
    for (const HandlerId id : handlerIds_) {
        channel_.off(id);
    }
}

std::optional<FormationStage> GroupFormation::stage() const {
    if (!pending_.has_value()) {
        return std::nullopt;
    }
    return pending_->stage;
}

void GroupFormation::findOrCreateGroup(const PositionMapping &desiredMapping, const QString &definitionId,
                                       const QString &groupName, bool createIfMissing) {
    if (pending_.has_value()) {
        log(LogLevel::Debug, QStringLiteral("Request %1 superseded").arg(pending_->requestId));
        pending_.reset();
    }
    if (!channel_.isConnected()) {
        resolveError(QStringLiteral("Not connected to backend"));
        return;
    }

    PositionMapping desired;
    for (auto it = desiredMapping.begin(); it != desiredMapping.end(); ++it) {
        const QString position = it.key().trimmed();
        const QString deviceId = it.value().trimmed();
        if (!position.isEmpty() && !deviceId.isEmpty()) {
            desired.insert(position, deviceId);
        }
    }
    if (desired.isEmpty()) {
        resolveError(QStringLiteral("No devices assigned to positions"));
        return;
    }

    const auto match = find_matching_group(directory_.snapshot(), desired, definitionId);
    if (match.has_value()) {
        resolveFound(*match);
        return;
    }
    if (!createIfMissing) {
        resolveError(QStringLiteral("No %1 group matches the selected devices").arg(definitionId));
        return;
    }
    startCreation(desired, definitionId, groupName);
}

void GroupFormation::abandon() {
    if (pending_.has_value()) {
        log(LogLevel::Info, QStringLiteral("Request %1 abandoned").arg(pending_->requestId));
        pending_.reset();
    }
}

void GroupFormation::onDirectoryRefreshed() {
    if (pending_.has_value() && pending_->stage == FormationStage::ReinitWait) {
        rematch();
    }
}

void GroupFormation::startCreation(const PositionMapping &desired, const QString &definitionId,
                                   const QString &groupName) {
    const DirectorySnapshot snapshot = directory_.snapshot();
    QString resolvedDefinition;
    const QJsonArray mappings = build_mappings(snapshot, desired, definitionId, &resolvedDefinition);
    if (mappings.isEmpty()) {
        resolveError(QStringLiteral("None of the selected positions belong to %1").arg(definitionId));
        return;
    }

    PendingCreation pending;
    pending.requestId = nextRequestId_++;
    pending.desiredMapping = desired;
    pending.definitionId = resolvedDefinition;
    const auto definition = resolve_definition(snapshot, definitionId);
    pending.configurationLabel = definition && !definition->name.isEmpty() ? definition->name : definitionId;
    pending.groupName = groupName;
    pending.mappings = mappings;
    pending.epoch = channel_.connectionEpoch();
    pending_ = pending;

    const CreateCommand &command = kCreateCommands[0];
    log(LogLevel::Info, QStringLiteral("Request %1: %2 for %3")
                            .arg(pending.requestId)
                            .arg(QLatin1String(command.event), resolvedDefinition));
    channel_.emitEvent(QLatin1String(command.event),
                       creation_payload(resolvedDefinition, groupName, mappings, command.style));

    const quint64 requestId = pending.requestId;
    QPointer<GroupFormation> self(this);
    scheduler_.postDelayed(kFallbackDelayMs, [self, requestId]() {
        if (self) {
            self->runFallback(requestId);
        }
    });
    scheduleDeadline(requestId, kCreationDeadlineMs);
}

void GroupFormation::onCreateStatus(const QString &event, const QJsonValue &payload, quint64 epoch) {
    if (!pending_.has_value()) {
        log(LogLevel::Debug, QStringLiteral("Ignoring %1 with no request pending").arg(event));
        return;
    }
    if (epoch != pending_->epoch) {
        log(LogLevel::Debug, QStringLiteral("Ignoring %1 from connection epoch %2").arg(event).arg(epoch));
        return;
    }

    const CreateResponse response = interpret_create_response(payload);
    switch (response.kind) {
        case ResponseKind::Created:
            directory_.rememberGroup(parse_group(response.group));
            resolveCreated(response.group);
            emit refreshRequested();
            break;
        case ResponseKind::CreatedEphemeral: {
            QJsonObject created;
            created.insert(QStringLiteral("axfId"), response.groupId);
            created.insert(QStringLiteral("name"), pending_->groupName);
            created.insert(QStringLiteral("groupDefinitionId"), pending_->definitionId);
            created.insert(QStringLiteral("groupConfiguration"), pending_->configurationLabel);
            created.insert(QStringLiteral("mappings"), camel_mappings(pending_->mappings));
            directory_.rememberGroup(parse_group(created));
            resolveCreated(created);
            QPointer<GroupFormation> self(this);
            scheduler_.postDelayed(kRefreshAfterCreateMs, [self]() {
                if (self) {
                    emit self->refreshRequested();
                }
            });
            break;
        }
        case ResponseKind::Persisted:
            if (pending_->stage != FormationStage::ReinitWait) {
                log(LogLevel::Info, QStringLiteral("Group saved but inactive: %1").arg(response.message));
                enterReinitWait();
            }
            break;
        case ResponseKind::Rejected:
            resolveError(response.message);
            break;
        case ResponseKind::Unrecognized:
            log(LogLevel::Warn, QStringLiteral("Unrecognized %1 payload: %2").arg(event, fl::json::compact(payload)));
            break;
    }
}

void GroupFormation::onReinitStatus(const QString &event, const QJsonValue &payload, quint64 epoch) {
    if (!pending_.has_value() || epoch != pending_->epoch || pending_->stage != FormationStage::ReinitWait) {
        return;
    }
    if (!reports_failure(payload)) {
        log(LogLevel::Debug, QStringLiteral("%1: %2").arg(event, fl::json::compact(payload)));
        return;
    }
    if (event == QLatin1String(events::kReinitializeGroupsStatus) && !pending_->legacyReinitSent) {
        pending_->legacyReinitSent = true;
        log(LogLevel::Info, QStringLiteral("%1 rejected; trying %2")
                                .arg(QLatin1String(kReinitializeCommands[0]), QLatin1String(kReinitializeCommands[1])));
        channel_.emitEvent(QLatin1String(kReinitializeCommands[1]));
    }
}

void GroupFormation::enterReinitWait() {
    pending_->stage = FormationStage::ReinitWait;
    channel_.emitEvent(QLatin1String(kReinitializeCommands[0]));

    const quint64 requestId = pending_->requestId;
    QPointer<GroupFormation> self(this);
    for (const int delay : {kReinitRecheckFirstMs, kReinitRecheckSecondMs}) {
        scheduler_.postDelayed(delay, [self, requestId]() {
            if (self) {
                self->recheck(requestId);
            }
        });
    }
    scheduleDeadline(requestId, kReinitDeadlineMs);
}

void GroupFormation::scheduleDeadline(quint64 requestId, int delayMs) {
    ++pending_->outstandingDeadlines;
    QPointer<GroupFormation> self(this);
    scheduler_.postDelayed(delayMs, [self, requestId]() {
        if (self) {
            self->onDeadline(requestId);
        }
    });
}

void GroupFormation::runFallback(quint64 requestId) {
    if (!isCurrent(requestId) || pending_->stage != FormationStage::Initial) {
        return;
    }
    if (!channel_.isConnected()) {
        log(LogLevel::Warn, QStringLiteral("No creation status and not connected; skipping fallback"));
        return;
    }
    const CreateCommand &command = kCreateCommands[1];
    pending_->stage = FormationStage::Retry;
    log(LogLevel::Info, QStringLiteral("No creation status after %1 ms; retrying once via %2")
                            .arg(kFallbackDelayMs)
                            .arg(QLatin1String(command.event)));
    channel_.emitEvent(QLatin1String(command.event),
                       creation_payload(pending_->definitionId, pending_->groupName, pending_->mappings, command.style));

    QPointer<GroupFormation> self(this);
    scheduler_.postDelayed(kFallbackDelayMs, [self, requestId]() {
        if (self) {
            self->runLegacyFallback(requestId);
        }
    });
}

void GroupFormation::runLegacyFallback(quint64 requestId) {
    if (!isCurrent(requestId) || pending_->stage != FormationStage::Retry || !channel_.isConnected()) {
        return;
    }
    const CreateCommand &command = kCreateCommands[2];
    pending_->stage = FormationStage::LegacyRetry;
    log(LogLevel::Info, QStringLiteral("Retrying once via %1").arg(QLatin1String(command.event)));
    channel_.emitEvent(QLatin1String(command.event),
                       creation_payload(pending_->definitionId, pending_->groupName, pending_->mappings, command.style));
}

void GroupFormation::recheck(quint64 requestId) {
    if (!isCurrent(requestId) || pending_->stage != FormationStage::ReinitWait) {
        return;
    }
    emit refreshRequested();
    // The refresh may have resolved the request synchronously.
    if (isCurrent(requestId)) {
        rematch();
    }
}

bool GroupFormation::rematch() {
    const auto match = find_matching_group(directory_.snapshot(), pending_->desiredMapping, pending_->definitionId);
    if (!match.has_value()) {
        return false;
    }
    resolveFound(*match);
    return true;
}

void GroupFormation::onDeadline(quint64 requestId) {
    if (!isCurrent(requestId)) {
        return;
    }
    if (--pending_->outstandingDeadlines > 0) {
        return;
    }
    resolveError(QStringLiteral("Timed out waiting for the backend to create the group"));
}

bool GroupFormation::isCurrent(quint64 requestId) const {
    return pending_.has_value() && pending_->requestId == requestId;
}

void GroupFormation::resolveFound(const GroupInstance &group) {
    pending_.reset();
    log(LogLevel::Info, QStringLiteral("Found group %1").arg(group.groupId));
    emit groupFound(group.raw);
}

void GroupFormation::resolveCreated(const QJsonObject &group) {
    pending_.reset();
    log(LogLevel::Info, QStringLiteral("Created group %1")
                            .arg(fl::json::first_string(group, {"axfId", "axf_id", "groupId", "id"})));
    emit groupCreated(group);
}

void GroupFormation::resolveError(const QString &message) {
    pending_.reset();
    log(LogLevel::Warn, QStringLiteral("Group formation failed: %1").arg(message));
    emit groupError(message);
}

}  // namespace fl::client
