#pragma once

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QMap>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

#include "common/call_queue.hpp"
#include "device_directory.hpp"
#include "event_channel.hpp"

namespace fl::client {

constexpr int kFallbackDelayMs = 1200;
constexpr int kReinitRecheckFirstMs = 1500;
constexpr int kReinitRecheckSecondMs = 3000;
constexpr int kCreationDeadlineMs = 6000;
constexpr int kReinitDeadlineMs = 5000;
constexpr int kRefreshAfterCreateMs = 500;

// position -> device id
using PositionMapping = QMap<QString, QString>;

enum class FormationStage {
    Initial,
    Retry,
    LegacyRetry,
    ReinitWait,
};

struct PendingCreation {
    quint64 requestId = 0;
    PositionMapping desiredMapping;
    QString definitionId;
    QString configurationLabel;
    QString groupName;
    QJsonArray mappings;  // snake_case entries
    FormationStage stage = FormationStage::Initial;
    quint64 epoch = 0;
    int outstandingDeadlines = 0;
    bool legacyReinitSent = false;
};

enum class ResponseKind {
    Unrecognized,
    Created,
    CreatedEphemeral,
    Persisted,
    Rejected,
};

struct CreateResponse {
    ResponseKind kind = ResponseKind::Unrecognized;
    QJsonObject group;
    QString groupId;
    QString message;
};

// Classifies a creation status payload by shape.
CreateResponse interpret_create_response(const QJsonValue &payload);

// Definition whose id equals `definitionId` ignoring case, or whose name
// normalizes to it.
std::optional<GroupDefinition> resolve_definition(const DirectorySnapshot &snapshot, const QString &definitionId);

// Finds a group whose label or definition names `definitionId` and whose
// position map equals `desired` after id normalization.
std::optional<GroupInstance> find_matching_group(const DirectorySnapshot &snapshot, const PositionMapping &desired,
                                                 const QString &definitionId);

// snake_case mapping entries for the definition's required positions, with
// positions the definition does not list appended after them.
QJsonArray build_mappings(const DirectorySnapshot &snapshot, const PositionMapping &desired,
                          const QString &definitionId, QString *resolvedDefinitionId = nullptr);

QJsonObject creation_payload(const QString &definitionId, const QString &groupName, const QJsonArray &mappings,
                             PayloadStyle style);

// Resolves each request to exactly one of groupFound, groupCreated or
// groupError. State lives on the scheduler's thread; channel callbacks are
// re-posted there before they touch it.
class GroupFormation : public QObject {
    Q_OBJECT

public:
    GroupFormation(EventChannel &channel, DeviceDirectory &directory, fl::common::Scheduler &scheduler,
                   QObject *parent = nullptr);
    ~GroupFormation() override;

    void findOrCreateGroup(const PositionMapping &desiredMapping, const QString &definitionId,
                           const QString &groupName, bool createIfMissing = true);
    void abandon();

    // Connected groups were refreshed in the directory.
    void onDirectoryRefreshed();

    bool hasPending() const { return pending_.has_value(); }
    std::optional<FormationStage> stage() const;

signals:
    void groupFound(QJsonObject group);
    void groupCreated(QJsonObject group);
    void groupError(QString message);
    void refreshRequested();

private:
    void startCreation(const PositionMapping &desired, const QString &definitionId, const QString &groupName);
    void onCreateStatus(const QString &event, const QJsonValue &payload, quint64 epoch);
    void onReinitStatus(const QString &event, const QJsonValue &payload, quint64 epoch);
    void enterReinitWait();
    void scheduleDeadline(quint64 requestId, int delayMs);
    void runFallback(quint64 requestId);
    void runLegacyFallback(quint64 requestId);
    void recheck(quint64 requestId);
    bool rematch();
    void onDeadline(quint64 requestId);
    bool isCurrent(quint64 requestId) const;
    void resolveFound(const GroupInstance &group);
    void resolveCreated(const QJsonObject &group);
    void resolveError(const QString &message);

    EventChannel &channel_;
    DeviceDirectory &directory_;
    fl::common::Scheduler &scheduler_;
    QVector<HandlerId> handlerIds_;
    std::optional<PendingCreation> pending_;
    quint64 nextRequestId_ = 1;
};

}  // namespace fl::client
