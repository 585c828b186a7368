#include "hardware_service.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QMetaObject>
#include <QtNetwork/QNetworkAccessManager>

#include "common/json_util.hpp"
#include "common/logger.hpp"
#include "common/settings.hpp"
#include "http_client.hpp"
#include "port_discovery.hpp"

using fl::common::Logger;
using fl::common::LogLevel;

namespace fl::client {

namespace {

const QString kCategory = QStringLiteral("service");

void log(LogLevel level, const QString &message) {
    Logger::instance().log(level, kCategory, message);
}

QString describe_socket_error(const QJsonValue &payload) {
    if (payload.isString()) {
        return payload.toString();
    }
    const QString message = fl::json::first_string(payload.toObject(), {"message", "error"});
    return message.isEmpty() ? fl::json::compact(payload) : message;
}

}  // namespace

HardwareService::HardwareService(QObject *parent)
    : QObject(parent), scheduler_(this), formation_(socket_, directory_, scheduler_) {
    qRegisterMetaType<QVector<fl::client::DeviceListing>>();
    qRegisterMetaType<QSet<QString>>();
    clock_.start();

    connect(&formation_, &GroupFormation::groupFound, this, &HardwareService::groupFound);
    connect(&formation_, &GroupFormation::groupCreated, this, &HardwareService::groupCreated);
    connect(&formation_, &GroupFormation::groupError, this, &HardwareService::groupError);
    connect(&formation_, &GroupFormation::refreshRequested, this, &HardwareService::fetchDiscovery);
    connect(&socket_, &SocketClient::reconnectScheduled, this, [this](int delayMs) {
        emit connectionStatusChanged(tr("Reconnecting in %1 ms").arg(delayMs));
    });

    autoConnectTimer_.setInterval(kAutoConnectIntervalMs);
    connect(&autoConnectTimer_, &QTimer::timeout, this, &HardwareService::handleAutoConnectTick);

    livenessTimer_.setInterval(kLivenessTickMs);
    connect(&livenessTimer_, &QTimer::timeout, this, &HardwareService::handleLivenessTick);

    registerHandlers();
}

HardwareService::~HardwareService() {
    autoConnectTimer_.stop();
    livenessTimer_.stop();
    // Unregistered first; the transport thread may still be dispatching.
    for (const HandlerId id : handlerIds_) {
        socket_.off(id);
    }
    socket_.disconnectFromBackend();
    if (discoveryThread_ && !discoveryThread_->wait(kDiscoveryTimeoutMs * 8)) {
        log(LogLevel::Warn, QStringLiteral("Port discovery still running at shutdown"));
    }
}

void HardwareService::registerHandlers() {
    handlerIds_.append(socket_.on(QLatin1String(events::kConnect), [this](const QJsonValue &) { onConnected(); }));
    handlerIds_.append(
        socket_.on(QLatin1String(events::kDisconnect), [this](const QJsonValue &) { onDisconnected(); }));
    handlerIds_.append(socket_.on(QLatin1String(events::kTelemetry),
                                  [this](const QJsonValue &payload) { onTelemetry(payload); }));
    handlerIds_.append(socket_.on(QLatin1String(events::kBackendConfigStatus),
                                  [this](const QJsonValue &payload) { emit backendConfigReceived(payload); }));
    handlerIds_.append(socket_.on(QLatin1String(events::kError), [this](const QJsonValue &payload) {
        const QString message = describe_socket_error(payload);
        log(LogLevel::Warn, QStringLiteral("Backend error: %1").arg(message));
        emit socketErrorReceived(message);
    }));

    for (const auto &capability : kInboundCapabilities) {
        if (capability.directory == DirectoryEventKind::None) {
            continue;
        }
        const QString event = QLatin1String(capability.event);
        handlerIds_.append(
            socket_.on(event, [this, event](const QJsonValue &payload) { onDirectoryEvent(event, payload); }));
    }
}

void HardwareService::connectToBackend(const QString &host, quint16 port) {
    if (socket_.isRunning()) {
        socket_.disconnectFromBackend();
    }
    host_ = host;
    port_ = port;
    // Queued behind any "Disconnected" the previous session just posted.
    const QString status = tr("Connecting to %1:%2").arg(fl::common::bare_host(host)).arg(port);
    QMetaObject::invokeMethod(
        this, [this, status]() { emit connectionStatusChanged(status); }, Qt::QueuedConnection);
    socket_.connectToBackend(host, port, httpPort_);
    livenessTimer_.start();
}

void HardwareService::disconnectFromBackend() {
    autoConnectEnabled_ = false;
    autoConnectTimer_.stop();
    livenessTimer_.stop();
    const bool wasConnected = socket_.isConnected();
    socket_.disconnectFromBackend();
    if (!wasConnected) {
        emit connectionStatusChanged(tr("Disconnected"));
    }
}

void HardwareService::autoConnect(const QString &host, quint16 httpPort) {
    host_ = host;
    httpPort_ = httpPort;
    autoConnectEnabled_ = true;
    emit connectionStatusChanged(tr("Discovering backend port"));
    runDiscovery();
    autoConnectTimer_.start();
}

void HardwareService::fetchDiscovery() {
    if (!socket_.isConnected()) {
        return;
    }
    for (const char *command : kDiscoveryCommands) {
        const QString event = QLatin1String(command);
        // The list queries take no payload; the settings queries take {}.
        if (event == QLatin1String(events::kGetConnectedDevices) || event == QLatin1String(events::kGetConnectedGroups) ||
            event == QLatin1String(events::kGetGroupsLegacy)) {
            socket_.emitEvent(event);
        } else {
            socket_.emitEvent(event, QJsonObject());
        }
    }
}

void HardwareService::startDataReception() {
    socket_.emitEvent(QLatin1String(events::kStartDataReception), QJsonObject());
}

void HardwareService::stopDataReception() {
    socket_.emitEvent(QLatin1String(events::kStopDataReception), QJsonObject());
}

void HardwareService::tare() {
    socket_.emitEvent(QLatin1String(events::kSetReferenceTime), -1);
    socket_.emitEvent(QLatin1String(events::kTareAll));
}

void HardwareService::startCapture(const CaptureRequest &request) {
    QJsonObject payload;
    payload.insert(QStringLiteral("captureConfiguration"), request.captureConfiguration);
    payload.insert(QStringLiteral("captureType"), request.captureConfiguration);
    payload.insert(QStringLiteral("groupId"), request.groupId);
    payload.insert(QStringLiteral("athleteId"), request.athleteId);
    if (!request.captureName.isEmpty()) {
        payload.insert(QStringLiteral("captureName"), request.captureName);
    }
    if (!request.tags.isEmpty()) {
        payload.insert(QStringLiteral("tags"), QJsonArray::fromStringList(request.tags));
    }
    socket_.emitEvent(QLatin1String(events::kStartCapture), payload);
}

void HardwareService::stopCapture(const QString &groupId) {
    QJsonObject payload;
    payload.insert(QStringLiteral("groupId"), groupId);
    socket_.emitEvent(QLatin1String(events::kStopCapture), payload);
}

void HardwareService::updateBackendConfig(const QString &key, const QJsonValue &value) {
    QJsonObject payload;
    payload.insert(QStringLiteral("key"), key);
    payload.insert(QStringLiteral("value"), value);
    socket_.emitEvent(QLatin1String(events::kUpdateBackendConfig), payload);
}

void HardwareService::requestBackendConfig() {
    socket_.emitEvent(QLatin1String(events::kGetBackendConfig));
}

void HardwareService::findOrCreateGroup(const PositionMapping &desiredMapping, const QString &definitionId,
                                        const QString &groupName, bool createIfMissing) {
    formation_.findOrCreateGroup(desiredMapping, definitionId, groupName, createIfMissing);
}

std::optional<QString> HardwareService::resolveGroupForDevice(const QString &deviceId) const {
    return directory_.resolveGroupForDevice(deviceId);
}

DirectorySnapshot HardwareService::directorySnapshot() const {
    return directory_.snapshot();
}

QUrl HardwareService::backendHttpAddress() const {
    const Connection connection = socket_.connection();
    QString host = fl::common::bare_host(connection.host);
    quint16 port = connection.httpPort;
    if (host.isEmpty() || port == 0) {
        host = fl::common::bare_host(host_.isEmpty() ? fl::common::Settings().host : host_);
        port = httpPort_;
    }
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(host);
    url.setPort(port);
    return url;
}

bool HardwareService::isConnected() const {
    return socket_.isConnected();
}

void HardwareService::setHttpPort(quint16 httpPort) {
    httpPort_ = httpPort;
}

void HardwareService::setDecayWindowMs(int decayWindowMs) {
    socket_.post([this, decayWindowMs]() { liveness_.setDecayWindowMs(decayWindowMs); });
    if (!socket_.isRunning()) {
        liveness_.setDecayWindowMs(decayWindowMs);
    }
}

void HardwareService::setSocketDebug(bool enabled) {
    socket_.setSocketDebug(enabled);
}

// Runs on the transport thread.
void HardwareService::onConnected() {
    emit connectionStatusChanged(tr("Connected"));
    startDataReception();
    requestBackendConfig();
    fetchDiscovery();
}

// Runs on the transport thread.
void HardwareService::onDisconnected() {
    publishLiveness(liveness_.clear());
    emit deviceListUpdated({});
    directory_.clearConnectionState();
    QPointer<GroupFormation> formation(&formation_);
    scheduler_.post([formation]() {
        if (formation) {
            formation->abandon();
        }
    });
    emit connectionStatusChanged(tr("Disconnected"));
}

void HardwareService::onTelemetry(const QJsonValue &payload) {
    emit dataReceived(payload);
    publishLiveness(liveness_.onTelemetry(payload, clock_.elapsed()));
}

void HardwareService::onDirectoryEvent(const QString &event, const QJsonValue &payload) {
    const DirectoryUpdate update = directory_.onDirectoryEvent(event, payload, clock_.elapsed());
    if (update.devicesChanged) {
        emit deviceListUpdated(update.devices);
    }
    if (update.zeroConnected) {
        log(LogLevel::Info, QStringLiteral("Backend reports no connected devices"));
        publishLiveness(liveness_.clear());
        emit deviceListUpdated({});
        socket_.emitEvent(QLatin1String(events::kGetConnectedDevices));
    }
    if (update.groupsChanged) {
        QPointer<GroupFormation> formation(&formation_);
        scheduler_.post([formation]() {
            if (formation) {
                formation->onDirectoryRefreshed();
            }
        });
    }
}

void HardwareService::publishLiveness(const std::optional<ActiveSetDelta> &delta) {
    if (delta.has_value()) {
        emit activeDevicesUpdated(delta->active);
    }
}

void HardwareService::runDiscovery() {
    if (discoveryThread_) {
        return;
    }
    const QString host = host_;
    const quint16 httpPort = httpPort_;
    QPointer<HardwareService> self(this);
    QThread *thread = QThread::create([self, host, httpPort]() {
        QNetworkAccessManager manager;
        const HttpClient http(&manager);
        const std::optional<quint16> port = discover_port(http, host, httpPort);
        if (!self) {
            return;
        }
        QMetaObject::invokeMethod(
            self.data(),
            [self, port]() {
                if (self) {
                    self->onDiscoveryFinished(port);
                }
            },
            Qt::QueuedConnection);
    });
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    discoveryThread_ = thread;
    thread->start();
}

void HardwareService::onDiscoveryFinished(std::optional<quint16> port) {
    if (!autoConnectEnabled_) {
        return;
    }
    const quint16 target = port.value_or(fl::common::kFallbackSocketPort);
    if (!port.has_value()) {
        log(LogLevel::Info, QStringLiteral("No socket port discovered; using %1").arg(target));
    }
    if (socket_.isRunning() && target == port_) {
        return;
    }
    log(LogLevel::Info, QStringLiteral("Auto-connecting to port %1").arg(target));
    connectToBackend(host_, target);
}

void HardwareService::handleAutoConnectTick() {
    if (!autoConnectEnabled_ || socket_.isConnected()) {
        return;
    }
    runDiscovery();
}

void HardwareService::handleLivenessTick() {
    socket_.post([this]() { publishLiveness(liveness_.tick(clock_.elapsed())); });
}

}  // namespace fl::client
