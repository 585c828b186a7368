#pragma once

#include <QtCore/QElapsedTimer>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QThread>
#include <QtCore/QTimer>
#include <QtCore/QUrl>
#include <QtCore/QVector>

#include <optional>

#include "common/call_queue.hpp"
#include "device_directory.hpp"
#include "group_formation.hpp"
#include "liveness_tracker.hpp"
#include "socket_client.hpp"

namespace fl::client {

constexpr int kAutoConnectIntervalMs = 5000;
constexpr int kLivenessTickMs = 250;

struct CaptureRequest {
    QString captureConfiguration = QStringLiteral("simple");
    QString groupId;
    QString athleteId;
    QString captureName;
    QStringList tags;
};

// Owner-thread facade over the transport, the directory, liveness and group
// formation. Signals may be emitted from the transport thread; connect with
// Qt::AutoConnection.
class HardwareService : public QObject {
    Q_OBJECT

public:
    explicit HardwareService(QObject *parent = nullptr);
    ~HardwareService() override;

    void connectToBackend(const QString &host, quint16 port);
    void disconnectFromBackend();
    void autoConnect(const QString &host, quint16 httpPort);
    void fetchDiscovery();

    void startDataReception();
    void stopDataReception();
    void tare();
    void startCapture(const CaptureRequest &request);
    void stopCapture(const QString &groupId);
    void updateBackendConfig(const QString &key, const QJsonValue &value);
    void requestBackendConfig();

    void findOrCreateGroup(const PositionMapping &desiredMapping, const QString &definitionId,
                           const QString &groupName, bool createIfMissing = true);
    std::optional<QString> resolveGroupForDevice(const QString &deviceId) const;
    DirectorySnapshot directorySnapshot() const;

    // http://host:httpPort of the current session.
    QUrl backendHttpAddress() const;

    bool isConnected() const;
    void setHttpPort(quint16 httpPort);
    void setDecayWindowMs(int decayWindowMs);
    void setSocketDebug(bool enabled);

signals:
    void connectionStatusChanged(QString status);
    void dataReceived(QJsonValue payload);
    void deviceListUpdated(QVector<fl::client::DeviceListing> devices);
    void activeDevicesUpdated(QSet<QString> deviceIds);
    void backendConfigReceived(QJsonValue config);
    void socketErrorReceived(QString message);
    void groupFound(QJsonObject group);
    void groupCreated(QJsonObject group);
    void groupError(QString message);

private:
    void registerHandlers();
    void onConnected();
    void onDisconnected();
    void onTelemetry(const QJsonValue &payload);
    void onDirectoryEvent(const QString &event, const QJsonValue &payload);
    void publishLiveness(const std::optional<ActiveSetDelta> &delta);
    void runDiscovery();
    void onDiscoveryFinished(std::optional<quint16> port);
    void handleAutoConnectTick();
    void handleLivenessTick();

    SocketClient socket_;
    DeviceDirectory directory_;
    LivenessTracker liveness_;
    fl::common::QtScheduler scheduler_;
    GroupFormation formation_;
    QVector<HandlerId> handlerIds_;

    QElapsedTimer clock_;
    QTimer autoConnectTimer_;
    QTimer livenessTimer_;
    QPointer<QThread> discoveryThread_;

    QString host_;
    quint16 port_ = 0;
    quint16 httpPort_ = fl::common::kDefaultHttpPort;
    bool autoConnectEnabled_ = false;
};

}  // namespace fl::client
