#pragma once

#include <QtWidgets/QMainWindow>

#include "common/logger.hpp"
#include "device_table_model.hpp"
#include "hardware_service.hpp"

class QComboBox;
class QLabel;
class QLineEdit;
class QPlainTextEdit;
class QPushButton;
class QSpinBox;
class QTableView;

namespace fl::client {

class MonitorWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MonitorWindow(HardwareService &service, QWidget *parent = nullptr);

    void setConnectionDefaults(const QString &host, quint16 socketPort, quint16 httpPort);
    void startConnection();

private slots:
    void handleConnectToggle();
    void handleFindOrCreate();
    void handleStatusChanged(const QString &status);
    void handleDeviceList(const QVector<fl::client::DeviceListing> &devices);
    void handleGroupResolved(const QJsonObject &group, bool created);
    void handleLog(fl::common::LogLevel level, const QString &category, const QString &message,
                   const QDateTime &timestamp);

private:
    void appendLog(const QString &line);
    void refillPositionSelectors();

    HardwareService &service_;
    DeviceTableModel model_;
    bool connected_ = false;
    bool running_ = false;

    QLineEdit *hostEdit_;
    QSpinBox *socketPortSpin_;
    QSpinBox *httpPortSpin_;
    QPushButton *connectBtn_;
    QLabel *statusLabel_;
    QLabel *statusIndicator_;
    QTableView *deviceView_;
    QComboBox *launchCombo_;
    QComboBox *upperCombo_;
    QComboBox *lowerCombo_;
    QPushButton *groupBtn_;
    QLabel *groupLabel_;
    QPlainTextEdit *logView_;
};

}  // namespace fl::client
