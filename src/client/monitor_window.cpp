#include "monitor_window.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QJsonObject>
#include <QtWidgets/QComboBox>
#include <QtWidgets/QGridLayout>
#include <QtWidgets/QGroupBox>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QHeaderView>
#include <QtWidgets/QLabel>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QPlainTextEdit>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QSpinBox>
#include <QtWidgets/QTableView>
#include <QtWidgets/QVBoxLayout>

#include "common/json_util.hpp"

using fl::common::Logger;
using fl::common::LogLevel;

namespace fl::client {

namespace {

const QString kDefinitionId = QStringLiteral("PitchingMound");
const QString kGroupName = QStringLiteral("Pitching Mound");
const char *const kPositions[] = {"Launch Zone", "Upper Landing Zone", "Lower Landing Zone"};

void set_indicator(QLabel *indicator, const char *color) {
    indicator->setStyleSheet(QStringLiteral("QLabel { color: %1; font-size: 16pt; font-weight: bold; }")
                                 .arg(QLatin1String(color)));
}

}  // namespace

MonitorWindow::MonitorWindow(HardwareService &service, QWidget *parent) : QMainWindow(parent), service_(service) {
    auto *central = new QWidget(this);
    setCentralWidget(central);

    hostEdit_ = new QLineEdit(QStringLiteral("http://localhost"), central);
    hostEdit_->setMinimumWidth(150);

    socketPortSpin_ = new QSpinBox(central);
    socketPortSpin_->setRange(0, 65535);
    socketPortSpin_->setSpecialValueText(tr("discover"));
    socketPortSpin_->setValue(0);

    httpPortSpin_ = new QSpinBox(central);
    httpPortSpin_->setRange(1, 65535);
    httpPortSpin_->setValue(fl::common::kDefaultHttpPort);

    connectBtn_ = new QPushButton(tr("Connect"), central);
    connectBtn_->setMinimumWidth(100);
    connectBtn_->setStyleSheet("QPushButton { font-weight: bold; padding: 8px; }");

    statusLabel_ = new QLabel(tr("Disconnected"), central);
    statusIndicator_ = new QLabel(QStringLiteral("●"), central);
    set_indicator(statusIndicator_, "red");

    deviceView_ = new QTableView(central);
    deviceView_->setModel(&model_);
    deviceView_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    deviceView_->verticalHeader()->setVisible(false);
    deviceView_->setSelectionBehavior(QAbstractItemView::SelectRows);

    launchCombo_ = new QComboBox(central);
    upperCombo_ = new QComboBox(central);
    lowerCombo_ = new QComboBox(central);
    groupBtn_ = new QPushButton(tr("Find or create group"), central);
    groupBtn_->setEnabled(false);
    groupLabel_ = new QLabel(tr("No group selected"), central);
    groupLabel_->setStyleSheet("QLabel { color: blue; font-style: italic; }");

    logView_ = new QPlainTextEdit(central);
    logView_->setReadOnly(true);
    logView_->setMaximumBlockCount(1000);
    logView_->setStyleSheet(
        "QPlainTextEdit { "
        "   background-color: #f5f5f5; "
        "   font-family: 'Consolas', 'Courier New', monospace; "
        "   font-size: 9pt; "
        "}"
    );

    auto *connGroup = new QGroupBox(tr("Backend"), central);
    auto *connLayout = new QGridLayout(connGroup);
    connLayout->addWidget(new QLabel(tr("Host:"), connGroup), 0, 0);
    connLayout->addWidget(hostEdit_, 0, 1);
    connLayout->addWidget(new QLabel(tr("Socket port:"), connGroup), 0, 2);
    connLayout->addWidget(socketPortSpin_, 0, 3);
    connLayout->addWidget(new QLabel(tr("HTTP port:"), connGroup), 0, 4);
    connLayout->addWidget(httpPortSpin_, 0, 5);
    connLayout->addWidget(connectBtn_, 0, 6);
    connLayout->addWidget(new QLabel(tr("Status:"), connGroup), 1, 0);
    connLayout->addWidget(statusIndicator_, 1, 1);
    connLayout->addWidget(statusLabel_, 1, 2, 1, 5);

    auto *deviceGroup = new QGroupBox(tr("Devices"), central);
    auto *deviceLayout = new QVBoxLayout(deviceGroup);
    deviceLayout->addWidget(deviceView_);

    auto *formGroup = new QGroupBox(tr("Group"), central);
    auto *formLayout = new QGridLayout(formGroup);
    QComboBox *const combos[] = {launchCombo_, upperCombo_, lowerCombo_};
    for (int i = 0; i < 3; ++i) {
        formLayout->addWidget(new QLabel(QLatin1String(kPositions[i]), formGroup), i, 0);
        formLayout->addWidget(combos[i], i, 1);
    }
    auto *btnLayout = new QHBoxLayout;
    btnLayout->addWidget(groupBtn_);
    btnLayout->addWidget(groupLabel_, 1);
    formLayout->addLayout(btnLayout, 3, 0, 1, 2);

    auto *logGroup = new QGroupBox(tr("Log"), central);
    auto *logLayout = new QVBoxLayout(logGroup);
    logLayout->addWidget(logView_);

    auto *layout = new QVBoxLayout;
    layout->addWidget(connGroup);
    layout->addWidget(deviceGroup, 1);
    layout->addWidget(formGroup);
    layout->addWidget(logGroup, 1);
    layout->setSpacing(10);
    layout->setContentsMargins(10, 10, 10, 10);
    central->setLayout(layout);

    setWindowTitle(tr("FluxLink Monitor"));
    resize(900, 750);

    connect(connectBtn_, &QPushButton::clicked, this, &MonitorWindow::handleConnectToggle);
    connect(groupBtn_, &QPushButton::clicked, this, &MonitorWindow::handleFindOrCreate);

    connect(&service_, &HardwareService::connectionStatusChanged, this, &MonitorWindow::handleStatusChanged);
    connect(&service_, &HardwareService::deviceListUpdated, this, &MonitorWindow::handleDeviceList);
    connect(&service_, &HardwareService::activeDevicesUpdated, &model_, &DeviceTableModel::setActive);
    connect(&service_, &HardwareService::groupFound, this,
            [this](const QJsonObject &group) { handleGroupResolved(group, false); });
    connect(&service_, &HardwareService::groupCreated, this,
            [this](const QJsonObject &group) { handleGroupResolved(group, true); });
    connect(&service_, &HardwareService::groupError, this, [this](const QString &message) {
        groupLabel_->setText(tr("Error: %1").arg(message));
        groupLabel_->setStyleSheet("QLabel { color: red; font-weight: bold; }");
        groupBtn_->setEnabled(connected_);
    });
    connect(&service_, &HardwareService::socketErrorReceived, this,
            [this](const QString &message) { appendLog(tr("[backend] %1").arg(message)); });

    connect(&Logger::instance(), &Logger::messageLogged, this, &MonitorWindow::handleLog);

    appendLog(tr("[system] Monitor ready"));
}

void MonitorWindow::setConnectionDefaults(const QString &host, quint16 socketPort, quint16 httpPort) {
    hostEdit_->setText(host);
    socketPortSpin_->setValue(socketPort);
    httpPortSpin_->setValue(httpPort);
}

void MonitorWindow::startConnection() {
    running_ = true;
    connectBtn_->setText(tr("Disconnect"));
    hostEdit_->setEnabled(false);
    socketPortSpin_->setEnabled(false);
    httpPortSpin_->setEnabled(false);

    const QString host = hostEdit_->text().trimmed();
    const auto httpPort = static_cast<quint16>(httpPortSpin_->value());
    service_.setHttpPort(httpPort);
    if (socketPortSpin_->value() == 0) {
        service_.autoConnect(host, httpPort);
    } else {
        service_.connectToBackend(host, static_cast<quint16>(socketPortSpin_->value()));
    }
}

void MonitorWindow::handleConnectToggle() {
    if (!running_) {
        startConnection();
        return;
    }
    running_ = false;
    service_.disconnectFromBackend();
    connectBtn_->setText(tr("Connect"));
    hostEdit_->setEnabled(true);
    socketPortSpin_->setEnabled(true);
    httpPortSpin_->setEnabled(true);
}

void MonitorWindow::handleFindOrCreate() {
    PositionMapping mapping;
    QComboBox *const combos[] = {launchCombo_, upperCombo_, lowerCombo_};
    for (int i = 0; i < 3; ++i) {
        const QString deviceId = combos[i]->currentData().toString();
        if (!deviceId.isEmpty()) {
            mapping.insert(QLatin1String(kPositions[i]), deviceId);
        }
    }
    groupBtn_->setEnabled(false);
    groupLabel_->setText(tr("Looking for a matching group..."));
    groupLabel_->setStyleSheet("QLabel { color: orange; font-style: italic; }");
    service_.findOrCreateGroup(mapping, kDefinitionId, kGroupName);
}

void MonitorWindow::handleStatusChanged(const QString &status) {
    statusLabel_->setText(status);
    connected_ = (status == tr("Connected"));
    const bool disconnected = (status == tr("Disconnected"));

    if (connected_) {
        set_indicator(statusIndicator_, "green");
    } else if (disconnected) {
        set_indicator(statusIndicator_, "red");
    } else {
        set_indicator(statusIndicator_, "orange");
    }
    groupBtn_->setEnabled(connected_);
    appendLog(tr("[status] %1").arg(status));
}

void MonitorWindow::handleDeviceList(const QVector<DeviceListing> &devices) {
    model_.setDevices(devices);
    refillPositionSelectors();
}

void MonitorWindow::handleGroupResolved(const QJsonObject &group, bool created) {
    const QString id = fl::json::first_string(group, {"axfId", "axf_id", "groupId", "id"});
    groupLabel_->setText(created ? tr("Created group %1").arg(id) : tr("Using group %1").arg(id));
    groupLabel_->setStyleSheet("QLabel { color: green; font-weight: bold; }");
    groupBtn_->setEnabled(connected_);
}

void MonitorWindow::handleLog(LogLevel level, const QString &category, const QString &message,
                              const QDateTime &timestamp) {
    logView_->appendPlainText(QStringLiteral("[%1] %2 %3: %4")
                                  .arg(timestamp.toLocalTime().toString("hh:mm:ss.zzz"),
                                       QLatin1String(fl::common::level_name(level)), category, message));
}

void MonitorWindow::appendLog(const QString &line) {
    const QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    logView_->appendPlainText(QString("[%1] %2").arg(timestamp, line));
}

void MonitorWindow::refillPositionSelectors() {
    QComboBox *const combos[] = {launchCombo_, upperCombo_, lowerCombo_};
    const QVector<DeviceListing> devices = model_.devices();
    for (QComboBox *combo : combos) {
        const QString selected = combo->currentData().toString();
        combo->blockSignals(true);
        combo->clear();
        combo->addItem(tr("(none)"), QString());
        for (const auto &device : devices) {
            combo->addItem(QStringLiteral("%1 (%2)").arg(device.name, device.id), device.id);
        }
        const int index = combo->findData(selected);
        combo->setCurrentIndex(index < 0 ? 0 : index);
        combo->blockSignals(false);
    }
}

}  // namespace fl::client
