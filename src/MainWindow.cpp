// MainWindow.cpp
#include "MainWindow.h"
#include "AcquisitionWidget.h"
#include "AppInfo.h"
#include "Dialogs.h"
#include "ExceptionLog.h"
#include "PreviewWidget.h"
#include "PropertyBrowser.h"
#include "Settings.h"
#include "StackWriter.h"
#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QDateTime>
#include <QDir>
#include <QDockWidget>
#include <QFileDialog>
#include <QFileInfo>
#include <QMenuBar>
#include <QMessageBox>
#include <QSignalBlocker>
#include <QStatusBar>
#include <QToolBar>
#include <chrono>
#include <iostream>

MainWindow::MainWindow(std::shared_ptr<DeviceCore> core, SettingsStore& settings, QWidget* parent)
    : QMainWindow(parent), core_(std::move(core)), settings_(settings) {
    setObjectName("ScopeGUIMainWindow");
    buildUi();
    buildMenus();
    updateTitle();
    resize(1280, 800);
}

MainWindow::~MainWindow() {
    // frame callbacks write into preview_, which is destroyed before the docks
    stopLive();
    acq_->cancelAndWait();
}

void MainWindow::buildUi() {
    // light blue theme
    setStyleSheet(R"(
        QMainWindow { background: #EAF6FF; }
        QPushButton {
            background: qlineargradient(x1:0,y1:0, x2:0,y2:1,
                                        stop:0 #7EC8FF, stop:1 #5AAEF0);
            border: none; border-radius: 10px; padding: 6px 12px;
            color: white; font-weight: 600;
        }
        QPushButton:hover { background: #66BBFF; }
        QPushButton:pressed { background: #459DE6; }
        QPushButton:disabled { background: #B8D8F0; }
        QLabel { color: #0F3554; }
        QCheckBox { color: #0F3554; }
        QDockWidget::title { background: #CFE9FF; padding: 4px; }
    )");

    preview_ = new PreviewWidget;
    setCentralWidget(preview_);

    props_ = new PropertyBrowser(core_);
    acq_ = new AcquisitionWidget(core_, settings_);
    acq_->setFrameSink([this](const cv::Mat& img) { preview_->pushFrame(img); });
    auto log = new ExceptionLogWidget(settings_);

    addDock(WidgetKey::kPropertyBrowser, "Property Browser", props_, Qt::LeftDockWidgetArea);
    addDock(WidgetKey::kAcquisition, "Acquisition", acq_, Qt::RightDockWidgetArea);
    addDock(WidgetKey::kExceptionLog, "Exception Log", log, Qt::BottomDockWidgetArea);

    connect(props_, &PropertyBrowser::errorOccurred, this, &MainWindow::onDeviceError);
    connect(acq_, &AcquisitionWidget::started, this, [this] {
        actSnap_->setEnabled(false);
        actLive_->setEnabled(false);
    });
    connect(acq_, &AcquisitionWidget::finished, this, [this] {
        actSnap_->setEnabled(true);
        actLive_->setEnabled(true);
        props_->refresh();
    });

    auto tb = addToolBar("Camera");
    tb->setObjectName("scopegui.camera_toolbar");
    actSnap_ = tb->addAction("Snap", this, &MainWindow::onSnap);
    actLive_ = tb->addAction("Live");
    actLive_->setCheckable(true);
    connect(actLive_, &QAction::toggled, this, &MainWindow::onLiveToggled);
}

QDockWidget* MainWindow::addDock(const char* key, const QString& title, QWidget* w, Qt::DockWidgetArea area) {
    auto dock = new QDockWidget(title, this);
    dock->setObjectName(key);   // saveState() identifies docks by object name
    dock->setWidget(w);
    addDockWidget(area, dock);
    docks_[key] = dock;
    return dock;
}

void MainWindow::buildMenus() {
    auto appMenu = menuBar()->addMenu(AppInfo::kAppName);
    appMenu->addAction("About", this, &MainWindow::onAbout);
    auto actQuit = appMenu->addAction("Quit", this, &QWidget::close);
    actQuit->setShortcut(QKeySequence::Quit);

    auto fileMenu = menuBar()->addMenu("File");
    fileMenu->addAction("Load Configuration...", this, &MainWindow::onLoadConfig);
    fileMenu->addAction("Save Configuration...", this, &MainWindow::onSaveConfig);
    fileMenu->addSeparator();
    auto actSave = fileMenu->addAction("Save Snapshot...", this, &MainWindow::onSaveSnapshot);
    actSave->setShortcut(QKeySequence::Save);

    windowMenu_ = menuBar()->addMenu("Window");
    for (const auto& [key, dock] : docks_) {
        Q_UNUSED(key);
        windowMenu_->addAction(dock->toggleViewAction());
    }
}

QDockWidget* MainWindow::dockWidget(const QString& key) const {
    auto it = docks_.find(key);
    return it == docks_.end() ? nullptr : it->second;
}

void MainWindow::restoreFromSettings() {
    const WindowSettings& w = settings_.settings().window;
    if (!w.geometry.isEmpty() && !restoreGeometry(w.geometry))
        std::cerr << "[MainWindow] could not restore window geometry" << std::endl;
    if (!w.windowState.isEmpty() && !restoreState(w.windowState))
        std::cerr << "[MainWindow] could not restore window state" << std::endl;

    // open_widgets wins over whatever the state blob said
    for (const auto& [key, dock] : docks_)
        dock->setVisible(w.openWidgets.count(key) > 0);
}

void MainWindow::storeToSettings() {
    WindowSettings& w = settings_.settings().window;
    w.geometry = saveGeometry();
    w.windowState = saveState();
    w.openWidgets.clear();
    for (const auto& [key, dock] : docks_)
        if (!dock->isHidden()) w.openWidgets.insert(key);
}

void MainWindow::loadConfiguration(const QString& path) {
    stopLive();
    core_->loadSystemConfiguration(path.toStdString());
    if (path != kDemoConfig) {
        settings_.settings().lastConfig = path;
        settings_.flush();
    }
    props_->refresh();
    updateTitle();
    statusBar()->showMessage(QString("Loaded %1").arg(path), 5000);
}

void MainWindow::updateTitle() {
    QString title = AppInfo::kAppName;
    if (core_ && core_->isLoaded()) {
        const QString cfg = QString::fromStdString(core_->systemConfigurationFile());
        title += QString(" - %1").arg(cfg == kDemoConfig ? QString("Demo") : QFileInfo(cfg).fileName());
    }
    setWindowTitle(title);
}

void MainWindow::onLoadConfig() {
    QString start = settings_.settings().lastConfig.value_or(QDir::homePath());
    const QString path = QFileDialog::getOpenFileName(this, "Load Configuration", start,
                                                      "Configuration (*.mfs *.ini *.json *.cfg);;All files (*)");
    if (path.isEmpty()) return;
    try {
        loadConfiguration(path);
    }
    catch (const std::exception& e) {
        QMessageBox::critical(this, "Load failed", e.what());
    }
}

void MainWindow::onSaveConfig() {
    if (!core_->isLoaded()) {
        QMessageBox::warning(this, "Save Configuration", "No configuration is loaded.");
        return;
    }
    const QString path = QFileDialog::getSaveFileName(this, "Save Configuration",
                                                      settings_.settings().lastConfig.value_or(QDir::homePath()));
    if (path.isEmpty()) return;
    try {
        core_->saveSystemConfiguration(path.toStdString());
        statusBar()->showMessage(QString("Saved %1").arg(path), 5000);
    }
    catch (const std::exception& e) {
        QMessageBox::critical(this, "Save failed", e.what());
    }
}

void MainWindow::onSaveSnapshot() {
    cv::Mat frame = preview_->lastFrame();
    if (frame.empty()) {
        QMessageBox::information(this, "Save Snapshot", "There is no image to save.");
        return;
    }
    const QString dir = settings_.settings().lastSaveDir.value_or(QDir::homePath());
    const auto name = QString("snap_%1.tif").arg(QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss"));
    const QString path = QFileDialog::getSaveFileName(this, "Save Snapshot", QDir(dir).filePath(name),
                                                      "TIFF (*.tif *.tiff);;PNG (*.png)");
    if (path.isEmpty()) return;
    try {
        StackWriter::saveImage(path.toStdString(), frame);
        settings_.settings().lastSaveDir = QFileInfo(path).absolutePath();
        settings_.flush();
        statusBar()->showMessage(QString("Saved %1").arg(path), 5000);
    }
    catch (const std::exception& e) {
        QMessageBox::critical(this, "Save failed", e.what());
    }
}

void MainWindow::onSnap() {
    if (!core_->isLoaded()) { QMessageBox::warning(this, "Snap", "Load a configuration first"); return; }
    try {
        preview_->pushFrame(core_->snapImage());
    }
    catch (const std::exception& e) {
        QMessageBox::critical(this, "Snap failed", e.what());
    }
}

void MainWindow::onLiveToggled(bool on) {
    if (!on) {
        stopLive();
        return;
    }
    if (!core_->isLoaded()) {
        QMessageBox::warning(this, "Live", "Load a configuration first");
        actLive_->setChecked(false);
        return;
    }
    try {
        core_->startContinuousAcquisition([this](const cv::Mat& img) { preview_->pushFrame(img); });
        actSnap_->setEnabled(false);
        acq_->setEnabled(false);
    }
    catch (const std::exception& e) {
        actLive_->setChecked(false);
        QMessageBox::critical(this, "Live failed", e.what());
    }
}

void MainWindow::stopLive() {
    if (core_ && core_->isSequenceRunning()) {
        try {
            core_->stopContinuousAcquisition();
        }
        catch (const std::exception& e) {
            std::cerr << "[MainWindow] stop live: " << e.what() << std::endl;
        }
    }
    if (actSnap_) actSnap_->setEnabled(true);
    if (acq_) acq_->setEnabled(true);
    if (actLive_ && actLive_->isChecked()) {
        const QSignalBlocker block(actLive_);
        actLive_->setChecked(false);
    }
}

void MainWindow::onAbout() {
    AboutDialog dlg(core_.get(), this);
    dlg.exec();
}

void MainWindow::onDeviceError(const QString& message) {
    ExceptionLog::instance().append({ QDateTime::currentDateTime(), "DeviceError", message, "property browser" });
    statusBar()->showMessage(message, 8000);
}

void MainWindow::closeEvent(QCloseEvent* e) {
    if (!closing_) {
        closing_ = true;
        stopLive();
        acq_->cancelAndWait();
        storeToSettings();
        if (!settings_.flush(std::chrono::milliseconds(1000)))
            std::cerr << "[MainWindow] settings were not written in time" << std::endl;
    }
    QMainWindow::closeEvent(e);
}
