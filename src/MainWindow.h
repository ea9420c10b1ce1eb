// MainWindow.h
// - preview in the centre, tool widgets as docks keyed by WidgetKey
// - geometry, dock state and open widgets round-trip through SettingsStore
#pragma once
#include <QMainWindow>
#include <QString>
#include <map>
#include <memory>
#include "DeviceCore.h"

class QAction;
class QCloseEvent;
class QDockWidget;
class QMenu;
class AcquisitionWidget;
class PreviewWidget;
class PropertyBrowser;
class SettingsStore;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    MainWindow(std::shared_ptr<DeviceCore> core, SettingsStore& settings, QWidget* parent = nullptr);
    ~MainWindow() override;

    // Applies window.geometry / window_state / open_widgets.
    void restoreFromSettings();
    // Copies the current window layout into the settings document (no flush).
    void storeToSettings();

    // Loads a hardware configuration; throws on failure. On success the path
    // becomes settings.last_config (the demo sentinel is not remembered).
    void loadConfiguration(const QString& path);

    QDockWidget* dockWidget(const QString& key) const;
    PreviewWidget* preview() const { return preview_; }
    std::shared_ptr<DeviceCore> core() const { return core_; }

protected:
    void closeEvent(QCloseEvent* e) override;

private slots:
    void onLoadConfig();
    void onSaveConfig();
    void onSaveSnapshot();
    void onSnap();
    void onLiveToggled(bool on);
    void onAbout();
    void onDeviceError(const QString& message);

private:
    void buildUi();
    void buildMenus();
    QDockWidget* addDock(const char* key, const QString& title, QWidget* w, Qt::DockWidgetArea area);
    void stopLive();
    void updateTitle();

    std::shared_ptr<DeviceCore> core_;
    SettingsStore& settings_;

    PreviewWidget* preview_{ nullptr };
    PropertyBrowser* props_{ nullptr };
    AcquisitionWidget* acq_{ nullptr };
    std::map<QString, QDockWidget*> docks_;

    QMenu* windowMenu_{ nullptr };
    QAction* actSnap_{ nullptr };
    QAction* actLive_{ nullptr };
    bool closing_ = false;
};
