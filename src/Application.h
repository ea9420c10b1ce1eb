// Application.h
// - ScopeApplication: QApplication that turns escaping exceptions into log entries
// - createScopeGui(): assembles settings, telemetry, device core and main window
#pragma once
#include <QApplication>
#include <QStringList>
#include <exception>
#include <functional>
#include <memory>
#include "ConfigDecision.h"
#include "ErrorReporter.h"
#include "ExceptionLog.h"

class DeviceCore;
class MainWindow;
class SettingsStore;

class ScopeApplication : public QApplication {
    Q_OBJECT
public:
    ScopeApplication(int& argc, char** argv);

    bool notify(QObject* receiver, QEvent* e) override;

    void setExceptionHandlingEnabled(bool on) { handleExceptions_ = on; }
    bool exceptionHandlingEnabled() const { return handleExceptions_; }

    // Logs `e`, forwards it to the global reporter and emits exceptionRaised.
    // Exits with status 1 when SCOPEGUI_EXIT_ON_EXCEPTION is set.
    void handleException(const std::exception& e, const QString& context);

    static void setIdentity();

signals:
    void exceptionRaised(const ExceptionRecord& rec);

private:
    bool handleExceptions_ = false;
};

struct LaunchOptions {
    ConfigRequest config;
    std::shared_ptr<DeviceCore> core;     // null = create the default core
    SettingsStore* settings = nullptr;    // null = SettingsStore::instance()
    bool installExceptionHandler = true;
    bool installErrorReporter = true;
    bool show = true;

    // Dialog replacements, null = the interactive dialogs
    std::function<LoadPrompt(const QString&)> askLoadConfig;
    ErrorReporter::ConsentPrompt askConsent;
};

struct ScopeGui {
    std::unique_ptr<ErrorReporter> reporter;
    std::unique_ptr<MainWindow> window;
    QStringList warnings;

    ScopeGui();
    ScopeGui(ScopeGui&&) noexcept;
    // Both clear ErrorReporter::global() when it is the reporter being dropped.
    ScopeGui& operator=(ScopeGui&&) noexcept;
    ~ScopeGui();

private:
    void releaseGlobal();
};

// Needs a QApplication (throws std::logic_error otherwise). Configuration
// load failures end up in `warnings`, they do not abort startup.
ScopeGui createScopeGui(LaunchOptions opts = {});
