// Application.cpp
#include "Application.h"
#include "AppInfo.h"
#include "DeviceCore.h"
#include "Dialogs.h"
#include "MainWindow.h"
#include "Settings.h"
#include <QDateTime>
#include <QMessageBox>
#include <QMetaObject>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <typeinfo>
#ifdef __GNUG__
#include <cxxabi.h>
#endif

static QString exceptionTypeName(const std::exception& e) {
    const char* raw = typeid(e).name();
#ifdef __GNUG__
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> name(abi::__cxa_demangle(raw, nullptr, nullptr, &status), std::free);
    if (status == 0 && name) return QString::fromLatin1(name.get());
#endif
    return QString::fromLatin1(raw);
}

// ==============================
// ScopeApplication
// ==============================
ScopeApplication::ScopeApplication(int& argc, char** argv)
    : QApplication(argc, argv) {
    setIdentity();
}

void ScopeApplication::setIdentity() {
    QCoreApplication::setApplicationName(AppInfo::kAppName);
    QCoreApplication::setOrganizationName(AppInfo::kOrgName);
    QCoreApplication::setOrganizationDomain(AppInfo::kOrgDomain);
    QCoreApplication::setApplicationVersion(AppInfo::kVersion);
}

bool ScopeApplication::notify(QObject* receiver, QEvent* e) {
    if (!handleExceptions_) return QApplication::notify(receiver, e);
    try {
        return QApplication::notify(receiver, e);
    }
    catch (const std::exception& ex) {
        QString where = receiver ? QString::fromLatin1(receiver->metaObject()->className()) : QString("<null>");
        if (receiver && !receiver->objectName().isEmpty()) where += QString(" '%1'").arg(receiver->objectName());
        handleException(ex, where);
    }
    return false;
}

void ScopeApplication::handleException(const std::exception& e, const QString& context) {
    ExceptionRecord rec;
    rec.time = QDateTime::currentDateTime();
    rec.type = exceptionTypeName(e);
    rec.message = QString::fromLocal8Bit(e.what());
    rec.context = context;

    std::cerr << "[ScopeGUI] uncaught " << rec.type.toStdString() << ": " << e.what()
              << " (" << context.toStdString() << ")" << std::endl;
    ExceptionLog::instance().append(rec);
    if (auto reporter = ErrorReporter::global()) reporter->capture(rec);
    emit exceptionRaised(rec);

    if (qEnvironmentVariableIsSet("SCOPEGUI_EXIT_ON_EXCEPTION")) {
        std::cerr << "[ScopeGUI] SCOPEGUI_EXIT_ON_EXCEPTION is set, exiting" << std::endl;
        // the event loop will not run again: deliver the report now
        if (auto reporter = ErrorReporter::global()) reporter->shutdown();
        std::exit(1);
    }
}

// ==============================
// createScopeGui
// ==============================
ScopeGui::ScopeGui() = default;
ScopeGui::ScopeGui(ScopeGui&&) noexcept = default;

ScopeGui& ScopeGui::operator=(ScopeGui&& o) noexcept {
    if (this == &o) return *this;
    releaseGlobal();
    window = std::move(o.window);
    reporter = std::move(o.reporter);
    warnings = std::move(o.warnings);
    return *this;
}

ScopeGui::~ScopeGui() {
    releaseGlobal();
}

void ScopeGui::releaseGlobal() {
    if (reporter && ErrorReporter::global() == reporter.get())
        ErrorReporter::setGlobal(nullptr);
}

static std::unique_ptr<ErrorReporter> makeReporter(SettingsStore& store, const ErrorReporter::ConsentPrompt& ask) {
    auto reporter = std::make_unique<ErrorReporter>(store, ReporterOptions::forStore(store));
    // with consent the SDK sends stored crash data itself; a refusal drops it
    if (!reporter->install(ask) && reporter->discardPendingReports())
        std::cerr << "[ErrorReporter] discarded stored crash reports" << std::endl;
    ErrorReporter::setGlobal(reporter.get());
    ErrorReporter::installTerminateHandler();
    return reporter;
}

ScopeGui createScopeGui(LaunchOptions opts) {
    if (!qApp) throw std::logic_error("createScopeGui needs a QApplication");

    SettingsStore& store = opts.settings ? *opts.settings : SettingsStore::instance();
    ScopeGui gui;
    gui.warnings = store.warnings();

    if (auto app = qobject_cast<ScopeApplication*>(qApp))
        app->setExceptionHandlingEnabled(opts.installExceptionHandler);

    if (opts.installErrorReporter) {
        auto ask = opts.askConsent ? opts.askConsent : ErrorReporter::ConsentPrompt([] { return SendErrorsDialog::ask(); });
        gui.reporter = makeReporter(store, ask);
    }

    auto askLoad = opts.askLoadConfig;
    if (!askLoad) {
        askLoad = [](const QString& last) {
            LoadConfigDialog dlg(last);
            const int res = dlg.exec();
            LoadPrompt p;
            p.answer = res == QMessageBox::Yes ? LoadAnswer::Yes : res == QMessageBox::No ? LoadAnswer::No : LoadAnswer::Cancel;
            p.dontAskAgain = dlg.dontAskAgain();
            return p;
        };
    }
    const std::optional<QString> config = decideConfiguration(store, opts.config, askLoad);

    std::shared_ptr<DeviceCore> core = opts.core;
    if (!core) core = createDefaultCore(config ? config->toStdString() : std::string());

    gui.window = std::make_unique<MainWindow>(core, store);
    gui.window->restoreFromSettings();

    if (config) {
        try {
            gui.window->loadConfiguration(*config);
        }
        catch (const std::exception& e) {
            const QString msg = QString("Failed to load configuration %1: %2").arg(*config, QString::fromLocal8Bit(e.what()));
            std::cerr << "[ScopeGUI] " << msg.toStdString() << std::endl;
            gui.warnings << msg;
        }
    }

    for (const auto& w : gui.warnings)
        std::cerr << "[ScopeGUI] warning: " << w.toStdString() << std::endl;

    if (opts.show) {
        gui.window->show();
        if (!gui.warnings.isEmpty()) {
            QMetaObject::invokeMethod(gui.window.get(), [w = gui.window.get(), text = gui.warnings.join("\n")] {
                QMessageBox::warning(w, "ScopeGUI", text);
            }, Qt::QueuedConnection);
        }
    }
    return gui;
}
