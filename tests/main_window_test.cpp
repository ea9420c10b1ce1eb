#undef NDEBUG
#include "Application.h"
#include "DemoCore.h"
#include "ExceptionLog.h"
#include "MainWindow.h"
#include "PreviewWidget.h"
#include "Settings.h"

#include <QCheckBox>
#include <QDockWidget>
#include <QEvent>
#include <QTemporaryDir>
#include <cassert>
#include <memory>
#include <stdexcept>

// Throws from its event handler, like a slot that fails.
class ThrowingObject : public QObject {
public:
    bool event(QEvent* e) override {
        if (e->type() == QEvent::User) throw std::runtime_error("boom");
        return QObject::event(e);
    }
};

static SettingsStore::Sources sourcesAt(const QString& path) {
    SettingsStore::Sources src;
    src.filePath = path;
    src.envPrefix.clear();
    return src;
}

static LaunchOptions quietOptions(SettingsStore& store, std::shared_ptr<DeviceCore> core) {
    LaunchOptions opts;
    opts.settings = &store;
    opts.core = std::move(core);
    opts.installErrorReporter = false;
    opts.show = false;
    opts.askLoadConfig = [](const QString&) {
        assert(false && "no prompt expected");
        return LoadPrompt{};
    };
    return opts;
}

int main(int argc, char* argv[]) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
    ScopeApplication app(argc, argv);
    assert(QCoreApplication::applicationName() == "ScopeGUI");

    QTemporaryDir tmp;
    const QString path = tmp.filePath("settings.json");

    {
        // demo config: loaded, not remembered, default docks
        SettingsStore store(sourcesAt(path));
        store.load();
        auto core = std::make_shared<DemoCore>();
        core->setSimulateTiming(false);

        LaunchOptions opts = quietOptions(store, core);
        opts.config.path = kDemoConfig;
        ScopeGui gui = createScopeGui(opts);
        assert(gui.window);
        assert(!gui.reporter);
        assert(gui.warnings.isEmpty());
        assert(core->isLoaded());
        assert(!store.settings().lastConfig.has_value());
        assert(gui.window->windowTitle().contains("Demo"));

        assert(!gui.window->dockWidget(WidgetKey::kPropertyBrowser)->isHidden());
        assert(!gui.window->dockWidget(WidgetKey::kAcquisition)->isHidden());
        assert(gui.window->dockWidget(WidgetKey::kExceptionLog)->isHidden());
        assert(gui.window->dockWidget("scopegui.nothing") == nullptr);

        // close stores the layout and flushes it
        gui.window->dockWidget(WidgetKey::kExceptionLog)->show();
        gui.window->dockWidget(WidgetKey::kAcquisition)->hide();
        gui.window->close();
        assert(store.settings().window.openWidgets
               == std::set<QString>({ WidgetKey::kPropertyBrowser, WidgetKey::kExceptionLog }));
        assert(!store.settings().window.windowState.isEmpty());
    }

    {
        // the stored layout comes back on the next start
        SettingsStore store(sourcesAt(path));
        store.load();
        assert(store.settings().window.openWidgets.count(WidgetKey::kExceptionLog) == 1);

        LaunchOptions opts = quietOptions(store, std::make_shared<DemoCore>());
        opts.config.disabled = true;
        ScopeGui gui = createScopeGui(opts);
        assert(!gui.window->core()->isLoaded());
        assert(!gui.window->dockWidget(WidgetKey::kExceptionLog)->isHidden());
        assert(gui.window->dockWidget(WidgetKey::kAcquisition)->isHidden());
    }

    {
        // a broken configuration is a warning, the window still comes up
        SettingsStore store(sourcesAt({}));
        LaunchOptions opts = quietOptions(store, std::make_shared<DemoCore>());
        opts.config.path = tmp.filePath("missing.json");
        ScopeGui gui = createScopeGui(opts);
        assert(gui.window);
        assert(gui.warnings.size() == 1);
        assert(gui.warnings.first().contains("missing.json"));
        assert(!store.settings().lastConfig.has_value());
    }

    {
        // a real file load is remembered as last_config
        QString cfg = tmp.filePath("rig.json");
        {
            DemoCore writer;
            writer.loadSystemConfiguration(kDemoConfig);
            writer.saveSystemConfiguration(cfg.toStdString());
        }
        SettingsStore store(sourcesAt({}));
        auto core = std::make_shared<DemoCore>();
        ScopeGui gui = createScopeGui(quietOptions(store, core));
        assert(!core->isLoaded());
        gui.window->loadConfiguration(cfg);
        assert(core->isLoaded());
        assert(store.settings().lastConfig && *store.settings().lastConfig == cfg);

        core->setSimulateTiming(false);
        gui.window->preview()->pushFrame(core->snapImage());
        assert(!gui.window->preview()->lastFrame().empty());
    }

    {
        // exceptions escaping an event handler are logged, not fatal
        SettingsStore store(sourcesAt({}));
        ScopeGui gui = createScopeGui(quietOptions(store, std::make_shared<DemoCore>()));
        assert(app.exceptionHandlingEnabled());

        ExceptionLog::instance().clear();
        int raised = 0;
        QObject::connect(&app, &ScopeApplication::exceptionRaised, [&](const ExceptionRecord& rec) {
            assert(rec.message == "boom");
            assert(rec.type.contains("runtime_error"));
            ++raised;
        });

        ThrowingObject obj;
        QEvent ev(QEvent::User);
        QCoreApplication::sendEvent(&obj, &ev);
        assert(raised == 1);
        assert(ExceptionLog::instance().records().size() == 1);
        assert(formatRecord(ExceptionLog::instance().records().first()).contains("boom"));
    }

    {
        // replacing a gui drops its global reporter registration
        SettingsStore store(sourcesAt(tmp.filePath("owned.json")));
        ScopeGui a;
        a.reporter = std::make_unique<ErrorReporter>(store, ReporterOptions{});
        ErrorReporter::setGlobal(a.reporter.get());
        a = ScopeGui{};
        assert(!a.reporter);
        assert(ErrorReporter::global() == nullptr);

        // moving the owner keeps the registration alive
        ScopeGui c;
        c.reporter = std::make_unique<ErrorReporter>(store, ReporterOptions{});
        ErrorReporter::setGlobal(c.reporter.get());
        ScopeGui d;
        d = std::move(c);
        assert(ErrorReporter::global() == d.reporter.get());
        d = ScopeGui{};
        assert(ErrorReporter::global() == nullptr);
    }

    {
        // ticking "send error reports" starts a reporter that was off at startup
        SettingsStore store(sourcesAt(tmp.filePath("consent.json")));
        store.settings().sendErrorReports = false;
        ReporterOptions ro = ReporterOptions::forStore(store);
        ro.dsn = "https://abc123@errors.invalid/4507";
        ro.shutdownTimeout = std::chrono::milliseconds(200);
        ErrorReporter rep(store, ro);
        int sent = 0;
        rep.setEventSink([&sent](sentry_value_t) { ++sent; });
        assert(!rep.install({}));
        ErrorReporter::setGlobal(&rep);

        ExceptionLogWidget w(store);
        auto box = w.findChild<QCheckBox*>("sendErrorReports");
        assert(box && !box->isChecked());
        box->setChecked(true);
        assert(store.settings().sendErrorReports == std::optional<bool>(true));
        assert(rep.isInstalled());

        app.handleException(std::runtime_error("after opt-in"), "test");
        assert(sent == 1);

        box->setChecked(false);
        app.handleException(std::runtime_error("after opt-out"), "test");
        assert(sent == 1);
        ErrorReporter::setGlobal(nullptr);
    }

    return 0;
}
