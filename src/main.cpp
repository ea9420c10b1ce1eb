// main.cpp
// - command line entry point
//   scopegui [run] [-c PATH] [--demo-config] [--no-telemetry]
//   scopegui settings [--reset] [--path] [--edit]
#include <QCommandLineParser>
#include <QDesktopServices>
#include <QFile>
#include <QFileInfo>
#include <QGuiApplication>
#include <QJsonDocument>
#include <QProcess>
#include <QUrl>
#include <iostream>
#include <string>
#include "AppInfo.h"
#include "Application.h"
#include "CommandLine.h"
#include "DeviceCore.h"
#include "MainWindow.h"
#include "Settings.h"

static void printVersion() {
    std::cout << AppInfo::kExeName << " " << AppInfo::kVersion << std::endl;
}

static int runCommand(int argc, char* argv[], const QStringList& args) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Open the microscope GUI.");
    parser.addHelpOption();
    const QCommandLineOption optConfig({ "c", "config" }, "Hardware configuration file to load.", "PATH");
    const QCommandLineOption optDemo("demo-config", "Load the demo camera.");
    const QCommandLineOption optNoTelemetry("no-telemetry", "Do not ask for or send error reports.");
    const QCommandLineOption optVersion("version", "Show the version and exit.");
    parser.addOption(optConfig);
    parser.addOption(optDemo);
    parser.addOption(optNoTelemetry);
    parser.addOption(optVersion);

    if (!parser.parse(args)) {
        std::cerr << parser.errorText().toStdString() << "\n\n" << parser.helpText().toStdString();
        return 2;
    }
    if (parser.isSet("help")) {
        std::cout << parser.helpText().toStdString() << "\n" << commandOverview().toStdString();
        return 0;
    }
    if (parser.isSet(optVersion)) { printVersion(); return 0; }
    if (parser.isSet(optConfig) && parser.isSet(optDemo)) {
        std::cerr << "--config and --demo-config are mutually exclusive" << std::endl;
        return 2;
    }

    ScopeApplication app(argc, argv);

    LaunchOptions opts;
    if (parser.isSet(optDemo)) opts.config.path = kDemoConfig;
    else if (parser.isSet(optConfig)) opts.config.path = parser.value(optConfig);
    opts.installErrorReporter = !parser.isSet(optNoTelemetry);

    ScopeGui gui = createScopeGui(opts);
    return app.exec();
}

static bool confirm(const std::string& question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

static int openInEditor(int argc, char* argv[], const QString& path) {
    if (!QFileInfo::exists(path)) {
        QFile f(path);
        if (!f.open(QIODevice::WriteOnly)) {
            std::cerr << "cannot create " << path.toStdString() << ": " << f.errorString().toStdString() << std::endl;
            return 1;
        }
        f.write("{}\n");
    }
    const QString editor = qEnvironmentVariable("VISUAL", qEnvironmentVariable("EDITOR"));
    if (!editor.isEmpty())
        return QProcess::execute(editor, { path }) == 0 ? 0 : 1;

    QGuiApplication app(argc, argv);
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(path))) {
        std::cerr << "no application to open " << path.toStdString() << std::endl;
        return 1;
    }
    return 0;
}

static int settingsCommand(int argc, char* argv[], const QStringList& args) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Show or manage the stored user settings.");
    parser.addHelpOption();
    const QCommandLineOption optReset("reset", "Reset all settings to their defaults.");
    const QCommandLineOption optPath("path", "Print the settings file path.");
    const QCommandLineOption optEdit("edit", "Open the settings file in an editor.");
    parser.addOption(optReset);
    parser.addOption(optPath);
    parser.addOption(optEdit);

    if (!parser.parse(args)) {
        std::cerr << parser.errorText().toStdString() << "\n\n" << parser.helpText().toStdString();
        return 2;
    }
    if (parser.isSet("help")) { std::cout << parser.helpText().toStdString(); return 0; }

    SettingsStore& store = SettingsStore::instance();
    if (parser.isSet(optPath)) {
        std::cout << store.filePath().toStdString() << std::endl;
        return 0;
    }
    if (parser.isSet(optReset)) {
        if (!confirm("Reset all settings to their defaults?")) {
            std::cout << "Aborted." << std::endl;
            return 1;
        }
        store.resetToDefaults();
        std::cout << "Settings reset." << std::endl;
        return 0;
    }
    if (parser.isSet(optEdit))
        return openInEditor(argc, argv, store.filePath());

    for (const auto& w : store.warnings())
        std::cerr << "warning: " << w.toStdString() << std::endl;
    std::cout << QJsonDocument(store.settings().toJson(false)).toJson(QJsonDocument::Indented).toStdString();
    return 0;
}

int main(int argc, char* argv[]) {
    ScopeApplication::setIdentity();

    QStringList args;
    for (int i = 0; i < argc; ++i) args << QString::fromLocal8Bit(argv[i]);

    const Command cmd = splitCommand(args);
    if (cmd.name == "help") { std::cout << commandOverview().toStdString(); return 0; }
    if (cmd.name == "run") return runCommand(argc, argv, cmd.args);
    if (cmd.name == "settings") return settingsCommand(argc, argv, cmd.args);

    std::cerr << "unknown command '" << cmd.name.toStdString() << "'\n\n" << commandOverview().toStdString();
    return 2;
}
