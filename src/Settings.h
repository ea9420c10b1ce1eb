// Settings.h
// - versioned user settings document (settings.json in the user data dir)
// - layered load: explicit overrides > environment > stored file > defaults
#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>

// Widget keys stored in window.open_widgets
namespace WidgetKey {
constexpr const char* kPropertyBrowser = "scopegui.property_browser";
constexpr const char* kAcquisition     = "scopegui.acquisition";
constexpr const char* kExceptionLog    = "scopegui.exception_log";
}

struct WindowSettings {
    QByteArray geometry;       // QMainWindow::saveGeometry(), empty = unset
    QByteArray windowState;    // QMainWindow::saveState(), empty = unset
    std::set<QString> openWidgets = defaultOpenWidgets();

    static std::set<QString> defaultOpenWidgets();
    bool operator==(const WindowSettings& o) const;
};

struct Settings {
    static constexpr const char* kSchemaVersion = "1.0";

    QString version = kSchemaVersion;
    WindowSettings window;
    std::optional<bool> sendErrorReports;      // nullopt = user has not decided
    std::optional<QString> lastConfig;
    std::optional<bool> autoLoadLastConfig;    // nullopt = ask on startup
    bool fallbackToDemoConfig = false;
    std::optional<QString> lastSaveDir;

    struct VersionTuple {
        int major = 0;
        int minor = 0;
        QString rest;
    };
    // First two parts are always integers; further dotted parts are joined into `rest`.
    VersionTuple versionTuple() const;

    QJsonObject toJson(bool excludeDefaults = true) const;

    // Builds a document from `obj`, keeping every field that validates.
    // Bad or unknown keys are skipped and described in `warnings`.
    static Settings fromJson(const QJsonObject& obj, QStringList* warnings = nullptr);

    bool operator==(const Settings& o) const;
    bool operator!=(const Settings& o) const { return !(*this == o); }
};

// Recursive merge: keys of `over` win, nested objects are merged key by key.
QJsonObject deepMerge(const QJsonObject& base, const QJsonObject& over);

// Drops keys that do not validate; unknown keys are kept (they are ignored later).
QJsonObject cleanSettingsValues(const QJsonObject& values, QStringList* warnings);

// Reads SCOPEGUI_<KEY> style variables for every top-level field.
QJsonObject settingsFromEnvironment(const QString& prefix, QStringList* warnings = nullptr);

class SettingsStore {
public:
    struct Sources {
        QString filePath;                 // empty = no stored file
        QString envPrefix = "SCOPEGUI_";  // empty = environment ignored
        bool readFile = true;
        bool writeFile = true;
    };

    explicit SettingsStore(Sources sources);
    ~SettingsStore();

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    // Re-reads all sources. `overrides` plays the role of explicit in-process values.
    void load(const QJsonObject& overrides = {});

    Settings& settings() { return settings_; }
    const Settings& settings() const { return settings_; }
    const QStringList& warnings() const { return warnings_; }
    const QString& filePath() const { return sources_.filePath; }
    bool writesFile() const { return sources_.writeFile && !sources_.filePath.isEmpty(); }

    // Contents of the stored file as JSON values (empty on any problem).
    QJsonObject storedValues(QStringList* warnings = nullptr) const;

    // Writes the document on a background thread. Returns false if a positive
    // timeout elapsed before the write finished.
    bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    // Removes the stored file and resets the in-memory document.
    void resetToDefaults();

    static QString defaultFilePath();
    static SettingsStore& instance();

private:
    void waitPending();
    void writeFile(const QByteArray& json) const;

    Sources sources_;
    Settings settings_;
    QStringList warnings_;
    std::future<void> pending_;
    mutable std::mutex writeMtx_;
};
