// Settings.cpp
#include "Settings.h"
#include "AppInfo.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>
#include <QtGlobal>
#include <iostream>
#include <stdexcept>

namespace {

// ===== JSON keys =====
namespace Keys {
const char* kVersion         = "version";
const char* kWindow          = "window";
const char* kGeometry        = "geometry";
const char* kWindowState     = "window_state";
const char* kOpenWidgets     = "open_widgets";
const char* kInitialWidgets  = "initial_widgets";   // pre-1.0 name of open_widgets
const char* kSendErrors      = "send_error_reports";
const char* kLastConfig      = "last_config";
const char* kAutoLoad        = "auto_load_last_config";
const char* kFallbackDemo    = "fallback_to_demo_config";
const char* kLastSaveDir     = "last_save_dir";
}

enum class FieldType { Version, Window, OptBool, Bool, OptString };

struct Field {
    const char* key;
    FieldType type;
};

const Field kTopFields[] = {
    { Keys::kVersion,      FieldType::Version   },
    { Keys::kWindow,       FieldType::Window    },
    { Keys::kSendErrors,   FieldType::OptBool   },
    { Keys::kLastConfig,   FieldType::OptString },
    { Keys::kAutoLoad,     FieldType::OptBool   },
    { Keys::kFallbackDemo, FieldType::Bool      },
    { Keys::kLastSaveDir,  FieldType::OptString },
};

void warn(QStringList* warnings, const QString& msg) {
    std::cerr << "[Settings] " << msg.toStdString() << std::endl;
    if (warnings) warnings->push_back(msg);
}

// Lax boolean: JSON bool, 0/1, or the usual words.
std::optional<bool> toBool(const QJsonValue& v) {
    if (v.isBool()) return v.toBool();
    if (v.isDouble()) {
        const double d = v.toDouble();
        if (d == 0.0) return false;
        if (d == 1.0) return true;
        return std::nullopt;
    }
    if (v.isString()) {
        const QString s = v.toString().trimmed().toLower();
        if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
        if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    }
    return std::nullopt;
}

std::optional<QByteArray> toBytes(const QJsonValue& v) {
    if (!v.isString()) return std::nullopt;
    auto res = QByteArray::fromBase64Encoding(v.toString().toLatin1(),
                                              QByteArray::AbortOnBase64DecodingErrors);
    if (res.decodingStatus != QByteArray::Base64DecodingStatus::Ok) return std::nullopt;
    return *res;
}

bool validVersion(const QJsonValue& v) {
    if (!v.isString()) return false;
    const QStringList parts = v.toString().split('.');
    if (parts.size() < 2) return false;
    bool okMajor = false, okMinor = false;
    parts[0].toInt(&okMajor);
    parts[1].toInt(&okMinor);
    return okMajor && okMinor;
}

QJsonObject cleanWindow(QJsonObject values, QStringList* warnings, bool warnUnknown) {
    // the legacy name wins when both are present
    if (values.contains(Keys::kInitialWidgets)) {
        values.insert(Keys::kOpenWidgets, values.value(Keys::kInitialWidgets));
        values.remove(Keys::kInitialWidgets);
    }

    QJsonObject cleaned;
    for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
        const QString key = it.key();
        const QJsonValue v = it.value();
        if (key == Keys::kGeometry || key == Keys::kWindowState) {
            if (v.isNull() || toBytes(v)) cleaned.insert(key, v);
            else warn(warnings, QString("Could not validate key 'window.%1' from settings").arg(key));
        }
        else if (key == Keys::kOpenWidgets) {
            bool ok = v.isArray();
            for (const auto& item : v.toArray()) ok = ok && item.isString();
            if (ok) cleaned.insert(key, v);
            else warn(warnings, QString("Could not validate key 'window.%1' from settings").arg(key));
        }
        else {
            if (warnUnknown) warn(warnings, QString("Key 'window.%1' from settings not found in model").arg(key));
            cleaned.insert(key, v);
        }
    }
    return cleaned;
}

bool validField(FieldType type, const QJsonValue& v) {
    switch (type) {
    case FieldType::Version:   return validVersion(v);
    case FieldType::Window:    return v.isObject();
    case FieldType::OptBool:   return v.isNull() || toBool(v).has_value();
    case FieldType::Bool:      return toBool(v).has_value();
    case FieldType::OptString: return v.isNull() || v.isString();
    }
    return false;
}

const Field* findField(const QString& key) {
    for (const auto& f : kTopFields)
        if (key == f.key) return &f;
    return nullptr;
}

QJsonObject cleanValues(const QJsonObject& values, QStringList* warnings, bool warnUnknown) {
    QJsonObject cleaned;
    for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
        const QString key = it.key();
        const Field* f = findField(key);
        if (!f) {
            // ignored by the model, kept so a newer app's data is visible to callers
            if (warnUnknown) warn(warnings, QString("Key '%1' from settings not found in model").arg(key));
            cleaned.insert(key, it.value());
            continue;
        }
        if (!validField(f->type, it.value())) {
            warn(warnings, QString("Could not validate key '%1' from settings").arg(key));
            continue;
        }
        if (f->type == FieldType::Window)
            cleaned.insert(key, cleanWindow(it.value().toObject(), warnings, warnUnknown));
        else
            cleaned.insert(key, it.value());
    }
    return cleaned;
}

std::optional<QString> toOptString(const QJsonValue& v) {
    if (v.isString()) return v.toString();
    return std::nullopt;
}

QJsonValue optStringJson(const std::optional<QString>& s) {
    return s ? QJsonValue(*s) : QJsonValue(QJsonValue::Null);
}

QJsonValue optBoolJson(const std::optional<bool>& b) {
    return b ? QJsonValue(*b) : QJsonValue(QJsonValue::Null);
}

QJsonValue bytesJson(const QByteArray& b) {
    return b.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(QString::fromLatin1(b.toBase64()));
}

} // namespace

// ==============================
// WindowSettings / Settings
// ==============================
std::set<QString> WindowSettings::defaultOpenWidgets() {
    return { WidgetKey::kPropertyBrowser, WidgetKey::kAcquisition };
}

bool WindowSettings::operator==(const WindowSettings& o) const {
    return geometry == o.geometry && windowState == o.windowState && openWidgets == o.openWidgets;
}

Settings::VersionTuple Settings::versionTuple() const {
    VersionTuple vt;
    const QStringList parts = version.split('.');
    if (parts.size() > 0) vt.major = parts[0].toInt();
    if (parts.size() > 1) vt.minor = parts[1].toInt();
    if (parts.size() > 2) vt.rest = parts.mid(2).join('.');
    return vt;
}

bool Settings::operator==(const Settings& o) const {
    return version == o.version && window == o.window && sendErrorReports == o.sendErrorReports
        && lastConfig == o.lastConfig && autoLoadLastConfig == o.autoLoadLastConfig
        && fallbackToDemoConfig == o.fallbackToDemoConfig && lastSaveDir == o.lastSaveDir;
}

QJsonObject Settings::toJson(bool excludeDefaults) const {
    const Settings defaults;
    QJsonObject obj;
    // the schema version is always written so readers can migrate
    obj.insert(Keys::kVersion, version);

    QJsonObject win;
    if (!excludeDefaults || !window.geometry.isEmpty())
        win.insert(Keys::kGeometry, bytesJson(window.geometry));
    if (!excludeDefaults || !window.windowState.isEmpty())
        win.insert(Keys::kWindowState, bytesJson(window.windowState));
    if (!excludeDefaults || window.openWidgets != defaults.window.openWidgets) {
        QJsonArray arr;
        for (const auto& w : window.openWidgets) arr.append(w);
        win.insert(Keys::kOpenWidgets, arr);
    }
    if (!win.isEmpty()) obj.insert(Keys::kWindow, win);

    if (!excludeDefaults || sendErrorReports != defaults.sendErrorReports)
        obj.insert(Keys::kSendErrors, optBoolJson(sendErrorReports));
    if (!excludeDefaults || lastConfig != defaults.lastConfig)
        obj.insert(Keys::kLastConfig, optStringJson(lastConfig));
    if (!excludeDefaults || autoLoadLastConfig != defaults.autoLoadLastConfig)
        obj.insert(Keys::kAutoLoad, optBoolJson(autoLoadLastConfig));
    if (!excludeDefaults || fallbackToDemoConfig != defaults.fallbackToDemoConfig)
        obj.insert(Keys::kFallbackDemo, fallbackToDemoConfig);
    if (!excludeDefaults || lastSaveDir != defaults.lastSaveDir)
        obj.insert(Keys::kLastSaveDir, optStringJson(lastSaveDir));
    return obj;
}

Settings Settings::fromJson(const QJsonObject& obj, QStringList* warnings) {
    const QJsonObject v = cleanValues(obj, warnings, false);
    Settings s;

    if (v.contains(Keys::kVersion)) s.version = v.value(Keys::kVersion).toString();

    const QJsonObject win = v.value(Keys::kWindow).toObject();
    if (auto g = toBytes(win.value(Keys::kGeometry))) s.window.geometry = *g;
    if (auto st = toBytes(win.value(Keys::kWindowState))) s.window.windowState = *st;
    if (win.contains(Keys::kOpenWidgets)) {
        s.window.openWidgets.clear();
        for (const auto& item : win.value(Keys::kOpenWidgets).toArray())
            s.window.openWidgets.insert(item.toString());
    }

    if (v.contains(Keys::kSendErrors)) s.sendErrorReports = toBool(v.value(Keys::kSendErrors));
    if (v.contains(Keys::kLastConfig)) s.lastConfig = toOptString(v.value(Keys::kLastConfig));
    if (v.contains(Keys::kAutoLoad)) s.autoLoadLastConfig = toBool(v.value(Keys::kAutoLoad));
    if (v.contains(Keys::kFallbackDemo)) s.fallbackToDemoConfig = toBool(v.value(Keys::kFallbackDemo)).value_or(false);
    if (v.contains(Keys::kLastSaveDir)) s.lastSaveDir = toOptString(v.value(Keys::kLastSaveDir));
    return s;
}

// ==============================
// Sources
// ==============================
QJsonObject deepMerge(const QJsonObject& base, const QJsonObject& over) {
    QJsonObject out = base;
    for (auto it = over.constBegin(); it != over.constEnd(); ++it) {
        const QJsonValue cur = out.value(it.key());
        if (cur.isObject() && it.value().isObject())
            out.insert(it.key(), deepMerge(cur.toObject(), it.value().toObject()));
        else
            out.insert(it.key(), it.value());
    }
    return out;
}

QJsonObject cleanSettingsValues(const QJsonObject& values, QStringList* warnings) {
    return cleanValues(values, warnings, true);
}

QJsonObject settingsFromEnvironment(const QString& prefix, QStringList* warnings) {
    QJsonObject values;
    if (prefix.isEmpty()) return values;

    for (const auto& f : kTopFields) {
        const QByteArray name = (prefix + QString(f.key).toUpper()).toUtf8();
        if (!qEnvironmentVariableIsSet(name.constData())) continue;
        const QString raw = qEnvironmentVariable(name.constData());

        switch (f.type) {
        case FieldType::Version:
            values.insert(f.key, raw);
            break;
        case FieldType::OptString:
            if (raw.isEmpty() || raw.trimmed() == "null") values.insert(f.key, QJsonValue::Null);
            else values.insert(f.key, raw);
            break;
        case FieldType::OptBool:
            if (raw.isEmpty() || raw.trimmed().toLower() == "null") values.insert(f.key, QJsonValue::Null);
            else values.insert(f.key, raw);
            break;
        case FieldType::Bool:
            values.insert(f.key, raw);
            break;
        case FieldType::Window: {
            QJsonParseError err{};
            const QJsonDocument doc = QJsonDocument::fromJson(raw.toUtf8(), &err);
            if (err.error != QJsonParseError::NoError || !doc.isObject()) {
                warn(warnings, QString("Environment variable %1 is not a JSON object").arg(QString::fromUtf8(name)));
                continue;
            }
            values.insert(f.key, doc.object());
            break;
        }
        }
    }
    return cleanValues(values, warnings, true);
}

// ==============================
// SettingsStore
// ==============================
SettingsStore::SettingsStore(Sources sources)
    : sources_(std::move(sources)) {}

SettingsStore::~SettingsStore() {
    waitPending();
}

QJsonObject SettingsStore::storedValues(QStringList* warnings) const {
    if (sources_.filePath.isEmpty()) return {};
    QFile f(sources_.filePath);
    if (!f.exists()) return {};
    if (!f.open(QIODevice::ReadOnly)) {
        warn(warnings, QString("Failed to read settings from %1: %2").arg(sources_.filePath, f.errorString()));
        return {};
    }
    const QByteArray content = f.readAll();
    if (content.trimmed().isEmpty()) return {};

    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(content, &err);
    if (err.error != QJsonParseError::NoError) {
        warn(warnings, QString("Failed to read settings from %1: %2").arg(sources_.filePath, err.errorString()));
        return {};
    }
    if (!doc.isObject()) {
        warn(warnings, QString("Failed to read settings from %1: file does not contain an object").arg(sources_.filePath));
        return {};
    }
    return cleanValues(doc.object(), warnings, true);
}

void SettingsStore::load(const QJsonObject& overrides) {
    waitPending();
    warnings_.clear();

    QJsonObject merged;
    if (sources_.readFile) merged = storedValues(&warnings_);
    merged = deepMerge(merged, settingsFromEnvironment(sources_.envPrefix, &warnings_));
    merged = deepMerge(merged, cleanValues(overrides, &warnings_, false));

    settings_ = Settings::fromJson(merged, &warnings_);

    const auto vt = settings_.versionTuple();
    if (vt.major > 1) {
        warn(&warnings_, QString("Settings version %1 is newer than %2; unknown fields are ignored")
                             .arg(settings_.version, QString(Settings::kSchemaVersion)));
    }
    // documents are always written back in the schema this build understands
    settings_.version = Settings::kSchemaVersion;
}

bool SettingsStore::flush(std::chrono::milliseconds timeout) {
    if (!sources_.writeFile || sources_.filePath.isEmpty()) return true;

    const QByteArray json = QJsonDocument(settings_.toJson(true)).toJson(QJsonDocument::Indented);
    waitPending();
    pending_ = std::async(std::launch::async, [this, json]() {
        try {
            writeFile(json);
        }
        catch (const std::exception& e) {
            std::cerr << "[Settings] " << e.what() << std::endl;
        }
    });
    if (timeout.count() > 0)
        return pending_.wait_for(timeout) == std::future_status::ready;
    return true;
}

void SettingsStore::writeFile(const QByteArray& json) const {
    std::scoped_lock lk(writeMtx_);
    const QFileInfo info(sources_.filePath);
    if (!QDir().mkpath(info.absolutePath()))
        throw std::runtime_error("cannot create " + info.absolutePath().toStdString());

    QSaveFile out(sources_.filePath);
    if (!out.open(QIODevice::WriteOnly))
        throw std::runtime_error("cannot write " + sources_.filePath.toStdString() + ": " + out.errorString().toStdString());
    out.write(json);
    if (!out.commit())
        throw std::runtime_error("cannot commit " + sources_.filePath.toStdString() + ": " + out.errorString().toStdString());
}

void SettingsStore::waitPending() {
    if (pending_.valid()) pending_.wait();
}

void SettingsStore::resetToDefaults() {
    waitPending();
    if (sources_.writeFile && !sources_.filePath.isEmpty())
        QFile::remove(sources_.filePath);
    settings_ = Settings{};
    warnings_.clear();
}

QString SettingsStore::defaultFilePath() {
    const QString base = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return QDir(base).filePath(QString("%1/settings.json").arg(AppInfo::kAppName));
}

SettingsStore& SettingsStore::instance() {
    static std::unique_ptr<SettingsStore> store = [] {
        const bool disabled = qEnvironmentVariableIsSet("SCOPEGUI_NO_SETTINGS");
        Sources src;
        src.filePath = defaultFilePath();
        src.readFile = !disabled;
        src.writeFile = !disabled;
        auto s = std::make_unique<SettingsStore>(src);
        s->load();
        return s;
    }();
    return *store;
}
