// ErrorReporter.cpp
#include "ErrorReporter.h"
#include "AppInfo.h"
#include "ExceptionLog.h"
#include "Settings.h"
#include <QCoreApplication>
#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QSysInfo>
#include <QTemporaryDir>
#include <cstdlib>
#include <exception>
#include <iostream>

#ifndef SCOPEGUI_SENTRY_DSN
#define SCOPEGUI_SENTRY_DSN ""
#endif

namespace {

ErrorReporter* g_reporter = nullptr;

bool envFlag(const char* name, bool def) {
    if (!qEnvironmentVariableIsSet(name)) return def;
    const QString v = qEnvironmentVariable(name);
    return v == "1" || v == "True" || v == "true";
}

QString replaceHome(const QString& s, const QString& home) {
    if (home.isEmpty()) return s;
    QString out = s;
    return out.replace(home, "~");
}

QString anonymousUserId() {
    const QByteArray id = QSysInfo::machineUniqueId();
    if (id.isEmpty()) return {};
    return QString::fromLatin1(QCryptographicHash::hash(id, QCryptographicHash::Sha256).toHex().left(32));
}

sentry_value_t str(const QString& s) {
    return sentry_value_new_string(s.toUtf8().constData());
}

// rewrites obj[key] in place when it is a string
void scrubKey(sentry_value_t obj, const char* key, const QString& home) {
    const sentry_value_t v = sentry_value_get_by_key(obj, key);
    if (sentry_value_get_type(v) != SENTRY_VALUE_TYPE_STRING) return;
    sentry_value_set_by_key(obj, key, str(replaceHome(QString::fromUtf8(sentry_value_as_string(v)), home)));
}

} // namespace

// ==============================
// ReporterOptions
// ==============================
ReporterOptions ReporterOptions::forStore(const SettingsStore& store) {
    ReporterOptions o;
    o.dsn = ErrorReporter::configuredDsn();
    o.showHostname = envFlag("SCOPEGUI_TELEMETRY_SHOW_HOSTNAME", false);
    o.debug = qEnvironmentVariableIsSet("SCOPEGUI_TELEMETRY_DEBUG");
    o.homeDir = QDir::homePath();
    if (store.writesFile())
        o.crashDir = QFileInfo(store.filePath()).absoluteDir().filePath("crash_reports");
    if (QCoreApplication::instance()) o.arguments = QCoreApplication::arguments();
    return o;
}

// ==============================
// ErrorReporter
// ==============================
QString ErrorReporter::configuredDsn() {
    if (qEnvironmentVariableIsSet("SCOPEGUI_TELEMETRY_DSN"))
        return qEnvironmentVariable("SCOPEGUI_TELEMETRY_DSN");
    return QString(SCOPEGUI_SENTRY_DSN);
}

ErrorReporter::ErrorReporter(SettingsStore& settings, ReporterOptions opts)
    : settings_(settings), opts_(std::move(opts)) {
    if (opts_.crashDir.isEmpty()) {
        tmpDatabase_ = std::make_unique<QTemporaryDir>();
        databasePath_ = tmpDatabase_->path();
    }
    else {
        databasePath_ = opts_.crashDir;
    }
}

ErrorReporter::~ErrorReporter() {
    shutdown();
    if (g_reporter == this) g_reporter = nullptr;
}

bool ErrorReporter::consentGiven() const {
    return settings_.settings().sendErrorReports.value_or(false);
}

bool ErrorReporter::install(const ConsentPrompt& ask) {
    auto& s = settings_.settings();
    if (!s.sendErrorReports.has_value()) {
        const std::optional<bool> answer = ask ? ask() : std::nullopt;
        if (!answer) {
            std::cerr << "[ErrorReporter] consent dialog dismissed, asking again next time" << std::endl;
            return false;
        }
        s.sendErrorReports = *answer;
        settings_.flush();
    }
    if (!*s.sendErrorReports) {
        std::cerr << "[ErrorReporter] error reporting disabled by user" << std::endl;
        return false;
    }
    if (installed_) return true;
    if (opts_.dsn.isEmpty()) {
        std::cerr << "[ErrorReporter] no DSN configured, skipping error reporting" << std::endl;
        return false;
    }
    if (databasePath_.isEmpty() || !QDir().mkpath(databasePath_)) {
        std::cerr << "[ErrorReporter] no usable crash database directory" << std::endl;
        return false;
    }

    sentry_options_t* o = sentry_options_new();
    sentry_options_set_dsn(o, opts_.dsn.toUtf8().constData());
    sentry_options_set_release(o, QString("%1@%2").arg(AppInfo::kExeName, AppInfo::kVersion).toUtf8().constData());
    sentry_options_set_environment(o, QSysInfo::productType().toUtf8().constData());
    sentry_options_set_database_path(o, QDir::toNativeSeparators(databasePath_).toUtf8().constData());
    sentry_options_set_debug(o, opts_.debug ? 1 : 0);
    sentry_options_set_auto_session_tracking(o, 0);
    sentry_options_set_shutdown_timeout(o, static_cast<uint64_t>(opts_.shutdownTimeout.count()));
    sentry_options_set_before_send(o, &ErrorReporter::beforeSend, this);
    if (sink_) {
        sentry_transport_t* t = sentry_transport_new(&ErrorReporter::sendToSink);
        sentry_transport_set_state(t, this);
        sentry_options_set_transport(o, t);
    }
    // sentry_init takes ownership of the options, also on failure
    if (sentry_init(o) != 0) {
        std::cerr << "[ErrorReporter] sentry_init failed, error reporting off" << std::endl;
        return false;
    }

    const QString uid = anonymousUserId();
    if (!uid.isEmpty()) {
        sentry_value_t user = sentry_value_new_object();
        sentry_value_set_by_key(user, "id", str(uid));
        sentry_set_user(user);
    }
    sentry_set_tag("qt", qVersion());
    sentry_set_tag("abi", QSysInfo::buildAbi().toUtf8().constData());
    installed_ = true;
    return true;
}

sentry_value_t ErrorReporter::buildEvent(const ExceptionRecord& rec) const {
    sentry_value_t frame = sentry_value_new_object();
    sentry_value_set_by_key(frame, "function", str(rec.context.isEmpty() ? QString("<unknown>") : rec.context));
    if (QCoreApplication::instance())
        sentry_value_set_by_key(frame, "abs_path", str(QCoreApplication::applicationFilePath()));
    sentry_value_t frames = sentry_value_new_list();
    sentry_value_append(frames, frame);
    sentry_value_t stacktrace = sentry_value_new_object();
    sentry_value_set_by_key(stacktrace, "frames", frames);

    sentry_value_t exc = sentry_value_new_exception(rec.type.toUtf8().constData(), rec.message.toUtf8().constData());
    sentry_value_set_by_key(exc, "stacktrace", stacktrace);

    sentry_value_t ev = sentry_value_new_event();
    if (rec.time.isValid())
        sentry_value_set_by_key(ev, "timestamp", str(rec.time.toUTC().toString(Qt::ISODateWithMs)));
    sentry_value_set_by_key(ev, "level", sentry_value_new_string("error"));
    sentry_value_set_by_key(ev, "logger", sentry_value_new_string(AppInfo::kExeName));
    if (opts_.showHostname)
        sentry_value_set_by_key(ev, "server_name", str(QSysInfo::machineHostName()));

    sentry_value_t tags = sentry_value_new_object();
    sentry_value_set_by_key(tags, "os", str(QSysInfo::prettyProductName()));
    sentry_value_set_by_key(ev, "tags", tags);

    sentry_value_t argv = sentry_value_new_list();
    for (const auto& a : opts_.arguments) sentry_value_append(argv, str(a));
    sentry_value_t extra = sentry_value_new_object();
    sentry_value_set_by_key(extra, "argv", argv);
    sentry_value_set_by_key(ev, "extra", extra);

    sentry_event_add_exception(ev, exc);
    stripSensitiveData(ev, opts_.homeDir);
    return ev;
}

void ErrorReporter::stripSensitiveData(sentry_value_t event, const QString& homeDir) {
    if (homeDir.isEmpty()) return;

    const sentry_value_t values = sentry_value_get_by_key(sentry_value_get_by_key(event, "exception"), "values");
    for (size_t i = 0; i < sentry_value_get_length(values); ++i) {
        const sentry_value_t exc = sentry_value_get_by_index(values, i);
        scrubKey(exc, "value", homeDir);
        const sentry_value_t frames = sentry_value_get_by_key(sentry_value_get_by_key(exc, "stacktrace"), "frames");
        for (size_t j = 0; j < sentry_value_get_length(frames); ++j) {
            const sentry_value_t fr = sentry_value_get_by_index(frames, j);
            for (const char* key : { "abs_path", "filename", "function" })
                scrubKey(fr, key, homeDir);
        }
    }

    const sentry_value_t argv = sentry_value_get_by_key(sentry_value_get_by_key(event, "extra"), "argv");
    for (size_t k = 0; k < sentry_value_get_length(argv); ++k) {
        const sentry_value_t a = sentry_value_get_by_index(argv, k);
        if (sentry_value_get_type(a) != SENTRY_VALUE_TYPE_STRING) continue;
        sentry_value_set_by_index(argv, k, str(replaceHome(QString::fromUtf8(sentry_value_as_string(a)), homeDir)));
    }
}

// Runs for every event the SDK is about to send, crash events included.
sentry_value_t ErrorReporter::beforeSend(sentry_value_t event, void* /*hint*/, void* closure) {
    auto self = static_cast<ErrorReporter*>(closure);
    // consent is re-read on every event so it can be revoked at runtime
    if (!self->consentGiven()) {
        sentry_value_decref(event);
        return sentry_value_new_null();
    }
    if (!self->opts_.showHostname) sentry_value_remove_by_key(event, "server_name");
    stripSensitiveData(event, self->opts_.homeDir);
    return event;
}

void ErrorReporter::sendToSink(sentry_envelope_t* envelope, void* state) {
    auto self = static_cast<ErrorReporter*>(state);
    const sentry_value_t ev = sentry_envelope_get_event(envelope);
    if (!sentry_value_is_null(ev) && self->sink_) self->sink_(ev);
    sentry_envelope_free(envelope);
}

bool ErrorReporter::capture(const ExceptionRecord& rec) {
    if (!installed_ || !consentGiven()) return false;
    sentry_capture_event(buildEvent(rec));
    return true;
}

void ErrorReporter::shutdown() {
    if (!installed_) return;
    installed_ = false;
    sentry_close();
}

bool ErrorReporter::discardPendingReports() {
    const auto& consent = settings_.settings().sendErrorReports;
    if (!consent.has_value() || *consent || installed_) return false;
    QDir dir(databasePath_);
    if (!dir.exists() || dir.isEmpty()) return false;
    return dir.removeRecursively();
}

ErrorReporter* ErrorReporter::global() {
    return g_reporter;
}

void ErrorReporter::setGlobal(ErrorReporter* reporter) {
    g_reporter = reporter;
}

void ErrorReporter::installTerminateHandler() {
    std::set_terminate([]() {
        ExceptionRecord rec;
        rec.time = QDateTime::currentDateTime();
        rec.type = "terminate";
        rec.context = "std::terminate";
        if (auto eptr = std::current_exception()) {
            try {
                std::rethrow_exception(eptr);
            }
            catch (const std::exception& e) {
                rec.type = "std::exception";
                rec.message = QString::fromLocal8Bit(e.what());
            }
            catch (...) {
                rec.message = "unknown exception";
            }
        }
        std::cerr << "[ErrorReporter] terminate: " << rec.message.toStdString() << std::endl;
        if (g_reporter && g_reporter->capture(rec)) g_reporter->shutdown();
        std::abort();
    });
}
