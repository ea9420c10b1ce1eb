// ErrorReporter.h
// - opt-in crash / exception reports through the Sentry native SDK
// - nothing leaves the machine unless settings.send_error_reports is true
// - the SDK is process-global: only one reporter can be installed at a time
#pragma once
#include <QString>
#include <QStringList>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <sentry.h>

class QTemporaryDir;
class SettingsStore;
struct ExceptionRecord;

struct ReporterOptions {
    QString dsn;                 // empty = nothing is sent
    bool showHostname = false;   // SCOPEGUI_TELEMETRY_SHOW_HOSTNAME
    bool debug = false;          // SCOPEGUI_TELEMETRY_DEBUG
    QString homeDir;             // replaced by "~" in reports
    QString crashDir;            // SDK database, empty = temporary directory
    QStringList arguments;       // command line, recorded with paths stripped
    std::chrono::milliseconds shutdownTimeout{ 2000 };   // flush wait in shutdown()

    // crashDir sits next to the store's settings file, if it writes one
    static ReporterOptions forStore(const SettingsStore& store);
};

class ErrorReporter {
public:
    // SCOPEGUI_TELEMETRY_DSN, else the DSN the build was configured with (may be empty).
    static QString configuredDsn();

    // Returns true/false for a decision, nullopt if the user dismissed the question.
    using ConsentPrompt = std::function<std::optional<bool>()>;

    // Receives each outgoing event instead of the network transport.
    // The event is borrowed for the duration of the call.
    using EventSink = std::function<void(sentry_value_t event)>;

    ErrorReporter(SettingsStore& settings, ReporterOptions opts);
    ~ErrorReporter();

    ErrorReporter(const ErrorReporter&) = delete;
    ErrorReporter& operator=(const ErrorReporter&) = delete;

    // Must be set before install().
    void setEventSink(EventSink sink) { sink_ = std::move(sink); }

    // Asks for consent when undecided, persists a decision, and starts the
    // SDK when consent is given. Returns whether reports may be sent.
    bool install(const ConsentPrompt& ask);
    bool isInstalled() const { return installed_; }

    bool consentGiven() const;

    // Builds and sends one event. Returns false when nothing was sent.
    bool capture(const ExceptionRecord& rec);

    // Flushes queued events, waiting at most opts.shutdownTimeout, and stops the SDK.
    void shutdown();

    // Deletes stored crash data when consent was refused. Returns true if
    // anything was removed.
    bool discardPendingReports();

    const QString& databasePath() const { return databasePath_; }

    // Caller owns the returned value.
    sentry_value_t buildEvent(const ExceptionRecord& rec) const;
    // Replaces the home directory in exception values, stack frames and argv.
    static void stripSensitiveData(sentry_value_t event, const QString& homeDir);

    // Process-wide reporter used by the exception and terminate handlers.
    static ErrorReporter* global();
    static void setGlobal(ErrorReporter* reporter);
    static void installTerminateHandler();

private:
    static sentry_value_t beforeSend(sentry_value_t event, void* hint, void* closure);
    static void sendToSink(sentry_envelope_t* envelope, void* state);

    SettingsStore& settings_;
    ReporterOptions opts_;
    EventSink sink_;
    std::unique_ptr<QTemporaryDir> tmpDatabase_;
    QString databasePath_;
    bool installed_ = false;
};
