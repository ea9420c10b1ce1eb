// ConfigDecision.h
// - which hardware configuration to load at startup
#pragma once
#include <QString>
#include <functional>
#include <optional>

class SettingsStore;

enum class LoadAnswer { Yes, No, Cancel };

struct LoadPrompt {
    LoadAnswer answer = LoadAnswer::Cancel;
    bool dontAskAgain = false;
};

// Explicit request from the caller of createScopeGui / the command line.
struct ConfigRequest {
    bool disabled = false;      // load nothing at all
    QString path;               // empty = decide from settings
};

// Order: explicit path, last config (auto-load or asked), demo fallback, nothing.
// `ask` is only called when the last config exists and auto-load is undecided;
// "Don't ask again" with Yes/No is stored and flushed.
std::optional<QString> decideConfiguration(SettingsStore& store, const ConfigRequest& req,
                                           const std::function<LoadPrompt(const QString&)>& ask);
