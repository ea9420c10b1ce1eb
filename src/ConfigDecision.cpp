// ConfigDecision.cpp
#include "ConfigDecision.h"
#include "DeviceCore.h"
#include "Settings.h"

std::optional<QString> decideConfiguration(SettingsStore& store, const ConfigRequest& req,
                                           const std::function<LoadPrompt(const QString&)>& ask) {
    if (req.disabled) return std::nullopt;
    if (!req.path.isEmpty()) return req.path;

    Settings& s = store.settings();
    if (s.lastConfig && !s.lastConfig->isEmpty()) {
        const QString last = *s.lastConfig;
        if (s.autoLoadLastConfig.value_or(false)) return last;

        if (!s.autoLoadLastConfig.has_value() && ask) {
            const LoadPrompt p = ask(last);
            if (p.answer != LoadAnswer::Cancel) {
                const bool load = p.answer == LoadAnswer::Yes;
                if (p.dontAskAgain) {
                    s.autoLoadLastConfig = load;
                    store.flush();
                }
                if (load) return last;
            }
        }
    }

    if (s.fallbackToDemoConfig) return QString(kDemoConfig);
    return std::nullopt;
}
