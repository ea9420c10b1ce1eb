#undef NDEBUG
#include "ConfigDecision.h"
#include "DeviceCore.h"
#include "Settings.h"

#include <QTemporaryDir>
#include <cassert>

static SettingsStore::Sources sourcesAt(const QString& path) {
    SettingsStore::Sources src;
    src.filePath = path;
    src.envPrefix.clear();
    return src;
}

static LoadPrompt answer(LoadAnswer a, bool dontAsk = false) {
    LoadPrompt p;
    p.answer = a;
    p.dontAskAgain = dontAsk;
    return p;
}

int main() {
    auto neverAsk = [](const QString&) -> LoadPrompt {
        assert(false && "prompt not expected");
        return {};
    };

    {
        // disabled wins over everything
        SettingsStore store(sourcesAt({}));
        store.settings().lastConfig = "last.cfg";
        store.settings().autoLoadLastConfig = true;
        store.settings().fallbackToDemoConfig = true;
        ConfigRequest req;
        req.disabled = true;
        req.path = "explicit.cfg";
        assert(!decideConfiguration(store, req, neverAsk));
    }

    {
        SettingsStore store(sourcesAt({}));
        store.settings().lastConfig = "last.cfg";
        ConfigRequest req;
        req.path = "explicit.cfg";
        assert(*decideConfiguration(store, req, neverAsk) == "explicit.cfg");
    }

    {
        SettingsStore store(sourcesAt({}));
        store.settings().lastConfig = "last.cfg";
        store.settings().autoLoadLastConfig = true;
        assert(*decideConfiguration(store, {}, neverAsk) == "last.cfg");
    }

    {
        // auto-load refused earlier: skip straight to the fallback
        SettingsStore store(sourcesAt({}));
        store.settings().lastConfig = "last.cfg";
        store.settings().autoLoadLastConfig = false;
        store.settings().fallbackToDemoConfig = true;
        assert(*decideConfiguration(store, {}, neverAsk) == kDemoConfig);
    }

    {
        // undecided: ask, answer is not remembered without "Don't ask again"
        SettingsStore store(sourcesAt({}));
        store.settings().lastConfig = "last.cfg";
        QString shown;
        auto res = decideConfiguration(store, {}, [&](const QString& last) {
            shown = last;
            return answer(LoadAnswer::Yes);
        });
        assert(shown == "last.cfg");
        assert(res && *res == "last.cfg");
        assert(!store.settings().autoLoadLastConfig.has_value());

        res = decideConfiguration(store, {}, [](const QString&) { return answer(LoadAnswer::No); });
        assert(!res);

        res = decideConfiguration(store, {}, [](const QString&) { return answer(LoadAnswer::Cancel, true); });
        assert(!res);
        assert(!store.settings().autoLoadLastConfig.has_value());
    }

    {
        // "Don't ask again" is persisted
        QTemporaryDir dir;
        const QString path = dir.filePath("settings.json");
        SettingsStore store(sourcesAt(path));
        store.load();
        store.settings().lastConfig = "last.cfg";
        auto res = decideConfiguration(store, {}, [](const QString&) { return answer(LoadAnswer::No, true); });
        assert(!res);
        assert(store.settings().autoLoadLastConfig == std::optional<bool>(false));

        bool done = store.flush(std::chrono::milliseconds(5000));
        assert(done);
        SettingsStore reread(sourcesAt(path));
        reread.load();
        assert(reread.settings().autoLoadLastConfig == std::optional<bool>(false));
        assert(!decideConfiguration(reread, {}, neverAsk));
    }

    {
        SettingsStore store(sourcesAt({}));
        assert(!decideConfiguration(store, {}, neverAsk));
        store.settings().fallbackToDemoConfig = true;
        assert(*decideConfiguration(store, {}, neverAsk) == kDemoConfig);
    }

    return 0;
}
