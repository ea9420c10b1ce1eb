#undef NDEBUG
#include "CommandLine.h"

#include <cassert>

int main() {
    {
        const Command c = splitCommand({ "scopegui" });
        assert(c.name == "run");
        assert(c.args == QStringList{ "scopegui" });
    }

    {
        const Command c = splitCommand({ "scopegui", "-c", "rig.cfg" });
        assert(c.name == "run");
        assert(c.args.size() == 3);
    }

    {
        const Command c = splitCommand({ "scopegui", "settings", "--path" });
        assert(c.name == "settings");
        assert(c.args == QStringList({ "scopegui", "--path" }));
    }

    {
        // a lone help flag lists the commands; after a command it is that command's help
        assert(splitCommand({ "scopegui", "-h" }).name == "help");
        assert(splitCommand({ "scopegui", "--help" }).name == "help");
        const Command c = splitCommand({ "scopegui", "settings", "--help" });
        assert(c.name == "settings");
        assert(c.args.contains("--help"));
    }

    {
        assert(splitCommand({ "scopegui", "frobnicate" }).name == "frobnicate");

        const QString help = commandOverview();
        assert(help.contains("run"));
        assert(help.contains("settings"));
        assert(help.contains("scopegui COMMAND --help"));
    }

    return 0;
}
