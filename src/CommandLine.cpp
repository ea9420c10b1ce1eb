// CommandLine.cpp
#include "CommandLine.h"
#include "AppInfo.h"

Command splitCommand(QStringList args) {
    Command cmd;
    cmd.name = "run";
    if (args.size() == 2 && (args[1] == "-h" || args[1] == "--help" || args[1] == "-?")) {
        cmd.name = "help";
        args.removeAt(1);
    }
    else if (args.size() > 1 && !args[1].startsWith('-')) {
        cmd.name = args[1];
        args.removeAt(1);
    }
    cmd.args = args;
    return cmd;
}

QString commandOverview() {
    return QString("Usage: %1 [COMMAND] [OPTIONS]\n"
                   "\n"
                   "%2 %3, a desktop GUI for microscope cameras.\n"
                   "\n"
                   "Commands:\n"
                   "  run        Open the microscope GUI (default).\n"
                   "  settings   Show or manage the stored user settings.\n"
                   "\n"
                   "Run '%1 COMMAND --help' for the options of a command.\n")
        .arg(AppInfo::kExeName, AppInfo::kAppName, AppInfo::kVersion);
}
