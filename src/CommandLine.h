// CommandLine.h
// - subcommand dispatch for the scopegui executable
#pragma once
#include <QString>
#include <QStringList>

struct Command {
    QString name;        // "run", "settings", "help" or whatever the user typed
    QStringList args;    // program name followed by the command's own arguments
};

// A bare invocation or one starting with an option means "run";
// a lone -h/--help asks for the command overview.
Command splitCommand(QStringList args);

// Application-level help: usage line plus the list of commands.
QString commandOverview();
