#pragma once

#include "common/app_config.hpp"

// Print the backup command usage information
void printBackupUsage();

// `backup [-v] [<host>]`; argv[0] is the command name
int backupMain(int argc, char* argv[], const AppConfig& config);

// `list`: committed snapshots, current one marked
int listMain(int argc, char* argv[], const AppConfig& config);
