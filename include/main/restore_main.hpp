#pragma once

#include "common/app_config.hpp"

// Exit status of an operator declining the confirmation prompt
constexpr int kExitAborted = 2;

// `restore [-f] [-c] [-s <snapshot-id>] [-v] <host>`; argv[0] is the command name
int restoreMain(int argc, char* argv[], const AppConfig& config);
