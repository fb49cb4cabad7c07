#pragma once

#include "restore/restore_session.hpp"
#include <iostream>
#include <string>

class RestoreCLI {
public:
    // Parses `restore [-f] [-c] [-s <snapshot-id>] [-v] <host>`; argv[0] is
    // the command name. Sets help instead of failing on -h.
    static bool parseArgs(int argc, char* argv[], RestoreOptions& options, bool& help,
                          std::string& error);

    static void printUsage(std::ostream& out);

    // Asks the operator to type "yes". Empty lines ask again; anything else,
    // or end of input, declines.
    static bool confirm(std::istream& in, std::ostream& out, const RestoreSession& session);
};
