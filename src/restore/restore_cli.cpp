#include "restore/restore_cli.hpp"
#include "common/interrupt.hpp"
#include "common/utils.hpp"

bool RestoreCLI::parseArgs(int argc, char* argv[], RestoreOptions& options, bool& help,
                           std::string& error) {
    help = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            help = true;
            return true;
        } else if (arg == "-f" || arg == "--force") {
            options.force = true;
        } else if (arg == "-c" || arg == "--config-settings") {
            options.restoreSettings = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-s" || arg == "--snapshot") {
            if (i + 1 >= argc) {
                error = "Option " + arg + " requires a snapshot id";
                return false;
            }
            options.snapshotId = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return false;
        } else if (options.host.empty()) {
            options.host = arg;
        } else {
            error = "Unexpected argument: " + arg;
            return false;
        }
    }

    if (options.host.empty()) {
        error = "No target host given";
        return false;
    }
    return true;
}

void RestoreCLI::printUsage(std::ostream& out) {
    out << "Usage: appliance-backup restore [options] <host>[:<port>]\n"
        << "Restore a snapshot onto an appliance.\n"
        << "\n"
        << "Options:\n"
        << "  -f, --force            Don't prompt for confirmation\n"
        << "  -c, --config-settings  Restore settings and license even if the\n"
        << "                         appliance is already configured\n"
        << "  -s, --snapshot <id>    Snapshot to restore (default: current)\n"
        << "  -v, --verbose          Verbose output\n"
        << "  -h, --help             Show this help message\n";
}

bool RestoreCLI::confirm(std::istream& in, std::ostream& out, const RestoreSession& session) {
    out << "WARNING: All data on " << session.target.host << " will be overwritten with "
        << "snapshot " << session.snapshot.id << ".\n";
    if (session.isReplicated) {
        out << "WARNING: Replication on " << session.target.host << " will be interrupted.\n";
    }

    std::string line;
    for (;;) {
        out << "Type 'yes' to continue: " << std::flush;
        if (!std::getline(in, line)) {
            out << "\n";
            // A signal cuts the read short; that is not an answer
            Interrupt::checkpoint();
            return false;
        }
        std::string answer = utils::trim(line);
        if (answer.empty()) {
            continue;
        }
        return utils::toLower(answer) == "yes";
    }
}
