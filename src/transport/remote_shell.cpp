#include "transport/remote_shell.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cctype>

bool SshEndpoint::parse(const std::string& spec, const SshSettings& settings,
                        SshEndpoint& endpoint, std::string& error) {
    std::string value = utils::trim(spec);
    if (value.empty()) {
        error = "No target host given";
        return false;
    }

    endpoint.user = settings.user;
    endpoint.port = settings.port;
    endpoint.host = value;

    // Only a single colon means host:port; anything else is left to ssh
    auto colon = value.find(':');
    if (colon != std::string::npos && value.find(':', colon + 1) == std::string::npos) {
        std::string port = value.substr(colon + 1);
        if (port.empty() || port.size() > 5 ||
            port.find_first_not_of("0123456789") != std::string::npos) {
            error = "Invalid port in '" + value + "'";
            return false;
        }
        int number = std::stoi(port);
        if (number < 1 || number > 65535) {
            error = "Invalid port in '" + value + "'";
            return false;
        }
        endpoint.host = value.substr(0, colon);
        endpoint.port = number;
    }

    if (endpoint.host.empty() || endpoint.host[0] == '-') {
        error = "Invalid host '" + value + "'";
        return false;
    }
    return true;
}

std::string SshEndpoint::toString() const {
    return user + "@" + host + ":" + std::to_string(port);
}

RemoteShell::RemoteShell(std::shared_ptr<CommandRunner> runner, const SshSettings& settings,
                         bool checksum)
    : runner_(runner)
    , settings_(settings)
    , checksum_(checksum) {
}

std::vector<std::string> RemoteShell::sshArgs(const SshEndpoint& endpoint,
                                              const std::string& configPath) const {
    std::vector<std::string> args = {"ssh"};
    if (!configPath.empty()) {
        args.push_back("-F");
        args.push_back(configPath);
    }
    args.push_back("-p");
    args.push_back(std::to_string(endpoint.port));
    args.push_back("-l");
    args.push_back(endpoint.user);
    args.push_back("-o");
    args.push_back("BatchMode=yes");
    args.insert(args.end(), settings_.extraOptions.begin(), settings_.extraOptions.end());
    args.push_back(endpoint.host);
    return args;
}

CommandResult RemoteShell::exec(const SshEndpoint& endpoint,
                                const std::string& command,
                                const std::string& stdinPath,
                                const std::string& stdoutPath,
                                const std::string& configPath) {
    Command cmd;
    cmd.argv = sshArgs(endpoint, configPath);
    cmd.argv.push_back("--");
    cmd.argv.push_back(command);
    cmd.stdinPath = stdinPath;
    cmd.stdoutPath = stdoutPath;
    return runner_->run(cmd);
}

bool RemoteShell::pathExists(const SshEndpoint& endpoint, const std::string& path, bool& exists,
                             const std::string& configPath) {
    CommandResult result = exec(endpoint, "test -e " + utils::shellQuote(path), "", "", configPath);
    if (result.exitCode == 0 || result.exitCode == 1) {
        exists = result.exitCode == 0;
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    lastError_ = "Failed to check " + path + " on " + endpoint.host +
                 " (exit status " + std::to_string(result.exitCode) + ")";
    return false;
}

CommandResult RemoteShell::transfer(const SshEndpoint& endpoint, const TransferSpec& spec,
                                    const std::string& configPath) {
    std::vector<std::string> ssh = sshArgs(endpoint, configPath);
    ssh.pop_back();  // rsync appends the host itself

    Command cmd;
    cmd.argv = {"rsync", "-a", "--numeric-ids"};
    if (checksum_) {
        cmd.argv.push_back("--checksum");
    }
    if (spec.deleteExtraneous) {
        cmd.argv.push_back("--delete");
    }
    if (spec.direction == TransferDirection::Pull && spec.dedupBase) {
        cmd.argv.push_back("--link-dest=" + *spec.dedupBase);
    }
    cmd.argv.push_back("-e");
    cmd.argv.push_back(utils::joinCommand(ssh));
    cmd.argv.push_back("--rsync-path=sudo rsync");

    std::string remote = endpoint.host + ":" + spec.remotePath + "/";
    std::string local = spec.localPath + "/";
    if (spec.direction == TransferDirection::Pull) {
        cmd.argv.push_back(remote);
        cmd.argv.push_back(local);
    } else {
        cmd.argv.push_back(local);
        cmd.argv.push_back(remote);
    }

    CommandResult result = runner_->run(cmd);
    if (!result.ok()) {
        Logger::error("rsync " + std::string(spec.direction == TransferDirection::Pull ? "from " : "to ") +
                      endpoint.host + ":" + spec.remotePath + " failed with status " +
                      std::to_string(result.exitCode));
    }
    return result;
}

std::string RemoteShell::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}
