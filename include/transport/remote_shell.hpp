#pragma once

#include "common/app_config.hpp"
#include "common/command_runner.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct SshEndpoint {
    std::string host;
    std::string user;
    int port{122};

    // Accepts "host" or "host:port"; user and default port come from settings.
    static bool parse(const std::string& spec, const SshSettings& settings,
                      SshEndpoint& endpoint, std::string& error);

    std::string toString() const;
};

enum class TransferDirection {
    Pull,   // appliance -> local snapshot
    Push    // local snapshot -> appliance
};

struct TransferSpec {
    TransferDirection direction{TransferDirection::Pull};
    std::string localPath;
    std::string remotePath;
    std::optional<std::string> dedupBase;   // rsync --link-dest, pulls only
    bool deleteExtraneous{false};
};

// Remote command execution and bulk transfer towards one ssh endpoint.
// A non-empty configPath selects an ssh config file (tunnel).
class RemoteShell {
public:
    RemoteShell(std::shared_ptr<CommandRunner> runner, const SshSettings& settings,
                bool checksum = false);

    CommandResult exec(const SshEndpoint& endpoint,
                       const std::string& command,
                       const std::string& stdinPath = "",
                       const std::string& stdoutPath = "",
                       const std::string& configPath = "");

    // Runs `test -e path`. Returns false with lastError set when the
    // remote side cannot be reached.
    bool pathExists(const SshEndpoint& endpoint, const std::string& path, bool& exists,
                    const std::string& configPath = "");

    CommandResult transfer(const SshEndpoint& endpoint, const TransferSpec& spec,
                           const std::string& configPath = "");

    std::vector<std::string> sshArgs(const SshEndpoint& endpoint,
                                     const std::string& configPath = "") const;

    const SshSettings& getSettings() const { return settings_; }
    std::string getLastError() const;

    // ssh reserves exit status 255 for its own connection failures
    static constexpr int kSshConnectionFailure = 255;

private:
    std::shared_ptr<CommandRunner> runner_;
    SshSettings settings_;
    bool checksum_;
    std::string lastError_;
    mutable std::mutex mutex_;
};
