#pragma once

#include "common/app_config.hpp"
#include "transport/remote_shell.hpp"
#include "transport/topology_resolver.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// An ssh config file routing internal-only cluster members through the
// entry host. Lives for one operation.
struct TunnelConfig {
    std::string path;
    SshEndpoint entry;
    std::vector<Node> members;
};

// Owns the tunnel config file and unlinks it when it goes out of scope,
// whether the scope ends normally, by error or by InterruptedError.
class ScopedTunnel {
public:
    explicit ScopedTunnel(TunnelConfig config);
    ~ScopedTunnel();

    ScopedTunnel(const ScopedTunnel&) = delete;
    ScopedTunnel& operator=(const ScopedTunnel&) = delete;

    const TunnelConfig& config() const { return config_; }

private:
    TunnelConfig config_;
};

using MemberPredicate = std::function<bool(const Node&)>;
using MemberAction = std::function<bool(const Node&)>;
using TunnelBody = std::function<bool(const TunnelConfig&)>;

class TunnelTransport {
public:
    TunnelTransport(std::shared_ptr<RemoteShell> shell, const AppConfig& config);

    // Writes the tunnel config file. The caller owns the file; prefer
    // withTunnel, which releases it on every exit path.
    bool buildTunnel(const SshEndpoint& entry, const std::vector<Node>& members,
                     TunnelConfig& config);

    // Builds a tunnel, runs body with it and removes the config afterwards.
    bool withTunnel(const SshEndpoint& entry, const std::vector<Node>& members,
                    const TunnelBody& body);

    CommandResult runOverTunnel(const TunnelConfig& config, const Node& member,
                                const std::string& command,
                                const std::string& stdinPath = "",
                                const std::string& stdoutPath = "");

    bool transferOverTunnel(const TunnelConfig& config, const Node& member,
                            TransferDirection direction,
                            const std::string& localPath,
                            const std::string& remotePath,
                            const std::optional<std::string>& dedupBase = std::nullopt);

    // Visits members in order and runs action on the first one satisfying
    // applies, then stops. No applicable member is a successful no-op.
    bool firstSuccess(const std::vector<Node>& members, const MemberPredicate& applies,
                      const MemberAction& action);

    // Runs action on every member; fails if any of them fails.
    bool fanOut(const std::vector<Node>& members, const MemberAction& action);

    // ssh config text for a tunnel
    static std::string renderConfig(const SshEndpoint& entry, const std::vector<Node>& members,
                                    const SshSettings& settings);

    SshEndpoint memberEndpoint(const Node& member) const;

    std::string getLastError() const;

private:
    void setError(const std::string& error);

    std::shared_ptr<RemoteShell> shell_;
    std::string tunnelDir_;
    bool parallel_;
    std::string lastError_;
    mutable std::mutex mutex_;
};
