#include "transport/tunnel_transport.hpp"
#include "common/interrupt.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <cstring>
#include <exception>
#include <filesystem>
#include <future>
#include <sstream>
#include <unistd.h>

ScopedTunnel::ScopedTunnel(TunnelConfig config)
    : config_(std::move(config)) {
}

ScopedTunnel::~ScopedTunnel() {
    if (config_.path.empty()) {
        return;
    }
    if (unlink(config_.path.c_str()) != 0 && errno != ENOENT) {
        Logger::warning("Failed to remove tunnel config " + config_.path + ": " + strerror(errno));
    } else {
        Logger::debug("Removed tunnel config " + config_.path);
    }
}

TunnelTransport::TunnelTransport(std::shared_ptr<RemoteShell> shell, const AppConfig& config)
    : shell_(shell)
    , tunnelDir_(config.tunnelDir)
    , parallel_(config.parallelTransfers) {
}

std::string TunnelTransport::renderConfig(const SshEndpoint& entry,
                                          const std::vector<Node>& members,
                                          const SshSettings& settings) {
    // The hop to the entry host keeps the caller's host key policy; only the
    // internal members, which cannot be verified independently, skip it.
    std::vector<std::string> proxy = {"ssh", "-p", std::to_string(entry.port),
                                      "-l", entry.user, "-o", "BatchMode=yes"};
    proxy.insert(proxy.end(), settings.extraOptions.begin(), settings.extraOptions.end());
    proxy.push_back(entry.host);
    proxy.push_back("nc.openbsd");
    proxy.push_back("%h");
    proxy.push_back("%p");

    std::stringstream ss;
    ss << "# Tunnel to internal cluster members through " << entry.host << "\n";
    for (const auto& member : members) {
        ss << "Host " << member.hostname << "\n"
           << "  ProxyCommand " << utils::joinCommand(proxy) << "\n"
           << "  StrictHostKeyChecking no\n"
           << "  UserKnownHostsFile /dev/null\n"
           << "  LogLevel ERROR\n";
    }
    return ss.str();
}

bool TunnelTransport::buildTunnel(const SshEndpoint& entry, const std::vector<Node>& members,
                                  TunnelConfig& config) {
    std::filesystem::path dir;
    try {
        dir = tunnelDir_.empty() ? std::filesystem::temp_directory_path()
                                 : std::filesystem::path(tunnelDir_);
    } catch (const std::filesystem::filesystem_error& e) {
        setError(std::string("No directory for tunnel config: ") + e.what());
        return false;
    }

    std::string pattern = (dir / "appliance-tunnel.XXXXXX").string();
    std::vector<char> path(pattern.begin(), pattern.end());
    path.push_back('\0');

    int fd = mkstemp(path.data());
    if (fd < 0) {
        setError("Failed to create tunnel config in " + dir.string() + ": " + strerror(errno));
        return false;
    }

    std::string content = renderConfig(entry, members, shell_->getSettings());
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string error = strerror(errno);
            close(fd);
            unlink(path.data());
            setError("Failed to write tunnel config: " + error);
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    close(fd);

    config.path = path.data();
    config.entry = entry;
    config.members = members;
    Logger::debug("Wrote tunnel config " + config.path + " for " +
                  std::to_string(members.size()) + " member(s) via " + entry.host);
    return true;
}

bool TunnelTransport::withTunnel(const SshEndpoint& entry, const std::vector<Node>& members,
                                 const TunnelBody& body) {
    TunnelConfig config;
    if (!buildTunnel(entry, members, config)) {
        return false;
    }

    ScopedTunnel tunnel(config);
    return body(tunnel.config());
}

SshEndpoint TunnelTransport::memberEndpoint(const Node& member) const {
    SshEndpoint endpoint;
    endpoint.host = member.hostname;
    endpoint.user = shell_->getSettings().user;
    endpoint.port = member.port;
    return endpoint;
}

CommandResult TunnelTransport::runOverTunnel(const TunnelConfig& config, const Node& member,
                                             const std::string& command,
                                             const std::string& stdinPath,
                                             const std::string& stdoutPath) {
    return shell_->exec(memberEndpoint(member), command, stdinPath, stdoutPath, config.path);
}

bool TunnelTransport::transferOverTunnel(const TunnelConfig& config, const Node& member,
                                         TransferDirection direction,
                                         const std::string& localPath,
                                         const std::string& remotePath,
                                         const std::optional<std::string>& dedupBase) {
    TransferSpec spec;
    spec.direction = direction;
    spec.localPath = localPath;
    spec.remotePath = remotePath;
    spec.dedupBase = dedupBase;

    CommandResult result = shell_->transfer(memberEndpoint(member), spec, config.path);
    if (!result.ok()) {
        setError("Transfer " + std::string(direction == TransferDirection::Pull ? "from " : "to ") +
                 member.hostname + ":" + remotePath + " failed with status " +
                 std::to_string(result.exitCode));
        return false;
    }
    return true;
}

bool TunnelTransport::firstSuccess(const std::vector<Node>& members,
                                   const MemberPredicate& applies,
                                   const MemberAction& action) {
    for (const auto& member : members) {
        Interrupt::checkpoint();
        if (!applies(member)) {
            Logger::debug("Skipping " + member.hostname + ": not applicable");
            continue;
        }

        Logger::debug("Using " + member.hostname);
        if (!action(member)) {
            if (getLastError().empty()) {
                setError("Action on " + member.hostname + " failed");
            }
            return false;
        }
        return true;
    }

    Logger::info("No applicable member found; nothing to transfer");
    return true;
}

bool TunnelTransport::fanOut(const std::vector<Node>& members, const MemberAction& action) {
    std::vector<std::string> failed;

    if (parallel_ && members.size() > 1) {
        std::vector<std::future<bool>> results;
        results.reserve(members.size());
        for (const auto& member : members) {
            results.push_back(std::async(std::launch::async, action, std::cref(member)));
        }

        std::exception_ptr interrupted;
        for (size_t i = 0; i < results.size(); ++i) {
            try {
                if (!results[i].get()) {
                    failed.push_back(members[i].hostname);
                }
            } catch (const InterruptedError&) {
                interrupted = std::current_exception();
            }
        }
        if (interrupted) {
            std::rethrow_exception(interrupted);
        }
    } else {
        for (const auto& member : members) {
            Interrupt::checkpoint();
            if (!action(member)) {
                failed.push_back(member.hostname);
            }
        }
    }

    if (failed.empty()) {
        return true;
    }

    std::string names;
    for (const auto& name : failed) {
        names += names.empty() ? name : ", " + name;
    }
    setError("Failed on " + std::to_string(failed.size()) + " of " +
             std::to_string(members.size()) + " member(s): " + names);
    return false;
}

std::string TunnelTransport::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void TunnelTransport::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_ = error;
    Logger::error(error);
}
