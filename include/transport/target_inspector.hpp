#pragma once

#include "common/app_config.hpp"
#include "transport/remote_shell.hpp"
#include <memory>
#include <string>

// What the orchestrators need to know about the appliance before touching it
struct TargetInfo {
    std::string version;
    bool isConfigured{false};
    bool isCluster{false};
    bool inMaintenance{false};
    bool isReplicated{false};
};

class TargetInspector {
public:
    TargetInspector(std::shared_ptr<RemoteShell> shell, const RemoteLayout& layout);

    // Returns false when the target is unreachable or its release file
    // cannot be read.
    bool inspect(const SshEndpoint& target, TargetInfo& info);

    std::string getLastError() const { return lastError_; }

private:
    bool probe(const SshEndpoint& target, const std::string& path, bool& flag);

    std::shared_ptr<RemoteShell> shell_;
    RemoteLayout layout_;
    std::string lastError_;
};
