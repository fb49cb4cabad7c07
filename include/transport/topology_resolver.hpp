#pragma once

#include "transport/remote_shell.hpp"
#include <memory>
#include <string>
#include <vector>

struct Node {
    std::string hostname;
    int port{122};
    std::string role;
    bool online{true};
};

// Asks the cluster control plane on the entry host which members carry a
// role. Nothing is cached; every call queries again.
class TopologyResolver {
public:
    TopologyResolver(std::shared_ptr<RemoteShell> shell, const SshEndpoint& entry,
                     int defaultMemberPort);

    // Online members sorted by hostname. Empty when the query fails.
    std::vector<Node> membersWithRole(const std::string& role);

    // Parses the control plane's JSON listing. Returns false on malformed
    // output.
    static bool parseMembers(const std::string& output, const std::string& role,
                             int defaultPort, std::vector<Node>& members, std::string& error);

private:
    std::shared_ptr<RemoteShell> shell_;
    SshEndpoint entry_;
    int defaultMemberPort_;
};
