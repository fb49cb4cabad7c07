#include "transport/topology_resolver.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

TopologyResolver::TopologyResolver(std::shared_ptr<RemoteShell> shell, const SshEndpoint& entry,
                                   int defaultMemberPort)
    : shell_(shell)
    , entry_(entry)
    , defaultMemberPort_(defaultMemberPort) {
}

std::vector<Node> TopologyResolver::membersWithRole(const std::string& role) {
    std::vector<Node> members;

    CommandResult result = shell_->exec(
        entry_, "appliance-cluster-nodes --role " + utils::shellQuote(role) + " --json");
    if (!result.ok()) {
        Logger::warning("Cluster member query for role '" + role + "' on " + entry_.host +
                        " failed with status " + std::to_string(result.exitCode));
        return members;
    }

    std::string error;
    if (!parseMembers(result.output, role, defaultMemberPort_, members, error)) {
        Logger::warning("Ignoring cluster member list for role '" + role + "': " + error);
        members.clear();
        return members;
    }

    Logger::debug("Role '" + role + "' has " + std::to_string(members.size()) + " online member(s)");
    return members;
}

bool TopologyResolver::parseMembers(const std::string& output, const std::string& role,
                                    int defaultPort, std::vector<Node>& members,
                                    std::string& error) {
    json listing;
    try {
        listing = json::parse(output);
    } catch (const json::parse_error& e) {
        error = e.what();
        return false;
    }

    if (!listing.is_array()) {
        error = "expected a JSON array";
        return false;
    }

    try {
        for (const auto& entry : listing) {
            Node node;
            node.hostname = entry.at("hostname").get<std::string>();
            node.port = entry.value("port", defaultPort);
            node.online = entry.value("online", true);
            node.role = role;

            if (node.hostname.empty()) {
                error = "member without hostname";
                return false;
            }
            if (node.online) {
                members.push_back(node);
            }
        }
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }

    std::sort(members.begin(), members.end(),
              [](const Node& a, const Node& b) { return a.hostname < b.hostname; });
    return true;
}
