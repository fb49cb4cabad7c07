#pragma once

#include <string>
#include <vector>

// One child process invocation. Every external collaborator (ssh, rsync,
// appliance tools) is reached through this.
struct Command {
    std::vector<std::string> argv;
    std::string stdinPath;   // empty: /dev/null
    std::string stdoutPath;  // empty: captured into CommandResult::output
};

struct CommandResult {
    int exitCode{-1};
    std::string output;

    bool ok() const { return exitCode == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs the command to completion. Throws InterruptedError when a signal
    // arrives while waiting; the child is terminated first.
    virtual CommandResult run(const Command& command) = 0;
};

class ProcessRunner : public CommandRunner {
public:
    ProcessRunner() = default;
    ~ProcessRunner() override = default;

    CommandResult run(const Command& command) override;

private:
    static void terminate(int pid);
};
