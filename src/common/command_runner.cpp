#include "common/command_runner.hpp"
#include "common/interrupt.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

CommandResult ProcessRunner::run(const Command& command) {
    Interrupt::checkpoint();

    CommandResult result;
    if (command.argv.empty()) {
        Logger::error("Refusing to run an empty command");
        result.exitCode = 127;
        return result;
    }

    Logger::debug("Running: " + utils::joinCommand(command.argv));

    const std::string inputPath = command.stdinPath.empty() ? "/dev/null" : command.stdinPath;
    int inFd = open(inputPath.c_str(), O_RDONLY | O_CLOEXEC);
    if (inFd < 0) {
        Logger::error("Failed to open " + inputPath + ": " + strerror(errno));
        result.exitCode = 126;
        return result;
    }

    int outFd = -1;
    int pipeFds[2] = {-1, -1};
    if (!command.stdoutPath.empty()) {
        outFd = open(command.stdoutPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (outFd < 0) {
            Logger::error("Failed to open " + command.stdoutPath + ": " + strerror(errno));
            close(inFd);
            result.exitCode = 126;
            return result;
        }
    } else if (pipe2(pipeFds, O_CLOEXEC) != 0) {
        Logger::error(std::string("Failed to create pipe: ") + strerror(errno));
        close(inFd);
        result.exitCode = 126;
        return result;
    }

    std::vector<char*> args;
    args.reserve(command.argv.size() + 1);
    for (const auto& arg : command.argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        Logger::error(std::string("fork failed: ") + strerror(errno));
        close(inFd);
        close(outFd >= 0 ? outFd : pipeFds[1]);
        if (pipeFds[0] >= 0) {
            close(pipeFds[0]);
        }
        result.exitCode = 126;
        return result;
    }

    if (pid == 0) {
        dup2(inFd, STDIN_FILENO);
        dup2(outFd >= 0 ? outFd : pipeFds[1], STDOUT_FILENO);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(inFd);
    if (outFd >= 0) {
        close(outFd);
    }
    if (pipeFds[1] >= 0) {
        close(pipeFds[1]);
    }

    if (pipeFds[0] >= 0) {
        char buffer[4096];
        for (;;) {
            if (Interrupt::requested()) {
                close(pipeFds[0]);
                terminate(pid);
                Interrupt::checkpoint();
            }

            pollfd pfd{pipeFds[0], POLLIN, 0};
            int ready = poll(&pfd, 1, 200);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                Logger::warning(std::string("poll failed: ") + strerror(errno));
                break;
            }
            if (ready == 0) {
                continue;
            }

            ssize_t count = read(pipeFds[0], buffer, sizeof(buffer));
            if (count < 0) {
                if (errno == EINTR) {
                    continue;
                }
                Logger::warning(std::string("read failed: ") + strerror(errno));
                break;
            }
            if (count == 0) {
                break;
            }
            result.output.append(buffer, static_cast<size_t>(count));
        }
        close(pipeFds[0]);
    }

    int status = 0;
    for (;;) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            Logger::error(std::string("waitpid failed: ") + strerror(errno));
            result.exitCode = 1;
            return result;
        }
        if (Interrupt::requested()) {
            terminate(pid);
            Interrupt::checkpoint();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    if (result.exitCode != 0) {
        Logger::debug(args[0] + std::string(" exited with status ") + std::to_string(result.exitCode));
    }
    return result;
}

void ProcessRunner::terminate(int pid) {
    kill(pid, SIGTERM);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}
