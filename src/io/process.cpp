#include "io/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rehost::io {
namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kPollInterval{50};

std::string buildDisplayCommand(const std::string &command, const std::vector<std::string> &args) {
    std::ostringstream cmd;
    cmd << shellQuote(command);
    for (const auto &arg : args) {
        cmd << ' ' << shellQuote(arg);
    }
    return cmd.str();
}

bool validateWorkingDirectory(const std::filesystem::path &cwd, const rehost::Context &ctx) {
    if (cwd.empty()) {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::exists(cwd, ec) || !std::filesystem::is_directory(cwd, ec)) {
        ctx.error("Working directory does not exist: ", cwd.string());
        return false;
    }
    return true;
}

std::vector<char *> makeArgv(std::vector<std::string> &storage) {
    std::vector<char *> argv;
    argv.reserve(storage.size() + 1);
    for (auto &item : storage) {
        argv.push_back(const_cast<char *>(item.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

int decodeStatus(int status, const rehost::Context &ctx) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        ctx.warn("Process terminated by signal: ", WTERMSIG(status));
        return 128 + WTERMSIG(status);
    }
    ctx.error("Process ended abnormally");
    return -1;
}

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

// Polls until the child exits or the deadline passes. Returns true when reaped.
bool waitUntil(pid_t pid, Clock::time_point deadline, int &status, bool &failed) {
    for (;;) {
        const pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            return true;
        }
        if (done < 0 && errno != EINTR) {
            failed = true;
            return false;
        }
        if (Clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

} // namespace

std::string shellQuote(const std::string &value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const rehost::Context &ctx
) {
    ProcessResult result;
    result.commandLine = buildDisplayCommand(command, args);

    if (!cwd.empty()) {
        ctx.debug("cwd: ", cwd.string());
    }
    ctx.debug(result.commandLine);

    if (!validateWorkingDirectory(cwd, ctx)) {
        result.code = -1;
        return result;
    }

    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv = makeArgv(storage);

    const auto start = Clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        result.code = -1;
        ctx.error("Failed to fork process: ", std::strerror(errno));
        return result;
    }

    if (pid == 0) {
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(127);
        }
        execvp(command.c_str(), argv.data());
        _exit(127);
    }

    result.processId = static_cast<long long>(pid);
    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    result.durationSeconds = secondsSince(start);
    if (waited < 0) {
        result.code = -1;
        ctx.error("Failed to wait for process: ", std::strerror(errno));
        return result;
    }

    result.code = decodeStatus(status, ctx);
    return result;
}

ProcessResult runBoundedCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const ProcessLimits &limits,
    const rehost::Context &ctx
) {
    ProcessResult result;
    result.commandLine = buildDisplayCommand(command, args);

    if (!cwd.empty()) {
        ctx.log("cwd: ", cwd.string());
    }
    ctx.log(result.commandLine);

    if (!validateWorkingDirectory(cwd, ctx)) {
        result.code = -1;
        return result;
    }

    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv = makeArgv(storage);

    const std::string logPath = limits.logFile.string();
    const auto start = Clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        result.code = -1;
        ctx.error("Failed to fork process: ", std::strerror(errno));
        return result;
    }

    if (pid == 0) {
        setpgid(0, 0);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(127);
        }
        if (!logPath.empty()) {
            const int fd = open(logPath.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd < 0) {
                _exit(127);
            }
            dup2(fd, STDOUT_FILENO);
            dup2(fd, STDERR_FILENO);
            if (fd > STDERR_FILENO) {
                close(fd);
            }
        }
        execvp(command.c_str(), argv.data());
        _exit(127);
    }

    // Both sides call setpgid so the group exists before any kill below.
    setpgid(pid, pid);
    result.processId = static_cast<long long>(pid);

    const auto deadline = limits.timeout.count() > 0
                              ? start + limits.timeout
                              : Clock::time_point::max();
    int status = 0;
    bool failed = false;
    if (waitUntil(pid, deadline, status, failed)) {
        result.durationSeconds = secondsSince(start);
        result.code = decodeStatus(status, ctx);
        return result;
    }
    if (failed) {
        result.durationSeconds = secondsSince(start);
        result.code = -1;
        ctx.error("Failed to wait for process: ", std::strerror(errno));
        return result;
    }

    result.timedOut = true;
    ctx.error("Process exceeded timeout of ", limits.timeout.count(), " ms, terminating group ", pid);
    kill(-pid, SIGTERM);
    if (!waitUntil(pid, Clock::now() + limits.killGrace, status, failed) && !failed) {
        ctx.warn("Process group ", pid, " ignored SIGTERM, sending SIGKILL");
        kill(-pid, SIGKILL);
        pid_t waited = -1;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);
    }

    result.durationSeconds = secondsSince(start);
    result.code = -1;
    return result;
}

bool isCommandAvailable(const std::string &command) {
    if (command.find('/') != std::string::npos) {
        return access(command.c_str(), X_OK) == 0;
    }
    const char *pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return false;
    }
    std::istringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const std::filesystem::path candidate = std::filesystem::path(dir) / command;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace rehost::io
