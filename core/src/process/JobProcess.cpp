#include "allpair/core/process/JobProcess.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace allpair::core::process {

namespace {

constexpr int kPollIntervalMs = 20;

std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string value(*entry);
        const size_t eq = value.find('=');
        const std::string key = eq == std::string::npos ? value : value.substr(0, eq);
        if (overrides.count(key) == 0) {
            env.push_back(value);
        }
    }
    for (const auto& item : overrides) {
        env.push_back(item.first + "=" + item.second);
    }
    return env;
}

std::vector<char*> ToCharArray(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& value : values) {
        out.push_back(const_cast<char*>(value.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

int OpenOutput(const std::string& path) {
    return open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
}

std::string ErrnoMessage(const std::string& what, const std::string& subject) {
    return what + " " + subject + ": " + std::strerror(errno);
}

}  // namespace

JobProcess::JobProcess() = default;

JobProcess::~JobProcess() {
    if (running_) {
        Kill();
        Reap(true);
    }
}

bool JobProcess::Start(const LaunchSpec& spec, std::string* error) {
    if (running_) {
        if (error) {
            *error = "process already running";
        }
        return false;
    }
    if (spec.argv.empty()) {
        if (error) {
            *error = "empty command";
        }
        return false;
    }

    const int stdout_fd = OpenOutput(spec.stdout_path);
    if (stdout_fd < 0) {
        if (error) {
            *error = ErrnoMessage("failed to open log", spec.stdout_path);
        }
        return false;
    }
    int stderr_fd = stdout_fd;
    if (!spec.stderr_path.empty()) {
        stderr_fd = OpenOutput(spec.stderr_path);
        if (stderr_fd < 0) {
            if (error) {
                *error = ErrnoMessage("failed to open log", spec.stderr_path);
            }
            close(stdout_fd);
            return false;
        }
    }
    const int stdin_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);

    // Everything the child touches is prepared before fork; only async-signal-safe
    // calls happen between fork and exec.
    std::vector<std::string> args = spec.argv;
    std::vector<std::string> env = BuildEnvironment(spec.env);
    std::vector<char*> argv = ToCharArray(args);
    std::vector<char*> envp = ToCharArray(env);
    const char* cwd = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

    const pid_t pid = fork();
    if (pid < 0) {
        if (error) {
            *error = ErrnoMessage("fork failed for", spec.argv.front());
        }
        close(stdout_fd);
        if (stderr_fd != stdout_fd) {
            close(stderr_fd);
        }
        if (stdin_fd >= 0) {
            close(stdin_fd);
        }
        return false;
    }

    if (pid == 0) {
        setpgid(0, 0);
        if (stdin_fd >= 0) {
            dup2(stdin_fd, STDIN_FILENO);
        }
        dup2(stdout_fd, STDOUT_FILENO);
        dup2(stderr_fd, STDERR_FILENO);
        if (cwd && chdir(cwd) != 0) {
            _exit(126);
        }
        execvpe(argv[0], argv.data(), envp.data());
        const char message[] = "[allpair] exec failed\n";
        const ssize_t ignored = write(STDERR_FILENO, message, sizeof(message) - 1);
        static_cast<void>(ignored);
        _exit(127);
    }

    // Mirror the child's setpgid so a signal sent right after Start() cannot
    // race the child and miss the group.
    setpgid(pid, pid);

    close(stdout_fd);
    if (stderr_fd != stdout_fd) {
        close(stderr_fd);
    }
    if (stdin_fd >= 0) {
        close(stdin_fd);
    }

    pid_ = pid;
    running_ = true;
    exit_code_ = 0;
    term_signal_ = 0;
    return true;
}

bool JobProcess::IsRunning() {
    if (running_) {
        Reap(false);
    }
    return running_;
}

bool JobProcess::WaitForExit(int timeout_ms, const std::atomic<bool>* abort) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (running_) {
        if (Reap(false)) {
            break;
        }
        if (abort && abort->load()) {
            return false;
        }
        if (timeout_ms >= 0 && std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }
    return true;
}

bool JobProcess::Terminate() {
    return SignalGroup(SIGTERM);
}

bool JobProcess::Kill() {
    return SignalGroup(SIGKILL);
}

bool JobProcess::StopGroup(int grace_ms) {
    if (pid_ <= 0) {
        return true;
    }
    SignalGroup(SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        Reap(false);
        if (!running_ && !GroupAlive()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }
    // The leader may already be gone while other members ignored SIGTERM.
    SignalGroup(SIGKILL);
    Reap(true);
    return false;
}

bool JobProcess::GroupAlive() const {
    if (pid_ <= 0) {
        return false;
    }
    if (kill(-pid_, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

// The group outlives its leader, so signals keep going to it after Reap().
bool JobProcess::SignalGroup(int signal_number) {
    if (pid_ <= 0) {
        return false;
    }
    if (kill(-pid_, signal_number) == 0) {
        return true;
    }
    if (!running_) {
        return false;
    }
    return kill(pid_, signal_number) == 0;
}

bool JobProcess::Reap(bool block) {
    if (!running_ || pid_ <= 0) {
        return true;
    }
    int status = 0;
    pid_t result = 0;
    do {
        result = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return false;
    }
    if (result < 0) {
        // ECHILD: somebody else reaped it; nothing more to learn.
        running_ = false;
        exit_code_ = -1;
        return true;
    }
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        term_signal_ = WTERMSIG(status);
        exit_code_ = 128 + term_signal_;
    }
    running_ = false;
    return true;
}

}  // namespace allpair::core::process
