#pragma once

#include <atomic>
#include <map>
#include <string>
#include <vector>

namespace allpair::core::process {

struct LaunchSpec {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;
    std::string stdout_path;
    // Empty: stderr shares the stdout file.
    std::string stderr_path;
    std::string working_dir;
};

// One child process running in its own process group so that signals reach the
// whole tree (mpirun and everything it forked). Output goes to files, never to
// pipes, so a chatty workload cannot block on a full pipe.
class JobProcess {
public:
    JobProcess();
    ~JobProcess();

    JobProcess(const JobProcess&) = delete;
    JobProcess& operator=(const JobProcess&) = delete;

    bool Start(const LaunchSpec& spec, std::string* error);
    bool IsRunning();

    // Returns true once the child has exited. timeout_ms < 0 waits forever.
    // Returns false early when *abort becomes true.
    bool WaitForExit(int timeout_ms, const std::atomic<bool>* abort = nullptr);

    // Terminate() and Kill() signal the whole process group, including members
    // left behind after the leader exited.
    bool Terminate();
    bool Kill();

    // SIGTERM to the group, then SIGKILL to whatever is left of it once
    // grace_ms has passed. Returns false when SIGKILL was needed.
    bool StopGroup(int grace_ms);
    bool GroupAlive() const;

    int ExitCode() const { return exit_code_; }
    int TermSignal() const { return term_signal_; }
    int pid() const { return pid_; }

private:
    bool Reap(bool block);
    bool SignalGroup(int signal_number);

    int pid_ = -1;
    bool running_ = false;
    int exit_code_ = 0;
    int term_signal_ = 0;
};

}  // namespace allpair::core::process
