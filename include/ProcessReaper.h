#ifndef PROCESS_REAPER_H
#define PROCESS_REAPER_H

#include "CommandRunner.h"
#include "Config.h"
#include <string>
#include <sys/types.h>
#include <vector>

struct ProcessRef {
    pid_t pid = 0;
    std::string command;
};

/**
 * @class ProcessReaper
 * @brief Finds and terminates processes that keep a mount busy.
 *
 * Termination is always SIGTERM, a grace period, then SIGKILL for
 * whatever survived. The calling process is never a target.
 */
class ProcessReaper {
public:
    ProcessReaper(CommandRunner& runner, const Timings& timings, std::string proc_root = "/proc");
    virtual ~ProcessReaper() = default;

    // Processes with files open under path, merged from fuser and lsof.
    std::vector<ProcessRef> find_users(const std::string& path);

    // Processes whose root directory is root or lies below it.
    std::vector<ProcessRef> find_chroot_processes(const std::string& root);

    virtual bool evict_users(const std::string& path);
    virtual bool evict_chroot_processes(const std::string& root);

    // Pids from fuser/lsof style output; access-mode suffixes are ignored.
    static std::vector<pid_t> parse_pid_list(const std::string& text);

protected:
    virtual bool is_alive(pid_t pid);
    virtual bool send_signal(pid_t pid, int signal_number);
    virtual std::string command_name(pid_t pid);

private:
    bool terminate(const std::vector<ProcessRef>& processes, const std::string& scope);

    CommandRunner& runner_;
    const Timings& timings_;
    std::string proc_root_;
};

#endif // PROCESS_REAPER_H
