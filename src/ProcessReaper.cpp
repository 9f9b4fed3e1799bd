#include "ProcessReaper.h"
#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

ProcessReaper::ProcessReaper(CommandRunner& runner, const Timings& timings, std::string proc_root)
    : runner_(runner), timings_(timings), proc_root_(std::move(proc_root)) {}

std::vector<pid_t> ProcessReaper::parse_pid_list(const std::string& text) {
    std::vector<pid_t> pids;
    std::istringstream tokens(text);
    std::string token;
    while (tokens >> token) {
        // fuser appends access letters such as "c" or "m" to each pid.
        size_t digits = 0;
        while (digits < token.size() && std::isdigit(static_cast<unsigned char>(token[digits]))) {
            ++digits;
        }
        if (digits == 0) {
            continue;
        }
        try {
            pids.push_back(static_cast<pid_t>(std::stol(token.substr(0, digits))));
        } catch (const std::out_of_range&) {
            continue;
        }
    }
    return pids;
}

bool ProcessReaper::is_alive(pid_t pid) {
    return kill(pid, 0) == 0 || errno == EPERM;
}

bool ProcessReaper::send_signal(pid_t pid, int signal_number) {
    return kill(pid, signal_number) == 0;
}

std::string ProcessReaper::command_name(pid_t pid) {
    std::ifstream comm(proc_root_ + "/" + std::to_string(pid) + "/comm");
    std::string name;
    if (!std::getline(comm, name) || name.empty()) {
        return "unknown";
    }
    return name;
}

std::vector<ProcessRef> ProcessReaper::find_users(const std::string& path) {
    CHROOT_LOG_DEBUG("[Reaper] Finding processes using {}", path);
    const pid_t self = getpid();
    std::vector<ProcessRef> processes;
    auto add = [&](pid_t pid, const char* source) {
        if (pid <= 0 || pid == self || !is_alive(pid)) {
            return;
        }
        for (const auto& known : processes) {
            if (known.pid == pid) {
                return;
            }
        }
        ProcessRef ref{pid, command_name(pid)};
        CHROOT_LOG_DEBUG("[Reaper] {} reports PID {} ({}) using {}", source, pid, ref.command, path);
        processes.push_back(ref);
    };

    bool any_tool = false;
    if (runner_.has_tool("fuser")) {
        any_tool = true;
        // fuser exits 1 when nothing uses the path; the pid list is still valid.
        CommandResult result = runner_.run({"fuser", "-m", path});
        for (pid_t pid : parse_pid_list(result.out)) {
            add(pid, "fuser");
        }
    }
    if (runner_.has_tool("lsof")) {
        any_tool = true;
        CommandResult result = runner_.run({"lsof", "-t", "+D", path});
        for (pid_t pid : parse_pid_list(result.out)) {
            add(pid, "lsof");
        }
    }
    if (!any_tool) {
        CHROOT_LOG_WARN("[Reaper] Neither fuser nor lsof is available; cannot check {}", path);
    }
    return processes;
}

std::vector<ProcessRef> ProcessReaper::find_chroot_processes(const std::string& root) {
    std::error_code ec;
    std::string chroot_path = fs::weakly_canonical(root, ec).string();
    if (ec || chroot_path.empty()) {
        chroot_path = root;
    }
    while (chroot_path.size() > 1 && chroot_path.back() == '/') {
        chroot_path.pop_back();
    }
    CHROOT_LOG_DEBUG("[Reaper] Finding processes chrooted to {}", chroot_path);

    std::vector<ProcessRef> processes;
    const pid_t self = getpid();
    fs::directory_iterator it(proc_root_, ec);
    if (ec) {
        CHROOT_LOG_WARN("[Reaper] Cannot read {}: {}", proc_root_, ec.message());
        return processes;
    }
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(),
                                         [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        std::error_code link_ec;
        const std::string proc_root = fs::read_symlink(entry.path() / "root", link_ec).string();
        if (link_ec) {
            continue;
        }
        if (proc_root != chroot_path && proc_root.rfind(chroot_path + "/", 0) != 0) {
            continue;
        }
        pid_t pid = static_cast<pid_t>(std::stol(name));
        if (pid == self) {
            continue;
        }
        ProcessRef ref{pid, command_name(pid)};
        CHROOT_LOG_DEBUG("[Reaper] Found chroot process: PID {} ({})", pid, ref.command);
        processes.push_back(ref);
    }
    std::sort(processes.begin(), processes.end(),
              [](const ProcessRef& a, const ProcessRef& b) { return a.pid < b.pid; });
    return processes;
}

bool ProcessReaper::terminate(const std::vector<ProcessRef>& processes, const std::string& scope) {
    bool success = true;
    for (const auto& process : processes) {
        if (!is_alive(process.pid)) {
            continue;
        }
        CHROOT_LOG_INFO("[Reaper] Sending SIGTERM to {} process {} ({})", scope, process.pid, process.command);
        if (!send_signal(process.pid, SIGTERM)) {
            CHROOT_LOG_WARN("[Reaper] Failed to send SIGTERM to process {}", process.pid);
            success = false;
        }
    }

    std::this_thread::sleep_for(timings_.eviction_grace);

    for (const auto& process : processes) {
        if (!is_alive(process.pid)) {
            CHROOT_LOG_DEBUG("[Reaper] Process {} ({}) terminated gracefully", process.pid, process.command);
            continue;
        }
        CHROOT_LOG_WARN("[Reaper] Process {} ({}) still running, sending SIGKILL", process.pid, process.command);
        if (!send_signal(process.pid, SIGKILL)) {
            CHROOT_LOG_ERROR("[Reaper] Failed to kill process {}", process.pid);
            success = false;
        }
    }

    std::this_thread::sleep_for(timings_.eviction_settle);
    return success;
}

bool ProcessReaper::evict_users(const std::string& path) {
    std::vector<ProcessRef> processes = find_users(path);
    if (processes.empty()) {
        CHROOT_LOG_DEBUG("[Reaper] No processes found using {}", path);
        return true;
    }
    CHROOT_LOG_INFO("[Reaper] Found {} process(es) using {}", processes.size(), path);
    if (!terminate(processes, "mount user")) {
        CHROOT_LOG_ERROR("[Reaper] Some processes using {} could not be terminated", path);
        return false;
    }
    CHROOT_LOG_INFO("[Reaper] All processes using {} have been terminated", path);
    return true;
}

bool ProcessReaper::evict_chroot_processes(const std::string& root) {
    std::vector<ProcessRef> processes = find_chroot_processes(root);
    if (processes.empty()) {
        CHROOT_LOG_DEBUG("[Reaper] No chroot processes found");
        return true;
    }
    CHROOT_LOG_INFO("[Reaper] Found {} chroot process(es) to terminate", processes.size());
    if (!terminate(processes, "chroot")) {
        CHROOT_LOG_ERROR("[Reaper] Some chroot processes could not be terminated");
        return false;
    }
    CHROOT_LOG_INFO("[Reaper] All chroot processes terminated");
    return true;
}
