#include "SessionLauncher.h"
#include "Errors.h"
#include "Logger.h"
#include "Privileges.h"
#include "Signals.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr int kMaxSymlinkHops = 40;

const char* const kShellCandidates[] = {"/bin/bash", "/usr/bin/bash", "/bin/zsh",
                                        "/usr/bin/zsh", "/bin/sh", "/usr/bin/sh"};

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream stream(path);
    std::string part;
    while (std::getline(stream, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::string join_path(const std::vector<std::string>& parts) {
    std::string path;
    for (const auto& part : parts) {
        path += "/" + part;
    }
    return path.empty() ? "/" : path;
}

std::string host_path(const std::string& root, const std::string& inside) {
    std::string base = root;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }
    return inside == "/" ? base : base + inside;
}

bool is_executable_file(const std::string& path) {
    struct stat st {};
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && (st.st_mode & 0111) != 0;
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = getenv(name);
    return value != nullptr && *value != '\0' ? value : fallback;
}

} // namespace

SessionLauncher::SessionLauncher(ShellExecutor& executor) : executor_(executor) {}

std::optional<std::string> SessionLauncher::resolve_in_root(const std::string& root, const std::string& path) {
    std::deque<std::string> pending;
    for (auto& part : split_path(path)) {
        pending.push_back(part);
    }
    std::vector<std::string> resolved;
    int hops = 0;

    while (!pending.empty()) {
        std::string part = pending.front();
        pending.pop_front();
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!resolved.empty()) {
                resolved.pop_back();
            }
            continue;
        }
        resolved.push_back(part);

        const std::string current = host_path(root, join_path(resolved));
        struct stat st {};
        if (lstat(current.c_str(), &st) != 0) {
            return std::nullopt;
        }
        if (!S_ISLNK(st.st_mode)) {
            continue;
        }
        if (++hops > kMaxSymlinkHops) {
            CHROOT_LOG_WARN("[Launcher] Too many symlinks resolving {}", path);
            return std::nullopt;
        }
        std::error_code ec;
        const std::string target = fs::read_symlink(current, ec).string();
        if (ec || target.empty()) {
            return std::nullopt;
        }
        resolved.pop_back();
        if (target.front() == '/') {
            resolved.clear();
        }
        std::vector<std::string> target_parts = split_path(target);
        pending.insert(pending.begin(), target_parts.begin(), target_parts.end());
    }
    return join_path(resolved);
}

std::string SessionLauncher::resolve_shell(const std::string& root, const std::string& preferred) {
    std::vector<std::string> candidates;
    if (!preferred.empty()) {
        candidates.push_back(preferred);
    }
    candidates.insert(candidates.end(), std::begin(kShellCandidates), std::end(kShellCandidates));

    for (const auto& candidate : candidates) {
        std::optional<std::string> resolved = resolve_in_root(root, candidate);
        if (!resolved) {
            CHROOT_LOG_DEBUG("[Launcher] Shell {} not present in {}", candidate, root);
            continue;
        }
        if (!is_executable_file(host_path(root, *resolved))) {
            CHROOT_LOG_DEBUG("[Launcher] {} resolves to {}, which is not executable", candidate, *resolved);
            continue;
        }
        if (!preferred.empty() && candidate != preferred) {
            CHROOT_LOG_WARN("[Launcher] Shell {} not found in chroot, using {}", preferred, candidate);
        }
        CHROOT_LOG_DEBUG("[Launcher] Using shell {} (resolves to {})", candidate, *resolved);
        return candidate;
    }
    throw ShellNotFoundError("No suitable shell found in " + root);
}

std::optional<UserAccount> SessionLauncher::lookup_user(const std::string& root, const std::string& name) {
    std::ifstream passwd(host_path(root, "/etc/passwd"));
    std::string line;
    while (std::getline(passwd, line)) {
        // name:password:uid:gid:gecos:home:shell
        std::vector<std::string> fields;
        std::istringstream stream(line);
        std::string field;
        while (std::getline(stream, field, ':')) {
            fields.push_back(field);
        }
        if (fields.size() < 6 || fields[0] != name) {
            continue;
        }
        UserAccount account;
        account.name = fields[0];
        try {
            account.uid = static_cast<uid_t>(std::stoul(fields[2]));
            account.gid = static_cast<gid_t>(std::stoul(fields[3]));
        } catch (const std::exception&) {
            CHROOT_LOG_WARN("[Launcher] Malformed passwd entry for {}", name);
            return std::nullopt;
        }
        account.home = fields[5];
        account.shell = fields.size() > 6 ? fields[6] : "";
        return account;
    }
    return std::nullopt;
}

std::vector<gid_t> SessionLauncher::lookup_groups(const std::string& root, const std::string& name,
                                                  gid_t primary_gid) {
    std::vector<gid_t> groups = {primary_gid};
    std::ifstream group_file(host_path(root, "/etc/group"));
    std::string line;
    while (std::getline(group_file, line)) {
        // name:password:gid:member,member
        std::vector<std::string> fields;
        std::istringstream stream(line);
        std::string field;
        while (std::getline(stream, field, ':')) {
            fields.push_back(field);
        }
        if (fields.size() < 4) {
            continue;
        }
        std::istringstream members(fields[3]);
        std::string member;
        bool listed = false;
        while (std::getline(members, member, ',')) {
            if (member == name) {
                listed = true;
                break;
            }
        }
        if (!listed) {
            continue;
        }
        gid_t gid = 0;
        try {
            gid = static_cast<gid_t>(std::stoul(fields[2]));
        } catch (const std::exception&) {
            CHROOT_LOG_WARN("[Launcher] Malformed group entry {}", fields[0]);
            continue;
        }
        if (std::find(groups.begin(), groups.end(), gid) == groups.end()) {
            groups.push_back(gid);
        }
    }
    return groups;
}

UserAccount SessionLauncher::prepare_user(const std::string& root, const std::string& name) {
    if (name.empty() || name == "root") {
        return UserAccount{};
    }

    std::optional<UserAccount> account = lookup_user(root, name);
    if (!account) {
        throw UserNotFoundInTargetError(name, "User " + name + " does not exist in the chroot's /etc/passwd");
    }
    if (account->home.empty()) {
        throw UserNotFoundInTargetError(name, "No home directory found for " + name + " in the chroot");
    }

    const std::string home = host_path(root, account->home);
    std::error_code ec;
    if (!fs::is_directory(home, ec)) {
        CHROOT_LOG_INFO("[Launcher] Creating home directory {} for {}", account->home, name);
        fs::create_directories(home, ec);
        if (ec) {
            throw UserNotFoundInTargetError(name, "Failed to create home directory " + account->home +
                                                      " for " + name + ": " + ec.message());
        }
        if (chown(home.c_str(), account->uid, account->gid) != 0) {
            CHROOT_LOG_WARN("[Launcher] Failed to set ownership of {}: {}", account->home, strerror(errno));
        }
    }
    account->groups = lookup_groups(root, name, account->gid);
    return *account;
}

std::vector<std::string> SessionLauncher::build_environment(const UserAccount& account, const std::string& shell,
                                                            const std::vector<std::string>& extra) {
    std::vector<std::string> env = {
        "HOME=" + account.home,
        "USER=" + account.name,
        "LOGNAME=" + account.name,
        "SHELL=" + shell,
        "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin",
        "TERM=" + env_or("TERM", "xterm"),
    };
    const std::string lang = env_or("LANG", "");
    if (!lang.empty()) {
        env.push_back("LANG=" + lang);
    }
    env.insert(env.end(), extra.begin(), extra.end());
    return env;
}

LaunchPlan SessionLauncher::plan(const SessionConfig& config) const {
    LaunchPlan plan;
    plan.root = config.root_mount;
    plan.shell = resolve_shell(config.root_mount, config.custom_shell);
    plan.account = prepare_user(config.root_mount, config.chroot_user);
    plan.environment = build_environment(plan.account, plan.shell, {});
    return plan;
}

int SessionLauncher::launch(const LaunchPlan& plan) {
    CHROOT_LOG_INFO("[Launcher] Entering chroot {} as {} with {}", plan.root, plan.account.name, plan.shell);
    int exit_code = executor_.execute(plan);
    CHROOT_LOG_INFO("[Launcher] Shell exited with status {}", exit_code);
    return exit_code;
}

int SessionLauncher::launch(const SessionConfig& config) {
    return launch(plan(config));
}

int ChrootShellExecutor::execute(const LaunchPlan& plan) {
    std::vector<std::string> argv_storage = {"-" + fs::path(plan.shell).filename().string()};
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (const auto& entry : plan.environment) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        CHROOT_LOG_ERROR("[Launcher] fork failed: {}", strerror(errno));
        return 1;
    }

    if (pid == 0) {
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGHUP, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);

        if (chroot(plan.root.c_str()) != 0 || chdir("/") != 0) {
            CHROOT_LOG_ERROR("[Launcher] chroot to {} failed: {}", plan.root, strerror(errno));
            _exit(126);
        }
        if (plan.account.uid != 0 &&
            !Privileges::UserSecurity::drop_to_user(plan.account.uid, plan.account.gid, plan.account.groups)) {
            _exit(126);
        }
        if (chdir(plan.account.home.c_str()) != 0 && chdir("/") != 0) {
            _exit(126);
        }
        execve(plan.shell.c_str(), argv.data(), envp.data());
        CHROOT_LOG_ERROR("[Launcher] Failed to execute {}: {}", plan.shell, strerror(errno));
        _exit(127);
    }

    int status = 0;
    while (true) {
        pid_t waited = waitpid(pid, &status, 0);
        if (waited == pid) {
            break;
        }
        if (waited == -1 && errno == EINTR) {
            int signal_number = SignalGuard::take();
            if (signal_number != 0) {
                CHROOT_LOG_INFO("[Launcher] Forwarding {} to the chroot shell", strsignal(signal_number));
                if (kill(pid, signal_number) != 0) {
                    CHROOT_LOG_WARN("[Launcher] Could not signal PID {}: {}", pid, strerror(errno));
                }
            }
            continue;
        }
        CHROOT_LOG_ERROR("[Launcher] waitpid failed: {}", strerror(errno));
        return 1;
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}
