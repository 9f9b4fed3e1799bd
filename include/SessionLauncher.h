#ifndef SESSION_LAUNCHER_H
#define SESSION_LAUNCHER_H

#include "Config.h"
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

// An account from the target root's /etc/passwd.
struct UserAccount {
    std::string name = "root";
    uid_t uid = 0;
    gid_t gid = 0;
    std::string home = "/root";
    std::string shell;
    std::vector<gid_t> groups; // primary gid first, then supplementary
};

struct LaunchPlan {
    std::string root;
    std::string shell; // path inside root
    UserAccount account;
    std::vector<std::string> environment; // KEY=value, complete
};

/**
 * @class ShellExecutor
 * @brief Runs the interactive process described by a LaunchPlan.
 */
class ShellExecutor {
public:
    virtual ~ShellExecutor() = default;

    // Blocks until the process exits. Returns its exit code, 128+N if it
    // died from signal N.
    virtual int execute(const LaunchPlan& plan) = 0;
};

// fork, chroot(2), drop privileges, execve a login shell, and wait.
// Signals recorded by SignalGuard while waiting are forwarded to the shell.
class ChrootShellExecutor : public ShellExecutor {
public:
    int execute(const LaunchPlan& plan) override;
};

class SessionLauncher {
public:
    explicit SessionLauncher(ShellExecutor& executor);

    /**
     * @brief Picks the shell to run inside root.
     *
     * preferred (if set) is tried first, then bash, zsh and sh in their /bin
     * and /usr/bin locations. Symlinks are followed relative to root.
     * @return The candidate path as seen inside root.
     * @throws ShellNotFoundError if no candidate is an executable file.
     */
    static std::string resolve_shell(const std::string& root, const std::string& preferred);

    // Resolves path inside root, following at most 40 symlinks. Absolute
    // link targets are taken relative to root, never the host.
    static std::optional<std::string> resolve_in_root(const std::string& root, const std::string& path);

    static std::optional<UserAccount> lookup_user(const std::string& root, const std::string& name);

    // Groups listing name as a member in root's /etc/group, after primary_gid.
    static std::vector<gid_t> lookup_groups(const std::string& root, const std::string& name, gid_t primary_gid);

    /**
     * @brief Validates the target user and makes sure its home exists.
     *
     * An empty name or "root" selects root. A missing home directory is
     * created inside root and chowned to the user.
     * @throws UserNotFoundInTargetError if the user or its home entry is missing.
     */
    static UserAccount prepare_user(const std::string& root, const std::string& name);

    // Environment for the session: login basics plus the extra entries.
    static std::vector<std::string> build_environment(const UserAccount& account, const std::string& shell,
                                                      const std::vector<std::string>& extra);

    LaunchPlan plan(const SessionConfig& config) const;

    int launch(const LaunchPlan& plan);
    int launch(const SessionConfig& config);

private:
    ShellExecutor& executor_;
};

#endif // SESSION_LAUNCHER_H
