#ifndef STATE_MANAGER_H
#define STATE_MANAGER_H

#include <string>
#include <vector>
#include <unistd.h>
#include <optional>

// The running chroot session, as recorded in the state file.
struct SessionState {
    pid_t pid = 0;
    std::string status; // acquiring, running, tearing_down
    std::string root_device;
    std::string root_mount;
    std::string log_file;
    std::vector<std::string> resources;
};

class StateManager {
public:
    explicit StateManager(std::string state_path = "/tmp/chroot-tool.state.json");

    // Claims the state file for this process. Fails if a live session owns it;
    // a stale file left by a dead process is replaced.
    bool acquire(const SessionState& state);

    bool save_state(const SessionState& state);

    std::optional<SessionState> load_state();

    // Removes the state file if this process owns it.
    bool remove_state();

    const std::string& path() const { return state_path_; }

private:
    std::string state_path_;
    bool owned_ = false;
};

#endif // STATE_MANAGER_H
