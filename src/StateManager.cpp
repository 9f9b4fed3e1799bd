#include "StateManager.h"
#include "Logger.h"
#include "nlohmann/json.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <signal.h>
#include <utility>

using json = nlohmann::json;

// Whether the session owner recorded in the state file still exists.
// kill(pid, 0) sends nothing; EPERM means the pid is taken by someone else's process.
static bool is_process_running(pid_t pid) {
    return pid > 0 && (kill(pid, 0) == 0 || errno == EPERM);
}

StateManager::StateManager(std::string state_path) : state_path_(std::move(state_path)) {}

bool StateManager::acquire(const SessionState& state) {
    if (auto existing = load_state()) {
        if (existing->pid != getpid() && is_process_running(existing->pid)) {
            CHROOT_LOG_ERROR("[State] Another session (PID {}) is active on {}; state file {}", existing->pid,
                             existing->root_mount, state_path_);
            return false;
        }
        CHROOT_LOG_INFO("[State] Removing stale state file left by PID {}", existing->pid);
        if (std::remove(state_path_.c_str()) != 0 && errno != ENOENT) {
            CHROOT_LOG_ERROR("[State] Cannot remove {}: {}", state_path_, strerror(errno));
            return false;
        }
    }
    owned_ = true;
    return save_state(state);
}

bool StateManager::save_state(const SessionState& state) {
    std::ofstream state_file(state_path_, std::ios::trunc);
    if (!state_file.is_open()) {
        CHROOT_LOG_WARN("[State] Cannot write {}", state_path_);
        return false;
    }

    json j;
    j["pid"] = state.pid;
    j["status"] = state.status;
    j["root_device"] = state.root_device;
    j["root_mount"] = state.root_mount;
    j["log_file"] = state.log_file;
    j["resources"] = state.resources;

    state_file << j.dump(4);
    return static_cast<bool>(state_file);
}

std::optional<SessionState> StateManager::load_state() {
    std::ifstream state_file(state_path_);
    if (!state_file.is_open()) {
        return std::nullopt; // No session recorded
    }

    try {
        json j = json::parse(state_file);
        SessionState state;
        state.pid = j.at("pid").get<pid_t>();
        state.status = j.value("status", "");
        state.root_device = j.value("root_device", "");
        state.root_mount = j.value("root_mount", "");
        state.log_file = j.value("log_file", "");
        if (j.contains("resources")) {
            state.resources = j["resources"].get<std::vector<std::string>>();
        }
        return state;
    } catch (json::exception& e) {
        CHROOT_LOG_WARN("[State] Error parsing {}: {}", state_path_, e.what());
        SessionState unreadable;
        return unreadable;
    }
}

bool StateManager::remove_state() {
    if (!owned_) {
        return true;
    }
    owned_ = false;
    if (std::remove(state_path_.c_str()) != 0 && errno != ENOENT) {
        CHROOT_LOG_WARN("[State] Cannot remove {}: {}", state_path_, strerror(errno));
        return false;
    }
    return true;
}
