#include "Privileges.h"
#include "Logger.h"
#include <cerrno>
#include <cstring>
#include <grp.h>
#include <initializer_list>
#include <sys/capability.h>
#include <unistd.h>

namespace Privileges {

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

static void log_error(const std::string& msg) {
    CHROOT_LOG_ERROR("[Privileges] {}: {}", msg, strerror(errno));
}

const char* to_string(Capability cap) {
    switch (cap) {
    case Capability::SysChroot: return "CAP_SYS_CHROOT";
    case Capability::SysAdmin: return "CAP_SYS_ADMIN";
    }
    return "unknown capability";
}

// ============================================================================
// CapabilityManager Implementation
// ============================================================================

bool CapabilityManager::has_capability(Capability cap) {
    cap_t caps = cap_get_proc();
    if (!caps) { log_error("cap_get_proc failed"); return false; }

    cap_flag_value_t value = CAP_CLEAR;
    if (cap_get_flag(caps, static_cast<cap_value_t>(cap), CAP_EFFECTIVE, &value) != 0) {
        log_error("cap_get_flag failed");
        cap_free(caps);
        return false;
    }
    cap_free(caps);
    return value == CAP_SET;
}

std::vector<Capability> CapabilityManager::missing_required() {
    std::vector<Capability> missing;
    for (Capability cap : {Capability::SysAdmin, Capability::SysChroot}) {
        if (!has_capability(cap)) {
            missing.push_back(cap);
        }
    }
    return missing;
}

// ============================================================================
// UserSecurity Implementation
// ============================================================================

bool UserSecurity::drop_to_user(uid_t uid, gid_t gid, const std::vector<gid_t>& groups) {
    if (setgroups(groups.size(), groups.empty() ? nullptr : groups.data()) != 0) {
        log_error("Failed to set supplementary groups");
        return false;
    }
    if (setgid(gid) != 0) { log_error("Failed to setgid"); return false; }
    if (setuid(uid) != 0) { log_error("Failed to setuid"); return false; }
    return true;
}

} // namespace Privileges
