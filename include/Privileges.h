#ifndef PRIVILEGES_H
#define PRIVILEGES_H

#include <string>
#include <sys/types.h>
#include <vector>

namespace Privileges {

// ============================================================================
// DATA STRUCTURES
// ============================================================================

// Capabilities the orchestrator needs in its effective set.
enum class Capability {
    SysChroot = 18, // CAP_SYS_CHROOT
    SysAdmin = 21,  // CAP_SYS_ADMIN
};

const char* to_string(Capability cap);

// ============================================================================
// HELPER CLASS DEFINITIONS
// ============================================================================

class CapabilityManager {
public:
    static bool has_capability(Capability cap);

    // Every required capability absent from the effective set.
    static std::vector<Capability> missing_required();
};

class UserSecurity {
public:
    // Sets the supplementary groups (none if empty), then switches gid and uid.
    static bool drop_to_user(uid_t uid, gid_t gid, const std::vector<gid_t>& groups);
};

} // namespace Privileges

#endif // PRIVILEGES_H
