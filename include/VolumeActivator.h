#ifndef VOLUME_ACTIVATOR_H
#define VOLUME_ACTIVATOR_H

#include "CommandRunner.h"
#include "DeviceResolver.h"
#include "ResourceStack.h"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

struct LogicalVolume {
    std::string vg_name;
    std::string lv_name;
    std::string path;
    uint64_t size_bytes = 0;
};

/**
 * @class VolumeActivator
 * @brief Activates LVM volume groups and picks the logical volume that
 * most likely holds the root filesystem.
 */
class VolumeActivator {
public:
    explicit VolumeActivator(CommandRunner& runner);

    /**
     * @brief Rescans physical volumes and activates every volume group found.
     *
     * Groups that had no active volume before the call are pushed onto stack
     * as soon as they activate; groups the host already had active are
     * activated but never recorded, so teardown leaves them alone. Groups
     * that fail to activate are logged and skipped.
     * @return Activated group names in scan order.
     */
    std::vector<std::string> scan_and_activate(ResourceStack& stack);

    // Logical volumes of the given groups, ordered as the groups are.
    std::vector<LogicalVolume> list_logical_volumes(const std::vector<std::string>& vg_names);

    bool deactivate(const std::string& vg_name);

    /**
     * @brief Chooses the root device.
     *
     * Priority: an LV named like root/ubuntu/system, then the largest LV
     * (ties go to the earlier entry, i.e. the first-activated group), then
     * the largest partition with a Linux-native filesystem.
     * @throws NoRootCandidateError when nothing qualifies.
     */
    static std::string select_root_candidate(const std::vector<LogicalVolume>& volumes,
                                             const std::vector<DeviceInfo>& partitions);

    static std::vector<LogicalVolume> parse_lvs_json(const std::string& json_text);

    // Groups with at least one active volume in `lvs -o vg_name,lv_active` JSON.
    static std::set<std::string> parse_active_groups(const std::string& json_text);

private:
    CommandRunner& runner_;
};

#endif // VOLUME_ACTIVATOR_H
