#ifndef DEVICE_RESOLVER_H
#define DEVICE_RESOLVER_H

#include "CommandRunner.h"
#include "FilesystemKind.h"
#include <cstdint>
#include <string>
#include <vector>

struct DeviceInfo {
    std::string name;        // kernel name, e.g. "sda2"
    std::string path;        // device node, e.g. "/dev/sda2"
    std::string type;        // lsblk TYPE: disk, part, lvm, crypt, ...
    uint64_t size_bytes = 0;
    std::string fstype;      // raw type string as reported
    FilesystemKind kind = FilesystemKind::Unknown;
    std::string mount_point; // empty when not mounted
};

/**
 * @class DeviceResolver
 * @brief Enumerates block devices and classifies their filesystems.
 *
 * detect_filesystem() runs three layers and stops at the first one that
 * yields a known kind: the lsblk metadata query, a libblkid superblock
 * probe, then a raw signature sniff of the first 64 KiB.
 */
class DeviceResolver {
public:
    explicit DeviceResolver(CommandRunner& runner);
    virtual ~DeviceResolver() = default;

    // Partitions, logical volumes and open mappers, swap excluded.
    std::vector<DeviceInfo> list_candidate_devices();

    // Partitions of one whole-disk device, in table order.
    std::vector<DeviceInfo> list_partitions(const std::string& device);

    // One device without its children; kind falls back to detect_filesystem().
    DeviceInfo describe(const std::string& path);

    // Never fails; an undetectable filesystem comes back as Unknown.
    FilesystemKind detect_filesystem(const std::string& path);

    // Where the device is mounted on the host, or an empty string.
    std::string find_mount_point(const std::string& device);

    // Reads on-disk magic numbers directly from path.
    static FilesystemKind sniff_signature(const std::string& path);

    // Parses `lsblk -J -b` output; exposed for tests.
    static std::vector<DeviceInfo> parse_lsblk_json(const std::string& json_text);

    static std::string human_size(uint64_t bytes);

protected:
    virtual std::string query_metadata(const std::string& path);
    virtual std::string probe_attributes(const std::string& path);
    virtual FilesystemKind sniff_content(const std::string& path);

private:
    std::vector<DeviceInfo> run_lsblk(const std::vector<std::string>& extra_args);

    CommandRunner& runner_;
};

#endif // DEVICE_RESOLVER_H
