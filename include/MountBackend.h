#ifndef MOUNT_BACKEND_H
#define MOUNT_BACKEND_H

#include <string>
#include <vector>

struct MountResult {
    bool ok = false;
    int error_number = 0;
    std::string message;
};

/**
 * @class MountBackend
 * @brief Thin layer over the kernel mount table.
 */
class MountBackend {
public:
    virtual ~MountBackend() = default;

    /**
     * @brief Mounts source on target.
     * @param fstype Filesystem type, "bind" for a bind mount, or empty to probe.
     * @param options Comma separated mount(8)-style options.
     */
    virtual MountResult mount(const std::string& source, const std::string& target,
                              const std::string& fstype, const std::string& options) = 0;

    // Detaches target; lazy requests MNT_DETACH.
    virtual MountResult unmount(const std::string& target, bool lazy) = 0;

    virtual bool is_mounted(const std::string& target) = 0;
};

// mount(2)/umount2(2) with /proc/self/mountinfo as the source of truth.
class SyscallMountBackend : public MountBackend {
public:
    explicit SyscallMountBackend(std::string mountinfo_path = "/proc/self/mountinfo",
                                 std::string filesystems_path = "/proc/filesystems");

    MountResult mount(const std::string& source, const std::string& target,
                      const std::string& fstype, const std::string& options) override;
    MountResult unmount(const std::string& target, bool lazy) override;
    bool is_mounted(const std::string& target) override;

private:
    std::vector<std::string> block_filesystems() const;

    std::string mountinfo_path_;
    std::string filesystems_path_;
};

struct ParsedMountOptions {
    unsigned long flags = 0;
    std::string data;
    bool bind = false;
};

// Splits "ro,nosuid,subvol=@" into MS_* flags and the filesystem data string.
ParsedMountOptions parse_mount_options(const std::string& options);

// Mount points listed in a mountinfo file, with octal escapes decoded.
std::vector<std::string> read_mount_points(const std::string& mountinfo_path);

#endif // MOUNT_BACKEND_H
