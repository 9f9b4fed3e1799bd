#ifndef MOUNT_STACK_H
#define MOUNT_STACK_H

#include "CommandRunner.h"
#include "Config.h"
#include "FilesystemKind.h"
#include "MountBackend.h"
#include "ResourceStack.h"
#include <string>
#include <vector>

/**
 * @class MountStack
 * @brief Builds the mount tree of a chroot session.
 *
 * Every mount that succeeds is pushed onto the session's ResourceStack
 * straight away, so the teardown walk sees real kernel state even when a
 * later mount throws.
 */
class MountStack {
public:
    MountStack(MountBackend& backend, ResourceStack& stack, CommandRunner& runner, const Timings& timings);

    /**
     * @brief Mounts spec.source on spec.target, retrying on failure.
     *
     * The target directory is created first. A target that is already a
     * mount point is left alone and not recorded.
     * @return false if an optional mount failed.
     * @throws MountError if a required mount failed after every retry.
     */
    bool mount(const MountSpec& spec, MountKind kind);

    /**
     * @brief Mounts the root filesystem on root.
     *
     * Btrfs volumes are probed for a root subvolume first. The mounted tree
     * must contain etc/ and bin/ or usr/bin/.
     * @throws MountError when the mount fails or the layout check does not pass.
     */
    void mount_root(const std::string& device, FilesystemKind kind, const std::string& root);

    // Optional boot or EFI volume at root/relative_target, e.g. "boot/efi".
    bool mount_companion(const std::string& device, const std::string& root,
                         const std::string& relative_target);

    void mount_virtual_filesystems(const std::string& root);

    // Extra mounts whose targets are relative to root, in declared order.
    void mount_additional(const std::string& root, const std::vector<MountSpec>& specs);

    // Creates proc, sys, dev, dev/pts, run, tmp and var/tmp under root.
    void prepare_directories(const std::string& root);

    // Copies resolv.conf and hosts from host_etc into root/etc.
    void copy_network_files(const std::string& root, const std::string& host_etc = "/etc");

    // Unmounts with retries, falling back to a lazy detach.
    bool unmount(const MountHandle& handle);

    bool is_mounted(const std::string& path) { return backend_.is_mounted(path); }

    // The fixed proc/sys/dev/devpts/run/tmp set, in mount order.
    static std::vector<MountSpec> virtual_filesystems(const std::string& root);

    static bool has_root_layout(const std::string& root);

    // Subvolume paths from `btrfs subvolume list` output.
    static std::vector<std::string> parse_subvolume_list(const std::string& output);

    static std::string join(const std::string& root, const std::string& relative);

private:
    bool mount_btrfs_root(const std::string& device, const std::string& root);
    std::vector<std::string> probe_subvolumes(const std::string& device);

    MountBackend& backend_;
    ResourceStack& stack_;
    CommandRunner& runner_;
    const Timings& timings_;
};

#endif // MOUNT_STACK_H
