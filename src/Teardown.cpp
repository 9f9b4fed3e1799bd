#include "Teardown.h"
#include "Logger.h"

Teardown::Teardown(MountStack& mounts, ProcessReaper& reaper, VolumeActivator& volumes,
                   EncryptionLayer& encryption, BackingStore& backing)
    : mounts_(mounts), reaper_(reaper), volumes_(volumes), encryption_(encryption), backing_(backing) {}

std::string Teardown::release(const ResourceHandle& handle) {
    return std::visit(
        Overloaded{
            [this](const MountHandle& mount) -> std::string {
                // A vanished mount point would make fuser report the host filesystem.
                if (!mounts_.is_mounted(mount.path)) {
                    CHROOT_LOG_DEBUG("[Teardown] {} is no longer mounted, skipping", mount.path);
                    return "";
                }
                // Only device-backed mounts are evicted.
                if (mount.kind == MountKind::Filesystem) {
                    CHROOT_LOG_INFO("[Teardown] Unmounting physical filesystem: {}", mount.path);
                    if (!reaper_.evict_users(mount.path)) {
                        CHROOT_LOG_WARN("[Teardown] Could not terminate all processes for {}", mount.path);
                    }
                } else {
                    CHROOT_LOG_INFO("[Teardown] Unmounting {} mount: {}", to_string(mount.kind), mount.path);
                }
                if (!mounts_.unmount(mount)) {
                    return "could not unmount " + mount.path + "; try: umount -l " + mount.path;
                }
                return "";
            },
            [this](const VolumeGroupHandle& vg) -> std::string {
                if (!volumes_.deactivate(vg.name)) {
                    return "could not deactivate volume group " + vg.name + "; try: vgchange -an " + vg.name;
                }
                return "";
            },
            [this](const EncryptedVolumeHandle& volume) -> std::string {
                if (!encryption_.close(volume.mapper_name)) {
                    return "could not close encrypted volume " + volume.mapper_name +
                           "; try: cryptsetup luksClose " + volume.mapper_name;
                }
                return "";
            },
            [this](const BackingStoreHandle& store) -> std::string {
                if (!backing_.detach(store)) {
                    return "could not detach backing store node " + store.device_node +
                           "; try: qemu-nbd -d " + store.device_node;
                }
                return "";
            },
        },
        handle);
}

std::vector<std::string> Teardown::run(ResourceStack& stack) {
    std::vector<std::string> failures;
    if (done_) {
        CHROOT_LOG_DEBUG("[Teardown] Cleanup already performed");
        return failures;
    }
    done_ = true;

    if (stack.empty() && (gui_ == nullptr || !gui_->active())) {
        CHROOT_LOG_DEBUG("[Teardown] Nothing to clean up");
        return failures;
    }
    CHROOT_LOG_INFO("[Teardown] Releasing {} resource(s)", stack.size());

    if (gui_ != nullptr && gui_->active() && !gui_->revert()) {
        failures.push_back("GUI passthrough could not be fully reverted; check xhost and the copied .Xauthority");
    }

    if (!chroot_root_.empty() && !stack.mounts().empty()) {
        CHROOT_LOG_INFO("[Teardown] Terminating any lingering chroot processes");
        if (!reaper_.evict_chroot_processes(chroot_root_)) {
            CHROOT_LOG_WARN("[Teardown] Some chroot processes may persist, proceeding with caution");
        }
    }

    while (!stack.empty()) {
        ResourceHandle handle = stack.pop();
        CHROOT_LOG_DEBUG("[Teardown] Releasing {}", describe(handle));
        std::string failure = release(handle);
        if (!failure.empty()) {
            CHROOT_LOG_ERROR("[Teardown] {}", failure);
            failures.push_back(failure);
        }
    }

    if (failures.empty()) {
        CHROOT_LOG_INFO("[Teardown] Cleanup complete");
    } else {
        CHROOT_LOG_WARN("[Teardown] Cleanup finished with {} problem(s)", failures.size());
    }
    return failures;
}
