#include "InteractiveSetup.h"
#include "ConfigParser.h"
#include "Logger.h"
#include <filesystem>
#include <utility>

InteractiveSetup::InteractiveSetup(Prompter& prompter, DeviceResolver& resolver, std::string efi_firmware_dir)
    : prompter_(prompter), resolver_(resolver), efi_firmware_dir_(std::move(efi_firmware_dir)) {}

std::optional<std::string> InteractiveSetup::select_device(const std::string& role, bool allow_skip) {
    const std::vector<DeviceInfo> devices = resolver_.list_candidate_devices();
    if (devices.empty()) {
        CHROOT_LOG_ERROR("[Setup] No devices found for selection");
        return std::nullopt;
    }

    std::vector<std::string> options;
    for (const auto& device : devices) {
        std::string label = device.path + "  " + DeviceResolver::human_size(device.size_bytes) + " " +
                            (device.fstype.empty() ? "unknown" : device.fstype);
        if (!device.mount_point.empty()) {
            label += " (" + device.mount_point + ")";
        }
        options.push_back(label);
    }
    if (allow_skip) {
        options.push_back("None - skip this mount");
    }

    auto choice = prompter_.choose("Select " + role + " device:", options);
    if (!choice || *choice >= devices.size()) {
        return std::nullopt;
    }
    CHROOT_LOG_DEBUG("[Setup] Selected {} device {}", role, devices[*choice].path);
    return devices[*choice].path;
}

bool InteractiveSetup::run(SessionConfig& config, const std::string& default_user) {
    auto type = prompter_.choose("Select the type of chroot environment:",
                                 {"Physical disk/partition chroot", "Virtual disk image chroot"});
    if (!type) {
        CHROOT_LOG_ERROR("[Setup] No chroot type selected or operation cancelled");
        return false;
    }

    if (*type == 1) {
        config.virtual_image = prompter_.ask("Path to the disk image", config.virtual_image);
        if (config.virtual_image.empty()) {
            CHROOT_LOG_ERROR("[Setup] No disk image specified");
            return false;
        }
        config.root_device.clear();
    } else {
        auto root = select_device("Root", false);
        if (!root) {
            CHROOT_LOG_ERROR("[Setup] No root device selected or operation cancelled");
            return false;
        }
        config.root_device = *root;
        config.virtual_image.clear();
    }

    config.root_mount = prompter_.ask("Enter root mount directory", config.root_mount);
    if (config.root_mount.empty()) {
        CHROOT_LOG_ERROR("[Setup] Empty mount point specified");
        return false;
    }

    // Companion partitions of an image are detected after attaching it.
    if (!config.image_mode()) {
        std::error_code ec;
        if (std::filesystem::is_directory(efi_firmware_dir_, ec) &&
            prompter_.confirm("UEFI system detected. Mount EFI partition?", true)) {
            config.efi_part = select_device("EFI", true).value_or("");
        }
        if (prompter_.confirm("Mount a separate boot partition?", false)) {
            config.boot_part = select_device("Boot", true).value_or("");
        }
    }

    config.gui_enabled =
        prompter_.confirm("Do you need to run graphical applications (X11) inside the chroot?", false);
    const std::string user = prompter_.ask("User to run the shell as inside the chroot",
                                           config.chroot_user.empty() ? default_user : config.chroot_user);
    config.chroot_user = user.empty() ? "root" : user;

    while (prompter_.confirm("Configure an additional mount point?", false)) {
        const std::string entry = prompter_.ask("Enter source:mountpoint[:options] (e.g. /dev/sda1:/home)", "");
        if (entry.empty()) break;
        auto spec = ConfigParser::parse_mount_spec(entry);
        if (!spec) {
            CHROOT_LOG_WARN("[Setup] Invalid mount specification: {}", entry);
            continue;
        }
        config.additional_mounts.push_back(*spec);
    }
    return true;
}
