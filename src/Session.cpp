#include "Session.h"
#include "Errors.h"
#include "Logger.h"
#include "Signals.h"
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

// EFI system partitions are small; larger FAT volumes are data partitions.
constexpr uint64_t kEfiSizeLimit = 1000ULL * 1024 * 1024;

const char* const kOptionalTools[] = {"fuser", "lsof", "lsblk", "btrfs"};

// Sorts one discovered block device into the layout's buckets.
void classify(const DeviceInfo& device, SourceLayout& layout, uint64_t& efi_size) {
    switch (device.kind) {
    case FilesystemKind::CryptoLuks:
        layout.encrypted.push_back(device.path);
        break;
    case FilesystemKind::LvmMember:
        layout.has_lvm_member = true;
        break;
    case FilesystemKind::Vfat:
        if (device.size_bytes > 0 && device.size_bytes < kEfiSizeLimit &&
            (layout.efi_candidate.empty() || device.size_bytes < efi_size)) {
            layout.efi_candidate = device.path;
            efi_size = device.size_bytes;
        }
        break;
    case FilesystemKind::Ext2:
    case FilesystemKind::Ext3:
    case FilesystemKind::Ext4:
    case FilesystemKind::Xfs:
    case FilesystemKind::Btrfs:
    case FilesystemKind::F2fs:
        layout.linux_partitions.push_back(device);
        break;
    case FilesystemKind::Ntfs:
    case FilesystemKind::Swap:
    case FilesystemKind::Unknown:
        CHROOT_LOG_DEBUG("[Session] Ignoring {} ({})", device.path,
                         device.fstype.empty() ? "unknown" : device.fstype);
        break;
    }
}

} // namespace

Session::Session(const SessionConfig& config, HostServices& host)
    : config_(config),
      host_(host),
      resolver_(host.runner),
      backing_(host.runner, config_.timings, host.backing_paths),
      encryption_(host.runner, resolver_, host.mapper_dir),
      volumes_(host.runner),
      mounts_(host.mounts, stack_, host.runner, config_.timings),
      gui_(host.runner, host.x11_socket_dir),
      teardown_(mounts_, host.reaper, volumes_, encryption_, backing_),
      state_(host.state_path),
      launcher_(host.shell) {
    teardown_.set_gui(&gui_);
}

Session::~Session() {
    try {
        finish();
    } catch (const std::exception& e) {
        CHROOT_LOG_ERROR("[Session] Teardown aborted: {}", e.what());
    }
}

void Session::checkpoint() {
    const int signal_number = SignalGuard::take();
    if (signal_number != 0) {
        throw InterruptedError(signal_number);
    }
}

void Session::update_state(const std::string& status) {
    if (!state_claimed_) {
        return;
    }
    SessionState state;
    state.pid = getpid();
    state.status = status;
    state.root_device = root_device_.empty() ? (config_.image_mode() ? config_.virtual_image : config_.root_device)
                                             : root_device_;
    state.root_mount = config_.root_mount;
    state.log_file = Logger::instance().log_path();
    for (const auto& handle : stack_.handles()) {
        state.resources.push_back(describe(handle));
    }
    if (!state_.save_state(state)) {
        CHROOT_LOG_DEBUG("[Session] State file {} not updated", state_.path());
    }
}

void Session::require_tools(const std::vector<std::string>& tools) {
    for (const auto& tool : tools) {
        if (!host_.runner.has_tool(tool)) {
            throw MissingToolError(tool);
        }
    }
}

void Session::check_requirements() {
    if (config_.image_mode()) {
        require_tools({"qemu-nbd", "modprobe", "partprobe"});
    }

    std::string missing;
    std::vector<std::string> optional(std::begin(kOptionalTools), std::end(kOptionalTools));
    if (config_.gui_enabled) {
        optional.push_back("xhost");
    }
    for (const auto& tool : optional) {
        if (!host_.runner.has_tool(tool)) {
            missing += (missing.empty() ? "" : ", ") + tool;
        }
    }
    if (!missing.empty()) {
        CHROOT_LOG_WARN("[Session] Optional tools not found: {}; some features will be degraded", missing);
    }
}

bool Session::validate_filesystem(const std::string& device, FilesystemKind kind, const std::string& role) {
    const bool is_root = role == "root";

    auto refuse = [&](const std::string& why) -> bool {
        if (is_root) {
            throw MountError(device, config_.root_mount, MountFailureReason::WrongFsType, why);
        }
        CHROOT_LOG_WARN("[Session] Skipping {} partition {}: {}", role, device, why);
        return false;
    };
    auto confirm = [&](const std::string& question) -> bool {
        if (config_.quiet) {
            CHROOT_LOG_WARN("[Session] {} (proceeding in quiet mode)", question);
            return true;
        }
        if (host_.prompter.confirm(question + " Mount it anyway?", false)) {
            return true;
        }
        return refuse("declined by operator");
    };

    switch (kind) {
    case FilesystemKind::Ext2:
    case FilesystemKind::Ext3:
    case FilesystemKind::Ext4:
    case FilesystemKind::Xfs:
    case FilesystemKind::Btrfs:
    case FilesystemKind::F2fs:
        CHROOT_LOG_DEBUG("[Session] {} has Linux filesystem {}", device, to_string(kind));
        return true;
    case FilesystemKind::Vfat:
        if (role == "EFI") {
            return true;
        }
        return confirm("FAT filesystem on " + device + " is unusual for a " + role + " partition.");
    case FilesystemKind::Ntfs:
        return refuse("NTFS cannot hold a Linux " + role + " filesystem");
    case FilesystemKind::Swap:
        return refuse("device is a swap area");
    case FilesystemKind::CryptoLuks:
        return refuse("device is still encrypted");
    case FilesystemKind::LvmMember:
        return refuse("device is an LVM physical volume, not a filesystem");
    case FilesystemKind::Unknown:
        return confirm("Could not determine the filesystem on " + device + ".");
    }
    return refuse("unsupported filesystem");
}

void Session::release_host_mount(const std::string& device) {
    const std::string mount_point = resolver_.find_mount_point(device);
    if (mount_point.empty()) {
        return;
    }
    CHROOT_LOG_WARN("[Session] Device {} is already mounted at {}", device, mount_point);
    if (config_.quiet) {
        CHROOT_LOG_WARN("[Session] Proceeding without unmounting {} (quiet mode)", mount_point);
        return;
    }
    if (!host_.prompter.confirm("The device " + device + " is mounted at " + mount_point +
                                    ". Unmount it before proceeding?", true)) {
        throw ChrootError("Unmount of " + mount_point + " cancelled by operator");
    }

    MountResult result = host_.mounts.unmount(mount_point, false);
    if (result.ok) {
        CHROOT_LOG_INFO("[Session] Unmounted {}", mount_point);
        return;
    }
    CHROOT_LOG_WARN("[Session] Normal unmount failed ({}), checking for processes", result.message);
    if (!host_.reaper.evict_users(mount_point)) {
        CHROOT_LOG_WARN("[Session] Could not terminate all processes using {}", mount_point);
    }
    result = host_.mounts.unmount(mount_point, false);
    if (result.ok) {
        CHROOT_LOG_INFO("[Session] Unmounted {}", mount_point);
        return;
    }
    if (host_.prompter.confirm("Unmount of " + mount_point + " failed. Try a lazy unmount?", false)) {
        result = host_.mounts.unmount(mount_point, true);
        if (result.ok) {
            CHROOT_LOG_INFO("[Session] Lazily unmounted {}", mount_point);
            return;
        }
    }
    throw MountError(device, mount_point, classify_mount_failure(result.message), result.message);
}

SourceLayout Session::inspect_physical() {
    const std::string& device = config_.root_device;
    std::error_code ec;
    if (!fs::exists(device, ec)) {
        throw DeviceNotFoundError(device);
    }
    release_host_mount(device);

    SourceLayout layout;
    const FilesystemKind kind = resolver_.detect_filesystem(device);
    switch (kind) {
    case FilesystemKind::CryptoLuks:
        CHROOT_LOG_INFO("[Session] {} is an encrypted volume", device);
        layout.encrypted.push_back(device);
        break;
    case FilesystemKind::LvmMember:
        CHROOT_LOG_INFO("[Session] {} is an LVM physical volume", device);
        layout.has_lvm_member = true;
        break;
    default:
        layout.root_device = device;
        layout.root_kind = kind;
        break;
    }
    return layout;
}

SourceLayout Session::inspect_image() {
    const std::string& image = config_.virtual_image;
    std::error_code ec;
    if (!fs::is_regular_file(image, ec)) {
        throw DeviceNotFoundError(image);
    }

    BackingStoreHandle handle = backing_.attach(image);
    stack_.push(handle);
    update_state("acquiring");
    checkpoint();

    SourceLayout layout;
    uint64_t efi_size = 0;
    std::vector<DeviceInfo> partitions = resolver_.list_partitions(handle.device_node);
    if (partitions.empty()) {
        CHROOT_LOG_INFO("[Session] No partition table on {}, using the whole device", handle.device_node);
        partitions.push_back(resolver_.describe(handle.device_node));
    }
    for (const auto& partition : partitions) {
        CHROOT_LOG_DEBUG("[Session] Found {} {} {}", partition.path, DeviceResolver::human_size(partition.size_bytes),
                         partition.fstype.empty() ? "unknown" : partition.fstype);
        classify(partition, layout, efi_size);
    }
    if (!layout.efi_candidate.empty()) {
        CHROOT_LOG_INFO("[Session] EFI partition candidate: {}", layout.efi_candidate);
    }
    return layout;
}

void Session::unlock_encrypted(SourceLayout& layout) {
    if (layout.encrypted.empty()) {
        return;
    }
    require_tools({"cryptsetup"});

    uint64_t unused_efi_size = 0;
    const std::vector<std::string> pending = layout.encrypted;
    for (const auto& partition : pending) {
        checkpoint();
        std::string passphrase;
        if (config_.luks_key_file.empty()) {
            if (config_.quiet) {
                CHROOT_LOG_WARN("[Session] Skipping encrypted partition {}: no key file in quiet mode", partition);
                continue;
            }
            auto secret = host_.prompter.ask_secret("Passphrase for " + partition + ": ");
            if (!secret) {
                CHROOT_LOG_WARN("[Session] No passphrase given, skipping {}", partition);
                continue;
            }
            passphrase = *secret;
        }

        std::string mapper_name;
        try {
            mapper_name = encryption_.open(partition, passphrase, config_.luks_key_file);
        } catch (const EncryptionError& e) {
            CHROOT_LOG_WARN("[Session] Skipping encrypted partition {}: {}", e.partition(), e.what());
            continue;
        }
        stack_.push(EncryptedVolumeHandle{partition, mapper_name});
        update_state("acquiring");

        // EFI partitions are never encrypted.
        DeviceInfo opened = resolver_.describe(encryption_.mapper_path(mapper_name));
        if (opened.kind != FilesystemKind::Vfat) {
            classify(opened, layout, unused_efi_size);
        }
    }
}

void Session::activate_volumes(SourceLayout& layout) {
    if (!layout.has_lvm_member) {
        return;
    }
    require_tools({"pvscan", "vgs", "vgchange", "lvs"});
    checkpoint();
    const std::vector<std::string> groups = volumes_.scan_and_activate(stack_);
    update_state("acquiring");
    layout.volumes = volumes_.list_logical_volumes(groups);
}

void Session::choose_root(SourceLayout& layout) {
    if (!layout.root_device.empty()) {
        return;
    }
    layout.root_device = VolumeActivator::select_root_candidate(layout.volumes, layout.linux_partitions);
    layout.root_kind = resolver_.detect_filesystem(layout.root_device);
    CHROOT_LOG_INFO("[Session] Selected root device {} ({})", layout.root_device,
                    layout.root_kind == FilesystemKind::Unknown ? "unknown" : to_string(layout.root_kind));
}

void Session::mount_tree(const SourceLayout& layout) {
    const std::string& root = config_.root_mount;

    validate_filesystem(layout.root_device, layout.root_kind, "root");
    root_device_ = layout.root_device;
    teardown_.set_chroot_root(root);
    mounts_.mount_root(layout.root_device, layout.root_kind, root);
    update_state("acquiring");
    checkpoint();

    if (!config_.boot_part.empty()) {
        const FilesystemKind kind = resolver_.detect_filesystem(config_.boot_part);
        if (validate_filesystem(config_.boot_part, kind, "boot") &&
            !mounts_.mount_companion(config_.boot_part, root, "boot")) {
            CHROOT_LOG_WARN("[Session] Continuing without boot partition {}", config_.boot_part);
        }
    }
    const std::string efi = config_.efi_part.empty() ? layout.efi_candidate : config_.efi_part;
    if (!efi.empty()) {
        const FilesystemKind kind = resolver_.detect_filesystem(efi);
        if (validate_filesystem(efi, kind, "EFI") && !mounts_.mount_companion(efi, root, "boot/efi")) {
            CHROOT_LOG_WARN("[Session] Continuing without EFI partition {}", efi);
        }
    }
    checkpoint();

    mounts_.prepare_directories(root);
    if (config_.copy_host_network_files) {
        mounts_.copy_network_files(root, host_.host_etc);
    }
    mounts_.mount_virtual_filesystems(root);
    update_state("acquiring");
    checkpoint();

    mounts_.mount_additional(root, config_.additional_mounts);
    checkpoint();
}

void Session::acquire() {
    CHROOT_LOG_INFO("[Session] Preparing chroot at {}", config_.root_mount);
    check_requirements();
    checkpoint();

    SourceLayout layout = config_.image_mode() ? inspect_image() : inspect_physical();
    unlock_encrypted(layout);
    activate_volumes(layout);
    choose_root(layout);
    checkpoint();

    mount_tree(layout);
    update_state("running");
    CHROOT_LOG_INFO("[Session] Acquired {} resource(s)", stack_.size());
}

LaunchPlan Session::prepare_launch() {
    LaunchPlan plan = launcher_.plan(config_);
    if (config_.gui_enabled) {
        if (gui_.setup(plan.root, plan.account, HostDisplay::capture())) {
            plan.environment = SessionLauncher::build_environment(plan.account, plan.shell, gui_.environment());
        } else {
            CHROOT_LOG_WARN("[Session] Continuing without GUI support");
        }
    }
    return plan;
}

void Session::print_banner(const LaunchPlan& plan) const {
    std::cout << "\n=== Chroot session ===\n"
              << "Source:      " << (config_.image_mode() ? config_.virtual_image : config_.root_device) << "\n"
              << "Root device: " << root_device_ << "\n"
              << "Mount point: " << plan.root << "\n"
              << "Shell:       " << plan.shell << "\n"
              << "User:        " << plan.account.name << "\n"
              << "GUI support: " << (gui_.active() ? "enabled (experimental)" : "disabled") << "\n"
              << "Log file:    " << Logger::instance().log_path() << "\n"
              << "Type 'exit' to leave the chroot and clean up.\n"
              << std::endl;
}

void Session::report_residual(const std::vector<std::string>& failures) const {
    if (failures.empty()) {
        return;
    }
    TeardownPartialFailure summary(failures);
    CHROOT_LOG_ERROR("[Session] {}", summary.what());
    for (const auto& failure : summary.failures()) {
        CHROOT_LOG_ERROR("[Session]   - {}", failure);
    }
}

std::vector<std::string> Session::finish() {
    if (teardown_.done()) {
        return teardown_failures_;
    }
    update_state("tearing_down");
    teardown_failures_ = teardown_.run(stack_);
    if (state_claimed_ && !state_.remove_state()) {
        CHROOT_LOG_WARN("[Session] Remove {} manually", state_.path());
    }
    state_claimed_ = false;
    return teardown_failures_;
}

int Session::run() {
    SessionState initial;
    initial.pid = getpid();
    initial.status = "acquiring";
    initial.root_device = config_.image_mode() ? config_.virtual_image : config_.root_device;
    initial.root_mount = config_.root_mount;
    initial.log_file = Logger::instance().log_path();
    if (!state_.acquire(initial)) {
        CHROOT_LOG_ERROR("[Session] Refusing to start while another session is active");
        return 1;
    }
    state_claimed_ = true;

    LaunchPlan plan;
    try {
        acquire();
        plan = prepare_launch();
    } catch (const MountError& e) {
        CHROOT_LOG_ERROR("[Session] {}", e.what());
        CHROOT_LOG_ERROR("[Session] Hint: {}", mount_failure_hint(e.reason()));
        report_residual(finish());
        return 1;
    } catch (const ChrootError& e) {
        CHROOT_LOG_ERROR("[Session] {}", e.what());
        report_residual(finish());
        return 1;
    } catch (const std::exception& e) {
        CHROOT_LOG_ERROR("[Session] Unexpected error: {}", e.what());
        report_residual(finish());
        return 1;
    }

    if (!config_.quiet) {
        print_banner(plan);
        if (host_.stdin_is_tty) {
            host_.prompter.pause("Press Enter to enter the chroot...");
        }
    }
    launcher_.launch(plan);

    const int signal_number = SignalGuard::take();
    if (signal_number != 0) {
        CHROOT_LOG_INFO("[Session] Session ended by signal {}", signal_number);
    }

    const std::vector<std::string> failures = finish();
    if (!failures.empty()) {
        report_residual(failures);
        return 2;
    }
    CHROOT_LOG_INFO("[Session] Session finished cleanly");
    return 0;
}
