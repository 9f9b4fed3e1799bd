#include "MountStack.h"
#include "Errors.h"
#include "Logger.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <iterator>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

const char* const kStandardDirectories[] = {"proc", "sys", "dev", "dev/pts", "run", "tmp", "var/tmp"};
const char* const kRootSubvolumeNames[] = {"@", "@root", "root"};

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_bind_request(const MountSpec& spec) {
    if (spec.fstype == "bind") {
        return true;
    }
    std::istringstream options(spec.options);
    std::string option;
    while (std::getline(options, option, ',')) {
        if (option == "bind" || option == "rbind") {
            return true;
        }
    }
    return false;
}

} // namespace

MountStack::MountStack(MountBackend& backend, ResourceStack& stack, CommandRunner& runner,
                       const Timings& timings)
    : backend_(backend), stack_(stack), runner_(runner), timings_(timings) {}

std::string MountStack::join(const std::string& root, const std::string& relative) {
    std::string base = root;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }
    size_t start = 0;
    while (start < relative.size() && relative[start] == '/') {
        ++start;
    }
    if (start == relative.size()) {
        return base;
    }
    return (base == "/" ? "" : base) + "/" + relative.substr(start);
}

bool MountStack::has_root_layout(const std::string& root) {
    return is_directory(join(root, "etc")) &&
           (is_directory(join(root, "bin")) || is_directory(join(root, "usr/bin")));
}

std::vector<MountSpec> MountStack::virtual_filesystems(const std::string& root) {
    return {
        {"proc", join(root, "proc"), "proc", "", true},
        {"sysfs", join(root, "sys"), "sysfs", "", true},
        {"/dev", join(root, "dev"), "bind", "", true},
        {"devpts", join(root, "dev/pts"), "devpts", "ptmxmode=666,gid=5,mode=620", true},
        {"/run", join(root, "run"), "bind", "", false},
        {"/tmp", join(root, "tmp"), "bind", "", false},
    };
}

bool MountStack::mount(const MountSpec& spec, MountKind kind) {
    CHROOT_LOG_DEBUG("[MountStack] Mounting {} to {} (type '{}', options '{}')", spec.source, spec.target,
                     spec.fstype, spec.options);

    std::error_code ec;
    fs::create_directories(spec.target, ec);
    if (ec) {
        if (spec.required) {
            throw MountError(spec.source, spec.target, classify_mount_failure(ec.message()),
                             "cannot create mount point: " + ec.message());
        }
        CHROOT_LOG_WARN("[MountStack] Cannot create mount point {}: {}", spec.target, ec.message());
        return false;
    }

    if (backend_.is_mounted(spec.target)) {
        CHROOT_LOG_WARN("[MountStack] {} is already mounted", spec.target);
        return true;
    }

    MountResult result;
    const int attempts = std::max(1, timings_.mount_retries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        CHROOT_LOG_DEBUG("[MountStack] Mount attempt {}/{}", attempt, attempts);
        result = backend_.mount(spec.source, spec.target, spec.fstype, spec.options);
        if (result.ok) {
            stack_.push(MountHandle{spec.target, spec.source, kind});
            CHROOT_LOG_INFO("[MountStack] Mounted {} on {}", spec.source, spec.target);
            return true;
        }
        if (attempt < attempts) {
            CHROOT_LOG_DEBUG("[MountStack] Mount attempt {} failed ({}), retrying", attempt, result.message);
            std::this_thread::sleep_for(timings_.mount_retry_delay);
        }
    }

    const MountFailureReason reason = classify_mount_failure(result.message);
    if (spec.required) {
        throw MountError(spec.source, spec.target, reason, result.message);
    }
    CHROOT_LOG_WARN("[MountStack] Failed to mount {} on {} after {} attempts: {} ({})", spec.source,
                    spec.target, attempts, result.message, mount_failure_hint(reason));
    return false;
}

std::vector<std::string> MountStack::parse_subvolume_list(const std::string& output) {
    // ID 256 gen 35 top level 5 path @home
    std::vector<std::string> subvolumes;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        const size_t marker = line.find(" path ");
        if (marker == std::string::npos) {
            continue;
        }
        std::string path = line.substr(marker + 6);
        while (!path.empty() && (path.back() == ' ' || path.back() == '\r')) {
            path.pop_back();
        }
        if (!path.empty()) {
            subvolumes.push_back(path);
        }
    }
    return subvolumes;
}

std::vector<std::string> MountStack::probe_subvolumes(const std::string& device) {
    char scratch_template[] = "/tmp/chroot-tool-probe.XXXXXX";
    if (mkdtemp(scratch_template) == nullptr) {
        CHROOT_LOG_WARN("[MountStack] Cannot create a probe directory for {}", device);
        return {};
    }
    const std::string scratch = scratch_template;

    std::vector<std::string> subvolumes;
    MountResult probe = backend_.mount(device, scratch, "btrfs", "ro");
    if (!probe.ok) {
        CHROOT_LOG_WARN("[MountStack] Cannot mount {} for probing: {}", device, probe.message);
    } else {
        CommandResult list = runner_.run({"btrfs", "subvolume", "list", scratch});
        if (list.ok()) {
            subvolumes = parse_subvolume_list(list.out);
        } else {
            CHROOT_LOG_WARN("[MountStack] btrfs subvolume list failed: {}", list.err);
        }
        MountResult release = backend_.unmount(scratch, false);
        if (!release.ok) {
            CHROOT_LOG_WARN("[MountStack] Could not unmount probe {}: {}", scratch, release.message);
            if (!backend_.unmount(scratch, true).ok) {
                CHROOT_LOG_ERROR("[MountStack] Probe mount {} is still attached", scratch);
            }
        }
    }

    std::error_code ec;
    fs::remove(scratch, ec);
    return subvolumes;
}

bool MountStack::mount_btrfs_root(const std::string& device, const std::string& root) {
    CHROOT_LOG_INFO("[MountStack] Probing Btrfs partition {} for subvolumes", device);

    std::vector<std::string> candidates(std::begin(kRootSubvolumeNames), std::end(kRootSubvolumeNames));
    for (const auto& found : probe_subvolumes(device)) {
        candidates.push_back(found);
    }

    for (const auto& subvolume : candidates) {
        CHROOT_LOG_INFO("[MountStack] Trying Btrfs subvolume candidate: {}", subvolume);
        MountResult result = backend_.mount(device, root, "btrfs", "subvol=" + subvolume);
        if (!result.ok) {
            continue;
        }
        if (has_root_layout(root)) {
            stack_.push(MountHandle{root, device, MountKind::Filesystem});
            CHROOT_LOG_INFO("[MountStack] Using Btrfs subvolume for root: {}", subvolume);
            return true;
        }
        MountResult undo = backend_.unmount(root, false);
        if (!undo.ok) {
            // Leave it recorded so teardown retries it.
            stack_.push(MountHandle{root, device, MountKind::Filesystem});
            throw MountError(device, root, classify_mount_failure(undo.message),
                             "cannot unmount rejected subvolume " + subvolume + ": " + undo.message);
        }
    }
    CHROOT_LOG_INFO("[MountStack] No valid root subvolume found; mounting the whole volume");
    return false;
}

void MountStack::mount_root(const std::string& device, FilesystemKind kind, const std::string& root) {
    std::error_code ec;
    fs::create_directories(root, ec);

    bool mounted = false;
    if (supports_subvolumes(kind)) {
        mounted = mount_btrfs_root(device, root);
    }
    if (!mounted) {
        mount(MountSpec{device, root, to_string(kind), "", true}, MountKind::Filesystem);
    }

    if (!has_root_layout(root)) {
        throw MountError(device, root, MountFailureReason::Unknown,
                         "mounted tree has no etc/ and bin/ or usr/bin/; is this the root partition?");
    }
    CHROOT_LOG_INFO("[MountStack] Root filesystem {} mounted on {}", device, root);
}

bool MountStack::mount_companion(const std::string& device, const std::string& root,
                                 const std::string& relative_target) {
    MountSpec spec{device, join(root, relative_target), "", "", false};
    return mount(spec, MountKind::Filesystem);
}

void MountStack::prepare_directories(const std::string& root) {
    for (const char* relative : kStandardDirectories) {
        const std::string path = join(root, relative);
        std::error_code ec;
        fs::create_directories(path, ec);
        if (ec) {
            CHROOT_LOG_WARN("[MountStack] Cannot create {}: {}", path, ec.message());
        }
    }
    for (const char* relative : {"tmp", "var/tmp"}) {
        std::error_code ec;
        fs::permissions(join(root, relative), fs::perms::all | fs::perms::sticky_bit,
                        fs::perm_options::replace, ec);
        if (ec) {
            CHROOT_LOG_DEBUG("[MountStack] Cannot set mode 1777 on {}: {}", join(root, relative), ec.message());
        }
    }
}

void MountStack::copy_network_files(const std::string& root, const std::string& host_etc) {
    for (const char* name : {"resolv.conf", "hosts"}) {
        const std::string source = join(host_etc, name);
        const std::string target = join(root, std::string("etc/") + name);
        std::error_code ec;
        // A symlinked resolv.conf points into the bound /run; writing through it
        // would change the host's copy.
        if (fs::is_symlink(target, ec)) {
            CHROOT_LOG_DEBUG("[MountStack] {} is a symlink, leaving it alone", target);
            continue;
        }
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            CHROOT_LOG_DEBUG("[MountStack] Could not copy {}: {}", source, ec.message());
        } else {
            CHROOT_LOG_DEBUG("[MountStack] Copied {} to {}", source, target);
        }
    }
}

void MountStack::mount_virtual_filesystems(const std::string& root) {
    for (const auto& spec : virtual_filesystems(root)) {
        mount(spec, MountKind::Virtual);
    }
}

void MountStack::mount_additional(const std::string& root, const std::vector<MountSpec>& specs) {
    for (const auto& declared : specs) {
        MountSpec spec = declared;
        spec.target = join(root, declared.target);
        MountKind kind = MountKind::Filesystem;
        if (is_bind_request(spec)) {
            kind = MountKind::Bind;
        } else if (is_directory(spec.source)) {
            spec.fstype = "bind";
            kind = MountKind::Bind;
        }
        mount(spec, kind);
    }
}

bool MountStack::unmount(const MountHandle& handle) {
    if (!backend_.is_mounted(handle.path)) {
        CHROOT_LOG_DEBUG("[MountStack] {} is not mounted, skipping", handle.path);
        return true;
    }

    const int attempts = std::max(1, timings_.unmount_retries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        CHROOT_LOG_DEBUG("[MountStack] Unmount attempt {}/{} for {}", attempt, attempts, handle.path);
        MountResult result = backend_.unmount(handle.path, false);
        if (result.ok) {
            CHROOT_LOG_INFO("[MountStack] Unmounted {}", handle.path);
            return true;
        }
        CHROOT_LOG_WARN("[MountStack] Unmount attempt {} for {} failed: {}", attempt, handle.path, result.message);
        if (attempt < attempts) {
            std::this_thread::sleep_for(timings_.unmount_retry_delay);
        }
    }

    CHROOT_LOG_WARN("[MountStack] All unmount attempts failed, trying lazy unmount for {}", handle.path);
    MountResult lazy = backend_.unmount(handle.path, true);
    if (lazy.ok) {
        CHROOT_LOG_INFO("[MountStack] Lazily unmounted {}", handle.path);
        return true;
    }
    CHROOT_LOG_ERROR("[MountStack] Failed to unmount {} even lazily: {}", handle.path, lazy.message);
    return false;
}
