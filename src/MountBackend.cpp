#include "MountBackend.h"
#include "Logger.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <map>
#include <sstream>
#include <sys/mount.h>
#include <utility>

namespace {

std::string decode_octal_escapes(const std::string& field) {
    std::string decoded;
    decoded.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            field[i + 1] >= '0' && field[i + 1] <= '7' &&
            field[i + 2] >= '0' && field[i + 2] <= '7' &&
            field[i + 3] >= '0' && field[i + 3] <= '7') {
            int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0');
            decoded.push_back(static_cast<char>(value));
            i += 3;
        } else {
            decoded.push_back(field[i]);
        }
    }
    return decoded;
}

std::string strip_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

MountResult failure(int err) {
    MountResult result;
    result.ok = false;
    result.error_number = err;
    result.message = strerror(err);
    return result;
}

} // namespace

ParsedMountOptions parse_mount_options(const std::string& options) {
    static const std::map<std::string, unsigned long> set_flags = {
        {"ro", MS_RDONLY},       {"nosuid", MS_NOSUID},     {"nodev", MS_NODEV},
        {"noexec", MS_NOEXEC},   {"sync", MS_SYNCHRONOUS},  {"remount", MS_REMOUNT},
        {"noatime", MS_NOATIME}, {"nodiratime", MS_NODIRATIME},
        {"relatime", MS_RELATIME}, {"strictatime", MS_STRICTATIME},
        {"dirsync", MS_DIRSYNC}, {"silent", MS_SILENT},
    };
    // Options that only restate the kernel default.
    static const char* const defaults[] = {"rw", "suid", "dev", "exec", "async", "defaults", "auto"};

    ParsedMountOptions parsed;
    std::istringstream stream(options);
    std::string option;
    while (std::getline(stream, option, ',')) {
        if (option.empty()) {
            continue;
        }
        if (option == "bind") {
            parsed.flags |= MS_BIND;
            parsed.bind = true;
            continue;
        }
        if (option == "rbind") {
            parsed.flags |= MS_BIND | MS_REC;
            parsed.bind = true;
            continue;
        }
        auto it = set_flags.find(option);
        if (it != set_flags.end()) {
            parsed.flags |= it->second;
            continue;
        }
        bool is_default = false;
        for (const char* d : defaults) {
            if (option == d) {
                is_default = true;
                break;
            }
        }
        if (is_default) {
            continue;
        }
        if (!parsed.data.empty()) {
            parsed.data += ',';
        }
        parsed.data += option;
    }
    return parsed;
}

std::vector<std::string> read_mount_points(const std::string& mountinfo_path) {
    std::vector<std::string> points;
    std::ifstream mountinfo(mountinfo_path);
    std::string line;
    while (std::getline(mountinfo, line)) {
        // id parent major:minor root mount_point options ...
        std::istringstream fields(line);
        std::string id, parent, devno, root, mount_point;
        if (fields >> id >> parent >> devno >> root >> mount_point) {
            points.push_back(decode_octal_escapes(mount_point));
        }
    }
    return points;
}

SyscallMountBackend::SyscallMountBackend(std::string mountinfo_path, std::string filesystems_path)
    : mountinfo_path_(std::move(mountinfo_path)), filesystems_path_(std::move(filesystems_path)) {}

std::vector<std::string> SyscallMountBackend::block_filesystems() const {
    std::vector<std::string> types;
    std::ifstream filesystems(filesystems_path_);
    std::string line;
    while (std::getline(filesystems, line)) {
        // Virtual filesystems are tagged "nodev" in the first column.
        if (line.rfind("nodev", 0) == 0) {
            continue;
        }
        std::istringstream fields(line);
        std::string type;
        if (fields >> type) {
            types.push_back(type);
        }
    }
    return types;
}

MountResult SyscallMountBackend::mount(const std::string& source, const std::string& target,
                                       const std::string& fstype, const std::string& options) {
    ParsedMountOptions parsed = parse_mount_options(options);
    const char* data = parsed.data.empty() ? nullptr : parsed.data.c_str();

    if (fstype == "bind" || parsed.bind) {
        unsigned long flags = MS_BIND | (parsed.flags & MS_REC);
        if (::mount(source.c_str(), target.c_str(), nullptr, flags, nullptr) != 0) {
            return failure(errno);
        }
        // A bind mount ignores the other flags until it is remounted.
        unsigned long extra = parsed.flags & ~(MS_BIND | MS_REC);
        if (extra != 0 &&
            ::mount(nullptr, target.c_str(), nullptr, MS_REMOUNT | MS_BIND | extra, nullptr) != 0) {
            int err = errno;
            umount2(target.c_str(), MNT_DETACH);
            return failure(err);
        }
        return {true, 0, ""};
    }

    if (!fstype.empty()) {
        if (::mount(source.c_str(), target.c_str(), fstype.c_str(), parsed.flags, data) != 0) {
            return failure(errno);
        }
        return {true, 0, ""};
    }

    // No type given: try each block filesystem the kernel knows, as mount(8) does.
    int last_error = ENODEV;
    for (const auto& type : block_filesystems()) {
        if (::mount(source.c_str(), target.c_str(), type.c_str(), parsed.flags, data) == 0) {
            CHROOT_LOG_DEBUG("[MountBackend] {} mounted as {}", source, type);
            return {true, 0, ""};
        }
        last_error = errno;
        if (last_error != EINVAL && last_error != ENODEV) {
            break;
        }
    }
    return failure(last_error);
}

MountResult SyscallMountBackend::unmount(const std::string& target, bool lazy) {
    if (umount2(target.c_str(), lazy ? MNT_DETACH : 0) != 0) {
        return failure(errno);
    }
    return {true, 0, ""};
}

bool SyscallMountBackend::is_mounted(const std::string& target) {
    const std::string wanted = strip_trailing_slash(target);
    for (const auto& point : read_mount_points(mountinfo_path_)) {
        if (point == wanted) {
            return true;
        }
    }
    return false;
}
