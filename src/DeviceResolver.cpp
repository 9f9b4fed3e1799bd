#include "DeviceResolver.h"
#include "Logger.h"
#include "nlohmann/json.hpp"
#include <blkid/blkid.h>
#include <cstring>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

const char* const kLsblkColumns = "NAME,PATH,TYPE,SIZE,FSTYPE,MOUNTPOINT";

// Offsets of the signatures sniff_signature() understands.
constexpr size_t kSniffLength = 0x10048;
constexpr size_t kExtSuperblock = 1024;
constexpr size_t kExtMagic = kExtSuperblock + 0x38;
constexpr size_t kExtFeatureCompat = kExtSuperblock + 0x5C;
constexpr size_t kExtFeatureIncompat = kExtSuperblock + 0x60;
constexpr size_t kF2fsMagic = 1024;
constexpr size_t kBtrfsMagic = 0x10040;
constexpr size_t kLvmLabel = 512;
constexpr size_t kSwapMagic = 4096 - 10;

bool has_bytes(const std::string& data, size_t offset, const char* magic, size_t length) {
    return data.size() >= offset + length && std::memcmp(data.data() + offset, magic, length) == 0;
}

uint32_t read_le32(const std::string& data, size_t offset) {
    if (data.size() < offset + 4) {
        return 0;
    }
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(static_cast<unsigned char>(data[offset + i])) << (8 * i);
    }
    return value;
}

uint16_t read_le16(const std::string& data, size_t offset) {
    if (data.size() < offset + 2) {
        return 0;
    }
    return static_cast<uint16_t>(static_cast<unsigned char>(data[offset]) |
                                 (static_cast<unsigned char>(data[offset + 1]) << 8));
}

std::string string_field(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return "";
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

uint64_t size_field(const json& node) {
    auto it = node.find("size");
    if (it == node.end() || it->is_null()) {
        return 0;
    }
    if (it->is_number_unsigned() || it->is_number_integer()) {
        return it->get<uint64_t>();
    }
    // Older lsblk prints numbers as strings even with -b.
    try {
        return std::stoull(it->get<std::string>());
    } catch (const std::exception&) {
        return 0;
    }
}

void flatten(const json& node, std::vector<DeviceInfo>& out) {
    DeviceInfo info;
    info.name = string_field(node, "name");
    info.path = string_field(node, "path");
    if (info.path.empty() && !info.name.empty()) {
        info.path = "/dev/" + info.name;
    }
    info.type = string_field(node, "type");
    info.size_bytes = size_field(node);
    info.fstype = string_field(node, "fstype");
    info.kind = filesystem_kind_from_string(info.fstype);
    info.mount_point = string_field(node, "mountpoint");
    out.push_back(info);

    auto children = node.find("children");
    if (children != node.end() && children->is_array()) {
        for (const auto& child : *children) {
            flatten(child, out);
        }
    }
}

} // namespace

DeviceResolver::DeviceResolver(CommandRunner& runner) : runner_(runner) {}

std::vector<DeviceInfo> DeviceResolver::parse_lsblk_json(const std::string& json_text) {
    std::vector<DeviceInfo> devices;
    try {
        json data = json::parse(json_text);
        auto it = data.find("blockdevices");
        if (it == data.end() || !it->is_array()) {
            return devices;
        }
        for (const auto& node : *it) {
            flatten(node, devices);
        }
    } catch (json::exception& e) {
        CHROOT_LOG_WARN("[DeviceResolver] Could not parse lsblk output: {}", e.what());
        devices.clear();
    }
    return devices;
}

std::vector<DeviceInfo> DeviceResolver::run_lsblk(const std::vector<std::string>& extra_args) {
    std::vector<std::string> argv = {"lsblk", "-J", "-b", "-o", kLsblkColumns};
    argv.insert(argv.end(), extra_args.begin(), extra_args.end());
    CommandResult result = runner_.run(argv);
    if (!result.ok()) {
        CHROOT_LOG_WARN("[DeviceResolver] lsblk failed: {}", result.err);
        return {};
    }
    return parse_lsblk_json(result.out);
}

std::vector<DeviceInfo> DeviceResolver::list_candidate_devices() {
    std::vector<DeviceInfo> candidates;
    for (auto& device : run_lsblk({})) {
        if (device.type != "part" && device.type != "lvm" && device.type != "crypt") {
            continue;
        }
        if (device.kind == FilesystemKind::Swap) {
            continue;
        }
        candidates.push_back(device);
    }
    CHROOT_LOG_DEBUG("[DeviceResolver] {} candidate device(s) found", candidates.size());
    return candidates;
}

std::vector<DeviceInfo> DeviceResolver::list_partitions(const std::string& device) {
    std::vector<DeviceInfo> partitions;
    for (auto& entry : run_lsblk({device})) {
        if (entry.type != "part") {
            continue;
        }
        // lsblk can lag behind a fresh partition table; confirm the signature.
        if (entry.kind == FilesystemKind::Unknown) {
            entry.kind = detect_filesystem(entry.path);
            entry.fstype = to_string(entry.kind);
        }
        partitions.push_back(entry);
    }
    return partitions;
}

DeviceInfo DeviceResolver::describe(const std::string& path) {
    std::vector<DeviceInfo> entries = run_lsblk({"-d", path});
    DeviceInfo info = entries.empty() ? DeviceInfo{} : entries.front();
    info.path = path;
    if (info.kind == FilesystemKind::Unknown) {
        info.kind = detect_filesystem(path);
        info.fstype = to_string(info.kind);
    }
    return info;
}

FilesystemKind DeviceResolver::detect_filesystem(const std::string& path) {
    CHROOT_LOG_DEBUG("[DeviceResolver] Detecting filesystem on {}", path);

    std::string fstype = query_metadata(path);
    FilesystemKind kind = filesystem_kind_from_string(fstype);
    if (kind != FilesystemKind::Unknown) {
        CHROOT_LOG_DEBUG("[DeviceResolver] lsblk reports {} for {}", fstype, path);
        return kind;
    }

    CHROOT_LOG_DEBUG("[DeviceResolver] lsblk returned '{}', trying blkid", fstype);
    fstype = probe_attributes(path);
    kind = filesystem_kind_from_string(fstype);
    if (kind != FilesystemKind::Unknown) {
        CHROOT_LOG_DEBUG("[DeviceResolver] blkid reports {} for {}", fstype, path);
        return kind;
    }

    CHROOT_LOG_DEBUG("[DeviceResolver] blkid returned '{}', sniffing signatures", fstype);
    kind = sniff_content(path);
    if (kind == FilesystemKind::Unknown) {
        CHROOT_LOG_DEBUG("[DeviceResolver] Could not determine filesystem type for {}", path);
    }
    return kind;
}

std::string DeviceResolver::find_mount_point(const std::string& device) {
    CommandResult result = runner_.run({"findmnt", "--noheadings", "--output", "TARGET", "--source", device});
    if (!result.ok()) {
        return "";
    }
    std::istringstream lines(result.out);
    std::string first;
    std::getline(lines, first);
    return first;
}

std::string DeviceResolver::query_metadata(const std::string& path) {
    CommandResult result = runner_.run({"lsblk", "-no", "FSTYPE", path});
    if (!result.ok()) {
        return "";
    }
    std::istringstream lines(result.out);
    std::string first;
    std::getline(lines, first);
    while (!first.empty() && (first.back() == ' ' || first.back() == '\n')) {
        first.pop_back();
    }
    return first;
}

std::string DeviceResolver::probe_attributes(const std::string& path) {
    blkid_probe pr = blkid_new_probe_from_filename(path.c_str());
    if (pr == nullptr) {
        CHROOT_LOG_DEBUG("[DeviceResolver] blkid cannot open {}", path);
        return "";
    }

    std::string fstype;
    const char* value = nullptr;
    if (blkid_do_safeprobe(pr) == 0 && blkid_probe_lookup_value(pr, "TYPE", &value, nullptr) == 0 &&
        value != nullptr) {
        fstype = value;
    }
    blkid_free_probe(pr);
    return fstype;
}

FilesystemKind DeviceResolver::sniff_content(const std::string& path) {
    return sniff_signature(path);
}

FilesystemKind DeviceResolver::sniff_signature(const std::string& path) {
    std::ifstream device(path, std::ios::binary);
    if (!device.is_open()) {
        return FilesystemKind::Unknown;
    }
    std::string data(kSniffLength, '\0');
    device.read(&data[0], static_cast<std::streamsize>(data.size()));
    data.resize(static_cast<size_t>(device.gcount()));

    if (has_bytes(data, 0, "LUKS\xba\xbe", 6)) {
        return FilesystemKind::CryptoLuks;
    }
    if (has_bytes(data, kLvmLabel, "LABELONE", 8) && has_bytes(data, kLvmLabel + 24, "LVM2", 4)) {
        return FilesystemKind::LvmMember;
    }
    if (has_bytes(data, 0, "XFSB", 4)) {
        return FilesystemKind::Xfs;
    }
    if (has_bytes(data, 3, "NTFS    ", 8)) {
        return FilesystemKind::Ntfs;
    }
    if (has_bytes(data, 82, "FAT32", 5) || has_bytes(data, 54, "FAT12", 5) ||
        has_bytes(data, 54, "FAT16", 5) || has_bytes(data, 54, "FAT     ", 8)) {
        return FilesystemKind::Vfat;
    }
    if (read_le16(data, kExtMagic) == 0xEF53) {
        const uint32_t compat = read_le32(data, kExtFeatureCompat);
        const uint32_t incompat = read_le32(data, kExtFeatureIncompat);
        // extents, 64bit or flex_bg only exist on ext4.
        if (incompat & (0x40 | 0x80 | 0x200)) {
            return FilesystemKind::Ext4;
        }
        // has_journal
        if (compat & 0x4) {
            return FilesystemKind::Ext3;
        }
        return FilesystemKind::Ext2;
    }
    if (read_le32(data, kF2fsMagic) == 0xF2F52010) {
        return FilesystemKind::F2fs;
    }
    if (has_bytes(data, kBtrfsMagic, "_BHRfS_M", 8)) {
        return FilesystemKind::Btrfs;
    }
    if (has_bytes(data, kSwapMagic, "SWAPSPACE2", 10) || has_bytes(data, kSwapMagic, "SWAP-SPACE", 10)) {
        return FilesystemKind::Swap;
    }
    return FilesystemKind::Unknown;
}

std::string DeviceResolver::human_size(uint64_t bytes) {
    static const char* const units[] = {"B", "K", "M", "G", "T", "P"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return std::to_string(bytes) + "B";
    }
    return fmt::format("{:.1f}{}", value, units[unit]);
}
