#include "VolumeActivator.h"
#include "Errors.h"
#include "Logger.h"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

using json = nlohmann::json;

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool looks_like_swap(const std::string& lv_name) {
    return lowercase(lv_name).find("swap") != std::string::npos;
}

bool looks_like_root(const std::string& lv_name) {
    const std::string name = lowercase(lv_name);
    if (name.find("swap") != std::string::npos) {
        return false;
    }
    return name.find("root") != std::string::npos || name.find("ubuntu") != std::string::npos ||
           name.find("system") != std::string::npos;
}

uint64_t parse_size(const json& value) {
    if (value.is_number()) {
        return value.get<uint64_t>();
    }
    if (!value.is_string()) {
        return 0;
    }
    std::string text = value.get<std::string>();
    // Strip a trailing unit in case --nosuffix was ignored.
    while (!text.empty() && !std::isdigit(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    const size_t dot = text.find('.');
    if (dot != std::string::npos) {
        text.resize(dot);
    }
    try {
        return text.empty() ? 0 : std::stoull(text);
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace

VolumeActivator::VolumeActivator(CommandRunner& runner) : runner_(runner) {}

std::vector<std::string> VolumeActivator::scan_and_activate(ResourceStack& stack) {
    CHROOT_LOG_INFO("[LVM] Scanning for LVM physical volumes");
    CommandResult scan = runner_.run({"pvscan", "--cache"});
    if (!scan.ok()) {
        CHROOT_LOG_DEBUG("[LVM] pvscan --cache failed: {}", scan.err);
    }

    std::set<std::string> already_active;
    CommandResult active = runner_.run({"lvs", "--reportformat", "json", "-o", "vg_name,lv_active"});
    if (active.ok()) {
        already_active = parse_active_groups(active.out);
    } else {
        CHROOT_LOG_WARN("[LVM] Could not read active volumes: {}", active.err);
    }

    std::vector<std::string> activated;
    CommandResult groups = runner_.run({"vgs", "--noheadings", "-o", "vg_name"});
    if (!groups.ok()) {
        CHROOT_LOG_WARN("[LVM] vgs failed: {}", groups.err);
        return activated;
    }

    std::istringstream lines(groups.out);
    std::string vg;
    while (lines >> vg) {
        CHROOT_LOG_INFO("[LVM] Activating volume group {}", vg);
        CommandResult result = runner_.run({"vgchange", "-ay", vg});
        if (!result.ok()) {
            CHROOT_LOG_WARN("[LVM] Could not activate {}: {}", vg, result.err);
            continue;
        }
        if (already_active.count(vg) != 0) {
            CHROOT_LOG_INFO("[LVM] Volume group {} was already active on the host; leaving it active", vg);
        } else {
            stack.push(VolumeGroupHandle{vg});
        }
        activated.push_back(vg);
    }
    return activated;
}

std::vector<LogicalVolume> VolumeActivator::parse_lvs_json(const std::string& json_text) {
    std::vector<LogicalVolume> volumes;
    try {
        json data = json::parse(json_text);
        for (const auto& report : data.at("report")) {
            auto lvs = report.find("lv");
            if (lvs == report.end()) {
                continue;
            }
            for (const auto& entry : *lvs) {
                LogicalVolume lv;
                lv.vg_name = entry.value("vg_name", "");
                lv.lv_name = entry.value("lv_name", "");
                lv.path = entry.value("lv_path", "");
                if (lv.path.empty() && !lv.vg_name.empty()) {
                    lv.path = "/dev/" + lv.vg_name + "/" + lv.lv_name;
                }
                auto size = entry.find("lv_size");
                lv.size_bytes = size == entry.end() ? 0 : parse_size(*size);
                volumes.push_back(lv);
            }
        }
    } catch (json::exception& e) {
        CHROOT_LOG_WARN("[LVM] Could not parse lvs output: {}", e.what());
        volumes.clear();
    }
    return volumes;
}

std::set<std::string> VolumeActivator::parse_active_groups(const std::string& json_text) {
    std::set<std::string> groups;
    try {
        json data = json::parse(json_text);
        for (const auto& report : data.at("report")) {
            auto lvs = report.find("lv");
            if (lvs == report.end()) {
                continue;
            }
            for (const auto& entry : *lvs) {
                const std::string state = entry.value("lv_active", "");
                if (!state.empty() && state != "inactive") {
                    groups.insert(entry.value("vg_name", ""));
                }
            }
        }
    } catch (json::exception& e) {
        CHROOT_LOG_WARN("[LVM] Could not parse lvs output: {}", e.what());
        groups.clear();
    }
    return groups;
}

std::vector<LogicalVolume> VolumeActivator::list_logical_volumes(const std::vector<std::string>& vg_names) {
    if (vg_names.empty()) {
        return {};
    }
    std::vector<std::string> argv = {"lvs", "--reportformat", "json", "--units", "b", "--nosuffix",
                                     "-o", "vg_name,lv_name,lv_path,lv_size"};
    argv.insert(argv.end(), vg_names.begin(), vg_names.end());
    CommandResult result = runner_.run(argv);
    if (!result.ok()) {
        CHROOT_LOG_WARN("[LVM] lvs failed: {}", result.err);
        return {};
    }

    std::vector<LogicalVolume> volumes = parse_lvs_json(result.out);
    auto rank = [&](const LogicalVolume& lv) {
        return std::find(vg_names.begin(), vg_names.end(), lv.vg_name) - vg_names.begin();
    };
    std::stable_sort(volumes.begin(), volumes.end(),
                     [&](const LogicalVolume& a, const LogicalVolume& b) { return rank(a) < rank(b); });
    for (const auto& lv : volumes) {
        CHROOT_LOG_DEBUG("[LVM] {} ({} bytes)", lv.path, lv.size_bytes);
    }
    return volumes;
}

bool VolumeActivator::deactivate(const std::string& vg_name) {
    CHROOT_LOG_INFO("[LVM] Deactivating volume group {}", vg_name);
    CommandResult result = runner_.run({"vgchange", "-an", vg_name});
    if (!result.ok()) {
        CHROOT_LOG_WARN("[LVM] Could not deactivate {}: {}", vg_name, result.err);
        return false;
    }
    return true;
}

std::string VolumeActivator::select_root_candidate(const std::vector<LogicalVolume>& volumes,
                                                   const std::vector<DeviceInfo>& partitions) {
    for (const auto& lv : volumes) {
        if (looks_like_root(lv.lv_name)) {
            CHROOT_LOG_INFO("[LVM] Using logical volume {} as root (name match)", lv.path);
            return lv.path;
        }
    }

    const LogicalVolume* largest = nullptr;
    for (const auto& lv : volumes) {
        if (looks_like_swap(lv.lv_name)) {
            continue;
        }
        if (largest == nullptr || lv.size_bytes > largest->size_bytes) {
            largest = &lv;
        }
    }
    if (largest != nullptr) {
        CHROOT_LOG_INFO("[LVM] Using logical volume {} as root (largest)", largest->path);
        return largest->path;
    }

    const DeviceInfo* fallback = nullptr;
    for (const auto& part : partitions) {
        if (!is_linux_native(part.kind)) {
            continue;
        }
        if (fallback == nullptr || part.size_bytes > fallback->size_bytes) {
            fallback = &part;
        }
    }
    if (fallback != nullptr) {
        CHROOT_LOG_INFO("[LVM] Using partition {} as root", fallback->path);
        return fallback->path;
    }

    throw NoRootCandidateError("No root filesystem candidate found among logical volumes or partitions");
}
