#include "BackingStore.h"
#include "Errors.h"
#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::string lowercase_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string format_from_extension(const std::string& path) {
    const std::string ext = lowercase_extension(path);
    if (ext == ".vhd" || ext == ".vtoy") return "vpc";
    if (ext == ".vhdx") return "vhdx";
    if (ext == ".vmdk") return "vmdk";
    if (ext == ".qcow2" || ext == ".qcow") return "qcow2";
    if (ext == ".vdi") return "vdi";
    return "raw";
}

// Container formats identified by their header or footer magic.
std::string format_from_content(const std::string& path) {
    std::ifstream image(path, std::ios::binary);
    if (!image.is_open()) {
        return "";
    }
    char header[72] = {};
    image.read(header, sizeof(header));
    const std::streamsize got = image.gcount();

    if (got >= 4 && std::memcmp(header, "QFI\xfb", 4) == 0) return "qcow2";
    if (got >= 4 && std::memcmp(header, "KDMV", 4) == 0) return "vmdk";
    if (got >= 21 && std::memcmp(header, "# Disk DescriptorFile", 21) == 0) return "vmdk";
    if (got >= 8 && std::memcmp(header, "vhdxfile", 8) == 0) return "vhdx";
    if (got >= 8 && std::memcmp(header, "conectix", 8) == 0) return "vpc";
    if (got >= 0x44 && static_cast<unsigned char>(header[0x40]) == 0x7f &&
        static_cast<unsigned char>(header[0x41]) == 0x10 &&
        static_cast<unsigned char>(header[0x42]) == 0xda &&
        static_cast<unsigned char>(header[0x43]) == 0xbe) {
        return "vdi";
    }

    // Fixed-size VHDs only carry their footer in the last 512 bytes.
    image.clear();
    image.seekg(0, std::ios::end);
    const std::streamoff size = image.tellg();
    if (size >= 512) {
        char footer[8] = {};
        image.seekg(size - 512);
        image.read(footer, sizeof(footer));
        if (image.gcount() == 8 && std::memcmp(footer, "conectix", 8) == 0) {
            return "vpc";
        }
    }
    return "";
}

} // namespace

BackingStore::BackingStore(CommandRunner& runner, const Timings& timings, BackingStorePaths paths)
    : runner_(runner), timings_(timings), paths_(std::move(paths)) {}

std::string BackingStore::detect_format(const std::string& image_path) {
    const std::string guessed = format_from_extension(image_path);
    const std::string sniffed = format_from_content(image_path);
    if (!sniffed.empty() && sniffed != guessed) {
        CHROOT_LOG_DEBUG("[BackingStore] {} looks like {} despite its name", image_path, sniffed);
        return sniffed;
    }
    return guessed;
}

bool BackingStore::module_present() const {
    return fs::exists(paths_.sys_dir + "/module/nbd");
}

bool BackingStore::load_module() {
    CHROOT_LOG_INFO("[BackingStore] Loading nbd module");
    CommandResult result = runner_.run({"modprobe", "nbd", "max_part=16", "nbds_max=16"});
    if (!result.ok()) {
        CHROOT_LOG_ERROR("[BackingStore] modprobe nbd failed: {}", result.err);
        return false;
    }
    std::this_thread::sleep_for(timings_.module_load_settle);
    return true;
}

bool BackingStore::slot_has_live_server(int index) const {
    std::ifstream pid_file(paths_.sys_dir + "/block/nbd" + std::to_string(index) + "/pid");
    pid_t pid = 0;
    if (!(pid_file >> pid) || pid <= 0) {
        return false;
    }
    return kill(pid, 0) == 0 || errno == EPERM;
}

bool BackingStore::listed_in_partitions(const std::string& name) const {
    std::ifstream partitions(paths_.partitions_file);
    std::string line;
    while (std::getline(partitions, line)) {
        std::istringstream fields(line);
        std::string major, minor, blocks, entry;
        if (fields >> major >> minor >> blocks >> entry && entry == name) {
            return true;
        }
    }
    return false;
}

std::string BackingStore::find_free_slot() {
    for (int i = 0; i < kMaxSlots; ++i) {
        const std::string name = "nbd" + std::to_string(i);
        const std::string node = paths_.dev_dir + "/" + name;
        if (!fs::exists(node)) {
            CHROOT_LOG_DEBUG("[BackingStore] {} does not exist", node);
            continue;
        }
        if (slot_has_live_server(i)) {
            CHROOT_LOG_DEBUG("[BackingStore] {} is served by a running qemu-nbd", node);
            continue;
        }
        // A disconnect that succeeds leaves the slot free either way.
        if (runner_.run({"qemu-nbd", "-d", node}).ok()) {
            return node;
        }
        if (!listed_in_partitions(name)) {
            return node;
        }
        CHROOT_LOG_DEBUG("[BackingStore] {} appears to be in use", node);
    }
    return "";
}

bool BackingStore::connect(const std::string& node, const std::string& format,
                           const std::string& image_path) {
    CHROOT_LOG_INFO("[BackingStore] Connecting {} to {} as {}", image_path, node, format);
    CommandResult result = runner_.run({"qemu-nbd", "-c", node, "-f", format, image_path});
    if (!result.ok()) {
        CHROOT_LOG_WARN("[BackingStore] qemu-nbd -f {} failed: {}", format, result.err);
        return false;
    }
    return true;
}

BackingStoreHandle BackingStore::attach(const std::string& image_path) {
    if (!fs::is_regular_file(image_path)) {
        throw DeviceNotFoundError(image_path);
    }

    BackingStoreHandle handle;
    handle.image_path = image_path;

    if (!module_present()) {
        if (!load_module()) {
            throw BackingStoreError("Cannot load the nbd kernel module");
        }
        handle.module_loaded = true;
    }

    auto give_up = [&](const std::string& why) {
        if (handle.module_loaded && !runner_.run({"modprobe", "-r", "nbd"}).ok()) {
            CHROOT_LOG_WARN("[BackingStore] Unable to unload nbd module");
        }
        throw BackingStoreError(why);
    };

    handle.device_node = find_free_slot();
    if (handle.device_node.empty()) {
        give_up("No free NBD device found; try disconnecting one with: qemu-nbd -d /dev/nbd0");
    }

    handle.format = detect_format(image_path);
    if (!connect(handle.device_node, handle.format, image_path)) {
        if (handle.format == "raw") {
            give_up("Failed to connect " + image_path + " to " + handle.device_node);
        }
        CHROOT_LOG_WARN("[BackingStore] Retrying {} as raw", image_path);
        handle.format = "raw";
        if (!connect(handle.device_node, handle.format, image_path)) {
            give_up("Failed to connect " + image_path + " to " + handle.device_node +
                    " (tried the detected format and raw)");
        }
    }

    std::this_thread::sleep_for(timings_.attach_settle);
    CommandResult probe = runner_.run({"partprobe", handle.device_node});
    if (!probe.ok()) {
        CHROOT_LOG_DEBUG("[BackingStore] partprobe {} failed: {}", handle.device_node, probe.err);
    }
    std::this_thread::sleep_for(timings_.partition_settle);

    CHROOT_LOG_INFO("[BackingStore] {} attached at {}", image_path, handle.device_node);
    return handle;
}

bool BackingStore::detach(const BackingStoreHandle& handle) {
    CHROOT_LOG_INFO("[BackingStore] Disconnecting {}", handle.device_node);
    CommandResult result = runner_.run({"qemu-nbd", "--disconnect", handle.device_node});
    if (!result.ok()) {
        CHROOT_LOG_WARN("[BackingStore] Could not detach {}: {}", handle.device_node, result.err);
        return false;
    }
    if (handle.module_loaded) {
        if (!runner_.run({"modprobe", "-r", "nbd"}).ok()) {
            CHROOT_LOG_WARN("[BackingStore] Unable to unload nbd module");
        }
    }
    return true;
}
