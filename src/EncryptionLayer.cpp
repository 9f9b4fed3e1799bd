#include "EncryptionLayer.h"
#include "Errors.h"
#include "Logger.h"
#include <filesystem>
#include <utility>

EncryptionLayer::EncryptionLayer(CommandRunner& runner, DeviceResolver& resolver, std::string mapper_dir)
    : runner_(runner), resolver_(resolver), mapper_dir_(std::move(mapper_dir)) {}

std::string EncryptionLayer::make_mapper_name(std::time_t epoch, int ordinal) {
    return "luks" + std::to_string(static_cast<long long>(epoch)) + "_" + std::to_string(ordinal);
}

std::string EncryptionLayer::mapper_path(const std::string& mapper_name) const {
    return mapper_dir_ + "/" + mapper_name;
}

std::vector<std::string> EncryptionLayer::list_encrypted_partitions(const std::string& device) {
    std::vector<std::string> encrypted;
    std::vector<DeviceInfo> partitions = resolver_.list_partitions(device);
    for (const auto& part : partitions) {
        if (part.kind == FilesystemKind::CryptoLuks) {
            encrypted.push_back(part.path);
        }
    }
    if (partitions.empty() && resolver_.detect_filesystem(device) == FilesystemKind::CryptoLuks) {
        encrypted.push_back(device);
    }
    if (!encrypted.empty()) {
        CHROOT_LOG_INFO("[Encryption] {} LUKS volume(s) found on {}", encrypted.size(), device);
    }
    return encrypted;
}

std::string EncryptionLayer::open(const std::string& partition, const std::string& passphrase,
                                  const std::string& key_file) {
    const std::string name = make_mapper_name(std::time(nullptr), next_ordinal_++);
    CHROOT_LOG_INFO("[Encryption] Opening LUKS partition {} as {}", partition, mapper_path(name));

    CommandResult result;
    if (!key_file.empty()) {
        result = runner_.run({"cryptsetup", "luksOpen", "--key-file", key_file, partition, name});
    } else {
        result = runner_.run({"cryptsetup", "luksOpen", "--key-file", "-", partition, name}, passphrase);
    }
    if (!result.ok()) {
        throw EncryptionError(partition, "Failed to open LUKS partition " + partition + ": " + result.err);
    }
    return name;
}

bool EncryptionLayer::close(const std::string& mapper_name) {
    CHROOT_LOG_INFO("[Encryption] Closing LUKS mapping {}", mapper_name);
    CommandResult result = runner_.run({"cryptsetup", "luksClose", mapper_name});
    if (!result.ok()) {
        CHROOT_LOG_WARN("[Encryption] luksClose {} failed: {}; trying dmsetup", mapper_name, result.err);
        // Never --force: that swaps in an error table under a still-open mapping.
        CommandResult removed = runner_.run({"dmsetup", "remove", mapper_name});
        if (!removed.ok()) {
            CHROOT_LOG_WARN("[Encryption] dmsetup remove {} failed: {}", mapper_name, removed.err);
        }
    }

    std::error_code ec;
    if (std::filesystem::exists(mapper_path(mapper_name), ec)) {
        CHROOT_LOG_ERROR("[Encryption] {} still exists", mapper_path(mapper_name));
        return false;
    }
    return true;
}
