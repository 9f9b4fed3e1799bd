#include "FilesystemKind.h"
#include <algorithm>
#include <cctype>

FilesystemKind filesystem_kind_from_string(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (n == "ext2") return FilesystemKind::Ext2;
    if (n == "ext3") return FilesystemKind::Ext3;
    if (n == "ext4") return FilesystemKind::Ext4;
    if (n == "xfs") return FilesystemKind::Xfs;
    if (n == "btrfs") return FilesystemKind::Btrfs;
    if (n == "f2fs") return FilesystemKind::F2fs;
    if (n == "vfat" || n == "fat" || n == "fat12" || n == "fat16" || n == "fat32" || n == "msdos") {
        return FilesystemKind::Vfat;
    }
    if (n == "ntfs" || n == "ntfs3") return FilesystemKind::Ntfs;
    if (n == "swap") return FilesystemKind::Swap;
    if (n == "crypto_luks" || n == "luks") return FilesystemKind::CryptoLuks;
    if (n == "lvm2_member") return FilesystemKind::LvmMember;
    return FilesystemKind::Unknown;
}

const char* to_string(FilesystemKind kind) {
    switch (kind) {
    case FilesystemKind::Ext2: return "ext2";
    case FilesystemKind::Ext3: return "ext3";
    case FilesystemKind::Ext4: return "ext4";
    case FilesystemKind::Xfs: return "xfs";
    case FilesystemKind::Btrfs: return "btrfs";
    case FilesystemKind::F2fs: return "f2fs";
    case FilesystemKind::Vfat: return "vfat";
    case FilesystemKind::Ntfs: return "ntfs";
    case FilesystemKind::Swap: return "swap";
    case FilesystemKind::CryptoLuks: return "crypto_LUKS";
    case FilesystemKind::LvmMember: return "LVM2_member";
    case FilesystemKind::Unknown: return "";
    }
    return "";
}

bool is_linux_native(FilesystemKind kind) {
    switch (kind) {
    case FilesystemKind::Ext2:
    case FilesystemKind::Ext3:
    case FilesystemKind::Ext4:
    case FilesystemKind::Xfs:
    case FilesystemKind::Btrfs:
    case FilesystemKind::F2fs:
        return true;
    case FilesystemKind::Vfat:
    case FilesystemKind::Ntfs:
    case FilesystemKind::Swap:
    case FilesystemKind::CryptoLuks:
    case FilesystemKind::LvmMember:
    case FilesystemKind::Unknown:
        return false;
    }
    return false;
}

bool supports_subvolumes(FilesystemKind kind) {
    switch (kind) {
    case FilesystemKind::Btrfs:
        return true;
    case FilesystemKind::Ext2:
    case FilesystemKind::Ext3:
    case FilesystemKind::Ext4:
    case FilesystemKind::Xfs:
    case FilesystemKind::F2fs:
    case FilesystemKind::Vfat:
    case FilesystemKind::Ntfs:
    case FilesystemKind::Swap:
    case FilesystemKind::CryptoLuks:
    case FilesystemKind::LvmMember:
    case FilesystemKind::Unknown:
        return false;
    }
    return false;
}

bool is_mountable(FilesystemKind kind) {
    switch (kind) {
    case FilesystemKind::Ext2:
    case FilesystemKind::Ext3:
    case FilesystemKind::Ext4:
    case FilesystemKind::Xfs:
    case FilesystemKind::Btrfs:
    case FilesystemKind::F2fs:
    case FilesystemKind::Vfat:
    case FilesystemKind::Ntfs:
        return true;
    case FilesystemKind::Swap:
    case FilesystemKind::CryptoLuks:
    case FilesystemKind::LvmMember:
    case FilesystemKind::Unknown:
        return false;
    }
    return false;
}
