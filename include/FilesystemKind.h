#ifndef FILESYSTEM_KIND_H
#define FILESYSTEM_KIND_H

#include <string>

// Every on-disk signature the tool knows how to act on. Anything else is
// Unknown; switch statements over this enum are kept exhaustive.
enum class FilesystemKind {
    Ext2,
    Ext3,
    Ext4,
    Xfs,
    Btrfs,
    F2fs,
    Vfat,
    Ntfs,
    Swap,
    CryptoLuks,
    LvmMember,
    Unknown,
};

// Accepts the names printed by lsblk/blkid ("ext4", "crypto_LUKS",
// "LVM2_member", "fat32", ...). Empty or unrecognised input is Unknown.
FilesystemKind filesystem_kind_from_string(const std::string& name);

// The type name mount(2) expects, or an empty string where there is none.
const char* to_string(FilesystemKind kind);

bool is_linux_native(FilesystemKind kind);
bool supports_subvolumes(FilesystemKind kind);
bool is_mountable(FilesystemKind kind);

#endif // FILESYSTEM_KIND_H
