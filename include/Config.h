#ifndef CONFIG_H
#define CONFIG_H

#include <chrono>
#include <string>
#include <vector>

// A single mount request. fstype "bind" means a bind mount of an existing
// directory; an empty fstype lets the mount backend probe for one.
struct MountSpec {
    std::string source;
    std::string target;
    std::string fstype;
    std::string options;
    bool required = true;
};

// Every retry count and fixed pause used while acquiring or releasing
// resources. The defaults match the delays the kernel usually needs.
struct Timings {
    int mount_retries = 3;
    std::chrono::milliseconds mount_retry_delay{1000};
    int unmount_retries = 3;
    std::chrono::milliseconds unmount_retry_delay{2000};
    std::chrono::milliseconds eviction_grace{3000};
    std::chrono::milliseconds eviction_settle{1000};
    std::chrono::milliseconds module_load_settle{1000};
    std::chrono::milliseconds attach_settle{2000};
    std::chrono::milliseconds partition_settle{1000};
};

struct SessionConfig {
    // Source selection: a block device, or a disk image to attach first.
    std::string root_device;
    std::string virtual_image;

    std::string root_mount = "/mnt/chroot";
    std::string efi_part;
    std::string boot_part;
    std::vector<MountSpec> additional_mounts;

    std::string custom_shell;
    bool gui_enabled = false;
    std::string chroot_user;

    std::string luks_key_file;
    bool copy_host_network_files = true;

    bool quiet = false;
    bool debug = false;

    Timings timings;

    bool image_mode() const { return !virtual_image.empty(); }
};

#endif // CONFIG_H
