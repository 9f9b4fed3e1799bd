#ifndef BACKING_STORE_H
#define BACKING_STORE_H

#include "CommandRunner.h"
#include "Config.h"
#include "ResourceStack.h"
#include <string>

// Host locations the connector inspects. Tests point them at a scratch tree.
struct BackingStorePaths {
    std::string dev_dir = "/dev";
    std::string sys_dir = "/sys";
    std::string partitions_file = "/proc/partitions";
};

/**
 * @class BackingStore
 * @brief Exposes a disk image as a kernel block device through qemu-nbd.
 */
class BackingStore {
public:
    static constexpr int kMaxSlots = 16;

    BackingStore(CommandRunner& runner, const Timings& timings, BackingStorePaths paths = {});

    /**
     * @brief Attaches image_path to the first free /dev/nbdN slot.
     *
     * The nbd module is loaded if needed. The guessed format is tried first;
     * if qemu-nbd rejects it the image is retried once as raw.
     * @return Handle describing the attached node.
     * @throws BackingStoreError when no slot is free or both attempts fail.
     */
    BackingStoreHandle attach(const std::string& image_path);

    // Disconnects the node, unloading the module if attach() loaded it.
    bool detach(const BackingStoreHandle& handle);

    // qemu-nbd format name for the image: extension first, magic bytes win.
    static std::string detect_format(const std::string& image_path);

private:
    bool module_present() const;
    bool load_module();
    std::string find_free_slot();
    bool slot_has_live_server(int index) const;
    bool listed_in_partitions(const std::string& name) const;
    bool connect(const std::string& node, const std::string& format, const std::string& image_path);

    CommandRunner& runner_;
    const Timings& timings_;
    BackingStorePaths paths_;
};

#endif // BACKING_STORE_H
