#ifndef ENCRYPTION_LAYER_H
#define ENCRYPTION_LAYER_H

#include "CommandRunner.h"
#include "DeviceResolver.h"
#include <ctime>
#include <string>
#include <vector>

/**
 * @class EncryptionLayer
 * @brief Unlocks LUKS volumes with cryptsetup and closes them again.
 */
class EncryptionLayer {
public:
    EncryptionLayer(CommandRunner& runner, DeviceResolver& resolver,
                    std::string mapper_dir = "/dev/mapper");

    // LUKS partitions on device, or device itself when it is a bare LUKS volume.
    std::vector<std::string> list_encrypted_partitions(const std::string& device);

    /**
     * @brief Opens partition under a freshly generated mapper name.
     * @param passphrase Fed to cryptsetup on stdin when key_file is empty.
     * @param key_file Key file handed to cryptsetup instead of a passphrase.
     * @return The mapper name; the clear device is /dev/mapper/<name>.
     * @throws EncryptionError if cryptsetup refuses the key.
     */
    std::string open(const std::string& partition, const std::string& passphrase,
                     const std::string& key_file = "");

    // luksClose, falling back to a plain dmsetup removal.
    bool close(const std::string& mapper_name);

    std::string mapper_path(const std::string& mapper_name) const;

    // "luks<epoch>_<ordinal>", unique across repeated runs.
    static std::string make_mapper_name(std::time_t epoch, int ordinal);

private:
    CommandRunner& runner_;
    DeviceResolver& resolver_;
    std::string mapper_dir_;
    int next_ordinal_ = 0;
};

#endif // ENCRYPTION_LAYER_H
