#ifndef RESOURCE_STACK_H
#define RESOURCE_STACK_H

#include <string>
#include <variant>
#include <vector>

struct BackingStoreHandle {
    std::string image_path;
    std::string device_node;
    std::string format;
    bool module_loaded = false; // the connector loaded the nbd module itself
};

struct EncryptedVolumeHandle {
    std::string source_partition;
    std::string mapper_name;
};

struct VolumeGroupHandle {
    std::string name;
};

enum class MountKind {
    Filesystem, // device-backed: root, boot, EFI, extra device mounts
    Virtual,    // the fixed proc/sys/dev/devpts/run/tmp set
    Bind,       // user-declared bind mount of a host directory
};

const char* to_string(MountKind kind);

struct MountHandle {
    std::string path;
    std::string source;
    MountKind kind = MountKind::Filesystem;
};

using ResourceHandle =
    std::variant<BackingStoreHandle, EncryptedVolumeHandle, VolumeGroupHandle, MountHandle>;

// Visitor built from lambdas, for std::visit over ResourceHandle.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// One line description for logs and teardown reports.
std::string describe(const ResourceHandle& handle);

/**
 * @class ResourceStack
 * @brief Every kernel resource the session holds, in acquisition order.
 *
 * Handles are pushed the moment their acquisition succeeds and popped in
 * LIFO order during teardown.
 */
class ResourceStack {
public:
    void push(ResourceHandle handle);

    // Removes and returns the newest handle. The stack must not be empty.
    ResourceHandle pop();

    bool empty() const { return handles_.empty(); }
    size_t size() const { return handles_.size(); }

    // Oldest first.
    const std::vector<ResourceHandle>& handles() const { return handles_; }

    std::vector<MountHandle> mounts() const;

private:
    std::vector<ResourceHandle> handles_;
};

#endif // RESOURCE_STACK_H
