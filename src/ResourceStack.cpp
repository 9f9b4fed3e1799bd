#include "ResourceStack.h"
#include <stdexcept>
#include <utility>

const char* to_string(MountKind kind) {
    switch (kind) {
    case MountKind::Filesystem: return "filesystem";
    case MountKind::Virtual: return "virtual";
    case MountKind::Bind: return "bind";
    }
    return "filesystem";
}

std::string describe(const ResourceHandle& handle) {
    return std::visit(
        Overloaded{
            [](const BackingStoreHandle& h) {
                return "backing store " + h.device_node + " (" + h.image_path + ", " + h.format + ")";
            },
            [](const EncryptedVolumeHandle& h) {
                return "encrypted volume /dev/mapper/" + h.mapper_name + " (" + h.source_partition + ")";
            },
            [](const VolumeGroupHandle& h) { return "volume group " + h.name; },
            [](const MountHandle& h) {
                return std::string(to_string(h.kind)) + " mount " + h.path + " (" + h.source + ")";
            },
        },
        handle);
}

void ResourceStack::push(ResourceHandle handle) {
    handles_.push_back(std::move(handle));
}

ResourceHandle ResourceStack::pop() {
    if (handles_.empty()) {
        throw std::logic_error("pop from an empty resource stack");
    }
    ResourceHandle top = std::move(handles_.back());
    handles_.pop_back();
    return top;
}

std::vector<MountHandle> ResourceStack::mounts() const {
    std::vector<MountHandle> result;
    for (const auto& handle : handles_) {
        if (const auto* mount = std::get_if<MountHandle>(&handle)) {
            result.push_back(*mount);
        }
    }
    return result;
}
