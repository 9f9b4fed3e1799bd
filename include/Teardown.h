#ifndef TEARDOWN_H
#define TEARDOWN_H

#include "BackingStore.h"
#include "EncryptionLayer.h"
#include "GuiPassthrough.h"
#include "MountStack.h"
#include "ProcessReaper.h"
#include "ResourceStack.h"
#include "VolumeActivator.h"
#include <string>
#include <vector>

/**
 * @class Teardown
 * @brief Releases everything on a ResourceStack in reverse order.
 *
 * Each handle is released even when an earlier release failed. Failures
 * are collected and returned instead of thrown. The walk runs at most once
 * per instance; later calls are no-ops.
 */
class Teardown {
public:
    Teardown(MountStack& mounts, ProcessReaper& reaper, VolumeActivator& volumes,
             EncryptionLayer& encryption, BackingStore& backing);

    // Reverted before the first unmount when set and active.
    void set_gui(GuiPassthrough* gui) { gui_ = gui; }

    // Processes chrooted below root are evicted before unmounting.
    void set_chroot_root(const std::string& root) { chroot_root_ = root; }

    // One message per resource that needs manual attention.
    std::vector<std::string> run(ResourceStack& stack);

    bool done() const { return done_; }

private:
    std::string release(const ResourceHandle& handle);

    MountStack& mounts_;
    ProcessReaper& reaper_;
    VolumeActivator& volumes_;
    EncryptionLayer& encryption_;
    BackingStore& backing_;
    GuiPassthrough* gui_ = nullptr;
    std::string chroot_root_;
    bool done_ = false;
};

#endif // TEARDOWN_H
