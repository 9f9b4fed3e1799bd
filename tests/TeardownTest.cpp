#include "FakeHost.h"
#include "BackingStore.h"
#include "DeviceResolver.h"
#include "EncryptionLayer.h"
#include "Errors.h"
#include "GuiPassthrough.h"
#include "MountStack.h"
#include "ResourceStack.h"
#include "Teardown.h"
#include "VolumeActivator.h"
#include <gtest/gtest.h>
#include <algorithm>

namespace {

// Every component the teardown walk drives, wired to fakes.
struct TeardownRig {
    TeardownRig()
        : runner(&journal),
          backend(&journal),
          reaper(runner, timings, &journal),
          resolver(runner),
          backing(runner, timings),
          encryption(runner, resolver, scratch.mkdir("mapper")),
          volumes(runner),
          mounts(backend, stack, runner, timings),
          teardown(mounts, reaper, volumes, encryption, backing) {}

    void push_mount(const std::string& path, const std::string& source, MountKind kind) {
        stack.push(MountHandle{path, source, kind});
        backend.mounted.insert(path);
    }

    ScratchDir scratch;
    Journal journal;
    Timings timings = instant_timings();
    FakeCommandRunner runner;
    FakeMountBackend backend;
    FakeReaper reaper;
    DeviceResolver resolver;
    BackingStore backing;
    EncryptionLayer encryption;
    VolumeActivator volumes;
    ResourceStack stack;
    MountStack mounts;
    Teardown teardown;
};

std::vector<std::string> without_evictions(const Journal& journal) {
    std::vector<std::string> filtered;
    for (const auto& entry : journal) {
        if (entry.rfind("evict", 0) != 0) filtered.push_back(entry);
    }
    return filtered;
}

} // namespace

TEST(TeardownTest, ReleasesInReverseAcquisitionOrder) {
    TeardownRig rig;
    const std::string root = rig.scratch.mkdir("root");
    rig.stack.push(BackingStoreHandle{"/images/disk.qcow2", "/dev/nbd0", "qcow2", false});
    rig.stack.push(EncryptedVolumeHandle{"/dev/nbd0p2", "luks1700000000_0"});
    rig.stack.push(VolumeGroupHandle{"vg0"});
    rig.push_mount(root, "/dev/vg0/root", MountKind::Filesystem);
    rig.push_mount(root + "/proc", "proc", MountKind::Virtual);

    rig.runner.script("vgchange -an vg0", command_ok());
    rig.runner.script("cryptsetup luksClose luks1700000000_0", command_ok());
    rig.runner.script("qemu-nbd --disconnect /dev/nbd0", command_ok());

    std::vector<std::string> failures = rig.teardown.run(rig.stack);

    EXPECT_TRUE(failures.empty());
    EXPECT_TRUE(rig.stack.empty());
    const std::vector<std::string> expected = {
        "umount " + root + "/proc",
        "umount " + root,
        "vgchange -an vg0",
        "cryptsetup luksClose luks1700000000_0",
        "qemu-nbd --disconnect /dev/nbd0",
    };
    EXPECT_EQ(without_evictions(rig.journal), expected);
}

TEST(TeardownTest, SecondRunIsANoOp) {
    TeardownRig rig;
    const std::string root = rig.scratch.mkdir("root");
    rig.push_mount(root, "/dev/sda2", MountKind::Filesystem);
    rig.stack.push(VolumeGroupHandle{"vg0"});
    rig.runner.script("vgchange -an vg0", command_ok());

    EXPECT_TRUE(rig.teardown.run(rig.stack).empty());
    const size_t recorded = rig.journal.size();
    EXPECT_TRUE(rig.teardown.done());

    EXPECT_TRUE(rig.teardown.run(rig.stack).empty());
    EXPECT_EQ(rig.journal.size(), recorded);
    EXPECT_EQ(rig.runner.count("vgchange -an vg0"), 1);
}

TEST(TeardownTest, EvictsOnlyDeviceBackedMounts) {
    TeardownRig rig;
    const std::string root = rig.scratch.mkdir("root");
    rig.push_mount(root, "/dev/sda2", MountKind::Filesystem);
    for (const auto& spec : MountStack::virtual_filesystems(root)) {
        rig.push_mount(spec.target, spec.source, MountKind::Virtual);
    }
    rig.push_mount(root + "/srv/shared", "/srv/shared", MountKind::Bind);
    rig.push_mount(root + "/home", "/dev/sdb1", MountKind::Filesystem);

    EXPECT_TRUE(rig.teardown.run(rig.stack).empty());

    const std::vector<std::string> expected = {root + "/home", root};
    EXPECT_EQ(rig.reaper.evicted_users, expected);
    EXPECT_EQ(rig.backend.unmounts().size(), 9u);
}

TEST(TeardownTest, VanishedMountIsNeitherEvictedNorUnmounted) {
    TeardownRig rig;
    const std::string root = rig.scratch.mkdir("root");
    rig.push_mount(root, "/dev/sda2", MountKind::Filesystem);
    // Unmounted from inside the chroot before teardown.
    rig.stack.push(MountHandle{root + "/boot", "/dev/sda1", MountKind::Filesystem});

    EXPECT_TRUE(rig.teardown.run(rig.stack).empty());

    const std::vector<std::string> expected = {root};
    EXPECT_EQ(rig.reaper.evicted_users, expected);
    EXPECT_EQ(rig.backend.unmounts(), std::vector<std::string>({"umount " + root}));
    EXPECT_TRUE(rig.stack.empty());
}

TEST(TeardownTest, EvictsChrootProcessesBeforeUnmounting) {
    TeardownRig rig;
    const std::string root = rig.scratch.mkdir("root");
    rig.teardown.set_chroot_root(root);
    rig.push_mount(root, "/dev/sda2", MountKind::Filesystem);

    EXPECT_TRUE(rig.teardown.run(rig.stack).empty());

    ASSERT_FALSE(rig.journal.empty());
    EXPECT_EQ(rig.journal.front(), "evict-chroot " + root);
    EXPECT_EQ(rig.journal.back(), "umount " + root);
}

TEST(TeardownTest, CollectsFailuresAndKeepsGoing) {
    TeardownRig rig;
    const std::string root = rig.scratch.mkdir("root");
    rig.stack.push(BackingStoreHandle{"/images/disk.img", "/dev/nbd3", "raw", false});
    rig.stack.push(VolumeGroupHandle{"vg0"});
    rig.push_mount(root, "/dev/vg0/root", MountKind::Filesystem);
    rig.backend.stuck.insert(root);
    rig.runner.script("vgchange -an vg0", command_ok());
    rig.runner.script("qemu-nbd --disconnect /dev/nbd3", command_failed("device busy"));

    std::vector<std::string> failures = rig.teardown.run(rig.stack);

    ASSERT_EQ(failures.size(), 2u);
    EXPECT_NE(failures[0].find("umount -l " + root), std::string::npos);
    EXPECT_NE(failures[1].find("qemu-nbd -d /dev/nbd3"), std::string::npos);
    // The volume group between the two failures was still released.
    EXPECT_EQ(rig.runner.count("vgchange -an vg0"), 1);
    EXPECT_TRUE(rig.stack.empty());
}

TEST(TeardownTest, LeavesNothingBehindAfterPartialMountFailure) {
    TeardownRig rig;
    const std::string root = rig.scratch.mkdir("root");
    rig.mounts.mount(MountSpec{"/dev/sda2", root, "ext4", "", true}, MountKind::Filesystem);
    rig.backend.failing_mounts.insert(root + "/dev");

    EXPECT_THROW(rig.mounts.mount_virtual_filesystems(root), MountError);
    // Root, proc and sys made it; /dev did not.
    ASSERT_EQ(rig.stack.size(), 3u);
    EXPECT_EQ(rig.backend.count("mount " + root + "/dev"), rig.timings.mount_retries);

    EXPECT_TRUE(rig.teardown.run(rig.stack).empty());
    const std::vector<std::string> expected = {
        "umount " + root + "/sys",
        "umount " + root + "/proc",
        "umount " + root,
    };
    EXPECT_EQ(rig.backend.unmounts(), expected);
}

TEST(TeardownTest, RevertsGuiBeforeFirstUnmount) {
    TeardownRig rig;
    const std::string root = rig.scratch.mkdir("root");
    GuiPassthrough gui(rig.runner, rig.scratch.mkdir("x11"));
    rig.runner.script("xhost +local:", command_ok());
    rig.runner.script("xhost -local:", command_ok());

    HostDisplay host;
    host.display = ":0";
    ASSERT_TRUE(gui.setup(root, UserAccount{}, host));
    rig.teardown.set_gui(&gui);
    rig.push_mount(root, "/dev/sda2", MountKind::Filesystem);

    EXPECT_TRUE(rig.teardown.run(rig.stack).empty());
    EXPECT_FALSE(gui.active());

    auto revert = std::find(rig.journal.begin(), rig.journal.end(), "xhost -local:");
    auto unmount = std::find(rig.journal.begin(), rig.journal.end(), "umount " + root);
    ASSERT_NE(revert, rig.journal.end());
    ASSERT_NE(unmount, rig.journal.end());
    EXPECT_LT(revert, unmount);
}

TEST(TeardownTest, EmptyStackNeedsNothing) {
    TeardownRig rig;
    EXPECT_TRUE(rig.teardown.run(rig.stack).empty());
    EXPECT_TRUE(rig.journal.empty());
}
