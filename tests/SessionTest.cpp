#include "FakeHost.h"
#include "Errors.h"
#include "Session.h"
#include "Signals.h"
#include "StateManager.h"
#include <algorithm>
#include <csignal>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr uint64_t kGiB = 1024ULL * 1024 * 1024;

class SessionTest : public ::testing::Test {
protected:
    SessionTest()
        : runner(&journal),
          backend(&journal),
          reaper(runner, timings, &journal),
          host(runner, backend, shell, prompter, reaper) {
        SignalGuard::take();

        host.state_path = scratch.sub("state.json");
        host.host_etc = scratch.sub("host-etc");
        host.mapper_dir = scratch.mkdir("mapper");
        host.x11_socket_dir = scratch.sub("x11");
        host.backing_paths.dev_dir = scratch.mkdir("dev");
        host.backing_paths.sys_dir = scratch.mkdir("sys");
        host.backing_paths.partitions_file = scratch.write("partitions", "");

        root = scratch.mkdir("mnt");
        config.root_mount = root;
        config.quiet = true;
        config.timings = instant_timings();
    }

    ~SessionTest() override { SignalGuard::take(); }

    // What the mounted root filesystem would contain.
    void populate_root(bool with_shell = true) {
        scratch.mkdir("mnt/etc");
        scratch.mkdir("mnt/bin");
        if (with_shell) {
            const std::string bash = scratch.write("mnt/bin/bash", "#!/bin/sh\n");
            fs::permissions(bash, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                      fs::perms::others_read | fs::perms::others_exec);
        }
    }

    std::string physical_device(const std::string& fstype) {
        const std::string device = scratch.write("sda2", "");
        runner.script("lsblk -no FSTYPE " + device, command_ok(fstype + "\n"));
        config.root_device = device;
        return device;
    }

    int run_session() {
        Session session(config, host);
        return session.run();
    }

    std::vector<std::string> mounted_targets() const {
        std::vector<std::string> targets;
        for (const auto& event : backend.events) {
            if (event.rfind("mount ", 0) == 0) targets.push_back(event.substr(6));
        }
        return targets;
    }

    std::vector<std::string> unmounted_targets() const {
        std::vector<std::string> targets;
        for (const auto& event : backend.unmounts()) {
            targets.push_back(event.substr(event.rfind(' ') + 1));
        }
        return targets;
    }

    size_t position(const std::string& entry) const {
        return static_cast<size_t>(std::find(journal.begin(), journal.end(), entry) - journal.begin());
    }

    ScratchDir scratch;
    Journal journal;
    Timings timings = instant_timings();
    FakeCommandRunner runner;
    FakeMountBackend backend;
    FakeShellExecutor shell;
    FakePrompter prompter;
    FakeReaper reaper;
    HostServices host;
    SessionConfig config;
    std::string root;
};

} // namespace

TEST_F(SessionTest, PhysicalRootEndToEnd) {
    populate_root();
    physical_device("ext4");
    const std::string shared = scratch.mkdir("shared");
    config.additional_mounts.push_back(MountSpec{shared, "/srv/shared", "", "", true});

    EXPECT_EQ(run_session(), 0);

    const std::vector<std::string> mounted = mounted_targets();
    const std::vector<std::string> expected_mounts = {
        root,           root + "/proc", root + "/sys", root + "/dev", root + "/dev/pts",
        root + "/run",  root + "/tmp",  root + "/srv/shared",
    };
    EXPECT_EQ(mounted, expected_mounts);
    EXPECT_EQ(unmounted_targets(), std::vector<std::string>(mounted.rbegin(), mounted.rend()));
    EXPECT_TRUE(backend.mounted.empty());

    ASSERT_EQ(shell.plans.size(), 1u);
    EXPECT_EQ(shell.plans[0].root, root);
    EXPECT_EQ(shell.plans[0].shell, "/bin/bash");
    EXPECT_EQ(shell.plans[0].account.name, "root");

    EXPECT_EQ(runner.count_prefix("qemu-nbd"), 0);
    EXPECT_EQ(runner.count_prefix("cryptsetup"), 0);
    EXPECT_EQ(runner.count_prefix("vgchange"), 0);
    EXPECT_FALSE(fs::exists(host.state_path));
}

TEST_F(SessionTest, StateFileTracksRunningSession) {
    populate_root();
    physical_device("ext4");
    std::optional<SessionState> seen;
    StateManager observer(host.state_path);
    backend.on_mount = [&](const std::string&, const std::string&, const std::string&) {
        seen = observer.load_state();
        return true;
    };

    EXPECT_EQ(run_session(), 0);

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->pid, getpid());
    EXPECT_EQ(seen->root_mount, root);
    EXPECT_EQ(seen->status, "acquiring");
    EXPECT_FALSE(seen->resources.empty());
}

TEST_F(SessionTest, RequiredMountFailureTearsDownAndExitsOne) {
    populate_root();
    physical_device("ext4");
    backend.failing_mounts.insert(root + "/dev");

    EXPECT_EQ(run_session(), 1);

    EXPECT_TRUE(shell.plans.empty());
    EXPECT_TRUE(backend.mounted.empty());
    const std::vector<std::string> expected = {root + "/sys", root + "/proc", root};
    EXPECT_EQ(unmounted_targets(), expected);
    EXPECT_FALSE(fs::exists(host.state_path));
}

TEST_F(SessionTest, MissingImageToolStopsBeforeAnything) {
    config.virtual_image = scratch.write("disk.img", std::string(1024, '\0'));
    runner.missing_tools.insert("qemu-nbd");

    {
        Session session(config, host);
        EXPECT_THROW(session.acquire(), MissingToolError);
        EXPECT_TRUE(session.resources().empty());
    }
    EXPECT_EQ(run_session(), 1);
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_TRUE(backend.events.empty());
}

TEST_F(SessionTest, MissingRootDeviceExitsOne) {
    config.root_device = scratch.sub("sdz9");
    EXPECT_EQ(run_session(), 1);
    EXPECT_TRUE(backend.events.empty());
}

TEST_F(SessionTest, InterruptDuringMountingReleasesEverything) {
    populate_root();
    physical_device("ext4");
    backend.on_mount = [&](const std::string&, const std::string& target, const std::string&) {
        if (target == root + "/sys") {
            SignalGuard::raise_for_test(SIGINT);
        }
        return true;
    };

    EXPECT_EQ(run_session(), 1);

    EXPECT_TRUE(shell.plans.empty());
    EXPECT_TRUE(backend.mounted.empty());
    EXPECT_EQ(SignalGuard::pending(), 0);
}

TEST_F(SessionTest, ShellMissingInRootExitsOne) {
    populate_root(false);
    physical_device("ext4");

    EXPECT_EQ(run_session(), 1);

    EXPECT_TRUE(shell.plans.empty());
    EXPECT_TRUE(backend.mounted.empty());
}

TEST_F(SessionTest, StuckUnmountExitsTwo) {
    populate_root();
    physical_device("ext4");
    backend.stuck.insert(root);

    EXPECT_EQ(run_session(), 2);

    EXPECT_EQ(shell.plans.size(), 1u);
    EXPECT_EQ(backend.mounted, std::set<std::string>({root}));
    EXPECT_EQ(backend.count("umount -l " + root), 1);
}

TEST_F(SessionTest, LiveSessionBlocksSecondStart) {
    populate_root();
    physical_device("ext4");
    StateManager other(host.state_path);
    SessionState live;
    live.pid = getppid();
    live.status = "running";
    live.root_mount = "/mnt/other";
    ASSERT_TRUE(other.save_state(live));

    EXPECT_EQ(run_session(), 1);

    EXPECT_TRUE(backend.events.empty());
    auto state = other.load_state();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->pid, getppid());
}

TEST_F(SessionTest, StaleStateFileIsReplaced) {
    populate_root();
    physical_device("ext4");
    StateManager other(host.state_path);
    SessionState stale;
    stale.pid = 0x3ffffff;
    ASSERT_TRUE(other.save_state(stale));

    EXPECT_EQ(run_session(), 0);
    EXPECT_FALSE(fs::exists(host.state_path));
}

TEST_F(SessionTest, ImageWithLvmAndEfiPartition) {
    populate_root();
    const std::string image = scratch.write("disk.img", std::string(1024, '\0'));
    const std::string node = scratch.write("dev/nbd0", "");
    scratch.mkdir("sys/module/nbd");
    config.virtual_image = image;

    runner.script("qemu-nbd -d " + node, command_ok());
    runner.script("qemu-nbd -c " + node + " -f raw " + image, command_ok());
    runner.script("lsblk -J -b -o NAME,PATH,TYPE,SIZE,FSTYPE,MOUNTPOINT " + node, command_ok(R"({
      "blockdevices": [
        {"name":"nbd0", "path":"/dev/nbd0", "type":"disk", "size":21474836480, "fstype":null, "children": [
          {"name":"nbd0p1", "path":"/dev/nbd0p1", "type":"part", "size":536870912, "fstype":"vfat"},
          {"name":"nbd0p2", "path":"/dev/nbd0p2", "type":"part", "size":1073741824, "fstype":"vfat"},
          {"name":"nbd0p3", "path":"/dev/nbd0p3", "type":"part", "size":19864223744, "fstype":"LVM2_member"}
        ]}
      ]
    })"));
    runner.script("pvscan --cache", command_ok());
    runner.script("vgs --noheadings -o vg_name", command_ok("  vg0\n"));
    runner.script("vgchange -ay vg0", command_ok());
    runner.script("lvs --reportformat json --units b --nosuffix -o vg_name,lv_name,lv_path,lv_size vg0",
                  command_ok(R"({"report":[{"lv":[
                      {"vg_name":"vg0","lv_name":"swap","lv_path":"/dev/vg0/swap","lv_size":"2147483648"},
                      {"vg_name":"vg0","lv_name":"root","lv_path":"/dev/vg0/root","lv_size":"17179869184"}]}]})"));
    runner.script("lsblk -no FSTYPE /dev/vg0/root", command_ok("ext4\n"));
    runner.script("lsblk -no FSTYPE /dev/nbd0p1", command_ok("vfat\n"));
    runner.script("vgchange -an vg0", command_ok());
    runner.script("qemu-nbd --disconnect " + node, command_ok());

    EXPECT_EQ(run_session(), 0);

    // The small FAT partition went to /boot/efi; the 1 GiB one is too big.
    EXPECT_NE(std::find(backend.mount_requests.begin(), backend.mount_requests.end(),
                        "/dev/nbd0p1 " + root + "/boot/efi  "),
              backend.mount_requests.end());
    EXPECT_EQ(backend.mount_requests.front(), "/dev/vg0/root " + root + " ext4 ");

    const size_t efi_off = position("umount " + root + "/boot/efi");
    const size_t root_off = position("umount " + root);
    const size_t vg_off = position("vgchange -an vg0");
    const size_t nbd_off = position("qemu-nbd --disconnect " + node);
    ASSERT_LT(nbd_off, journal.size());
    EXPECT_LT(efi_off, root_off);
    EXPECT_LT(root_off, vg_off);
    EXPECT_LT(vg_off, nbd_off);
    EXPECT_EQ(journal.back(), "qemu-nbd --disconnect " + node);
}

TEST_F(SessionTest, EncryptedRootOpenedWithKeyFile) {
    populate_root();
    const std::string device = physical_device("crypto_LUKS");
    config.luks_key_file = scratch.write("disk.key", "secret");
    runner.handler = [&](const std::vector<std::string>& argv) -> std::optional<CommandResult> {
        if (argv[0] == "cryptsetup") {
            return command_ok();
        }
        // Anything asked about the opened mapper is an ext4 volume.
        if (argv[0] == "lsblk" && argv.back().rfind(host.mapper_dir, 0) == 0) {
            if (argv[1] == "-no") return command_ok("ext4\n");
            return command_ok(R"({"blockdevices":[{"name":"m","type":"crypt","size":8589934592,"fstype":"ext4"}]})");
        }
        return std::nullopt;
    };

    EXPECT_EQ(run_session(), 0);

    EXPECT_EQ(runner.count_prefix("cryptsetup luksOpen --key-file " + config.luks_key_file + " " + device), 1);
    ASSERT_FALSE(backend.mount_requests.empty());
    EXPECT_EQ(backend.mount_requests.front().rfind(host.mapper_dir + "/luks", 0), 0u);
    EXPECT_LT(position("umount " + root), journal.size());
    EXPECT_EQ(journal.back().rfind("cryptsetup luksClose luks", 0), 0u);
    EXPECT_TRUE(prompter.questions.empty());
}

TEST_F(SessionTest, EncryptedRootWithoutKeyInQuietModeFindsNoRoot) {
    physical_device("crypto_LUKS");

    {
        Session session(config, host);
        EXPECT_THROW(session.acquire(), NoRootCandidateError);
    }
    EXPECT_EQ(runner.count_prefix("cryptsetup"), 0);
    EXPECT_TRUE(backend.events.empty());
}

TEST_F(SessionTest, HostMountedDeviceIsReleasedFirst) {
    populate_root();
    const std::string device = physical_device("ext4");
    config.quiet = false;
    runner.script("findmnt --noheadings --output TARGET --source " + device, command_ok("/media/usb\n"));
    backend.mounted.insert("/media/usb");
    backend.busy.insert("/media/usb");
    prompter.confirms = {true, true};

    {
        Session session(config, host);
        session.acquire();
    }

    EXPECT_EQ(backend.events.front(), "umount /media/usb");
    EXPECT_EQ(reaper.evicted_users.front(), "/media/usb");
    EXPECT_EQ(backend.count("umount -l /media/usb"), 1);
    EXPECT_EQ(backend.mounted.count("/media/usb"), 0u);
}

TEST_F(SessionTest, DecliningHostUnmountAborts) {
    const std::string device = physical_device("ext4");
    config.quiet = false;
    runner.script("findmnt --noheadings --output TARGET --source " + device, command_ok("/media/usb\n"));
    prompter.confirms = {false};

    Session session(config, host);
    EXPECT_THROW(session.acquire(), ChrootError);
    EXPECT_TRUE(backend.events.empty());
}

TEST_F(SessionTest, FilesystemPolicyForRoles) {
    Session session(config, host);

    EXPECT_TRUE(session.validate_filesystem("/dev/sda2", FilesystemKind::Ext4, "root"));
    EXPECT_TRUE(session.validate_filesystem("/dev/sda2", FilesystemKind::Btrfs, "root"));
    EXPECT_TRUE(session.validate_filesystem("/dev/sda1", FilesystemKind::Vfat, "EFI"));
    EXPECT_FALSE(session.validate_filesystem("/dev/sda1", FilesystemKind::Ntfs, "boot"));
    EXPECT_FALSE(session.validate_filesystem("/dev/sda1", FilesystemKind::Swap, "EFI"));
    EXPECT_FALSE(session.validate_filesystem("/dev/sda1", FilesystemKind::CryptoLuks, "boot"));
    // Quiet mode proceeds past doubtful cases without asking.
    EXPECT_TRUE(session.validate_filesystem("/dev/sda1", FilesystemKind::Unknown, "root"));
    EXPECT_TRUE(session.validate_filesystem("/dev/sda1", FilesystemKind::Vfat, "boot"));
    EXPECT_TRUE(prompter.questions.empty());

    try {
        session.validate_filesystem("/dev/sda3", FilesystemKind::LvmMember, "root");
        FAIL() << "expected MountError";
    } catch (const MountError& e) {
        EXPECT_EQ(e.reason(), MountFailureReason::WrongFsType);
        EXPECT_EQ(e.source(), "/dev/sda3");
    }
}

TEST_F(SessionTest, InteractiveFilesystemPolicyAsks) {
    config.quiet = false;
    Session session(config, host);

    prompter.confirms = {true, false, false};
    EXPECT_TRUE(session.validate_filesystem("/dev/sda1", FilesystemKind::Vfat, "boot"));
    EXPECT_FALSE(session.validate_filesystem("/dev/sda1", FilesystemKind::Unknown, "boot"));
    EXPECT_THROW(session.validate_filesystem("/dev/sda2", FilesystemKind::Unknown, "root"), MountError);
    EXPECT_EQ(prompter.questions.size(), 3u);

    // EFI on FAT never needs confirmation.
    EXPECT_TRUE(session.validate_filesystem("/dev/sda1", FilesystemKind::Vfat, "EFI"));
    EXPECT_EQ(prompter.questions.size(), 3u);
}

TEST_F(SessionTest, BannerWaitsForEnterOnATerminal) {
    populate_root();
    physical_device("ext4");
    config.quiet = false;
    host.stdin_is_tty = true;

    EXPECT_EQ(run_session(), 0);
    ASSERT_FALSE(prompter.questions.empty());
    EXPECT_EQ(prompter.questions.back(), "Press Enter to enter the chroot...");
}

TEST_F(SessionTest, FinishIsIdempotent) {
    populate_root();
    physical_device("ext4");
    Session session(config, host);
    session.acquire();
    EXPECT_FALSE(session.resources().empty());

    EXPECT_TRUE(session.finish().empty());
    const size_t events = backend.events.size();
    EXPECT_TRUE(session.finish().empty());
    EXPECT_EQ(backend.events.size(), events);
    EXPECT_TRUE(session.resources().empty());
}

TEST_F(SessionTest, FatPartitionAtSizeLimitIsNotEfi) {
    populate_root();
    const std::string image = scratch.write("disk.img", std::string(1024, '\0'));
    const std::string node = scratch.write("dev/nbd0", "");
    scratch.mkdir("sys/module/nbd");
    config.virtual_image = image;
    runner.script("qemu-nbd -d " + node, command_ok());
    runner.script("qemu-nbd -c " + node + " -f raw " + image, command_ok());
    runner.script("lsblk -J -b -o NAME,PATH,TYPE,SIZE,FSTYPE,MOUNTPOINT " + node,
                  command_ok(fmt::format(R"({{"blockdevices":[{{"name":"nbd0","type":"disk","size":1,"children":[
                      {{"name":"nbd0p1","path":"/dev/nbd0p1","type":"part","size":{},"fstype":"vfat"}},
                      {{"name":"nbd0p2","path":"/dev/nbd0p2","type":"part","size":{},"fstype":"ext4"}}]}}]}})",
                                         1000ULL * 1024 * 1024, 8 * kGiB)));
    runner.script("lsblk -no FSTYPE /dev/nbd0p2", command_ok("ext4\n"));
    runner.script("qemu-nbd --disconnect " + node, command_ok());

    EXPECT_EQ(run_session(), 0);
    EXPECT_EQ(backend.mount_requests.front(), "/dev/nbd0p2 " + root + " ext4 ");
    for (const auto& request : backend.mount_requests) {
        EXPECT_EQ(request.find("boot/efi"), std::string::npos) << request;
    }
}
