#include "FakeHost.h"
#include "DeviceResolver.h"
#include <gtest/gtest.h>

namespace {

// Image content with one signature written at a fixed offset.
std::string image_with(size_t offset, const std::string& magic, size_t size = 0x11000) {
    std::string data(size, '\0');
    data.replace(offset, magic.size(), magic);
    return data;
}

std::string ext_image(uint32_t compat, uint32_t incompat) {
    std::string data(0x2000, '\0');
    data[1024 + 0x38] = '\x53';
    data[1024 + 0x39] = '\xef';
    for (int i = 0; i < 4; ++i) {
        data[1024 + 0x5C + i] = static_cast<char>((compat >> (8 * i)) & 0xff);
        data[1024 + 0x60 + i] = static_cast<char>((incompat >> (8 * i)) & 0xff);
    }
    return data;
}

// Replaces the three detection layers with canned answers.
class LayeredResolver : public DeviceResolver {
public:
    explicit LayeredResolver(CommandRunner& runner) : DeviceResolver(runner) {}

    std::string metadata;
    std::string attributes;
    FilesystemKind content = FilesystemKind::Unknown;
    std::vector<std::string> layers;

protected:
    std::string query_metadata(const std::string&) override {
        layers.push_back("lsblk");
        return metadata;
    }
    std::string probe_attributes(const std::string&) override {
        layers.push_back("blkid");
        return attributes;
    }
    FilesystemKind sniff_content(const std::string&) override {
        layers.push_back("sniff");
        return content;
    }
};

const char* const kDiskJson = R"({
  "blockdevices": [
    {"name":"sda", "path":"/dev/sda", "type":"disk", "size":256060514304, "fstype":null, "mountpoint":null,
     "children": [
        {"name":"sda1", "path":"/dev/sda1", "type":"part", "size":536870912, "fstype":"vfat", "mountpoint":"/boot/efi"},
        {"name":"sda2", "path":"/dev/sda2", "type":"part", "size":"8589934592", "fstype":"swap", "mountpoint":"[SWAP]"},
        {"name":"sda3", "path":"/dev/sda3", "type":"part", "size":246933110784, "fstype":"crypto_LUKS", "mountpoint":null,
         "children": [
            {"name":"luks-root", "path":"/dev/mapper/luks-root", "type":"crypt", "size":246916333568,
             "fstype":"LVM2_member", "mountpoint":null,
             "children": [
                {"name":"vg0-root", "path":"/dev/mapper/vg0-root", "type":"lvm", "size":53687091200,
                 "fstype":"ext4", "mountpoint":"/"}
             ]}
         ]}
     ]},
    {"name":"sr0", "type":"rom", "size":1073741312, "fstype":"iso9660", "mountpoint":null}
  ]
})";

} // namespace

TEST(DeviceResolverTest, SniffsSignatures) {
    ScratchDir scratch;
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("luks", image_with(0, std::string("LUKS\xba\xbe", 6)))),
              FilesystemKind::CryptoLuks);

    std::string lvm = image_with(512, "LABELONE");
    lvm.replace(512 + 24, 4, "LVM2");
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("lvm", lvm)), FilesystemKind::LvmMember);

    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("xfs", image_with(0, "XFSB"))), FilesystemKind::Xfs);
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("ntfs", image_with(3, "NTFS    "))), FilesystemKind::Ntfs);
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("fat", image_with(82, "FAT32   "))), FilesystemKind::Vfat);
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("btrfs", image_with(0x10040, "_BHRfS_M"))),
              FilesystemKind::Btrfs);
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("swap", image_with(4096 - 10, "SWAPSPACE2"))),
              FilesystemKind::Swap);
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("f2fs", image_with(1024, "\x10\x20\xf5\xf2"))),
              FilesystemKind::F2fs);
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("zeros", std::string(0x11000, '\0'))),
              FilesystemKind::Unknown);
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.sub("missing")), FilesystemKind::Unknown);
}

TEST(DeviceResolverTest, TellsExtGenerationsApart) {
    ScratchDir scratch;
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("ext2", ext_image(0, 0))), FilesystemKind::Ext2);
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("ext3", ext_image(0x4, 0x2))), FilesystemKind::Ext3);
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("ext4", ext_image(0x4, 0x2 | 0x40))),
              FilesystemKind::Ext4);
    // High feature bytes must not spill into the low ones.
    EXPECT_EQ(DeviceResolver::sniff_signature(scratch.write("ext3-high", ext_image(0xff000004, 0x80000002))),
              FilesystemKind::Ext3);
}

TEST(DeviceResolverTest, FlattensLsblkTree) {
    auto devices = DeviceResolver::parse_lsblk_json(kDiskJson);

    ASSERT_EQ(devices.size(), 7u);
    EXPECT_EQ(devices[0].type, "disk");
    EXPECT_EQ(devices[1].kind, FilesystemKind::Vfat);
    EXPECT_EQ(devices[1].mount_point, "/boot/efi");
    EXPECT_EQ(devices[2].size_bytes, 8589934592u);
    EXPECT_EQ(devices[3].kind, FilesystemKind::CryptoLuks);
    EXPECT_TRUE(devices[3].mount_point.empty());
    EXPECT_EQ(devices[4].kind, FilesystemKind::LvmMember);
    EXPECT_EQ(devices[5].path, "/dev/mapper/vg0-root");
    EXPECT_EQ(devices[6].path, "/dev/sr0");
    EXPECT_EQ(devices[6].kind, FilesystemKind::Unknown);
}

TEST(DeviceResolverTest, MalformedLsblkOutputYieldsNothing) {
    EXPECT_TRUE(DeviceResolver::parse_lsblk_json("{").empty());
    EXPECT_TRUE(DeviceResolver::parse_lsblk_json(R"({"devices": []})").empty());
}

TEST(DeviceResolverTest, CandidatesExcludeDisksAndSwap) {
    FakeCommandRunner runner;
    runner.script("lsblk -J -b -o NAME,PATH,TYPE,SIZE,FSTYPE,MOUNTPOINT", command_ok(kDiskJson));
    DeviceResolver resolver(runner);

    auto candidates = resolver.list_candidate_devices();

    ASSERT_EQ(candidates.size(), 4u);
    EXPECT_EQ(candidates[0].path, "/dev/sda1");
    EXPECT_EQ(candidates[1].path, "/dev/sda3");
    EXPECT_EQ(candidates[2].type, "crypt");
    EXPECT_EQ(candidates[3].type, "lvm");
}

TEST(DeviceResolverTest, StopsAtFirstLayerThatKnows) {
    FakeCommandRunner runner;
    LayeredResolver resolver(runner);

    resolver.metadata = "xfs";
    EXPECT_EQ(resolver.detect_filesystem("/dev/sdb1"), FilesystemKind::Xfs);
    EXPECT_EQ(resolver.layers, std::vector<std::string>({"lsblk"}));

    resolver.layers.clear();
    resolver.metadata = "";
    resolver.attributes = "crypto_LUKS";
    EXPECT_EQ(resolver.detect_filesystem("/dev/sdb1"), FilesystemKind::CryptoLuks);
    EXPECT_EQ(resolver.layers, std::vector<std::string>({"lsblk", "blkid"}));

    resolver.layers.clear();
    resolver.attributes = "zfs_member";
    resolver.content = FilesystemKind::Btrfs;
    EXPECT_EQ(resolver.detect_filesystem("/dev/sdb1"), FilesystemKind::Btrfs);
    EXPECT_EQ(resolver.layers, std::vector<std::string>({"lsblk", "blkid", "sniff"}));

    resolver.content = FilesystemKind::Unknown;
    EXPECT_EQ(resolver.detect_filesystem("/dev/sdb1"), FilesystemKind::Unknown);
}

TEST(DeviceResolverTest, PartitionsFillInLaggingFstype) {
    FakeCommandRunner runner;
    runner.script("lsblk -J -b -o NAME,PATH,TYPE,SIZE,FSTYPE,MOUNTPOINT /dev/nbd0", command_ok(R"({
      "blockdevices": [
        {"name":"nbd0", "path":"/dev/nbd0", "type":"disk", "size":10737418240, "fstype":null,
         "children": [
           {"name":"nbd0p1", "path":"/dev/nbd0p1", "type":"part", "size":1048576, "fstype":null},
           {"name":"nbd0p2", "path":"/dev/nbd0p2", "type":"part", "size":10736369664, "fstype":"ext4"}
         ]}
      ]
    })"));
    LayeredResolver resolver(runner);
    resolver.attributes = "vfat";

    auto partitions = resolver.list_partitions("/dev/nbd0");

    ASSERT_EQ(partitions.size(), 2u);
    EXPECT_EQ(partitions[0].kind, FilesystemKind::Vfat);
    EXPECT_EQ(partitions[0].fstype, "vfat");
    EXPECT_EQ(partitions[1].kind, FilesystemKind::Ext4);
}

TEST(DeviceResolverTest, DescribeKeepsRequestedPath) {
    FakeCommandRunner runner;
    runner.script("lsblk -J -b -o NAME,PATH,TYPE,SIZE,FSTYPE,MOUNTPOINT -d /dev/mapper/luks1_0",
                  command_ok(R"({"blockdevices":[{"name":"luks1_0","path":"/dev/mapper/luks1_0",
                                "type":"crypt","size":4096,"fstype":"ext4"}]})"));
    DeviceResolver resolver(runner);

    DeviceInfo info = resolver.describe("/dev/mapper/luks1_0");
    EXPECT_EQ(info.kind, FilesystemKind::Ext4);
    EXPECT_EQ(info.size_bytes, 4096u);

    LayeredResolver fallback(runner);
    fallback.metadata = "btrfs";
    DeviceInfo unknown = fallback.describe("/dev/loop9");
    EXPECT_EQ(unknown.path, "/dev/loop9");
    EXPECT_EQ(unknown.kind, FilesystemKind::Btrfs);
}

TEST(DeviceResolverTest, FindsHostMountPoint) {
    FakeCommandRunner runner;
    runner.script("findmnt --noheadings --output TARGET --source /dev/sdb2", command_ok("/media/usb\n/srv/usb\n"));
    DeviceResolver resolver(runner);

    EXPECT_EQ(resolver.find_mount_point("/dev/sdb2"), "/media/usb");
    EXPECT_EQ(resolver.find_mount_point("/dev/sdb3"), "");
}

TEST(DeviceResolverTest, HumanSizes) {
    EXPECT_EQ(DeviceResolver::human_size(512), "512B");
    EXPECT_EQ(DeviceResolver::human_size(1536), "1.5K");
    EXPECT_EQ(DeviceResolver::human_size(10737418240ULL), "10.0G");
}
