#include <doctest/doctest.h>
#include <katsu/partition.hpp>

#include "support/recording_runner.hpp"
#include "support/temp_dir.hpp"

namespace fs = std::filesystem;
using namespace katsu;
using katsu::test::RecordingRunner;
using katsu::test::TempDir;
using katsu::test::joined_args;

namespace {

constexpr uint64_t MiB = 1024ull * 1024ull;

Partition part(const std::string& mountpoint, const std::string& fs, std::optional<uint64_t> size,
               PartitionType type = PartitionType::LinuxGeneric) {
    Partition p;
    p.mountpoint = mountpoint;
    p.filesystem = fs;
    p.size = size;
    p.type = type;
    return p;
}

// /boot/efi 100 MiB efi, /boot 1 GiB ext4, / unsized ext4
PartitionLayout three_partition_layout() {
    PartitionLayout layout;
    layout.size = 8192 * MiB;
    layout.partitions.push_back(part("/boot/efi", "efi", 100 * MiB, PartitionType::Esp));
    layout.partitions.push_back(part("/boot", "ext4", 1024 * MiB, PartitionType::Xbootldr));
    layout.partitions.push_back(part("/", "ext4", std::nullopt, PartitionType::Root));
    return layout;
}

std::vector<std::string> mountpoints(const std::vector<MountEntry>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) out.push_back(e.mountpoint);
    return out;
}

} // namespace

// ============================================================================
// Types and Flags
// ============================================================================

TEST_CASE("partition type names and GUIDs") {
    CHECK(parse_partition_type("root") == PartitionType::Root);
    CHECK(parse_partition_type("esp") == PartitionType::Esp);
    CHECK(parse_partition_type("EFI") == PartitionType::Esp);
    CHECK(parse_partition_type("swap") == PartitionType::Swap);
    CHECK(parse_partition_type("0FC63DAF-8483-4772-8E79-3D69D8477DE4") == PartitionType::Guid);
    CHECK_FALSE(parse_partition_type("fat").has_value());

    auto raw = resolve_type_guid(PartitionType::Guid, "0FC63DAF-8483-4772-8E79-3D69D8477DE4", "x86_64");
    REQUIRE(raw.ok);
    CHECK(raw.value == "0fc63daf-8483-4772-8e79-3d69d8477de4");
}

TEST_CASE("Root resolves per architecture") {
    auto x86 = resolve_type_guid(PartitionType::Root, "", "x86_64");
    REQUIRE(x86.ok);
    CHECK(x86.value == "4f68bce3-e8cd-4db1-96e7-fbcaf984b709");

    auto arm = resolve_type_guid(PartitionType::Root, "", "aarch64");
    REQUIRE(arm.ok);
    CHECK(arm.value == "b921b045-1df0-41c3-af44-4c6f280d3fae");

    auto riscv = resolve_type_guid(PartitionType::Root, "", "riscv64");
    CHECK_FALSE(riscv.ok);
    CHECK(riscv.status.kind == ErrorKind::UnsupportedArch);
}

TEST_CASE("partition flags map to GPT attribute bits") {
    CHECK(parse_partition_flag("no-auto")->bit() == 63);
    CHECK(parse_partition_flag("read-only")->bit() == 60);
    CHECK(parse_partition_flag("grow-fs")->bit() == 59);
    CHECK(parse_partition_flag("2")->bit() == 2);
    CHECK_FALSE(parse_partition_flag("sticky").has_value());
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("validate_layout") {
    SUBCASE("accepts the three partition layout") {
        CHECK(validate_layout(three_partition_layout(), "x86_64").ok);
    }
    SUBCASE("rejects an empty layout") {
        CHECK_FALSE(validate_layout(PartitionLayout{}, "x86_64").ok);
    }
    SUBCASE("unsized partition is only legal last") {
        PartitionLayout layout;
        layout.partitions.push_back(part("/", "ext4", std::nullopt));
        layout.partitions.push_back(part("/boot", "ext4", 512 * MiB));
        Status s = validate_layout(layout, "x86_64");
        CHECK_FALSE(s.ok);
        CHECK(s.kind == ErrorKind::ConfigInvalid);
    }
    SUBCASE("rejects duplicate mountpoints") {
        PartitionLayout layout;
        layout.partitions.push_back(part("/boot", "ext4", 512 * MiB));
        layout.partitions.push_back(part("/boot/", "ext4", std::nullopt));
        CHECK_FALSE(validate_layout(layout, "x86_64").ok);
    }
    SUBCASE("rejects flag bits above 63") {
        PartitionLayout layout = three_partition_layout();
        PartitionFlag flag;
        flag.position = 64;
        layout.partitions[1].flags.push_back(flag);
        CHECK_FALSE(validate_layout(layout, "x86_64").ok);
    }
    SUBCASE("rejects Root on an unsupported architecture") {
        Status s = validate_layout(three_partition_layout(), "ppc64le");
        CHECK_FALSE(s.ok);
        CHECK(s.kind == ErrorKind::UnsupportedArch);
    }
    SUBCASE("rejects subvolumes on non-btrfs partitions") {
        PartitionLayout layout = three_partition_layout();
        layout.partitions[2].subvolumes.push_back({"home", "/home"});
        CHECK_FALSE(validate_layout(layout, "x86_64").ok);
    }
}

// ============================================================================
// Mount Order
// ============================================================================

TEST_CASE("mount order puts root first then depth then name") {
    auto order = mountpoints(mount_order(three_partition_layout()));
    REQUIRE(order.size() == 3);
    CHECK(order[0] == "/");
    CHECK(order[1] == "/boot");
    CHECK(order[2] == "/boot/efi");
}

TEST_CASE("mount order breaks depth ties alphabetically and ignores trailing slashes") {
    PartitionLayout layout;
    layout.partitions.push_back(part("/var/log", "xfs", 10 * MiB));
    layout.partitions.push_back(part("/var/", "xfs", 10 * MiB));
    layout.partitions.push_back(part("/home", "xfs", 10 * MiB));
    layout.partitions.push_back(part("", "swap", 10 * MiB, PartitionType::Swap));
    layout.partitions.push_back(part("/", "xfs", std::nullopt));

    auto entries = mount_order(layout);
    auto order = mountpoints(entries);
    REQUIRE(order.size() == 4);
    CHECK(order[0] == "/");
    CHECK(order[1] == "/home");
    CHECK(order[2] == "/var/");
    CHECK(order[3] == "/var/log");
    CHECK(entries[0].index == 5);
    CHECK(entries[3].index == 1);
}

TEST_CASE("subvolumes join the mount order") {
    PartitionLayout layout;
    layout.partitions.push_back(part("/boot/efi", "efi", 100 * MiB, PartitionType::Esp));
    Partition root = part("/", "btrfs", std::nullopt, PartitionType::Root);
    root.subvolumes.push_back({"home", "/home"});
    layout.partitions.push_back(root);

    auto entries = mount_order(layout);
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].mountpoint == "/");
    CHECK(entries[1].mountpoint == "/home");
    CHECK(entries[1].subvolume == "home");
    CHECK(entries[1].index == 2);
    CHECK(entries[2].mountpoint == "/boot/efi");
}

TEST_CASE("partition_name") {
    CHECK(partition_name("/dev/loop0", 1) == "/dev/loop0p1");
    CHECK(partition_name("/dev/nvme0n1", 3) == "/dev/nvme0n1p3");
    CHECK(partition_name("/dev/mmcblk0", 2) == "/dev/mmcblk0p2");
    CHECK(partition_name("/dev/sda", 1) == "/dev/sda1");
    CHECK(partition_name("/dev/vdb", 12) == "/dev/vdb12");
}

// ============================================================================
// Command Helpers / fstab
// ============================================================================

TEST_CASE("command helpers") {
    CHECK(parted_fs_name("efi") == "fat32");
    CHECK(parted_fs_name("xfs") == "ext4");
    CHECK(parted_offset(MiB) == "1MiB");
    CHECK(parted_offset(101 * MiB) == "101MiB");
    CHECK(parted_offset(MiB + 512) == "1049088B");

    Command efi = mkfs_command("efi", "/dev/loop0p1");
    CHECK(efi.program == "mkfs.fat");
    CHECK(joined_args(efi) == "-F32 /dev/loop0p1");
    CHECK(mkfs_command("btrfs", "/dev/loop0p3").program == "mkfs.btrfs");
}

TEST_CASE("render_fstab writes one line per entry") {
    std::vector<FstabLine> lines = {
        {"1111", "/", "ext4"},
        {"2222", "/boot", "ext4"},
        {"3333", "/boot/efi", "efi"},
    };
    std::string fstab = render_fstab(lines);

    CHECK(fstab.rfind("# /etc/fstab", 0) == 0);
    CHECK(fstab.find("UUID=1111\t/\text4\tdefaults\t0\t2\n") != std::string::npos);
    CHECK(fstab.find("UUID=3333\t/boot/efi\tvfat\tdefaults\t0\t0\n") != std::string::npos);
    CHECK(fstab.find("UUID=1111") < fstab.find("UUID=2222"));
    CHECK(fstab.find("UUID=2222") < fstab.find("UUID=3333"));
    CHECK(fstab.back() == '\n');
}

// ============================================================================
// Partition Engine
// ============================================================================

TEST_CASE("apply partitions, types, flags and formats the device") {
    TempDir tmp;
    RecordingRunner runner;
    BuildContext ctx{runner, Workspace{tmp.path()}, HostPaths{}};

    PartitionLayout layout = three_partition_layout();
    layout.partitions[0].label = "EFI";
    layout.partitions[2].flags.push_back(*parse_partition_flag("grow-fs"));

    PartitionEngine engine(ctx, layout, "x86_64");
    REQUIRE(engine.apply("/dev/loop0").ok);

    auto lines = runner.lines();
    REQUIRE_FALSE(lines.empty());
    CHECK(lines[0] == "parted -s /dev/loop0 mklabel gpt");

    CHECK(runner.ran("parted -s /dev/loop0 mkpart primary fat32 1MiB 101MiB"));
    CHECK(runner.ran("parted -s /dev/loop0 mkpart primary ext4 101MiB 1125MiB"));
    CHECK(runner.ran("parted -s /dev/loop0 mkpart primary ext4 1125MiB 100%"));
    CHECK(runner.ran("sgdisk -t 1:c12a7328-f81f-11d2-ba4b-00a0c93ec93b /dev/loop0"));
    CHECK(runner.ran("sgdisk -t 3:4f68bce3-e8cd-4db1-96e7-fbcaf984b709 /dev/loop0"));
    CHECK(runner.ran("sgdisk -A 3:set:59 /dev/loop0"));
    CHECK(runner.ran("parted -s /dev/loop0 set 1 esp on"));
    CHECK_FALSE(runner.ran("set 2 esp on"));
    CHECK(runner.ran("parted -s /dev/loop0 name 1 EFI"));
    CHECK(runner.ran("mkfs.fat -F32 /dev/loop0p1"));
    CHECK(runner.ran("mkfs.ext4 /dev/loop0p2"));
    CHECK(runner.ran("mkfs.ext4 /dev/loop0p3"));

    // Formatting happens after the table is complete
    CHECK(runner.index_of("partprobe") < runner.index_of("mkfs.fat"));
}

TEST_CASE("apply stops at the first failing command") {
    TempDir tmp;
    RecordingRunner runner;
    runner.reply("sgdisk", 4, "", "bad guid");
    BuildContext ctx{runner, Workspace{tmp.path()}, HostPaths{}};

    PartitionEngine engine(ctx, three_partition_layout(), "x86_64");
    Status s = engine.apply("/dev/loop0");
    CHECK_FALSE(s.ok);
    CHECK(s.kind == ErrorKind::ExternalFailure);
    CHECK(s.stderr_output == "bad guid");
    CHECK(runner.count("mkfs.ext4") == 0);
}

TEST_CASE("apply rejects an invalid layout before running anything") {
    TempDir tmp;
    RecordingRunner runner;
    BuildContext ctx{runner, Workspace{tmp.path()}, HostPaths{}};

    PartitionEngine engine(ctx, three_partition_layout(), "s390x");
    CHECK_FALSE(engine.apply("/dev/loop0").ok);
    CHECK(runner.commands.empty());
}

TEST_CASE("btrfs subvolumes are created through a temporary mount") {
    TempDir tmp;
    RecordingRunner runner;
    BuildContext ctx{runner, Workspace{tmp.path()}, HostPaths{}};

    PartitionLayout layout;
    Partition root = part("/", "btrfs", std::nullopt, PartitionType::Root);
    root.subvolumes.push_back({"root", "/sysroot"});
    root.subvolumes.push_back({"home", "/home"});
    layout.partitions.push_back(root);

    PartitionEngine engine(ctx, layout, "x86_64");
    REQUIRE(engine.apply("/dev/loop0").ok);

    std::string top = tmp.sub("btrfs-top");
    CHECK(runner.ran("mount /dev/loop0p1 " + top));
    CHECK(runner.ran("btrfs subvolume create " + top + "/root"));
    CHECK(runner.ran("btrfs subvolume create " + top + "/home"));
    CHECK(runner.ran("umount " + top));
    CHECK(runner.index_of("mkfs.btrfs") < runner.index_of("btrfs subvolume create"));
}

TEST_CASE("mount_to and unmount_from are symmetric") {
    TempDir tmp;
    RecordingRunner runner;
    BuildContext ctx{runner, Workspace{tmp.path()}, HostPaths{}};
    std::string chroot = tmp.sub("chroot");

    PartitionEngine engine(ctx, three_partition_layout(), "x86_64");
    REQUIRE(engine.mount_to("/dev/loop0", chroot).ok);

    auto mounts = runner.with_program("mount");
    REQUIRE(mounts.size() == 3);
    CHECK(joined_args(mounts[0]) == "/dev/loop0p3 " + chroot);
    CHECK(joined_args(mounts[1]) == "/dev/loop0p2 " + chroot + "/boot");
    CHECK(joined_args(mounts[2]) == "/dev/loop0p1 " + chroot + "/boot/efi");
    CHECK(fs::is_directory(chroot + "/boot/efi"));

    REQUIRE(engine.unmount_from("/dev/loop0", chroot).ok);
    auto umounts = runner.with_program("umount");
    REQUIRE(umounts.size() == 3);
    CHECK(joined_args(umounts[0]) == "/dev/loop0p1");
    CHECK(joined_args(umounts[1]) == "/dev/loop0p2");
    CHECK(joined_args(umounts[2]) == "/dev/loop0p3");
}

TEST_CASE("mount_to rolls back earlier mounts on failure") {
    TempDir tmp;
    RecordingRunner runner;
    std::string chroot = tmp.sub("chroot");
    runner.handler = [&](const Command& cmd) -> std::optional<RecordingRunner::Reply> {
        if (cmd.program == "mount" && cmd.args.back() == chroot + "/boot/efi") {
            return RecordingRunner::Reply{32, "", "wrong fs type"};
        }
        return std::nullopt;
    };
    BuildContext ctx{runner, Workspace{tmp.path()}, HostPaths{}};

    PartitionEngine engine(ctx, three_partition_layout(), "x86_64");
    Status s = engine.mount_to("/dev/loop0", chroot);
    CHECK_FALSE(s.ok);
    CHECK(s.kind == ErrorKind::IoFailure);

    auto umounts = runner.with_program("umount");
    REQUIRE(umounts.size() == 2);
    CHECK(joined_args(umounts[0]) == chroot + "/boot");
    CHECK(joined_args(umounts[1]) == chroot);
}

TEST_CASE("subvolumes mount with subvol options and unmount by path") {
    TempDir tmp;
    RecordingRunner runner;
    BuildContext ctx{runner, Workspace{tmp.path()}, HostPaths{}};
    std::string chroot = tmp.sub("chroot");

    PartitionLayout layout;
    Partition root = part("/", "btrfs", std::nullopt, PartitionType::Root);
    root.subvolumes.push_back({"home", "/home"});
    layout.partitions.push_back(root);

    PartitionEngine engine(ctx, layout, "x86_64");
    REQUIRE(engine.mount_to("/dev/loop0", chroot).ok);
    CHECK(runner.ran("mount -o subvol=home /dev/loop0p1 " + chroot + "/home"));

    REQUIRE(engine.unmount_from("/dev/loop0", chroot).ok);
    auto umounts = runner.with_program("umount");
    REQUIRE(umounts.size() == 2);
    CHECK(joined_args(umounts[0]) == chroot + "/home");
    CHECK(joined_args(umounts[1]) == "/dev/loop0p1");
}

TEST_CASE("fstab resolves UUIDs of the mounted layout in mount order") {
    TempDir tmp;
    RecordingRunner runner;
    std::string chroot = tmp.sub("chroot");
    runner.handler = [&](const Command& cmd) -> std::optional<RecordingRunner::Reply> {
        if (cmd.program == "findmnt") {
            const std::string& target = cmd.args.back();
            if (target == chroot) return RecordingRunner::Reply{0, "/dev/loop0p3\n", ""};
            if (target == chroot + "/boot") return RecordingRunner::Reply{0, "/dev/loop0p2\n", ""};
            return RecordingRunner::Reply{0, "/dev/loop0p1\n", ""};
        }
        if (cmd.program == "blkid") {
            const std::string& dev = cmd.args.back();
            return RecordingRunner::Reply{0, "uuid-" + dev.substr(dev.size() - 2) + "\n", ""};
        }
        return std::nullopt;
    };
    BuildContext ctx{runner, Workspace{tmp.path()}, HostPaths{}};

    PartitionEngine engine(ctx, three_partition_layout(), "x86_64");
    auto fstab = engine.fstab(chroot);
    REQUIRE(fstab.ok);

    const std::string& text = fstab.value;
    size_t root = text.find("UUID=uuid-p3\t/\text4\tdefaults\t0\t2\n");
    size_t boot = text.find("UUID=uuid-p2\t/boot\text4\tdefaults\t0\t2\n");
    size_t efi = text.find("UUID=uuid-p1\t/boot/efi\tvfat\tdefaults\t0\t0\n");
    REQUIRE(root != std::string::npos);
    REQUIRE(boot != std::string::npos);
    REQUIRE(efi != std::string::npos);
    CHECK(root < boot);
    CHECK(boot < efi);
}

TEST_CASE("fstab strips btrfs subvolume suffixes from findmnt sources") {
    TempDir tmp;
    RecordingRunner runner;
    runner.reply("findmnt", 0, "/dev/loop0p1[/home]\n");
    runner.reply("blkid", 0, "abcd\n");
    BuildContext ctx{runner, Workspace{tmp.path()}, HostPaths{}};

    PartitionLayout layout;
    Partition root = part("/", "btrfs", std::nullopt, PartitionType::Root);
    root.subvolumes.push_back({"home", "/home"});
    layout.partitions.push_back(root);

    PartitionEngine engine(ctx, layout, "x86_64");
    auto fstab = engine.fstab(tmp.sub("chroot"));
    REQUIRE(fstab.ok);
    CHECK(runner.ran("blkid -s UUID -o value /dev/loop0p1"));
    CHECK(fstab.value.find("UUID=abcd\t/home\tbtrfs\tsubvol=home\t0\t2\n") != std::string::npos);
}

TEST_CASE("MountedLayout unmounts on scope exit") {
    TempDir tmp;
    RecordingRunner runner;
    BuildContext ctx{runner, Workspace{tmp.path()}, HostPaths{}};
    PartitionEngine engine(ctx, three_partition_layout(), "x86_64");

    {
        MountedLayout mounted(engine, "/dev/loop0", tmp.sub("chroot"));
        REQUIRE(mounted.mount().ok);
        CHECK(runner.count("umount") == 0);
    }
    CHECK(runner.count("umount") == 3);
}
