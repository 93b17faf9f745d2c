/**
 * End-to-end pipeline runs against a recording runner.
 *
 * External tools are never spawned. The chroot is pre-populated with the
 * files a real package install would leave behind so that the staging and
 * mastering phases operate on real directory trees.
 */

#include <doctest/doctest.h>
#include <katsu/manifest.hpp>
#include <katsu/pipeline.hpp>

#include "support/fake_root.hpp"
#include "support/recording_runner.hpp"
#include "support/temp_dir.hpp"

namespace fs = std::filesystem;
using namespace katsu;
using katsu::test::RecordingRunner;
using katsu::test::TempDir;
using katsu::test::fake_host;
using katsu::test::populate_boot_files;
using katsu::test::slurp;

namespace {

constexpr uint64_t MiB = 1024ull * 1024;

Manifest parse(const std::string& json, const std::string& base) {
    ManifestParseResult m = parse_manifest(json, base);
    REQUIRE_MESSAGE(m.ok, m.error);
    return m.manifest;
}

// Position of an exact command line, or -1
long line_index(const RecordingRunner& runner, const std::string& line) {
    auto lines = runner.lines();
    auto it = std::find(lines.begin(), lines.end(), line);
    return it == lines.end() ? -1 : static_cast<long>(it - lines.begin());
}

} // namespace

TEST_CASE("ISO build with GRUB") {
    TempDir tmp;
    RecordingRunner runner;
    Workspace ws{tmp.sub("katsu-work")};
    BuildContext ctx{runner, ws, fake_host(tmp)};
    populate_boot_files(ws.chroot());

    Manifest m = parse(R"({
        "builder": "dnf",
        "distro": "Demo Linux",
        "bootloader": "grub",
        "out_file": "demo.iso",
        "dnf": {"packages": ["kernel", "dracut-live"], "releasever": "40", "arch": "x86_64"},
        "iso": {"volume_id": "DEMO"}
    })", tmp.path());

    PipelineResult result = Pipeline(ctx, m, PipelineOptions{}).run();
    REQUIRE_MESSAGE(result.ok, result.phase + ": " + result.status.error);
    CHECK(result.artifact == "demo.iso");

    std::string tree = ws.iso_tree();
    CHECK(slurp(tree + "/boot/grub/grub.cfg").find("root=live:LABEL=DEMO") != std::string::npos);
    CHECK(fs::exists(tree + "/EFI/BOOT/BOOTX64.EFI"));
    CHECK(fs::exists(tree + "/boot/vmlinuz"));

    // phases run in order
    long dnf = runner.index_of("--installroot=" + ws.chroot());
    long dracut = runner.index_of(" dracut ");
    long squash = runner.index_of("mksquashfs " + ws.chroot() + " " + tree + "/LiveOS/squashfs.img");
    long mkimage = runner.index_of("grub2-mkimage");
    long xorriso = runner.index_of("xorriso -as mkisofs -R -V DEMO");
    CHECK(dnf >= 0);
    CHECK(dnf < dracut);
    CHECK(dracut < squash);
    CHECK(squash < mkimage);
    CHECK(mkimage < xorriso);
    CHECK(runner.ran(" -o demo.iso"));

    CHECK_FALSE(runner.ran("implantisomd5"));
    CHECK(runner.count("mount") == runner.count("umount"));
}

TEST_CASE("ISO build with Limine, erofs and isomd5") {
    TempDir tmp;
    RecordingRunner runner;
    Workspace ws{tmp.sub("katsu-work")};
    BuildContext ctx{runner, ws, fake_host(tmp)};
    populate_boot_files(ws.chroot());

    Manifest m = parse(R"({
        "bootloader": "limine",
        "dnf": {"packages": ["kernel"], "arch": "x86_64"},
        "iso": {"volume_id": "LIMINE"}
    })", tmp.path());

    PipelineOptions options;
    options.features = FeatureFlags::parse("erofs,isomd5");
    PipelineResult result = Pipeline(ctx, m, options).run();
    REQUIRE_MESSAGE(result.ok, result.phase + ": " + result.status.error);
    CHECK(result.artifact == "out.iso");

    CHECK(runner.count("mkfs.erofs") == 1);
    CHECK(runner.count("mksquashfs") == 0);
    CHECK(runner.count("limine") == 3);
    CHECK(runner.index_of("xorriso") < runner.index_of("implantisomd5"));
    CHECK(runner.index_of("implantisomd5") < runner.index_of("limine bios-install out.iso"));
    CHECK(fs::exists(ws.iso_tree() + "/boot/limine.cfg"));
}

TEST_CASE("missing kernel stops the build at copy-live") {
    TempDir tmp;
    RecordingRunner runner;
    Workspace ws{tmp.sub("katsu-work")};
    BuildContext ctx{runner, ws, fake_host(tmp)};
    populate_boot_files(ws.chroot());
    fs::remove_all(ws.chroot() + "/usr/lib/modules");

    Manifest m = parse(R"({"dnf": {"packages": ["kernel"], "arch": "x86_64"}})", tmp.path());

    PipelineResult result = Pipeline(ctx, m, PipelineOptions{}).run();
    CHECK_FALSE(result.ok);
    CHECK(result.phase == "copy-live");
    CHECK(result.status.kind == ErrorKind::ResourceMissing);
    CHECK_FALSE(runner.ran("xorriso"));
}

TEST_CASE("skipped phases are not run") {
    TempDir tmp;
    RecordingRunner runner;
    Workspace ws{tmp.sub("katsu-work")};
    BuildContext ctx{runner, ws, fake_host(tmp)};
    populate_boot_files(ws.chroot());

    Manifest m = parse(R"({"bootloader": "limine", "dnf": {"arch": "x86_64"}})", tmp.path());

    PipelineOptions options;
    options.skip = SkipPhases::parse("root,dracut,rootimg,copy-live");
    PipelineResult result = Pipeline(ctx, m, options).run();
    REQUIRE(result.ok);

    CHECK_FALSE(runner.ran("dnf"));
    CHECK_FALSE(runner.ran("dracut"));
    CHECK_FALSE(runner.ran("mksquashfs"));
    CHECK_FALSE(runner.ran("enroll-config"));
    CHECK(runner.count("xorriso") == 1);
    CHECK(runner.ran("limine bios-install"));
}

TEST_CASE("disk image with three partitions") {
    TempDir tmp;
    RecordingRunner runner;
    Workspace ws{tmp.sub("katsu-work")};
    BuildContext ctx{runner, ws, fake_host(tmp)};

    runner.handler = [&](const Command& cmd) -> std::optional<RecordingRunner::Reply> {
        if (cmd.program == "findmnt") {
            const std::string& target = cmd.args.back();
            if (target == ws.chroot()) return RecordingRunner::Reply{0, "/dev/loop0p3\n", ""};
            if (target == ws.chroot() + "/boot") return RecordingRunner::Reply{0, "/dev/loop0p2\n", ""};
            return RecordingRunner::Reply{0, "/dev/loop0p1\n", ""};
        }
        if (cmd.program == "blkid") {
            return RecordingRunner::Reply{0, "uuid-" + cmd.args.back().substr(10) + "\n", ""};
        }
        return std::nullopt;
    };

    Manifest m = parse(R"({
        "output": "disk-image",
        "bootloader": "systemd-boot",
        "out_file": "disk.img",
        "dnf": {"packages": ["kernel", "systemd-boot"], "arch": "x86_64"},
        "disk": {
            "size": "2GiB",
            "partitions": [
                {"label": "EFI", "size": "100MiB", "filesystem": "efi", "mountpoint": "/boot/efi", "type": "esp"},
                {"label": "boot", "size": "1GiB", "filesystem": "ext4", "mountpoint": "/boot", "type": "xbootldr"},
                {"label": "root", "filesystem": "ext4", "mountpoint": "/", "type": "root"}
            ]
        }
    })", tmp.path());
    m.out_file = tmp.sub("disk.img");

    PipelineOptions options;
    options.output = OutputKind::DiskImage;
    PipelineResult result = Pipeline(ctx, m, options).run();
    REQUIRE_MESSAGE(result.ok, result.phase + ": " + result.status.error);
    CHECK(result.artifact == tmp.sub("disk.img"));
    CHECK(fs::file_size(tmp.sub("disk.img")) == 2048 * MiB);
    CHECK_FALSE(fs::exists(ws.disk_image()));

    long root = runner.index_of("mount /dev/loop0p3 " + ws.chroot());
    long boot = runner.index_of("mount /dev/loop0p2 " + ws.chroot() + "/boot");
    long esp = runner.index_of("mount /dev/loop0p1 " + ws.chroot() + "/boot/efi");
    CHECK(runner.index_of("parted -s /dev/loop0 mklabel gpt") < root);
    CHECK(root < boot);
    CHECK(boot < esp);
    CHECK(esp < runner.index_of("--installroot=" + ws.chroot()));

    std::string fstab = slurp(ws.chroot() + "/etc/fstab");
    CHECK(fstab.find("UUID=uuid-p3\t/\text4\tdefaults\t0\t2") != std::string::npos);
    CHECK(fstab.find("UUID=uuid-p1\t/boot/efi\tvfat\tdefaults\t0\t0") != std::string::npos);

    long umount_esp = line_index(runner, "umount /dev/loop0p1");
    long umount_boot = line_index(runner, "umount /dev/loop0p2");
    long umount_root = line_index(runner, "umount /dev/loop0p3");
    CHECK(umount_esp >= 0);
    CHECK(umount_esp < umount_boot);
    CHECK(umount_boot < umount_root);
    CHECK(runner.index_of("losetup -d /dev/loop0") < runner.index_of("bootctl"));
    CHECK(runner.ran("bootctl --image=" + tmp.sub("disk.img") + " install"));
}
