#include <doctest/doctest.h>
#include <katsu/templates.hpp>

using namespace katsu;

TEST_CASE("render_template substitutes in a single pass") {
    std::vector<std::string> missing;
    std::string out = render_template("a={{ A }} b={{B}} c={{ C }}", {{"A", "{{ B }}"}, {"B", "2"}}, missing);
    CHECK(out == "a={{ B }} b=2 c={{ C }}");
    REQUIRE(missing.size() == 1);
    CHECK(missing[0] == "C");
}

TEST_CASE("render_template leaves unterminated braces alone") {
    std::vector<std::string> missing;
    CHECK(render_template("x {{ y", {}, missing) == "x {{ y");
    CHECK(missing.empty());
}

TEST_CASE("grub config boots the live image by volume label") {
    BootConfigFields fields;
    fields.volid = "DEMO";
    fields.distro = "Demo Linux";
    fields.cmdline = "console=ttyS0";

    std::string cfg = render_grub_config(fields);
    CHECK(cfg.rfind("# /boot/grub/grub.cfg: Grub configurations\n", 0) == 0);
    CHECK(cfg.find("root=live:LABEL=DEMO") != std::string::npos);
    CHECK(cfg.find("search --no-floppy --set=root -l 'DEMO'") != std::string::npos);
    CHECK(cfg.find("menuentry 'Demo Linux'") != std::string::npos);
    CHECK(cfg.find("linux /boot/vmlinuz ") != std::string::npos);
    CHECK(cfg.find("initrd /boot/initramfs.img") != std::string::npos);
    CHECK(cfg.find("console=ttyS0") != std::string::npos);
    CHECK(cfg.find("{{") == std::string::npos);
}

TEST_CASE("limine config points at the staged kernel") {
    BootConfigFields fields;
    fields.volid = "KATSU-LIVEOS";
    std::string cfg = render_limine_config(fields);
    CHECK(cfg.rfind("# /boot/limine.cfg: Limine configurations\n", 0) == 0);
    CHECK(cfg.find("TIMEOUT=5") != std::string::npos);
    CHECK(cfg.find(":Linux") != std::string::npos);
    CHECK(cfg.find("KERNEL_PATH=boot:///boot/vmlinuz") != std::string::npos);
    CHECK(cfg.find("MODULE_PATH=boot:///boot/initramfs.img") != std::string::npos);
    CHECK(cfg.find("root=live:LABEL=KATSU-LIVEOS") != std::string::npos);
}

TEST_CASE("refind config") {
    BootConfigFields fields;
    fields.volid = "RFND";
    std::string cfg = render_refind_config(fields);
    CHECK(cfg.rfind("# /EFI/BOOT/refind.conf: rEFInd configurations\n", 0) == 0);
    CHECK(cfg.find("volume \"RFND\"") != std::string::npos);
    CHECK(cfg.find("loader /boot/vmlinuz") != std::string::npos);
}
