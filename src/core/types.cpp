#include "katsu/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace katsu {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<OutputKind> parse_output_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "iso") return OutputKind::Iso;
    if (lower == "disk-image") return OutputKind::DiskImage;
    if (lower == "device") return OutputKind::Device;
    if (lower == "folder" || lower == "fs") return OutputKind::Folder;
    return std::nullopt;
}

std::optional<Bootloader> parse_bootloader(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "grub" || lower == "grub2") return Bootloader::Grub;
    if (lower == "grub-bios") return Bootloader::GrubBios;
    if (lower == "limine") return Bootloader::Limine;
    if (lower == "systemd-boot") return Bootloader::SystemdBoot;
    if (lower == "refind") return Bootloader::REFInd;
    return std::nullopt;
}

std::optional<RootBuilderKind> parse_root_builder_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "dnf") return RootBuilderKind::Dnf;
    if (lower == "oci" || lower == "bootc") return RootBuilderKind::Oci;
    return std::nullopt;
}

} // namespace katsu
