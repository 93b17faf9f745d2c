#pragma once

#include "katsu/partition.hpp"
#include "katsu/scripts.hpp"
#include "katsu/types.hpp"
#include "katsu/users.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace katsu {

// ============================================================================
// Root Builder Options
// ============================================================================

struct DnfOptions {
    std::string exec = "dnf";
    std::vector<std::string> packages;
    std::vector<std::string> options;          // appended after the package list
    std::vector<std::string> exclude;
    std::string releasever;
    std::optional<std::string> arch;           // --forcearch when set
    std::map<std::string, std::vector<std::string>> arch_packages;
    std::map<std::string, std::vector<std::string>> arch_exclude;
    std::string repodir;
    std::vector<std::string> global_options;   // placed before the transaction arguments
};

struct OciOptions {
    std::string runtime = "podman";
    std::string image;
    std::string derivation;                    // container file deriving from image
    std::string context;                       // build context, "." when empty
    bool embed_image = true;
    std::vector<std::string> embed_extra_images;
    bool embed_image_metadata = true;
};

// ============================================================================
// Root Image Options
// ============================================================================

enum class RootfsFormat {
    Squashfs,
    Erofs,
};

struct ErofsOptions {
    std::optional<int> log_level;              // -d<n>; 0 becomes --quiet
    std::string compression = "zstd,level=5";
    uint64_t chunk_size = 1048576;
    int xattr_level = 1;
    std::vector<std::string> exclude_paths = {"/sys/", "/proc/"};
    std::string file_contexts;
    std::vector<std::string> features = {"all-fragments", "fragdedupe=inode"};
};

struct IsoOptions {
    std::string volume_id = "KATSU-LIVEOS";
    RootfsFormat rootfs = RootfsFormat::Squashfs;
    std::string squashfs_compression = "xz";
    ErofsOptions erofs;
};

// ============================================================================
// Manifest
// ============================================================================

struct Manifest {
    std::optional<OutputKind> output;          // the CLI flag takes precedence
    RootBuilderKind builder = RootBuilderKind::Dnf;
    std::string distro;
    std::string out_file;
    std::optional<PartitionLayout> disk;
    DnfOptions dnf;
    OciOptions oci;
    std::vector<Script> pre_scripts;
    std::vector<Script> post_scripts;
    std::vector<User> users;
    std::string kernel_cmdline;
    IsoOptions iso;
    Bootloader bootloader = Bootloader::Grub;

    std::string source_path;
};

// Target architecture: dnf.arch when set, otherwise the host's
std::string target_arch(const Manifest& manifest);

// ============================================================================
// Parsing
// ============================================================================

struct ManifestParseResult {
    bool ok = false;
    std::string error;
    Manifest manifest;
    std::vector<std::string> warnings;
};

// Parse a JSON manifest. Relative file paths resolve against base_dir.
ManifestParseResult parse_manifest(const std::string& json_str, const std::string& base_dir = "");

// Read and parse a manifest file; warnings are logged
Result<Manifest> load_manifest(const std::string& path);

// "512MiB", "1G", "100 MB", "4096" -> bytes
std::optional<uint64_t> parse_size(const std::string& s);

} // namespace katsu
