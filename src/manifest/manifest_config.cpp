#include "katsu/manifest.hpp"
#include "katsu/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace katsu {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::optional<bool> get_bool(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

std::map<std::string, std::vector<std::string>> get_array_map(const json& j, const std::string& key) {
    std::map<std::string, std::vector<std::string>> result;
    if (j.contains(key) && j[key].is_object()) {
        for (const auto& item : j[key].items()) {
            result[item.key()] = get_string_array(j[key], item.key());
        }
    }
    return result;
}

std::string resolve_path(const std::string& path, const std::string& base_dir) {
    if (path.empty() || base_dir.empty() || fs::path(path).is_absolute()) return path;
    return (fs::path(base_dir) / path).lexically_normal().string();
}

// Thrown inside the parser and reported as the parse error
struct ManifestError {
    std::string message;
};

std::optional<uint64_t> get_size(const json& j, const std::string& key, const std::string& where) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    const auto& v = j[key];
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_string()) {
        if (auto size = parse_size(v.get<std::string>())) return size;
    }
    throw ManifestError{where + "." + key + " is not a valid size"};
}

Partition parse_partition(const json& j, size_t index) {
    std::string where = "disk.partitions[" + std::to_string(index) + "]";
    if (!j.is_object()) throw ManifestError{where + " must be an object"};

    Partition p;
    if (auto label = get_string(j, "label")) p.label = *label;
    p.size = get_size(j, "size", where);
    p.filesystem = get_string(j, "filesystem").value_or("");
    p.mountpoint = get_string(j, "mountpoint").value_or("");

    if (auto type = get_string(j, "type")) {
        auto parsed = parse_partition_type(*type);
        if (!parsed) throw ManifestError{where + ".type '" + *type + "' is not a known type or GUID"};
        p.type = *parsed;
        if (*parsed == PartitionType::Guid) p.type_guid = *type;
    }

    if (j.contains("flags") && j["flags"].is_array()) {
        for (const auto& f : j["flags"]) {
            std::string text = f.is_number_unsigned() ? std::to_string(f.get<uint64_t>())
                                                      : (f.is_string() ? f.get<std::string>() : "");
            auto flag = parse_partition_flag(text);
            if (!flag) throw ManifestError{where + ".flags entry '" + text + "' is invalid"};
            p.flags.push_back(*flag);
        }
    }

    if (j.contains("subvolumes") && j["subvolumes"].is_array()) {
        for (const auto& sv : j["subvolumes"]) {
            p.subvolumes.push_back({get_string(sv, "name").value_or(""),
                                    get_string(sv, "mountpoint").value_or("")});
        }
    }
    return p;
}

Script parse_script(const json& j, const std::string& base_dir) {
    Script s;
    s.id = get_string(j, "id").value_or("");
    s.name = get_string(j, "name").value_or("");
    s.file = resolve_path(get_string(j, "file").value_or(""), base_dir);
    s.inline_body = get_string(j, "inline").value_or("");
    if (auto in_chroot = get_bool(j, "in_chroot")) {
        s.in_chroot = *in_chroot;
    } else if (auto chroot = get_bool(j, "chroot")) {
        s.in_chroot = *chroot;
    }
    s.needs = get_string_array(j, "needs");
    if (j.contains("priority") && j["priority"].is_number_integer()) {
        s.priority = j["priority"].get<int>();
    }
    return s;
}

std::vector<Script> parse_scripts(const json& j, const std::string& key, const std::string& base_dir) {
    std::vector<Script> scripts;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& s : j[key]) {
            scripts.push_back(parse_script(s, base_dir));
        }
    }
    return scripts;
}

User parse_user(const json& j) {
    User u;
    u.username = get_string(j, "username").value_or("");
    u.password = get_string(j, "password").value_or("");
    u.groups = get_string_array(j, "groups");
    u.create_home = get_bool(j, "create_home").value_or(true);
    u.shell = get_string(j, "shell").value_or("");
    if (j.contains("uid") && j["uid"].is_number_unsigned()) u.uid = j["uid"].get<uint32_t>();
    if (j.contains("gid") && j["gid"].is_number_unsigned()) u.gid = j["gid"].get<uint32_t>();
    u.ssh_keys = get_string_array(j, "ssh_keys");
    return u;
}

ErofsOptions parse_erofs(const json& j) {
    ErofsOptions o;
    if (j.contains("log_level") && j["log_level"].is_number_integer()) o.log_level = j["log_level"].get<int>();
    if (auto comp = get_string(j, "compression")) o.compression = *comp;
    if (j.contains("chunk_size") && j["chunk_size"].is_number_unsigned()) o.chunk_size = j["chunk_size"].get<uint64_t>();
    if (j.contains("xattr_level") && j["xattr_level"].is_number_integer()) o.xattr_level = j["xattr_level"].get<int>();
    if (j.contains("exclude_paths")) o.exclude_paths = get_string_array(j, "exclude_paths");
    if (auto contexts = get_string(j, "file_contexts")) o.file_contexts = *contexts;
    if (j.contains("features")) o.features = get_string_array(j, "features");
    return o;
}

} // namespace

std::optional<uint64_t> parse_size(const std::string& s) {
    std::string text = trim(s);
    size_t i = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    if (i == 0 || i > 19) return std::nullopt;

    uint64_t value = std::stoull(text.substr(0, i));
    std::string unit = to_lower(trim(text.substr(i)));

    uint64_t multiplier = 0;
    if (unit.empty() || unit == "b") multiplier = 1;
    else if (unit == "k" || unit == "kib") multiplier = 1ull << 10;
    else if (unit == "m" || unit == "mib") multiplier = 1ull << 20;
    else if (unit == "g" || unit == "gib") multiplier = 1ull << 30;
    else if (unit == "t" || unit == "tib") multiplier = 1ull << 40;
    else if (unit == "kb") multiplier = 1000ull;
    else if (unit == "mb") multiplier = 1000ull * 1000;
    else if (unit == "gb") multiplier = 1000ull * 1000 * 1000;
    else if (unit == "tb") multiplier = 1000ull * 1000 * 1000 * 1000;
    else return std::nullopt;

    if (value > UINT64_MAX / multiplier) return std::nullopt;
    return value * multiplier;
}

std::string target_arch(const Manifest& manifest) {
    if (manifest.dnf.arch && !manifest.dnf.arch->empty()) return *manifest.dnf.arch;
    return host_arch();
}

ManifestParseResult parse_manifest(const std::string& json_str, const std::string& base_dir) {
    ManifestParseResult result;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = "manifest must be a JSON object";
            return result;
        }

        Manifest& m = result.manifest;

        if (auto output = get_string(j, "output")) {
            m.output = parse_output_kind(*output);
            if (!m.output) {
                result.error = "output '" + *output + "' is not one of iso, disk-image, device, folder";
                return result;
            }
        }

        if (auto builder = get_string(j, "builder")) {
            auto kind = parse_root_builder_kind(*builder);
            if (!kind) {
                result.error = "builder '" + *builder + "' is not one of dnf, oci";
                return result;
            }
            m.builder = *kind;
        }

        m.distro = get_string(j, "distro").value_or("");
        m.out_file = get_string(j, "out_file").value_or("");
        m.kernel_cmdline = get_string(j, "kernel_cmdline").value_or("");

        if (auto bootloader = get_string(j, "bootloader")) {
            auto parsed = parse_bootloader(*bootloader);
            if (parsed) {
                m.bootloader = *parsed;
            } else {
                result.warnings.push_back("Unknown bootloader '" + *bootloader + "', falling back to GRUB");
                m.bootloader = Bootloader::Grub;
            }
        }

        // "disk" section
        if (j.contains("disk") && j["disk"].is_object()) {
            const auto& disk = j["disk"];
            PartitionLayout layout;
            layout.size = get_size(disk, "size", "disk");
            if (disk.contains("partitions") && disk["partitions"].is_array()) {
                size_t index = 0;
                for (const auto& p : disk["partitions"]) {
                    layout.partitions.push_back(parse_partition(p, index++));
                }
            }
            m.disk = std::move(layout);
        }

        // "dnf" section
        if (j.contains("dnf") && j["dnf"].is_object()) {
            const auto& dnf = j["dnf"];
            if (auto exec = get_string(dnf, "exec")) m.dnf.exec = *exec;
            m.dnf.packages = get_string_array(dnf, "packages");
            m.dnf.options = get_string_array(dnf, "options");
            m.dnf.exclude = get_string_array(dnf, "exclude");
            m.dnf.releasever = get_string(dnf, "releasever").value_or("");
            if (auto arch = get_string(dnf, "arch")) m.dnf.arch = *arch;
            m.dnf.arch_packages = get_array_map(dnf, "arch_packages");
            m.dnf.arch_exclude = get_array_map(dnf, "arch_exclude");
            m.dnf.repodir = resolve_path(get_string(dnf, "repodir").value_or(""), base_dir);
            m.dnf.global_options = get_string_array(dnf, "global_options");
        }

        // "oci" section
        if (j.contains("oci") && j["oci"].is_object()) {
            const auto& oci = j["oci"];
            if (auto runtime = get_string(oci, "runtime")) m.oci.runtime = *runtime;
            m.oci.image = get_string(oci, "image").value_or("");
            m.oci.derivation = resolve_path(get_string(oci, "derivation").value_or(""), base_dir);
            m.oci.context = resolve_path(get_string(oci, "context").value_or(""), base_dir);
            m.oci.embed_image = get_bool(oci, "embed_image").value_or(true);
            m.oci.embed_extra_images = get_string_array(oci, "embed_extra_images");
            m.oci.embed_image_metadata = get_bool(oci, "embed_image_metadata").value_or(true);
        }

        // "scripts" section
        if (j.contains("scripts") && j["scripts"].is_object()) {
            m.pre_scripts = parse_scripts(j["scripts"], "pre", base_dir);
            m.post_scripts = parse_scripts(j["scripts"], "post", base_dir);
        }

        // "users" section
        if (j.contains("users") && j["users"].is_array()) {
            for (const auto& u : j["users"]) {
                m.users.push_back(parse_user(u));
            }
        }

        // "iso" section
        if (j.contains("iso") && j["iso"].is_object()) {
            const auto& iso = j["iso"];
            if (auto volid = get_string(iso, "volume_id")) m.iso.volume_id = *volid;
            if (auto rootfs = get_string(iso, "rootfs")) {
                std::string lower = to_lower(*rootfs);
                if (lower == "squashfs") {
                    m.iso.rootfs = RootfsFormat::Squashfs;
                } else if (lower == "erofs") {
                    m.iso.rootfs = RootfsFormat::Erofs;
                } else {
                    result.error = "iso.rootfs '" + *rootfs + "' is not one of squashfs, erofs";
                    return result;
                }
            }
            if (auto comp = get_string(iso, "squashfs_compression")) m.iso.squashfs_compression = *comp;
            if (iso.contains("erofs") && iso["erofs"].is_object()) m.iso.erofs = parse_erofs(iso["erofs"]);
        }

        if (m.builder == RootBuilderKind::Oci && m.oci.image.empty()) {
            result.error = "oci.image is required when builder is oci";
            return result;
        }

        result.ok = true;
    } catch (const ManifestError& e) {
        result.error = e.message;
    } catch (const std::exception& e) {
        result.error = std::string("failed to parse manifest: ") + e.what();
    }

    return result;
}

Result<Manifest> load_manifest(const std::string& path) {
    std::string ext = to_lower(fs::path(path).extension().string());
    if (ext == ".hcl" || ext == ".yml" || ext == ".yaml") {
        return failure<Manifest>(ErrorKind::ConfigInvalid,
                                 "unsupported manifest format '" + ext + "', expected a JSON manifest");
    }

    auto content = read_file(path);
    if (!content) {
        return failure<Manifest>(ErrorKind::ConfigInvalid, "cannot read manifest " + path);
    }

    std::string base_dir = fs::absolute(path).parent_path().string();
    auto parsed = parse_manifest(*content, base_dir);
    for (const auto& w : parsed.warnings) {
        spdlog::warn("{}", w);
    }
    if (!parsed.ok) {
        return failure<Manifest>(ErrorKind::ConfigInvalid, path + ": " + parsed.error);
    }

    parsed.manifest.source_path = path;
    return success(std::move(parsed.manifest));
}

} // namespace katsu
