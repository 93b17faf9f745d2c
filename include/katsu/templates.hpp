#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace katsu {

// ============================================================================
// Template Rendering
// ============================================================================

// Replace {{ NAME }} placeholders in a single pass (no recursion).
// Unknown placeholders are left verbatim and reported in missing_vars.
std::string render_template(const std::string& tpl,
                            const std::unordered_map<std::string, std::string>& vars,
                            std::vector<std::string>& missing_vars);

// ============================================================================
// Boot Configurations
// ============================================================================

struct BootConfigFields {
    std::string volid;
    std::string distro = "Linux";
    std::string vmlinuz = "vmlinuz";
    std::string initramfs = "initramfs.img";
    std::string cmdline;
};

// "# <path>: <purpose>" header marking a generated file
std::string config_header(const std::string& path, const std::string& purpose);

std::string render_grub_config(const BootConfigFields& fields);
std::string render_limine_config(const BootConfigFields& fields);
std::string render_refind_config(const BootConfigFields& fields);

} // namespace katsu
