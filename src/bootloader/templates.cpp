#include "katsu/templates.hpp"
#include "katsu/platform.hpp"

#include <spdlog/spdlog.h>

namespace katsu {

namespace {

const char* GRUB_TEMPLATE = R"({{ HEADER }}
set default="0"

function load_video {
  insmod all_video
}

load_video
set gfxpayload=keep
insmod gzio
insmod part_gpt
insmod ext2
insmod chain

set timeout=5

search --no-floppy --set=root -l '{{ VOLID }}'

menuentry '{{ DISTRO }}' --class gnu-linux --class gnu --class os {
  linux /boot/{{ VMLINUZ }} root=live:LABEL={{ VOLID }} rd.live.image quiet rhgb {{ CMDLINE }}
  initrd /boot/{{ INITRAMFS }}
}

menuentry '{{ DISTRO }} (basic graphics)' --class gnu-linux --class gnu --class os {
  linux /boot/{{ VMLINUZ }} root=live:LABEL={{ VOLID }} rd.live.image nomodeset quiet rhgb {{ CMDLINE }}
  initrd /boot/{{ INITRAMFS }}
}

menuentry 'Boot from the first disk' --class gnu-linux {
  chainloader (hd0)+1
}
)";

const char* LIMINE_TEMPLATE = R"({{ HEADER }}
TIMEOUT=5

:{{ DISTRO }}
    PROTOCOL=linux
    KERNEL_PATH=boot:///boot/{{ VMLINUZ }}
    MODULE_PATH=boot:///boot/{{ INITRAMFS }}
    CMDLINE=root=live:LABEL={{ VOLID }} rd.live.image quiet rhgb {{ CMDLINE }}

:{{ DISTRO }} (basic graphics)
    PROTOCOL=linux
    KERNEL_PATH=boot:///boot/{{ VMLINUZ }}
    MODULE_PATH=boot:///boot/{{ INITRAMFS }}
    CMDLINE=root=live:LABEL={{ VOLID }} rd.live.image nomodeset {{ CMDLINE }}
)";

const char* REFIND_TEMPLATE = R"({{ HEADER }}
timeout 5
use_nvram false
scanfor manual

menuentry "{{ DISTRO }}" {
    icon /EFI/BOOT/icons/os_linux.png
    volume "{{ VOLID }}"
    loader /boot/{{ VMLINUZ }}
    initrd /boot/{{ INITRAMFS }}
    options "root=live:LABEL={{ VOLID }} rd.live.image quiet rhgb {{ CMDLINE }}"
    submenuentry "Basic graphics" {
        add_options "nomodeset"
    }
}
)";

std::string render_boot_config(const char* tpl, const std::string& header, const BootConfigFields& fields) {
    std::unordered_map<std::string, std::string> vars = {
        {"HEADER", header},
        {"VOLID", fields.volid},
        {"DISTRO", fields.distro.empty() ? "Linux" : fields.distro},
        {"VMLINUZ", fields.vmlinuz},
        {"INITRAMFS", fields.initramfs},
        {"CMDLINE", fields.cmdline},
    };

    std::vector<std::string> missing;
    std::string out = render_template(tpl, vars, missing);
    for (const auto& name : missing) {
        spdlog::warn("Boot config template references unknown field {}", name);
    }
    return out;
}

} // namespace

std::string render_template(const std::string& tpl,
                            const std::unordered_map<std::string, std::string>& vars,
                            std::vector<std::string>& missing_vars) {
    std::string output;
    output.reserve(tpl.size());

    size_t i = 0;
    while (i < tpl.size()) {
        if (tpl.compare(i, 2, "{{") == 0) {
            size_t close = tpl.find("}}", i + 2);
            if (close != std::string::npos) {
                std::string name = trim(tpl.substr(i + 2, close - i - 2));
                auto it = vars.find(name);
                if (it != vars.end()) {
                    output += it->second;
                } else {
                    missing_vars.push_back(name);
                    output.append(tpl, i, close + 2 - i);
                }
                i = close + 2;
                continue;
            }
        }
        output += tpl[i];
        ++i;
    }

    return output;
}

std::string config_header(const std::string& path, const std::string& purpose) {
    return "# " + path + ": " + purpose + "\n"
           "#\n"
           "# Generated by katsu. Rebuilding the image regenerates this file.\n";
}

std::string render_grub_config(const BootConfigFields& fields) {
    return render_boot_config(GRUB_TEMPLATE, config_header("/boot/grub/grub.cfg", "Grub configurations"), fields);
}

std::string render_limine_config(const BootConfigFields& fields) {
    return render_boot_config(LIMINE_TEMPLATE, config_header("/boot/limine.cfg", "Limine configurations"), fields);
}

std::string render_refind_config(const BootConfigFields& fields) {
    return render_boot_config(REFIND_TEMPLATE,
                              config_header("/EFI/BOOT/refind.conf", "rEFInd configurations"), fields);
}

} // namespace katsu
