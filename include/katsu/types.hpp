#pragma once

#include <optional>
#include <string>
#include <utility>

namespace katsu {

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind {
    None,
    ConfigInvalid,     // manifest violates schema or layout invariants
    ResourceMissing,   // expected file absent (kernel, initramfs, grub dir)
    ExternalFailure,   // external process exited non-zero
    IoFailure,         // filesystem, mount or loop device failure
    ScriptFailure,     // user script exited non-zero
    UnsupportedArch,
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::ConfigInvalid: return "config_invalid";
        case ErrorKind::ResourceMissing: return "resource_missing";
        case ErrorKind::ExternalFailure: return "external_failure";
        case ErrorKind::IoFailure: return "io_failure";
        case ErrorKind::ScriptFailure: return "script_failure";
        case ErrorKind::UnsupportedArch: return "unsupported_arch";
        default: return "unknown";
    }
}

// ============================================================================
// Status / Result
// ============================================================================

struct Status {
    bool ok = true;
    ErrorKind kind = ErrorKind::None;
    std::string error;

    // Populated when an external command failed
    std::string command;
    std::string stdout_output;
    std::string stderr_output;
    int exit_code = 0;
};

inline Status ok_status() {
    return Status{};
}

inline Status make_error(ErrorKind kind, std::string message) {
    Status status;
    status.ok = false;
    status.kind = kind;
    status.error = std::move(message);
    return status;
}

// Re-tag a failure with a different kind, keeping command context
inline Status with_kind(Status status, ErrorKind kind) {
    if (!status.ok) status.kind = kind;
    return status;
}

template <typename T>
struct Result {
    bool ok = false;
    T value{};
    Status status;
};

template <typename T>
Result<T> success(T value) {
    Result<T> result;
    result.ok = true;
    result.value = std::move(value);
    return result;
}

template <typename T>
Result<T> failure(Status status) {
    Result<T> result;
    result.status = std::move(status);
    return result;
}

template <typename T>
Result<T> failure(ErrorKind kind, std::string message) {
    return failure<T>(make_error(kind, std::move(message)));
}

// ============================================================================
// Output Kind
// ============================================================================

enum class OutputKind {
    Iso,
    DiskImage,
    Device,
    Folder,
};

inline const char* output_kind_to_string(OutputKind kind) {
    switch (kind) {
        case OutputKind::Iso: return "iso";
        case OutputKind::DiskImage: return "disk-image";
        case OutputKind::Device: return "device";
        case OutputKind::Folder: return "folder";
        default: return "iso";
    }
}

// Accepts "iso", "disk-image", "device", "folder" and "fs"
std::optional<OutputKind> parse_output_kind(const std::string& s);

// ============================================================================
// Bootloader
// ============================================================================

enum class Bootloader {
    Grub,
    GrubBios,
    Limine,
    SystemdBoot,
    REFInd,
};

inline const char* bootloader_to_string(Bootloader b) {
    switch (b) {
        case Bootloader::Grub: return "grub";
        case Bootloader::GrubBios: return "grub-bios";
        case Bootloader::Limine: return "limine";
        case Bootloader::SystemdBoot: return "systemd-boot";
        case Bootloader::REFInd: return "refind";
        default: return "grub";
    }
}

// Returns nullopt for unknown names; callers fall back to Grub with a warning
std::optional<Bootloader> parse_bootloader(const std::string& s);

// ============================================================================
// Root Builder Kind
// ============================================================================

enum class RootBuilderKind {
    Dnf,
    Oci,
};

inline const char* root_builder_kind_to_string(RootBuilderKind k) {
    switch (k) {
        case RootBuilderKind::Dnf: return "dnf";
        case RootBuilderKind::Oci: return "oci";
        default: return "dnf";
    }
}

std::optional<RootBuilderKind> parse_root_builder_kind(const std::string& s);

} // namespace katsu
