#pragma once

#include "katsu/context.hpp"
#include "katsu/manifest.hpp"
#include "katsu/types.hpp"

#include <optional>
#include <set>
#include <string>

namespace katsu {

// ============================================================================
// Phases
// ============================================================================

enum class Phase {
    Root,
    Dracut,
    Rootimg,
    CopyLive,
    Iso,
    Bootloader,
};

inline const char* phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::Root: return "root";
        case Phase::Dracut: return "dracut";
        case Phase::Rootimg: return "rootimg";
        case Phase::CopyLive: return "copy-live";
        case Phase::Iso: return "iso";
        case Phase::Bootloader: return "bootloader";
        default: return "root";
    }
}

std::optional<Phase> parse_phase(const std::string& s);

// Phase names from a comma separated list; unknown names are warnings
struct SkipPhases {
    std::set<Phase> phases;

    bool contains(Phase phase) const { return phases.count(phase) != 0; }
    static SkipPhases parse(const std::string& csv);
};

// ============================================================================
// Feature Flags
// ============================================================================

struct FeatureFlags {
    bool erofs = false;     // pack the live root with mkfs.erofs
    bool isomd5 = false;    // implantisomd5 after mastering

    static FeatureFlags parse(const std::string& csv);
};

// ============================================================================
// Pipeline
// ============================================================================

// --output value if given, else the manifest's output, else iso.
// An unknown --output value is ConfigInvalid.
Result<OutputKind> select_output_kind(const std::string& requested, const Manifest& manifest);

struct PipelineOptions {
    OutputKind output = OutputKind::Iso;
    SkipPhases skip;
    FeatureFlags features;
};

struct PipelineResult {
    bool ok = false;
    std::string phase;          // failing phase on error
    Status status;
    std::string artifact;       // ISO, disk image or root directory
};

class Pipeline {
public:
    Pipeline(BuildContext& ctx, const Manifest& manifest, PipelineOptions options);

    PipelineResult run();

private:
    PipelineResult run_iso();
    PipelineResult run_disk();
    PipelineResult run_folder();

    bool skipped(Phase phase) const;

    BuildContext& ctx_;
    const Manifest& manifest_;
    PipelineOptions options_;
};

} // namespace katsu
