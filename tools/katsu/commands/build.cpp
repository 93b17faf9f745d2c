/**
 * Katsu CLI - build command
 *
 * Load a manifest and run the image pipeline for the selected output.
 */

#include "../common.hpp"

#include <katsu/context.hpp>
#include <katsu/log.hpp>
#include <katsu/manifest.hpp>
#include <katsu/pipeline.hpp>
#include <katsu/process.hpp>

#include <cstdlib>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

namespace katsu::cli::commands {

namespace {

struct BuildOptions {
    std::string manifest;
    std::string output;
    std::string skip_phases;
    std::string arch;
    std::string output_file;
    std::string feature_flags;
};

void log_failure(const PipelineResult& result) {
    spdlog::error("phase '{}' failed: {}", result.phase, result.status.error);
    if (!result.status.command.empty()) {
        spdlog::error("command: {}", result.status.command);
    }
    if (!result.status.stderr_output.empty()) {
        spdlog::error("stderr: {}", result.status.stderr_output);
    }
}

int cmd_build(const GlobalOptions& opts, const BuildOptions& build_opts) {
    init_logging(opts.verbose);

    auto loaded = load_manifest(build_opts.manifest);
    if (!loaded.ok) {
        spdlog::error("phase 'manifest' failed: {}", loaded.status.error);
        return exit_code_for(loaded.status);
    }
    Manifest manifest = std::move(loaded.value);

    if (!build_opts.arch.empty()) manifest.dnf.arch = build_opts.arch;
    if (!build_opts.output_file.empty()) manifest.out_file = build_opts.output_file;

    auto output = select_output_kind(build_opts.output, manifest);
    if (!output.ok) {
        spdlog::error("phase 'output' failed: {}", output.status.error);
        return exit_code_for(output.status);
    }

    PipelineOptions pipeline_opts;
    pipeline_opts.output = output.value;
    pipeline_opts.skip = SkipPhases::parse(build_opts.skip_phases);
    pipeline_opts.features = FeatureFlags::parse(build_opts.feature_flags);

    SystemRunner runner;
    BuildContext ctx{runner, Workspace{}, HostPaths{}};
    if (!opts.workspace.empty()) ctx.workspace.root = opts.workspace;

    spdlog::debug("manifest {} ({} output, arch {})", build_opts.manifest,
                  output_kind_to_string(pipeline_opts.output), target_arch(manifest));

    Pipeline pipeline(ctx, manifest, pipeline_opts);
    PipelineResult result = pipeline.run();
    if (!result.ok) {
        log_failure(result);
        return exit_code_for(result.status);
    }

    spdlog::info("Done: {}", result.artifact);
    return 0;
}

} // namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions build_opts;

    app->add_option("manifest", build_opts.manifest, "Image manifest (JSON)")->required();
    app->add_option("-o,--output", build_opts.output, "Output kind: iso, disk-image, device, folder");
    app->add_option("-s,--skip-phases", build_opts.skip_phases,
                    "Comma separated phases to skip: root,dracut,rootimg,copy-live,iso,bootloader")
        ->envname("KATSU_SKIP_PHASES");
    app->add_option("--arch", build_opts.arch, "Target architecture override");
    app->add_option("-O,--output-file", build_opts.output_file, "Output file override");
    app->add_option("--feature-flags", build_opts.feature_flags, "Comma separated feature flags: erofs,isomd5")
        ->envname("KATSU_FEATURE_FLAGS");

    app->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });
}

} // namespace katsu::cli::commands
