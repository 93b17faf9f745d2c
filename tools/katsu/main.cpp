/**
 * Katsu CLI - Entry Point
 *
 * Builds bootable ISO and disk images from a manifest.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace katsu::cli::commands {
    void setup_build(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace katsu::cli;

    CLI::App app{"katsu - bootable image builder"};
    app.set_version_flag("-V,--version", KATSU_VERSION);

    GlobalOptions opts;

    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_option("--workspace", opts.workspace, "Workspace directory (default ./katsu-work)");

    commands::setup_build(&app, opts);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
