#include "cli_common.hpp"
#include "recipe.hpp"
#include <export/mesh_export.hpp>
#include <section/cross_section.hpp>
#include <serialization/billet_log.hpp>
#include <common/logging.hpp>

namespace damascus::cli {

int command_run(int argc, char** argv) {
    auto log = damascus::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: damascus run <recipe.json> [-o model.obj|.ply|.stl] [--per-layer]\n"
                      << "                    [--log ops.json] [--section out.pgm]\n"
                      << "                    [--slice Y] [--resolution N]\n";
            return 1;
        }
        if (ctx.verbose) {
            damascus::logging::enable_verbose();
        }

        log->info("Running recipe: {}", ctx.input_path);
        Recipe recipe = load_recipe(ctx.input_path);

        Billet billet = build_billet(recipe);
        apply_operations(billet, recipe.operations);

        if (!ctx.output_path.empty()) {
            ExportOptions options;
            options.format = mesh_format_from_path(ctx.output_path);
            options.per_layer = ctx.per_layer;
            auto files = export_mesh(billet, ctx.output_path, options);
            std::cerr << "Wrote " << files.size() << " mesh file(s) to " << ctx.output_path << "\n";
        }

        if (ctx.log_path) {
            save_operation_log(billet, *ctx.log_path);
            std::cerr << "Wrote " << *ctx.log_path << " ("
                      << billet.history().size() << " operations)\n";
        }

        if (ctx.section_path) {
            SectionParams params = recipe.section;
            if (ctx.slice_position) params.slice_position = *ctx.slice_position;
            if (ctx.resolution) params.resolution = *ctx.resolution;
            CrossSection section = extract_cross_section(billet, params);
            write_pgm(section, *ctx.section_path);
            std::cerr << "Wrote " << *ctx.section_path << " ("
                      << section.width << "x" << section.height << ")\n";
        }

        std::cerr << "Billet: " << billet.width() << " x " << billet.length() << " x "
                  << billet.height() << " mm, " << billet.layer_count() << " layers, "
                  << billet.history().size() << " operations\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace damascus::cli
