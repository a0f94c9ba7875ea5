#include "cli_common.hpp"
#include "recipe.hpp"
#include <section/cross_section.hpp>
#include <common/logging.hpp>

namespace damascus::cli {

int command_section(int argc, char** argv) {
    auto log = damascus::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: damascus section <recipe.json> -o <out.pgm> [--slice Y] [--resolution N]\n";
            return 1;
        }
        if (ctx.verbose) {
            damascus::logging::enable_verbose();
        }

        Recipe recipe = load_recipe(ctx.input_path);
        Billet billet = build_billet(recipe);
        apply_operations(billet, recipe.operations);

        SectionParams params = recipe.section;
        if (ctx.slice_position) params.slice_position = *ctx.slice_position;
        if (ctx.resolution) params.resolution = *ctx.resolution;

        CrossSection section = extract_cross_section(billet, params);
        write_pgm(section, ctx.output_path);

        if (!section.hit) {
            log->warn("Slice at {:.2f}mm is outside the billet (length {:.2f}mm)",
                      params.slice_position, billet.length());
        }
        std::cerr << "Wrote " << ctx.output_path << " (" << section.width << "x"
                  << section.height << ", " << section.material_pixels() << " material pixels)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace damascus::cli
