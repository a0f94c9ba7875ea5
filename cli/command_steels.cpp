#include "cli_common.hpp"
#include "steel_catalog.hpp"
#include <serialization/json_serialization.hpp>
#include <common/logging.hpp>
#include <iomanip>

namespace damascus::cli {

int command_steels(int argc, char** argv) {
    auto log = damascus::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        SteelCatalog catalog = SteelCatalog::builtin();
        if (!ctx.input_path.empty()) {
            // Either a bare steel table or a recipe carrying a "steels" section
            nlohmann::json j = json::read_json_file(ctx.input_path);
            add_custom_steels(catalog, j.contains("steels") ? j["steels"] : j);
        }

        std::cout << std::left << std::setw(10) << "KEY" << std::setw(12) << "ETCH"
                  << std::setw(10) << "E (MPa)" << std::setw(10) << "YIELD"
                  << std::setw(6) << "MOVE" << "NAME\n";
        for (const auto& grade : catalog.grades()) {
            Material m = grade.material();
            std::cout << std::left << std::setw(10) << grade.key
                      << std::setw(12) << grade.etch_color
                      << std::setw(10) << static_cast<long>(m.stiffness)
                      << std::setw(10) << m.yield_strength
                      << std::setw(6) << grade.movement_level
                      << grade.name << (grade.is_custom ? " [custom]" : "") << "\n";
        }
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace damascus::cli
