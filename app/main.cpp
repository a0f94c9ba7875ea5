#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Simulates forging a layered Damascus billet.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  run <recipe.json>      Build and forge a billet from a recipe\n";
    std::cerr << "      -o <model>         Export mesh (.obj, .ply or .stl)\n";
    std::cerr << "      --per-layer        One mesh file per layer\n";
    std::cerr << "      --log <ops.json>   Write the operation log\n";
    std::cerr << "      --section <out.pgm> Write a cross-section image\n";
    std::cerr << "      --slice <Y>        Slice position along the length (mm)\n";
    std::cerr << "      --resolution <N>   Cross-section pixels per side\n";
    std::cerr << "  section <recipe.json> -o <out.pgm> [--slice Y] [--resolution N]\n";
    std::cerr << "                         Forge a recipe and write only its cross-section\n";
    std::cerr << "  steels [custom.json]   List the steel catalogue\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -v, --verbose          Debug logging\n";
    std::cerr << "  --help                 Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  DAMASCUS_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    auto log = damascus::logging::get_logger();
    log->debug("Command: {}", command);

    if (command == "run") {
        return damascus::cli::command_run(argc, argv);
    } else if (command == "section") {
        return damascus::cli::command_section(argc, argv);
    } else if (command == "steels") {
        return damascus::cli::command_steels(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
