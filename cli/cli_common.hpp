#ifndef DAMASCUS_CLI_COMMON_HPP
#define DAMASCUS_CLI_COMMON_HPP

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <optional>
#include <iostream>
#include <stdexcept>

namespace damascus::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> log_path;
    std::optional<std::string> section_path;
    std::optional<double> slice_position;
    std::optional<uint32_t> resolution;
    bool per_layer = false;
    bool verbose = false;
};

inline double parse_number(const std::string& option, const std::string& value) {
    try {
        size_t used = 0;
        double number = std::stod(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return number;
    } catch (const std::logic_error&) {
        throw std::runtime_error(option + " expects a number, got '" + value + "'");
    }
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto require_value = [&](const std::string& option) -> std::string {
        if (i + 1 < argc) {
            std::string value = argv[i + 1];
            i += 2;
            return value;
        }
        throw std::runtime_error(option + " requires an argument");
    };

    // Parse flags and positional arguments
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value("-o/--output");
        } else if (arg == "--log") {
            ctx.log_path = require_value("--log");
        } else if (arg == "--section") {
            ctx.section_path = require_value("--section");
        } else if (arg == "--slice") {
            ctx.slice_position = parse_number("--slice", require_value("--slice"));
        } else if (arg == "--resolution") {
            double value = parse_number("--resolution", require_value("--resolution"));
            constexpr double max_resolution = std::numeric_limits<uint32_t>::max();
            if (!(value >= 1.0 && value <= max_resolution) || value != std::floor(value)) {
                throw std::runtime_error("--resolution expects a positive integer");
            }
            ctx.resolution = static_cast<uint32_t>(value);
        } else if (arg == "--per-layer") {
            ctx.per_layer = true;
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
            ++i;
        } else if (arg[0] != '-') {
            // Positional argument (recipe file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Command function declarations
int command_run(int argc, char** argv);
int command_section(int argc, char** argv);
int command_steels(int argc, char** argv);

}  // namespace damascus::cli

#endif // DAMASCUS_CLI_COMMON_HPP
